#pragma once

#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/result.h"
#include "instance.hpp"
#include "creation_tracker.hpp"

namespace ireg {

	// key 별 shared instance cache.
	//
	//  -------------------------------------------------------------
	// |  finalized   | 생성 완료된 객체. 한번 등록되면 교체되지 않는다   |
	// |  early       | 생성 중인 객체의 부분 참조 (순환 참조 해결용)    |
	// |  factory     | early reference 를 만들 one-shot factory      |
	//  -------------------------------------------------------------
	// early 와 factory 는 한 key 에 대해 동시에 존재하지 않는다.
	//
	// 생성 protocol 은 하나의 recursive mutex 로 직렬화된다. factory 안에서
	// 같은 thread 가 다른 key 를 요청하면 mutex 를 재획득한다.
	// finalized 조회(get)는 생성 mutex 를 잡지 않는다.
	class InstanceCache
	{
	public:
		inline static constexpr const char* LOG_TAG = "InstanceCache";

		// 최상위 생성 하나에 기록되는 suppressed exception 최대 개수
		static constexpr std::size_t kSuppressedExceptionsLimit = 100;

		InstanceCache();
		~InstanceCache();

		InstanceCache(const InstanceCache&) = delete;
		InstanceCache& operator=(const InstanceCache&) = delete;

		// finalized cache 조회. 없으면 빈 Instance
		Instance get(const std::string& key) const;

		// 생성 중인 key 의 early reference.
		// finalized -> early -> pending factory(한번만 호출) 순서로 찾는다.
		Instance getEarly(const std::string& key);

		// finalized 객체를 반환하거나 factory 로 생성한다.
		// 실패하면 key 의 early reference 와 pending factory 는 남지 않는다.
		// @throw CreationNotAllowedException 폐기 중
		// @throw CurrentlyInCreationException 해결되지 않는 순환 참조
		// @throw factory 가 던진 예외
		Instance getOrCreate(const std::string& key, const InstanceFactory& factory);

		[[nodiscard]] Result<void> registerFinalized(const std::string& key, const Instance& instance);

		// finalized 객체가 없을 때만 등록된다.
		void registerPendingFactory(const std::string& key, InstanceFactory factory);

		// 모든 cache 에서 key 를 제거한다.
		void evict(const std::string& key);

		// 현재 최상위 생성에 실패 원인을 기록한다. 생성 중이 아니면 무시된다.
		void recordSuppressed(std::exception_ptr ex);
		std::size_t suppressedCount() const;

		bool contains(const std::string& key) const;
		std::vector<std::string> registeredNames() const;
		std::size_t registeredCount() const;

		void setInDestruction(bool in_destruction);
		bool isInDestruction() const;

		void clear();

		CreationTracker& tracker() { return tracker_; }
		const CreationTracker& tracker() const { return tracker_; }

	private:
		Instance findFinalized_(const std::string& key) const;
		// creation_mutex_ 를 잡은 상태에서 호출
		Instance addFinalized_(const std::string& key, const Instance& instance);
		void addRegistered_(const std::string& key);
		// 생성에 실패한 key 의 early reference / pending factory / 등록 순서를 지운다
		void discardPartial_(const std::string& key);
		void recordSuppressedLocked_(std::exception_ptr ex);

	private:
		CreationTracker tracker_;

		std::unordered_map<std::string, Instance> finalized_;
		mutable std::shared_mutex finalized_mutex_;

		// 아래 멤버는 creation_mutex_ 로 보호된다.
		std::unordered_map<std::string, Instance> early_;
		std::unordered_map<std::string, InstanceFactory> factories_;
		std::vector<std::string> registered_;
		std::optional<std::vector<std::exception_ptr>> suppressed_;
		bool in_destruction_;
		mutable std::recursive_mutex creation_mutex_;
	}; // class InstanceCache

}; // namespace ireg
