#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace ireg {

	// 생성 중인 key 를 추적한다.
	// NotInCreation -> InCreation -> NotInCreation
	// exclusion set 에 포함된 key 는 재진입 검사를 하지 않는다.
	class CreationTracker
	{
	public:
		inline static constexpr const char* LOG_TAG = "CreationTracker";

		CreationTracker() = default;
		~CreationTracker() = default;

		CreationTracker(const CreationTracker&) = delete;
		CreationTracker& operator=(const CreationTracker&) = delete;

		// @throw CurrentlyInCreationException key 가 이미 생성 중인 경우
		void beforeCreation(const std::string& key);

		// @throw IllegalStateError key 가 생성 중이 아니었던 경우
		void afterCreation(const std::string& key);

		// in-creation set 에 있고 exclusion set 에 없는 경우만 true
		bool isCurrentlyInCreation(const std::string& key) const;

		// exclusion 여부와 무관하게 in-creation set 에 있는지
		bool isActuallyInCreation(const std::string& key) const;

		// in_creation == false 이면 key 를 exclusion set 에 추가, true 이면 제거
		void setCurrentlyInCreation(const std::string& key, bool in_creation);

		bool isExcluded(const std::string& key) const;

		void clear();

	private:
		std::unordered_set<std::string> in_creation_;
		std::unordered_set<std::string> exclusions_;
		mutable std::mutex mutex_;
	}; // class CreationTracker

}; // namespace ireg
