#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "instance.hpp"

namespace ireg {

	class InstanceCache;
	class DependencyGraph;

	// 객체 폐기 순서를 관리한다.
	// key 를 폐기하기 전에 key 에 의존하는 객체를 먼저 폐기한다.
	class Destroyer
	{
		// 등록 순서를 유지한다. key 당 하나
		using Disposals = std::vector<std::pair<std::string, DisposalCallback>>;

	public:
		inline static constexpr const char* LOG_TAG = "Destroyer";

		Destroyer(InstanceCache& cache, DependencyGraph& graph);
		~Destroyer();

		Destroyer(const Destroyer&) = delete;
		Destroyer& operator=(const Destroyer&) = delete;

		// 같은 key 로 다시 등록하면 callback 만 교체된다 (순서 유지).
		void registerDisposal(const std::string& key, DisposalCallback callback);
		bool hasDisposal(const std::string& key) const;
		std::size_t disposalCount() const;

		// key 와 key 에 의존/포함된 객체를 폐기한다.
		// disposal callback 의 예외는 로그만 남기고 전파하지 않는다.
		void destroy(const std::string& key);

		// 이후 생성 요청은 CreationNotAllowed 로 실패한다.
		void destroyAll();

	private:
		DisposalCallback takeDisposal_(const std::string& key);
		void invokeDisposal_(const std::string& key, const DisposalCallback& callback);

	private:
		InstanceCache& cache_;
		DependencyGraph& graph_;

		Disposals disposals_;
		mutable std::mutex disposals_mutex_;
	}; // class Destroyer

}; // namespace ireg
