#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_set>

namespace ireg {

	class AliasRegistry;

	// 객체 간 관계를 key 로 색인된 edge map 으로 관리한다.
	//
	//  contained    : outer -> { inner }       (outer 가 inner 를 포함)
	//  dependents   : key   -> { dependent }   (dependent 가 key 에 의존)
	//  dependencies : dependent -> { key }
	//
	// dependent 는 의존 대상보다 먼저 폐기된다.
	// 각 map 은 독립된 mutex 로 보호된다.
	class DependencyGraph
	{
		using EdgeMap = std::map<std::string, std::set<std::string>>;

	public:
		inline static constexpr const char* LOG_TAG = "DependencyGraph";

		explicit DependencyGraph(const AliasRegistry& aliases);
		~DependencyGraph();

		DependencyGraph(const DependencyGraph&) = delete;
		DependencyGraph& operator=(const DependencyGraph&) = delete;

		// outer 가 inner 를 포함한다. 포함 관계는 의존 관계도 함께 등록한다.
		void registerContainment(const std::string& inner, const std::string& outer);

		// dependent 가 key 에 의존한다. key 는 canonical name 으로 변환된다.
		void registerDependency(const std::string& key, const std::string& dependent);

		// dependent 가 key 에 (transitive 하게) 의존하는지
		bool isDependent(const std::string& key, const std::string& dependent) const;

		bool hasDependents(const std::string& key) const;
		std::set<std::string> dependentsOf(const std::string& key) const;
		std::set<std::string> dependenciesOf(const std::string& key) const;
		std::set<std::string> containedOf(const std::string& outer) const;

		// Destroyer 용: key 의 edge 를 떼어내 반환한다.
		std::set<std::string> takeDependents(const std::string& key);
		std::set<std::string> takeContained(const std::string& outer);

		// 다른 key 의 dependents 에서 key 를 제거하고 key 의 dependencies 를 삭제한다.
		void scrub(const std::string& key);

		void clear();

	private:
		bool isDependent_(const std::string& key, const std::string& dependent,
		                  std::unordered_set<std::string>& already_seen) const;

	private:
		const AliasRegistry& aliases_;

		EdgeMap contained_;
		EdgeMap dependents_;
		EdgeMap dependencies_;

		mutable std::mutex contained_mutex_;
		mutable std::mutex dependents_mutex_;
		mutable std::mutex dependencies_mutex_;
	}; // class DependencyGraph

}; // namespace ireg
