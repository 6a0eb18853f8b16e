#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/result.h"

namespace ireg {

	// alias -> canonical name 을 관리한다.
	// alias chain 은 항상 종료되어야 한다 (등록 시 순환 검사).
	class AliasRegistry
	{
		// alias -> 등록된 이름 (다른 alias 일 수도 있다)
		using AliasMap = std::map<std::string, std::string>;

	public:
		inline static constexpr const char* LOG_TAG = "AliasRegistry";

		// 변환 결과가 nullopt 이면 해당 alias 는 제거된다.
		using NameTransform = std::function<std::optional<std::string>(const std::string&)>;

		explicit AliasRegistry(bool allow_overriding = true);
		~AliasRegistry();

		AliasRegistry(const AliasRegistry&) = delete;
		AliasRegistry& operator=(const AliasRegistry&) = delete;

		void setAllowOverriding(bool allow);
		bool allowOverriding() const;

		[[nodiscard]] Result<void> registerAlias(const std::string& canonical, const std::string& alias);
		[[nodiscard]] Result<void> removeAlias(const std::string& alias);

		bool isAlias(const std::string& name) const;

		// alias 가 (직접 또는 chain 을 통해) canonical 을 가리키는지
		bool hasAlias(const std::string& canonical, const std::string& alias) const;

		// canonical 로 귀결되는 모든 alias (transitive)
		std::vector<std::string> getAliases(const std::string& canonical) const;

		std::string canonicalize(const std::string& name) const;

		// 모든 alias 와 대상 이름에 transform 을 적용한다.
		// 실패하면 아무것도 변경하지 않는다.
		[[nodiscard]] Result<void> resolveAll(const NameTransform& transform);

	private:
		static bool hasAlias_(const AliasMap& map, const std::string& canonical, const std::string& alias);
		static void retrieveAliases_(const AliasMap& map, const std::string& name, std::vector<std::string>& result);
		static Result<void> checkForAliasCircle_(const AliasMap& map, const std::string& canonical, const std::string& alias);

	private:
		AliasMap alias_map_;
		bool allow_overriding_;
		mutable std::mutex mutex_;
	}; // class AliasRegistry

}; // namespace ireg
