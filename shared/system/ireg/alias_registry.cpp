#include "alias_registry.hpp"

#include <fmt/format.h>

#include "utility/logging/logging.hpp"

namespace ireg {

AliasRegistry::AliasRegistry(bool allow_overriding)
    : allow_overriding_(allow_overriding)
{
}

AliasRegistry::~AliasRegistry() = default;

void AliasRegistry::setAllowOverriding(bool allow)
{
    std::lock_guard<std::mutex> lock(mutex_);
    allow_overriding_ = allow;
}

bool AliasRegistry::allowOverriding() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return allow_overriding_;
}

Result<void> AliasRegistry::registerAlias(const std::string& canonical, const std::string& alias)
{
    if (canonical.empty())
        return Error(ResultCode::InvalidArgument, "'canonical' must not be empty");
    if (alias.empty())
        return Error(ResultCode::InvalidArgument, "'alias' must not be empty");

    std::lock_guard<std::mutex> lock(mutex_);
    if (alias == canonical) {
        // 자기 자신을 가리키는 alias 는 의미가 없으므로 제거
        alias_map_.erase(alias);
        LOGD("Alias definition '{}' ignored since it points to same name", alias);
        return OK();
    }

    auto it = alias_map_.find(alias);
    if (it != alias_map_.end()) {
        if (it->second == canonical) {
            return OK();
        }
        if (!allow_overriding_) {
            return Error(ResultCode::AlreadyExists,
                fmt::format("Cannot define alias '{}' for name '{}': It is already registered for name '{}'.",
                            alias, canonical, it->second));
        }
        LOGD("Overriding alias '{}' definition for registered name '{}' with new target name '{}'",
             alias, it->second, canonical);
    }

    auto r = checkForAliasCircle_(alias_map_, canonical, alias);
    if (!r) return r;

    alias_map_[alias] = canonical;
    LOGT("Alias definition '{}' registered for name '{}'", alias, canonical);
    return OK();
}

Result<void> AliasRegistry::removeAlias(const std::string& alias)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (alias_map_.erase(alias) == 0) {
        return Error(ResultCode::NotFound, fmt::format("No alias '{}' registered", alias));
    }
    return OK();
}

bool AliasRegistry::isAlias(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return alias_map_.count(name) != 0;
}

bool AliasRegistry::hasAlias(const std::string& canonical, const std::string& alias) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hasAlias_(alias_map_, canonical, alias);
}

std::vector<std::string> AliasRegistry::getAliases(const std::string& canonical) const
{
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(mutex_);
    retrieveAliases_(alias_map_, canonical, result);
    return result;
}

std::string AliasRegistry::canonicalize(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string canonical = name;
    for (auto it = alias_map_.find(canonical); it != alias_map_.end(); it = alias_map_.find(canonical)) {
        canonical = it->second;
    }
    return canonical;
}

Result<void> AliasRegistry::resolveAll(const NameTransform& transform)
{
    if (!transform)
        return Error(ResultCode::InvalidArgument, "name transform must not be empty");

    std::lock_guard<std::mutex> lock(mutex_);
    const AliasMap snapshot = alias_map_;
    AliasMap resolved = alias_map_;

    for (const auto& [alias, registered] : snapshot) {
        auto resolved_alias = transform(alias);
        auto resolved_name = transform(registered);

        // (a) 변환 후 자기 자신을 가리키거나 값이 없으면 제거
        if (!resolved_alias || !resolved_name || resolved_alias->empty() || resolved_name->empty()
            || *resolved_alias == *resolved_name) {
            resolved.erase(alias);
            continue;
        }

        if (*resolved_alias != alias) {
            auto existing = resolved.find(*resolved_alias);
            if (existing != resolved.end()) {
                // (b) 이미 같은 대상을 가리키는 alias 가 있으면 중복 제거
                if (existing->second == *resolved_name) {
                    resolved.erase(alias);
                    continue;
                }
                // (c) 다른 대상과 충돌
                return Error(ResultCode::ResolutionConflict,
                    fmt::format("Cannot register resolved alias '{}' (original: '{}') for name '{}': "
                                "It is already registered for name '{}'.",
                                *resolved_alias, alias, *resolved_name, existing->second));
            }
            resolved.erase(alias);
            auto r = checkForAliasCircle_(resolved, *resolved_name, *resolved_alias);
            if (!r) {
                return r;
            }
            resolved[*resolved_alias] = *resolved_name;
        } else if (registered != *resolved_name) {
            // 대상만 바뀐 경우에도 순환 검사를 다시 한다
            resolved.erase(alias);
            auto r = checkForAliasCircle_(resolved, *resolved_name, alias);
            if (!r) {
                return r;
            }
            resolved[alias] = *resolved_name;
        }
    }

    alias_map_.swap(resolved);
    LOGD("Resolved {} alias definition(s)", alias_map_.size());
    return OK();
}

bool AliasRegistry::hasAlias_(const AliasMap& map, const std::string& canonical, const std::string& alias)
{
    auto it = map.find(alias);
    if (it == map.end())
        return false;
    return it->second == canonical || hasAlias_(map, canonical, it->second);
}

void AliasRegistry::retrieveAliases_(const AliasMap& map, const std::string& name, std::vector<std::string>& result)
{
    for (const auto& [alias, registered] : map) {
        if (registered == name) {
            result.push_back(alias);
            retrieveAliases_(map, alias, result);
        }
    }
}

Result<void> AliasRegistry::checkForAliasCircle_(const AliasMap& map, const std::string& canonical, const std::string& alias)
{
    if (hasAlias_(map, alias, canonical)) {
        return Error(ResultCode::CircularAlias,
            fmt::format("Cannot register alias '{}' for name '{}': Circular reference - "
                        "'{}' is a direct or indirect alias for '{}' already",
                        alias, canonical, canonical, alias));
    }
    return OK();
}

} // namespace ireg
