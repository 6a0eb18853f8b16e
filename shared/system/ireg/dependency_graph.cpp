#include "dependency_graph.hpp"

#include "alias_registry.hpp"
#include "utility/logging/logging.hpp"

namespace ireg {

namespace {

std::set<std::string> copyEdges(const std::map<std::string, std::set<std::string>>& edges,
                                const std::string& key)
{
    auto it = edges.find(key);
    return it != edges.end() ? it->second : std::set<std::string>{};
}

} // namespace

DependencyGraph::DependencyGraph(const AliasRegistry& aliases)
    : aliases_(aliases)
{
}

DependencyGraph::~DependencyGraph() = default;

void DependencyGraph::registerContainment(const std::string& inner, const std::string& outer)
{
    {
        std::lock_guard<std::mutex> lock(contained_mutex_);
        if (!contained_[outer].insert(inner).second) {
            return;
        }
    }
    LOGT("Instance '{}' contains '{}'", outer, inner);
    registerDependency(inner, outer);
}

void DependencyGraph::registerDependency(const std::string& key, const std::string& dependent)
{
    const std::string canonical = aliases_.canonicalize(key);

    {
        std::lock_guard<std::mutex> lock(dependents_mutex_);
        if (!dependents_[canonical].insert(dependent).second) {
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(dependencies_mutex_);
        dependencies_[dependent].insert(canonical);
    }
    LOGT("Instance '{}' depends on '{}'", dependent, canonical);
}

bool DependencyGraph::isDependent(const std::string& key, const std::string& dependent) const
{
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    std::unordered_set<std::string> already_seen;
    return isDependent_(key, dependent, already_seen);
}

bool DependencyGraph::isDependent_(const std::string& key, const std::string& dependent,
                                   std::unordered_set<std::string>& already_seen) const
{
    if (already_seen.count(key))
        return false;

    const std::string canonical = aliases_.canonicalize(key);
    auto it = dependents_.find(canonical);
    if (it == dependents_.end())
        return false;

    const auto& dependents = it->second;
    if (dependents.count(dependent))
        return true;

    already_seen.insert(key);
    for (const auto& transitive : dependents) {
        if (isDependent_(transitive, dependent, already_seen))
            return true;
    }
    return false;
}

bool DependencyGraph::hasDependents(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    return dependents_.count(key) != 0;
}

std::set<std::string> DependencyGraph::dependentsOf(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    return copyEdges(dependents_, key);
}

std::set<std::string> DependencyGraph::dependenciesOf(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(dependencies_mutex_);
    return copyEdges(dependencies_, key);
}

std::set<std::string> DependencyGraph::containedOf(const std::string& outer) const
{
    std::lock_guard<std::mutex> lock(contained_mutex_);
    return copyEdges(contained_, outer);
}

std::set<std::string> DependencyGraph::takeDependents(const std::string& key)
{
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    std::set<std::string> taken;
    auto it = dependents_.find(key);
    if (it != dependents_.end()) {
        taken.swap(it->second);
        dependents_.erase(it);
    }
    return taken;
}

std::set<std::string> DependencyGraph::takeContained(const std::string& outer)
{
    std::lock_guard<std::mutex> lock(contained_mutex_);
    std::set<std::string> taken;
    auto it = contained_.find(outer);
    if (it != contained_.end()) {
        taken.swap(it->second);
        contained_.erase(it);
    }
    return taken;
}

void DependencyGraph::scrub(const std::string& key)
{
    {
        std::lock_guard<std::mutex> lock(dependents_mutex_);
        for (auto it = dependents_.begin(); it != dependents_.end(); ) {
            it->second.erase(key);
            if (it->second.empty()) {
                it = dependents_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::lock_guard<std::mutex> lock(dependencies_mutex_);
    dependencies_.erase(key);
}

void DependencyGraph::clear()
{
    {
        std::lock_guard<std::mutex> lock(contained_mutex_);
        contained_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(dependents_mutex_);
        dependents_.clear();
    }
    std::lock_guard<std::mutex> lock(dependencies_mutex_);
    dependencies_.clear();
}

} // namespace ireg
