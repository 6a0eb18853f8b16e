#include "instance_registry.hpp"

#include "utility/logging/logging.hpp"

namespace ireg {


InstanceRegistry::InstanceRegistry(const RegistryConfig& config)
    : name_(config.name)
    , aliases_(config.allow_alias_overriding)
    , graph_(aliases_)
    , destroyer_(cache_, graph_)
    , destroyed_(false)
{
    LOGD("Registry '{}' created (alias overriding: {})", name_, config.allow_alias_overriding);
}

InstanceRegistry::~InstanceRegistry()
{
    if (!destroyed_) {
        destroyAll();
    }
}

Result<void> InstanceRegistry::registerAlias(const std::string& canonical, const std::string& alias)
{
    return aliases_.registerAlias(canonical, alias);
}

Result<void> InstanceRegistry::removeAlias(const std::string& alias)
{
    return aliases_.removeAlias(alias);
}

Result<void> InstanceRegistry::resolveAliases(const AliasRegistry::NameTransform& transform)
{
    return aliases_.resolveAll(transform);
}

bool InstanceRegistry::isAlias(const std::string& name) const
{
    return aliases_.isAlias(name);
}

std::vector<std::string> InstanceRegistry::getAliases(const std::string& canonical) const
{
    return aliases_.getAliases(canonical);
}

std::string InstanceRegistry::canonicalize(const std::string& name) const
{
    return aliases_.canonicalize(name);
}

Instance InstanceRegistry::get(const std::string& name) const
{
    return cache_.get(aliases_.canonicalize(name));
}

Instance InstanceRegistry::getEarly(const std::string& name)
{
    return cache_.getEarly(aliases_.canonicalize(name));
}

Instance InstanceRegistry::getOrCreate(const std::string& name, const InstanceFactory& factory)
{
    return cache_.getOrCreate(aliases_.canonicalize(name), factory);
}

Result<void> InstanceRegistry::registerFinalized(const std::string& key, const Instance& instance)
{
    return cache_.registerFinalized(key, instance);
}

void InstanceRegistry::registerPendingFactory(const std::string& key, InstanceFactory factory)
{
    cache_.registerPendingFactory(key, std::move(factory));
}

bool InstanceRegistry::contains(const std::string& name) const
{
    return cache_.contains(aliases_.canonicalize(name));
}

std::vector<std::string> InstanceRegistry::instanceNames() const
{
    return cache_.registeredNames();
}

std::size_t InstanceRegistry::instanceCount() const
{
    return cache_.registeredCount();
}

void InstanceRegistry::recordSuppressed(std::exception_ptr ex)
{
    cache_.recordSuppressed(std::move(ex));
}

void InstanceRegistry::setCurrentlyInCreation(const std::string& key, bool in_creation)
{
    cache_.tracker().setCurrentlyInCreation(key, in_creation);
}

bool InstanceRegistry::isCurrentlyInCreation(const std::string& key) const
{
    return cache_.tracker().isCurrentlyInCreation(key);
}

void InstanceRegistry::registerDependency(const std::string& key, const std::string& dependent)
{
    graph_.registerDependency(key, dependent);
}

void InstanceRegistry::registerContainment(const std::string& inner, const std::string& outer)
{
    graph_.registerContainment(inner, outer);
}

bool InstanceRegistry::isDependent(const std::string& key, const std::string& dependent) const
{
    return graph_.isDependent(key, dependent);
}

std::set<std::string> InstanceRegistry::dependentsOf(const std::string& key) const
{
    return graph_.dependentsOf(key);
}

std::set<std::string> InstanceRegistry::dependenciesOf(const std::string& key) const
{
    return graph_.dependenciesOf(key);
}

void InstanceRegistry::registerDisposal(const std::string& key, DisposalCallback callback)
{
    destroyer_.registerDisposal(key, std::move(callback));
}

void InstanceRegistry::destroy(const std::string& key)
{
    destroyer_.destroy(key);
}

void InstanceRegistry::destroyAll()
{
    LOGI("Destroying registry '{}' ({} instance(s), {} disposal(s))",
         name_, cache_.registeredCount(), destroyer_.disposalCount());
    destroyer_.destroyAll();
    destroyed_ = true;
}

bool InstanceRegistry::isInDestruction() const
{
    return cache_.isInDestruction();
}

} // namespace ireg
