#include "instance_cache.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "registry_error.hpp"
#include "utility/logging/logging.hpp"

namespace ireg {

InstanceCache::InstanceCache()
    : in_destruction_(false)
{
}

InstanceCache::~InstanceCache() = default;

Instance InstanceCache::findFinalized_(const std::string& key) const
{
    std::shared_lock<std::shared_mutex> lock(finalized_mutex_);
    auto it = finalized_.find(key);
    return it != finalized_.end() ? it->second : Instance{};
}

Instance InstanceCache::get(const std::string& key) const
{
    return findFinalized_(key);
}

Instance InstanceCache::getEarly(const std::string& key)
{
    auto instance = findFinalized_(key);
    if (instance || !tracker_.isActuallyInCreation(key))
        return instance;

    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    // 다른 thread 가 그사이 생성을 끝냈을 수 있다
    instance = findFinalized_(key);
    if (instance)
        return instance;

    auto early = early_.find(key);
    if (early != early_.end())
        return early->second;

    auto pending = factories_.find(key);
    if (pending == factories_.end())
        return {};

    // factory 는 한번만 호출되도록 먼저 제거한다
    InstanceFactory factory = std::move(pending->second);
    factories_.erase(pending);

    instance = factory();
    if (instance) {
        early_[key] = instance;
        LOGD("Exposed early reference for instance '{}'", key);
    }
    return instance;
}

Instance InstanceCache::getOrCreate(const std::string& key, const InstanceFactory& factory)
{
    if (!factory)
        throw RegistryException(ResultCode::InvalidArgument, key, "Instance factory must not be empty");

    auto instance = findFinalized_(key);
    if (instance)
        return instance;

    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    instance = findFinalized_(key);
    if (instance)
        return instance;

    if (in_destruction_) {
        throw CreationNotAllowedException(key,
            "Instance creation not allowed while instances of this registry are in destruction "
            "(Do not request an instance from the registry in a disposal callback!)");
    }

    LOGD("Creating shared instance of '{}'", key);
    tracker_.beforeCreation(key);

    const bool record_suppressed = !suppressed_.has_value();
    if (record_suppressed) {
        suppressed_.emplace();
    }

    bool fresh = false;
    std::exception_ptr failure;
    try {
        instance = factory();
        if (instance) {
            fresh = true;
        } else {
            failure = std::make_exception_ptr(
                CreationException(key, "factory returned a null instance"));
        }
    } catch (const IllegalStateError&) {
        // 생성 도중 다른 경로로 객체가 등록되었다면 그 객체를 사용한다
        instance = findFinalized_(key);
        if (!instance) {
            failure = std::current_exception();
        }
    } catch (...) {
        failure = std::current_exception();
    }

    std::vector<std::exception_ptr> suppressed;
    if (record_suppressed) {
        suppressed = std::move(*suppressed_);
        suppressed_.reset();
    } else if (failure) {
        recordSuppressedLocked_(failure);
    }

    if (failure) {
        discardPartial_(key);
    }

    try {
        tracker_.afterCreation(key);
    } catch (const IllegalStateError& e) {
        if (!failure) throw;
        // factory 의 실패 원인을 함께 남긴다
        LOGE("Creation of instance '{}' failed: {}", key, describeException(failure));
        throw IllegalStateError(key, fmt::format("{} (pending creation failure: {})",
                                                 e.what(), describeException(failure)));
    }

    if (failure) {
        LOGD("Creation of instance '{}' failed: {}", key, describeException(failure));
        if (record_suppressed && !suppressed.empty()) {
            try {
                std::rethrow_exception(failure);
            } catch (CreationException& ex) {
                for (const auto& cause : suppressed) {
                    if (cause != failure) ex.addRelatedCause(cause);
                }
                throw;
            }
        }
        std::rethrow_exception(failure);
    }

    if (fresh) {
        instance = addFinalized_(key, instance);
    }
    return instance;
}

Result<void> InstanceCache::registerFinalized(const std::string& key, const Instance& instance)
{
    if (key.empty())
        return Error(ResultCode::InvalidArgument, "Instance key must not be empty");
    if (!instance)
        return Error(ResultCode::InvalidArgument, fmt::format("Instance for '{}' must not be null", key));

    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    auto existing = findFinalized_(key);
    if (existing) {
        if (existing == instance)
            return DuplicateIgnored(fmt::format("Instance '{}' is already registered", key));
        return Error(ResultCode::AlreadyExists,
            fmt::format("Could not register instance [{}] under key '{}': there is already instance [{}] bound",
                        instance.typeName(), key, existing.typeName()));
    }
    addFinalized_(key, instance);
    return OK();
}

void InstanceCache::registerPendingFactory(const std::string& key, InstanceFactory factory)
{
    if (!factory) return;

    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    if (findFinalized_(key))
        return;
    factories_[key] = std::move(factory);
    early_.erase(key);
    addRegistered_(key);
}

void InstanceCache::evict(const std::string& key)
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    {
        std::unique_lock<std::shared_mutex> flock(finalized_mutex_);
        finalized_.erase(key);
    }
    factories_.erase(key);
    early_.erase(key);
    registered_.erase(std::remove(registered_.begin(), registered_.end(), key), registered_.end());
}

void InstanceCache::recordSuppressed(std::exception_ptr ex)
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    recordSuppressedLocked_(std::move(ex));
}

void InstanceCache::recordSuppressedLocked_(std::exception_ptr ex)
{
    if (ex && suppressed_ && suppressed_->size() < kSuppressedExceptionsLimit) {
        suppressed_->push_back(std::move(ex));
    }
}

std::size_t InstanceCache::suppressedCount() const
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    return suppressed_ ? suppressed_->size() : 0;
}

bool InstanceCache::contains(const std::string& key) const
{
    std::shared_lock<std::shared_mutex> lock(finalized_mutex_);
    return finalized_.count(key) != 0;
}

std::vector<std::string> InstanceCache::registeredNames() const
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    return registered_;
}

std::size_t InstanceCache::registeredCount() const
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    return registered_.size();
}

void InstanceCache::setInDestruction(bool in_destruction)
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    in_destruction_ = in_destruction;
}

bool InstanceCache::isInDestruction() const
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    return in_destruction_;
}

void InstanceCache::clear()
{
    std::lock_guard<std::recursive_mutex> lock(creation_mutex_);
    {
        std::unique_lock<std::shared_mutex> flock(finalized_mutex_);
        finalized_.clear();
    }
    factories_.clear();
    early_.clear();
    registered_.clear();
}

Instance InstanceCache::addFinalized_(const std::string& key, const Instance& instance)
{
    {
        std::unique_lock<std::shared_mutex> flock(finalized_mutex_);
        auto [it, inserted] = finalized_.try_emplace(key, instance);
        if (!inserted) {
            // 생성 중 registerFinalized 로 먼저 등록된 경우. 기존 객체를 유지한다
            Instance kept = it->second;
            flock.unlock();
            LOGW("Instance '{}' was registered while being created; keeping the registered instance", key);
            factories_.erase(key);
            early_.erase(key);
            return kept;
        }
    }
    factories_.erase(key);
    early_.erase(key);
    addRegistered_(key);
    return instance;
}

void InstanceCache::discardPartial_(const std::string& key)
{
    if (findFinalized_(key))
        return;
    factories_.erase(key);
    if (early_.erase(key) != 0) {
        LOGD("Discarded early reference of failed instance '{}'", key);
    }
    registered_.erase(std::remove(registered_.begin(), registered_.end(), key), registered_.end());
}

void InstanceCache::addRegistered_(const std::string& key)
{
    if (std::find(registered_.begin(), registered_.end(), key) == registered_.end()) {
        registered_.push_back(key);
    }
}

} // namespace ireg
