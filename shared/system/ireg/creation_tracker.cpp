#include "creation_tracker.hpp"

#include <fmt/format.h>

#include "registry_error.hpp"
#include "utility/logging/logging.hpp"

namespace ireg {

void CreationTracker::beforeCreation(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (exclusions_.count(key))
        return;
    if (!in_creation_.insert(key).second) {
        throw CurrentlyInCreationException(key);
    }
}

void CreationTracker::afterCreation(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (exclusions_.count(key))
        return;
    if (in_creation_.erase(key) == 0) {
        LOGE("Instance '{}' isn't currently in creation", key);
        throw IllegalStateError(key, fmt::format("Instance '{}' isn't currently in creation", key));
    }
}

bool CreationTracker::isCurrentlyInCreation(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !exclusions_.count(key) && in_creation_.count(key);
}

bool CreationTracker::isActuallyInCreation(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_creation_.count(key) != 0;
}

void CreationTracker::setCurrentlyInCreation(const std::string& key, bool in_creation)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_creation) {
        exclusions_.insert(key);
    } else {
        exclusions_.erase(key);
    }
}

bool CreationTracker::isExcluded(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exclusions_.count(key) != 0;
}

void CreationTracker::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    in_creation_.clear();
}

} // namespace ireg
