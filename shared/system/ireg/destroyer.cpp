#include "destroyer.hpp"

#include <algorithm>
#include <exception>

#include "dependency_graph.hpp"
#include "instance_cache.hpp"
#include "utility/logging/logging.hpp"

namespace ireg {

Destroyer::Destroyer(InstanceCache& cache, DependencyGraph& graph)
    : cache_(cache)
    , graph_(graph)
{
}

Destroyer::~Destroyer() = default;

void Destroyer::registerDisposal(const std::string& key, DisposalCallback callback)
{
    if (!callback) return;

    std::lock_guard<std::mutex> lock(disposals_mutex_);
    auto it = std::find_if(disposals_.begin(), disposals_.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it != disposals_.end()) {
        it->second = std::move(callback);
        return;
    }
    disposals_.emplace_back(key, std::move(callback));
}

bool Destroyer::hasDisposal(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(disposals_mutex_);
    return std::any_of(disposals_.begin(), disposals_.end(),
                       [&key](const auto& entry) { return entry.first == key; });
}

std::size_t Destroyer::disposalCount() const
{
    std::lock_guard<std::mutex> lock(disposals_mutex_);
    return disposals_.size();
}

DisposalCallback Destroyer::takeDisposal_(const std::string& key)
{
    std::lock_guard<std::mutex> lock(disposals_mutex_);
    auto it = std::find_if(disposals_.begin(), disposals_.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it == disposals_.end())
        return nullptr;
    DisposalCallback callback = std::move(it->second);
    disposals_.erase(it);
    return callback;
}

void Destroyer::destroy(const std::string& key)
{
    // 1. cache 에서 제거
    cache_.evict(key);

    // 2. disposal callback 을 꺼낸다
    DisposalCallback callback = takeDisposal_(key);

    // 3. key 에 의존하는 객체를 먼저 폐기
    auto dependents = graph_.takeDependents(key);
    if (!dependents.empty()) {
        LOGT("Destroying {} dependent instance(s) of '{}' first", dependents.size(), key);
    }
    for (const auto& dependent : dependents) {
        destroy(dependent);
    }

    // 4. 실제 폐기
    if (callback) {
        invokeDisposal_(key, callback);
    }

    // 5. 포함된 객체 폐기
    for (const auto& inner : graph_.takeContained(key)) {
        destroy(inner);
    }

    // 6. 남은 edge 정리
    graph_.scrub(key);
}

void Destroyer::destroyAll()
{
    LOGD("Destroying instances in registry");
    cache_.setInDestruction(true);

    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(disposals_mutex_);
        keys.reserve(disposals_.size());
        for (const auto& entry : disposals_) {
            keys.push_back(entry.first);
        }
    }

    // 등록 역순으로 폐기
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
        destroy(*it);
    }

    graph_.clear();
    cache_.clear();
}

void Destroyer::invokeDisposal_(const std::string& key, const DisposalCallback& callback)
{
    try {
        callback();
        LOGT("Disposed instance '{}'", key);
    } catch (const std::exception& e) {
        LOGW("Destruction of instance with name '{}' threw an exception: {}", key, e.what());
    } catch (...) {
        LOGW("Destruction of instance with name '{}' threw an unknown exception", key);
    }
}

} // namespace ireg
