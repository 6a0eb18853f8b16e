#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "system/ireg/instance_cache.hpp"
#include "system/ireg/registry_error.hpp"

using ireg::Instance;
using ireg::InstanceCache;

namespace {

struct Service {
    std::string name;
};

struct NodeA;

struct NodeB {
    std::shared_ptr<NodeA> back;
};

struct NodeA {
    std::shared_ptr<NodeB> next;
    bool populated = false;
};

Instance makeService(const std::string& name)
{
    return Instance::of(std::make_shared<Service>(Service{name}));
}

} // namespace

TEST(InstanceCacheTest, GetOrCreateCachesResult)
{
    InstanceCache cache;
    int calls = 0;
    auto factory = [&calls] { ++calls; return makeService("svc"); };

    auto first = cache.getOrCreate("svc", factory);
    auto second = cache.getOrCreate("svc", factory);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache.get("svc"), first);
    EXPECT_EQ(first.as<Service>()->name, "svc");
    EXPECT_EQ(cache.registeredNames(), std::vector<std::string>{"svc"});
    EXPECT_FALSE(cache.tracker().isCurrentlyInCreation("svc"));
}

TEST(InstanceCacheTest, TypedAccessRejectsOtherTypes)
{
    InstanceCache cache;
    auto instance = cache.getOrCreate("svc", [] { return makeService("svc"); });
    EXPECT_NE(instance.as<Service>(), nullptr);
    EXPECT_EQ(instance.as<int>(), nullptr);
}

TEST(InstanceCacheTest, ConcurrentCallersShareOneInstance)
{
    InstanceCache cache;
    std::atomic<int> calls{0};
    constexpr int kThreads = 16;

    std::vector<Instance> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            results[i] = cache.getOrCreate("shared", [&calls] {
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return makeService("shared");
            });
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r, results.front());
    }
}

TEST(InstanceCacheTest, CircularReferenceResolvedByEarlyReference)
{
    InstanceCache cache;

    auto instance = cache.getOrCreate("A", [&cache] {
        auto a = std::make_shared<NodeA>();
        cache.registerPendingFactory("A", [a] { return Instance::of(a); });

        a->next = cache.getOrCreate("B", [&cache] {
            auto b = std::make_shared<NodeB>();
            b->back = cache.getEarly("A").as<NodeA>();
            return Instance::of(b);
        }).as<NodeB>();
        a->populated = true;
        return Instance::of(a);
    });

    auto a = instance.as<NodeA>();
    ASSERT_NE(a, nullptr);
    ASSERT_NE(a->next, nullptr);
    ASSERT_NE(a->next->back, nullptr);
    EXPECT_EQ(a->next->back, a);
    EXPECT_TRUE(a->next->back->populated);
    EXPECT_EQ(cache.get("A"), instance);
}

TEST(InstanceCacheTest, PendingFactoryInvokedOnce)
{
    InstanceCache cache;
    int pending_calls = 0;

    cache.getOrCreate("A", [&] {
        auto a = std::make_shared<NodeA>();
        cache.registerPendingFactory("A", [a, &pending_calls] {
            ++pending_calls;
            return Instance::of(a);
        });
        auto first = cache.getEarly("A");
        auto second = cache.getEarly("A");
        EXPECT_EQ(first, second);
        return Instance::of(a);
    });

    EXPECT_EQ(pending_calls, 1);
}

TEST(InstanceCacheTest, GetEarlyReturnsNullWhenNotInCreation)
{
    InstanceCache cache;
    cache.registerPendingFactory("idle", [] { return makeService("idle"); });
    EXPECT_FALSE(cache.getEarly("idle"));
    EXPECT_FALSE(cache.getEarly("unknown"));
}

TEST(InstanceCacheTest, PendingFactoryIgnoredWhenFinalized)
{
    InstanceCache cache;
    auto original = cache.getOrCreate("svc", [] { return makeService("original"); });
    cache.registerPendingFactory("svc", [] { return makeService("replacement"); });
    EXPECT_EQ(cache.get("svc"), original);
}

TEST(InstanceCacheTest, MutualRecursionWithoutEarlyReferenceFails)
{
    InstanceCache cache;
    std::function<Instance()> make_a;
    std::function<Instance()> make_b;
    make_a = [&] { cache.getOrCreate("B", make_b); return makeService("A"); };
    make_b = [&] { cache.getOrCreate("A", make_a); return makeService("B"); };

    EXPECT_THROW(cache.getOrCreate("A", make_a), ireg::CurrentlyInCreationException);
    EXPECT_THROW(cache.getOrCreate("B", make_b), ireg::CurrentlyInCreationException);

    EXPECT_FALSE(cache.contains("A"));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_FALSE(cache.tracker().isCurrentlyInCreation("A"));
    EXPECT_FALSE(cache.tracker().isCurrentlyInCreation("B"));
}

TEST(InstanceCacheTest, ExcludedKeyMayReenter)
{
    InstanceCache cache;
    cache.tracker().setCurrentlyInCreation("reentrant", false);

    int depth = 0;
    std::function<Instance()> factory = [&]() -> Instance {
        if (++depth < 3) {
            cache.getOrCreate("reentrant", factory);
        }
        return makeService("reentrant");
    };
    EXPECT_NO_THROW(cache.getOrCreate("reentrant", factory));
    EXPECT_TRUE(cache.contains("reentrant"));
}

TEST(InstanceCacheTest, FactoryExceptionPropagatesUnchanged)
{
    InstanceCache cache;
    EXPECT_THROW(cache.getOrCreate("broken", []() -> Instance {
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_FALSE(cache.contains("broken"));
    EXPECT_FALSE(cache.tracker().isCurrentlyInCreation("broken"));

    // 실패 후 재시도 가능
    EXPECT_TRUE(cache.getOrCreate("broken", [] { return makeService("fixed"); }));
}

TEST(InstanceCacheTest, NullInstanceIsCreationFailure)
{
    InstanceCache cache;
    EXPECT_THROW(cache.getOrCreate("null", [] { return Instance{}; }), ireg::CreationException);
    EXPECT_FALSE(cache.contains("null"));
}

TEST(InstanceCacheTest, StateChangeToleratedWhenInstanceAppeared)
{
    InstanceCache cache;
    auto registered = makeService("registered");

    auto result = cache.getOrCreate("svc", [&]() -> Instance {
        EXPECT_TRUE(cache.registerFinalized("svc", registered));
        throw ireg::IllegalStateError("svc", "instance registered concurrently");
    });
    EXPECT_EQ(result, registered);
}

TEST(InstanceCacheTest, StateChangePropagatesWhenStillAbsent)
{
    InstanceCache cache;
    EXPECT_THROW(cache.getOrCreate("svc", []() -> Instance {
        throw ireg::IllegalStateError("svc", "nothing appeared");
    }), ireg::IllegalStateError);
}

TEST(InstanceCacheTest, InstanceRegisteredDuringCreationIsKept)
{
    InstanceCache cache;
    auto registered = makeService("registered");

    auto result = cache.getOrCreate("svc", [&] {
        EXPECT_TRUE(cache.registerFinalized("svc", registered));
        return makeService("created");
    });
    EXPECT_EQ(result, registered);
    EXPECT_EQ(cache.get("svc"), registered);
}

TEST(InstanceCacheTest, SuppressedExceptionsAreBounded)
{
    InstanceCache cache;
    std::size_t seen_during_creation = 0;

    try {
        cache.getOrCreate("outer", [&]() -> Instance {
            for (int i = 0; i < 150; ++i) {
                try {
                    cache.getOrCreate("failing-" + std::to_string(i), []() -> Instance {
                        throw std::runtime_error("nested failure");
                    });
                } catch (const std::runtime_error&) {
                    // 하위 실패를 무시하고 계속 진행
                }
            }
            seen_during_creation = cache.suppressedCount();
            throw ireg::CreationException("outer", "dependencies unavailable");
        });
        FAIL() << "expected CreationException";
    } catch (const ireg::CreationException& ex) {
        EXPECT_EQ(ex.relatedCauses().size(), InstanceCache::kSuppressedExceptionsLimit);
        EXPECT_NE(ex.describe().find("nested failure"), std::string::npos);
    }

    EXPECT_EQ(seen_during_creation, InstanceCache::kSuppressedExceptionsLimit);
    EXPECT_EQ(cache.suppressedCount(), 0u);
}

TEST(InstanceCacheTest, SuppressedExceptionsDiscardedOnSuccess)
{
    InstanceCache cache;
    auto instance = cache.getOrCreate("outer", [&] {
        try {
            cache.getOrCreate("optional", []() -> Instance {
                throw std::runtime_error("optional dependency missing");
            });
        } catch (const std::runtime_error&) {
        }
        return makeService("outer");
    });
    EXPECT_TRUE(instance);
    EXPECT_EQ(cache.suppressedCount(), 0u);
}

TEST(InstanceCacheTest, RegisterFinalizedRejectsDifferentInstance)
{
    InstanceCache cache;
    auto first = makeService("first");
    ASSERT_TRUE(cache.registerFinalized("svc", first));

    EXPECT_EQ(cache.registerFinalized("svc", makeService("second")).code(), ResultCode::AlreadyExists);
    EXPECT_EQ(cache.registerFinalized("svc", first).code(), ResultCode::DuplicateIgnored);
    EXPECT_EQ(cache.registerFinalized("", first).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(cache.registerFinalized("null", Instance{}).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(cache.get("svc"), first);
}

TEST(InstanceCacheTest, EvictRemovesEveryState)
{
    InstanceCache cache;
    cache.getOrCreate("svc", [] { return makeService("svc"); });
    cache.registerPendingFactory("pending", [] { return makeService("pending"); });
    EXPECT_EQ(cache.registeredCount(), 2u);

    cache.evict("svc");
    cache.evict("pending");
    EXPECT_FALSE(cache.contains("svc"));
    EXPECT_EQ(cache.registeredCount(), 0u);
}

TEST(InstanceCacheTest, CreationRejectedDuringDestruction)
{
    InstanceCache cache;
    auto existing = cache.getOrCreate("existing", [] { return makeService("existing"); });
    cache.setInDestruction(true);

    try {
        cache.getOrCreate("late", [] { return makeService("late"); });
        FAIL() << "expected CreationNotAllowedException";
    } catch (const ireg::CreationNotAllowedException& ex) {
        EXPECT_EQ(ex.code(), ResultCode::CreationNotAllowed);
    }
    // 이미 생성된 객체는 계속 조회된다
    EXPECT_EQ(cache.getOrCreate("existing", [] { return makeService("other"); }), existing);
}

TEST(InstanceCacheTest, FailedCreationDiscardsEarlyReference)
{
    InstanceCache cache;
    auto partial = std::make_shared<NodeA>();

    EXPECT_THROW(cache.getOrCreate("A", [&]() -> Instance {
        cache.registerPendingFactory("A", [partial] { return Instance::of(partial); });
        cache.getOrCreate("B", [&cache] {
            auto b = std::make_shared<NodeB>();
            b->back = cache.getEarly("A").as<NodeA>();
            return Instance::of(b);
        });
        throw std::runtime_error("A failed after exposing an early reference");
    }), std::runtime_error);

    EXPECT_EQ(cache.registeredNames(), std::vector<std::string>{"B"});
    EXPECT_FALSE(cache.contains("A"));

    // 재시도에서 이전 시도의 부분 객체가 보이면 안 된다
    Instance seen_early;
    auto retried = cache.getOrCreate("A", [&] {
        seen_early = cache.getEarly("A");
        return Instance::of(std::make_shared<NodeA>());
    });
    EXPECT_FALSE(seen_early);
    EXPECT_NE(retried.as<NodeA>(), partial);
    EXPECT_EQ(cache.registeredNames(), (std::vector<std::string>{"B", "A"}));
}

TEST(InstanceCacheTest, FailedCreationDiscardsUnusedPendingFactory)
{
    InstanceCache cache;
    EXPECT_THROW(cache.getOrCreate("A", [&]() -> Instance {
        cache.registerPendingFactory("A", [] { return makeService("partial"); });
        throw std::runtime_error("failed before anyone asked for A");
    }), std::runtime_error);

    EXPECT_EQ(cache.registeredCount(), 0u);
}

TEST(InstanceCacheTest, StateCheckFailureKeepsFactoryError)
{
    InstanceCache cache;
    try {
        cache.getOrCreate("svc", [&]() -> Instance {
            // 생성 중 상태를 외부에서 지워 afterCreation 검사가 실패하게 한다
            cache.tracker().afterCreation("svc");
            throw std::runtime_error("factory boom");
        });
        FAIL() << "expected IllegalStateError";
    } catch (const ireg::IllegalStateError& ex) {
        EXPECT_EQ(ex.key(), "svc");
        EXPECT_NE(std::string(ex.what()).find("factory boom"), std::string::npos);
    }
    EXPECT_FALSE(cache.tracker().isActuallyInCreation("svc"));
}
