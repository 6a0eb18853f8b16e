#pragma once

#include <exception>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "common/result.h"
#include "instance.hpp"
#include "registry_config.hpp"
#include "alias_registry.hpp"
#include "instance_cache.hpp"
#include "dependency_graph.hpp"
#include "destroyer.hpp"


namespace ireg {

    // shared instance 의 생성/캐시/폐기를 담당하는 registry.
    // 전역 상태가 없으므로 여러 registry 가 동시에 존재할 수 있다.
    //
    // 조회 계열(get, getEarly, getOrCreate, contains)은 이름을 canonical name 으로
    // 변환한 뒤 cache 를 조회한다.
    //
    // NOTE: 순환 참조는 생성 중인 객체가 자신의 pending factory 를 먼저 등록한 경우에만
    //       early reference 로 해결된다. 그렇지 않으면 CurrentlyInCreationException.
    class InstanceRegistry
    {
    public:
        inline static constexpr const char* LOG_TAG = "InstanceRegistry";

        explicit InstanceRegistry(const RegistryConfig& config = RegistryConfig{});

        // destroyAll() 이 호출되지 않았다면 여기서 호출한다.
        ~InstanceRegistry();

        // Copying forbidden
        InstanceRegistry(const InstanceRegistry&) = delete;
        InstanceRegistry& operator=(const InstanceRegistry&) = delete;

        const std::string& name() const { return name_; }

        // ------------------------------------------------------------------
        // alias
        // ------------------------------------------------------------------
        [[nodiscard]] Result<void> registerAlias(const std::string& canonical, const std::string& alias);
        [[nodiscard]] Result<void> removeAlias(const std::string& alias);
        [[nodiscard]] Result<void> resolveAliases(const AliasRegistry::NameTransform& transform);
        bool isAlias(const std::string& name) const;
        std::vector<std::string> getAliases(const std::string& canonical) const;
        std::string canonicalize(const std::string& name) const;

        // ------------------------------------------------------------------
        // instance
        // ------------------------------------------------------------------
        Instance get(const std::string& name) const;
        Instance getEarly(const std::string& name);
        Instance getOrCreate(const std::string& name, const InstanceFactory& factory);

        [[nodiscard]] Result<void> registerFinalized(const std::string& key, const Instance& instance);
        void registerPendingFactory(const std::string& key, InstanceFactory factory);

        bool contains(const std::string& name) const;
        std::vector<std::string> instanceNames() const;
        std::size_t instanceCount() const;

        // 생성 중 삼켜진 하위 실패를 최상위 생성의 related cause 로 남긴다.
        void recordSuppressed(std::exception_ptr ex);

        void setCurrentlyInCreation(const std::string& key, bool in_creation);
        bool isCurrentlyInCreation(const std::string& key) const;

        // ------------------------------------------------------------------
        // dependency
        // ------------------------------------------------------------------
        void registerDependency(const std::string& key, const std::string& dependent);
        void registerContainment(const std::string& inner, const std::string& outer);
        bool isDependent(const std::string& key, const std::string& dependent) const;
        std::set<std::string> dependentsOf(const std::string& key) const;
        std::set<std::string> dependenciesOf(const std::string& key) const;

        // ------------------------------------------------------------------
        // destruction
        // ------------------------------------------------------------------
        void registerDisposal(const std::string& key, DisposalCallback callback);
        void destroy(const std::string& key);
        void destroyAll();
        bool isInDestruction() const;

        // ------------------------------------------------------------------
        // typed helper
        // ------------------------------------------------------------------
        template<typename T>
        std::shared_ptr<T> get(const std::string& name) const
        {
            return get(name).template as<T>();
        }

        template<typename T>
        std::shared_ptr<T> getEarly(const std::string& name)
        {
            return getEarly(name).template as<T>();
        }

        // factory 는 std::shared_ptr<T> (또는 T 로 변환 가능한 포인터)를 반환한다.
        template<typename T, typename F>
        std::shared_ptr<T> getOrCreate(const std::string& name, F factory)
        {
            auto instance = getOrCreate(name, [factory]() -> Instance {
                return Instance::of<T>(std::shared_ptr<T>(factory()));
            });
            return instance.template as<T>();
        }

        template<typename T, typename F>
        void registerPendingFactory(const std::string& key, F factory)
        {
            registerPendingFactory(key, [factory]() -> Instance {
                return Instance::of<T>(std::shared_ptr<T>(factory()));
            });
        }

        template<typename T>
        [[nodiscard]] Result<void> registerFinalized(const std::string& key, std::shared_ptr<T> object)
        {
            return registerFinalized(key, Instance::of<T>(std::move(object)));
        }

        AliasRegistry& aliases() { return aliases_; }
        InstanceCache& cache() { return cache_; }
        DependencyGraph& graph() { return graph_; }

    private:
        std::string name_;
        AliasRegistry aliases_;
        InstanceCache cache_;
        DependencyGraph graph_;
        Destroyer destroyer_;
        bool destroyed_;
    }; // class InstanceRegistry

}; // namespace ireg
