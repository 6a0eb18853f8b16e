#include <iostream>
#include <memory>
#include <string>

#include "common/result_helper.hpp"
#include "utility/logging/logging.hpp"
#include "system/ireg/ireg.hpp"

using namespace logging;

static constexpr const char* TAG = "Host";

namespace {

struct Connection {
    std::string url;
};

struct Repository;

struct Service {
    std::shared_ptr<Repository> repository;
};

struct Repository {
    std::shared_ptr<Connection> connection;
    std::shared_ptr<Service> owner;     // Service <-> Repository 순환 참조
};

Result<void> populate(ireg::InstanceRegistry& registry)
{
    auto connection = registry.getOrCreate<Connection>("connection", [] {
        return std::make_shared<Connection>(Connection{"mem://demo"});
    });
    registry.registerDisposal("connection", [] { LOG_INFO(TAG, "connection closed"); });

    auto service = registry.getOrCreate<Service>("service", [&registry] {
        auto self = std::make_shared<Service>();
        // Repository 가 생성 중인 Service 를 참조할 수 있도록 early reference 를 노출한다
        registry.registerPendingFactory<Service>("service", [self] { return self; });

        self->repository = registry.getOrCreate<Repository>("repository", [&registry] {
            auto repository = std::make_shared<Repository>();
            repository->connection = registry.get<Connection>("connection");
            repository->owner = registry.getEarly<Service>("service");
            return repository;
        });
        return self;
    });

    registry.registerDependency("connection", "repository");
    registry.registerDependency("repository", "service");
    registry.registerDisposal("repository", [service] {
        // 순환 참조 해제
        if (service->repository) service->repository->owner.reset();
        LOG_INFO(TAG, "repository disposed");
    });
    registry.registerDisposal("service", [] { LOG_INFO(TAG, "service disposed"); });

    auto r = registry.registerAlias("service", "svc");
    RETURN_IF_ERR_MSG(r, "alias registration failed");
    auto dup = registry.registerFinalized("connection", connection);
    RETURN_IF_ERR(dup);

    LOG_INFO(TAG, "{} instance(s) registered, service resolved through alias: {}",
             registry.instanceCount(), registry.get<Service>("svc") == service);
    LOG_INFO(TAG, "repository sees service early reference: {}",
             service->repository->owner == service);
    return OK();
}

} // namespace

int main(int argc, char* argv[])
{
    const std::string config_path = argc > 1 ? argv[1] : "registry.yaml";

    // YAML 기반 설정 적용
    auto r = logging::init(logging::Type::SpdLog, config_path);
    if (!r) {
        std::cerr << "logging init failed: " << to_string(r) << std::endl;
        return 1;
    }

    auto config = ireg::RegistryConfigLoader::load(config_path);
    if (!config) {
        LOG_ERROR(TAG, "registry config error: {}", to_string(config));
        logging::shutdown();
        return 1;
    }

    LOG_INFO(TAG, "서비스 시작 (registry: {})", config.value().name);
    {
        ireg::InstanceRegistry registry(config.value());
        try {
            auto populated = populate(registry);
            LOG_IF_ERR_TAG(TAG, populated);
        } catch (const ireg::RegistryException& e) {
            LOG_ERROR(TAG, "registry error [{}]: {}", to_string(e.code()), e.what());
        }
        registry.destroyAll();
    }
    LOG_INFO(TAG, "서비스 종료");

    logging::shutdown();
    return 0;
}
