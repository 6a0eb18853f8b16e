#include "registry_config.hpp"

namespace ireg {

Result<RegistryConfig> RegistryConfigLoader::load(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Result<RegistryConfig>::Error(ResultCode::NotFound,
            "cannot load registry config '" + path + "': " + e.what());
    }
    return fromNode(root);
}

Result<RegistryConfig> RegistryConfigLoader::fromNode(const YAML::Node& root)
{
    RegistryConfig config;
    if (!root || !root["registry"]) {
        return Result<RegistryConfig>::OK(config);
    }

    try {
        auto node = root["registry"];
        if (node["name"]) {
            config.name = node["name"].as<std::string>();
        }
        if (node["allow_alias_overriding"]) {
            config.allow_alias_overriding = node["allow_alias_overriding"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<RegistryConfig>::Error(ResultCode::InvalidArgument,
            std::string("invalid registry config: ") + e.what());
    }
    return Result<RegistryConfig>::OK(config);
}

} // namespace ireg
