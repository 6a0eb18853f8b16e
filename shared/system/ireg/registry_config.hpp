#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

#include "common/result.h"

namespace ireg {

// ---------------------------
// registry 설정
// ---------------------------
struct RegistryConfig {
    std::string name = "default";        // 로그에 표시될 registry 이름
    bool allow_alias_overriding = true;  // 다른 이름에 등록된 alias 재정의 허용 여부
};

// registry.yaml 의 registry: 섹션을 읽는다.
//
// registry:
//   name: "core"
//   allow_alias_overriding: false
class RegistryConfigLoader {
public:
    static Result<RegistryConfig> load(const std::string& path);
    static Result<RegistryConfig> fromNode(const YAML::Node& root);
};

} // namespace ireg
