#pragma once

#include "registry_error.hpp"
#include "instance.hpp"
#include "registry_config.hpp"
#include "alias_registry.hpp"
#include "creation_tracker.hpp"
#include "instance_cache.hpp"
#include "dependency_graph.hpp"
#include "destroyer.hpp"
#include "instance_registry.hpp"
