#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "bantubox/cgroup.h"
#include "bantubox/namespaces.h"

using json = nlohmann::json;

constexpr const char* DEFAULT_IMAGE = "ubuntu";
constexpr const char* CONFIG_FILE_NAME = "bantubox.json";

struct RuntimeConfig {
    std::string root_path;
    std::string cgroup_root;
    std::string default_image = DEFAULT_IMAGE;
    int handshake_timeout_ms = DEFAULT_HANDSHAKE_TIMEOUT_MS;
    ResourceLimits resources;
};

RuntimeConfig load_runtime_config(const std::string& path);

// Accepts plain bytes or a k/m/g suffix; "-1" means unlimited.
long long parse_memory_size(const std::string& value);

void from_json(const json& j, ResourceLimits& res);
void from_json(const json& j, RuntimeConfig& c);
