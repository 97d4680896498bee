#include "bantubox/config.h"

#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

long long memory_from_json(const json& value) {
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_string()) {
        return parse_memory_size(value.get<std::string>());
    }
    throw std::runtime_error("memory sizes must be integers or strings like \"512m\"");
}

} // namespace

long long parse_memory_size(const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error("empty memory size");
    }
    if (value == "-1") {
        return -1;
    }
    size_t consumed = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid memory size: " + value);
    }
    if (number < 0) {
        throw std::runtime_error("invalid memory size: " + value);
    }
    long long multiplier = 1;
    std::string suffix = value.substr(consumed);
    if (suffix.size() == 2 && std::tolower(static_cast<unsigned char>(suffix[1])) == 'b') {
        suffix.pop_back();
    }
    if (suffix.size() > 1) {
        throw std::runtime_error("invalid memory size: " + value);
    }
    if (!suffix.empty()) {
        switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
            case 'b':
                break;
            case 'k':
                multiplier = 1024LL;
                break;
            case 'm':
                multiplier = 1024LL * 1024;
                break;
            case 'g':
                multiplier = 1024LL * 1024 * 1024;
                break;
            default:
                throw std::runtime_error("invalid memory size: " + value);
        }
    }
    if (number > std::numeric_limits<long long>::max() / multiplier) {
        throw std::runtime_error("memory size out of range: " + value);
    }
    return number * multiplier;
}

void from_json(const json& j, ResourceLimits& res) {
    if (j.contains("cpu") && j["cpu"].contains("shares")) {
        j["cpu"].at("shares").get_to(res.cpu_shares);
    }
    if (j.contains("memory")) {
        const auto& memory = j["memory"];
        if (memory.contains("limit")) {
            res.memory_limit = memory_from_json(memory.at("limit"));
        }
        if (memory.contains("swap")) {
            res.memory_swap = memory_from_json(memory.at("swap"));
        }
    }
}

void from_json(const json& j, RuntimeConfig& c) {
    if (j.contains("root")) {
        j.at("root").get_to(c.root_path);
    }
    if (j.contains("cgroupRoot")) {
        j.at("cgroupRoot").get_to(c.cgroup_root);
    }
    if (j.contains("defaultImage")) {
        j.at("defaultImage").get_to(c.default_image);
        if (c.default_image.empty()) {
            throw std::runtime_error("defaultImage must not be empty");
        }
    }
    if (j.contains("handshakeTimeoutMs")) {
        j.at("handshakeTimeoutMs").get_to(c.handshake_timeout_ms);
        if (c.handshake_timeout_ms <= 0) {
            throw std::runtime_error("handshakeTimeoutMs must be positive");
        }
    }
    if (j.contains("resources")) {
        j.at("resources").get_to(c.resources);
    }
}

RuntimeConfig load_runtime_config(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    json j;
    config_file >> j;
    return j.get<RuntimeConfig>();
}
