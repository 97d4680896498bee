#pragma once

#include <string>

struct GlobalOptions {
    bool debug = false;
    std::string log_path;
    std::string config_path;
    std::string root_path = "/bantubox";
    std::string cgroup_root = "/sys/fs/cgroup";
};

extern GlobalOptions g_global_options;
extern const std::string BANTUBOX_VERSION;

bool configure_log_destination(const std::string& path);
void log_debug(const std::string& message);
void log_warning(const std::string& message);
std::string images_dir();
std::string containers_dir();
std::string trim_trailing_slashes(const std::string& path);
