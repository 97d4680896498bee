#include "bantubox/options.h"

#include <fstream>
#include <iostream>
#include <memory>

#include "bantubox/filesystem.h"

namespace {

std::unique_ptr<std::ofstream> g_log_stream;

std::ostream& log_stream() {
    if (g_log_stream && g_log_stream->is_open()) {
        return *g_log_stream;
    }
    return std::cerr;
}

} // namespace

GlobalOptions g_global_options;
const std::string BANTUBOX_VERSION = "0.3.0";

bool configure_log_destination(const std::string& path) {
    std::unique_ptr<std::ofstream> stream(new std::ofstream(path, std::ios::app));
    if (!stream || !(*stream)) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    g_log_stream = std::move(stream);
    return true;
}

void log_debug(const std::string& message) {
    if (g_global_options.debug) {
        log_stream() << "[debug] " << message << std::endl;
    }
}

void log_warning(const std::string& message) {
    log_stream() << "[warning] " << message << std::endl;
}

std::string trim_trailing_slashes(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return trimmed;
}

std::string images_dir() {
    return path_join(trim_trailing_slashes(g_global_options.root_path), "images");
}

std::string containers_dir() {
    return path_join(trim_trailing_slashes(g_global_options.root_path), "containers");
}
