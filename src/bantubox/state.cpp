#include "bantubox/state.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>

#include "bantubox/filesystem.h"
#include "bantubox/options.h"

namespace {

constexpr const char* RECORD_SUFFIX = ".json";

bool has_suffix(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

json ContainerRecord::to_json_object() const {
    return json{
            {"id", id},
            {"image", image},
            {"command", command},
            {"status", status},
            {"pid", pid >= 0 ? pid : 0},
            {"supervisorPid", supervisor_pid >= 0 ? supervisor_pid : 0},
            {"root", root_path},
            {"merged", merged_path},
            {"cgroups", cgroup_paths},
            {"created", created}
    };
}

std::string ContainerRecord::to_json() const {
    return to_json_object().dump(4);
}

ContainerRecord ContainerRecord::from_json(const std::string& json_str) {
    ContainerRecord record;
    json j = json::parse(json_str);
    j.at("id").get_to(record.id);
    j.at("status").get_to(record.status);
    j.at("pid").get_to(record.pid);
    if (record.pid == 0) {
        record.pid = -1;
    }
    if (j.contains("supervisorPid")) {
        j.at("supervisorPid").get_to(record.supervisor_pid);
        if (record.supervisor_pid == 0) {
            record.supervisor_pid = -1;
        }
    }
    if (j.contains("image")) {
        j.at("image").get_to(record.image);
    }
    if (j.contains("command")) {
        j.at("command").get_to(record.command);
    }
    if (j.contains("root")) {
        j.at("root").get_to(record.root_path);
    }
    if (j.contains("merged")) {
        j.at("merged").get_to(record.merged_path);
    }
    if (j.contains("cgroups")) {
        j.at("cgroups").get_to(record.cgroup_paths);
    }
    if (j.contains("created")) {
        j.at("created").get_to(record.created);
    }
    return record;
}

ContainerRegistry::ContainerRegistry(std::string containers_dir)
    : containers_dir_(std::move(containers_dir)) {}

std::string ContainerRegistry::record_path(const std::string& id) const {
    return path_join(containers_dir_, id + RECORD_SUFFIX);
}

bool ContainerRegistry::write_record(const ContainerRecord& record, bool exclusive) {
    const std::string path = record_path(record.id);
    if (!ensure_directory(containers_dir_, 0755)) {
        std::cerr << "Failed to create containers directory: " << containers_dir_ << std::endl;
        return false;
    }
    if (exclusive) {
        int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd == -1) {
            perror(("Failed to create registry entry " + path).c_str());
            return false;
        }
        close(fd);
    }
    // Write then rename so list never reads a half-written record.
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream ofs(tmp_path);
        if (!ofs) {
            std::cerr << "Failed to open registry entry: " << tmp_path << std::endl;
            return false;
        }
        ofs << record.to_json();
        if (!ofs.good()) {
            std::cerr << "Failed to write registry entry: " << tmp_path << std::endl;
            return false;
        }
    }
    if (rename(tmp_path.c_str(), path.c_str()) != 0) {
        perror(("Failed to commit registry entry " + path).c_str());
        unlink(tmp_path.c_str());
        return false;
    }
    return true;
}

bool ContainerRegistry::register_container(const ContainerRecord& record) {
    return write_record(record, true);
}

bool ContainerRegistry::update(const ContainerRecord& record) {
    if (!contains(record.id)) {
        std::cerr << "Container '" << record.id << "' is not registered" << std::endl;
        return false;
    }
    return write_record(record, false);
}

ContainerRecord ContainerRegistry::lookup(const std::string& id) const {
    const std::string path = record_path(id);
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("No such container: " + id);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return ContainerRecord::from_json(buffer.str());
}

bool ContainerRegistry::contains(const std::string& id) const {
    return access(record_path(id).c_str(), F_OK) == 0;
}

bool ContainerRegistry::remove(const std::string& id) {
    if (unlink(record_path(id).c_str()) != 0 && errno != ENOENT) {
        perror(("Failed to remove registry entry for " + id).c_str());
        return false;
    }
    return true;
}

std::vector<ContainerRecord> ContainerRegistry::list() const {
    std::vector<ContainerRecord> records;
    DIR* dir = opendir(containers_dir_.c_str());
    if (!dir) {
        return records;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (!has_suffix(name, RECORD_SUFFIX)) {
            continue;
        }
        std::string id = name.substr(0, name.size() - std::string(RECORD_SUFFIX).size());
        try {
            records.push_back(lookup(id));
        } catch (const std::exception& e) {
            log_warning("Skipping unreadable registry entry " + name + ": " + e.what());
        }
    }
    closedir(dir);
    std::sort(records.begin(), records.end(), [](const ContainerRecord& a, const ContainerRecord& b) {
        return a.created < b.created;
    });
    return records;
}

std::string iso8601_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto seconds = system_clock::to_time_t(now);
    std::tm tm {};
    gmtime_r(&seconds, &tm);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}
