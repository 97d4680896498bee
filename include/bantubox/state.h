#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <sys/types.h>
#include <vector>

using json = nlohmann::json;

// What the registry remembers about one container for list/stop/delete.
struct ContainerRecord {
    std::string id;
    std::string image;
    std::vector<std::string> command;
    std::string status;
    pid_t pid = -1;
    pid_t supervisor_pid = -1;
    std::string root_path;
    std::string merged_path;
    std::vector<std::string> cgroup_paths;
    std::string created;

    json to_json_object() const;
    std::string to_json() const;
    static ContainerRecord from_json(const std::string& json_str);
};

// Persisted index keyed by container id: <containers_dir>/<id>.json.
class ContainerRegistry {
public:
    explicit ContainerRegistry(std::string containers_dir);

    bool register_container(const ContainerRecord& record);
    bool update(const ContainerRecord& record);
    ContainerRecord lookup(const std::string& id) const;
    bool contains(const std::string& id) const;
    bool remove(const std::string& id);
    std::vector<ContainerRecord> list() const;

    std::string record_path(const std::string& id) const;

private:
    bool write_record(const ContainerRecord& record, bool exclusive);

    std::string containers_dir_;
};

std::string iso8601_now();
