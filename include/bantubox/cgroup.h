#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

#include "bantubox/kernel.h"

constexpr const char* CGROUP_GROUP_NAME = "bantubox";

enum class CgroupVersion {
    V1,
    V2
};

struct ResourceLimits {
    long long cpu_shares = 0;
    long long memory_limit = 0;
    // Memory plus swap, -1 for unlimited swap.
    long long memory_swap = 0;
};

unsigned long cpu_shares_to_weight(long long shares);
CgroupVersion detect_cgroup_version(const std::string& cgroup_root);

// Owns the cgroup sub-group(s) of one container under the shared bantubox
// group. Only paths scoped to the container id are ever created or removed.
class CgroupController {
public:
    CgroupController(KernelOps& kernel, std::string cgroup_root, std::string id, ResourceLimits limits);

    // Idempotent: concurrent callers racing on the first creation both succeed.
    void ensure_root_group();
    void create();
    void apply_limits();
    void attach(pid_t pid);
    std::vector<std::string> remove();

    // Takes over groups recorded for a container whose runner is gone.
    void adopt_groups(const std::vector<std::string>& paths);

    CgroupVersion version() const { return version_; }
    const std::vector<std::string>& group_paths() const { return group_paths_; }

private:
    std::vector<std::string> required_controllers() const;
    std::string shared_group_path(const std::string& controller) const;
    std::string group_path_for(const std::string& controller) const;
    std::vector<std::string> available_controllers() const;

    KernelOps& kernel_;
    std::string cgroup_root_;
    std::string id_;
    ResourceLimits limits_;
    CgroupVersion version_;
    std::vector<std::string> group_paths_;
};
