#include "bantubox/cgroup.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "bantubox/errors.h"
#include "bantubox/filesystem.h"
#include "bantubox/options.h"

namespace {

constexpr int REMOVE_ATTEMPTS = 20;
constexpr int REMOVE_RETRY_MS = 50;

void write_cgroup_file(const std::string& path, const std::string& value) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw CgroupError(errno_message("Failed to open cgroup file " + path, errno));
    }
    ofs << value;
    ofs.close();
    if (ofs.fail()) {
        throw CgroupError(errno_message("Failed to write '" + value + "' to " + path, errno));
    }
}

std::vector<pid_t> read_cgroup_procs(const std::string& group_path) {
    std::vector<pid_t> pids;
    std::ifstream ifs(path_join(group_path, "cgroup.procs"));
    pid_t pid = 0;
    while (ifs >> pid) {
        pids.push_back(pid);
    }
    return pids;
}

} // namespace

unsigned long cpu_shares_to_weight(long long shares) {
    if (shares <= 0) {
        return 100;
    }
    if (shares < 2) {
        return 1;
    }
    if (shares > 262144) {
        shares = 262144;
    }
    return static_cast<unsigned long>(1 + ((shares - 2) * 9999) / 262142);
}

CgroupVersion detect_cgroup_version(const std::string& cgroup_root) {
    const std::string controllers_file = path_join(cgroup_root, "cgroup.controllers");
    return access(controllers_file.c_str(), F_OK) == 0 ? CgroupVersion::V2 : CgroupVersion::V1;
}

CgroupController::CgroupController(KernelOps& kernel, std::string cgroup_root, std::string id, ResourceLimits limits)
    : kernel_(kernel),
      cgroup_root_(trim_trailing_slashes(cgroup_root)),
      id_(std::move(id)),
      limits_(limits),
      version_(detect_cgroup_version(cgroup_root_)) {}

std::vector<std::string> CgroupController::required_controllers() const {
    std::vector<std::string> controllers;
    bool wants_memory = limits_.memory_limit > 0 || limits_.memory_swap != 0;
    if (version_ == CgroupVersion::V1) {
        // v1 always gets a cpu group so the container is accounted somewhere.
        controllers.emplace_back("cpu");
        if (wants_memory) {
            controllers.emplace_back("memory");
        }
        return controllers;
    }
    if (limits_.cpu_shares > 0) {
        controllers.emplace_back("cpu");
    }
    if (wants_memory) {
        controllers.emplace_back("memory");
    }
    return controllers;
}

std::vector<std::string> CgroupController::available_controllers() const {
    std::vector<std::string> available;
    std::ifstream ctrl_stream(path_join(cgroup_root_, "cgroup.controllers"));
    std::string ctrl;
    while (ctrl_stream >> ctrl) {
        available.push_back(ctrl);
    }
    return available;
}

std::string CgroupController::shared_group_path(const std::string& controller) const {
    if (version_ == CgroupVersion::V2) {
        return path_join(cgroup_root_, CGROUP_GROUP_NAME);
    }
    return path_join(path_join(cgroup_root_, controller), CGROUP_GROUP_NAME);
}

std::string CgroupController::group_path_for(const std::string& controller) const {
    return path_join(shared_group_path(controller), id_);
}

void CgroupController::ensure_root_group() {
    log_debug("Ensuring shared cgroup '" + std::string(CGROUP_GROUP_NAME) + "' under " + cgroup_root_);
    std::vector<std::string> controllers = required_controllers();

    if (version_ == CgroupVersion::V2) {
        std::vector<std::string> available = available_controllers();
        for (const auto& controller : controllers) {
            if (std::find(available.begin(), available.end(), controller) == available.end()) {
                throw CgroupError(controller + " controller not available in cgroup v2");
            }
        }
        const std::string shared = shared_group_path("");
        if (mkdir(shared.c_str(), 0755) != 0 && errno != EEXIST) {
            throw CgroupError(errno_message("Failed to create shared cgroup " + shared, errno));
        }
        for (const auto& controller : controllers) {
            for (const auto& dir : {cgroup_root_, shared}) {
                std::ofstream subtree(path_join(dir, "cgroup.subtree_control"));
                if (subtree) {
                    subtree << "+" << controller << std::endl;
                }
                if (!subtree) {
                    log_debug("Could not enable " + controller + " in " + dir + "/cgroup.subtree_control");
                }
            }
        }
        return;
    }

    for (const auto& controller : controllers) {
        const std::string hierarchy = path_join(cgroup_root_, controller);
        struct stat st {};
        if (stat(hierarchy.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            throw CgroupError(controller + " controller not mounted at " + hierarchy);
        }
        const std::string shared = shared_group_path(controller);
        if (mkdir(shared.c_str(), 0755) != 0 && errno != EEXIST) {
            throw CgroupError(errno_message("Failed to create shared cgroup " + shared, errno));
        }
    }
}

void CgroupController::create() {
    // The unified hierarchy has a single group whatever the controllers.
    std::vector<std::string> hierarchies = required_controllers();
    if (version_ == CgroupVersion::V2) {
        hierarchies.assign(1, "");
    }
    for (const auto& controller : hierarchies) {
        const std::string path = group_path_for(controller);
        if (mkdir(path.c_str(), 0755) != 0) {
            throw CgroupError(errno_message("Failed to create cgroup " + path, errno));
        }
        group_paths_.push_back(path);
        log_debug("Created cgroup " + path);
    }
}

void CgroupController::apply_limits() {
    if (limits_.memory_swap > 0 && limits_.memory_swap < limits_.memory_limit) {
        throw CgroupError("memory-swap limit must not be smaller than the memory limit");
    }
    if (limits_.memory_swap > 0 && limits_.memory_limit <= 0) {
        throw CgroupError("memory-swap limit requires a memory limit");
    }

    if (version_ == CgroupVersion::V2) {
        const std::string path = group_path_for("");
        if (limits_.cpu_shares > 0) {
            write_cgroup_file(path_join(path, "cpu.weight"), std::to_string(cpu_shares_to_weight(limits_.cpu_shares)));
        }
        if (limits_.memory_limit > 0) {
            write_cgroup_file(path_join(path, "memory.max"), std::to_string(limits_.memory_limit));
        }
        if (limits_.memory_swap == -1) {
            write_cgroup_file(path_join(path, "memory.swap.max"), "max");
        } else if (limits_.memory_swap > 0) {
            write_cgroup_file(path_join(path, "memory.swap.max"),
                              std::to_string(limits_.memory_swap - limits_.memory_limit));
        }
        return;
    }

    if (limits_.cpu_shares > 0) {
        write_cgroup_file(path_join(group_path_for("cpu"), "cpu.shares"), std::to_string(limits_.cpu_shares));
    }
    if (limits_.memory_limit > 0) {
        write_cgroup_file(path_join(group_path_for("memory"), "memory.limit_in_bytes"),
                          std::to_string(limits_.memory_limit));
    }
    if (limits_.memory_swap != 0) {
        write_cgroup_file(path_join(group_path_for("memory"), "memory.memsw.limit_in_bytes"),
                          std::to_string(limits_.memory_swap));
    }
}

void CgroupController::attach(pid_t pid) {
    if (group_paths_.empty()) {
        throw CgroupError("No cgroup created for container " + id_);
    }
    for (const auto& path : group_paths_) {
        write_cgroup_file(path_join(path, "cgroup.procs"), std::to_string(pid));
    }
    log_debug("Attached pid " + std::to_string(pid) + " to cgroup(s) of " + id_);
}

void CgroupController::adopt_groups(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        if (std::find(group_paths_.begin(), group_paths_.end(), path) == group_paths_.end()) {
            group_paths_.push_back(path);
        }
    }
}

std::vector<std::string> CgroupController::remove() {
    std::vector<std::string> errors;
    std::vector<std::string> remaining;
    for (auto it = group_paths_.rbegin(); it != group_paths_.rend(); ++it) {
        const std::string& path = *it;
        bool removed = false;
        int last_errno = 0;
        for (int attempt = 0; attempt < REMOVE_ATTEMPTS; ++attempt) {
            if (kernel_.rmdir(path) == 0 || errno == ENOENT) {
                removed = true;
                break;
            }
            last_errno = errno;
            if (last_errno != EBUSY) {
                break;
            }
            // Processes of a dead PID namespace may still be exiting.
            for (pid_t pid : read_cgroup_procs(path)) {
                kill(pid, SIGKILL);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(REMOVE_RETRY_MS));
        }
        if (removed) {
            log_debug("Removed cgroup " + path);
        } else {
            errors.push_back(errno_message("Failed to remove cgroup " + path, last_errno));
            remaining.insert(remaining.begin(), path);
        }
    }
    group_paths_ = remaining;
    return errors;
}
