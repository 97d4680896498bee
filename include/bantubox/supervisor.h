#pragma once

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

#include "bantubox/cgroup.h"
#include "bantubox/filesystem.h"
#include "bantubox/kernel.h"
#include "bantubox/namespaces.h"
#include "bantubox/state.h"

enum class ContainerStage {
    Created,
    FilesystemReady,
    NamespacesReady,
    NetworkReady,
    CgroupApplied,
    Running,
    Exited,
    Cleaned
};

const char* stage_name(ContainerStage stage);

struct Container {
    std::string id;
    std::string image;
    std::string command;
    std::vector<std::string> args;
    OverlayPaths paths;
    std::vector<std::string> cgroup_paths;
    pid_t pid = -1;
    ContainerStage state = ContainerStage::Created;
    int exit_code = -1;
};

struct RunOptions {
    std::string image = "ubuntu";
    std::vector<std::string> command;
    ResourceLimits limits;
    int handshake_timeout_ms = DEFAULT_HANDSHAKE_TIMEOUT_MS;
    std::string images_dir;
    std::string containers_dir;
    std::string cgroup_root;
};

std::string generate_container_id();
std::string image_path_for(const std::string& images_dir, const std::string& image);

// Drives one container from id allocation to Cleaned. Every failure before
// Running unwinds exactly the stages that completed, in reverse.
class ContainerSupervisor {
public:
    ContainerSupervisor(KernelOps& kernel, RunOptions options);

    // Returns the contained command's exit code. Throws ContainerError (with
    // any teardown errors attached) when the container never ran.
    int run();

    const Container& container() const { return container_; }

private:
    void advance(ContainerStage next);
    std::string allocate_id();
    void start();
    void abort_child();
    std::vector<std::string> teardown();
    ContainerRecord make_record() const;

    KernelOps& kernel_;
    RunOptions options_;
    ContainerRegistry registry_;
    Container container_;
    std::unique_ptr<FilesystemJail> jail_;
    std::unique_ptr<CgroupController> cgroup_;
    Handshake handshake_;
    pid_t child_pid_ = -1;
    bool registered_ = false;
    std::string created_;
};

int run_container(KernelOps& kernel, const RunOptions& options);

// Sends SIGTERM to a registered container's init, SIGKILL after timeout_sec,
// and waits until the init is gone. As a PID namespace init the command only
// sees SIGTERM if it installed a handler; otherwise the full timeout elapses
// before the SIGKILL. Returns false when the container is not running.
bool stop_container(ContainerRegistry& registry, const std::string& id, int timeout_sec);

// Releases the leftovers of a container whose init is gone. Throws
// ContainerError when it is still running; returns teardown errors.
std::vector<std::string> delete_container(KernelOps& kernel,
                                          ContainerRegistry& registry,
                                          const std::string& containers_dir,
                                          const std::string& cgroup_root,
                                          const std::string& id);
