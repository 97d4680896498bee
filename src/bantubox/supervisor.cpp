#include "bantubox/supervisor.h"

#include <cerrno>
#include <cstdint>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <utility>

#include "bantubox/errors.h"
#include "bantubox/options.h"
#include "bantubox/process.h"

namespace {

constexpr int ID_ATTEMPTS = 8;
constexpr int KILL_CONFIRM_SEC = 5;
constexpr int STOP_POLL_MS = 100;

bool path_exists(const std::string& path) {
    struct stat st {};
    return lstat(path.c_str(), &st) == 0;
}

// Polls until pid is gone; the init is not our child, so it cannot be waited on.
bool wait_for_exit(pid_t pid, int timeout_sec) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (process_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(STOP_POLL_MS));
    }
    return true;
}

} // namespace

const char* stage_name(ContainerStage stage) {
    switch (stage) {
        case ContainerStage::Created:
            return "created";
        case ContainerStage::FilesystemReady:
            return "filesystem-ready";
        case ContainerStage::NamespacesReady:
            return "namespaces-ready";
        case ContainerStage::NetworkReady:
            return "network-ready";
        case ContainerStage::CgroupApplied:
            return "cgroup-applied";
        case ContainerStage::Running:
            return "running";
        case ContainerStage::Exited:
            return "exited";
        case ContainerStage::Cleaned:
            return "cleaned";
    }
    return "unknown";
}

std::string generate_container_id() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t high = dist(gen);
    uint64_t low = dist(gen);
    // RFC 4122 version 4, variant 1.
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string image_path_for(const std::string& images_dir, const std::string& image) {
    if (image.empty() || image == "." || image == ".." || image.find('/') != std::string::npos) {
        throw ImageNotFoundError("Invalid image name '" + image + "'");
    }
    return path_join(images_dir, image);
}

ContainerSupervisor::ContainerSupervisor(KernelOps& kernel, RunOptions options)
    : kernel_(kernel), options_(std::move(options)), registry_(options_.containers_dir) {
    container_.image = options_.image;
    if (!options_.command.empty()) {
        container_.command = options_.command.front();
        container_.args.assign(options_.command.begin() + 1, options_.command.end());
    }
}

void ContainerSupervisor::advance(ContainerStage next) {
    if (next <= container_.state) {
        throw std::logic_error(std::string("container stage cannot move from ") +
                               stage_name(container_.state) + " to " + stage_name(next));
    }
    log_debug("Container " + container_.id + ": " + stage_name(container_.state) + " -> " + stage_name(next));
    container_.state = next;
}

std::string ContainerSupervisor::allocate_id() {
    for (int attempt = 0; attempt < ID_ATTEMPTS; ++attempt) {
        std::string id = generate_container_id();
        if (!path_exists(path_join(options_.containers_dir, id)) && !registry_.contains(id)) {
            return id;
        }
    }
    throw ContainerError(ErrorKind::Generic, "Unable to allocate a unique container id");
}

ContainerRecord ContainerSupervisor::make_record() const {
    ContainerRecord record;
    record.id = container_.id;
    record.image = container_.image;
    record.command = options_.command;
    record.status = stage_name(container_.state);
    record.pid = container_.pid;
    record.supervisor_pid = getpid();
    record.root_path = container_.paths.root;
    record.merged_path = container_.paths.merged;
    record.cgroup_paths = container_.cgroup_paths;
    record.created = created_;
    return record;
}

int ContainerSupervisor::run() {
    if (kernel_.effective_uid() != 0) {
        throw PrivilegeError("bantubox must run as root to create namespaces and mounts");
    }
    if (options_.command.empty()) {
        throw ContainerError(ErrorKind::Generic, "No command given for the container");
    }

    const std::string image_path = image_path_for(options_.images_dir, options_.image);
    container_.id = allocate_id();
    container_.paths = overlay_paths_for(options_.containers_dir, container_.id);

    jail_.reset(new FilesystemJail(kernel_, image_path, container_.paths));
    jail_->prepare();
    advance(ContainerStage::FilesystemReady);

    try {
        start();
    } catch (ContainerError& e) {
        abort_child();
        e.add_teardown_errors(teardown());
        throw;
    } catch (const std::exception& e) {
        abort_child();
        ContainerError error(ErrorKind::Generic, e.what());
        error.add_teardown_errors(teardown());
        throw error;
    }

    int status = 0;
    if (!wait_for_process(child_pid_, status)) {
        ContainerError error(ErrorKind::Generic, errno_message("waitpid on container init failed", errno));
        abort_child();
        error.add_teardown_errors(teardown());
        throw error;
    }
    child_pid_ = -1;
    container_.exit_code = exit_code_from_status(status);
    advance(ContainerStage::Exited);
    log_debug("Container " + container_.id + " exited with code " + std::to_string(container_.exit_code));

    for (const auto& error : teardown()) {
        std::cerr << "Error during teardown of " << container_.id << ": " << error << std::endl;
    }
    return container_.exit_code;
}

void ContainerSupervisor::start() {
    created_ = iso8601_now();
    if (!registry_.register_container(make_record())) {
        throw ContainerError(ErrorKind::Generic, "Failed to register container " + container_.id);
    }
    registered_ = true;

    handshake_.open();
    ChildContext ctx;
    ctx.kernel = &kernel_;
    ctx.jail = jail_.get();
    ctx.handshake = &handshake_;
    ctx.hostname = container_.id;
    ctx.argv = options_.command;
    ctx.handshake_timeout_ms = options_.handshake_timeout_ms;
    child_pid_ = spawn_container_process(kernel_, ctx);
    advance(ContainerStage::NamespacesReady);

    handshake_.await_ready(options_.handshake_timeout_ms);
    advance(ContainerStage::NetworkReady);

    cgroup_.reset(new CgroupController(kernel_, options_.cgroup_root, container_.id, options_.limits));
    cgroup_->ensure_root_group();
    try {
        cgroup_->create();
        cgroup_->apply_limits();
        cgroup_->attach(child_pid_);
    } catch (const ContainerError&) {
        container_.cgroup_paths = cgroup_->group_paths();
        throw;
    }
    container_.cgroup_paths = cgroup_->group_paths();
    advance(ContainerStage::CgroupApplied);

    handshake_.release();
    handshake_.await_exec(options_.handshake_timeout_ms);
    container_.pid = child_pid_;
    advance(ContainerStage::Running);
    if (!registry_.update(make_record())) {
        log_warning("Failed to record running state of " + container_.id);
    }
}

void ContainerSupervisor::abort_child() {
    if (child_pid_ <= 0) {
        return;
    }
    handshake_.abort();
    kill_and_reap(child_pid_);
    log_debug("Killed container init " + std::to_string(child_pid_));
    child_pid_ = -1;
}

std::vector<std::string> ContainerSupervisor::teardown() {
    std::vector<std::string> errors;

    if (cgroup_) {
        auto cgroup_errors = cgroup_->remove();
        errors.insert(errors.end(), cgroup_errors.begin(), cgroup_errors.end());
        container_.cgroup_paths = cgroup_->group_paths();
    }
    if (jail_) {
        auto fs_errors = jail_->teardown();
        errors.insert(errors.end(), fs_errors.begin(), fs_errors.end());
    }

    if (registered_) {
        if (errors.empty()) {
            if (registry_.remove(container_.id)) {
                registered_ = false;
            } else {
                errors.push_back("Failed to remove registry entry for " + container_.id);
            }
        } else {
            // Keep the entry so `delete` can finish the job later.
            ContainerRecord record = make_record();
            record.status = "dirty";
            if (!registry_.update(record)) {
                errors.push_back("Failed to mark registry entry of " + container_.id + " as dirty");
            }
        }
    }

    container_.state = ContainerStage::Cleaned;
    return errors;
}

int run_container(KernelOps& kernel, const RunOptions& options) {
    ContainerSupervisor supervisor(kernel, options);
    return supervisor.run();
}

bool stop_container(ContainerRegistry& registry, const std::string& id, int timeout_sec) {
    ContainerRecord record = registry.lookup(id);
    if (record.status != stage_name(ContainerStage::Running) || !process_alive(record.pid)) {
        return false;
    }
    if (kill(record.pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            return false;
        }
        throw ContainerError(ErrorKind::Generic, errno_message("Failed to signal container " + id, errno));
    }
    if (wait_for_exit(record.pid, timeout_sec)) {
        return true;
    }
    log_debug("Container " + id + " ignored SIGTERM, sending SIGKILL");
    if (kill(record.pid, SIGKILL) != 0 && errno != ESRCH) {
        throw ContainerError(ErrorKind::Generic, errno_message("Failed to kill container " + id, errno));
    }
    if (!wait_for_exit(record.pid, KILL_CONFIRM_SEC)) {
        throw ContainerError(ErrorKind::Generic, "Container " + id + " is still alive after SIGKILL");
    }
    return true;
}

std::vector<std::string> delete_container(KernelOps& kernel,
                                          ContainerRegistry& registry,
                                          const std::string& containers_dir,
                                          const std::string& cgroup_root,
                                          const std::string& id) {
    ContainerRecord record = registry.lookup(id);
    if (record.status == stage_name(ContainerStage::Running) && process_alive(record.pid)) {
        throw ContainerError(ErrorKind::Generic, "Container " + id + " is still running; stop it first");
    }
    if (record.status != "dirty" && process_alive(record.supervisor_pid)) {
        throw ContainerError(ErrorKind::Generic, "Container " + id + " is still managed by process " +
                                                 std::to_string(record.supervisor_pid));
    }

    std::vector<std::string> errors;
    CgroupController cgroup(kernel, cgroup_root, id, ResourceLimits());
    cgroup.adopt_groups(record.cgroup_paths);
    auto cgroup_errors = cgroup.remove();
    errors.insert(errors.end(), cgroup_errors.begin(), cgroup_errors.end());

    FilesystemJail jail(kernel, "", overlay_paths_for(containers_dir, id));
    jail.adopt_existing();
    auto fs_errors = jail.teardown();
    errors.insert(errors.end(), fs_errors.begin(), fs_errors.end());

    if (errors.empty() && !registry.remove(id)) {
        errors.push_back("Failed to remove registry entry for " + id);
    }
    return errors;
}
