#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#define main bantubox_cli_main
#include "../main.cpp"
#undef main

#include "bantubox/process.h"

namespace fs = std::filesystem;

constexpr int SKIP_EXIT_CODE = 77;

struct TestContext {
    int passed = 0;
    int failed = 0;

    void expect(bool condition, const std::string& name, const std::string& message = "") {
        if (condition) {
            ++passed;
        } else {
            ++failed;
            std::cerr << "[FAIL] " << name;
            if (!message.empty()) {
                std::cerr << " - " << message;
            }
            std::cerr << std::endl;
        }
    }
};

struct Sandbox {
    std::string root;
    std::string images;
    std::string containers;
    std::string image_source;
};

struct RunResult {
    int exit_code = -1;
    std::string output;
    std::string id;
    OverlayPaths paths;
    bool threw = false;
    ErrorKind error_kind = ErrorKind::Generic;
    std::string error;
};

std::string make_temp_dir(const std::string& prefix) {
    std::string tmpl = "/tmp/" + prefix + "XXXXXX";
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    char* created = mkdtemp(buffer.data());
    if (!created) {
        throw std::runtime_error("mkdtemp failed");
    }
    return created;
}

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

bool path_exists(const std::string& path) {
    struct stat st {};
    return lstat(path.c_str(), &st) == 0;
}

bool mount_table_mentions(const std::string& path) {
    return read_file("/proc/self/mountinfo").find(path) != std::string::npos;
}

bool cgroup_group_exists(const std::string& id) {
    const std::string root = g_global_options.cgroup_root;
    return path_exists(path_join(path_join(root, CGROUP_GROUP_NAME), id)) ||
           path_exists(path_join(path_join(path_join(root, "cpu"), CGROUP_GROUP_NAME), id)) ||
           path_exists(path_join(path_join(path_join(root, "memory"), CGROUP_GROUP_NAME), id));
}

size_t directory_entries(const std::string& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return 0;
    }
    size_t count = 0;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        ++count;
    }
    return count;
}

std::string host_hostname() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "";
    }
    return buffer;
}

RunOptions sandbox_options(const Sandbox& sandbox, const std::vector<std::string>& command) {
    RunOptions options;
    options.image = "base";
    options.command = command;
    options.images_dir = sandbox.images;
    options.containers_dir = sandbox.containers;
    options.cgroup_root = g_global_options.cgroup_root;
    options.handshake_timeout_ms = 10000;
    return options;
}

// Runs a container with its stdout redirected into a file under the sandbox.
RunResult run_captured(const Sandbox& sandbox, const RunOptions& options) {
    RunResult result;
    const std::string capture = path_join(sandbox.root, "stdout.capture");
    std::cout.flush();
    std::fflush(stdout);
    int saved = dup(STDOUT_FILENO);
    int fd = open(capture.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (saved < 0 || fd < 0) {
        throw std::runtime_error(errno_message("Failed to redirect stdout", errno));
    }
    dup2(fd, STDOUT_FILENO);
    close(fd);

    LinuxKernelOps kernel;
    ContainerSupervisor supervisor(kernel, options);
    try {
        result.exit_code = supervisor.run();
    } catch (const ContainerError& e) {
        result.threw = true;
        result.error_kind = e.kind();
        result.error = e.describe();
    }
    result.id = supervisor.container().id;
    result.paths = supervisor.container().paths;

    std::fflush(stdout);
    dup2(saved, STDOUT_FILENO);
    close(saved);
    result.output = read_file(capture);
    unlink(capture.c_str());
    return result;
}

void expect_no_leftovers(TestContext& ctx, const std::string& name, const RunResult& result) {
    ctx.expect(!result.id.empty(), name + " allocated an id");
    ctx.expect(!mount_table_mentions(result.paths.root), name + " leaves no mounts", result.paths.root);
    ctx.expect(!path_exists(result.paths.root), name + " removes upper/work/merged", result.paths.root);
    ctx.expect(!cgroup_group_exists(result.id), name + " removes its cgroup", result.id);
}

void test_echo_hello(TestContext& ctx, const Sandbox& sandbox) {
    RunResult result = run_captured(sandbox, sandbox_options(sandbox, {"/bin/echo", "hello"}));
    ctx.expect(!result.threw, "echo runs", result.error);
    ctx.expect(result.exit_code == 0, "echo exits 0", std::to_string(result.exit_code));
    ctx.expect(result.output == "hello\n", "echo output", result.output);
    expect_no_leftovers(ctx, "echo", result);
}

void test_exit_code_propagates(TestContext& ctx, const Sandbox& sandbox) {
    RunResult result = run_captured(sandbox, sandbox_options(sandbox, {"/bin/sh", "-c", "exit 7"}));
    ctx.expect(result.exit_code == 7, "exit code propagates", std::to_string(result.exit_code));
    expect_no_leftovers(ctx, "exit code", result);
}

void test_hostname_and_pid(TestContext& ctx, const Sandbox& sandbox) {
    const std::string before = host_hostname();
    RunResult result = run_captured(sandbox, sandbox_options(sandbox, {
            "/bin/sh", "-c", "read name < /proc/sys/kernel/hostname; echo $name $$"
    }));
    std::istringstream fields(result.output);
    std::string hostname;
    std::string pid;
    fields >> hostname >> pid;
    ctx.expect(hostname == result.id, "hostname inside equals id", hostname + " vs " + result.id);
    ctx.expect(pid == "1", "init is pid 1 in its namespace", pid);
    ctx.expect(host_hostname() == before, "host hostname unchanged");
    expect_no_leftovers(ctx, "hostname", result);
}

void test_image_is_not_mutated(TestContext& ctx, const Sandbox& sandbox) {
    const std::string marker = "bantubox-lifecycle-marker";
    const std::string image_hostname = path_join(sandbox.image_source, "etc/hostname");
    const bool had_hostname = path_exists(image_hostname);
    RunResult result = run_captured(sandbox, sandbox_options(sandbox, {
            "/bin/sh", "-c", "echo scratch > /" + marker + " && rm -f /etc/hostname"
    }));
    ctx.expect(result.exit_code == 0, "writes inside the container succeed", std::to_string(result.exit_code));
    ctx.expect(!path_exists(path_join(sandbox.image_source, marker)), "image gains no new files");
    ctx.expect(path_exists(image_hostname) == had_hostname, "image files survive deletion inside the container");
    expect_no_leftovers(ctx, "image write", result);
}

void test_concurrent_runs(TestContext& ctx, const Sandbox& sandbox) {
    auto launch = [&sandbox]() {
        LinuxKernelOps kernel;
        ContainerSupervisor supervisor(kernel, sandbox_options(sandbox, {"/bin/true"}));
        int code = supervisor.run();
        return std::make_pair(code, supervisor.container().id);
    };
    auto first = std::async(std::launch::async, launch);
    auto second = std::async(std::launch::async, launch);
    try {
        auto a = first.get();
        auto b = second.get();
        ctx.expect(a.first == 0 && b.first == 0, "concurrent runs exit 0");
        ctx.expect(a.second != b.second, "concurrent runs get distinct ids");
        ctx.expect(!cgroup_group_exists(a.second) && !cgroup_group_exists(b.second),
                   "concurrent runs remove their cgroups");
    } catch (const std::exception& e) {
        ctx.expect(false, "concurrent runs", e.what());
    }
    ctx.expect(directory_entries(sandbox.containers) == 0, "concurrent runs leave no container state");
}

void test_without_privilege(TestContext& ctx, const Sandbox& sandbox) {
    pid_t child = fork();
    if (child == 0) {
        if (setgid(65534) != 0 || setuid(65534) != 0) {
            _exit(1);
        }
        LinuxKernelOps kernel;
        try {
            run_container(kernel, sandbox_options(sandbox, {"/bin/true"}));
        } catch (const ContainerError& e) {
            _exit(setup_failure_exit_code(e.kind()));
        }
        _exit(0);
    }
    int status = 0;
    bool reaped = wait_for_process(child, status);
    ctx.expect(reaped && exit_code_from_status(status) == setup_failure_exit_code(ErrorKind::Privilege),
               "unprivileged run fails with privilege error", std::to_string(exit_code_from_status(status)));
    ctx.expect(directory_entries(sandbox.containers) == 0, "unprivileged run creates nothing");
}

void test_missing_image(TestContext& ctx, const Sandbox& sandbox) {
    RunOptions options = sandbox_options(sandbox, {"/bin/true"});
    options.image = "missing-image";
    RunResult result = run_captured(sandbox, options);
    ctx.expect(result.threw && result.error_kind == ErrorKind::ImageNotFound, "missing image reported", result.error);
    ctx.expect(directory_entries(sandbox.containers) == 0, "missing image creates nothing");
}

// A read-only tmpfs posing as a cgroup v2 root makes group creation fail
// after the overlay, namespaces and network stages have succeeded.
void test_cgroup_failure_unwinds(TestContext& ctx, const Sandbox& sandbox) {
    const std::string fake_root = path_join(sandbox.root, "cgroup");
    if (!ensure_directory(fake_root) || mount("tmpfs", fake_root.c_str(), "tmpfs", 0, "size=64k") != 0) {
        ctx.expect(false, "mount fake cgroup root", std::strerror(errno));
        return;
    }
    {
        std::ofstream controllers(path_join(fake_root, "cgroup.controllers"));
        controllers << "cpu memory" << std::endl;
    }
    ensure_directory(path_join(fake_root, CGROUP_GROUP_NAME));
    if (mount("", fake_root.c_str(), "", MS_REMOUNT | MS_RDONLY, "") != 0) {
        ctx.expect(false, "remount fake cgroup root read-only", std::strerror(errno));
        umount2(fake_root.c_str(), MNT_DETACH);
        return;
    }

    RunOptions options = sandbox_options(sandbox, {"/bin/echo", "command-ran"});
    options.cgroup_root = fake_root;
    RunResult result = run_captured(sandbox, options);
    ctx.expect(result.threw && result.error_kind == ErrorKind::Cgroup, "cgroup failure reported", result.error);
    ctx.expect(result.output.find("command-ran") == std::string::npos, "command never runs", result.output);
    ctx.expect(!mount_table_mentions(result.paths.root), "cgroup failure unmounts overlay");
    ctx.expect(directory_entries(sandbox.containers) == 0, "cgroup failure leaves no container state");

    umount2(fake_root.c_str(), MNT_DETACH);
    rmdir(fake_root.c_str());
}

void test_list_shows_nothing_after_runs(TestContext& ctx, const Sandbox& sandbox) {
    ContainerRegistry registry(sandbox.containers);
    ctx.expect(registry.list().empty(), "registry empty after clean runs");
}

int main() {
    const char* image = std::getenv("BANTUBOX_TEST_IMAGE");
    if (geteuid() != 0 || image == nullptr || !fs::is_directory(image)) {
        std::cout << "[SKIP] lifecycle tests need root and BANTUBOX_TEST_IMAGE pointing at a root filesystem"
                  << std::endl;
        return SKIP_EXIT_CODE;
    }
    if (std::getenv("BANTUBOX_TEST_CGROUP_ROOT") != nullptr) {
        g_global_options.cgroup_root = std::getenv("BANTUBOX_TEST_CGROUP_ROOT");
    }

    Sandbox sandbox;
    sandbox.root = make_temp_dir("bantubox-lifecycle-");
    sandbox.images = path_join(sandbox.root, "images");
    sandbox.containers = path_join(sandbox.root, "containers");
    sandbox.image_source = image;
    g_global_options.root_path = sandbox.root;
    ensure_directory(sandbox.images);
    ensure_directory(sandbox.containers);
    if (symlink(image, path_join(sandbox.images, "base").c_str()) != 0) {
        std::cerr << errno_message("Failed to link test image", errno) << std::endl;
        return 1;
    }

    TestContext ctx;

    test_echo_hello(ctx, sandbox);
    test_exit_code_propagates(ctx, sandbox);
    test_hostname_and_pid(ctx, sandbox);
    test_image_is_not_mutated(ctx, sandbox);
    test_concurrent_runs(ctx, sandbox);
    test_without_privilege(ctx, sandbox);
    test_missing_image(ctx, sandbox);
    test_cgroup_failure_unwinds(ctx, sandbox);
    test_list_shows_nothing_after_runs(ctx, sandbox);

    std::error_code ec;
    fs::remove_all(sandbox.root, ec);

    std::cout << "[TEST SUMMARY] Passed: " << ctx.passed << ", Failed: " << ctx.failed << std::endl;
    return ctx.failed == 0 ? 0 : 1;
}
