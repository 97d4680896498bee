#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sched.h>
#include <set>
#include <sstream>
#include <string>
#include <sys/mount.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#define main bantubox_cli_main
#include "../main.cpp"
#undef main

#include "bantubox/namespaces.h"
#include "bantubox/process.h"

namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

void write_file(const std::string& path, const std::string& contents) {
    ensure_parent_directory(path);
    std::ofstream ofs(path);
    ofs << contents;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

// Records every privileged call and only touches paths inside the sandbox.
// clone_process forks a plain child, so the staged init and the exec of the
// target command run for real, just without new namespaces.
class FakeKernelOps : public KernelOps {
public:
    explicit FakeKernelOps(std::string sandbox) : sandbox_(std::move(sandbox)) {}

    uid_t euid = 0;
    int clone_errno = 0;
    int overlay_errno = 0;
    int hostname_errno = 0;
    int interface_errno = 0;
    // The init reports ready and exits at once; clone returns only after it
    // is gone, so the release write finds no reader.
    bool exit_after_ready = false;
    // umount2 of any overlay mountpoint fails with EBUSY.
    bool busy_merged = false;
    int clone_calls = 0;
    int last_clone_flags = 0;
    std::vector<std::string> calls;
    std::set<std::string> mounted;
    std::string last_overlay_data;

    pid_t clone_process(int (*entry)(void*), int flags, void* arg) override {
        ++clone_calls;
        last_clone_flags = flags;
        calls.push_back("clone");
        if (clone_errno != 0) {
            errno = clone_errno;
            return -1;
        }
        pid_t pid = fork();
        if (pid == 0) {
            if (exit_after_ready) {
                ChildContext* ctx = static_cast<ChildContext*>(arg);
                ctx->handshake->close_parent_ends();
                ctx->handshake->report_ready();
                _exit(0);
            }
            _exit(entry(arg));
        }
        if (pid > 0 && exit_after_ready) {
            siginfo_t info {};
            waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
        }
        return pid;
    }

    int unshare(int) override {
        calls.push_back("unshare");
        return 0;
    }

    int setns(int, int) override {
        calls.push_back("setns");
        return 0;
    }

    int pivot_root(const std::string& new_root, const std::string&) override {
        calls.push_back("pivot_root " + new_root);
        return 0;
    }

    int mount(const std::string&,
              const std::string& target,
              const std::string& fstype,
              unsigned long,
              const std::string& data) override {
        calls.push_back("mount " + fstype + " " + target);
        if (fstype == "overlay") {
            if (overlay_errno != 0) {
                errno = overlay_errno;
                return -1;
            }
            last_overlay_data = data;
            mounted.insert(target);
        }
        return 0;
    }

    int umount2(const std::string& target, int) override {
        calls.push_back("umount " + target);
        if (busy_merged && mounted.count(target) > 0) {
            errno = EBUSY;
            return -1;
        }
        if (mounted.erase(target) > 0 || !in_sandbox(target)) {
            return 0;
        }
        errno = EINVAL;
        return -1;
    }

    int sethostname(const std::string& name) override {
        calls.push_back("sethostname " + name);
        if (hostname_errno != 0) {
            errno = hostname_errno;
            return -1;
        }
        return 0;
    }

    int mknod(const std::string& path, mode_t, dev_t) override {
        calls.push_back("mknod " + path);
        return 0;
    }

    int rmdir(const std::string& path) override {
        calls.push_back("rmdir " + path);
        if (!in_sandbox(path)) {
            return 0;
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            errno = ENOENT;
            return -1;
        }
        fs::remove_all(path, ec);
        if (ec) {
            errno = ec.value();
            return -1;
        }
        return 0;
    }

    int interface_up(const std::string& name) override {
        calls.push_back("interface_up " + name);
        if (interface_errno != 0) {
            errno = interface_errno;
            return -1;
        }
        return 0;
    }

    uid_t effective_uid() override {
        return euid;
    }

    bool called(const std::string& prefix) const {
        return std::any_of(calls.begin(), calls.end(), [&](const std::string& call) {
            return starts_with(call, prefix);
        });
    }

private:
    bool in_sandbox(const std::string& path) const {
        return starts_with(path, sandbox_ + "/");
    }

    std::string sandbox_;
};

class BantuboxFixture : public ::testing::Test {
protected:
    std::string root;
    std::string images;
    std::string containers;
    std::string cgroups;
    std::unique_ptr<FakeKernelOps> kernel;

    void SetUp() override {
        const testing::TestInfo* info = testing::UnitTest::GetInstance()->current_test_info();
        std::string test_name = info ? info->name() : "default";
        std::string safe_name = test_name;
        std::transform(safe_name.begin(), safe_name.end(), safe_name.begin(), [](unsigned char c) {
            return (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
        });
        root = "/tmp/bantubox-gtest-" + std::to_string(getpid()) + "-" + safe_name;
        images = root + "/images";
        containers = root + "/containers";
        cgroups = root + "/cgroup";
        ensure_directory(images + "/base/etc", 0755);
        write_file(images + "/base/etc/hostname", "base\n");
        use_cgroup_v2("cpu memory");
        kernel.reset(new FakeKernelOps(root));
        g_global_options.root_path = root;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void use_cgroup_v2(const std::string& controllers) {
        std::error_code ec;
        fs::remove_all(cgroups, ec);
        write_file(cgroups + "/cgroup.controllers", controllers + "\n");
    }

    void use_cgroup_v1() {
        std::error_code ec;
        fs::remove_all(cgroups, ec);
        ensure_directory(cgroups + "/cpu", 0755);
        ensure_directory(cgroups + "/memory", 0755);
    }

    RunOptions run_options(const std::vector<std::string>& command) const {
        RunOptions options;
        options.image = "base";
        options.command = command;
        options.images_dir = images;
        options.containers_dir = containers;
        options.cgroup_root = cgroups;
        options.handshake_timeout_ms = 5000;
        return options;
    }

    size_t entries_in(const std::string& dir) const {
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            return 0;
        }
        return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
    }
};

TEST(CgroupMath, CpuSharesToWeight) {
    EXPECT_EQ(100u, cpu_shares_to_weight(0));
    EXPECT_EQ(1u, cpu_shares_to_weight(1));
    EXPECT_EQ(39u, cpu_shares_to_weight(1024));
    EXPECT_EQ(10000u, cpu_shares_to_weight(262144));
    EXPECT_EQ(10000u, cpu_shares_to_weight(1000000));
}

TEST(CliOptions, ParseRunOptionsHandlesFlags) {
    RunCommandOptions opts;
    std::vector<std::string> args = {
            "run", "-i", "alpine", "--cpu-shares", "512", "--memory", "64m",
            "--memory-swap", "-1", "/bin/echo", "-n", "hello"
    };
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    ASSERT_TRUE(parse_run_options(static_cast<int>(argv.size()), argv.data(), opts));
    EXPECT_EQ("alpine", opts.image);
    EXPECT_TRUE(opts.has_cpu_shares);
    EXPECT_EQ(512, opts.cpu_shares);
    EXPECT_EQ(64LL * 1024 * 1024, opts.memory);
    EXPECT_EQ(-1, opts.memory_swap);
    ASSERT_EQ(3u, opts.command.size());
    EXPECT_EQ("/bin/echo", opts.command[0]);
    EXPECT_EQ("-n", opts.command[1]);
    EXPECT_EQ("hello", opts.command[2]);
}

TEST(CliOptions, ParseRunOptionsRejectsMissingCommandAndBadValues) {
    ::testing::internal::CaptureStderr();
    RunCommandOptions missing;
    std::vector<std::string> missing_args = {"run", "-i", "base"};
    std::vector<char*> missing_argv;
    for (auto& arg : missing_args) {
        missing_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    EXPECT_FALSE(parse_run_options(static_cast<int>(missing_argv.size()), missing_argv.data(), missing));

    RunCommandOptions bad;
    std::vector<std::string> bad_args = {"run", "--memory", "12q", "/bin/true"};
    std::vector<char*> bad_argv;
    for (auto& arg : bad_args) {
        bad_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    EXPECT_FALSE(parse_run_options(static_cast<int>(bad_argv.size()), bad_argv.data(), bad));
    ::testing::internal::GetCapturedStderr();
}

TEST(CliOptions, BuildRunOptionsPrefersFlagsOverConfig) {
    RuntimeConfig config;
    config.default_image = "debian";
    config.resources.cpu_shares = 256;
    config.resources.memory_limit = 1024;
    config.handshake_timeout_ms = 7000;

    RunCommandOptions flags;
    flags.command = {"/bin/true"};
    flags.has_cpu_shares = true;
    flags.cpu_shares = 2048;

    RunOptions options = build_run_options(flags, config);
    EXPECT_EQ("debian", options.image);
    EXPECT_EQ(2048, options.limits.cpu_shares);
    EXPECT_EQ(1024, options.limits.memory_limit);
    EXPECT_EQ(7000, options.handshake_timeout_ms);
}

TEST(Config, ParseMemorySizeSuffixes) {
    EXPECT_EQ(512, parse_memory_size("512"));
    EXPECT_EQ(1024, parse_memory_size("1k"));
    EXPECT_EQ(2LL * 1024 * 1024, parse_memory_size("2M"));
    EXPECT_EQ(1024LL * 1024 * 1024, parse_memory_size("1gb"));
    EXPECT_EQ(-1, parse_memory_size("-1"));
    EXPECT_THROW(parse_memory_size("abc"), std::runtime_error);
    EXPECT_THROW(parse_memory_size("5x"), std::runtime_error);
    EXPECT_THROW(parse_memory_size("-5"), std::runtime_error);
}

TEST_F(BantuboxFixture, LoadRuntimeConfigReadsSettings) {
    const std::string path = root + "/bantubox.json";
    write_file(path, R"({
        "root": "/srv/bantubox",
        "cgroupRoot": "/sys/fs/cgroup/unified",
        "defaultImage": "alpine",
        "handshakeTimeoutMs": 1500,
        "resources": {"cpu": {"shares": 512}, "memory": {"limit": "256m", "swap": -1}}
    })");
    RuntimeConfig config = load_runtime_config(path);
    EXPECT_EQ("/srv/bantubox", config.root_path);
    EXPECT_EQ("/sys/fs/cgroup/unified", config.cgroup_root);
    EXPECT_EQ("alpine", config.default_image);
    EXPECT_EQ(1500, config.handshake_timeout_ms);
    EXPECT_EQ(512, config.resources.cpu_shares);
    EXPECT_EQ(256LL * 1024 * 1024, config.resources.memory_limit);
    EXPECT_EQ(-1, config.resources.memory_swap);

    write_file(path, R"({"handshakeTimeoutMs": 0})");
    EXPECT_THROW(load_runtime_config(path), std::exception);
    write_file(path, "{ not json");
    EXPECT_THROW(load_runtime_config(path), std::exception);
}

TEST(ContainerIds, GeneratedIdsAreDistinctUuidV4) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        std::string id = generate_container_id();
        ASSERT_EQ(36u, id.size());
        EXPECT_EQ('-', id[8]);
        EXPECT_EQ('-', id[13]);
        EXPECT_EQ('4', id[14]);
        EXPECT_NE(std::string::npos, std::string("89ab").find(id[19]));
        EXPECT_TRUE(seen.insert(id).second);
    }
}

TEST(ContainerIds, ImagePathRejectsTraversal) {
    EXPECT_EQ("/bantubox/images/ubuntu", image_path_for("/bantubox/images", "ubuntu"));
    EXPECT_THROW(image_path_for("/bantubox/images", "../etc"), ImageNotFoundError);
    EXPECT_THROW(image_path_for("/bantubox/images", ".."), ImageNotFoundError);
    EXPECT_THROW(image_path_for("/bantubox/images", ""), ImageNotFoundError);
}

TEST(Errors, SetupExitCodesAreDistinctPerKind) {
    std::set<int> codes;
    const ErrorKind kinds[] = {
        ErrorKind::Generic, ErrorKind::Privilege, ErrorKind::ImageNotFound,
        ErrorKind::Namespace, ErrorKind::Mount, ErrorKind::Cgroup
    };
    for (ErrorKind kind : kinds) {
        int code = setup_failure_exit_code(kind);
        EXPECT_GE(code, kSetupFailureBase);
        EXPECT_LT(code, 256);
        EXPECT_TRUE(codes.insert(code).second);
        EXPECT_EQ(kind, error_kind_from_name(error_kind_name(kind)));
    }
}

TEST_F(BantuboxFixture, FilesystemJailPreparesAndTearsDownOverlay) {
    OverlayPaths paths = overlay_paths_for(containers, "jail-demo");
    FilesystemJail jail(*kernel, images + "/base", paths);
    jail.prepare();

    EXPECT_TRUE(jail.mounted());
    EXPECT_TRUE(fs::is_directory(paths.upper));
    EXPECT_TRUE(fs::is_directory(paths.work));
    EXPECT_TRUE(fs::is_directory(paths.merged));
    ASSERT_TRUE(fs::is_symlink(paths.lower));
    EXPECT_EQ(images + "/base", fs::read_symlink(paths.lower).string());
    EXPECT_EQ(1u, kernel->mounted.count(paths.merged));
    EXPECT_EQ("lowerdir=" + images + "/base,upperdir=" + paths.upper + ",workdir=" + paths.work,
              kernel->last_overlay_data);

    write_file(paths.upper + "/scratch.txt", "written in the container");
    EXPECT_TRUE(jail.teardown().empty());
    EXPECT_FALSE(fs::exists(paths.root));
    EXPECT_TRUE(kernel->mounted.empty());
    EXPECT_TRUE(fs::exists(images + "/base/etc/hostname"));

    // A second teardown finds nothing mounted and nothing to remove.
    EXPECT_TRUE(jail.teardown().empty());
}

TEST_F(BantuboxFixture, FilesystemJailMissingImageCreatesNothing) {
    FilesystemJail jail(*kernel, images + "/missing", overlay_paths_for(containers, "no-image"));
    EXPECT_THROW(jail.prepare(), ImageNotFoundError);
    EXPECT_FALSE(fs::exists(containers + "/no-image"));
    EXPECT_FALSE(kernel->called("mount"));
}

TEST_F(BantuboxFixture, FilesystemJailOverlayFailureLeavesNothingBehind) {
    kernel->overlay_errno = ENODEV;
    OverlayPaths paths = overlay_paths_for(containers, "bad-overlay");
    FilesystemJail jail(*kernel, images + "/base", paths);
    ::testing::internal::CaptureStderr();
    EXPECT_THROW(jail.prepare(), MountError);
    ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(fs::exists(paths.root));
    EXPECT_FALSE(jail.mounted());
}

TEST_F(BantuboxFixture, FilesystemJailRefusesExistingContainerDirectory) {
    ensure_directory(containers + "/taken", 0755);
    FilesystemJail jail(*kernel, images + "/base", overlay_paths_for(containers, "taken"));
    EXPECT_THROW(jail.prepare(), MountError);
    EXPECT_TRUE(fs::exists(containers + "/taken"));
}

TEST(MountOptions, ParseMountOptionsSplitsFlagsAndData) {
    ParsedMountOptions parsed = parse_mount_options({"ro", "nosuid", "nodev", "mode=755", "size=65536k"});
    EXPECT_EQ(static_cast<unsigned long>(MS_RDONLY | MS_NOSUID | MS_NODEV), parsed.flags);
    EXPECT_EQ("mode=755,size=65536k", parsed.data);

    bool has_devpts = false;
    for (const auto& aux : auxiliary_mounts()) {
        if (aux.type == "devpts") {
            has_devpts = true;
            EXPECT_EQ("/dev/pts", aux.destination);
        }
    }
    EXPECT_TRUE(has_devpts);
}

TEST_F(BantuboxFixture, CgroupV2LayoutLimitsAndRemoval) {
    ResourceLimits limits;
    limits.cpu_shares = 512;
    limits.memory_limit = 64 * 1024 * 1024;
    limits.memory_swap = 128 * 1024 * 1024;
    CgroupController cgroup(*kernel, cgroups, "v2-demo", limits);
    ASSERT_EQ(CgroupVersion::V2, cgroup.version());

    cgroup.ensure_root_group();
    cgroup.create();
    cgroup.apply_limits();
    cgroup.attach(4242);

    const std::string group = cgroups + "/bantubox/v2-demo";
    ASSERT_EQ(1u, cgroup.group_paths().size());
    EXPECT_EQ(group, cgroup.group_paths().front());
    EXPECT_EQ(std::to_string(cpu_shares_to_weight(512)), read_file(group + "/cpu.weight"));
    EXPECT_EQ(std::to_string(64 * 1024 * 1024), read_file(group + "/memory.max"));
    EXPECT_EQ(std::to_string(64 * 1024 * 1024), read_file(group + "/memory.swap.max"));
    EXPECT_EQ("4242", read_file(group + "/cgroup.procs"));
    EXPECT_NE(std::string::npos, read_file(cgroups + "/bantubox/cgroup.subtree_control").find("+memory"));

    EXPECT_TRUE(cgroup.remove().empty());
    EXPECT_FALSE(fs::exists(group));
    EXPECT_TRUE(fs::is_directory(cgroups + "/bantubox"));
    EXPECT_TRUE(cgroup.group_paths().empty());
}

TEST_F(BantuboxFixture, CgroupV1UsesPerControllerHierarchies) {
    use_cgroup_v1();
    ResourceLimits limits;
    limits.cpu_shares = 256;
    limits.memory_limit = 1024 * 1024;
    CgroupController cgroup(*kernel, cgroups, "v1-demo", limits);
    ASSERT_EQ(CgroupVersion::V1, cgroup.version());

    cgroup.ensure_root_group();
    cgroup.create();
    cgroup.apply_limits();
    cgroup.attach(77);

    EXPECT_EQ("256", read_file(cgroups + "/cpu/bantubox/v1-demo/cpu.shares"));
    EXPECT_EQ(std::to_string(1024 * 1024), read_file(cgroups + "/memory/bantubox/v1-demo/memory.limit_in_bytes"));
    EXPECT_EQ("77", read_file(cgroups + "/cpu/bantubox/v1-demo/cgroup.procs"));
    EXPECT_EQ("77", read_file(cgroups + "/memory/bantubox/v1-demo/cgroup.procs"));

    EXPECT_TRUE(cgroup.remove().empty());
    EXPECT_FALSE(fs::exists(cgroups + "/cpu/bantubox/v1-demo"));
    EXPECT_FALSE(fs::exists(cgroups + "/memory/bantubox/v1-demo"));
}

TEST_F(BantuboxFixture, CgroupSharedGroupCreationIsIdempotent) {
    CgroupController first(*kernel, cgroups, "first", ResourceLimits());
    CgroupController second(*kernel, cgroups, "second", ResourceLimits());
    first.ensure_root_group();
    second.ensure_root_group();
    first.create();
    second.create();
    EXPECT_TRUE(fs::is_directory(cgroups + "/bantubox/first"));
    EXPECT_TRUE(fs::is_directory(cgroups + "/bantubox/second"));

    EXPECT_TRUE(first.remove().empty());
    EXPECT_TRUE(fs::is_directory(cgroups + "/bantubox/second"));
    EXPECT_TRUE(second.remove().empty());
}

TEST_F(BantuboxFixture, CgroupMissingControllerFailsWithoutTouchingSharedGroup) {
    use_cgroup_v2("cpu");
    ResourceLimits limits;
    limits.memory_limit = 1024 * 1024;
    CgroupController cgroup(*kernel, cgroups, "no-memory", limits);
    EXPECT_THROW(cgroup.ensure_root_group(), CgroupError);
    EXPECT_FALSE(fs::exists(cgroups + "/bantubox"));
}

TEST_F(BantuboxFixture, CgroupRejectsSwapBelowMemory) {
    ResourceLimits limits;
    limits.memory_limit = 2048;
    limits.memory_swap = 1024;
    CgroupController cgroup(*kernel, cgroups, "swap", limits);
    cgroup.ensure_root_group();
    cgroup.create();
    EXPECT_THROW(cgroup.apply_limits(), CgroupError);
    EXPECT_TRUE(cgroup.remove().empty());
}

TEST_F(BantuboxFixture, RegistryPersistsAndRemovesRecords) {
    ContainerRegistry registry(containers);
    ContainerRecord record;
    record.id = "registry-demo";
    record.image = "base";
    record.command = {"/bin/sh", "-c", "true"};
    record.status = "filesystem-ready";
    record.root_path = containers + "/registry-demo";
    record.merged_path = record.root_path + "/merged";
    record.cgroup_paths = {cgroups + "/bantubox/registry-demo"};
    record.created = iso8601_now();

    ASSERT_TRUE(registry.register_container(record));
    EXPECT_TRUE(registry.contains("registry-demo"));
    EXPECT_EQ(containers + "/registry-demo.json", registry.record_path("registry-demo"));
    EXPECT_TRUE(fs::is_regular_file(registry.record_path("registry-demo")));
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(registry.register_container(record));
    ::testing::internal::GetCapturedStderr();

    record.status = "running";
    record.pid = 321;
    ASSERT_TRUE(registry.update(record));
    ContainerRecord loaded = registry.lookup("registry-demo");
    EXPECT_EQ("running", loaded.status);
    EXPECT_EQ(321, loaded.pid);
    EXPECT_EQ(record.command, loaded.command);
    EXPECT_EQ(record.cgroup_paths, loaded.cgroup_paths);

    ASSERT_EQ(1u, registry.list().size());
    EXPECT_TRUE(registry.remove("registry-demo"));
    EXPECT_FALSE(registry.contains("registry-demo"));
    EXPECT_THROW(registry.lookup("registry-demo"), std::runtime_error);
    EXPECT_TRUE(registry.list().empty());
}

TEST(HandshakeTest, ReleaseAndTimeouts) {
    Handshake released;
    released.open();
    released.release();
    EXPECT_NO_THROW(released.await_release(1000));

    Handshake silent;
    silent.open();
    EXPECT_THROW(silent.await_release(100), NamespaceError);
    EXPECT_THROW(silent.await_ready(100), NamespaceError);

    Handshake aborted;
    aborted.open();
    aborted.abort();
    EXPECT_THROW(aborted.await_release(1000), NamespaceError);
}

TEST(HandshakeTest, ReleaseToExitedInitIsAnError) {
    Handshake handshake;
    handshake.open();
    // Drops the only reader of the release pipe, as a dead init would.
    handshake.close_child_ends();
    EXPECT_THROW(handshake.release(), NamespaceError);
}

TEST(HandshakeTest, ChildErrorsKeepTheirKind) {
    Handshake ready;
    ready.open();
    ready.report_ready();
    EXPECT_NO_THROW(ready.await_ready(1000));

    Handshake failed;
    failed.open();
    failed.report_error(ErrorKind::Mount, "pivot_root failed");
    try {
        failed.await_ready(1000);
        FAIL() << "expected MountError";
    } catch (const MountError& e) {
        EXPECT_EQ(std::string("pivot_root failed"), e.what());
    }
}

TEST_F(BantuboxFixture, RunReturnsCommandExitCodeAndCleansUp) {
    ContainerSupervisor supervisor(*kernel, run_options({"/bin/sh", "-c", "exit 3"}));
    EXPECT_EQ(3, supervisor.run());

    const Container& container = supervisor.container();
    EXPECT_EQ(ContainerStage::Cleaned, container.state);
    EXPECT_EQ(3, container.exit_code);
    EXPECT_GT(container.pid, 0);
    EXPECT_EQ(1, kernel->clone_calls);
    const int expected_flags = CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC | CLONE_NEWPID | CLONE_NEWNET;
    EXPECT_EQ(expected_flags, kernel->last_clone_flags & expected_flags);

    EXPECT_TRUE(kernel->mounted.empty());
    EXPECT_TRUE(kernel->called("umount " + container.paths.merged));
    EXPECT_EQ(0u, entries_in(containers));
    EXPECT_FALSE(fs::exists(cgroups + "/bantubox/" + container.id));
    EXPECT_TRUE(fs::exists(images + "/base/etc/hostname"));
}

TEST_F(BantuboxFixture, RunAttachesInitToItsCgroupBeforeExec) {
    const std::string marker = root + "/cgroup-seen";
    // The command reads its own cgroup membership file, which only holds its
    // pid if attachment happened before exec.
    RunOptions options = run_options({"/bin/sh", "-c",
            "echo $(cat " + cgroups + "/bantubox/*/cgroup.procs) $$ > " + marker});
    ContainerSupervisor supervisor(*kernel, options);
    EXPECT_EQ(0, supervisor.run());

    std::istringstream fields(read_file(marker));
    std::string attached;
    std::string self;
    fields >> attached >> self;
    EXPECT_FALSE(attached.empty());
    EXPECT_EQ(self, attached);
}

TEST_F(BantuboxFixture, RunWithoutPrivilegeIsACleanNoOp) {
    kernel->euid = 1000;
    EXPECT_THROW(run_container(*kernel, run_options({"/bin/true"})), PrivilegeError);
    EXPECT_EQ(0, kernel->clone_calls);
    EXPECT_FALSE(kernel->called("mount"));
    EXPECT_EQ(0u, entries_in(containers));
    EXPECT_FALSE(fs::exists(cgroups + "/bantubox"));
}

TEST_F(BantuboxFixture, RunWithMissingImageCreatesNoProcess) {
    RunOptions options = run_options({"/bin/true"});
    options.image = "missing-image";
    EXPECT_THROW(run_container(*kernel, options), ImageNotFoundError);
    EXPECT_EQ(0, kernel->clone_calls);
    EXPECT_EQ(0u, entries_in(containers));
}

TEST_F(BantuboxFixture, NamespaceFailureUnwindsTheOverlay) {
    kernel->clone_errno = EPERM;
    try {
        run_container(*kernel, run_options({"/bin/true"}));
        FAIL() << "expected NamespaceError";
    } catch (const NamespaceError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("insufficient privilege"));
        EXPECT_TRUE(e.teardown_errors().empty());
    }
    EXPECT_TRUE(kernel->mounted.empty());
    EXPECT_EQ(0u, entries_in(containers));
}

TEST_F(BantuboxFixture, CgroupFailureUnwindsAndCommandNeverRuns) {
    use_cgroup_v2("cpu");
    const std::string marker = root + "/command-ran";
    RunOptions options = run_options({"/bin/sh", "-c", "touch " + marker});
    options.limits.memory_limit = 64 * 1024 * 1024;

    EXPECT_THROW(run_container(*kernel, options), CgroupError);
    EXPECT_FALSE(fs::exists(marker));
    EXPECT_TRUE(kernel->mounted.empty());
    EXPECT_EQ(0u, entries_in(containers));
    EXPECT_FALSE(fs::exists(cgroups + "/bantubox"));
}

TEST_F(BantuboxFixture, ChildSetupFailureReportsItsKind) {
    kernel->hostname_errno = EPERM;
    const std::string marker = root + "/command-ran";
    ::testing::internal::CaptureStderr();
    EXPECT_THROW(run_container(*kernel, run_options({"/bin/sh", "-c", "touch " + marker})), NamespaceError);
    ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(fs::exists(marker));
    EXPECT_TRUE(kernel->mounted.empty());
    EXPECT_EQ(0u, entries_in(containers));
}

TEST_F(BantuboxFixture, LoopbackFailureOnlyWarns) {
    kernel->interface_errno = EPERM;
    ::testing::internal::CaptureStderr();
    int code = run_container(*kernel, run_options({"/bin/true"}));
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(0, code);
    EXPECT_NE(std::string::npos, err.find("[warning]"));
}

TEST_F(BantuboxFixture, ExecFailureIsTheContainersOwnExitCode) {
    ::testing::internal::CaptureStderr();
    int code = run_container(*kernel, run_options({"/nonexistent/command"}));
    ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(kExecNotFoundExitCode, code);
    EXPECT_EQ(0u, entries_in(containers));
}

TEST_F(BantuboxFixture, DeleteReleasesLeftoversOfDeadContainer) {
    const std::string id = "leftover";
    OverlayPaths paths = overlay_paths_for(containers, id);
    FilesystemJail jail(*kernel, images + "/base", paths);
    jail.prepare();
    CgroupController cgroup(*kernel, cgroups, id, ResourceLimits());
    cgroup.ensure_root_group();
    cgroup.create();

    ContainerRegistry registry(containers);
    ContainerRecord record;
    record.id = id;
    record.status = "dirty";
    record.root_path = paths.root;
    record.merged_path = paths.merged;
    record.cgroup_paths = cgroup.group_paths();
    ASSERT_TRUE(registry.register_container(record));

    EXPECT_TRUE(delete_container(*kernel, registry, containers, cgroups, id).empty());
    EXPECT_FALSE(fs::exists(paths.root));
    EXPECT_FALSE(fs::exists(cgroups + "/bantubox/" + id));
    EXPECT_FALSE(registry.contains(id));
    EXPECT_TRUE(kernel->mounted.empty());
}

TEST_F(BantuboxFixture, DeleteRefusesContainerStillManaged) {
    ContainerRegistry registry(containers);
    ContainerRecord record;
    record.id = "managed";
    record.status = "network-ready";
    record.supervisor_pid = getpid();
    ASSERT_TRUE(registry.register_container(record));
    EXPECT_THROW(delete_container(*kernel, registry, containers, cgroups, "managed"), ContainerError);
    EXPECT_TRUE(registry.contains("managed"));
}

TEST_F(BantuboxFixture, InitExitingBeforeReleaseIsUnwound) {
    kernel->exit_after_ready = true;
    ContainerSupervisor supervisor(*kernel, run_options({"/bin/true"}));
    EXPECT_THROW(supervisor.run(), NamespaceError);

    const Container& container = supervisor.container();
    EXPECT_EQ(ContainerStage::Cleaned, container.state);
    EXPECT_TRUE(kernel->mounted.empty());
    EXPECT_EQ(0u, entries_in(containers));
    EXPECT_FALSE(fs::exists(cgroups + "/bantubox/" + container.id));
}

TEST_F(BantuboxFixture, TeardownFailureIsReportedAndMarksRecordDirty) {
    use_cgroup_v2("cpu");
    kernel->busy_merged = true;
    RunOptions options = run_options({"/bin/true"});
    options.limits.memory_limit = 64 * 1024 * 1024;
    ContainerSupervisor supervisor(*kernel, options);

    try {
        supervisor.run();
        FAIL() << "expected CgroupError";
    } catch (const CgroupError& e) {
        ASSERT_FALSE(e.teardown_errors().empty());
        EXPECT_NE(std::string::npos, e.teardown_errors().front().find("unmount"));
        EXPECT_NE(std::string::npos, e.describe().find("during teardown"));
    }

    const Container& container = supervisor.container();
    EXPECT_TRUE(fs::is_directory(container.paths.upper));
    EXPECT_TRUE(fs::is_directory(container.paths.merged));
    EXPECT_EQ(1u, kernel->mounted.count(container.paths.merged));

    ContainerRegistry registry(containers);
    ContainerRecord record = registry.lookup(container.id);
    EXPECT_EQ("dirty", record.status);
    EXPECT_EQ(container.paths.root, record.root_path);

    // Once the mount is no longer busy, delete finishes the job.
    kernel->busy_merged = false;
    EXPECT_TRUE(delete_container(*kernel, registry, containers, cgroups, container.id).empty());
    EXPECT_FALSE(fs::exists(container.paths.root));
    EXPECT_FALSE(registry.contains(container.id));
}

TEST_F(BantuboxFixture, StopKillsInitThatIgnoresSigterm) {
    int ready[2];
    ASSERT_EQ(0, pipe(ready));
    pid_t child = fork();
    if (child == 0) {
        signal(SIGTERM, SIG_IGN);
        const char byte = 'r';
        if (write(ready[1], &byte, 1) != 1) {
            _exit(1);
        }
        while (true) {
            pause();
        }
    }
    ASSERT_GT(child, 0);
    close(ready[1]);
    char byte = 0;
    ASSERT_EQ(1, read(ready[0], &byte, 1));
    close(ready[0]);

    ContainerRegistry registry(containers);
    ContainerRecord record;
    record.id = "stubborn";
    record.status = "running";
    record.pid = child;
    ASSERT_TRUE(registry.register_container(record));

    EXPECT_TRUE(stop_container(registry, "stubborn", 1));
    int status = 0;
    ASSERT_TRUE(wait_for_process(child, status));
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(SIGKILL, WTERMSIG(status));
    EXPECT_FALSE(process_alive(child));
}

TEST_F(BantuboxFixture, StopReportsContainerNotRunning) {
    ContainerRegistry registry(containers);
    ContainerRecord record;
    record.id = "stopped";
    record.status = "exited";
    record.pid = 999999;
    ASSERT_TRUE(registry.register_container(record));
    EXPECT_FALSE(stop_container(registry, "stopped", 1));
    EXPECT_THROW(stop_container(registry, "unknown", 1), std::runtime_error);
}
