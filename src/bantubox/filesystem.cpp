#include "bantubox/filesystem.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <string>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

#include "bantubox/errors.h"
#include "bantubox/options.h"

namespace fs = std::filesystem;

namespace {

constexpr const char* PUT_OLD_DIR = ".put_old";

struct DeviceNode {
    const char* path;
    mode_t mode;
    unsigned int major;
    unsigned int minor;
};

const DeviceNode kDevices[] = {
    {"/dev/null", S_IFCHR | 0666, 1, 3},
    {"/dev/zero", S_IFCHR | 0666, 1, 5},
    {"/dev/full", S_IFCHR | 0666, 1, 7},
    {"/dev/random", S_IFCHR | 0666, 1, 8},
    {"/dev/urandom", S_IFCHR | 0666, 1, 9},
    {"/dev/tty", S_IFCHR | 0666, 5, 0}
};

const std::pair<const char*, const char*> kDevLinks[] = {
    {"/proc/self/fd", "/dev/fd"},
    {"/proc/self/fd/0", "/dev/stdin"},
    {"/proc/self/fd/1", "/dev/stdout"},
    {"/proc/self/fd/2", "/dev/stderr"},
    {"pts/ptmx", "/dev/ptmx"}
};

} // namespace

bool ensure_directory(const std::string& path, mode_t mode) {
    if (path.empty()) {
        return false;
    }
    struct stat st {};
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    std::string parent;
    auto pos = path.find_last_of('/');
    if (pos != std::string::npos && pos != 0) {
        parent = path.substr(0, pos);
    } else if (pos == 0) {
        parent = "/";
    }
    if (!parent.empty() && parent != path) {
        if (!ensure_directory(parent, mode)) {
            return false;
        }
    }
    if (mkdir(path.c_str(), mode) == 0 || errno == EEXIST) {
        return true;
    }
    return false;
}

bool ensure_parent_directory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return true;
    }
    return ensure_directory(path.substr(0, pos));
}

std::string path_join(const std::string& base, const std::string& child) {
    if (base.empty()) {
        return child;
    }
    if (child.empty()) {
        return base;
    }
    if (base.back() == '/') {
        return base + child;
    }
    return base + "/" + child;
}

std::string join_strings(const std::vector<std::string>& parts, const char* delimiter) {
    if (parts.empty()) {
        return "";
    }
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << parts[i];
    }
    return oss.str();
}

bool make_mount_private(KernelOps& kernel, const std::string& path) {
    return kernel.mount("", path, "", MS_PRIVATE | MS_REC, "") == 0;
}

ParsedMountOptions parse_mount_options(const std::vector<std::string>& options) {
    ParsedMountOptions parsed;
    std::vector<std::string> data_options;
    for (const auto& opt : options) {
        if (opt == "ro") {
            parsed.flags |= MS_RDONLY;
        } else if (opt == "nosuid") {
            parsed.flags |= MS_NOSUID;
        } else if (opt == "nodev") {
            parsed.flags |= MS_NODEV;
        } else if (opt == "noexec") {
            parsed.flags |= MS_NOEXEC;
        } else if (opt == "strictatime") {
            parsed.flags |= MS_STRICTATIME;
        } else {
            data_options.push_back(opt);
        }
    }
    parsed.data = join_strings(data_options, ",");
    return parsed;
}

OverlayPaths overlay_paths_for(const std::string& containers_dir, const std::string& id) {
    OverlayPaths paths;
    paths.root = path_join(containers_dir, id);
    paths.lower = path_join(paths.root, "lower");
    paths.upper = path_join(paths.root, "upper");
    paths.work = path_join(paths.root, "work");
    paths.merged = path_join(paths.root, "merged");
    return paths;
}

std::string overlay_mount_data(const std::string& image_path, const OverlayPaths& paths) {
    return "lowerdir=" + image_path + ",upperdir=" + paths.upper + ",workdir=" + paths.work;
}

const std::vector<AuxiliaryMount>& auxiliary_mounts() {
    static const std::vector<AuxiliaryMount> mounts = {
        {"proc", "/proc", "proc", {"nosuid", "noexec", "nodev"}},
        {"sysfs", "/sys", "sysfs", {"ro", "nosuid", "noexec", "nodev"}},
        {"tmpfs", "/dev", "tmpfs", {"nosuid", "strictatime", "mode=755", "size=65536k"}},
        {"devpts", "/dev/pts", "devpts", {"nosuid", "noexec", "newinstance", "ptmxmode=0666", "mode=0620"}}
    };
    return mounts;
}

FilesystemJail::FilesystemJail(KernelOps& kernel, std::string image_path, OverlayPaths paths)
    : kernel_(kernel), image_path_(std::move(image_path)), paths_(std::move(paths)) {}

void FilesystemJail::prepare() {
    struct stat st {};
    if (stat(image_path_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw ImageNotFoundError("Unable to locate image at " + image_path_);
    }

    if (!ensure_parent_directory(paths_.root)) {
        throw MountError(errno_message("Failed to create containers directory for " + paths_.root, errno));
    }
    if (mkdir(paths_.root.c_str(), 0700) != 0) {
        throw MountError(errno_message("Failed to create container directory " + paths_.root, errno));
    }
    created_ = true;

    auto abort_prepare = [this](const std::string& message) {
        for (const auto& error : teardown()) {
            log_warning(error);
        }
        throw MountError(message);
    };

    for (const auto* dir : {&paths_.upper, &paths_.work, &paths_.merged}) {
        if (mkdir(dir->c_str(), 0755) != 0) {
            abort_prepare(errno_message("Failed to create overlay directory " + *dir, errno));
        }
    }
    if (symlink(image_path_.c_str(), paths_.lower.c_str()) != 0) {
        abort_prepare(errno_message("Failed to link lower layer " + paths_.lower, errno));
    }

    log_debug("Mounting overlay at " + paths_.merged + " over image " + image_path_);
    if (kernel_.mount("overlay", paths_.merged, "overlay", MS_NODEV, overlay_mount_data(image_path_, paths_)) != 0) {
        abort_prepare(errno_message("Failed to mount overlay at " + paths_.merged, errno));
    }
    mounted_ = true;
}

void FilesystemJail::enter() {
    // Keep the pivot and the mounts below from propagating back to the host.
    if (!make_mount_private(kernel_, "/")) {
        throw MountError(errno_message("Failed to make / private", errno));
    }

    const std::string put_old = path_join(paths_.merged, PUT_OLD_DIR);
    if (mkdir(put_old.c_str(), 0700) != 0 && errno != EEXIST) {
        throw MountError(errno_message("Failed to create " + put_old, errno));
    }
    if (kernel_.pivot_root(paths_.merged, put_old) != 0) {
        throw MountError(errno_message("pivot_root into " + paths_.merged + " failed", errno));
    }
    if (chdir("/") != 0) {
        throw MountError(errno_message("chdir to new root failed", errno));
    }

    mount_auxiliary_filesystems();
    populate_dev();
    detach_old_root();
}

void FilesystemJail::mount_auxiliary_filesystems() {
    for (const auto& aux : auxiliary_mounts()) {
        if (!ensure_directory(aux.destination)) {
            throw MountError(errno_message("Failed to create mount target " + aux.destination, errno));
        }
        ParsedMountOptions parsed = parse_mount_options(aux.options);
        if (kernel_.mount(aux.source, aux.destination, aux.type, parsed.flags, parsed.data) != 0) {
            throw MountError(errno_message("Failed to mount " + aux.type + " at " + aux.destination, errno));
        }
    }
}

void FilesystemJail::populate_dev() {
    for (const auto& dev : kDevices) {
        if (kernel_.mknod(dev.path, dev.mode, makedev(dev.major, dev.minor)) != 0 && errno != EEXIST) {
            throw MountError(errno_message(std::string("Failed to create device ") + dev.path, errno));
        }
    }
    for (const auto& link : kDevLinks) {
        if (symlink(link.first, link.second) != 0 && errno != EEXIST) {
            log_warning(errno_message(std::string("Failed to link ") + link.second, errno));
        }
    }
}

void FilesystemJail::detach_old_root() {
    const std::string old_root = std::string("/") + PUT_OLD_DIR;
    if (kernel_.umount2(old_root, MNT_DETACH) != 0) {
        throw MountError(errno_message("Failed to detach old root", errno));
    }
    if (kernel_.rmdir(old_root) != 0) {
        log_warning(errno_message("Failed to remove " + old_root, errno));
    }
}

void FilesystemJail::adopt_existing() {
    created_ = true;
    mounted_ = true;
}

std::vector<std::string> FilesystemJail::teardown() {
    std::vector<std::string> errors;

    if (kernel_.umount2(paths_.merged, MNT_DETACH) != 0 && errno != EINVAL && errno != ENOENT) {
        errors.push_back(errno_message("Failed to unmount overlay at " + paths_.merged, errno));
        return errors;
    }
    mounted_ = false;

    if (!created_) {
        return errors;
    }

    std::error_code ec;
    // lower is a link to the shared image; remove the link, never its target.
    fs::remove(paths_.lower, ec);
    if (ec) {
        errors.push_back("Failed to remove " + paths_.lower + ": " + ec.message());
    }
    for (const auto* dir : {&paths_.upper, &paths_.work}) {
        ec.clear();
        fs::remove_all(*dir, ec);
        if (ec) {
            errors.push_back("Failed to remove " + *dir + ": " + ec.message());
        }
    }
    if (kernel_.rmdir(paths_.merged) != 0 && errno != ENOENT) {
        errors.push_back(errno_message("Failed to remove " + paths_.merged, errno));
    }
    ec.clear();
    fs::remove(paths_.root, ec);
    if (ec) {
        errors.push_back("Failed to remove " + paths_.root + ": " + ec.message());
    }
    if (errors.empty()) {
        created_ = false;
    }
    return errors;
}
