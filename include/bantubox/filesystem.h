#pragma once

#include <string>
#include <sys/stat.h>
#include <vector>

#include "bantubox/kernel.h"

struct ParsedMountOptions {
    unsigned long flags = 0;
    std::string data;
};

bool ensure_directory(const std::string& path, mode_t mode = 0755);
bool ensure_parent_directory(const std::string& path);

std::string path_join(const std::string& base, const std::string& child);
std::string join_strings(const std::vector<std::string>& parts, const char* delimiter = ",");
// Recursively marks the mounts under path private.
bool make_mount_private(KernelOps& kernel, const std::string& path);
ParsedMountOptions parse_mount_options(const std::vector<std::string>& options);

// Per-container overlay layout under <containers_dir>/<id>/.
struct OverlayPaths {
    std::string root;
    std::string lower;
    std::string upper;
    std::string work;
    std::string merged;
};

OverlayPaths overlay_paths_for(const std::string& containers_dir, const std::string& id);
std::string overlay_mount_data(const std::string& image_path, const OverlayPaths& paths);

// A filesystem mounted inside the new root after pivot_root.
struct AuxiliaryMount {
    std::string source;
    std::string destination;
    std::string type;
    std::vector<std::string> options;
};

const std::vector<AuxiliaryMount>& auxiliary_mounts();

class FilesystemJail {
public:
    FilesystemJail(KernelOps& kernel, std::string image_path, OverlayPaths paths);

    // Host side: creates the layer directories and mounts the overlay at
    // merged. Throws ImageNotFoundError or MountError; on failure nothing it
    // created is left behind.
    void prepare();

    // Container side: must run inside the new mount namespace. Pivots into
    // merged, mounts proc/sysfs/dev/devpts and detaches the host root.
    void enter();

    // Unmounts the overlay and removes the layer directories. Safe to call
    // more than once. Directories are kept if the unmount fails.
    std::vector<std::string> teardown();

    // Takes ownership of a layout left by a runner that is gone, so teardown
    // removes it.
    void adopt_existing();

    const OverlayPaths& paths() const { return paths_; }
    const std::string& image_path() const { return image_path_; }
    bool mounted() const { return mounted_; }

private:
    void mount_auxiliary_filesystems();
    void populate_dev();
    void detach_old_root();

    KernelOps& kernel_;
    std::string image_path_;
    OverlayPaths paths_;
    bool created_ = false;
    bool mounted_ = false;
};
