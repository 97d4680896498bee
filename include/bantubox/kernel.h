#pragma once

#include <string>
#include <sys/types.h>

// The privileged kernel calls the container lifecycle performs. Every call
// mirrors its syscall: 0 (or a pid) on success, -1 with errno set on failure.
class KernelOps {
public:
    virtual ~KernelOps() = default;

    virtual pid_t clone_process(int (*entry)(void*), int flags, void* arg) = 0;
    virtual int unshare(int flags) = 0;
    virtual int setns(int fd, int nstype) = 0;
    virtual int pivot_root(const std::string& new_root, const std::string& put_old) = 0;
    virtual int mount(const std::string& source,
                      const std::string& target,
                      const std::string& fstype,
                      unsigned long flags,
                      const std::string& data) = 0;
    virtual int umount2(const std::string& target, int flags) = 0;
    virtual int sethostname(const std::string& name) = 0;
    virtual int mknod(const std::string& path, mode_t mode, dev_t device) = 0;
    // Removes a kernel-backed directory (cgroup, mountpoint).
    virtual int rmdir(const std::string& path) = 0;
    virtual int interface_up(const std::string& name) = 0;
    virtual uid_t effective_uid() = 0;
};

class LinuxKernelOps : public KernelOps {
public:
    pid_t clone_process(int (*entry)(void*), int flags, void* arg) override;
    int unshare(int flags) override;
    int setns(int fd, int nstype) override;
    int pivot_root(const std::string& new_root, const std::string& put_old) override;
    int mount(const std::string& source,
              const std::string& target,
              const std::string& fstype,
              unsigned long flags,
              const std::string& data) override;
    int umount2(const std::string& target, int flags) override;
    int sethostname(const std::string& name) override;
    int mknod(const std::string& path, mode_t mode, dev_t device) override;
    int rmdir(const std::string& path) override;
    int interface_up(const std::string& name) override;
    uid_t effective_uid() override;
};
