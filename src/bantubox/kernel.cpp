#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "bantubox/kernel.h"

#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <sched.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <vector>

constexpr int STACK_SIZE = 1024 * 1024; // 1MB

pid_t LinuxKernelOps::clone_process(int (*entry)(void*), int flags, void* arg) {
    // Without CLONE_VM the child runs on a copy of this buffer, so the parent
    // may release it as soon as clone returns.
    std::vector<char> stack(STACK_SIZE);
    return ::clone(entry, stack.data() + stack.size(), flags, arg);
}

int LinuxKernelOps::unshare(int flags) {
    return ::unshare(flags);
}

int LinuxKernelOps::setns(int fd, int nstype) {
    return ::setns(fd, nstype);
}

int LinuxKernelOps::pivot_root(const std::string& new_root, const std::string& put_old) {
    return static_cast<int>(syscall(SYS_pivot_root, new_root.c_str(), put_old.c_str()));
}

int LinuxKernelOps::mount(const std::string& source,
                          const std::string& target,
                          const std::string& fstype,
                          unsigned long flags,
                          const std::string& data) {
    return ::mount(source.empty() ? nullptr : source.c_str(),
                   target.c_str(),
                   fstype.empty() ? nullptr : fstype.c_str(),
                   flags,
                   data.empty() ? nullptr : data.c_str());
}

int LinuxKernelOps::umount2(const std::string& target, int flags) {
    return ::umount2(target.c_str(), flags);
}

int LinuxKernelOps::sethostname(const std::string& name) {
    return ::sethostname(name.c_str(), name.length());
}

int LinuxKernelOps::mknod(const std::string& path, mode_t mode, dev_t device) {
    return ::mknod(path.c_str(), mode, device);
}

int LinuxKernelOps::rmdir(const std::string& path) {
    return ::rmdir(path.c_str());
}

int LinuxKernelOps::interface_up(const std::string& name) {
    if (name.size() >= IFNAMSIZ) {
        errno = ENAMETOOLONG;
        return -1;
    }
    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd == -1) {
        return -1;
    }
    struct ifreq ifr {};
    std::strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);
    int result = ioctl(fd, SIOCGIFFLAGS, &ifr);
    if (result == 0) {
        ifr.ifr_flags |= IFF_UP | IFF_RUNNING;
        result = ioctl(fd, SIOCSIFFLAGS, &ifr);
    }
    int saved_errno = errno;
    close(fd);
    errno = saved_errno;
    return result;
}

uid_t LinuxKernelOps::effective_uid() {
    return geteuid();
}
