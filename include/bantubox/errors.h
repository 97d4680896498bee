#pragma once

#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
    Generic = 0,
    Privilege,
    ImageNotFound,
    Namespace,
    Mount,
    Cgroup,
    NetworkSetup
};

// Setup failures exit with kSetupFailureBase + kind so callers can tell a
// container that never ran from one whose command failed.
constexpr int kSetupFailureBase = 240;
constexpr int kUsageExitCode = 2;
constexpr int kExecNotFoundExitCode = 127;
constexpr int kExecNotExecutableExitCode = 126;

const char* error_kind_name(ErrorKind kind);
ErrorKind error_kind_from_name(const std::string& name);
int setup_failure_exit_code(ErrorKind kind);

class ContainerError : public std::runtime_error {
public:
    ContainerError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::vector<std::string>& teardown_errors() const { return teardown_errors_; }
    void add_teardown_errors(const std::vector<std::string>& errors);
    std::string describe() const;

private:
    ErrorKind kind_;
    std::vector<std::string> teardown_errors_;
};

class PrivilegeError : public ContainerError {
public:
    explicit PrivilegeError(const std::string& message) : ContainerError(ErrorKind::Privilege, message) {}
};

class ImageNotFoundError : public ContainerError {
public:
    explicit ImageNotFoundError(const std::string& message) : ContainerError(ErrorKind::ImageNotFound, message) {}
};

class NamespaceError : public ContainerError {
public:
    explicit NamespaceError(const std::string& message) : ContainerError(ErrorKind::Namespace, message) {}
};

class MountError : public ContainerError {
public:
    explicit MountError(const std::string& message) : ContainerError(ErrorKind::Mount, message) {}
};

class CgroupError : public ContainerError {
public:
    explicit CgroupError(const std::string& message) : ContainerError(ErrorKind::Cgroup, message) {}
};

class NetworkSetupError : public ContainerError {
public:
    explicit NetworkSetupError(const std::string& message) : ContainerError(ErrorKind::NetworkSetup, message) {}
};

// Rebuilds the typed exception for a kind reported across the handshake pipe.
[[noreturn]] void throw_container_error(ErrorKind kind, const std::string& message);

std::string errno_message(const std::string& what, int err);
