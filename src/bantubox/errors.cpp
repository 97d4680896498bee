#include "bantubox/errors.h"

#include <cstring>
#include <sstream>

ContainerError::ContainerError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

void ContainerError::add_teardown_errors(const std::vector<std::string>& errors) {
    teardown_errors_.insert(teardown_errors_.end(), errors.begin(), errors.end());
}

std::string ContainerError::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind_) << ": " << what();
    for (const auto& error : teardown_errors_) {
        oss << "\n  during teardown: " << error;
    }
    return oss.str();
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Privilege:
            return "PrivilegeError";
        case ErrorKind::ImageNotFound:
            return "ImageNotFoundError";
        case ErrorKind::Namespace:
            return "NamespaceError";
        case ErrorKind::Mount:
            return "MountError";
        case ErrorKind::Cgroup:
            return "CgroupError";
        case ErrorKind::NetworkSetup:
            return "NetworkSetupError";
        case ErrorKind::Generic:
            break;
    }
    return "ContainerError";
}

ErrorKind error_kind_from_name(const std::string& name) {
    const ErrorKind kinds[] = {
        ErrorKind::Privilege, ErrorKind::ImageNotFound, ErrorKind::Namespace,
        ErrorKind::Mount, ErrorKind::Cgroup, ErrorKind::NetworkSetup
    };
    for (ErrorKind kind : kinds) {
        if (name == error_kind_name(kind)) {
            return kind;
        }
    }
    return ErrorKind::Generic;
}

int setup_failure_exit_code(ErrorKind kind) {
    return kSetupFailureBase + static_cast<int>(kind);
}

void throw_container_error(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::Privilege:
            throw PrivilegeError(message);
        case ErrorKind::ImageNotFound:
            throw ImageNotFoundError(message);
        case ErrorKind::Namespace:
            throw NamespaceError(message);
        case ErrorKind::Mount:
            throw MountError(message);
        case ErrorKind::Cgroup:
            throw CgroupError(message);
        case ErrorKind::NetworkSetup:
            throw NetworkSetupError(message);
        case ErrorKind::Generic:
            break;
    }
    throw ContainerError(ErrorKind::Generic, message);
}

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}
