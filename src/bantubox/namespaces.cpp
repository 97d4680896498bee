#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "bantubox/namespaces.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fcntl.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <pthread.h>
#include <sched.h>
#include <string>
#include <time.h>
#include <unistd.h>

#include "bantubox/network.h"
#include "bantubox/options.h"

using json = nlohmann::json;

namespace {

enum class ReadResult {
    Line,
    Eof,
    Timeout
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Waits until fd is readable, or until the deadline when bounded.
bool wait_readable(int fd, std::chrono::steady_clock::time_point deadline, bool bounded) {
    while (true) {
        int timeout_ms = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return false;
            }
            timeout_ms = static_cast<int>(remaining.count());
        }
        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, timeout_ms);
        if (ready > 0) {
            return true;
        }
        if (ready == 0) {
            return false;
        }
        if (errno != EINTR) {
            throw NamespaceError(errno_message("poll on handshake pipe failed", errno));
        }
    }
}

ReadResult read_line(int fd, int timeout_ms, std::string& line) {
    line.clear();
    bool bounded = timeout_ms > 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (!wait_readable(fd, deadline, bounded)) {
            return ReadResult::Timeout;
        }
        char c = 0;
        ssize_t n = read(fd, &c, 1);
        if (n == 0) {
            return line.empty() ? ReadResult::Eof : ReadResult::Line;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw NamespaceError(errno_message("read on handshake pipe failed", errno));
        }
        if (c == '\n') {
            return ReadResult::Line;
        }
        line.push_back(c);
    }
}

// Writes to a pipe whose reader may already be gone. SIGPIPE is blocked for
// the calling thread around the write and a SIGPIPE it raised is consumed, so
// a dead peer shows up as EPIPE instead of killing the process.
ssize_t write_without_sigpipe(int fd, const char* data, size_t size) {
    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    bool was_pending = sigismember(&pending, SIGPIPE) == 1;

    ssize_t n;
    do {
        n = write(fd, data, size);
    } while (n == -1 && errno == EINTR);
    int saved_errno = errno;

    if (n == -1 && saved_errno == EPIPE && !was_pending) {
        struct timespec no_wait {};
        while (sigtimedwait(&pipe_set, nullptr, &no_wait) == -1 && errno == EINTR) {
        }
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = saved_errno;
    return n;
}

// Turns a status line from the child into its exception when it reports an
// error; returns the stage otherwise.
std::string parse_status_line(const std::string& line) {
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        throw NamespaceError("Malformed handshake message: " + line);
    }
    std::string stage = message.value("stage", "");
    if (stage == "error") {
        throw_container_error(error_kind_from_name(message.value("kind", "")),
                              message.value("message", "container setup failed"));
    }
    return stage;
}

} // namespace

int namespace_clone_flags() {
    return CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC | CLONE_NEWPID | CLONE_NEWNET;
}

Handshake::~Handshake() {
    close_fd(status_read_);
    close_fd(status_write_);
    close_fd(release_read_);
    close_fd(release_write_);
}

void Handshake::open() {
    int status_pipe[2];
    int release_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        throw NamespaceError(errno_message("Failed to create status pipe", errno));
    }
    if (pipe2(release_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw NamespaceError(errno_message("Failed to create release pipe", saved));
    }
    status_read_ = status_pipe[0];
    status_write_ = status_pipe[1];
    release_read_ = release_pipe[0];
    release_write_ = release_pipe[1];
}

void Handshake::close_child_ends() {
    close_fd(status_write_);
    close_fd(release_read_);
}

void Handshake::close_parent_ends() {
    close_fd(status_read_);
    close_fd(release_write_);
}

void Handshake::await_ready(int timeout_ms) {
    std::string line;
    switch (read_line(status_read_, timeout_ms, line)) {
        case ReadResult::Timeout:
            throw NamespaceError("Timed out after " + std::to_string(timeout_ms) +
                                 " ms waiting for the container to finish setup");
        case ReadResult::Eof:
            throw NamespaceError("Container init exited before finishing setup");
        case ReadResult::Line:
            break;
    }
    std::string stage = parse_status_line(line);
    if (stage != "ready") {
        throw NamespaceError("Unexpected handshake stage '" + stage + "'");
    }
}

void Handshake::release() {
    const char go = 'G';
    ssize_t n = write_without_sigpipe(release_write_, &go, 1);
    if (n != 1) {
        if (errno == EPIPE) {
            throw NamespaceError("Container init exited before it was released");
        }
        throw NamespaceError(errno_message("Failed to release container init", errno));
    }
    close_fd(release_write_);
}

void Handshake::abort() {
    close_fd(release_write_);
}

void Handshake::await_exec(int timeout_ms) {
    std::string line;
    switch (read_line(status_read_, timeout_ms, line)) {
        case ReadResult::Timeout:
            throw NamespaceError("Timed out waiting for the container command to start");
        case ReadResult::Eof:
            close_fd(status_read_);
            return;
        case ReadResult::Line:
            break;
    }
    parse_status_line(line);
    throw NamespaceError("Unexpected handshake message after release: " + line);
}

void Handshake::send_status(const std::string& line) {
    std::string payload = line + "\n";
    size_t written = 0;
    while (written < payload.size()) {
        ssize_t n = write_without_sigpipe(status_write_, payload.data() + written, payload.size() - written);
        if (n < 0) {
            throw NamespaceError(errno_message("Failed to write handshake status", errno));
        }
        written += static_cast<size_t>(n);
    }
}

void Handshake::report_ready() {
    send_status(json{{"stage", "ready"}}.dump());
}

void Handshake::report_error(ErrorKind kind, const std::string& message) {
    send_status(json{{"stage", "error"}, {"kind", error_kind_name(kind)}, {"message", message}}.dump());
}

void Handshake::await_release(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    if (!wait_readable(release_read_, deadline, timeout_ms > 0)) {
        throw NamespaceError("Timed out waiting for the supervisor to release the container");
    }
    char go = 0;
    ssize_t n;
    do {
        n = read(release_read_, &go, 1);
    } while (n == -1 && errno == EINTR);
    if (n != 1 || go != 'G') {
        throw NamespaceError("Supervisor aborted container startup");
    }
    close_fd(release_read_);
}

void child_set_hostname(ChildContext& ctx) {
    if (ctx.kernel->sethostname(ctx.hostname) != 0) {
        throw NamespaceError(errno_message("sethostname failed", errno));
    }
}

void child_enter_jail(ChildContext& ctx) {
    ctx.jail->enter();
}

void child_setup_network(ChildContext& ctx) {
    try {
        bring_up_loopback(*ctx.kernel);
    } catch (const NetworkSetupError& e) {
        log_warning(e.what());
    }
}

void child_await_release(ChildContext& ctx) {
    ctx.handshake->await_release(ctx.handshake_timeout_ms);
}

int child_exec(ChildContext& ctx) {
    std::vector<char*> argv;
    argv.reserve(ctx.argv.size() + 1);
    for (const auto& arg : ctx.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    execvp(argv[0], argv.data());
    int err = errno;
    perror(("execvp " + ctx.argv[0] + " failed").c_str());
    return (err == ENOENT || err == ENOTDIR) ? kExecNotFoundExitCode : kExecNotExecutableExitCode;
}

int container_main(void* arg) {
    ChildContext& ctx = *static_cast<ChildContext*>(arg);
    ctx.handshake->close_parent_ends();

    try {
        child_set_hostname(ctx);
        child_enter_jail(ctx);
        child_setup_network(ctx);
        ctx.handshake->report_ready();
        child_await_release(ctx);
    } catch (const ContainerError& e) {
        try {
            ctx.handshake->report_error(e.kind(), e.what());
        } catch (const ContainerError&) {
            std::cerr << "Container setup failed: " << e.what() << std::endl;
        }
        return setup_failure_exit_code(e.kind());
    } catch (const std::exception& e) {
        try {
            ctx.handshake->report_error(ErrorKind::Generic, e.what());
        } catch (const ContainerError&) {
            std::cerr << "Container setup failed: " << e.what() << std::endl;
        }
        return setup_failure_exit_code(ErrorKind::Generic);
    }

    return child_exec(ctx);
}

pid_t spawn_container_process(KernelOps& kernel, ChildContext& ctx) {
    if (ctx.argv.empty()) {
        throw NamespaceError("No command given for the container");
    }
    pid_t pid = kernel.clone_process(container_main, namespace_clone_flags() | SIGCHLD, &ctx);
    if (pid == -1) {
        int err = errno;
        std::string reason = errno_message("clone with new namespaces failed", err);
        if (err == EPERM) {
            reason += " (insufficient privilege)";
        } else if (err == EINVAL) {
            reason += " (namespace type not supported by this kernel)";
        }
        throw NamespaceError(reason);
    }
    ctx.handshake->close_child_ends();
    log_debug("Spawned container init with pid " + std::to_string(pid));
    return pid;
}
