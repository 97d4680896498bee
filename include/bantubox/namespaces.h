#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

#include "bantubox/errors.h"
#include "bantubox/filesystem.h"
#include "bantubox/kernel.h"

constexpr int DEFAULT_HANDSHAKE_TIMEOUT_MS = 30000;

int namespace_clone_flags();

// Two pipes between the supervisor and the container init. The status pipe
// (child to parent) carries one JSON line per message and is close-on-exec,
// so EOF tells the parent the child has exec'd or died. The release pipe
// (parent to child) carries the single go-ahead byte.
class Handshake {
public:
    Handshake() = default;
    ~Handshake();
    Handshake(const Handshake&) = delete;
    Handshake& operator=(const Handshake&) = delete;

    void open();

    // Parent side.
    void close_child_ends();
    void await_ready(int timeout_ms);
    void release();
    void abort();
    void await_exec(int timeout_ms);

    // Child side.
    void close_parent_ends();
    void report_ready();
    void report_error(ErrorKind kind, const std::string& message);
    void await_release(int timeout_ms);

private:
    void send_status(const std::string& line);

    int status_read_ = -1;
    int status_write_ = -1;
    int release_read_ = -1;
    int release_write_ = -1;
};

struct ChildContext {
    KernelOps* kernel = nullptr;
    FilesystemJail* jail = nullptr;
    Handshake* handshake = nullptr;
    std::string hostname;
    std::vector<std::string> argv;
    int handshake_timeout_ms = DEFAULT_HANDSHAKE_TIMEOUT_MS;
};

// Stages run by the container init, in order, inside the new namespaces.
void child_set_hostname(ChildContext& ctx);
void child_enter_jail(ChildContext& ctx);
void child_setup_network(ChildContext& ctx);
void child_await_release(ChildContext& ctx);
int child_exec(ChildContext& ctx);

// clone() entry point; arg is a ChildContext*.
int container_main(void* arg);

// Creates the container init with every namespace in one clone call.
// Throws NamespaceError.
pid_t spawn_container_process(KernelOps& kernel, ChildContext& ctx);
