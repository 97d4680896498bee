#include "bantubox/process.h"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace {

pid_t waitpid_retrying(pid_t pid, int& status, int options) {
    pid_t result;
    do {
        result = waitpid(pid, &status, options);
    } while (result == -1 && errno == EINTR);
    return result;
}

// State letter from /proc/<pid>/stat, or '\0' when it cannot be read.
char process_state(pid_t pid) {
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!std::getline(ifs, stat)) {
        return '\0';
    }
    // The command name may contain spaces and parentheses; the state follows
    // the last ')'.
    auto pos = stat.rfind(')');
    if (pos == std::string::npos || pos + 2 >= stat.size()) {
        return '\0';
    }
    return stat[pos + 2];
}

} // namespace

bool wait_for_process(pid_t pid, int& status) {
    return waitpid_retrying(pid, status, 0) == pid;
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

bool process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }
    char state = process_state(pid);
    return state != 'Z' && state != 'X';
}

void kill_and_reap(pid_t pid) {
    if (pid <= 0) {
        return;
    }
    kill(pid, SIGKILL);
    int status = 0;
    waitpid_retrying(pid, status, 0);
}
