#pragma once

#include <sys/types.h>

bool wait_for_process(pid_t pid, int& status);
int exit_code_from_status(int status);
// A zombie counts as dead: it only waits for its parent to reap it.
bool process_alive(pid_t pid);
void kill_and_reap(pid_t pid);
