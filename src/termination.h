#pragma once

#include <sys/types.h>

namespace playpack {

// Install SIGINT/SIGTERM/SIGHUP handlers with SA_RESTART. The handler records the
// signal and forwards it to the registered child process; the build notices via
// termination_check() and unwinds so scoped resources are released.
void termination_handler_install();

// Signal number received, or 0.
int termination_signal();

// Throws interrupted_error if a termination signal has been received.
void termination_check();

// Child process that receives forwarded signals. Pass -1 to clear.
void termination_set_child(pid_t pid);

// Test hook: forget any received signal.
void termination_reset();

}  // namespace playpack
