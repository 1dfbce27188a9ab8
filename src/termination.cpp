#include "termination.h"

#include "errors.h"

#include <csignal>
#include <initializer_list>

#include <signal.h>

namespace {

volatile std::sig_atomic_t s_signal{ 0 };
volatile std::sig_atomic_t s_child{ -1 };

void signal_handler(int sig) {
  s_signal = sig;
  if (pid_t const child{ static_cast<pid_t>(s_child) }; child > 0) { ::kill(child, sig); }
}

}  // namespace

namespace playpack {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sa.sa_flags = SA_RESTART;  // interrupted syscalls resume; termination_check() unwinds
  sigemptyset(&sa.sa_mask);

  for (int const sig : { SIGINT, SIGTERM, SIGHUP }) { sigaction(sig, &sa, nullptr); }
}

int termination_signal() { return static_cast<int>(s_signal); }

void termination_check() {
  if (int const sig{ termination_signal() }; sig != 0) { throw interrupted_error{ sig }; }
}

void termination_set_child(pid_t pid) { s_child = static_cast<std::sig_atomic_t>(pid); }

void termination_reset() { s_signal = 0; }

}  // namespace playpack
