#pragma once

#include <stdexcept>
#include <string>

namespace playpack {

// Missing, unreadable or conflicting user input. Raised before any staging occurs.
struct config_error : std::runtime_error {
  explicit config_error(std::string const &msg) : std::runtime_error{ msg } {}
};

// The external role resolver exited non-zero.
struct dependency_error : std::runtime_error {
  dependency_error(std::string const &msg, int exit_code)
      : std::runtime_error{ msg }, exit_code{ exit_code } {}

  int exit_code;
};

// SIGINT/SIGTERM observed while building.
struct interrupted_error : std::runtime_error {
  explicit interrupted_error(int signal)
      : std::runtime_error{ "build interrupted by signal " + std::to_string(signal) },
        signal{ signal } {}

  int signal;
};

}  // namespace playpack
