#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace playpack {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
};

enum class shell_stream { std_out, std_err };

struct shell_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
};

shell_env_t shell_getenv();

// Fork and execve argv (argv[0] must be a path; use /usr/bin/env for PATH lookup).
// stdin is /dev/null, stdout/stderr are delivered line by line. Blocks until the child
// exits. While running, the child receives forwarded SIGINT/SIGTERM.
shell_result shell_run(std::vector<std::string> const &argv, shell_run_cfg const &cfg);

}  // namespace playpack
