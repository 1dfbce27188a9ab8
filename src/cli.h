#pragma once

#include "cmds/cmd_build.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace playpack {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_build::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  bool help_requested{ false };
  std::string cli_output;  // help text or parse error
};

cli_args cli_parse(int argc, char **argv);

// Runs the parsed command and maps the outcome to a process exit status:
// 0 on success or help, 1 on any failure including interruption.
int cli_run(cli_args const &args);

}  // namespace playpack
