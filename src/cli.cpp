#include "cli.h"

#include "errors.h"

#include "CLI/CLI.hpp"

#include <cstdlib>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace playpack {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "playpack - package an ansible playbook into a self-extracting bundle" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  bool version_flag{ false };
  app.add_flag("--version", version_flag, "Show version information and exit");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  cmd_build::register_cli(app, [&cmd_cfg](cmd_build::cfg cfg) { cmd_cfg = std::move(cfg); });

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    args.help_requested = true;
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (!args.cli_output.empty()) { return args; }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  args.cmd_cfg = std::move(cmd_cfg);
  return args;
}

int cli_run(cli_args const &args) {
  if (args.help_requested) {
    tui::print_stdout("%s", args.cli_output.c_str());
    return EXIT_SUCCESS;
  }

  if (!args.cli_output.empty()) {
    tui::error("%s", args.cli_output.c_str());
    return EXIT_FAILURE;
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return cmd::create(cfg); }, *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (config_error const &ex) {
    tui::error("%s", ex.what());
    return EXIT_FAILURE;
  } catch (dependency_error const &ex) {
    tui::error("%s", ex.what());
    return EXIT_FAILURE;
  } catch (interrupted_error const &ex) {
    tui::error("%s", ex.what());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    tui::error("Build failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

}  // namespace playpack
