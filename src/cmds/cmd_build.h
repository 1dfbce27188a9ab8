#pragma once

#include "build_config.h"
#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace playpack {

class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {
    build_options options;
  };

  // Build options live on the top-level app; playpack has no subcommands.
  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_build(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace playpack
