#include "cmd_build.h"

#include "dependency_resolver.h"
#include "pipeline.h"
#include "runtime_assets.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <utility>

#ifndef PLAYPACK_VERSION_STR
#error "PLAYPACK_VERSION_STR must be defined by the build system"
#endif

namespace playpack {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto cfg_ptr{ std::make_shared<cfg>() };
  auto &o{ cfg_ptr->options };

  app.add_option("-p,--playbook-file", o.playbook_file, "Playbook to package (required)");
  app.add_option("-r,--requirements-file",
                 o.requirements_file,
                 "Role requirements file (defaults to requirements.yml beside the playbook)");
  app.add_option("--vars-file", o.vars_file, "Variables file passed as extra vars");
  app.add_option("--extra-deps",
                 o.extra_deps,
                 "Additional file or directory to ship in the bundle (repeatable)");
  app.add_option("--ansible-version", o.ansible_version, "Pin the ansible package version");
  app.add_option("--python-package",
                 o.python_packages,
                 "Extra pip requirement installed at runtime (repeatable)");
  app.add_option("-o,--output",
                 o.output,
                 "Bundle path (defaults to <playbook dir>/<playbook stem>.run)");

  app.callback([cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_build::cmd_build(cmd_build::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_build::execute() {
  auto const build_cfg{ build_config_resolve(cfg_.options) };

  auto const assets{ runtime_assets::from_root(runtime_assets_find_root()) };
  assets.validate();

  galaxy_resolver resolver;
  auto const result{ run_build(build_cfg, assets, resolver, PLAYPACK_VERSION_STR) };

  tui::print_stdout("%s\n", result.output.string().c_str());
}

}  // namespace playpack
