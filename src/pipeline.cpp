#include "pipeline.h"

#include "assemble.h"
#include "build_config.h"
#include "dependency_resolver.h"
#include "entrypoint.h"
#include "requirements.h"
#include "runtime_assets.h"
#include "staging_area.h"
#include "termination.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <memory>

namespace playpack {

build_result run_build(build_config const &cfg,
                       runtime_assets const &assets,
                       dependency_resolver &resolver,
                       std::string_view version,
                       std::filesystem::path const &staging_parent) {
  auto const start{ std::chrono::steady_clock::now() };
  termination_check();

  // A failed build must not leave a bundle from earlier inputs at the target path.
  scoped_path_cleanup output_cleanup{ cfg.output };

  auto const staging{ staging_parent.empty() ? std::make_unique<staging_area>()
                                             : std::make_unique<staging_area>(
                                                   staging_parent) };
  auto const &root{ staging->path() };

  assemble_content(cfg, assets, root);
  termination_check();

  materialize_dependencies(root, resolver);
  termination_check();

  write_runtime_requirements(root, cfg);
  install_entrypoint(assets, root);
  termination_check();

  tui::info("Packaging %s", cfg.output.string().c_str());
  auto const summary{ package_bundle(root, assets, cfg.output, version) };

  output_cleanup.release();
  staging->release();

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  tui::info("Built %s (%s, %zu entries) in %lld ms",
            cfg.output.filename().string().c_str(),
            util_format_bytes(summary.bytes).c_str(),
            summary.entries,
            static_cast<long long>(duration_ms));

  return { .output = cfg.output, .summary = summary };
}

}  // namespace playpack
