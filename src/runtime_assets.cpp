#include "runtime_assets.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <string>
#include <system_error>
#include <vector>

#ifndef PLAYPACK_DEFAULT_ASSETS_DIR
#error "PLAYPACK_DEFAULT_ASSETS_DIR must be defined by the build system"
#endif

namespace playpack {

namespace {

constexpr char const *kHeaderName{ "header.sh" };
constexpr char const *kEntrypointName{ "run.sh" };
constexpr char const *kRuntimeConfigName{ "ansible.cfg" };

bool has_assets(std::filesystem::path const &root) {
  std::error_code ec;
  return std::filesystem::is_regular_file(root / kHeaderName, ec);
}

}  // namespace

runtime_assets runtime_assets::from_root(std::filesystem::path const &root) {
  return { .header_template = root / kHeaderName,
           .entrypoint = root / kEntrypointName,
           .runtime_config = root / kRuntimeConfigName };
}

void runtime_assets::validate() const {
  for (auto const *p : { &header_template, &entrypoint, &runtime_config }) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*p, ec) || !util_is_readable(*p)) {
      throw config_error("runtime asset missing or unreadable: " + p->string());
    }
  }
}

std::filesystem::path runtime_assets_find_root(
    std::optional<std::filesystem::path> const &override_root) {
  std::vector<std::filesystem::path> candidates;

  if (override_root && !override_root->empty()) {
    candidates.push_back(*override_root);
  } else {
    if (auto const env_root{ platform::env_var_get("PLAYPACK_ASSETS_DIR") }) {
      candidates.emplace_back(*env_root);
    }

    try {
      candidates.push_back(platform::get_exe_path().parent_path().parent_path() /
                           "share" / "playpack");
    } catch (std::exception const &e) {
      tui::debug("runtime assets: cannot locate executable: %s", e.what());
    }

    candidates.emplace_back(PLAYPACK_DEFAULT_ASSETS_DIR);
  }

  for (auto const &candidate : candidates) {
    if (has_assets(candidate)) {
      tui::debug("runtime assets: using %s", candidate.string().c_str());
      return candidate;
    }
    tui::debug("runtime assets: no assets in %s", candidate.string().c_str());
  }

  std::string msg{ "runtime assets not found; searched:" };
  for (auto const &candidate : candidates) { msg += "\n  " + candidate.string(); }
  throw config_error(msg);
}

}  // namespace playpack
