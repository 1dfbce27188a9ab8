#pragma once

#include <filesystem>
#include <optional>

namespace playpack {

// Build-time constant files shipped with playpack. Resolved once at startup and passed
// to the stages that need them.
struct runtime_assets {
  std::filesystem::path header_template;  // self-extracting shell header
  std::filesystem::path entrypoint;       // run.sh executed after extraction
  std::filesystem::path runtime_config;   // ansible.cfg

  // Asset layout under root: header.sh, run.sh, ansible.cfg
  static runtime_assets from_root(std::filesystem::path const &root);

  // Throws config_error naming the first missing or unreadable asset.
  void validate() const;
};

// Lookup order: override (if non-empty), PLAYPACK_ASSETS_DIR, <exe_dir>/../share/playpack,
// compile-time PLAYPACK_DEFAULT_ASSETS_DIR. Throws config_error if none contains the
// header template.
std::filesystem::path runtime_assets_find_root(
    std::optional<std::filesystem::path> const &override_root = std::nullopt);

}  // namespace playpack
