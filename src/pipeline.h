#pragma once

#include "packager.h"

#include <filesystem>
#include <string_view>

namespace playpack {

struct build_config;
struct runtime_assets;
class dependency_resolver;

struct build_result {
  std::filesystem::path output;
  bundle_summary summary;
};

// Run every build stage for cfg inside a fresh staging area, which is removed on every
// exit path. On failure no file remains at cfg.output, including one from an earlier
// build. staging_parent defaults to the system temp directory.
build_result run_build(build_config const &cfg,
                       runtime_assets const &assets,
                       dependency_resolver &resolver,
                       std::string_view version,
                       std::filesystem::path const &staging_parent = {});

}  // namespace playpack
