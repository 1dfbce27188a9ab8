#pragma once

#include <filesystem>

namespace playpack {

struct build_config;
struct runtime_assets;

// Copy playbook, local roles, requirements descriptor, vars file, extra dependencies
// and the runtime configuration into staging_root under their fixed names.
void assemble_content(build_config const &cfg,
                      runtime_assets const &assets,
                      std::filesystem::path const &staging_root);

// Copy a file or directory tree, dereferencing symlinks and preserving modification
// times. Only regular files and directories are produced; anything else throws.
void copy_dereferenced(std::filesystem::path const &src, std::filesystem::path const &dst);

}  // namespace playpack
