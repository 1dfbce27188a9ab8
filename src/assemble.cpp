#include "assemble.h"

#include "build_config.h"
#include "bundle_layout.h"
#include "runtime_assets.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace playpack {

namespace {

void copy_regular_file(std::filesystem::path const &src, std::filesystem::path const &dst) {
  std::error_code ec;
  std::filesystem::copy_file(src,
                             dst,
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw std::runtime_error("failed to copy " + src.string() + " to " + dst.string() +
                             ": " + ec.message());
  }

  auto const mtime{ std::filesystem::last_write_time(src) };
  std::filesystem::last_write_time(dst, mtime);
}

void copy_tree(std::filesystem::path const &src,
               std::filesystem::path const &dst,
               std::vector<std::filesystem::path> &ancestors) {
  std::error_code ec;
  auto const st{ std::filesystem::status(src, ec) };  // follows symlinks
  if (ec || !std::filesystem::exists(st)) {
    throw std::runtime_error("cannot stage " + src.string() +
                             ": missing file or dangling symlink");
  }

  if (std::filesystem::is_regular_file(st)) {
    copy_regular_file(src, dst);
    return;
  }

  if (!std::filesystem::is_directory(st)) {
    throw std::runtime_error("cannot stage " + src.string() +
                             ": not a regular file or directory");
  }

  auto const canonical{ std::filesystem::canonical(src) };
  if (std::ranges::find(ancestors, canonical) != ancestors.end()) {
    throw std::runtime_error("cannot stage " + src.string() + ": symlink cycle");
  }
  ancestors.push_back(canonical);

  std::filesystem::create_directories(dst);

  for (auto const &entry : std::filesystem::directory_iterator(src)) {
    copy_tree(entry.path(), dst / entry.path().filename(), ancestors);
  }

  ancestors.pop_back();

  // Staged directories stay owner-writable so the staging area can always be removed.
  std::filesystem::permissions(dst, st.permissions() | std::filesystem::perms::owner_all);
  // Children changed the directory mtime; restore it last.
  std::filesystem::last_write_time(dst, std::filesystem::last_write_time(src));
}

}  // namespace

void copy_dereferenced(std::filesystem::path const &src, std::filesystem::path const &dst) {
  std::vector<std::filesystem::path> ancestors;
  copy_tree(src, dst, ancestors);
}

void assemble_content(build_config const &cfg,
                      runtime_assets const &assets,
                      std::filesystem::path const &staging_root) {
  tui::info("Staging playbook %s", cfg.playbook_file.string().c_str());
  copy_dereferenced(cfg.playbook_file, staging_root / bundle_layout::kPlaybook);

  auto const local_roles{ cfg.playbook_dir / bundle_layout::kRoles };
  if (std::error_code ec; std::filesystem::is_directory(local_roles, ec)) {
    tui::info("Staging local roles %s", local_roles.string().c_str());
    copy_dereferenced(local_roles, staging_root / bundle_layout::kRoles);
  } else {
    tui::debug("no local roles directory at %s", local_roles.string().c_str());
  }

  if (cfg.requirements_file) {
    tui::info("Staging requirements %s", cfg.requirements_file->string().c_str());
    copy_dereferenced(*cfg.requirements_file, staging_root / bundle_layout::kRequirements);
  }

  if (cfg.vars_file) {
    tui::info("Staging vars %s", cfg.vars_file->string().c_str());
    copy_dereferenced(*cfg.vars_file, staging_root / bundle_layout::kVars);
  }

  for (auto const &dep : cfg.extra_deps) {
    tui::info("Staging extra dependency %s", dep.string().c_str());
    copy_dereferenced(dep, staging_root / dep.filename());
  }

  tui::debug("Staging runtime configuration %s", assets.runtime_config.string().c_str());
  copy_dereferenced(assets.runtime_config, staging_root / bundle_layout::kRuntimeConfig);
}

}  // namespace playpack
