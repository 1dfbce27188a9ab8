#include "build_config.h"

#include "bundle_layout.h"
#include "errors.h"
#include "util.h"

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <system_error>

namespace playpack {

namespace {

std::filesystem::path normalize(std::filesystem::path const &p) {
  auto result{ std::filesystem::absolute(p).lexically_normal() };
  if (result.filename().empty() && result.has_parent_path()) {
    result = result.parent_path();  // drop trailing separator
  }
  return result;
}

void require_readable_file(std::filesystem::path const &p, char const *what) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    throw config_error(std::string(what) + " not found: " + p.string());
  }
  if (!std::filesystem::is_regular_file(p, ec)) {
    throw config_error(std::string(what) + " is not a regular file: " + p.string());
  }
  if (!util_is_readable(p)) {
    throw config_error(std::string(what) + " is not readable: " + p.string());
  }
}

void require_readable_path(std::filesystem::path const &p, char const *what) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    throw config_error(std::string(what) + " not found: " + p.string());
  }
  if (!util_is_readable(p)) {
    throw config_error(std::string(what) + " is not readable: " + p.string());
  }
}

}  // namespace

std::filesystem::path build_config_default_output(std::filesystem::path const &playbook) {
  return playbook.parent_path() / (playbook.stem().string() + ".run");
}

build_config build_config_resolve(build_options const &opts) {
  if (opts.playbook_file.empty()) { throw config_error("playbook file is required"); }

  build_config cfg;
  cfg.playbook_file = normalize(opts.playbook_file);
  require_readable_file(cfg.playbook_file, "playbook file");
  cfg.playbook_dir = cfg.playbook_file.parent_path();

  if (opts.requirements_file) {
    cfg.requirements_file = normalize(*opts.requirements_file);
    require_readable_file(*cfg.requirements_file, "requirements file");
  } else {
    auto const colocated{ cfg.playbook_dir / bundle_layout::kRequirements };
    std::error_code ec;
    if (std::filesystem::is_regular_file(colocated, ec)) {
      require_readable_file(colocated, "requirements file");
      cfg.requirements_file = colocated;
    }
  }

  if (opts.vars_file) {
    cfg.vars_file = normalize(*opts.vars_file);
    require_readable_file(*cfg.vars_file, "vars file");
  }

  std::set<std::string> seen_names;
  for (auto const &dep : opts.extra_deps) {
    auto const path{ normalize(dep) };
    require_readable_path(path, "extra dependency");

    std::string const name{ path.filename().string() };
    if (name.empty()) {
      throw config_error("extra dependency has no base name: " + dep.string());
    }
    if (std::ranges::find(bundle_layout::kReservedNames, std::string_view{ name }) !=
        bundle_layout::kReservedNames.end()) {
      throw config_error("extra dependency '" + name +
                         "' collides with a reserved bundle entry: " + path.string());
    }
    if (!seen_names.insert(name).second) {
      throw config_error("extra dependency base name '" + name +
                         "' given more than once: " + path.string());
    }
    cfg.extra_deps.push_back(path);
  }

  cfg.ansible_version = opts.ansible_version;
  if (cfg.ansible_version && cfg.ansible_version->empty()) { cfg.ansible_version.reset(); }
  cfg.python_packages = opts.python_packages;

  cfg.output = opts.output ? normalize(*opts.output)
                           : build_config_default_output(cfg.playbook_file);

  std::error_code ec;
  if (std::filesystem::is_directory(cfg.output, ec)) {
    throw config_error("output path is a directory: " + cfg.output.string());
  }
  if (!std::filesystem::is_directory(cfg.output.parent_path(), ec)) {
    throw config_error("output directory does not exist: " +
                       cfg.output.parent_path().string());
  }

  return cfg;
}

}  // namespace playpack
