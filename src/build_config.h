#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace playpack {

// Raw option values as supplied on the command line.
struct build_options {
  std::filesystem::path playbook_file;
  std::optional<std::filesystem::path> requirements_file;
  std::optional<std::filesystem::path> vars_file;
  std::vector<std::filesystem::path> extra_deps;
  std::optional<std::string> ansible_version;
  std::vector<std::string> python_packages;
  std::optional<std::filesystem::path> output;
};

// Validated, absolute, defaults-applied configuration for one build.
struct build_config {
  std::filesystem::path playbook_dir;
  std::filesystem::path playbook_file;
  std::optional<std::filesystem::path> requirements_file;
  std::optional<std::filesystem::path> vars_file;
  std::vector<std::filesystem::path> extra_deps;
  std::optional<std::string> ansible_version;
  std::vector<std::string> python_packages;
  std::filesystem::path output;
};

// Validate options and apply defaults. Throws config_error; touches nothing on disk.
build_config build_config_resolve(build_options const &opts);

// <playbook_dir>/<playbook_stem>.run
std::filesystem::path build_config_default_output(std::filesystem::path const &playbook);

}  // namespace playpack
