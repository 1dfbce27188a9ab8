#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace playpack {

struct build_config;

// "ansible" or "ansible==<version>", then each package specifier verbatim, one per line.
std::string compose_runtime_requirements(std::optional<std::string> const &ansible_version,
                                         std::vector<std::string> const &python_packages);

// Write the composed manifest to <staging_root>/requirements.txt.
void write_runtime_requirements(std::filesystem::path const &staging_root,
                                build_config const &cfg);

}  // namespace playpack
