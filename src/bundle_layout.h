#pragma once

#include <array>
#include <string_view>

namespace playpack::bundle_layout {

// Fixed names inside the staging area (and therefore inside every bundle).
inline constexpr std::string_view kPlaybook{ "playbook.yml" };
inline constexpr std::string_view kRoles{ "roles" };
inline constexpr std::string_view kRequirements{ "requirements.yml" };
inline constexpr std::string_view kVars{ "vars.yml" };
inline constexpr std::string_view kRuntimeConfig{ "ansible.cfg" };
inline constexpr std::string_view kRuntimeRequirements{ "requirements.txt" };
inline constexpr std::string_view kEntrypoint{ "run.sh" };

inline constexpr std::array<std::string_view, 7> kReservedNames{
  kPlaybook,   kRoles,          kRequirements,        kVars,
  kEntrypoint, kRuntimeConfig,  kRuntimeRequirements,
};

// Per-role metadata written by ansible-galaxy; varies between runs.
inline constexpr std::string_view kGalaxyInstallInfo{ ".galaxy_install_info" };

}  // namespace playpack::bundle_layout
