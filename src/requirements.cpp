#include "requirements.h"

#include "build_config.h"
#include "bundle_layout.h"
#include "tui.h"
#include "util.h"

namespace playpack {

namespace {

constexpr char const *kRuntimePackage{ "ansible" };

}  // namespace

std::string compose_runtime_requirements(std::optional<std::string> const &ansible_version,
                                         std::vector<std::string> const &python_packages) {
  std::string manifest{ kRuntimePackage };
  if (ansible_version) { manifest += "==" + *ansible_version; }
  manifest += '\n';

  for (auto const &spec : python_packages) {
    manifest += spec;
    manifest += '\n';
  }

  return manifest;
}

void write_runtime_requirements(std::filesystem::path const &staging_root,
                                build_config const &cfg) {
  auto const manifest{ compose_runtime_requirements(cfg.ansible_version,
                                                    cfg.python_packages) };
  tui::info("Writing runtime requirements (ansible %s, %zu extra packages)",
            cfg.ansible_version ? cfg.ansible_version->c_str() : "unpinned",
            cfg.python_packages.size());
  util_write_file(staging_root / bundle_layout::kRuntimeRequirements, manifest);
}

}  // namespace playpack
