#include "dependency_resolver.h"

#include "bundle_layout.h"
#include "errors.h"
#include "platform.h"
#include "shell.h"
#include "termination.h"
#include "tui.h"

#include <chrono>
#include <string>
#include <system_error>
#include <utility>

namespace playpack {

namespace {

constexpr char const *kDefaultResolver{ "ansible-galaxy" };

}  // namespace

galaxy_resolver::galaxy_resolver(std::string executable)
    : executable_{ std::move(executable) } {
  if (executable_.empty()) {
    executable_ = platform::env_var_get("PLAYPACK_RESOLVER").value_or(kDefaultResolver);
  }
}

std::vector<std::string> galaxy_resolver::command_line(
    std::filesystem::path const &descriptor,
    std::filesystem::path const &target_dir) const {
  return { "/usr/bin/env",
           executable_,
           "install",
           "--ignore-errors",
           "--role-file",
           descriptor.string(),
           "--roles-path",
           target_dir.string() };
}

resolver_result galaxy_resolver::resolve(std::filesystem::path const &descriptor,
                                         std::filesystem::path const &target_dir) {
  auto const argv{ command_line(descriptor, target_dir) };
  tui::debug("resolver: %s install --role-file %s --roles-path %s",
             executable_.c_str(),
             descriptor.string().c_str(),
             target_dir.string().c_str());

  shell_run_cfg const cfg{
    .on_stdout_line = [](std::string_view line) {
      tui::info("  %.*s", static_cast<int>(line.size()), line.data());
    },
    .on_stderr_line = [](std::string_view line) {
      tui::warn("  %.*s", static_cast<int>(line.size()), line.data());
    },
    .cwd = target_dir.parent_path(),
    .env = shell_getenv()
  };

  auto const result{ shell_run(argv, cfg) };
  return { .exit_code = result.exit_code, .signal = result.signal };
}

std::size_t strip_install_metadata(std::filesystem::path const &install_dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(install_dir, ec)) { return 0; }

  std::vector<std::filesystem::path> doomed;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(install_dir)) {
    if (entry.path().filename() == bundle_layout::kGalaxyInstallInfo) {
      doomed.push_back(entry.path());
    }
  }

  for (auto const &p : doomed) {
    std::filesystem::remove_all(p, ec);
    if (ec) {
      throw std::runtime_error("failed to remove install metadata " + p.string() + ": " +
                               ec.message());
    }
    tui::debug("removed install metadata %s", p.string().c_str());
  }

  return doomed.size();
}

void materialize_dependencies(std::filesystem::path const &staging_root,
                              dependency_resolver &resolver) {
  auto const descriptor{ staging_root / bundle_layout::kRequirements };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(descriptor, ec)) {
    tui::debug("no requirements descriptor staged, skipping dependency resolution");
    return;
  }

  auto const install_dir{ staging_root / bundle_layout::kRoles };
  std::filesystem::create_directories(install_dir, ec);
  if (ec) {
    throw std::runtime_error("failed to create " + install_dir.string() + ": " +
                             ec.message());
  }

  tui::info("Resolving role dependencies");
  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ resolver.resolve(descriptor, install_dir) };
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };

  termination_check();

  if (result.exit_code != 0) {
    std::string msg{ "dependency resolution failed: resolver " };
    if (result.signal) {
      msg += "terminated by signal " + std::to_string(*result.signal);
    } else {
      msg += "exited with status " + std::to_string(result.exit_code);
    }
    throw dependency_error(msg, result.exit_code);
  }

  std::size_t const stripped{ strip_install_metadata(install_dir) };
  tui::info("Resolved role dependencies in %lld ms (%zu metadata files stripped)",
            static_cast<long long>(duration_ms),
            stripped);
}

}  // namespace playpack
