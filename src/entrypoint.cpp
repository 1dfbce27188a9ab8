#include "entrypoint.h"

#include "bundle_layout.h"
#include "runtime_assets.h"
#include "tui.h"

#include <stdexcept>
#include <system_error>

namespace playpack {

void install_entrypoint(runtime_assets const &assets,
                        std::filesystem::path const &staging_root) {
  auto const dst{ staging_root / bundle_layout::kEntrypoint };
  tui::debug("Installing entrypoint %s", assets.entrypoint.string().c_str());

  std::error_code ec;
  std::filesystem::copy_file(assets.entrypoint,
                             dst,
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw std::runtime_error("failed to install entrypoint " +
                             assets.entrypoint.string() + ": " + ec.message());
  }

  using std::filesystem::perms;
  std::filesystem::permissions(dst,
                               perms::owner_read | perms::owner_write |
                                   perms::owner_exec | perms::group_read |
                                   perms::group_exec,
                               std::filesystem::perm_options::replace);
}

}  // namespace playpack
