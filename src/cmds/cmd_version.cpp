#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "archive.h"
#include "zlib.h"

#include <exception>
#include <utility>

#ifndef PLAYPACK_VERSION_STR
#error "PLAYPACK_VERSION_STR must be defined by the build system"
#endif

namespace playpack {

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::print_stdout("playpack %s\n", PLAYPACK_VERSION_STR);

  try {
    tui::debug("executable: %s", platform::get_exe_path().string().c_str());
  } catch (std::exception const &e) { tui::debug("executable: unknown (%s)", e.what()); }

  tui::debug("Third-party component versions:");
  tui::debug("  libarchive: %s", archive_version_details());
  tui::debug("  zlib: %s", zlibVersion());
}

}  // namespace playpack
