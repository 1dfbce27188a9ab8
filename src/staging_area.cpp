#include "staging_area.h"

#include "platform.h"
#include "tui.h"

#include <stdexcept>
#include <system_error>

namespace playpack {

namespace {

constexpr char const *kStagingPrefix{ "playpack-" };

}  // namespace

staging_area::staging_area() : staging_area(std::filesystem::temp_directory_path()) {}

staging_area::staging_area(std::filesystem::path const &parent)
    : path_{ platform::make_private_temp_dir(parent, kStagingPrefix) } {
  tui::debug("staging area created: %s", path_.string().c_str());
}

staging_area::~staging_area() {
  if (!active()) { return; }

  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    tui::warn("failed to remove staging area %s: %s",
              path_.string().c_str(),
              ec.message().c_str());
  } else {
    tui::debug("staging area removed: %s", path_.string().c_str());
  }
}

void staging_area::release() {
  if (!active()) { return; }

  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    throw std::runtime_error("failed to remove staging area " + path_.string() + ": " +
                             ec.message());
  }

  tui::debug("staging area removed: %s", path_.string().c_str());
  path_.clear();
}

}  // namespace playpack
