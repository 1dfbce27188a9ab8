#pragma once

#include "util.h"

#include <filesystem>

namespace playpack {

// Ephemeral, owner-only working directory for one build. The directory is created in
// the constructor and removed recursively by release() or the destructor, whichever
// comes first.
class staging_area : unmovable {
 public:
  // Creates <parent>/playpack-XXXXXX; parent defaults to the system temp directory.
  staging_area();
  explicit staging_area(std::filesystem::path const &parent);
  ~staging_area();

  std::filesystem::path const &path() const { return path_; }
  bool active() const { return !path_.empty(); }

  // Remove the directory now. Idempotent. Throws if removal fails.
  void release();

 private:
  std::filesystem::path path_;
};

}  // namespace playpack
