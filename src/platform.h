#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace playpack::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Create a uniquely named directory with mode 0700 under parent via mkdtemp.
// prefix is the leading part of the directory name; a random suffix is appended.
std::filesystem::path make_private_temp_dir(std::filesystem::path const &parent,
                                            std::string_view prefix);

struct temp_file {
  std::filesystem::path path;
  int fd;  // open for writing; caller owns it
};

// Create a uniquely named file with mode 0600 under parent via mkstemp.
temp_file make_temp_file(std::filesystem::path const &parent, std::string_view prefix);

// Set both access and modification time (seconds since epoch). Symlinks are not
// followed.
void set_file_times(std::filesystem::path const &path, std::int64_t epoch_seconds);

std::filesystem::path get_exe_path();

std::optional<std::string> env_var_get(char const *name);

}  // namespace playpack::platform
