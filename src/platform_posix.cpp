#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace playpack::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

std::filesystem::path make_private_temp_dir(std::filesystem::path const &parent,
                                            std::string_view prefix) {
  std::string pattern{ (parent / (std::string{ prefix } + "XXXXXX")).string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  if (::mkdtemp(path_buffer.data()) == nullptr) {
    throw std::system_error(errno,
                            std::system_category(),
                            "mkdtemp failed for " + pattern);
  }

  return std::filesystem::path{ path_buffer.data() };
}

temp_file make_temp_file(std::filesystem::path const &parent, std::string_view prefix) {
  std::string pattern{ (parent / (std::string{ prefix } + "XXXXXX")).string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  int const fd{ ::mkstemp(path_buffer.data()) };
  if (fd == -1) {
    throw std::system_error(errno, std::system_category(), "mkstemp failed for " + pattern);
  }

  return { .path = std::filesystem::path{ path_buffer.data() }, .fd = fd };
}

void set_file_times(std::filesystem::path const &path, std::int64_t epoch_seconds) {
  struct timespec const ts{ .tv_sec = static_cast<time_t>(epoch_seconds), .tv_nsec = 0 };
  struct timespec const times[2]{ ts, ts };

  if (::utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to set file times: " + path.string());
  }
}

std::filesystem::path get_exe_path() {
#ifdef __APPLE__
  uint32_t size{ 0 };
  _NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size);
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    throw std::runtime_error("_NSGetExecutablePath failed");
  }
  return std::filesystem::canonical(buf.data());
#else
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
#endif
}

std::optional<std::string> env_var_get(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_get: null name"); }
  char const *value{ std::getenv(name) };
  if (!value || *value == '\0') { return std::nullopt; }
  return std::string{ value };
}


}  // namespace playpack::platform
