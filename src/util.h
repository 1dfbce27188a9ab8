#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace playpack {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Load entire file as text. Throws std::runtime_error on failure.
std::string util_load_text(std::filesystem::path const &path);

// Write data to file, truncating. Throws std::runtime_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view data);

// Write all bytes to an open FILE. Throws std::runtime_error on short write.
void util_write_all(std::FILE *file, void const *data, std::size_t size);

// Number of '\n' characters in text.
std::size_t util_count_lines(std::string_view text);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// True if the file at path can be opened for reading.
bool util_is_readable(std::filesystem::path const &path);

// Removes the held path (file or directory tree) on destruction unless released.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void release() { path_.clear(); }
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace playpack
