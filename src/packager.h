#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace playpack {

struct runtime_assets;

// 2000-01-01T00:00:00Z. Every staged file and archive entry carries this timestamp.
inline constexpr std::int64_t kReferenceEpoch{ 946684800 };

inline constexpr std::string_view kSkipToken{ "@UNCOMPRESS_SKIP@" };
inline constexpr std::string_view kVersionToken{ "@PLAYPACK_VERSION@" };

using header_values_t = std::vector<std::pair<std::string_view, std::string>>;

// Replace whole-token occurrences in one left-to-right pass; substituted text is never
// rescanned. Every token must occur at least once and no value may contain a newline.
std::string header_substitute(std::string_view header, header_values_t const &values);

struct rendered_header {
  std::string text;
  std::size_t uncompress_skip;  // 1-based line of the first payload byte
};

// Terminate the template with a newline if needed, measure its line count, then
// substitute skip (= line count + 1) and version. Line count is verified unchanged.
rendered_header render_header(std::string header_template, std::string_view version);

// Set atime and mtime of root and everything beneath it (symlinks not followed).
void normalize_timestamps(std::filesystem::path const &root, std::int64_t epoch_seconds);

// Relative paths of everything beneath root, sorted lexicographically by generic form.
std::vector<std::filesystem::path> collect_archive_entries(std::filesystem::path const &root);

struct bundle_summary {
  std::uint64_t bytes;
  std::size_t entries;
  std::size_t uncompress_skip;
};

// Write header + gzip(tar(staging_root)) to output, mode 0755. The bundle is built in a
// temporary sibling and renamed into place; on failure no output file is left behind.
bundle_summary package_bundle(std::filesystem::path const &staging_root,
                              runtime_assets const &assets,
                              std::filesystem::path const &output,
                              std::string_view version);

}  // namespace playpack
