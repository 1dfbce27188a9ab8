#include "packager.h"

#include "platform.h"
#include "runtime_assets.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"
#include "zlib.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace playpack {
namespace {

constexpr std::size_t kChunkSize{ 64 * 1024 };

// Deflates into a FILE with a gzip wrapper. zlib writes a zero mtime and no name in the
// gzip header, so identical input yields identical output.
class gzip_sink : unmovable {
 public:
  explicit gzip_sink(std::FILE *out) : out_{ out }, buffer_(kChunkSize) {
    if (deflateInit2(&strm_, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
      throw std::runtime_error("deflateInit2 failed");
    }
  }

  ~gzip_sink() { deflateEnd(&strm_); }

  void write(void const *data, std::size_t size) {
    strm_.next_in = const_cast<Bytef *>(static_cast<Bytef const *>(data));
    strm_.avail_in = static_cast<uInt>(size);
    pump(Z_NO_FLUSH);
  }

  void finish() {
    strm_.next_in = nullptr;
    strm_.avail_in = 0;
    pump(Z_FINISH);
  }

 private:
  void pump(int flush) {
    int ret{ Z_OK };
    do {
      strm_.next_out = buffer_.data();
      strm_.avail_out = static_cast<uInt>(buffer_.size());
      ret = deflate(&strm_, flush);
      if (ret == Z_STREAM_ERROR) { throw std::runtime_error("deflate failed"); }
      util_write_all(out_, buffer_.data(), buffer_.size() - strm_.avail_out);
    } while (strm_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
  }

  std::FILE *out_;
  z_stream strm_{};
  std::vector<Bytef> buffer_;
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
  }

  ~archive_writer() {
    if (handle) { archive_write_free(handle); }
  }

  archive *handle{ nullptr };
};

struct entry_deleter {
  void operator()(archive_entry *e) const noexcept { archive_entry_free(e); }
};
using entry_ptr_t = std::unique_ptr<archive_entry, entry_deleter>;

la_ssize_t gzip_write_cb(archive *a, void *client, void const *buffer, size_t length) {
  try {
    static_cast<gzip_sink *>(client)->write(buffer, length);
    return static_cast<la_ssize_t>(length);
  } catch (std::exception const &e) {
    archive_set_error(a, EIO, "%s", e.what());
    return -1;
  }
}

void check_archive(archive *a, int rc, char const *what) {
  if (rc == ARCHIVE_OK) { return; }
  if (rc == ARCHIVE_WARN) {
    tui::warn("%s: %s", what, archive_error_string(a));
    return;
  }
  char const *detail{ archive_error_string(a) };
  throw std::runtime_error(std::string(what) + ": " + (detail ? detail : "unknown error"));
}

void write_entry(archive *a,
                 std::filesystem::path const &root,
                 std::filesystem::path const &rel) {
  auto const full{ root / rel };
  auto const st{ std::filesystem::symlink_status(full) };

  entry_ptr_t entry{ archive_entry_new() };
  if (!entry) { throw std::runtime_error("archive_entry_new failed"); }

  archive_entry_copy_pathname(entry.get(), rel.generic_string().c_str());
  archive_entry_set_perm(entry.get(),
                         static_cast<mode_t>(st.permissions() &
                                                std::filesystem::perms::mask));
  archive_entry_set_uid(entry.get(), 0);
  archive_entry_set_gid(entry.get(), 0);
  archive_entry_set_mtime(entry.get(), static_cast<time_t>(kReferenceEpoch), 0);

  switch (st.type()) {
    case std::filesystem::file_type::directory:
      archive_entry_set_filetype(entry.get(), AE_IFDIR);
      break;
    case std::filesystem::file_type::regular:
      archive_entry_set_filetype(entry.get(), AE_IFREG);
      archive_entry_set_size(entry.get(),
                             static_cast<la_int64_t>(std::filesystem::file_size(full)));
      break;
    case std::filesystem::file_type::symlink:
      archive_entry_set_filetype(entry.get(), AE_IFLNK);
      archive_entry_copy_symlink(entry.get(),
                                 std::filesystem::read_symlink(full).string().c_str());
      break;
    default: throw std::runtime_error("cannot archive special file " + full.string());
  }

  check_archive(a, archive_write_header(a, entry.get()), "archive_write_header");

  if (st.type() != std::filesystem::file_type::regular) { return; }

  auto file{ util_open_file(full, "rb") };
  if (!file) { throw std::runtime_error("failed to open " + full.string()); }

  std::vector<char> buffer(kChunkSize);
  while (true) {
    std::size_t const n{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (n > 0 && archive_write_data(a, buffer.data(), n) < 0) {
      throw std::runtime_error(std::string("archive_write_data failed for ") +
                               full.string() + ": " + archive_error_string(a));
    }
    if (n < buffer.size()) {
      if (std::ferror(file.get())) {
        throw std::runtime_error("failed to read " + full.string());
      }
      break;
    }
  }
}

void write_tar_gz(std::FILE *out,
                  std::filesystem::path const &root,
                  std::vector<std::filesystem::path> const &entries) {
  gzip_sink sink{ out };
  archive_writer writer;

  check_archive(writer.handle,
                archive_write_set_format_gnutar(writer.handle),
                "archive_write_set_format_gnutar");
  check_archive(writer.handle,
                archive_write_add_filter_none(writer.handle),
                "archive_write_add_filter_none");
  check_archive(writer.handle,
                archive_write_open(writer.handle, &sink, nullptr, gzip_write_cb, nullptr),
                "archive_write_open");

  for (auto const &rel : entries) { write_entry(writer.handle, root, rel); }

  check_archive(writer.handle, archive_write_close(writer.handle), "archive_write_close");
  sink.finish();
}

}  // namespace

std::string header_substitute(std::string_view header, header_values_t const &values) {
  for (auto const &[token, value] : values) {
    if (token.empty()) { throw std::invalid_argument("header_substitute: empty token"); }
    if (value.find('\n') != std::string::npos) {
      throw std::invalid_argument("header_substitute: value for " + std::string(token) +
                                  " contains a newline");
    }
  }

  std::vector<bool> used(values.size(), false);
  std::string out;
  out.reserve(header.size());

  for (std::size_t pos{ 0 }; pos < header.size();) {
    bool matched{ false };
    for (std::size_t i{ 0 }; i < values.size(); ++i) {
      if (header.compare(pos, values[i].first.size(), values[i].first) == 0) {
        out += values[i].second;
        pos += values[i].first.size();
        used[i] = true;
        matched = true;
        break;
      }
    }
    if (!matched) { out.push_back(header[pos++]); }
  }

  for (std::size_t i{ 0 }; i < values.size(); ++i) {
    if (!used[i]) {
      throw std::runtime_error("header template is missing token " +
                               std::string(values[i].first));
    }
  }

  return out;
}

rendered_header render_header(std::string header_template, std::string_view version) {
  if (header_template.empty() || header_template.back() != '\n') {
    header_template.push_back('\n');
  }

  std::size_t const lines{ util_count_lines(header_template) };
  std::size_t const skip{ lines + 1 };

  auto text{ header_substitute(header_template,
                               { { kSkipToken, std::to_string(skip) },
                                 { kVersionToken, std::string(version) } }) };

  if (util_count_lines(text) != lines) {
    throw std::logic_error("header line count changed during substitution");
  }

  return { .text = std::move(text), .uncompress_skip = skip };
}

void normalize_timestamps(std::filesystem::path const &root, std::int64_t epoch_seconds) {
  for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
    platform::set_file_times(entry.path(), epoch_seconds);
  }
  platform::set_file_times(root, epoch_seconds);
}

std::vector<std::filesystem::path> collect_archive_entries(
    std::filesystem::path const &root) {
  std::vector<std::filesystem::path> entries;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
    entries.push_back(entry.path().lexically_relative(root));
  }

  std::ranges::sort(entries, [](auto const &a, auto const &b) {
    return a.generic_string() < b.generic_string();
  });
  return entries;
}

bundle_summary package_bundle(std::filesystem::path const &staging_root,
                              runtime_assets const &assets,
                              std::filesystem::path const &output,
                              std::string_view version) {
  auto const header{ render_header(util_load_text(assets.header_template), version) };
  tui::debug("header: %zu lines, UNCOMPRESS_SKIP=%zu",
             header.uncompress_skip - 1,
             header.uncompress_skip);

  normalize_timestamps(staging_root, kReferenceEpoch);
  auto const entries{ collect_archive_entries(staging_root) };

  auto const tmp{ platform::make_temp_file(output.parent_path(),
                                           "." + output.filename().string() + ".") };
  std::filesystem::path const partial{ tmp.path };
  scoped_path_cleanup partial_cleanup{ partial };

  {
    file_ptr_t file{ ::fdopen(tmp.fd, "wb") };
    if (!file) {
      int const err{ errno };
      ::close(tmp.fd);
      throw std::system_error(err,
                              std::generic_category(),
                              "failed to open " + partial.string());
    }

    util_write_all(file.get(), header.text.data(), header.text.size());
    write_tar_gz(file.get(), staging_root, entries);

    if (std::fflush(file.get()) != 0 || std::ferror(file.get())) {
      throw std::runtime_error("failed to write " + partial.string());
    }
  }

  using std::filesystem::perms;
  std::filesystem::permissions(partial,
                               perms::owner_all | perms::group_read | perms::group_exec |
                                   perms::others_read | perms::others_exec,
                               std::filesystem::perm_options::replace);

  platform::atomic_rename(partial, output);
  partial_cleanup.release();

  return { .bytes = std::filesystem::file_size(output),
           .entries = entries.size(),
           .uncompress_skip = header.uncompress_skip };
}

}  // namespace playpack
