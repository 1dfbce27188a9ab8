#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>

#include <CLI/CLI.hpp>

#include <array>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

int main() {
    // libarchive: write a one-entry gnutar archive to memory, read it back.
    std::vector<char> tar_buffer(64 * 1024);
    size_t tar_used = 0;

    archive *writer = archive_write_new();
    if (!writer) {
        return 1;
    }
    if (archive_write_set_format_gnutar(writer) != ARCHIVE_OK ||
        archive_write_add_filter_gzip(writer) != ARCHIVE_OK ||
        archive_write_open_memory(writer, tar_buffer.data(), tar_buffer.size(), &tar_used) !=
            ARCHIVE_OK) {
        archive_write_free(writer);
        return 1;
    }

    static constexpr std::string_view payload = "- hosts: all\n";
    archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname(entry, "playbook.yml");
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, static_cast<la_int64_t>(payload.size()));
    const bool wrote = archive_write_header(writer, entry) == ARCHIVE_OK &&
                       archive_write_data(writer, payload.data(), payload.size()) ==
                           static_cast<la_ssize_t>(payload.size());
    archive_entry_free(entry);
    if (!wrote || archive_write_close(writer) != ARCHIVE_OK) {
        archive_write_free(writer);
        return 1;
    }
    archive_write_free(writer);

    archive *reader = archive_read_new();
    if (!reader) {
        return 1;
    }
    archive_read_support_filter_gzip(reader);
    archive_read_support_format_tar(reader);
    if (archive_read_open_memory(reader, tar_buffer.data(), tar_used) != ARCHIVE_OK) {
        archive_read_free(reader);
        return 1;
    }
    archive_entry *read_entry = nullptr;
    if (archive_read_next_header(reader, &read_entry) != ARCHIVE_OK ||
        std::strcmp(archive_entry_pathname(read_entry), "playbook.yml") != 0) {
        archive_read_free(reader);
        return 1;
    }
    archive_read_free(reader);

    // zlib: gzip-wrapped deflate round trip.
    static constexpr std::string_view text = "UNCOMPRESS_SKIP=42\n";
    std::array<unsigned char, 256> compressed{};
    z_stream deflater{};
    if (deflateInit2(&deflater, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return 1;
    }
    deflater.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(text.data()));
    deflater.avail_in = static_cast<uInt>(text.size());
    deflater.next_out = compressed.data();
    deflater.avail_out = static_cast<uInt>(compressed.size());
    const int deflate_rc = deflate(&deflater, Z_FINISH);
    const size_t compressed_size = compressed.size() - deflater.avail_out;
    deflateEnd(&deflater);
    if (deflate_rc != Z_STREAM_END || compressed[0] != 0x1f || compressed[1] != 0x8b) {
        return 1;
    }

    std::array<char, 256> inflated{};
    z_stream inflater{};
    if (inflateInit2(&inflater, 15 + 16) != Z_OK) {
        return 1;
    }
    inflater.next_in = compressed.data();
    inflater.avail_in = static_cast<uInt>(compressed_size);
    inflater.next_out = reinterpret_cast<Bytef *>(inflated.data());
    inflater.avail_out = static_cast<uInt>(inflated.size());
    const int inflate_rc = inflate(&inflater, Z_FINISH);
    const size_t inflated_size = inflated.size() - inflater.avail_out;
    inflateEnd(&inflater);
    if (inflate_rc != Z_STREAM_END ||
        std::string_view(inflated.data(), inflated_size) != text) {
        return 1;
    }

    // CLI11: parse a repeatable option.
    CLI::App app{"smoke"};
    std::vector<std::string> packages;
    app.add_option("--python-package", packages);
    std::array<const char *, 5> argv{"smoke", "--python-package", "boto", "--python-package",
                                     "botocore"};
    try {
        app.parse(static_cast<int>(argv.size()), argv.data());
    } catch (const CLI::ParseError &) {
        return 1;
    }
    if (packages.size() != 2) {
        return 1;
    }

    return 0;
}
