#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("playpack-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

void write_dummy_file(std::filesystem::path const &path) {
  std::ofstream out{ path };
  out << "playpack-test";
}

}  // namespace

TEST_CASE("util_format_bytes uses integer for bytes") {
  CHECK(playpack::util_format_bytes(0) == "0B");
  CHECK(playpack::util_format_bytes(1) == "1B");
  CHECK(playpack::util_format_bytes(1023) == "1023B");
}

TEST_CASE("util_format_bytes scales to KB/MB") {
  constexpr std::uint64_t kMB{ 1024ull * 1024ull };

  CHECK(playpack::util_format_bytes(1024) == "1.00KB");
  CHECK(playpack::util_format_bytes(1536) == "1.50KB");
  CHECK(playpack::util_format_bytes(kMB) == "1.00MB");
  CHECK(playpack::util_format_bytes(5 * kMB * 1024ull) == "5.00GB");
}

TEST_CASE("util_count_lines counts newline characters") {
  CHECK(playpack::util_count_lines("") == 0);
  CHECK(playpack::util_count_lines("no newline") == 0);
  CHECK(playpack::util_count_lines("one\n") == 1);
  CHECK(playpack::util_count_lines("#!/bin/sh\nA=1\n\nB=2\n") == 4);
  CHECK(playpack::util_count_lines("trailing\nno end") == 1);
}

TEST_CASE("scoped_path_cleanup removes file on destruction") {
  auto path = make_temp_path("cleanup");
  write_dummy_file(path);
  REQUIRE(std::filesystem::exists(path));
  {
    playpack::scoped_path_cleanup cleanup{ path };
    CHECK(std::filesystem::exists(path));
  }
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto dir = make_temp_path("tree");
  std::filesystem::create_directories(dir / "a" / "b");
  write_dummy_file(dir / "a" / "b" / "c.txt");
  {
    playpack::scoped_path_cleanup cleanup{ dir };
  }
  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("scoped_path_cleanup release keeps the path") {
  auto path = make_temp_path("release");
  write_dummy_file(path);
  {
    playpack::scoped_path_cleanup cleanup{ path };
    cleanup.release();
    CHECK(cleanup.path().empty());
  }
  CHECK(std::filesystem::exists(path));
  std::filesystem::remove(path);
}

TEST_CASE("util_load_file loads empty file") {
  auto path = make_temp_path("empty");
  std::ofstream{ path };  // Create empty file
  playpack::scoped_path_cleanup cleanup{ path };

  auto data = playpack::util_load_file(path);
  CHECK(data.empty());
}

TEST_CASE("util_load_file throws on missing file") {
  CHECK_THROWS_AS(playpack::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("util_write_file and util_load_text preserve content") {
  auto path = make_temp_path("text");
  playpack::scoped_path_cleanup cleanup{ path };

  playpack::util_write_file(path, "ansible==2.14.1\nboto==1.2.0\n");
  CHECK(playpack::util_load_text(path) == "ansible==2.14.1\nboto==1.2.0\n");

  playpack::util_write_file(path, "short");
  CHECK(playpack::util_load_text(path) == "short");
}

TEST_CASE("util_is_readable reports existence and readability") {
  auto path = make_temp_path("readable");
  CHECK_FALSE(playpack::util_is_readable(path));

  write_dummy_file(path);
  playpack::scoped_path_cleanup cleanup{ path };
  CHECK(playpack::util_is_readable(path));
}
