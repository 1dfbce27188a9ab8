#include "platform.h"

#include "doctest/doctest.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

namespace playpack {

TEST_CASE("platform::get_exe_path returns valid path") {
  auto const path{ platform::get_exe_path() };

  CHECK(!path.empty());
  CHECK(path.is_absolute());
  CHECK(std::filesystem::exists(path));
  CHECK(std::filesystem::is_regular_file(path));
}

TEST_CASE("platform::make_private_temp_dir creates unique owner-only directories") {
  auto const parent{ std::filesystem::temp_directory_path() };
  auto const first{ platform::make_private_temp_dir(parent, "playpack-platform-") };
  auto const second{ platform::make_private_temp_dir(parent, "playpack-platform-") };

  CHECK(first != second);
  CHECK(std::filesystem::is_directory(first));
  CHECK(first.filename().string().rfind("playpack-platform-", 0) == 0);

  auto const perms{ std::filesystem::status(first).permissions() };
  CHECK(perms == std::filesystem::perms::owner_all);

  std::filesystem::remove_all(first);
  std::filesystem::remove_all(second);
}

TEST_CASE("platform::make_private_temp_dir throws for missing parent") {
  CHECK_THROWS(platform::make_private_temp_dir("/nonexistent/playpack/parent", "x-"));
}

TEST_CASE("platform::make_temp_file creates unique owner-only files") {
  auto const dir{ platform::make_private_temp_dir(std::filesystem::temp_directory_path(),
                                                  "playpack-tmpfile-") };
  auto const first{ platform::make_temp_file(dir, ".site.run.") };
  auto const second{ platform::make_temp_file(dir, ".site.run.") };

  CHECK(first.path != second.path);
  CHECK(first.path.parent_path() == dir);
  CHECK(first.path.filename().string().rfind(".site.run.", 0) == 0);
  CHECK(std::filesystem::is_regular_file(first.path));
  CHECK(std::filesystem::status(first.path).permissions() ==
        (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));
  CHECK(::write(first.fd, "x", 1) == 1);
  CHECK(std::filesystem::file_size(first.path) == 1);

  ::close(first.fd);
  ::close(second.fd);
  std::filesystem::remove_all(dir);
}

TEST_CASE("platform::make_temp_file throws for missing parent") {
  CHECK_THROWS_AS(platform::make_temp_file("/nonexistent/playpack/parent", "x-"),
                  std::system_error);
}

TEST_CASE("platform::set_file_times sets atime and mtime") {
  auto const dir{ platform::make_private_temp_dir(std::filesystem::temp_directory_path(),
                                                  "playpack-times-") };
  auto const file{ dir / "f.txt" };
  std::ofstream{ file } << "x";

  platform::set_file_times(file, 946684800);
  platform::set_file_times(dir, 946684800);

  struct stat st{};
  REQUIRE(::stat(file.c_str(), &st) == 0);
  CHECK(st.st_mtime == 946684800);
  CHECK(st.st_atime == 946684800);

  REQUIRE(::stat(dir.c_str(), &st) == 0);
  CHECK(st.st_mtime == 946684800);

  std::filesystem::remove_all(dir);
}

TEST_CASE("platform::env_var_get treats empty as unset") {
  ::setenv("PLAYPACK_PLATFORM_TEST_VAR", "", 1);
  CHECK_FALSE(platform::env_var_get("PLAYPACK_PLATFORM_TEST_VAR").has_value());

  ::setenv("PLAYPACK_PLATFORM_TEST_VAR", "value", 1);
  auto const value{ platform::env_var_get("PLAYPACK_PLATFORM_TEST_VAR") };
  REQUIRE(value.has_value());
  CHECK(*value == "value");

  ::unsetenv("PLAYPACK_PLATFORM_TEST_VAR");
}

}  // namespace playpack
