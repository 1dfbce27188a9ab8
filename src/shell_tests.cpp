#include "shell.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> sh(std::string const &script) {
  return { "/bin/sh", "-c", script };
}

std::vector<std::string> run_collect(std::string const &script,
                                     std::optional<fs::path> cwd = std::nullopt,
                                     playpack::shell_env_t env = playpack::shell_getenv()) {
  std::vector<std::string> lines;
  playpack::shell_run_cfg inv{ .on_stdout_line =
                                   [&](std::string_view line) { lines.emplace_back(line); },
                               .cwd = cwd,
                               .env = std::move(env) };
  auto const result{ playpack::shell_run(sh(script), inv) };
  REQUIRE(result.exit_code == 0);
  REQUIRE(!result.signal.has_value());
  return lines;
}

}  // namespace

TEST_CASE("shell_getenv captures PATH") {
  auto env{ playpack::shell_getenv() };
  REQUIRE(!env.empty());
  CHECK(env.find("PATH") != env.end());
}

TEST_CASE("shell_run executes multiple lines") {
  auto lines{ run_collect("echo first; printf 'second\\n'") };
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "first");
  CHECK(lines[1] == "second");
}

TEST_CASE("shell_run exposes custom environment variables") {
  auto env{ playpack::shell_getenv() };
  env["PLAYPACK_SHELL_TEST"] = "ok";
  auto lines{ run_collect("printf '%s\\n' \"$PLAYPACK_SHELL_TEST\"", std::nullopt, env) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "ok");
}

TEST_CASE("shell_run honors cwd") {
  auto const tmp{ fs::canonical(fs::temp_directory_path()) };
  auto lines{ run_collect("pwd", tmp) };
  REQUIRE(lines.size() == 1);
  CHECK(fs::path{ lines[0] } == tmp);
}

TEST_CASE("shell_run separates stdout and stderr") {
  std::vector<std::string> out;
  std::vector<std::string> err;
  playpack::shell_run_cfg inv{
    .on_stdout_line = [&](std::string_view line) { out.emplace_back(line); },
    .on_stderr_line = [&](std::string_view line) { err.emplace_back(line); },
    .env = playpack::shell_getenv()
  };
  auto const result{ playpack::shell_run(sh("echo to-out; echo to-err >&2"), inv) };
  CHECK(result.exit_code == 0);
  REQUIRE(out.size() == 1);
  REQUIRE(err.size() == 1);
  CHECK(out[0] == "to-out");
  CHECK(err[0] == "to-err");
}

TEST_CASE("shell_run surfaces non-zero exit codes") {
  playpack::shell_run_cfg inv{ .env = playpack::shell_getenv() };
  auto const result{ playpack::shell_run(sh("exit 7"), inv) };
  CHECK(result.exit_code == 7);
  CHECK(!result.signal.has_value());
}

TEST_CASE("shell_run reports terminating signals") {
  playpack::shell_run_cfg inv{ .env = playpack::shell_getenv() };
  auto const result{ playpack::shell_run(sh("kill -TERM $$"), inv) };
  REQUIRE(result.signal.has_value());
  CHECK(*result.signal == 15);
  CHECK(result.exit_code == 128 + 15);
}

TEST_CASE("shell_run delivers trailing partial lines") {
  auto lines{ run_collect("printf 'without-newline'") };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "without-newline");
}

TEST_CASE("shell_run reports exec failure as exit 127") {
  playpack::shell_run_cfg inv{ .env = playpack::shell_getenv() };
  auto const result{ playpack::shell_run({ "/nonexistent/playpack-binary" }, inv) };
  CHECK(result.exit_code == 127);
}

TEST_CASE("shell_run rejects empty argv") {
  playpack::shell_run_cfg inv{};
  CHECK_THROWS_AS(playpack::shell_run({}, inv), std::invalid_argument);
}

TEST_CASE("shell_run propagates callback exceptions") {
  playpack::shell_run_cfg inv{ .on_stdout_line =
                                   [](std::string_view) { throw std::runtime_error("test"); },
                               .env = playpack::shell_getenv() };
  CHECK_THROWS_AS(playpack::shell_run(sh("echo hi"), inv), std::runtime_error);
}
