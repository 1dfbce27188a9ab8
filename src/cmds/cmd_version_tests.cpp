#include "cmds/cmd_version.h"

#include "doctest/doctest.h"

#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = playpack::cmd_version::cfg;
  using expected_command = playpack::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version execute is callable") {
  playpack::cmd_version cmd{ playpack::cmd_version::cfg{} };
  CHECK_NOTHROW(cmd.execute());
}
