#include "requirements.h"

#include "build_config.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <string>

TEST_CASE("compose_runtime_requirements leaves ansible unpinned by default") {
  CHECK(playpack::compose_runtime_requirements(std::nullopt, {}) == "ansible\n");
}

TEST_CASE("compose_runtime_requirements pins version and keeps package order") {
  auto const manifest{ playpack::compose_runtime_requirements(
      "2.14.1",
      { "boto==1.2.0", "botocore==3.1.0" }) };
  CHECK(manifest == "ansible==2.14.1\nboto==1.2.0\nbotocore==3.1.0\n");
}

TEST_CASE("compose_runtime_requirements passes specifiers through verbatim") {
  auto const manifest{ playpack::compose_runtime_requirements(
      std::nullopt,
      { "requests>=2,<3", "jmespath" }) };
  CHECK(manifest == "ansible\nrequests>=2,<3\njmespath\n");
}

TEST_CASE("write_runtime_requirements writes requirements.txt") {
  playpack::test::temp_dir tmp{ "reqs" };
  playpack::build_config cfg;
  cfg.ansible_version = "9.1.0";
  cfg.python_packages = { "netaddr" };

  playpack::write_runtime_requirements(tmp.path(), cfg);

  CHECK(playpack::util_load_text(tmp / "requirements.txt") == "ansible==9.1.0\nnetaddr\n");
}
