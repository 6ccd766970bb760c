#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "r3load/hot_function.hpp"
#include "r3load/hot_module_registry.hpp"
#include "test_support.hpp"

namespace {

namespace t = r3::load::test;

} // namespace

TEST_CASE("r3load registry returns the same module for the same name") {
  t::temp_dir dir;
  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));
  r3::load::hot_module_registry registry;

  auto first = registry.open(t::fast_config(dir.path()));
  auto second = registry.open(t::fast_config(dir.path()));
  REQUIRE(first.ok());
  REQUIRE(second.ok());
  CHECK(first.value == second.value);
  CHECK(registry.size() == 1);
  CHECK(registry.get("game") == first.value);
}

TEST_CASE("r3load registry keeps modules apart by name") {
  t::temp_dir dir;
  t::install_file(t::fixture_v1(), t::artifact_path(dir.path(), "game"));
  t::install_file(t::fixture_v2(), t::artifact_path(dir.path(), "tools"));
  r3::load::hot_module_registry registry;

  REQUIRE(registry.open(t::fast_config(dir.path(), "game")).ok());
  REQUIRE(registry.open(t::fast_config(dir.path(), "tools")).ok());
  const std::vector<std::string> expected{"game", "tools"};
  CHECK(registry.list() == expected);

  auto tools = registry.get("tools");
  REQUIRE(tools != nullptr);
  r3::load::hot_function<int()> version(*tools, "r3_fixture_version");
  auto current = version();
  REQUIRE(current.ok());
  CHECK(current.value == 2);
}

TEST_CASE("r3load registry close removes the module") {
  t::temp_dir dir;
  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));
  r3::load::hot_module_registry registry;
  auto opened = registry.open(t::fast_config(dir.path()));
  REQUIRE(opened.ok());

  CHECK(registry.close("game"));
  CHECK_FALSE(registry.close("game"));
  CHECK(registry.get("game") == nullptr);
  CHECK(registry.size() == 0);

  // a handle obtained earlier stays usable after the registry lets go
  CHECK(opened.value->read().is_loaded());
}

TEST_CASE("r3load registry does not keep modules that failed to open") {
  t::temp_dir dir;
  r3::load::hot_module_registry registry;

  auto opened = registry.open(t::fast_config(dir.path() / "missing"));
  CHECK_FALSE(opened.ok());
  CHECK(opened.status.code == r3::load::error_code::not_found);
  CHECK(registry.size() == 0);
  CHECK(registry.list().empty());
}
