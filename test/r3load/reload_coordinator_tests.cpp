#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <system_error>

#include "r3base/crc32.hpp"
#include "r3base/platform_utils.hpp"
#include "r3load/reload_coordinator.hpp"
#include "test_support.hpp"

namespace {

using version_fn = int (*)();

namespace t = r3::load::test;

int loaded_version(const r3::load::reload_coordinator& coordinator) {
  auto fn = coordinator.get_symbol<version_fn>("r3_fixture_version");
  REQUIRE(fn.ok());
  return fn.value();
}

bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

} // namespace

TEST_CASE("r3load coordinator rejects invalid configuration") {
  r3::load::hot_module_config config{};
  auto created = r3::load::reload_coordinator::create(config);
  CHECK_FALSE(created.ok());
  CHECK(created.status.code == r3::load::error_code::invalid_argument);
}

TEST_CASE("r3load coordinator fails when the library directory cannot be found") {
  t::temp_dir dir;
  auto created = r3::load::reload_coordinator::create(t::fast_config(dir.path() / "missing"));
  CHECK_FALSE(created.ok());
  CHECK(created.status.code == r3::load::error_code::not_found);
}

TEST_CASE("r3load coordinator loads an existing artifact from a private copy") {
  t::temp_dir dir;
  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));

  auto created = r3::load::reload_coordinator::create(t::fast_config(dir.path()));
  REQUIRE(created.ok());
  auto& coordinator = *created.value;

  CHECK(coordinator.is_loaded());
  CHECK(coordinator.load_counter() == 0);
  CHECK(coordinator.loaded_path().filename().string() ==
        "game-hot-0" + r3::util::platform_utils::get_library_extension());
  CHECK(file_exists(coordinator.loaded_path()));
  CHECK(coordinator.loaded_path() != coordinator.watched_path());
  CHECK(coordinator.fingerprint() == r3::util::hash_file(coordinator.watched_path()));
  CHECK(loaded_version(coordinator) == 1);

  auto no_change = coordinator.update();
  REQUIRE(no_change.ok());
  CHECK_FALSE(no_change.value);
}

TEST_CASE("r3load coordinator names the loaded copy from a custom template") {
  t::temp_dir dir;
  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));

  auto config = t::fast_config(dir.path());
  config.loaded_name_template = "{lib_name}-{load_counter}-{pid}";
  auto created = r3::load::reload_coordinator::create(config);
  REQUIRE(created.ok());

  auto expected = "game-0-" + std::to_string(r3::util::platform_utils::current_process_id()) +
                  r3::util::platform_utils::get_library_extension();
  CHECK(created.value->loaded_path().filename().string() == expected);
}

TEST_CASE("r3load coordinator follows an artifact from absence through two builds") {
  t::temp_dir dir;
  auto artifact = t::artifact_path(dir.path());

  auto created = r3::load::reload_coordinator::create(t::fast_config(dir.path()));
  REQUIRE(created.ok());
  auto& coordinator = *created.value;
  auto changes = coordinator.subscribe_to_file_changes();

  CHECK_FALSE(coordinator.is_loaded());
  auto early = coordinator.get_symbol<version_fn>("r3_fixture_version");
  CHECK(early.status.code == r3::load::error_code::library_not_loaded);

  t::install_file(t::fixture_v1(), artifact);
  REQUIRE(changes.recv_for(t::kSignalTimeout).has_value());
  auto first = coordinator.update();
  REQUIRE(first.ok());
  CHECK(first.value);
  CHECK(coordinator.load_counter() == 1);
  CHECK(loaded_version(coordinator) == 1);
  auto first_copy = coordinator.loaded_path();

  t::install_file(t::fixture_v2(), artifact);
  REQUIRE(changes.recv_for(t::kSignalTimeout).has_value());
  auto second = coordinator.update();
  REQUIRE(second.ok());
  CHECK(second.value);
  CHECK(coordinator.load_counter() == 2);
  CHECK(loaded_version(coordinator) == 2);
  CHECK(coordinator.fingerprint() == r3::util::hash_file(artifact));

  CHECK_FALSE(file_exists(first_copy));
  CHECK(file_exists(coordinator.loaded_path()));

  auto idle = coordinator.update();
  REQUIRE(idle.ok());
  CHECK_FALSE(idle.value);
}

TEST_CASE("r3load coordinator is left without a library when a reload fails") {
  t::temp_dir dir;
  auto artifact = t::artifact_path(dir.path());
  t::install_file(t::fixture_v1(), artifact);

  auto created = r3::load::reload_coordinator::create(t::fast_config(dir.path()));
  REQUIRE(created.ok());
  auto& coordinator = *created.value;
  auto changes = coordinator.subscribe_to_file_changes();
  REQUIRE(coordinator.is_loaded());

  t::install_bytes("this is not a loadable library", artifact);
  REQUIRE(changes.recv_for(t::kSignalTimeout).has_value());
  auto failed = coordinator.update();
  CHECK_FALSE(failed.ok());
  CHECK(failed.status.code == r3::load::error_code::load_error);

  // the previous version was already closed before the new one failed to open
  CHECK_FALSE(coordinator.is_loaded());
  auto lookup = coordinator.get_symbol<version_fn>("r3_fixture_version");
  CHECK(lookup.status.code == r3::load::error_code::library_not_loaded);

  t::install_file(t::fixture_v2(), artifact);
  REQUIRE(changes.recv_for(t::kSignalTimeout).has_value());
  auto recovered = coordinator.update();
  REQUIRE(recovered.ok());
  CHECK(recovered.value);
  CHECK(loaded_version(coordinator) == 2);
}

TEST_CASE("r3load coordinator unloads when the artifact disappears") {
  t::temp_dir dir;
  auto artifact = t::artifact_path(dir.path());
  t::install_file(t::fixture_v1(), artifact);

  auto created = r3::load::reload_coordinator::create(t::fast_config(dir.path()));
  REQUIRE(created.ok());
  auto& coordinator = *created.value;
  auto changes = coordinator.subscribe_to_file_changes();
  auto initial_copy = coordinator.loaded_path();

  // removal alone does not signal; the next build does
  std::filesystem::remove(artifact);
  CHECK_FALSE(changes.recv_for(t::kQuietPeriod).has_value());

  t::install_file(t::fixture_v2(), artifact);
  REQUIRE(changes.recv_for(t::kSignalTimeout).has_value());
  std::filesystem::remove(artifact);

  auto updated = coordinator.update();
  REQUIRE(updated.ok());
  CHECK(updated.value);
  CHECK_FALSE(coordinator.is_loaded());
  CHECK_FALSE(file_exists(initial_copy));
}

TEST_CASE("r3load coordinator removes its loaded copy on destruction") {
  t::temp_dir dir;
  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));

  std::filesystem::path copy;
  {
    auto created = r3::load::reload_coordinator::create(t::fast_config(dir.path()));
    REQUIRE(created.ok());
    copy = created.value->loaded_path();
    CHECK(file_exists(copy));
  }
  CHECK_FALSE(file_exists(copy));
  CHECK(file_exists(t::artifact_path(dir.path())));
}
