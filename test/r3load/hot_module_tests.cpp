#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "r3load/hot_function.hpp"
#include "r3load/hot_module.hpp"
#include "test_support.hpp"

namespace {

namespace t = r3::load::test;

using r3::load::update_phase;

std::unique_ptr<r3::load::hot_module> open_with(
    const std::filesystem::path& dir, const std::filesystem::path& fixture
) {
  t::install_file(fixture, t::artifact_path(dir));
  auto opened = r3::load::hot_module::open(t::fast_config(dir));
  REQUIRE(opened.ok());
  return std::move(opened.value);
}

int current_version(const r3::load::hot_module& module) {
  r3::load::hot_function<int()> version(module, "r3_fixture_version");
  auto result = version();
  REQUIRE(result.ok());
  return result.value;
}

} // namespace

TEST_CASE("r3load hot module counts reloads and flags each one once") {
  t::temp_dir dir;
  auto module = open_with(dir.path(), t::fixture_v1());

  CHECK(module->version() == 0);
  CHECK_FALSE(module->take_was_updated());
  CHECK(current_version(*module) == 1);

  t::install_file(t::fixture_v2(), t::artifact_path(dir.path()));
  REQUIRE(t::wait_until([&] { return module->version() == 1; }, t::kSignalTimeout));
  CHECK(module->take_was_updated());
  CHECK_FALSE(module->take_was_updated());
  CHECK(current_version(*module) == 2);

  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));
  REQUIRE(t::wait_until([&] { return module->version() == 2; }, t::kSignalTimeout));
  CHECK(module->take_was_updated());
  CHECK(current_version(*module) == 1);
}

TEST_CASE("r3load hot module holds the swap until the observer releases its token") {
  t::temp_dir dir;
  auto module = open_with(dir.path(), t::fixture_v1());
  auto observer = module->subscribe();

  t::install_file(t::fixture_v2(), t::artifact_path(dir.path()));
  auto token = observer.wait_for_about_to_reload_for(t::kSignalTimeout);
  REQUIRE(token.has_value());
  REQUIRE(token->active());

  std::this_thread::sleep_for(t::kQuietPeriod);
  CHECK(module->phase() == update_phase::announcing);
  CHECK(module->version() == 0);
  CHECK(current_version(*module) == 1);

  token.reset();
  CHECK(observer.wait_for_reload_for(t::kSignalTimeout));
  CHECK(module->version() == 1);
  CHECK(current_version(*module) == 2);
}

TEST_CASE("r3load hot module lets observers carry state across a reload") {
  t::temp_dir dir;
  auto module = open_with(dir.path(), t::fixture_v1());
  auto observer = module->subscribe();

  r3::load::hot_function<void(int)> set_counter(*module, "r3_fixture_set_counter");
  r3::load::hot_function<int()> get_counter(*module, "r3_fixture_get_counter");
  REQUIRE(set_counter(17).ok());

  std::atomic<int> restored{-1};
  std::thread client([&] {
    int saved = 0;
    {
      auto token = observer.wait_for_about_to_reload_for(t::kSignalTimeout);
      if (!token) {
        return;
      }
      auto value = get_counter();
      if (value.ok()) {
        saved = value.value;
      }
    }
    if (observer.wait_for_reload_for(t::kSignalTimeout)) {
      if (set_counter(saved).ok()) {
        auto value = get_counter();
        restored.store(value.ok() ? value.value : -2);
      }
    }
  });

  t::install_file(t::fixture_v2(), t::artifact_path(dir.path()));
  client.join();

  CHECK(restored.load() == 17);
  CHECK(current_version(*module) == 2);
}

TEST_CASE("r3load hot module waits for shared access before swapping") {
  t::temp_dir dir;
  auto module = open_with(dir.path(), t::fixture_v1());

  std::optional<r3::load::hot_module::access> held;
  held.emplace(module->read());
  CHECK(held->is_loaded());
  CHECK(held->load_counter() == 0);

  t::install_file(t::fixture_v2(), t::artifact_path(dir.path()));
  REQUIRE(t::wait_until(
      [&] { return module->phase() == update_phase::acquiring_exclusive_access; }, t::kSignalTimeout
  ));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK(module->version() == 0);

  held.reset();
  REQUIRE(t::wait_until([&] { return module->version() == 1; }, t::kSignalTimeout));
  CHECK(module->read().load_counter() == 1);
}

TEST_CASE("r3load hot module lookups during a swap see the old or the new library") {
  t::temp_dir dir;
  auto module = open_with(dir.path(), t::fixture_v1());
  r3::load::hot_function<int()> version(*module, "r3_fixture_version");

  std::atomic<bool> stop{false};
  std::atomic<int> failures{0};
  std::atomic<int> calls{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        auto result = version();
        if (!result.ok() || (result.value != 1 && result.value != 2)) {
          failures.fetch_add(1);
        }
        calls.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    });
  }

  t::install_file(t::fixture_v2(), t::artifact_path(dir.path()));
  bool reloaded = t::wait_until([&] { return module->version() == 1; }, t::kSignalTimeout);

  stop.store(true);
  for (auto& reader : readers) {
    reader.join();
  }

  CHECK(reloaded);
  CHECK(calls.load() > 0);
  CHECK(failures.load() == 0);
  CHECK(current_version(*module) == 2);
}

TEST_CASE("r3load hot module opened before the first build") {
  t::temp_dir dir;
  auto opened = r3::load::hot_module::open(t::fast_config(dir.path()));
  REQUIRE(opened.ok());
  auto& module = *opened.value;

  r3::load::hot_function<int()> version(module, "r3_fixture_version");
  auto early = version();
  CHECK(early.status.code == r3::load::error_code::library_not_loaded);
  CHECK_FALSE(module.read().is_loaded());

  t::install_file(t::fixture_v1(), t::artifact_path(dir.path()));
  REQUIRE(t::wait_until([&] { return module.version() == 1; }, t::kSignalTimeout));
  CHECK(current_version(module) == 1);
}

TEST_CASE("r3load hot module stop halts reloading") {
  t::temp_dir dir;
  auto module = open_with(dir.path(), t::fixture_v1());

  module->stop();
  CHECK(module->phase() == update_phase::idle);

  t::install_file(t::fixture_v2(), t::artifact_path(dir.path()));
  std::this_thread::sleep_for(t::kQuietPeriod);
  CHECK(module->version() == 0);
  CHECK(current_version(*module) == 1);
}

TEST_CASE("r3load hot module open reports construction errors") {
  t::temp_dir dir;
  auto opened = r3::load::hot_module::open(t::fast_config(dir.path() / "nowhere"));
  CHECK_FALSE(opened.ok());
  CHECK(opened.status.code == r3::load::error_code::not_found);
  CHECK(opened.value == nullptr);
}
