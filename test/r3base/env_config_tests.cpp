#include <doctest/doctest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "r3base/env_config.hpp"
#include "r3base/log_level.hpp"
#include "test_env.hpp"

namespace {

enum class color { red, green, blue };

} // namespace

TEST_CASE("r3base env_config builds prefixed names") {
  r3::util::env_config env("R3TEST");
  CHECK(env.build_env_name("DEBOUNCE_MS") == "R3TEST_DEBOUNCE_MS");

  r3::util::env_config already_suffixed("R3TEST_");
  CHECK(already_suffixed.build_env_name("X") == "R3TEST_X");
}

TEST_CASE("r3base env_config reads typed values") {
  r3::test::scoped_env text("R3TEST_TEXT", "hello");
  r3::test::scoped_env flag("R3TEST_FLAG", "Yes");
  r3::test::scoped_env count("R3TEST_COUNT", " 42 ");
  r3::test::scoped_env big("R3TEST_BIG", "123456789012");

  r3::util::env_config env("R3TEST");
  CHECK(env.get<std::string>("TEXT", "default") == "hello");
  CHECK(env.get<bool>("FLAG", false));
  CHECK(env.get<int>("COUNT", 0) == 42);
  CHECK(env.get<uint64_t>("BIG", 0) == 123456789012ull);
  CHECK(env.has("TEXT"));
}

TEST_CASE("r3base env_config falls back to defaults") {
  r3::test::scoped_env bad("R3TEST_BAD_INT", "not-a-number");

  r3::util::env_config env("R3TEST");
  CHECK(env.get<int>("BAD_INT", 7) == 7);
  CHECK(env.get<int>("UNSET_INT", 9) == 9);
  CHECK(env.get<std::string>("UNSET_TEXT", "fallback") == "fallback");
  CHECK_FALSE(env.has("UNSET_TEXT"));
}

TEST_CASE("r3base env_config reads durations in milliseconds") {
  r3::test::scoped_env delay("R3TEST_DELAY_MS", "250");

  r3::util::env_config env("R3TEST");
  CHECK(env.get_millis("DELAY_MS", std::chrono::milliseconds(10)) == std::chrono::milliseconds(250));
  CHECK(env.get_millis("OTHER_MS", std::chrono::milliseconds(10)) == std::chrono::milliseconds(10));
}

TEST_CASE("r3base env_config maps enum names case-insensitively") {
  r3::test::scoped_env known("R3TEST_COLOR", "Green");
  r3::test::scoped_env unknown("R3TEST_OTHER_COLOR", "purple");

  r3::util::env_config env("R3TEST");
  const auto mapping = {
      std::pair<const char*, color>{"red", color::red},
      std::pair<const char*, color>{"green", color::green},
      std::pair<const char*, color>{"blue", color::blue},
  };
  CHECK(env.get_enum<color>(mapping, "COLOR", color::red) == color::green);
  CHECK(env.get_enum<color>(mapping, "OTHER_COLOR", color::blue) == color::blue);
}

TEST_CASE("r3base level_from_verbosity maps counts to levels") {
  CHECK(r3::util::level_from_verbosity(0) == redlog::level::info);
  CHECK(r3::util::level_from_verbosity(1) == redlog::level::verbose);
  CHECK(r3::util::level_from_verbosity(2) == redlog::level::trace);
  CHECK(r3::util::level_from_verbosity(3) == redlog::level::debug);
  CHECK(r3::util::level_from_verbosity(9) == redlog::level::pedantic);
}
