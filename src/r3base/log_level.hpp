#pragma once

#include <redlog.hpp>

#include "r3base/env_config.hpp"

namespace r3::util {

inline redlog::level level_from_verbosity(int count) {
  if (count <= 0) {
    return redlog::level::info;
  }
  if (count == 1) {
    return redlog::level::verbose;
  }
  if (count == 2) {
    return redlog::level::trace;
  }
  if (count == 3) {
    return redlog::level::debug;
  }
  return redlog::level::pedantic;
}

// applies R3LOAD_VERBOSE=<count> when set, otherwise leaves the current level alone
inline void apply_env_verbosity() {
  env_config env("R3LOAD");
  if (!env.has("VERBOSE")) {
    return;
  }
  redlog::set_level(level_from_verbosity(env.get<int>("VERBOSE", 0)));
}

} // namespace r3::util
