#include "r3base/env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>

namespace r3::util {
namespace {

auto log_env = redlog::get_logger("r3.util.env");

void warn_unparsed(const std::string& env_name, const char* type_name, const std::exception& e) {
  log_env.wrn(
      "failed to parse setting, using default", redlog::field("name", env_name), redlog::field("type", type_name),
      redlog::field("error", e.what())
  );
}

} // namespace

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

bool env_config::has(const std::string& name) const { return !trim(get_env_value(name)).empty(); }

std::string env_config::to_lower(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return result;
}

std::string env_config::trim(const std::string& str) {
  size_t first = str.find_first_not_of(' ');
  if (std::string::npos == first) {
    return {};
  }
  size_t last = str.find_last_not_of(' ');
  return str.substr(first, (last - first + 1));
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  return (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on");
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    warn_unparsed(build_env_name(name), "int", e);
    return default_value;
  }
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoull(value);
  } catch (const std::exception& e) {
    warn_unparsed(build_env_name(name), "uint64_t", e);
    return default_value;
  }
}

std::chrono::milliseconds env_config::get_millis(
    const std::string& name, std::chrono::milliseconds default_value
) const {
  const auto fallback = static_cast<uint64_t>(default_value.count());
  const auto value = get<uint64_t>(name, fallback);
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
}

} // namespace r3::util
