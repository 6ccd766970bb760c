#pragma once

#include <string>
#include <utility>

namespace r3::load {

// error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  not_found,
  copy_error,
  load_error,
  symbol_not_found,
  library_not_loaded,
  lock_contention,
  watch_error
};

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  ::r3::load::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status error) { return result<T>{T{}, std::move(error)}; }

inline const char* error_code_name(error_code code) {
  switch (code) {
    case error_code::ok:
      return "ok";
    case error_code::invalid_argument:
      return "invalid_argument";
    case error_code::not_found:
      return "not_found";
    case error_code::copy_error:
      return "copy_error";
    case error_code::load_error:
      return "load_error";
    case error_code::symbol_not_found:
      return "symbol_not_found";
    case error_code::library_not_loaded:
      return "library_not_loaded";
    case error_code::lock_contention:
      return "lock_contention";
    case error_code::watch_error:
      return "watch_error";
  }
  return "unknown";
}

} // namespace r3::load
