#pragma once

#include <cstdint>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace r3::util {

/**
 * @brief Cross-platform helpers for dynamic library naming and process identity
 */
namespace platform_utils {

/**
 * @brief Get the file name prefix the platform toolchains put in front of dynamic libraries
 * @return "lib" on unix-like systems, empty on Windows
 */
inline std::string get_library_prefix() {
#ifdef _WIN32
  return "";
#else
  return "lib";
#endif
}

/**
 * @brief Get the appropriate dynamic library file extension for the current platform
 * @return Library extension including the dot (e.g., ".dylib", ".so", ".dll")
 */
inline std::string get_library_extension() {
#ifdef __APPLE__
  return ".dylib";
#elif defined(__linux__)
  return ".so";
#elif defined(_WIN32)
  return ".dll";
#else
#error "Unsupported platform for dynamic library loading"
#endif
}

/**
 * @brief Build the file name a toolchain produces for a library base name
 * @param lib_name Library name without prefix or extension (e.g., "game")
 * @return Platform file name (e.g., "libgame.so")
 */
inline std::string library_file_name(const std::string& lib_name) {
  return get_library_prefix() + lib_name + get_library_extension();
}

inline uint64_t current_process_id() {
#ifdef _WIN32
  return static_cast<uint64_t>(GetCurrentProcessId());
#else
  return static_cast<uint64_t>(getpid());
#endif
}

} // namespace platform_utils
} // namespace r3::util
