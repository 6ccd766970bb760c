#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <redlog.hpp>

#include "r3load/result.hpp"

namespace r3::load {

/**
 * @brief Exclusive owner of one opened dynamic library
 *
 * Opened with immediate binding and local symbol visibility so two versions of the same library can coexist while a
 * swap is in progress. The destructor closes the library if close() was not called.
 */
class library_handle {
public:
  ~library_handle();

  library_handle(const library_handle&) = delete;
  library_handle& operator=(const library_handle&) = delete;

  static result<std::unique_ptr<library_handle>> open(const std::filesystem::path& path);

  // releases the module; the backing file may be deleted afterwards
  status close();

  // raw address of an exported symbol
  result<void*> symbol(std::string_view name) const;

  // the caller asserts the symbol type; nothing here can verify it
  template <typename T> result<T> symbol_as(std::string_view name) const {
    auto raw = symbol(name);
    if (!raw.ok()) {
      return error_result<T>(raw.status);
    }
    return ok_result(reinterpret_cast<T>(raw.value));
  }

  bool is_open() const noexcept { return native_ != nullptr; }
  const std::filesystem::path& path() const noexcept { return path_; }

private:
  library_handle(void* native, std::filesystem::path path);

  void* native_ = nullptr;
  std::filesystem::path path_{};
  redlog::logger log_;
};

} // namespace r3::load
