#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "r3load/hot_module.hpp"
#include "r3load/result.hpp"

namespace r3::load {

template <typename Signature> class hot_function;

/**
 * @brief Callable bound to an exported function by name
 *
 * Every call takes shared access to the module, resolves the symbol in whatever version is loaded at that moment and
 * invokes it, so a call never straddles a swap. The signature is asserted by the caller and cannot be checked.
 * Returns result<R>, or a plain status for void functions.
 */
template <typename R, typename... Args> class hot_function<R(Args...)> {
public:
  using pointer = R (*)(Args...);
  using return_type = std::conditional_t<std::is_void_v<R>, status, result<R>>;

  hot_function(const hot_module& module, std::string symbol) : module_(&module), symbol_(std::move(symbol)) {}

  return_type operator()(Args... args) const {
    auto access = module_->read();
    auto fn = access.template get_symbol<pointer>(symbol_);
    if constexpr (std::is_void_v<R>) {
      if (!fn.ok()) {
        return fn.status;
      }
      fn.value(std::forward<Args>(args)...);
      return ok_status();
    } else {
      if (!fn.ok()) {
        return error_result<R>(fn.status);
      }
      return ok_result<R>(fn.value(std::forward<Args>(args)...));
    }
  }

  // true when the current library version exports the symbol
  bool available() const {
    auto access = module_->read();
    return access.template get_symbol<void*>(symbol_).ok();
  }

  const std::string& symbol() const noexcept { return symbol_; }

private:
  const hot_module* module_;
  std::string symbol_;
};

// startup-populated list of the exports a host relies on
class symbol_table {
public:
  explicit symbol_table(const hot_module& module) : module_(&module) {}

  symbol_table& add(std::string symbol) {
    symbols_.push_back(std::move(symbol));
    return *this;
  }

  template <typename Signature> hot_function<Signature> bind(std::string symbol) {
    add(symbol);
    return hot_function<Signature>(*module_, std::move(symbol));
  }

  // bound names the currently loaded version does not export (all of them when nothing is loaded)
  std::vector<std::string> missing() const {
    std::vector<std::string> absent;
    auto access = module_->read();
    for (const auto& symbol : symbols_) {
      if (!access.get_symbol<void*>(symbol).ok()) {
        absent.push_back(symbol);
      }
    }
    return absent;
  }

  const std::vector<std::string>& symbols() const noexcept { return symbols_; }

private:
  const hot_module* module_;
  std::vector<std::string> symbols_{};
};

} // namespace r3::load
