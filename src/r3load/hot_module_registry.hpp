#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "r3load/config.hpp"
#include "r3load/hot_module.hpp"
#include "r3load/result.hpp"

namespace r3::load {

// application-wide set of hot modules keyed by library name
class hot_module_registry {
public:
  hot_module_registry();
  ~hot_module_registry();

  hot_module_registry(const hot_module_registry&) = delete;
  hot_module_registry& operator=(const hot_module_registry&) = delete;

  // opens the module, or returns the one already registered under config.lib_name
  result<std::shared_ptr<hot_module>> open(const hot_module_config& config);

  std::shared_ptr<hot_module> get(const std::string& lib_name) const;

  // false if nothing was registered under the name
  bool close(const std::string& lib_name);
  void close_all();

  std::vector<std::string> list() const;
  size_t size() const;

private:
  redlog::logger log_;
  mutable std::mutex mutex_{};
  std::map<std::string, std::shared_ptr<hot_module>> modules_{};
};

} // namespace r3::load
