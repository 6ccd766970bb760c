#include "r3load/hot_module_registry.hpp"

#include <utility>

namespace r3::load {

hot_module_registry::hot_module_registry() : log_(redlog::get_logger("r3.load.registry")) {}

hot_module_registry::~hot_module_registry() { close_all(); }

result<std::shared_ptr<hot_module>> hot_module_registry::open(const hot_module_config& config) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = modules_.find(config.lib_name);
  if (existing != modules_.end()) {
    log_.dbg("module already open", redlog::field("name", config.lib_name));
    return ok_result(existing->second);
  }

  auto opened = hot_module::open(config);
  if (!opened.ok()) {
    return error_result<std::shared_ptr<hot_module>>(opened.status);
  }

  std::shared_ptr<hot_module> module(std::move(opened.value));
  modules_.emplace(config.lib_name, module);
  log_.vrb("module registered", redlog::field("name", config.lib_name), redlog::field("count", modules_.size()));
  return ok_result(std::move(module));
}

std::shared_ptr<hot_module> hot_module_registry::get(const std::string& lib_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = modules_.find(lib_name);
  return it == modules_.end() ? nullptr : it->second;
}

bool hot_module_registry::close(const std::string& lib_name) {
  std::shared_ptr<hot_module> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = modules_.find(lib_name);
    if (it == modules_.end()) {
      return false;
    }
    removed = std::move(it->second);
    modules_.erase(it);
  }

  // joins the module threads outside the registry lock
  removed->stop();
  log_.vrb("module closed", redlog::field("name", lib_name));
  return true;
}

void hot_module_registry::close_all() {
  std::map<std::string, std::shared_ptr<hot_module>> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed.swap(modules_);
  }
  for (auto& [name, module] : removed) {
    module->stop();
  }
}

std::vector<std::string> hot_module_registry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(modules_.size());
  for (const auto& [name, module] : modules_) {
    names.push_back(name);
  }
  return names;
}

size_t hot_module_registry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return modules_.size();
}

} // namespace r3::load
