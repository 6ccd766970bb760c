#include "r3load/hot_module.hpp"

#include <utility>

namespace r3::load {

hot_module::hot_module(std::string name, std::shared_ptr<module_state> state, std::unique_ptr<update_loop> loop)
    : name_(std::move(name)), state_(std::move(state)), loop_(std::move(loop)),
      log_(redlog::get_logger("r3.load.module")) {}

hot_module::~hot_module() { stop(); }

result<std::unique_ptr<hot_module>> hot_module::open(const hot_module_config& config) {
  auto log = redlog::get_logger("r3.load.module");

  auto coordinator = reload_coordinator::create(config);
  if (!coordinator.ok()) {
    log.err(
        "failed to open hot module", redlog::field("name", config.lib_name),
        redlog::field("code", error_code_name(coordinator.status.code)),
        redlog::field("error", coordinator.status.message)
    );
    return error_result<std::unique_ptr<hot_module>>(coordinator.status);
  }

  auto state = std::make_shared<module_state>();
  state->coordinator = std::move(coordinator.value);

  auto changes = state->coordinator->subscribe_to_file_changes();
  auto loop = std::make_unique<update_loop>(state, std::move(changes), config.lock_retry_delay);
  loop->start();

  log.inf(
      "hot module opened", redlog::field("name", config.lib_name),
      redlog::field("watched", state->coordinator->watched_path().string()),
      redlog::field("loaded", state->coordinator->is_loaded())
  );
  return ok_result(std::unique_ptr<hot_module>(new hot_module(config.lib_name, std::move(state), std::move(loop))));
}

void hot_module::stop() {
  if (loop_) {
    loop_->stop();
  }
  if (state_ && state_->coordinator) {
    state_->coordinator->stop_watching();
  }
  log_.dbg("hot module stopped", redlog::field("name", name_));
}

} // namespace r3::load
