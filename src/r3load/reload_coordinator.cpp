#include "r3load/reload_coordinator.hpp"

#include <system_error>
#include <utility>

#include "r3base/crc32.hpp"
#include "r3base/path_resolver.hpp"
#include "r3base/platform_utils.hpp"
#include "r3load/artifact_paths.hpp"

namespace r3::load {
namespace {

bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

} // namespace

reload_coordinator::reload_coordinator(const hot_module_config& config)
    : lib_name_(config.lib_name), name_template_(config.loaded_name_template),
      pid_(util::platform_utils::current_process_id()), shared_(std::make_shared<watch_state>()),
      log_(redlog::get_logger("r3.load.coordinator")) {}

reload_coordinator::~reload_coordinator() {
  stop_watching();

  if (handle_) {
    status closed = handle_->close();
    if (!closed.ok()) {
      log_.wrn("failed to close library on teardown", redlog::field("error", closed.message));
    }
    handle_.reset();
    remove_loaded_copy();
  }
}

result<std::unique_ptr<reload_coordinator>> reload_coordinator::create(const hot_module_config& config) {
  auto log = redlog::get_logger("r3.load.coordinator");

  status valid = config.validate();
  if (!valid.ok()) {
    return error_result<std::unique_ptr<reload_coordinator>>(valid);
  }

  auto resolved = util::resolve_in_ancestors(config.lib_dir);
  if (!resolved) {
    log.err("library directory not found", redlog::field("lib_dir", config.lib_dir.string()));
    return error_result<std::unique_ptr<reload_coordinator>>(
        error_code::not_found, "library directory not found: " + config.lib_dir.string()
    );
  }

  std::unique_ptr<reload_coordinator> coordinator(new reload_coordinator(config));

  std::error_code ec;
  auto canonical = std::filesystem::canonical(*resolved, ec);
  coordinator->lib_dir_ = ec ? *resolved : canonical;

  auto paths = compute_artifact_paths(
      coordinator->lib_dir_, coordinator->lib_name_, coordinator->load_counter_, coordinator->name_template_,
      coordinator->pid_
  );
  coordinator->watched_path_ = paths.watched;
  coordinator->loaded_path_ = paths.loaded;

  if (file_exists(coordinator->watched_path_)) {
    status loaded = coordinator->load_copy();
    if (!loaded.ok()) {
      return error_result<std::unique_ptr<reload_coordinator>>(loaded);
    }
  } else {
    log.dbg("library does not exist yet", redlog::field("path", coordinator->watched_path_.string()));
  }

  change_watcher_config watch_config{};
  watch_config.path = coordinator->watched_path_;
  watch_config.debounce = config.debounce;
  watch_config.rearm_delay = config.rearm_delay;
  watch_config.backend = config.watch_backend;
  watch_config.poll_interval = config.poll_interval;

  auto watcher = change_watcher::start(watch_config, coordinator->shared_);
  if (!watcher.ok()) {
    return error_result<std::unique_ptr<reload_coordinator>>(watcher.status);
  }
  coordinator->watcher_ = std::move(watcher.value);

  return ok_result(std::move(coordinator));
}

result<bool> reload_coordinator::update() {
  if (!shared_->changed.load(std::memory_order_acquire)) {
    return ok_result(false);
  }
  shared_->changed.store(false, std::memory_order_release);

  status reloaded = reload();
  if (!reloaded.ok()) {
    return error_result<bool>(reloaded);
  }
  return ok_result(true);
}

status reload_coordinator::reload() {
  log_.inf("reloading library", redlog::field("path", watched_path_.string()));

  // the old module goes away before the new one is confirmed
  if (handle_) {
    status closed = handle_->close();
    if (!closed.ok()) {
      log_.wrn("failed to close previous library", redlog::field("error", closed.message));
    }
    handle_.reset();
    remove_loaded_copy();
  }

  if (!file_exists(watched_path_)) {
    log_.wrn("library file is gone, nothing to load", redlog::field("path", watched_path_.string()));
    return ok_status();
  }

  ++load_counter_;
  loaded_path_ = compute_artifact_paths(lib_dir_, lib_name_, load_counter_, name_template_, pid_).loaded;
  return load_copy();
}

status reload_coordinator::load_copy() {
  log_.trc(
      "copying library", redlog::field("from", watched_path_.string()), redlog::field("to", loaded_path_.string())
  );

  std::error_code ec;
  std::filesystem::copy_file(watched_path_, loaded_path_, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    log_.err(
        "failed to copy library", redlog::field("from", watched_path_.string()),
        redlog::field("to", loaded_path_.string()), redlog::field("error", ec.message())
    );
    return make_status(
        error_code::copy_error, "failed to copy " + watched_path_.string() + " to " + loaded_path_.string() + ": " +
                                    ec.message()
    );
  }

  uint32_t crc = util::hash_file(loaded_path_);
  shared_->fingerprint.store(crc, std::memory_order_release);

  auto opened = library_handle::open(loaded_path_);
  if (!opened.ok()) {
    remove_loaded_copy();
    return opened.status;
  }
  handle_ = std::move(opened.value);

  log_.dbg(
      "library loaded", redlog::field("path", loaded_path_.string()), redlog::field("load_counter", load_counter_),
      redlog::field("crc32", crc)
  );
  return ok_status();
}

void reload_coordinator::remove_loaded_copy() {
  std::error_code ec;
  std::filesystem::remove(loaded_path_, ec);
  if (ec) {
    log_.wrn(
        "failed to remove loaded copy", redlog::field("path", loaded_path_.string()),
        redlog::field("error", ec.message())
    );
  }
}

result<void*> reload_coordinator::get_symbol_address(std::string_view name) const {
  return get_symbol<void*>(name);
}

receiver<change_signal> reload_coordinator::subscribe_to_file_changes() {
  auto [tx, rx] = make_channel<change_signal>();
  std::lock_guard<std::mutex> lock(shared_->subscribers_mutex);
  shared_->subscribers.push_back(std::move(tx));
  return std::move(rx);
}

void reload_coordinator::stop_watching() {
  if (watcher_) {
    watcher_->stop();
  }
}

change_watcher::state reload_coordinator::watcher_state() const {
  return watcher_ ? watcher_->current_state() : change_watcher::state::stopped;
}

} // namespace r3::load
