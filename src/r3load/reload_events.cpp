#include "r3load/reload_events.hpp"

#include <algorithm>
#include <utility>

namespace r3::load {

namespace {

void release_hold(detail::block_state& state) {
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.pending > 0) {
      --state.pending;
    }
  }
  state.cv.notify_all();
}

} // namespace

block_token::block_token(std::shared_ptr<detail::block_state> state) : state_(std::move(state)) {}

block_token::block_token(const block_token& other) : state_(other.state_) {
  if (state_) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->pending;
  }
}

block_token::block_token(block_token&& other) noexcept : state_(std::move(other.state_)) {}

block_token& block_token::operator=(const block_token& other) {
  if (this != &other) {
    block_token copy(other);
    release();
    state_ = std::move(copy.state_);
  }
  return *this;
}

block_token& block_token::operator=(block_token&& other) noexcept {
  if (this != &other) {
    release();
    state_ = std::move(other.state_);
  }
  return *this;
}

block_token::~block_token() { release(); }

void block_token::release() {
  if (!state_) {
    return;
  }
  release_hold(*state_);
  state_.reset();
}

size_t block_token::pending() const {
  if (!state_) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->pending;
}

const char* reload_event_name(reload_event::kind kind) {
  switch (kind) {
    case reload_event::kind::about_to_reload:
      return "about_to_reload";
    case reload_event::kind::reloaded:
      return "reloaded";
  }
  return "unknown";
}

reload_observer::reload_observer(receiver<reload_event> rx) : rx_(std::move(rx)) {}

block_token reload_observer::wait_for_about_to_reload() {
  while (auto event = rx_.recv()) {
    if (event->type == reload_event::kind::about_to_reload) {
      return std::move(event->token);
    }
  }
  return block_token{};
}

std::optional<block_token> reload_observer::wait_for_about_to_reload_for(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    auto event = rx_.recv_for(std::max(remaining, std::chrono::milliseconds(1)));
    if (!event) {
      if (rx_.disconnected()) {
        return std::nullopt;
      }
      continue;
    }
    if (event->type == reload_event::kind::about_to_reload) {
      return std::move(event->token);
    }
  }
}

bool reload_observer::wait_for_reload() {
  while (auto event = rx_.recv()) {
    if (event->type == reload_event::kind::reloaded) {
      return true;
    }
  }
  return false;
}

bool reload_observer::wait_for_reload_for(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    auto event = rx_.recv_for(std::max(remaining, std::chrono::milliseconds(1)));
    if (!event) {
      if (rx_.disconnected()) {
        return false;
      }
      continue;
    }
    if (event->type == reload_event::kind::reloaded) {
      return true;
    }
  }
}

reload_notifier::reload_notifier() : log_(redlog::get_logger("r3.load.notifier")) {}

reload_observer reload_notifier::subscribe() {
  auto [tx, rx] = make_channel<reload_event>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(tx));
  }
  log_.dbg("observer subscribed");
  return reload_observer(std::move(rx));
}

void reload_notifier::send_about_to_reload_and_wait() {
  auto state = std::make_shared<detail::block_state>();
  state->pending = 1;

  // the seed hold is copied into every event and released once the broadcast is done
  {
    block_token seed(state);
    notify(reload_event{reload_event::kind::about_to_reload, seed});
  }

  std::unique_lock<std::mutex> lock(state->mutex);
  if (state->pending > 0) {
    log_.vrb("waiting for observers to release reload holds", redlog::field("pending", state->pending));
  }
  state->cv.wait(lock, [&] { return state->pending == 0; });
  log_.trc("all reload holds released");
}

void reload_notifier::send_reloaded() { notify(reload_event{reload_event::kind::reloaded, block_token{}}); }

size_t reload_notifier::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void reload_notifier::notify(const reload_event& event) {
  std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    log_.wrn("subscriber list busy, event not delivered", redlog::field("event", reload_event_name(event.type)));
    return;
  }

  size_t before = subscribers_.size();
  subscribers_.erase(
      std::remove_if(
          subscribers_.begin(), subscribers_.end(), [&](const sender<reload_event>& tx) { return !tx.send(event); }
      ),
      subscribers_.end()
  );

  log_.trc(
      "event broadcast", redlog::field("event", reload_event_name(event.type)),
      redlog::field("subscribers", subscribers_.size()), redlog::field("pruned", before - subscribers_.size())
  );
}

} // namespace r3::load
