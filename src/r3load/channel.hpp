#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace r3::load {

namespace detail {

template <typename T> struct channel_state {
  std::mutex mutex{};
  std::condition_variable cv{};
  std::deque<T> items{};
  size_t senders = 0;
  bool receiver_alive = true;
};

} // namespace detail

template <typename T> class receiver;

// producer end of an unbounded single-consumer queue; copyable, send fails once the receiver is gone
template <typename T> class sender {
public:
  sender() = default;

  sender(const sender& other) : state_(other.state_) { attach(); }

  sender(sender&& other) noexcept : state_(std::move(other.state_)) {}

  sender& operator=(const sender& other) {
    if (this != &other) {
      detach();
      state_ = other.state_;
      attach();
    }
    return *this;
  }

  sender& operator=(sender&& other) noexcept {
    if (this != &other) {
      detach();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~sender() { detach(); }

  bool send(T value) const {
    if (!state_) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->receiver_alive) {
        return false;
      }
      state_->items.push_back(std::move(value));
    }
    state_->cv.notify_one();
    return true;
  }

  bool connected() const {
    if (!state_) {
      return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_alive;
  }

private:
  template <typename U> friend std::pair<sender<U>, receiver<U>> make_channel();

  explicit sender(std::shared_ptr<detail::channel_state<T>> state) : state_(std::move(state)) { attach(); }

  void attach() {
    if (!state_) {
      return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  void detach() {
    if (!state_) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      --state_->senders;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::channel_state<T>> state_{};
};

// consumer end; move-only. destroying it discards everything still queued
template <typename T> class receiver {
public:
  receiver() = default;
  receiver(const receiver&) = delete;
  receiver& operator=(const receiver&) = delete;
  receiver(receiver&& other) noexcept = default;

  receiver& operator=(receiver&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~receiver() { close(); }

  // blocks until a value arrives; nullopt once every sender is gone and the queue is empty
  std::optional<T> recv() {
    if (!state_) {
      return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return !state_->items.empty() || state_->senders == 0; });
    return pop_locked();
  }

  std::optional<T> recv_for(std::chrono::milliseconds timeout) {
    if (!state_) {
      return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [this] { return !state_->items.empty() || state_->senders == 0; });
    return pop_locked();
  }

  std::optional<T> try_recv() {
    if (!state_) {
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return pop_locked();
  }

  bool disconnected() const {
    if (!state_) {
      return true;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->senders == 0 && state_->items.empty();
  }

  bool valid() const { return static_cast<bool>(state_); }

private:
  template <typename U> friend std::pair<sender<U>, receiver<U>> make_channel();

  explicit receiver(std::shared_ptr<detail::channel_state<T>> state) : state_(std::move(state)) {}

  std::optional<T> pop_locked() {
    if (state_->items.empty()) {
      return std::nullopt;
    }
    std::optional<T> value(std::move(state_->items.front()));
    state_->items.pop_front();
    return value;
  }

  void close() {
    if (!state_) {
      return;
    }
    std::deque<T> discarded;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiver_alive = false;
      discarded.swap(state_->items);
    }
    state_.reset();
    // queued values are destroyed outside the channel lock
  }

  std::shared_ptr<detail::channel_state<T>> state_{};
};

template <typename T> std::pair<sender<T>, receiver<T>> make_channel() {
  auto state = std::make_shared<detail::channel_state<T>>();
  return {sender<T>(state), receiver<T>(state)};
}

} // namespace r3::load
