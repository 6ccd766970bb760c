#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <redlog.hpp>

#include "r3load/channel.hpp"

namespace r3::load {

namespace detail {

struct block_state {
  std::mutex mutex{};
  std::condition_variable cv{};
  size_t pending = 0;
};

} // namespace detail

/**
 * @brief Hold on a pending reload
 *
 * Every live copy counts as one hold. The update thread does not swap the library until all holds handed out for
 * the current cycle are gone, either destroyed or released explicitly. A default-constructed or moved-from token
 * holds nothing.
 */
class block_token {
public:
  block_token() = default;
  block_token(const block_token& other);
  block_token(block_token&& other) noexcept;
  block_token& operator=(const block_token& other);
  block_token& operator=(block_token&& other) noexcept;
  ~block_token();

  // drops this hold early; safe to call more than once
  void release();

  bool active() const noexcept { return static_cast<bool>(state_); }

  // holds still outstanding for the cycle this token belongs to (0 for an inactive token)
  size_t pending() const;

private:
  friend class reload_notifier;

  // adopts a hold that was already counted
  explicit block_token(std::shared_ptr<detail::block_state> state);

  std::shared_ptr<detail::block_state> state_{};
};

struct reload_event {
  enum class kind { about_to_reload, reloaded };
  kind type = kind::reloaded;
  block_token token{};
};

const char* reload_event_name(reload_event::kind kind);

/**
 * @brief Receiving end of lifecycle notifications for one subscriber
 *
 * Typical use: wait for the about-to-reload token, serialize state while the old code is still loaded, drop the
 * token, then wait for the reload and restore.
 */
class reload_observer {
public:
  reload_observer() = default;
  explicit reload_observer(receiver<reload_event> rx);

  // blocks until a reload is announced; returns an inactive token if the notifier has gone away
  block_token wait_for_about_to_reload();
  std::optional<block_token> wait_for_about_to_reload_for(std::chrono::milliseconds timeout);

  // blocks until the new version is loaded; false if the notifier has gone away
  bool wait_for_reload();
  bool wait_for_reload_for(std::chrono::milliseconds timeout);

private:
  receiver<reload_event> rx_{};
};

class reload_notifier {
public:
  reload_notifier();

  reload_observer subscribe();

  // broadcasts about_to_reload and blocks until every hold handed out for it has been released
  void send_about_to_reload_and_wait();

  void send_reloaded();

  size_t subscriber_count() const;

private:
  void notify(const reload_event& event);

  redlog::logger log_;
  mutable std::mutex mutex_{};
  std::vector<sender<reload_event>> subscribers_{};
};

} // namespace r3::load
