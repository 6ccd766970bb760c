#include "r3watch/backend/linux/inotify_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <redlog.hpp>

namespace r3::watch::backend::linux_backend {
namespace {

constexpr uint32_t kWatchMask = IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF;
constexpr size_t kReadBufferSize = 16 * (sizeof(inotify_event) + 256);

fs_event::kind translate_mask(uint32_t mask) {
  if (mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
    return fs_event::kind::removed;
  }
  if (mask & IN_CREATE) {
    return fs_event::kind::created;
  }
  if (mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) {
    return fs_event::kind::modified;
  }
  return fs_event::kind::other;
}

class inotify_watcher final : public path_watcher {
public:
  inotify_watcher() : log_(redlog::get_logger("r3.watch.inotify")) {}

  ~inotify_watcher() override {
    disarm();
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool arm(const std::filesystem::path& path) override {
    if (fd_ < 0) {
      fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
      if (fd_ < 0) {
        log_.err("inotify_init1 failed", redlog::field("error", std::strerror(errno)));
        return false;
      }
    }

    disarm();

    const int wd = ::inotify_add_watch(fd_, path.c_str(), kWatchMask);
    if (wd < 0) {
      log_.dbg(
          "inotify_add_watch failed", redlog::field("path", path.string()), redlog::field("error", std::strerror(errno))
      );
      return false;
    }

    wd_ = wd;
    path_ = path.string();
    log_.trc("watch armed", redlog::field("path", path_), redlog::field("wd", wd_));
    return true;
  }

  void disarm() override {
    if (fd_ >= 0 && wd_ >= 0) {
      // the kernel drops the watch by itself once the file is gone, so failure here is expected
      (void)::inotify_rm_watch(fd_, wd_);
    }
    wd_ = -1;
  }

  bool armed() const override { return wd_ >= 0; }

  bool wait(std::vector<fs_event>& out, std::chrono::milliseconds timeout) override {
    if (fd_ < 0) {
      return false;
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready <= 0) {
      if (ready < 0 && errno != EINTR) {
        log_.wrn("poll on inotify fd failed", redlog::field("error", std::strerror(errno)));
      }
      return false;
    }

    const size_t before = out.size();
    alignas(inotify_event) char buffer[kReadBufferSize];
    for (;;) {
      const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
      if (len <= 0) {
        break;
      }

      for (char* ptr = buffer; ptr < buffer + len;) {
        const auto* event = reinterpret_cast<const inotify_event*>(ptr);
        ptr += sizeof(inotify_event) + event->len;

        // stale events from a previous watch descriptor
        if (event->wd != wd_) {
          continue;
        }

        fs_event translated{};
        translated.type = translate_mask(event->mask);
        translated.path = path_;
        out.push_back(std::move(translated));

        if (event->mask & IN_IGNORED) {
          wd_ = -1;
        }
      }
    }

    return out.size() > before;
  }

private:
  redlog::logger log_;
  int fd_ = -1;
  int wd_ = -1;
  std::string path_{};
};

} // namespace

std::unique_ptr<path_watcher> make_path_watcher() { return std::make_unique<inotify_watcher>(); }

} // namespace r3::watch::backend::linux_backend
