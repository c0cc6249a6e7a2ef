#pragma once
#include "errors.hpp"
#include <cerrno>
#include <cstdint>
#include <sys/eventfd.h>
#include <unistd.h>

namespace TinyReactor {
/* eventfd 的 RAII 封装, 用于从其他线程唤醒阻塞在 epoll_wait 上的循环 */
class event_notifier {
public:
  event_notifier() : m_fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (m_fd == -1) {
      throw reactor_error("eventfd() failed", errno);
    }
  }

  ~event_notifier() {
    if (m_fd != -1) {
      ::close(m_fd);
    }
  }

  event_notifier(const event_notifier &) = delete;
  auto operator=(const event_notifier &) -> event_notifier & = delete;

  inline auto fd() const noexcept -> int { return m_fd; }

  /* 计数器溢出时返回 EAGAIN, 此时 fd 已经可读, 可以忽略 */
  auto notify() const noexcept -> void {
    uint64_t one = 1;
    [[maybe_unused]] ssize_t n = ::write(m_fd, &one, sizeof(one));
  }

  /* 返回累计的通知次数, 没有通知时返回 0 */
  auto drain() const noexcept -> uint64_t {
    uint64_t count = 0;
    if (::read(m_fd, &count, sizeof(count)) != sizeof(count)) {
      return 0;
    }
    return count;
  }

private:
  int m_fd{-1};
};
}; // namespace TinyReactor
