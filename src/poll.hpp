#pragma once
#include <cstdint>
#include <sys/epoll.h>

namespace TinyReactor {
enum class poll_status { CLOSED, READ, WRITE, ERROR };

enum class poll_op : uint32_t {
  READ = EPOLLIN,
  WRITE = EPOLLOUT,
  READ_WRITE = EPOLLIN | EPOLLOUT
};

/* 一次就绪通知, events 为 epoll 返回的原始掩码 */
struct poll_event {
  int fd{-1};
  uint32_t events{0};

  auto readable() const noexcept -> bool {
    return (events & (EPOLLIN | EPOLLPRI)) != 0;
  }
  auto writable() const noexcept -> bool { return (events & EPOLLOUT) != 0; }
  auto closed() const noexcept -> bool {
    return (events & (EPOLLRDHUP | EPOLLHUP)) != 0;
  }
  auto error() const noexcept -> bool { return (events & EPOLLERR) != 0; }

  auto status() const noexcept -> poll_status {
    if (closed()) {
      return poll_status::CLOSED;
    } else if (readable()) {
      return poll_status::READ;
    } else if (writable()) {
      return poll_status::WRITE;
    } else {
      return poll_status::ERROR;
    }
  }
};

inline auto to_string(poll_status status) -> const char * {
  switch (status) {
  case poll_status::CLOSED:
    return "CLOSED";
  case poll_status::READ:
    return "READ";
  case poll_status::WRITE:
    return "WRITE";
  case poll_status::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

inline auto to_string(poll_op op) -> const char * {
  switch (op) {
  case poll_op::READ:
    return "READ";
  case poll_op::WRITE:
    return "WRITE";
  case poll_op::READ_WRITE:
    return "READ_WRITE";
  }
  return "UNKNOWN";
}
}; // namespace TinyReactor
