#pragma once
#include "poll.hpp"
#include <cstdint>
#include <functional>
#include <utility>

namespace TinyReactor {
using watch_callback = std::function<void(const poll_event &)>;

/* epoll_event.data.u64 的编码: 高 32 位为 generation, 低 32 位为 fd */
inline auto make_token(int fd, uint32_t generation) noexcept -> uint64_t {
  return (static_cast<uint64_t>(generation) << 32) |
         static_cast<uint32_t>(fd);
}

inline auto token_fd(uint64_t token) noexcept -> int {
  return static_cast<int>(static_cast<uint32_t>(token & 0xffffffffu));
}

inline auto token_generation(uint64_t token) noexcept -> uint32_t {
  return static_cast<uint32_t>(token >> 32);
}

/* 内部 fd (eventfd, timerfd) 使用 generation 0, 用户注册从 1 开始 */
inline constexpr uint32_t internal_generation = 0;

struct watch {
public:
  int m_fd{-1};
  poll_op m_op{poll_op::READ};
  /* 同一个 fd 反复注册时用来区分过期的就绪事件 */
  uint32_t m_generation{0};
  watch_callback m_callback;

public:
  watch(int fd, poll_op op, uint32_t generation, watch_callback callback)
      : m_fd(fd), m_op(op), m_generation(generation),
        m_callback(std::move(callback)) {}
  ~watch() = default;
  watch(const watch &) = delete;
  watch(watch &&) = delete;
  auto operator=(const watch &) -> watch & = delete;
  auto operator=(watch &&) -> watch & = delete;

  auto token() const noexcept -> uint64_t {
    return make_token(m_fd, m_generation);
  }

  auto epoll_events() const noexcept -> uint32_t {
    return static_cast<uint32_t>(m_op) | EPOLLRDHUP;
  }
};
}; // namespace TinyReactor
