#include "timer_queue.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cerrno>
#include <ctime>
#include <sys/timerfd.h>
#include <unistd.h>

namespace TinyReactor {
namespace {
/* 很远的 deadline 先按上限设置, 到点后 pop_expired 取不到, 会再次 rearm */
constexpr int64_t max_arm_ms = 3'600'000;
} // namespace

auto monotonic_now_ms() noexcept -> int64_t {
  timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1'000'000;
}

timer_queue::timer_queue()
    : m_timer_fd(
          ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (m_timer_fd == -1) {
    throw reactor_error("timerfd_create() failed", errno);
  }
}

timer_queue::~timer_queue() { ::close(m_timer_fd); }

auto timer_queue::add(int64_t deadline_ms, timer_callback callback)
    -> timer_id {
  timer_id id = m_next_id++;
  /* multimap 对相同 key 按插入顺序排列 */
  auto pos = m_timed_events.emplace(deadline_ms,
                                    std::make_pair(id, std::move(callback)));
  m_index.emplace(id, pos);
  if (pos == m_timed_events.begin()) {
    try {
      rearm(monotonic_now_ms());
    } catch (...) {
      /* id 没有返回给调用方, 不能留在队列里 */
      m_index.erase(id);
      m_timed_events.erase(pos);
      throw;
    }
  }
  return id;
}

auto timer_queue::cancel(timer_id id) -> bool {
  auto it = m_index.find(id);
  if (it == m_index.end()) {
    return false;
  }
  bool is_first = (it->second == m_timed_events.begin());
  m_timed_events.erase(it->second);
  m_index.erase(it);
  if (is_first) {
    rearm(monotonic_now_ms());
  }
  return true;
}

auto timer_queue::pop_expired(int64_t now_ms, timer_id id_limit)
    -> std::optional<entry> {
  for (auto it = m_timed_events.begin();
       it != m_timed_events.end() && it->first <= now_ms; ++it) {
    if (it->second.first >= id_limit) {
      continue;
    }
    entry e{it->second.first, it->first, std::move(it->second.second)};
    m_index.erase(e.m_id);
    m_timed_events.erase(it);
    return e;
  }
  return std::nullopt;
}

auto timer_queue::drain() noexcept -> void {
  uint64_t expirations = 0;
  if (::read(m_timer_fd, &expirations, sizeof(expirations)) == -1 &&
      errno != EAGAIN) {
    log_debug("timerfd read failed: errno {}", errno);
  }
}

auto timer_queue::rearm(int64_t now_ms) -> void {
  itimerspec ts{};
  if (!m_timed_events.empty()) {
    int64_t deadline = m_timed_events.begin()->first;
    /* 已经过期的设置为 1ms, it_value 全 0 会解除定时器 */
    int64_t amount = 1;
    if (deadline > now_ms) {
      /* 先比较再相减, 避免 deadline - now_ms 溢出 */
      amount = deadline - now_ms > max_arm_ms ? max_arm_ms : deadline - now_ms;
    }
    ts.it_value.tv_sec = amount / 1000;
    ts.it_value.tv_nsec = (amount % 1'000) * 1'000'000;
  }
  /* 队列为空时 it_value 为 0, 即解除定时器 */
  if (::timerfd_settime(m_timer_fd, 0, &ts, nullptr) == -1) {
    throw reactor_error("timerfd_settime() failed", errno);
  }
}
}; // namespace TinyReactor
