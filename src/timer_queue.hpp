#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace TinyReactor {
using timer_id = uint64_t;
using timer_callback = std::function<void()>;

/* 单调时钟, 单位 ms */
auto monotonic_now_ms() noexcept -> int64_t;

/**
 * @brief 基于单个 timerfd 的一次性定时器队列
 *
 * timerfd 总是按最早的 deadline 设置, 到期后由 io_dispatcher 调用
 * pop_expired() 逐个取出
 */
class timer_queue {
public:
  struct entry {
    timer_id m_id;
    int64_t m_deadline;
    timer_callback m_callback;
  };

  timer_queue();
  ~timer_queue();
  timer_queue(const timer_queue &) = delete;
  auto operator=(const timer_queue &) -> timer_queue & = delete;

  inline auto fd() const noexcept -> int { return m_timer_fd; }

  auto add(int64_t deadline_ms, timer_callback callback) -> timer_id;
  auto cancel(timer_id id) -> bool;

  /**
   * @brief 取出一个已经到期的定时器
   *
   * @param now_ms
   * @param id_limit 只返回 id 小于该值的定时器, 避免回调中新加的 0 延迟
   * 定时器在同一轮里被执行
   * @return std::optional<entry>
   */
  auto pop_expired(int64_t now_ms, timer_id id_limit) -> std::optional<entry>;

  /* 读掉 timerfd 的到期计数, 防止事件一直触发 */
  auto drain() noexcept -> void;
  auto rearm(int64_t now_ms) -> void;

  inline auto next_id() const noexcept -> timer_id { return m_next_id; }
  inline auto empty() const noexcept -> bool { return m_timed_events.empty(); }
  inline auto size() const noexcept -> std::size_t {
    return m_timed_events.size();
  }

private:
  using timed_map = std::multimap<int64_t, std::pair<timer_id, timer_callback>>;

  int m_timer_fd{-1};
  timer_id m_next_id{1};
  timed_map m_timed_events{};
  std::unordered_map<timer_id, timed_map::iterator> m_index{};
};
}; // namespace TinyReactor
