#pragma once
#include "errors.hpp"
#include "event_notifier.hpp"
#include "poll.hpp"
#include "timer_queue.hpp"
#include "watch.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

namespace TinyReactor {
struct dispatcher_options {
  /* 每次 epoll_wait 最多返回的事件数, 超出的留到下一轮 */
  std::size_t max_events{16};
};

using error_handler = std::function<void(const callback_error &)>;

/**
 * @brief 单线程的就绪事件分发器
 *
 * 阻塞在 epoll_wait 上, 每一轮对内核报告就绪的每个 fd 调用一次回调.
 * 除了 stop() 之外, 所有成员函数都只能在运行循环的线程上调用.
 */
class io_dispatcher {
public:
  explicit io_dispatcher(dispatcher_options options = {});
  ~io_dispatcher();

  io_dispatcher(const io_dispatcher &) = delete;
  io_dispatcher(io_dispatcher &&) = delete;
  auto operator=(const io_dispatcher &) -> io_dispatcher & = delete;
  auto operator=(io_dispatcher &&) -> io_dispatcher & = delete;

  /**
   * @brief 注册 fd, 就绪时调用 callback
   *
   * @throw duplicate_resource_error fd 已经注册过
   * @throw invalid_resource_error fd < 0, callback 为空或者 epoll_ctl 失败
   */
  auto register_fd(int fd, poll_op op, watch_callback callback) -> void;

  /* fd 未注册时什么都不做, 可以在任意回调里调用 */
  auto unregister_fd(int fd) -> bool;

  /* @throw registration_error fd 未注册或 epoll_ctl 失败 */
  auto modify(int fd, poll_op op) -> void;

  auto is_registered(int fd) const -> bool;
  inline auto size() const noexcept -> std::size_t { return m_watches.size(); }

  auto add_timer(int64_t delay_ms, timer_callback callback) -> timer_id;
  auto cancel_timer(timer_id id) -> bool;
  inline auto pending_timers() const noexcept -> std::size_t {
    return m_timers.size();
  }

  auto set_error_handler(error_handler handler) -> void {
    m_error_handler = std::move(handler);
  }

  /**
   * @brief 执行一轮: 等待最多 timeout_ms 毫秒, 分发就绪事件和到期定时器
   *
   * @param timeout_ms -1 表示一直阻塞
   * @return std::size_t 本轮调用的回调数
   */
  auto run_once(int timeout_ms) -> std::size_t;

  /* 循环直到 stop() 或者没有任何 fd 和定时器 */
  auto run() -> void;

  /* 线程安全 */
  auto stop() noexcept -> void;

  inline auto is_running() const noexcept -> bool {
    return m_running.load(std::memory_order_acquire);
  }

private:
  auto add_internal(int fd) -> void;
  auto dispatch_watch(const epoll_event &event) -> bool;
  auto fire_expired_timers() -> std::size_t;
  auto report(const callback_error &error) -> void;

  template <typename F> auto invoke_guarded(int fd, F &&f) -> void {
    try {
      f();
    } catch (const std::exception &e) {
      report(callback_error(fd, e.what(), std::current_exception()));
    } catch (...) {
      report(
          callback_error(fd, "non-standard exception", std::current_exception()));
    }
  }

private:
  int m_epoll_fd{-1};
  event_notifier m_notifier;
  timer_queue m_timers;
  std::vector<epoll_event> m_events;
  /* shared_ptr 保证回调在执行过程中被注销时不会析构自己 */
  std::unordered_map<int, std::shared_ptr<watch>> m_watches{};
  uint32_t m_next_generation{1};
  error_handler m_error_handler{};
  bool m_dispatching{false};
  std::atomic<bool> m_stop{false};
  std::atomic<bool> m_running{false};
};
}; // namespace TinyReactor
