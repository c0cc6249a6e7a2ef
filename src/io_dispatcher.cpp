#include "io_dispatcher.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <limits>
#include <stdexcept>
#include <unistd.h>

namespace TinyReactor {
io_dispatcher::io_dispatcher(dispatcher_options options) {
  if (options.max_events == 0) {
    throw std::invalid_argument("dispatcher_options::max_events must be > 0");
  }
  m_events.resize(options.max_events);

  m_epoll_fd = ::epoll_create1(EPOLL_CLOEXEC);
  if (m_epoll_fd == -1) {
    throw reactor_error("epoll_create1() failed", errno);
  }
  /* epoll 需要监听唤醒事件和定时器事件 */
  try {
    add_internal(m_notifier.fd());
    add_internal(m_timers.fd());
  } catch (...) {
    ::close(m_epoll_fd);
    throw;
  }
  log_debug("io_dispatcher created, epoll fd [{}], max events [{}]",
            m_epoll_fd, options.max_events);
}

io_dispatcher::~io_dispatcher() {
  /* 回调析构时可能再调用 unregister_fd, 先把 map 移出来 */
  auto watches = std::move(m_watches);
  m_watches.clear();
  watches.clear();
  ::close(m_epoll_fd);
}

auto io_dispatcher::add_internal(int fd) -> void {
  epoll_event event{};
  event.events = EPOLLIN;
  event.data.u64 = make_token(fd, internal_generation);
  if (::epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
    throw reactor_error("epoll_ctl(ADD) failed for internal fd", errno);
  }
}

auto io_dispatcher::register_fd(int fd, poll_op op, watch_callback callback)
    -> void {
  if (fd < 0) {
    throw invalid_resource_error(fd, "fd must not be negative");
  }
  if (!callback) {
    throw invalid_resource_error(fd, "callback must not be empty");
  }
  if (m_watches.contains(fd)) {
    throw duplicate_resource_error(fd);
  }

  uint32_t generation = m_next_generation++;
  if (m_next_generation == internal_generation) [[unlikely]] {
    m_next_generation = internal_generation + 1;
  }

  auto w = std::make_shared<watch>(fd, op, generation, std::move(callback));
  epoll_event event{};
  event.events = w->epoll_events();
  event.data.u64 = w->token();
  if (::epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
    throw invalid_resource_error(
        fd, "epoll_ctl(ADD) failed for fd " + std::to_string(fd), errno);
  }
  m_watches.emplace(fd, std::move(w));
  log_trace("register fd [{}] op [{}] generation [{}]", fd, to_string(op),
            generation);
}

auto io_dispatcher::unregister_fd(int fd) -> bool {
  auto it = m_watches.find(fd);
  if (it == m_watches.end()) {
    return false;
  }
  /* fd 已经被关闭时内核会自动移除, 此时 EBADF/ENOENT 可以忽略 */
  if (::epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1) {
    log_debug("epoll_ctl(DEL) fd [{}] failed: errno {}", fd, errno);
  }
  m_watches.erase(it);
  log_trace("unregister fd [{}]", fd);
  return true;
}

auto io_dispatcher::modify(int fd, poll_op op) -> void {
  auto it = m_watches.find(fd);
  if (it == m_watches.end()) {
    throw registration_error(fd, "fd " + std::to_string(fd) +
                                     " is not registered");
  }
  auto &w = it->second;
  if (w->m_op == op) {
    return;
  }
  epoll_event event{};
  event.events = static_cast<uint32_t>(op) | EPOLLRDHUP;
  event.data.u64 = w->token();
  if (::epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1) {
    throw registration_error(
        fd, "epoll_ctl(MOD) failed for fd " + std::to_string(fd), errno);
  }
  w->m_op = op;
}

auto io_dispatcher::is_registered(int fd) const -> bool {
  return m_watches.contains(fd);
}

auto io_dispatcher::add_timer(int64_t delay_ms, timer_callback callback)
    -> timer_id {
  if (!callback) {
    throw std::invalid_argument("timer callback must not be empty");
  }
  auto now = monotonic_now_ms();
  /* 限制在 int64_t 范围内, INT64_MAX 之类的 "永不" 延迟不能溢出 */
  delay_ms = std::clamp<int64_t>(delay_ms, 0,
                                 std::numeric_limits<int64_t>::max() - now);
  return m_timers.add(now + delay_ms, std::move(callback));
}

auto io_dispatcher::cancel_timer(timer_id id) -> bool {
  return m_timers.cancel(id);
}

auto io_dispatcher::run_once(int timeout_ms) -> std::size_t {
  if (m_dispatching) {
    throw reactor_error("run_once() called from inside a callback");
  }

  auto recv_count = ::epoll_wait(m_epoll_fd, m_events.data(),
                                 static_cast<int>(m_events.size()), timeout_ms);
  if (recv_count == -1) {
    if (errno == EINTR) {
      return 0;
    }
    throw reactor_error("epoll_wait() failed", errno);
  }

  std::size_t dispatched = 0;
  m_dispatching = true;
  try {
    for (std::size_t i = 0; i < static_cast<std::size_t>(recv_count); ++i) {
      const epoll_event &event = m_events[i];
      uint64_t token = event.data.u64;
      if (token_generation(token) == internal_generation) {
        int fd = token_fd(token);
        if (fd == m_notifier.fd()) {
          m_notifier.drain();
        } else if (fd == m_timers.fd()) {
          m_timers.drain();
          dispatched += fire_expired_timers();
        }
        continue;
      }
      if (dispatch_watch(event)) {
        ++dispatched;
      }
    }
  } catch (...) {
    m_dispatching = false;
    throw;
  }
  m_dispatching = false;

  log_trace("cycle: [{}] events, [{}] callbacks", recv_count, dispatched);
  return dispatched;
}

auto io_dispatcher::dispatch_watch(const epoll_event &event) -> bool {
  int fd = token_fd(event.data.u64);
  auto it = m_watches.find(fd);
  /* 同一轮里已经被注销, 或者注销后又重新注册, 这个事件已经过期 */
  if (it == m_watches.end() ||
      it->second->m_generation != token_generation(event.data.u64)) {
    log_trace("skip stale event for fd [{}]", fd);
    return false;
  }
  /* 持有一份引用, 回调里注销自己也不会析构正在执行的 std::function */
  std::shared_ptr<watch> w = it->second;
  poll_event ready{fd, event.events};
  invoke_guarded(fd, [&w, &ready] { w->m_callback(ready); });
  return true;
}

auto io_dispatcher::fire_expired_timers() -> std::size_t {
  auto now = monotonic_now_ms();
  auto id_limit = m_timers.next_id();
  std::size_t fired = 0;
  while (auto expired = m_timers.pop_expired(now, id_limit)) {
    ++fired;
    invoke_guarded(-1, [&expired] { expired->m_callback(); });
  }
  m_timers.rearm(monotonic_now_ms());
  return fired;
}

auto io_dispatcher::report(const callback_error &error) -> void {
  if (m_error_handler) {
    m_error_handler(error);
  } else {
    log_error("callback for fd [{}] failed: {}", error.fd(), error.what());
  }
}

auto io_dispatcher::run() -> void {
  m_running.store(true, std::memory_order_release);
  try {
    while (!m_stop.exchange(false, std::memory_order_acq_rel)) {
      if (m_watches.empty() && m_timers.empty()) {
        log_debug("io_dispatcher has nothing left to wait on");
        break;
      }
      run_once(-1);
    }
  } catch (...) {
    m_running.store(false, std::memory_order_release);
    throw;
  }
  m_running.store(false, std::memory_order_release);
}

auto io_dispatcher::stop() noexcept -> void {
  m_stop.store(true, std::memory_order_release);
  m_notifier.notify();
}
}; // namespace TinyReactor
