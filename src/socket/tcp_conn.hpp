#pragma once
#include "io_dispatcher.hpp"
#include "log.hpp"
#include "poll.hpp"
#include <cerrno>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace TinyTcpServer {
class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
  using data_handler = std::function<void(TcpConnection &, std::string_view)>;
  using close_handler = std::function<void(TcpConnection &)>;

  /**
   * @param high_water_mark 待发送数据超过这个字节数时停止读, 直到写出去一部分
   */
  TcpConnection(TinyReactor::io_dispatcher *io_dispatcher, int client_fd,
                std::size_t read_buffer_size = 1024,
                std::size_t high_water_mark = 64 * 1024)
      : m_io_dispatcher{io_dispatcher}, m_client_fd{client_fd},
        m_read_buf(read_buffer_size), m_high_water_mark{high_water_mark} {}

  ~TcpConnection() { close(); }

  TcpConnection(const TcpConnection &) = delete;
  auto operator=(const TcpConnection &) -> TcpConnection & = delete;

  /**
   * @brief 注册到 io_dispatcher 上, 回调持有自身的 shared_ptr,
   * 在 close() 注销之前连接不会被析构
   *
   * @param idle_timeout_ms 超过这个时间没有收到数据就关闭, <= 0 表示不超时
   */
  auto start(data_handler on_data, close_handler on_close,
             int64_t idle_timeout_ms = 0) -> void {
    m_on_data = std::move(on_data);
    m_on_close = std::move(on_close);
    m_idle_timeout_ms = idle_timeout_ms;
    auto self = shared_from_this();
    m_io_dispatcher->register_fd(
        m_client_fd, TinyReactor::poll_op::READ,
        [self](const TinyReactor::poll_event &event) { self->on_event(event); });
    reset_idle_timer();
  }

  /* 先尝试直接写, 写不完的部分等 EPOLLOUT */
  auto send(std::string_view data) -> void {
    if (m_client_fd == -1) {
      return;
    }
    m_write_buf.append(data);
    if (!flush()) {
      close();
    }
  }

  auto close() -> void {
    if (m_client_fd == -1) {
      return;
    }
    if (m_idle_timer.has_value()) {
      m_io_dispatcher->cancel_timer(*m_idle_timer);
      m_idle_timer.reset();
    }
    m_io_dispatcher->unregister_fd(m_client_fd);
    ::close(m_client_fd);
    TinyReactor::log_debug("conn[{}] closed", m_client_fd);
    m_client_fd = -1;
    /* 回调里可能释放最后一个外部引用, 之后不能再访问成员 */
    auto on_close = std::move(m_on_close);
    m_on_close = nullptr;
    if (on_close) {
      on_close(*this);
    }
  }

  inline int fd() const { return m_client_fd; }
  inline auto is_open() const -> bool { return m_client_fd != -1; }
  inline auto pending_bytes() const -> std::size_t { return m_write_buf.size(); }

private:
  auto on_event(const TinyReactor::poll_event &event) -> void {
    if (event.error()) {
      TinyReactor::log_debug("conn[{}] socket error", m_client_fd);
      close();
      return;
    }
    if (event.readable() && !recv_all()) {
      close();
      return;
    }
    if (m_client_fd == -1) {
      return;
    }
    if (event.writable() && !flush()) {
      close();
      return;
    }
    /* 对端关闭且数据已经读完; 限流时先把积压的数据写完, 之后 read 会返回 0 */
    if (event.closed() && !event.readable() && !throttled()) {
      close();
    }
  }

  /* 返回 false 表示连接需要关闭 */
  auto recv_all() -> bool {
    while (m_client_fd != -1 && !throttled()) {
      ssize_t n = ::read(m_client_fd, m_read_buf.data(), m_read_buf.size());
      if (n > 0) {
        reset_idle_timer();
        TinyReactor::log_trace("conn[{}] read [{}] bytes", m_client_fd, n);
        if (m_on_data) {
          m_on_data(*this, std::string_view(m_read_buf.data(),
                                            static_cast<std::size_t>(n)));
        }
      } else if (n == 0) {
        return false;
      } else if (errno == EINTR) {
        continue;
      } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return true;
      } else {
        TinyReactor::log_debug("conn[{}] read failed: errno {}", m_client_fd,
                               errno);
        return false;
      }
    }
    return true;
  }

  auto flush() -> bool {
    std::size_t written = 0;
    while (written < m_write_buf.size()) {
      ssize_t n = ::write(m_client_fd, m_write_buf.data() + written,
                          m_write_buf.size() - written);
      if (n >= 0) {
        written += static_cast<std::size_t>(n);
      } else if (errno == EINTR) {
        continue;
      } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      } else {
        TinyReactor::log_debug("conn[{}] write failed: errno {}",
                               m_client_fd, errno);
        return false;
      }
    }
    m_write_buf.erase(0, written);
    if (written > 0) {
      reset_idle_timer();
    }
    m_io_dispatcher->modify(m_client_fd, wanted_op());
    return true;
  }

  inline auto throttled() const -> bool {
    return !m_write_buf.empty() && m_write_buf.size() >= m_high_water_mark;
  }

  /* 只有还有数据没写完时才关心 EPOLLOUT, 否则会一直触发; 积压过多时不再读 */
  auto wanted_op() const -> TinyReactor::poll_op {
    if (m_write_buf.empty()) {
      return TinyReactor::poll_op::READ;
    }
    return throttled() ? TinyReactor::poll_op::WRITE
                       : TinyReactor::poll_op::READ_WRITE;
  }

  auto reset_idle_timer() -> void {
    if (m_idle_timeout_ms <= 0) {
      return;
    }
    if (m_idle_timer.has_value()) {
      m_io_dispatcher->cancel_timer(*m_idle_timer);
    }
    std::weak_ptr<TcpConnection> weak = weak_from_this();
    m_idle_timer = m_io_dispatcher->add_timer(m_idle_timeout_ms, [weak] {
      if (auto self = weak.lock()) {
        TinyReactor::log_debug("conn[{}] idle timeout", self->fd());
        self->m_idle_timer.reset();
        self->close();
      }
    });
  }

private:
  TinyReactor::io_dispatcher *m_io_dispatcher;
  int m_client_fd;
  std::vector<char> m_read_buf;
  std::string m_write_buf;
  std::size_t m_high_water_mark;
  data_handler m_on_data;
  close_handler m_on_close;
  int64_t m_idle_timeout_ms{0};
  std::optional<TinyReactor::timer_id> m_idle_timer;
};
}; // namespace TinyTcpServer
