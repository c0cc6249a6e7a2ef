#pragma once
#include "errors.hpp"
#include "io_dispatcher.hpp"
#include "ip_v4_address.hpp"
#include "log.hpp"
#include <cerrno>
#include <functional>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace TinyTcpServer {
using accept_handler = std::function<void(int clientfd, const IPv4Address &)>;

class Acceptor {
  TinyReactor::io_dispatcher *m_io_dispatcher;
  IPv4Address m_host_addr;
  int m_acceptFd{-1};
  accept_handler m_on_accept;

public:
  /* @throw TinyReactor::reactor_error socket/bind/listen 失败 */
  Acceptor(TinyReactor::io_dispatcher *io_dispatcher, const std::string &host,
           uint16_t port)
      : m_io_dispatcher(io_dispatcher), m_host_addr(host, port) {
    m_acceptFd =
        ::socket(m_host_addr.getFamily(),
                 SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (m_acceptFd == -1) {
      throw TinyReactor::reactor_error("socket() failed", errno);
    }
    int optval = 1;
    if (::setsockopt(m_acceptFd, SOL_SOCKET, SO_REUSEADDR, &optval,
                     static_cast<socklen_t>(sizeof(optval))) == -1) {
      TinyReactor::log_warn("setsockopt(SO_REUSEADDR) failed: errno {}",
                            errno);
    }

    if (::bind(m_acceptFd, m_host_addr.getSockaddr_in(),
               sizeof(sockaddr_in)) == -1) {
      int err = errno;
      ::close(m_acceptFd);
      throw TinyReactor::reactor_error(
          "bind() to " + m_host_addr.toString() + " failed", err);
    }
    if (::listen(m_acceptFd, SOMAXCONN) == -1) {
      int err = errno;
      ::close(m_acceptFd);
      throw TinyReactor::reactor_error("listen() failed", err);
    }
  }

  ~Acceptor() {
    stop();
    ::close(m_acceptFd);
  }

  Acceptor(const Acceptor &) = delete;
  auto operator=(const Acceptor &) -> Acceptor & = delete;

  inline int fd() const { return m_acceptFd; }

  /* port 为 0 时返回内核实际分配的端口 */
  auto local_address() const -> IPv4Address {
    return IPv4Address::local_of(m_acceptFd);
  }

  auto start(accept_handler on_accept) -> void {
    m_on_accept = std::move(on_accept);
    m_io_dispatcher->register_fd(
        m_acceptFd, TinyReactor::poll_op::READ,
        [this](const TinyReactor::poll_event &event) { on_ready(event); });
  }

  auto stop() -> void { m_io_dispatcher->unregister_fd(m_acceptFd); }

private:
  auto on_ready(const TinyReactor::poll_event &event) -> void {
    if (event.error()) {
      TinyReactor::log_warn("listening socket [{}] reported an error",
                            m_acceptFd);
      return;
    }
    /* 水平触发, 但一次尽量把 backlog 里的连接都取出来 */
    while (true) {
      sockaddr_in client_addr{};
      socklen_t client_addr_len = sizeof(client_addr);
      int clientfd = ::accept4(
          m_acceptFd, reinterpret_cast<sockaddr *>(&client_addr),
          &client_addr_len, SOCK_CLOEXEC | SOCK_NONBLOCK);
      if (clientfd == -1) {
        if (errno == EINTR || errno == ECONNABORTED) {
          continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
          /* EMFILE 之类的错误, 留到下一轮再试 */
          TinyReactor::log_warn("accept4() failed: errno {}", errno);
        }
        return;
      }
      m_on_accept(clientfd, IPv4Address(client_addr));
    }
  }
};
}; // namespace TinyTcpServer
