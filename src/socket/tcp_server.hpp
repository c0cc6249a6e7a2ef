#pragma once
#include "acceptor.hpp"
#include "io_dispatcher.hpp"
#include "log.hpp"
#include "tcp_conn.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace TinyTcpServer {
struct server_options {
  std::string host{"0.0.0.0"};
  uint16_t port{9999};
  /* 连接空闲超时, 毫秒, <= 0 表示不超时 */
  int64_t idle_timeout_ms{30'000};
  std::size_t read_buffer_size{1024};
  /* 单个连接待发送数据的上限, 超过后暂停读取 */
  std::size_t write_high_water_mark{64 * 1024};
};

/* echo server: 收到什么就写回什么 */
struct TcpServer {
  explicit TcpServer(server_options options,
                     TinyReactor::dispatcher_options dispatcher = {})
      : m_options(std::move(options)) {
    if (m_options.read_buffer_size == 0) {
      throw std::invalid_argument("server_options::read_buffer_size must be > 0");
    }
    m_io_dispatcher = std::make_shared<TinyReactor::io_dispatcher>(dispatcher);
    m_acceptor = std::make_shared<TinyTcpServer::Acceptor>(
        m_io_dispatcher.get(), m_options.host, m_options.port);
  }

  ~TcpServer() {
    /* on_close 会从 m_conns 中删除自己, 先移出来再逐个关闭 */
    auto conns = std::move(m_conns);
    m_conns.clear();
    for (auto &[fd, conn] : conns) {
      conn->close();
    }
    m_acceptor.reset();
  }

  TcpServer(const TcpServer &) = delete;
  auto operator=(const TcpServer &) -> TcpServer & = delete;

  auto start() -> void {
    m_acceptor->start([this](int clientfd, const IPv4Address &peer) {
      accept(clientfd, peer);
    });
    TinyReactor::log_info("server listening on {}",
                          m_acceptor->local_address().toString());
  }

  auto run() -> void { m_io_dispatcher->run(); }

  /* 可以在其他线程调用 */
  auto stop() noexcept -> void { m_io_dispatcher->stop(); }

  inline auto dispatcher() -> TinyReactor::io_dispatcher & {
    return *m_io_dispatcher;
  }

  inline auto local_address() const -> IPv4Address {
    return m_acceptor->local_address();
  }

  inline auto connection_count() const -> std::size_t { return m_conns.size(); }

private:
  auto accept(int clientfd, const IPv4Address &peer) -> void {
    auto conn = std::make_shared<TcpConnection>(
        m_io_dispatcher.get(), clientfd, m_options.read_buffer_size,
        m_options.write_high_water_mark);
    m_conns.emplace(clientfd, conn);
    TinyReactor::log_debug("conn[{}] accepted from {}", clientfd,
                           peer.toString());
    try {
      conn->start(
          [](TcpConnection &c, std::string_view data) { c.send(data); },
          [this, clientfd](TcpConnection &) { m_conns.erase(clientfd); },
          m_options.idle_timeout_ms);
    } catch (const TinyReactor::registration_error &e) {
      TinyReactor::log_warn("conn[{}] dropped: {}", clientfd, e.what());
      m_conns.erase(clientfd);
    }
  }

private:
  server_options m_options;
  std::shared_ptr<TinyReactor::io_dispatcher> m_io_dispatcher;
  std::shared_ptr<TinyTcpServer::Acceptor> m_acceptor;
  std::unordered_map<int, std::shared_ptr<TcpConnection>> m_conns;
};
} // namespace TinyTcpServer
