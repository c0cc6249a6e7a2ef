#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <ignore_sigpipe.hpp>
#include <log.hpp>
#include <signal.h>
#include <stdexcept>
#include <socket/tcp_server.hpp>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {
/* SIGINT/SIGTERM 通过 signalfd 交给事件循环处理 */
class SignalWatcher {
public:
  explicit SignalWatcher(TinyReactor::io_dispatcher &dispatcher)
      : m_dispatcher(dispatcher) {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) == -1) {
      throw TinyReactor::reactor_error("sigprocmask() failed", errno);
    }
    m_fd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (m_fd == -1) {
      throw TinyReactor::reactor_error("signalfd() failed", errno);
    }
    m_dispatcher.register_fd(m_fd, TinyReactor::poll_op::READ,
                             [this](const TinyReactor::poll_event &) {
                               on_signal();
                             });
  }

  ~SignalWatcher() {
    m_dispatcher.unregister_fd(m_fd);
    ::close(m_fd);
  }

  SignalWatcher(const SignalWatcher &) = delete;
  auto operator=(const SignalWatcher &) -> SignalWatcher & = delete;

private:
  auto on_signal() -> void {
    signalfd_siginfo info{};
    if (::read(m_fd, &info, sizeof(info)) != sizeof(info)) {
      return;
    }
    TinyReactor::log_info("received signal [{}], shutting down",
                          info.ssi_signo);
    m_dispatcher.stop();
  }

  TinyReactor::io_dispatcher &m_dispatcher;
  int m_fd{-1};
};

auto parse_port(const std::string &text) -> uint16_t {
  std::size_t pos = 0;
  unsigned long value = std::stoul(text, &pos);
  if (pos != text.size() || value > 65535) {
    throw std::invalid_argument("invalid port: " + text);
  }
  return static_cast<uint16_t>(value);
}
} // namespace

int main(int argc, char **argv) {
  if (const char *level = std::getenv("TINY_REACTOR_LOG_LEVEL")) {
    TinyReactor::set_log_level(
        TinyReactor::log_level_from_string(level, TinyReactor::log_level::info));
  }
  TinyReactor::ignore_sigpipe();

  TinyTcpServer::server_options options;
  try {
    if (argc > 1) {
      options.host = argv[1];
    }
    if (argc > 2) {
      options.port = parse_port(argv[2]);
    }
  } catch (const std::exception &e) {
    fmt::print(stderr, "usage: {} [host] [port]\n{}\n", argv[0], e.what());
    return 2;
  }

  try {
    TinyTcpServer::TcpServer server(options);
    SignalWatcher signals(server.dispatcher());
    server.start();
    server.run();
  } catch (const std::exception &e) {
    TinyReactor::log_error("fatal: {}", e.what());
    return 1;
  }
  TinyReactor::log_info("server stopped");
  return 0;
}
