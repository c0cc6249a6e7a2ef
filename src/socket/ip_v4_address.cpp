#include "ip_v4_address.hpp"
#include "errors.hpp"
#include <cerrno>
#include <memory>
#include <stdexcept>

namespace TinyTcpServer {
IPv4Address::IPv4Address(const std::string &ip, uint16_t port) : addr{} {
  addr.sin_family = AF_INET;
  addr.sin_port = ::htons(port);
  /* inet_addr 无法区分 255.255.255.255 和错误, 使用 inet_pton */
  if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("invalid IPv4 address: " + ip);
  }
}

IPv4Address::IPv4Address(sockaddr_in _addr) : addr(_addr) {}

auto IPv4Address::local_of(int fd) -> IPv4Address {
  sockaddr_in local{};
  socklen_t len = sizeof(local);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&local), &len) == -1) {
    throw TinyReactor::reactor_error("getsockname() failed", errno);
  }
  return IPv4Address(local);
}

auto IPv4Address::getSockAddr() -> sockaddr * {
  return reinterpret_cast<sockaddr *>(std::addressof(addr));
}
}; // namespace TinyTcpServer
