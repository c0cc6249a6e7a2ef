#pragma once
#include <arpa/inet.h>
#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace TinyTcpServer {
class IPv4Address {
public:
  /* @throw std::invalid_argument ip 不是合法的点分十进制地址 */
  IPv4Address(const std::string &ip, uint16_t port);
  explicit IPv4Address(sockaddr_in addr);

  /* 通过 getsockname 获取 fd 绑定的地址 */
  static auto local_of(int fd) -> IPv4Address;

  auto getSockAddr() -> sockaddr *;

  auto getIp() const -> std::string {
    char buf[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &addr.sin_addr, buf,
                static_cast<socklen_t>(sizeof(buf)));
    return std::string(buf);
  }

  inline auto getPort() const -> uint16_t { return ::ntohs(addr.sin_port); }

  inline auto getFamily() const -> sa_family_t { return addr.sin_family; }

  inline auto getSockaddr_in() const -> const sockaddr * {
    return reinterpret_cast<const sockaddr *>(&addr);
  }

  auto toString() const -> std::string {
    return getIp() + ":" + std::to_string(getPort());
  }

private:
  sockaddr_in addr;
};
}; // namespace TinyTcpServer
