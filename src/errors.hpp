#pragma once
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace TinyReactor {
/* 所有错误的基类, errno 为 0 表示与系统调用无关 */
class reactor_error : public std::runtime_error {
public:
  explicit reactor_error(const std::string &what, int err = 0)
      : std::runtime_error(err == 0 ? what
                                    : what + ": " + std::strerror(err)),
        m_errno(err) {}

  auto error_code() const noexcept -> int { return m_errno; }

private:
  int m_errno;
};

class registration_error : public reactor_error {
public:
  registration_error(int fd, const std::string &what, int err = 0)
      : reactor_error(what, err), m_fd(fd) {}

  auto fd() const noexcept -> int { return m_fd; }

private:
  int m_fd;
};

class duplicate_resource_error : public registration_error {
public:
  explicit duplicate_resource_error(int fd)
      : registration_error(fd, "fd " + std::to_string(fd) +
                                   " is already registered") {}
};

class invalid_resource_error : public registration_error {
public:
  invalid_resource_error(int fd, const std::string &what, int err = 0)
      : registration_error(fd, what, err) {}
};

/**
 * @brief 回调执行过程中抛出的异常, 只交给 error handler, 不会传出事件循环
 *
 * fd 为 -1 表示来自定时器回调
 */
class callback_error : public reactor_error {
public:
  callback_error(int fd, const std::string &what, std::exception_ptr nested)
      : reactor_error(what), m_fd(fd), m_nested(std::move(nested)) {}

  auto fd() const noexcept -> int { return m_fd; }
  auto nested() const noexcept -> std::exception_ptr { return m_nested; }

  [[noreturn]] auto rethrow_nested() const -> void {
    std::rethrow_exception(m_nested);
  }

private:
  int m_fd;
  std::exception_ptr m_nested;
};
}; // namespace TinyReactor
