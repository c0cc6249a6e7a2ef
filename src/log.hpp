#pragma once
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace TinyReactor {
enum class log_level { trace, debug, info, warn, error, off };

auto set_log_level(log_level level) noexcept -> void;
auto get_log_level() noexcept -> log_level;
/* 无法识别的字符串返回 fallback */
auto log_level_from_string(std::string_view name, log_level fallback)
    -> log_level;
auto log_write(log_level level, std::string_view message) -> void;

inline auto should_log(log_level level) noexcept -> bool {
  return level != log_level::off && level >= get_log_level();
}

template <typename... Args>
auto log_at(log_level level, fmt::format_string<Args...> format,
            Args &&...args) -> void {
  if (should_log(level)) {
    log_write(level, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
auto log_trace(fmt::format_string<Args...> format, Args &&...args) -> void {
  log_at(log_level::trace, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto log_debug(fmt::format_string<Args...> format, Args &&...args) -> void {
  log_at(log_level::debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto log_info(fmt::format_string<Args...> format, Args &&...args) -> void {
  log_at(log_level::info, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto log_warn(fmt::format_string<Args...> format, Args &&...args) -> void {
  log_at(log_level::warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto log_error(fmt::format_string<Args...> format, Args &&...args) -> void {
  log_at(log_level::error, format, std::forward<Args>(args)...);
}
}; // namespace TinyReactor
