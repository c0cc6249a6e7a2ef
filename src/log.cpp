#include "log.hpp"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <string>

namespace TinyReactor {
namespace {
std::atomic<log_level> g_level{log_level::info};

auto level_name(log_level level) -> const char * {
  switch (level) {
  case log_level::trace:
    return "trace";
  case log_level::debug:
    return "debug";
  case log_level::info:
    return "info";
  case log_level::warn:
    return "warn";
  case log_level::error:
    return "error";
  case log_level::off:
    return "off";
  }
  return "?";
}
} // namespace

auto set_log_level(log_level level) noexcept -> void {
  g_level.store(level, std::memory_order_relaxed);
}

auto get_log_level() noexcept -> log_level {
  return g_level.load(std::memory_order_relaxed);
}

auto log_level_from_string(std::string_view name, log_level fallback)
    -> log_level {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "trace") {
    return log_level::trace;
  } else if (lower == "debug") {
    return log_level::debug;
  } else if (lower == "info") {
    return log_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return log_level::warn;
  } else if (lower == "error") {
    return log_level::error;
  } else if (lower == "off" || lower == "none") {
    return log_level::off;
  }
  return fallback;
}

auto log_write(log_level level, std::string_view message) -> void {
  fmt::print(stderr, "[{}] {}\n", level_name(level), message);
}
}; // namespace TinyReactor
