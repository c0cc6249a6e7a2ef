#pragma once
#include <signal.h>

namespace TinyReactor {
/* 对端关闭后继续 write 会触发 SIGPIPE, 忽略之后 write 返回 EPIPE */
inline auto ignore_sigpipe() noexcept -> void { ::signal(SIGPIPE, SIG_IGN); }
}; // namespace TinyReactor
