#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <io_dispatcher.hpp>
#include <limits>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace TinyReactor;

namespace {
struct Pipe {
  int read_fd{-1};
  int write_fd{-1};

  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
      throw std::runtime_error("pipe2 failed");
    }
    read_fd = fds[0];
    write_fd = fds[1];
  }
  ~Pipe() {
    ::close(read_fd);
    ::close(write_fd);
  }

  void fill() {
    char byte = 'x';
    ASSERT_EQ(::write(write_fd, &byte, 1), 1);
  }
};

struct SocketPair {
  int a{-1};
  int b{-1};

  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0,
                     fds) != 0) {
      throw std::runtime_error("socketpair failed");
    }
    a = fds[0];
    b = fds[1];
  }
  ~SocketPair() {
    ::close(a);
    ::close(b);
  }
};
} // namespace

TEST(IoDispatcherTest, DuplicateRegistrationFails) {
  io_dispatcher dispatcher;
  Pipe p;
  dispatcher.register_fd(p.read_fd, poll_op::READ, [](const poll_event &) {});
  EXPECT_THROW(dispatcher.register_fd(p.read_fd, poll_op::READ,
                                      [](const poll_event &) {}),
               duplicate_resource_error);
  try {
    dispatcher.register_fd(p.read_fd, poll_op::WRITE,
                           [](const poll_event &) {});
    FAIL() << "expected duplicate_resource_error";
  } catch (const duplicate_resource_error &e) {
    EXPECT_EQ(e.fd(), p.read_fd);
  }
  EXPECT_EQ(dispatcher.size(), 1u);
}

TEST(IoDispatcherTest, InvalidResourcesAreRejected) {
  io_dispatcher dispatcher;
  EXPECT_THROW(
      dispatcher.register_fd(-1, poll_op::READ, [](const poll_event &) {}),
      invalid_resource_error);

  Pipe p;
  EXPECT_THROW(dispatcher.register_fd(p.read_fd, poll_op::READ, nullptr),
               invalid_resource_error);

  int closed_fd = ::dup(p.read_fd);
  ASSERT_GE(closed_fd, 0);
  ::close(closed_fd);
  try {
    dispatcher.register_fd(closed_fd, poll_op::READ,
                           [](const poll_event &) {});
    FAIL() << "expected invalid_resource_error";
  } catch (const invalid_resource_error &e) {
    EXPECT_EQ(e.error_code(), EBADF);
  }
  EXPECT_EQ(dispatcher.size(), 0u);
}

TEST(IoDispatcherTest, RegularFileIsRejected) {
  io_dispatcher dispatcher;
  char path[] = "/tmp/tiny_reactor_XXXXXX";
  int fd = ::mkstemp(path);
  ASSERT_GE(fd, 0);
  ::unlink(path);
  try {
    dispatcher.register_fd(fd, poll_op::READ, [](const poll_event &) {});
    FAIL() << "expected invalid_resource_error";
  } catch (const invalid_resource_error &e) {
    EXPECT_EQ(e.error_code(), EPERM);
  }
  ::close(fd);
  EXPECT_FALSE(dispatcher.is_registered(fd));
}

TEST(IoDispatcherTest, UnregisterAbsentIsNoop) {
  io_dispatcher dispatcher;
  EXPECT_FALSE(dispatcher.unregister_fd(42));
  Pipe p;
  dispatcher.register_fd(p.read_fd, poll_op::READ, [](const poll_event &) {});
  EXPECT_TRUE(dispatcher.unregister_fd(p.read_fd));
  EXPECT_FALSE(dispatcher.unregister_fd(p.read_fd));
  EXPECT_EQ(dispatcher.size(), 0u);
}

TEST(IoDispatcherTest, NotDispatchedUntilReady) {
  io_dispatcher dispatcher;
  Pipe p;
  int calls = 0;
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&calls](const poll_event &) { ++calls; });
  EXPECT_EQ(dispatcher.run_once(0), 0u);
  EXPECT_EQ(calls, 0);

  p.fill();
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(calls, 1);
}

TEST(IoDispatcherTest, CallbackFiresAtMostOncePerCycle) {
  io_dispatcher dispatcher;
  Pipe p;
  p.fill();
  int calls = 0;
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&calls](const poll_event &event) {
                           EXPECT_TRUE(event.readable());
                           EXPECT_EQ(event.status(), poll_status::READ);
                           ++calls;
                         });
  /* 水平触发, 数据没读走时每一轮都就绪, 但每轮只调用一次 */
  for (int cycle = 1; cycle <= 3; ++cycle) {
    EXPECT_EQ(dispatcher.run_once(0), 1u);
    EXPECT_EQ(calls, cycle);
  }
}

TEST(IoDispatcherTest, ReadWriteInterestIsOneCallback) {
  io_dispatcher dispatcher;
  SocketPair sp;
  ASSERT_EQ(::write(sp.b, "ping", 4), 4);
  std::vector<poll_event> seen;
  dispatcher.register_fd(sp.a, poll_op::READ_WRITE,
                         [&seen](const poll_event &event) {
                           seen.push_back(event);
                         });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].fd, sp.a);
  EXPECT_TRUE(seen[0].readable());
  EXPECT_TRUE(seen[0].writable());
  EXPECT_FALSE(seen[0].closed());
}

TEST(IoDispatcherTest, PeerHangupReportsClosed) {
  io_dispatcher dispatcher;
  SocketPair sp;
  ::shutdown(sp.b, SHUT_WR);
  poll_status status = poll_status::ERROR;
  dispatcher.register_fd(sp.a, poll_op::READ,
                         [&status](const poll_event &event) {
                           status = event.status();
                         });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(status, poll_status::CLOSED);
}

TEST(IoDispatcherTest, UnregisterSelfInsideCallback) {
  io_dispatcher dispatcher;
  Pipe p;
  p.fill();
  int calls = 0;
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&](const poll_event &event) {
                           ++calls;
                           EXPECT_TRUE(dispatcher.unregister_fd(event.fd));
                         });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(dispatcher.run_once(0), 0u);
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(dispatcher.is_registered(p.read_fd));
}

TEST(IoDispatcherTest, UnregisterOtherInSameCycle) {
  io_dispatcher dispatcher;
  Pipe first;
  Pipe second;
  first.fill();
  second.fill();
  int calls = 0;
  dispatcher.register_fd(first.read_fd, poll_op::READ,
                         [&](const poll_event &) {
                           ++calls;
                           dispatcher.unregister_fd(second.read_fd);
                         });
  dispatcher.register_fd(second.read_fd, poll_op::READ,
                         [&](const poll_event &) {
                           ++calls;
                           dispatcher.unregister_fd(first.read_fd);
                         });
  /* 两个都就绪, 先被调用的那个把另一个注销掉 */
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(dispatcher.size(), 1u);
}

TEST(IoDispatcherTest, ReregisteredFdSkipsStaleEvent) {
  io_dispatcher dispatcher;
  Pipe first;
  Pipe second;
  first.fill();
  second.fill();
  int old_calls = 0;
  int new_calls = 0;
  bool swapped = false;
  auto swap_other = [&](int other) {
    ++old_calls;
    if (swapped) {
      return;
    }
    swapped = true;
    dispatcher.unregister_fd(other);
    dispatcher.register_fd(other, poll_op::READ,
                           [&new_calls](const poll_event &) { ++new_calls; });
  };
  dispatcher.register_fd(first.read_fd, poll_op::READ,
                         [&](const poll_event &) { swap_other(second.read_fd); });
  dispatcher.register_fd(second.read_fd, poll_op::READ,
                         [&](const poll_event &) { swap_other(first.read_fd); });

  /* 本轮收集到的事件属于旧的注册, 新回调不能被调用 */
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(old_calls, 1);
  EXPECT_EQ(new_calls, 0);

  EXPECT_EQ(dispatcher.run_once(0), 2u);
  EXPECT_EQ(old_calls, 2);
  EXPECT_EQ(new_calls, 1);
}

TEST(IoDispatcherTest, MaxEventsSpreadsReadyFdsOverCycles) {
  io_dispatcher dispatcher(dispatcher_options{.max_events = 1});
  Pipe first;
  Pipe second;
  first.fill();
  second.fill();
  int first_calls = 0;
  int second_calls = 0;
  dispatcher.register_fd(first.read_fd, poll_op::READ,
                         [&](const poll_event &event) {
                           ++first_calls;
                           dispatcher.unregister_fd(event.fd);
                         });
  dispatcher.register_fd(second.read_fd, poll_op::READ,
                         [&](const poll_event &event) {
                           ++second_calls;
                           dispatcher.unregister_fd(event.fd);
                         });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(first_calls + second_calls, 1);
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(first_calls, 1);
  EXPECT_EQ(second_calls, 1);
}

TEST(IoDispatcherTest, ZeroMaxEventsIsRejected) {
  EXPECT_THROW(io_dispatcher(dispatcher_options{.max_events = 0}),
               std::invalid_argument);
}

TEST(IoDispatcherTest, ModifyChangesInterest) {
  io_dispatcher dispatcher;
  SocketPair sp;
  std::vector<poll_status> seen;
  dispatcher.register_fd(sp.a, poll_op::READ,
                         [&seen](const poll_event &event) {
                           seen.push_back(event.status());
                         });
  EXPECT_EQ(dispatcher.run_once(0), 0u);

  dispatcher.modify(sp.a, poll_op::WRITE);
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], poll_status::WRITE);

  EXPECT_THROW(dispatcher.modify(sp.b, poll_op::READ), registration_error);
}

TEST(IoDispatcherTest, CallbackExceptionReachesHandler) {
  io_dispatcher dispatcher;
  Pipe p;
  p.fill();
  std::vector<std::string> errors;
  int error_fd = -2;
  dispatcher.set_error_handler([&](const callback_error &error) {
    errors.emplace_back(error.what());
    error_fd = error.fd();
    EXPECT_THROW(error.rethrow_nested(), std::runtime_error);
  });
  int calls = 0;
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&calls](const poll_event &) {
                           ++calls;
                           throw std::runtime_error("boom");
                         });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(calls, 2);
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0], "boom");
  EXPECT_EQ(error_fd, p.read_fd);
}

TEST(IoDispatcherTest, NonStandardExceptionReachesHandler) {
  io_dispatcher dispatcher;
  Pipe p;
  p.fill();
  int reported = 0;
  dispatcher.set_error_handler(
      [&reported](const callback_error &) { ++reported; });
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [](const poll_event &) { throw 7; });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_EQ(reported, 1);
}

TEST(IoDispatcherTest, RunOnceInsideCallbackIsReported) {
  io_dispatcher dispatcher;
  Pipe p;
  p.fill();
  std::string message;
  dispatcher.set_error_handler(
      [&message](const callback_error &error) { message = error.what(); });
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&dispatcher](const poll_event &) {
                           dispatcher.run_once(0);
                         });
  EXPECT_EQ(dispatcher.run_once(0), 1u);
  EXPECT_NE(message.find("inside a callback"), std::string::npos);
}

TEST(IoDispatcherTest, RunReturnsWhenNothingIsWatched) {
  io_dispatcher dispatcher;
  dispatcher.run();

  Pipe p;
  p.fill();
  int calls = 0;
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&](const poll_event &event) {
                           ++calls;
                           dispatcher.unregister_fd(event.fd);
                         });
  dispatcher.run();
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(dispatcher.is_running());
}

TEST(IoDispatcherTest, StopFromAnotherThreadUnblocksRun) {
  io_dispatcher dispatcher;
  Pipe p;
  dispatcher.register_fd(p.read_fd, poll_op::READ, [](const poll_event &) {});
  std::thread loop([&dispatcher] { dispatcher.run(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  dispatcher.stop();
  loop.join();
  EXPECT_TRUE(dispatcher.is_registered(p.read_fd));
}

TEST(IoDispatcherTest, StopInsideCallbackEndsRun) {
  io_dispatcher dispatcher;
  Pipe p;
  p.fill();
  int calls = 0;
  dispatcher.register_fd(p.read_fd, poll_op::READ,
                         [&](const poll_event &) {
                           ++calls;
                           dispatcher.stop();
                         });
  dispatcher.run();
  EXPECT_EQ(calls, 1);
}

TEST(IoDispatcherTest, StopBeforeRunIsConsumed) {
  io_dispatcher dispatcher;
  Pipe p;
  dispatcher.register_fd(p.read_fd, poll_op::READ, [](const poll_event &) {});
  dispatcher.stop();
  dispatcher.run();
  EXPECT_TRUE(dispatcher.is_registered(p.read_fd));
}

TEST(IoDispatcherTest, TimersFireInDeadlineOrder) {
  io_dispatcher dispatcher;
  std::vector<int> order;
  dispatcher.add_timer(30, [&order] { order.push_back(30); });
  dispatcher.add_timer(10, [&order] { order.push_back(10); });
  dispatcher.add_timer(20, [&order] { order.push_back(20); });
  EXPECT_EQ(dispatcher.pending_timers(), 3u);
  dispatcher.run();
  EXPECT_EQ(order, (std::vector<int>{10, 20, 30}));
  EXPECT_EQ(dispatcher.pending_timers(), 0u);
}

TEST(IoDispatcherTest, CancelledTimerNeverFires) {
  io_dispatcher dispatcher;
  bool cancelled_fired = false;
  bool kept_fired = false;
  auto id = dispatcher.add_timer(5, [&] { cancelled_fired = true; });
  dispatcher.add_timer(20, [&] { kept_fired = true; });
  EXPECT_TRUE(dispatcher.cancel_timer(id));
  EXPECT_FALSE(dispatcher.cancel_timer(id));
  dispatcher.run();
  EXPECT_FALSE(cancelled_fired);
  EXPECT_TRUE(kept_fired);
}

TEST(IoDispatcherTest, TimerCancelledByEarlierTimerInSameBatch) {
  io_dispatcher dispatcher;
  bool second_fired = false;
  timer_id second = 0;
  dispatcher.add_timer(0, [&] { dispatcher.cancel_timer(second); });
  second = dispatcher.add_timer(0, [&] { second_fired = true; });
  dispatcher.run();
  EXPECT_FALSE(second_fired);
}

TEST(IoDispatcherTest, TimerAddedFromTimerWaitsForNextCycle) {
  io_dispatcher dispatcher;
  int fired = 0;
  dispatcher.add_timer(0, [&] {
    ++fired;
    dispatcher.add_timer(0, [&fired] { ++fired; });
  });
  std::size_t first_cycle = 0;
  while (first_cycle == 0) {
    first_cycle = dispatcher.run_once(1000);
  }
  EXPECT_EQ(first_cycle, 1u);
  EXPECT_EQ(fired, 1);
  dispatcher.run();
  EXPECT_EQ(fired, 2);
}

TEST(IoDispatcherTest, TimerExceptionIsReportedWithoutFd) {
  io_dispatcher dispatcher;
  int error_fd = 0;
  dispatcher.set_error_handler(
      [&error_fd](const callback_error &error) { error_fd = error.fd(); });
  dispatcher.add_timer(1, [] { throw std::logic_error("timer"); });
  dispatcher.run();
  EXPECT_EQ(error_fd, -1);
}

TEST(IoDispatcherTest, HugeDelayDoesNotStarveOtherTimers) {
  io_dispatcher dispatcher;
  bool never_fired = false;
  bool soon_fired = false;
  auto never = dispatcher.add_timer(std::numeric_limits<int64_t>::max(),
                                    [&never_fired] { never_fired = true; });
  dispatcher.add_timer(5, [&soon_fired] { soon_fired = true; });
  for (int i = 0; i < 20 && !soon_fired; ++i) {
    dispatcher.run_once(100);
  }
  EXPECT_TRUE(soon_fired);
  EXPECT_FALSE(never_fired);
  EXPECT_EQ(dispatcher.pending_timers(), 1u);
  EXPECT_TRUE(dispatcher.cancel_timer(never));
}

namespace {
void noop_signal_handler(int) {}
} // namespace

TEST(IoDispatcherTest, InterruptedWaitIsAnEmptyCycle) {
  struct sigaction action {};
  struct sigaction previous {};
  action.sa_handler = noop_signal_handler;
  sigemptyset(&action.sa_mask);
  ASSERT_EQ(::sigaction(SIGUSR1, &action, &previous), 0);

  io_dispatcher dispatcher;
  std::atomic<bool> done{false};
  std::size_t result = 1;
  bool threw = false;
  std::thread loop([&] {
    try {
      result = dispatcher.run_once(-1);
    } catch (const reactor_error &) {
      threw = true;
    }
    done = true;
  });
  /* 信号可能在进入 epoll_wait 之前到达, 一直发到返回为止 */
  for (int i = 0; i < 500 && !done; ++i) {
    ::pthread_kill(loop.native_handle(), SIGUSR1);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  bool interrupted = done;
  if (!interrupted) {
    dispatcher.stop();
  }
  loop.join();
  ::sigaction(SIGUSR1, &previous, nullptr);

  EXPECT_TRUE(interrupted);
  EXPECT_FALSE(threw);
  EXPECT_EQ(result, 0u);
}
