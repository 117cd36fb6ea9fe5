#include "taskwarden/util/daemon.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace taskwarden::process {

namespace {

std::atomic<bool> shutdown_flag{false};
static_assert(std::atomic<bool>::is_always_lock_free);

extern "C" void on_shutdown_signal(int) {
  request_shutdown();
}

auto fork_and_leave_parent() -> bool {
  pid_t pid = ::fork();
  if (pid < 0) {
    return false;
  }
  if (pid > 0) {
    ::_exit(0);
  }
  return true;
}

// Points fd 0..2 at /dev/null. The process log file is opened before this,
// so it keeps its own descriptor.
auto silence_std_streams() -> bool {
  int null_fd = ::open("/dev/null", O_RDWR);
  if (null_fd < 0) {
    return false;
  }
  for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    if (::dup2(null_fd, fd) < 0) {
      ::close(null_fd);
      return false;
    }
  }
  if (null_fd > STDERR_FILENO) {
    ::close(null_fd);
  }
  return true;
}

}  // namespace

auto detach() -> Result<void> {
  if (!fork_and_leave_parent() || ::setsid() < 0 || !fork_and_leave_parent()) {
    return fail(std::error_code(errno, std::generic_category()));
  }
  if (!silence_std_streams()) {
    return fail(std::error_code(errno, std::generic_category()));
  }
  return ok();
}

auto install_shutdown_handlers() -> Result<void> {
  struct sigaction sa {};
  sa.sa_handler = on_shutdown_signal;
  ::sigemptyset(&sa.sa_mask);
  for (int sig : {SIGINT, SIGTERM}) {
    if (::sigaction(sig, &sa, nullptr) < 0) {
      return fail(std::error_code(errno, std::generic_category()));
    }
  }

  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  ::sigemptyset(&ignore.sa_mask);
  if (::sigaction(SIGPIPE, &ignore, nullptr) < 0) {
    return fail(std::error_code(errno, std::generic_category()));
  }
  return ok();
}

auto request_shutdown() noexcept -> void {
  shutdown_flag.store(true, std::memory_order_release);
  shutdown_flag.notify_all();
}

auto shutdown_requested() noexcept -> bool {
  return shutdown_flag.load(std::memory_order_acquire);
}

auto wait_for_shutdown() noexcept -> void {
  shutdown_flag.wait(false, std::memory_order_acquire);
}

}  // namespace taskwarden::process
