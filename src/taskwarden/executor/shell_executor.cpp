#include "taskwarden/core/constants.hpp"
#include "taskwarden/executor/executor.hpp"
#include "taskwarden/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace taskwarden {

namespace {

inline constexpr std::size_t kReadBufferSize = 4096;

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Built before fork; the child must not allocate.
struct ChildEnv {
  std::vector<std::string> storage;
  std::vector<char*> envp;

  ChildEnv(ResourceId resource, const TaskSettings& settings) {
    for (char** e = environ; e && *e; ++e) {
      std::string_view entry{*e};
      if (entry.starts_with("TASKWARDEN_RESOURCE_ID=") ||
          entry.starts_with("TASKWARDEN_SETTINGS=")) {
        continue;
      }
      storage.emplace_back(entry);
    }
    storage.push_back(std::format("TASKWARDEN_RESOURCE_ID={}", resource));
    storage.push_back("TASKWARDEN_SETTINGS=" + nlohmann::json(settings).dump());
    for (auto& s : storage) {
      envp.push_back(s.data());
    }
    envp.push_back(nullptr);
  }
};

auto spawn(const std::string& cmd, const std::string& working_dir,
           char** envp, int stdout_write_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    setpgid(0, 0);
    dup2(stdout_write_fd, STDOUT_FILENO);
    close(stdout_write_fd);

    if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }

    const char* argv[] = {"sh", "-c", cmd.c_str(), nullptr};
    execve("/bin/sh", const_cast<char* const*>(argv), envp);
    _exit(127);
  }

  close(stdout_write_fd);
  setpgid(pid, pid);
  return pid;
}

// Returns the captured output and whether the deadline passed.
auto read_output(int fd, std::chrono::steady_clock::time_point deadline)
    -> std::pair<std::string, bool> {
  std::string output;
  std::array<char, kReadBufferSize> buffer;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return {std::move(output), true};
    }

    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc == 0) {
      return {std::move(output), true};
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    output.append(buffer.data(), static_cast<std::size_t>(n));
    if (output.size() >= limits::kMaxExecutorOutput) {
      output.resize(limits::kMaxExecutorOutput);
      break;
    }
  }
  return {std::move(output), false};
}

class ShellExecutor : public IExecutor {
public:
  explicit ShellExecutor(ShellExecutorConfig config)
      : config_(std::move(config)) {
  }

  ~ShellExecutor() override = default;

  auto execute(ResourceId resource, const TaskSettings& settings)
      -> Result<SessionResult> override {
    if (config_.command.empty()) {
      log::error("Shell executor has no command configured");
      return fail(Error::InvalidArgument);
    }

    ChildEnv env{resource, settings};

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
      log::error("Failed to create pipe: {}", std::strerror(errno));
      return fail(Error::ExecutionFailed);
    }
    auto [read_fd, write_fd] = fds;

    auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    pid_t pid = spawn(config_.command, config_.working_dir, env.envp.data(),
                      write_fd);
    if (pid < 0) {
      log::error("Failed to fork: {}", std::strerror(errno));
      close(read_fd);
      close(write_fd);
      return fail(Error::ExecutionFailed);
    }

    auto [output, timed_out] = read_output(read_fd, deadline);
    close(read_fd);

    if (timed_out) {
      kill(-pid, SIGKILL);
    }
    int exit_code = -1;
    while (true) {
      int status = 0;
      if (waitpid(pid, &status, 0) >= 0) {
        exit_code = get_exit_code(status);
        break;
      }
      if (errno != EINTR) {
        log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
        break;
      }
    }

    if (timed_out) {
      log::error("Resource {}: command timed out after {}s", resource,
                 config_.timeout.count());
      return fail(Error::Timeout);
    }
    if (exit_code != 0) {
      log::error("Resource {}: command exited with {}", resource, exit_code);
      return fail(Error::ExecutionFailed);
    }

    if (output.find_first_not_of(" \t\r\n") == std::string::npos) {
      return SessionResult{};
    }
    auto j = nlohmann::json::parse(output, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      log::error("Resource {}: command output is not a JSON object",
                 resource);
      return fail(Error::ParseError);
    }
    return j.get<SessionResult>();
  }

private:
  ShellExecutorConfig config_;
};

}  // namespace

auto create_shell_executor(ShellExecutorConfig config)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>(std::move(config));
}

}  // namespace taskwarden
