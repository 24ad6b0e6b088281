#include "backends/command/command_backend.hpp"

#include "content/issue_markdown.hpp"
#include "core/fs_utils.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace docguard::backends::command {

namespace {

constexpr std::string_view kCancelledError = "generation cancelled";
constexpr int kPollIntervalMs = 50;

std::string ErrnoText() {
  return std::strerror(errno);
}

class ScopedFd {
public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {}
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ~ScopedFd() {
    Reset();
  }

  int get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_;
};

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return status;
}

void KillAndReap(pid_t pid) {
  ::kill(-pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

// Blocks until `pid` exits. Kills its process group when `cancel` fires first.
bool ReapChild(pid_t pid, const core::CancellationToken& cancel, ShellCommandResult& result,
               std::string& error) {
  int status = 0;
  while (true) {
    const pid_t waited = ::waitpid(pid, &status, result.cancelled ? 0 : WNOHANG);
    if (waited == pid) {
      result.exit_code = DecodeWaitStatus(status);
      return true;
    }
    if (waited < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "failed to wait for command: " + ErrnoText();
      return false;
    }
    if (!cancel.WaitFor(std::chrono::milliseconds(kPollIntervalMs))) {
      result.cancelled = true;
      ::kill(-pid, SIGKILL);
    }
  }
}

// Removes the prompt file on every exit path.
class ScopedTempFile {
public:
  explicit ScopedTempFile(fs::path path) : path_(std::move(path)) {}
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ~ScopedTempFile() {
    std::error_code ec;
    (void)fs::remove(path_, ec);
  }

  const fs::path& path() const {
    return path_;
  }

private:
  fs::path path_;
};

fs::path BuildPromptPath(const fs::path& temp_dir) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  const long pid = static_cast<long>(::getpid());
  return temp_dir / ("docguard-prompt-" + std::to_string(pid) + "-" + std::to_string(tick) +
                     "-" + std::to_string(suffix) + ".txt");
}

} // namespace

bool RunShellCommand(const std::string& command, const fs::path& stdin_path,
                     const core::CancellationToken& cancel, ShellCommandResult& result,
                     std::string& error) {
  result = ShellCommandResult{};
  error.clear();

  const std::string input_name = stdin_path.empty() ? "/dev/null" : stdin_path.string();
  ScopedFd input(::open(input_name.c_str(), O_RDONLY | O_CLOEXEC));
  if (input.get() < 0) {
    error = "failed to open command input " + input_name + ": " + ErrnoText();
    return false;
  }

  int pipe_fds[2] = {-1, -1};
  if (::pipe(pipe_fds) != 0) {
    error = "failed to create output pipe: " + ErrnoText();
    return false;
  }
  ScopedFd read_end(pipe_fds[0]);
  ScopedFd write_end(pipe_fds[1]);
  ::fcntl(read_end.get(), F_SETFD, FD_CLOEXEC);
  ::fcntl(write_end.get(), F_SETFD, FD_CLOEXEC);

  const char* command_text = command.c_str();
  const pid_t pid = ::fork();
  if (pid < 0) {
    error = "failed to execute command: " + ErrnoText();
    return false;
  }
  if (pid == 0) {
    // Child: only async-signal-safe calls until exec.
    ::setpgid(0, 0);
    ::dup2(input.get(), STDIN_FILENO);
    ::dup2(write_end.get(), STDOUT_FILENO);
    ::dup2(write_end.get(), STDERR_FILENO);
    ::execl("/bin/sh", "sh", "-c", command_text, static_cast<char*>(nullptr));
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  input.Reset();
  write_end.Reset();

  char buffer[4096];
  while (true) {
    if (cancel.IsCancelled()) {
      result.cancelled = true;
      ::kill(-pid, SIGKILL);
      break;
    }
    pollfd ready{read_end.get(), POLLIN, 0};
    const int polled = ::poll(&ready, 1, kPollIntervalMs);
    if (polled == 0 || (polled < 0 && errno == EINTR)) {
      continue;
    }
    if (polled < 0) {
      error = "failed to poll command output: " + ErrnoText();
      KillAndReap(pid);
      return false;
    }
    const ssize_t count = ::read(read_end.get(), buffer, sizeof(buffer));
    if (count > 0) {
      result.output.append(buffer, static_cast<std::size_t>(count));
    } else if (count == 0) {
      break;
    } else if (errno != EINTR && errno != EAGAIN) {
      break;
    }
  }
  read_end.Reset();

  return ReapChild(pid, cancel, result, error);
}

CommandBackend::CommandBackend(std::string command, fs::path temp_dir)
    : command_(std::move(command)), temp_dir_(std::move(temp_dir)) {
  if (temp_dir_.empty()) {
    std::error_code ec;
    temp_dir_ = fs::temp_directory_path(ec);
    if (ec) {
      temp_dir_ = ".";
    }
  }
}

bool CommandBackend::Generate(const GenerationRequest& request,
                              const core::CancellationToken& cancel, GenerationResult& result,
                              std::string& error) {
  if (command_.empty()) {
    error = "backend command is empty";
    return false;
  }
  if (cancel.IsCancelled()) {
    error = std::string(kCancelledError);
    return false;
  }

  const ScopedTempFile prompt_file(BuildPromptPath(temp_dir_));
  if (!core::WriteTextFileAtomic(prompt_file.path(), request.prompt, error)) {
    return false;
  }

  ShellCommandResult run;
  if (!RunShellCommand(command_, prompt_file.path(), cancel, run, error)) {
    return false;
  }

  if (run.cancelled || cancel.IsCancelled()) {
    error = std::string(kCancelledError);
    return false;
  }

  if (run.exit_code != 0) {
    const std::string captured = content::TrimWhitespace(run.output);
    error = "backend command exited with code " + std::to_string(run.exit_code);
    if (!captured.empty()) {
      error += ": " + captured;
    }
    return false;
  }

  result.text = std::move(run.output);
  result.attributes["backend"] = "command";
  return true;
}

} // namespace docguard::backends::command
