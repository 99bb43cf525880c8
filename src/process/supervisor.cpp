#include "webfetch/process/supervisor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace webfetch::process {

namespace {

constexpr int POLL_INTERVAL_MS = 100;

void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void close_pair(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] != -1) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

void set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

ProcessExit exit_from_status(int status) {
  ProcessExit out;
  if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.signal = WTERMSIG(status);
  }
  return out;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const std::string &command, const std::vector<const char *> &argv,
                             int stdin_fd, int stdout_fd, int stderr_fd, int error_fd) {
  setpgid(0, 0);

  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  std::signal(SIGPIPE, SIG_DFL);

  if (dup2(stdin_fd, STDIN_FILENO) < 0 || dup2(stdout_fd, STDOUT_FILENO) < 0 ||
      dup2(stderr_fd, STDERR_FILENO) < 0) {
    const int err = errno;
    (void)!write(error_fd, &err, sizeof(err));
    _exit(127);
  }

  execvp(command.c_str(), const_cast<char *const *>(argv.data()));
  const int err = errno;
  (void)!write(error_fd, &err, sizeof(err));
  _exit(127);
}

} // namespace

ProcessHandle::ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                             std::string input, std::chrono::milliseconds kill_grace)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
      input_(std::move(input)), kill_grace_(kill_grace) {}

ProcessHandle::~ProcessHandle() {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!reaped_) {
    ::kill(-pid_, SIGKILL);
    (void)reap_locked(0);
  }
}

void ProcessHandle::close_fd(int &fd) {
  if (fd != -1) {
    ::close(fd);
    fd = -1;
  }
}

bool ProcessHandle::reap_locked(int options) {
  if (reaped_) {
    return true;
  }
  int status = 0;
  pid_t result = -1;
  do {
    result = waitpid(pid_, &status, options);
  } while (result < 0 && errno == EINTR);

  if (result == pid_) {
    exit_ = exit_from_status(status);
    reaped_ = true;
  } else if (result < 0) {
    // ECHILD: someone else reaped it.
    reaped_ = true;
  }
  return reaped_;
}

void ProcessHandle::signal_group(int sig) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reaped_) {
    ::kill(-pid_, sig);
  }
}

void ProcessHandle::cancel() {
  if (cancel_requested_.exchange(true)) {
    return;
  }
  signal_group(SIGTERM);
}

std::optional<ProcessExit> ProcessHandle::try_reap() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reap_locked(WNOHANG)) {
    return std::nullopt;
  }
  ProcessExit out = exit_;
  out.cancelled = cancel_requested_.load();
  return out;
}

ProcessExit ProcessHandle::terminate() {
  signal_group(SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + kill_grace_;
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto exit = try_reap()) {
      return *exit;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  signal_group(SIGKILL);
  std::lock_guard<std::mutex> lock(mutex_);
  (void)reap_locked(0);
  ProcessExit out = exit_;
  out.cancelled = cancel_requested_.load();
  return out;
}

void ProcessHandle::drain(int &fd, std::string &sink, const ChunkCallback &callback) {
  std::array<char, 8192> buffer{};
  while (fd != -1) {
    const ssize_t bytes = ::read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      const std::string_view chunk(buffer.data(), static_cast<std::size_t>(bytes));
      sink.append(chunk);
      if (callback) {
        callback(chunk);
      }
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
      close_fd(fd);
    }
    return;
  }
}

void ProcessHandle::escalate() {
  const auto now = std::chrono::steady_clock::now();
  if (!term_sent_at_.has_value()) {
    if (cancel_requested_.load()) {
      term_sent_at_ = now;
    } else if (deadline_.has_value() && now >= *deadline_) {
      timed_out_ = true;
      signal_group(SIGTERM);
      term_sent_at_ = now;
    }
  } else if (!kill_sent_ && now - *term_sent_at_ >= kill_grace_) {
    signal_group(SIGKILL);
    kill_sent_ = true;
  }
}

ProcessExit ProcessHandle::finish() {
  // Grandchildren may still hold the pipes open; take what is buffered.
  drain(stdout_fd_, stdout_buffer_, on_stdout_);
  drain(stderr_fd_, stderr_buffer_, on_stderr_);
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);

  ProcessExit out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out = exit_;
  }
  out.cancelled = cancel_requested_.load();
  out.timed_out = timed_out_;
  return out;
}

common::Result<std::optional<ProcessExit>>
ProcessHandle::pump(std::chrono::milliseconds budget) {
  using ResultT = common::Result<std::optional<ProcessExit>>;
  const auto until = std::chrono::steady_clock::now() + budget;

  if (stdin_fd_ != -1 && input_offset_ >= input_.size()) {
    close_fd(stdin_fd_);
  }

  while (true) {
    std::vector<pollfd> fds;
    if (stdout_fd_ != -1) {
      fds.push_back({stdout_fd_, POLLIN, 0});
    }
    if (stderr_fd_ != -1) {
      fds.push_back({stderr_fd_, POLLIN, 0});
    }
    if (stdin_fd_ != -1) {
      fds.push_back({stdin_fd_, POLLOUT, 0});
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        until - std::chrono::steady_clock::now());
    const int slice = static_cast<int>(
        std::clamp<std::int64_t>(remaining.count(), 0, fds.empty() ? 20 : POLL_INTERVAL_MS));

    if (fds.empty()) {
      ::poll(nullptr, 0, slice);
    } else {
      const int ready = ::poll(fds.data(), fds.size(), slice);
      if (ready < 0 && errno != EINTR) {
        return ResultT::failure("poll failed: " + std::string(std::strerror(errno)));
      }
      for (const auto &pfd : fds) {
        if (pfd.revents == 0) {
          continue;
        }
        if (pfd.fd == stdout_fd_) {
          drain(stdout_fd_, stdout_buffer_, on_stdout_);
        } else if (pfd.fd == stderr_fd_) {
          drain(stderr_fd_, stderr_buffer_, on_stderr_);
        } else if (pfd.fd == stdin_fd_) {
          if ((pfd.revents & (POLLERR | POLLHUP)) != 0) {
            close_fd(stdin_fd_);
            continue;
          }
          const ssize_t written = ::write(stdin_fd_, input_.data() + input_offset_,
                                          input_.size() - input_offset_);
          if (written > 0) {
            input_offset_ += static_cast<std::size_t>(written);
          } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
            close_fd(stdin_fd_);
            continue;
          }
          if (input_offset_ >= input_.size()) {
            close_fd(stdin_fd_);
          }
        }
      }
    }

    escalate();

    bool done = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done = reap_locked(WNOHANG);
    }
    if (done) {
      return ResultT::success(finish());
    }
    if (std::chrono::steady_clock::now() >= until) {
      return ResultT::success(std::nullopt);
    }
  }
}

common::Result<ProcessExit>
ProcessHandle::wait(std::optional<std::chrono::milliseconds> timeout) {
  if (timeout.has_value()) {
    deadline_ = std::chrono::steady_clock::now() + *timeout;
  }
  while (true) {
    auto pumped = pump(std::chrono::milliseconds(POLL_INTERVAL_MS));
    if (!pumped.ok()) {
      return common::Result<ProcessExit>::failure(pumped.error());
    }
    if (pumped.value().has_value()) {
      return common::Result<ProcessExit>::success(*pumped.value());
    }
  }
}

common::Result<std::unique_ptr<ProcessHandle>>
spawn(const std::string &command, const std::vector<std::string> &args,
      const SpawnOptions &options) {
  using ResultT = common::Result<std::unique_ptr<ProcessHandle>>;
  if (command.empty()) {
    return ResultT::failure("no command given");
  }
  ignore_sigpipe_once();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  int devnull = -1;

  auto cleanup = [&]() {
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(exec_pipe);
    if (devnull != -1) {
      ::close(devnull);
      devnull = -1;
    }
  };

  devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  if (devnull < 0) {
    return ResultT::failure("failed to open /dev/null: " + std::string(std::strerror(errno)));
  }
  if ((options.input.has_value() && pipe2(in_pipe, O_CLOEXEC) != 0) ||
      (options.capture_output &&
       (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0)) ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const std::string reason = std::strerror(errno);
    cleanup();
    return ResultT::failure("failed to create pipes: " + reason);
  }

  std::vector<const char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(command.c_str());
  for (const auto &arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  const int child_stdin = options.input.has_value() ? in_pipe[0] : devnull;
  const int child_stdout = options.capture_output ? out_pipe[1] : devnull;
  const int child_stderr = options.capture_output ? err_pipe[1] : devnull;

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    cleanup();
    return ResultT::failure("failed to fork: " + reason);
  }
  if (pid == 0) {
    exec_child(command, argv, child_stdin, child_stdout, child_stderr, exec_pipe[1]);
  }

  setpgid(pid, pid);
  ::close(exec_pipe[1]);
  exec_pipe[1] = -1;

  int child_errno = 0;
  ssize_t got = -1;
  do {
    got = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    cleanup();
    return ResultT::failure("failed to launch " + command + ": " + std::strerror(child_errno));
  }

  const int parent_stdin = in_pipe[1];
  const int parent_stdout = out_pipe[0];
  const int parent_stderr = err_pipe[0];
  in_pipe[1] = -1;
  out_pipe[0] = -1;
  err_pipe[0] = -1;
  cleanup();

  if (parent_stdin != -1) {
    set_nonblocking(parent_stdin);
  }
  if (parent_stdout != -1) {
    set_nonblocking(parent_stdout);
  }
  if (parent_stderr != -1) {
    set_nonblocking(parent_stderr);
  }

  return ResultT::success(std::make_unique<ProcessHandle>(
      pid, parent_stdin, parent_stdout, parent_stderr, options.input.value_or(std::string{}),
      options.kill_grace));
}

common::Result<ProcessOutput> run_capture(const std::string &command,
                                          const std::vector<std::string> &args,
                                          const SpawnOptions &options,
                                          std::optional<std::chrono::milliseconds> timeout) {
  auto spawned = spawn(command, args, options);
  if (!spawned.ok()) {
    return common::Result<ProcessOutput>::failure(spawned.error());
  }
  auto &handle = *spawned.value();
  auto waited = handle.wait(timeout);
  if (!waited.ok()) {
    return common::Result<ProcessOutput>::failure(waited.error());
  }
  ProcessOutput output;
  output.exit = waited.value();
  output.stdout_text = handle.stdout_text();
  output.stderr_text = handle.stderr_text();
  return common::Result<ProcessOutput>::success(std::move(output));
}

} // namespace webfetch::process
