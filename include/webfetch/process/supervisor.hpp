#pragma once

#include "webfetch/common/result.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace webfetch::process {

struct SpawnOptions {
  /// Written to the child's stdin, which is then closed. Without input the child
  /// reads from /dev/null.
  std::optional<std::string> input;
  /// When false stdout and stderr go to /dev/null.
  bool capture_output = true;
  std::chrono::milliseconds kill_grace{5000};
};

struct ProcessExit {
  int exit_code = -1;
  int signal = 0;
  bool cancelled = false;
  bool timed_out = false;

  [[nodiscard]] bool success() const {
    return signal == 0 && exit_code == 0 && !cancelled && !timed_out;
  }
};

struct ProcessOutput {
  ProcessExit exit;
  std::string stdout_text;
  std::string stderr_text;
};

/// A running child in its own process group. The destructor kills and reaps the
/// child if nobody waited for it.
class ProcessHandle {
public:
  using ChunkCallback = std::function<void(std::string_view)>;

  ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd, std::string input,
                std::chrono::milliseconds kill_grace);
  ~ProcessHandle();

  ProcessHandle(const ProcessHandle &) = delete;
  ProcessHandle &operator=(const ProcessHandle &) = delete;

  [[nodiscard]] pid_t pid() const { return pid_; }

  void set_stdout_callback(ChunkCallback callback) { on_stdout_ = std::move(callback); }
  void set_stderr_callback(ChunkCallback callback) { on_stderr_ = std::move(callback); }

  /// Drive stdin/stdout/stderr for at most `budget`. Returns the exit once the
  /// child has been reaped, std::nullopt while it is still running.
  [[nodiscard]] common::Result<std::optional<ProcessExit>> pump(std::chrono::milliseconds budget);

  /// Pump until the child exits. After a timeout or a cancel() the group gets
  /// SIGTERM and, once the grace period passes, SIGKILL.
  [[nodiscard]] common::Result<ProcessExit>
  wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// Everything read so far.
  [[nodiscard]] const std::string &stdout_text() const { return stdout_buffer_; }
  [[nodiscard]] const std::string &stderr_text() const { return stderr_buffer_; }

  /// Non-blocking reap. Returns the exit once the child is gone.
  [[nodiscard]] std::optional<ProcessExit> try_reap();

  /// Safe to call from any thread, any number of times.
  void cancel();
  [[nodiscard]] bool cancel_requested() const { return cancel_requested_.load(); }

  /// SIGTERM, wait up to the grace period, then SIGKILL. Blocks until reaped.
  ProcessExit terminate();

private:
  [[nodiscard]] bool reap_locked(int options);
  void signal_group(int sig);
  void close_fd(int &fd);
  void drain(int &fd, std::string &sink, const ChunkCallback &callback);
  void escalate();
  [[nodiscard]] ProcessExit finish();

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::string input_;
  std::size_t input_offset_ = 0;
  std::chrono::milliseconds kill_grace_;
  ChunkCallback on_stdout_;
  ChunkCallback on_stderr_;
  std::string stdout_buffer_;
  std::string stderr_buffer_;

  std::optional<std::chrono::steady_clock::time_point> deadline_;
  std::optional<std::chrono::steady_clock::time_point> term_sent_at_;
  bool kill_sent_ = false;
  bool timed_out_ = false;

  std::mutex mutex_;
  bool reaped_ = false;
  ProcessExit exit_;
  std::atomic<bool> cancel_requested_{false};
};

/// Launch `command` (looked up on PATH) with `args`. Fails only when the program
/// could not be started.
[[nodiscard]] common::Result<std::unique_ptr<ProcessHandle>>
spawn(const std::string &command, const std::vector<std::string> &args,
      const SpawnOptions &options = {});

/// Spawn, collect both streams and wait.
[[nodiscard]] common::Result<ProcessOutput>
run_capture(const std::string &command, const std::vector<std::string> &args,
            const SpawnOptions &options = {},
            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace webfetch::process
