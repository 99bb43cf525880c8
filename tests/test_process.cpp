#include "test_framework.hpp"

#include "webfetch/common/cancel.hpp"
#include "webfetch/process/supervisor.hpp"

#include <csignal>
#include <thread>

namespace {

using webfetch::process::SpawnOptions;

SpawnOptions with_grace(std::chrono::milliseconds grace) {
  SpawnOptions options;
  options.kill_grace = grace;
  return options;
}

} // namespace

void register_process_tests(std::vector<webfetch::tests::TestCase> &tests) {
  using webfetch::tests::require;
  namespace p = webfetch::process;
  using std::chrono::milliseconds;

  tests.push_back({"process_capture_stdout_stderr_and_exit_code", [] {
                     auto out = p::run_capture("/bin/sh",
                                               {"-c", "printf 'out'; printf 'err' >&2; exit 3"},
                                               SpawnOptions{});
                     require(out.ok(), out.error());
                     require(out.value().stdout_text == "out", "stdout mismatch");
                     require(out.value().stderr_text == "err", "stderr mismatch");
                     require(out.value().exit.exit_code == 3, "exit code mismatch");
                     require(!out.value().exit.success(), "nonzero exit is not success");
                   }});

  tests.push_back({"process_stdin_is_delivered_and_closed", [] {
                     SpawnOptions options;
                     options.input = std::string(200'000, 'x') + "\nend";
                     auto out = p::run_capture("/bin/sh", {"-c", "wc -c"}, options);
                     require(out.ok(), out.error());
                     require(out.value().exit.success(), "wc should succeed");
                     require(out.value().stdout_text.find("200004") != std::string::npos,
                             "byte count mismatch: " + out.value().stdout_text);
                   }});

  tests.push_back({"process_incremental_stdout_callback", [] {
                     auto spawned = p::spawn(
                         "/bin/sh", {"-c", "echo one; sleep 0.1; echo two"}, SpawnOptions{});
                     require(spawned.ok(), spawned.error());
                     std::string seen;
                     spawned.value()->set_stdout_callback(
                         [&](std::string_view chunk) { seen.append(chunk); });
                     auto exit = spawned.value()->wait();
                     require(exit.ok(), exit.error());
                     require(seen == "one\ntwo\n", "callback saw: " + seen);
                     require(spawned.value()->stdout_text() == seen, "buffer matches callback");
                   }});

  tests.push_back({"process_missing_program_fails_to_launch", [] {
                     auto spawned = p::spawn("webfetch-no-such-program-xyz", {}, SpawnOptions{});
                     require(!spawned.ok(), "spawn should fail");
                     require(spawned.error().find("failed to launch") != std::string::npos,
                             "unexpected error: " + spawned.error());
                   }});

  tests.push_back({"process_timeout_terminates", [] {
                     const auto started = std::chrono::steady_clock::now();
                     auto out = p::run_capture("/bin/sh", {"-c", "sleep 30"},
                                               with_grace(milliseconds(200)), milliseconds(200));
                     require(out.ok(), out.error());
                     require(out.value().exit.timed_out, "exit should be flagged timed out");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                             "timeout should stop the child quickly");
                   }});

  tests.push_back({"process_cancel_escalates_to_sigkill", [] {
                     auto spawned = p::spawn("/bin/sh", {"-c", "trap '' TERM; sleep 30"},
                                             with_grace(milliseconds(300)));
                     require(spawned.ok(), spawned.error());
                     auto &handle = *spawned.value();
                     webfetch::common::CancellationToken token;
                     std::thread canceller([&]() {
                       std::this_thread::sleep_for(milliseconds(100));
                       token.cancel();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     webfetch::common::Result<p::ProcessExit> exit =
                         webfetch::common::Result<p::ProcessExit>::failure("not run");
                     {
                       webfetch::common::CancelRegistration registration(
                           token, [&handle]() { handle.cancel(); });
                       exit = handle.wait();
                     }
                     canceller.join();
                     require(exit.ok(), exit.error());
                     require(exit.value().cancelled, "exit should be flagged cancelled");
                     require(exit.value().signal == SIGKILL,
                             "TERM is ignored, so KILL should end it");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                             "kill should follow the grace period");
                   }});

  tests.push_back({"process_terminate_kills_process_group", [] {
                     auto spawned = p::spawn("/bin/sh", {"-c", "sleep 30 & sleep 30; wait"},
                                             with_grace(milliseconds(200)));
                     require(spawned.ok(), spawned.error());
                     const pid_t pid = spawned.value()->pid();
                     std::this_thread::sleep_for(milliseconds(100));
                     const auto exit = spawned.value()->terminate();
                     require(exit.signal != 0 || exit.exit_code != 0,
                             "terminated child should not report success");
                     bool gone = false;
                     for (int i = 0; i < 100 && !gone; ++i) {
                       gone = ::kill(-pid, 0) != 0;
                       if (!gone) {
                         std::this_thread::sleep_for(milliseconds(20));
                       }
                     }
                     require(gone, "no process in the group should remain");
                   }});

  tests.push_back({"cancel_token_runs_handlers_once", [] {
                     webfetch::common::CancellationToken token;
                     int calls = 0;
                     {
                       webfetch::common::CancelRegistration registration(token,
                                                                         [&]() { ++calls; });
                       token.cancel();
                       token.cancel();
                     }
                     require(calls == 1, "handler should run exactly once");
                     require(token.is_cancelled(), "token should stay cancelled");
                     int late = 0;
                     {
                       webfetch::common::CancelRegistration registration(token, [&]() { ++late; });
                     }
                     require(late == 1, "late registration should run immediately");
                   }});
}
