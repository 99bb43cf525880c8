#include "webfetch/cli/commands.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/config/config.hpp"
#include "webfetch/runtime/session.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace webfetch::cli {

namespace {

std::string version_string() {
#ifdef WEBFETCH_VERSION
  return std::string("webfetch ") + WEBFETCH_VERSION;
#else
  return "webfetch 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes `--name value` or `--name=value`. Returns false when the value is missing.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::optional<std::string> &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name,
               const std::string &short_name = {}) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

int run_check_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "config error: " << loaded.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    std::cerr << "config error: " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  const auto path = config::config_path();
  std::cout << "config ok" << (path.ok() ? ": " + path.value().string() : std::string{}) << "\n";
  return 0;
}

/// Cancels the token on SIGINT or SIGTERM. The signals must already be blocked
/// in every thread; SIGUSR1 wakes the watcher for shutdown.
class SignalWatcher {
public:
  explicit SignalWatcher(std::shared_ptr<common::CancellationToken> token)
      : token_(std::move(token)) {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    sigaddset(&set_, SIGUSR1);
    thread_ = std::thread([this]() {
      while (true) {
        int signal_number = 0;
        if (sigwait(&set_, &signal_number) != 0) {
          continue;
        }
        if (signal_number == SIGUSR1) {
          return;
        }
        std::cerr << "\nCancelling...\n";
        token_->cancel();
      }
    });
  }

  ~SignalWatcher() {
    pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
  }

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  static void block_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
  }

private:
  std::shared_ptr<common::CancellationToken> token_;
  sigset_t set_{};
  std::thread thread_;
};

} // namespace

std::string usage() {
  return "Usage: webfetch <url> [options]\n"
         "\n"
         "Fetch a web page in a headless browser and print its main content as markdown.\n"
         "\n"
         "Options:\n"
         "  -p, --prompt TEXT      What information to extract from the page\n"
         "  -m, --model ID         Answerer model when the config names none\n"
         "  -t, --thinking LEVEL   Answerer thinking level when the config names none\n"
         "      --config PATH      Use an alternate config file\n"
         "      --check-config     Validate the config file and exit\n"
         "  -q, --quiet            Do not print progress\n"
         "  -h, --help             Show this help\n"
         "  -V, --version          Show the version\n";
}

common::Result<CliOptions> parse_args(std::vector<std::string> args) {
  CliOptions options;
  options.help = take_flag(args, "--help", "-h");
  options.version = take_flag(args, "--version", "-V");
  options.check_config = take_flag(args, "--check-config");
  options.quiet = take_flag(args, "--quiet", "-q");

  std::optional<std::string> model;
  std::optional<std::string> thinking;
  if (!take_option(args, "--prompt", "-p", options.prompt)) {
    return common::Result<CliOptions>::failure("missing value for --prompt");
  }
  if (!take_option(args, "--model", "-m", model)) {
    return common::Result<CliOptions>::failure("missing value for --model");
  }
  if (!take_option(args, "--thinking", "-t", thinking)) {
    return common::Result<CliOptions>::failure("missing value for --thinking");
  }
  if (!take_option(args, "--config", "", options.config_path)) {
    return common::Result<CliOptions>::failure("missing value for --config");
  }
  options.model = model.value_or("");
  options.thinking_level = thinking.value_or("");

  if (options.help || options.version || options.check_config) {
    return common::Result<CliOptions>::success(std::move(options));
  }

  for (const auto &arg : args) {
    if (arg.size() > 1 && arg.front() == '-') {
      return common::Result<CliOptions>::failure("unknown option: " + arg);
    }
  }
  if (args.empty()) {
    return common::Result<CliOptions>::failure("missing url");
  }
  if (args.size() > 1) {
    return common::Result<CliOptions>::failure("unexpected argument: " + args[1]);
  }
  options.url = args.front();
  return common::Result<CliOptions>::success(std::move(options));
}

int run_cli(int argc, char **argv) {
  auto parsed = parse_args(collect_args(argc - 1, argv + 1));
  if (!parsed.ok()) {
    std::cerr << parsed.error() << "\n\n" << usage();
    return 1;
  }
  const CliOptions &options = parsed.value();
  if (options.help) {
    std::cout << usage();
    return 0;
  }
  if (options.version) {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (options.config_path.has_value()) {
    config::set_config_path_override(std::filesystem::path(*options.config_path));
  }
  if (options.check_config) {
    return run_check_config();
  }

  SignalWatcher::block_signals();
  auto cancel = std::make_shared<common::CancellationToken>();
  SignalWatcher watcher(cancel);

  runtime::Session session(config::load_config_or_default());
  auto started = session.start();
  if (!started.ok()) {
    std::cerr << "failed to start: " << started.error() << "\n";
    return 1;
  }

  tools::ToolContext ctx;
  std::error_code ec;
  ctx.workspace_path = std::filesystem::current_path(ec);
  ctx.session_model = options.model;
  ctx.session_thinking_level = options.thinking_level;
  ctx.cancel = cancel;
  if (!options.quiet) {
    ctx.on_update = [](const std::string &message) { std::cerr << message << "\n"; };
  }

  tools::ToolArgs args;
  args["url"] = options.url;
  if (options.prompt.has_value()) {
    args["prompt"] = *options.prompt;
  }

  auto result = session.web_fetch_tool()->execute(args, ctx);
  session.stop();
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  if (!result.value().success) {
    std::cerr << result.value().output << "\n";
    return 1;
  }
  std::cout << result.value().output << "\n";
  return 0;
}

} // namespace webfetch::cli
