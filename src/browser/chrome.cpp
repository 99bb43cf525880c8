#include "webfetch/browser/chrome.hpp"

#include "webfetch/browser/websocket.hpp"
#include "webfetch/common/fs.hpp"
#include "webfetch/observability/global.hpp"

#include <cstdlib>
#include <thread>
#include <unistd.h>

namespace webfetch::browser {

namespace {

constexpr auto PORT_POLL_INTERVAL = std::chrono::milliseconds(50);
constexpr auto BROWSER_CLOSE_TIMEOUT = std::chrono::seconds(2);

const std::vector<std::string> &chrome_candidates() {
  static const std::vector<std::string> names = {
      "google-chrome",
      "google-chrome-stable",
      "chromium",
      "chromium-browser",
      "chrome",
      "/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
      "/Applications/Chromium.app/Contents/MacOS/Chromium",
  };
  return names;
}

common::Result<std::filesystem::path> make_profile_dir() {
  std::error_code ec;
  auto base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    base = "/tmp";
  }
  std::string pattern = (base / "webfetch-chrome-XXXXXX").string();
  if (::mkdtemp(pattern.data()) == nullptr) {
    return common::Result<std::filesystem::path>::failure(
        "failed to create browser profile directory");
  }
  return common::Result<std::filesystem::path>::success(std::filesystem::path(pattern));
}

void remove_profile_dir(const std::filesystem::path &dir) {
  if (dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    observability::record_error("browser", "failed to remove profile " + dir.string() + ": " +
                                               ec.message());
  }
}

} // namespace

common::Result<std::string> find_chrome_executable(const std::string &configured) {
  if (!common::trim(configured).empty()) {
    if (auto found = common::find_executable(configured)) {
      return common::Result<std::string>::success(found->string());
    }
    return common::Result<std::string>::failure("browser executable not found: " + configured);
  }
  for (const auto &candidate : chrome_candidates()) {
    if (auto found = common::find_executable(candidate)) {
      return common::Result<std::string>::success(found->string());
    }
  }
  return common::Result<std::string>::failure(
      "no Chrome or Chromium executable found; set browser.executable or "
      "PUPPETEER_EXECUTABLE_PATH");
}

common::Result<std::vector<std::string>>
build_chrome_launch_args(const ChromeLaunchOptions &options) {
  if (options.executable.empty()) {
    return common::Result<std::vector<std::string>>::failure("browser executable is required");
  }
  if (options.user_data_dir.empty()) {
    return common::Result<std::vector<std::string>>::failure("user data dir is required");
  }

  std::vector<std::string> args;
  args.push_back(options.executable);
  args.push_back("--remote-debugging-port=0");
  args.push_back("--user-data-dir=" + options.user_data_dir.string());
  if (options.headless) {
    args.push_back("--headless=new");
  }
  args.push_back("--no-first-run");
  args.push_back("--no-default-browser-check");
  args.push_back("--disable-gpu");
  args.push_back("--disable-extensions");
  args.push_back("--disable-sync");
  args.push_back("--disable-background-networking");
  args.push_back("--disable-component-update");
  args.push_back("--disable-dev-shm-usage");
  args.push_back("--mute-audio");
  args.push_back("--hide-scrollbars");
  if (options.no_sandbox) {
    args.push_back("--no-sandbox");
  }
  for (const auto &extra : options.extra_args) {
    if (!common::trim(extra).empty()) {
      args.push_back(extra);
    }
  }
  args.push_back("about:blank");
  return common::Result<std::vector<std::string>>::success(std::move(args));
}

common::Result<std::string> build_devtools_ws_url(std::uint16_t port, const std::string &path) {
  if (port == 0) {
    return common::Result<std::string>::failure("invalid devtools port");
  }
  if (path.empty() || path.front() != '/') {
    return common::Result<std::string>::failure("invalid devtools path: " + path);
  }
  return common::Result<std::string>::success("ws://127.0.0.1:" + std::to_string(port) + path);
}

common::Result<DevToolsEndpoint>
read_devtools_active_port(const std::filesystem::path &user_data_dir) {
  const auto text = common::read_file(user_data_dir / "DevToolsActivePort");
  if (!text.ok()) {
    return common::Result<DevToolsEndpoint>::failure(text.error());
  }
  const auto lines = common::split_lines(text.value());
  if (lines.size() < 2) {
    return common::Result<DevToolsEndpoint>::failure("DevToolsActivePort incomplete");
  }
  DevToolsEndpoint endpoint;
  try {
    const int port = std::stoi(common::trim(lines[0]));
    if (port <= 0 || port > 65535) {
      return common::Result<DevToolsEndpoint>::failure("DevToolsActivePort has a bad port");
    }
    endpoint.port = static_cast<std::uint16_t>(port);
  } catch (const std::exception &) {
    return common::Result<DevToolsEndpoint>::failure("DevToolsActivePort has a bad port");
  }
  endpoint.path = common::trim(lines[1]);
  if (endpoint.path.empty()) {
    return common::Result<DevToolsEndpoint>::failure("DevToolsActivePort incomplete");
  }
  return common::Result<DevToolsEndpoint>::success(std::move(endpoint));
}

ChromeSession::ChromeSession(std::unique_ptr<process::ProcessHandle> process,
                             std::unique_ptr<CDPClient> client, std::filesystem::path profile_dir)
    : process_(std::move(process)), client_(std::move(client)),
      profile_dir_(std::move(profile_dir)) {}

ChromeSession::~ChromeSession() {
  if (client_) {
    if (!process_->cancel_requested() && client_->is_connected()) {
      auto closed = client_->send_command("Browser.close", {}, BROWSER_CLOSE_TIMEOUT);
      if (!closed.ok()) {
        observability::record_error("browser", "Browser.close failed: " + closed.error());
      }
    }
    client_->disconnect();
  }
  if (process_) {
    const auto exit = process_->terminate();
    observability::record_event("browser", "browser exited" +
                                               (exit.signal != 0
                                                    ? " on signal " + std::to_string(exit.signal)
                                                    : " with code " +
                                                          std::to_string(exit.exit_code)));
  }
  remove_profile_dir(profile_dir_);
}

void ChromeSession::abort() {
  std::call_once(abort_once_, [this]() {
    if (client_) {
      client_->interrupt();
    }
    if (process_) {
      process_->cancel();
    }
  });
}

ChromeLauncher::ChromeLauncher(config::BrowserConfig config, std::chrono::milliseconds kill_grace)
    : config_(std::move(config)), kill_grace_(kill_grace) {}

common::Result<std::unique_ptr<IBrowserSession>>
ChromeLauncher::launch(const common::CancellationToken &cancel) {
  using ResultT = common::Result<std::unique_ptr<IBrowserSession>>;

  auto executable = find_chrome_executable(config_.executable);
  if (!executable.ok()) {
    return ResultT::failure(executable.error());
  }

  auto profile = make_profile_dir();
  if (!profile.ok()) {
    return ResultT::failure(profile.error());
  }
  const std::filesystem::path profile_dir = profile.value();

  ChromeLaunchOptions options;
  options.executable = executable.value();
  options.user_data_dir = profile_dir;
  options.headless = config_.headless;
  options.no_sandbox = config_.no_sandbox;
  options.extra_args = config_.extra_args;
  auto argv = build_chrome_launch_args(options);
  if (!argv.ok()) {
    remove_profile_dir(profile_dir);
    return ResultT::failure(argv.error());
  }
  const std::vector<std::string> args(argv.value().begin() + 1, argv.value().end());

  process::SpawnOptions spawn_options;
  spawn_options.capture_output = false;
  spawn_options.kill_grace = kill_grace_;
  auto spawned = process::spawn(options.executable, args, spawn_options);
  if (!spawned.ok()) {
    remove_profile_dir(profile_dir);
    return ResultT::failure(spawned.error());
  }
  auto process = std::move(spawned).value();
  observability::record_event("browser", "launched " + options.executable + " (pid " +
                                             std::to_string(process->pid()) + ")");

  auto fail = [&](const std::string &reason) {
    process->terminate();
    remove_profile_dir(profile_dir);
    return ResultT::failure(reason);
  };

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(config_.launch_timeout_secs);
  std::string ws_url;
  while (true) {
    if (cancel.is_cancelled()) {
      process->cancel();
      return fail("Aborted");
    }
    if (auto endpoint = read_devtools_active_port(profile_dir); endpoint.ok()) {
      auto url = build_devtools_ws_url(endpoint.value().port, endpoint.value().path);
      if (!url.ok()) {
        return fail(url.error());
      }
      ws_url = url.value();
      break;
    }
    auto pumped = process->pump(PORT_POLL_INTERVAL);
    if (!pumped.ok()) {
      return fail(pumped.error());
    }
    if (pumped.value().has_value()) {
      const auto &exit = *pumped.value();
      remove_profile_dir(profile_dir);
      return ResultT::failure("browser exited during startup (code " +
                              std::to_string(exit.exit_code) + ")");
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return fail("browser did not expose a DevTools endpoint within " +
                  std::to_string(config_.launch_timeout_secs) + " seconds");
    }
  }

  auto client = std::make_unique<CDPClient>(std::make_unique<WebSocketTransport>());
  auto connected = client->connect(ws_url);
  if (!connected.ok()) {
    return fail("failed to connect to browser: " + connected.error());
  }
  return ResultT::success(
      std::make_unique<ChromeSession>(std::move(process), std::move(client), profile_dir));
}

} // namespace webfetch::browser
