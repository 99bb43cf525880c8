#pragma once

#include "webfetch/browser/launcher.hpp"
#include "webfetch/config/schema.hpp"
#include "webfetch/process/supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace webfetch::browser {

struct ChromeLaunchOptions {
  std::string executable;
  std::filesystem::path user_data_dir;
  bool headless = true;
  bool no_sandbox = false;
  std::vector<std::string> extra_args;
};

struct DevToolsEndpoint {
  std::uint16_t port = 0;
  std::string path;
};

/// Configured executable if set, else the first Chrome/Chromium found on PATH.
[[nodiscard]] common::Result<std::string> find_chrome_executable(const std::string &configured);

/// Full argv; element 0 is the executable.
[[nodiscard]] common::Result<std::vector<std::string>>
build_chrome_launch_args(const ChromeLaunchOptions &options);

[[nodiscard]] common::Result<std::string> build_devtools_ws_url(std::uint16_t port,
                                                                const std::string &path);

/// Chrome writes "<port>\n<path>" to DevToolsActivePort in the profile once the
/// debugging endpoint listens.
[[nodiscard]] common::Result<DevToolsEndpoint>
read_devtools_active_port(const std::filesystem::path &user_data_dir);

class ChromeSession final : public IBrowserSession {
public:
  ChromeSession(std::unique_ptr<process::ProcessHandle> process,
                std::unique_ptr<CDPClient> client, std::filesystem::path profile_dir);
  ~ChromeSession() override;

  [[nodiscard]] CDPClient &client() override { return *client_; }
  void abort() override;

private:
  std::unique_ptr<process::ProcessHandle> process_;
  std::unique_ptr<CDPClient> client_;
  std::filesystem::path profile_dir_;
  std::once_flag abort_once_;
};

class ChromeLauncher final : public IBrowserLauncher {
public:
  ChromeLauncher(config::BrowserConfig config, std::chrono::milliseconds kill_grace);

  [[nodiscard]] common::Result<std::unique_ptr<IBrowserSession>>
  launch(const common::CancellationToken &cancel) override;

private:
  config::BrowserConfig config_;
  std::chrono::milliseconds kill_grace_;
};

} // namespace webfetch::browser
