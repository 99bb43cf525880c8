#include "webfetch/config/config.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>

namespace webfetch::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".webfetch";
constexpr const char *CONFIG_FILENAME = "config.toml";

std::optional<std::filesystem::path> g_config_path_override;
std::mutex g_override_mutex;

std::optional<std::filesystem::path> resolved_config_path_override() {
  {
    std::lock_guard<std::mutex> lock(g_override_mutex);
    if (g_config_path_override.has_value()) {
      return g_config_path_override;
    }
  }
  if (const char *env = std::getenv("WEBFETCH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> optional_string(const common::TomlDocument &doc,
                                           const std::string &key) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  const std::string value = common::trim(doc.get_string(key));
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

void load_answerer_config(Config &config, const common::TomlDocument &doc) {
  config.answerer.command = doc.get_string("answerer.command", config.answerer.command);
  if (auto model = optional_string(doc, "answerer.model")) {
    config.answerer.model = std::move(model);
  }
  if (auto level = optional_string(doc, "answerer.thinking_level")) {
    config.answerer.thinking_level = std::move(level);
  }
}

void load_browser_config(Config &config, const common::TomlDocument &doc) {
  config.browser.executable =
      common::expand_path(doc.get_string("browser.executable", config.browser.executable));
  config.browser.headless = doc.get_bool("browser.headless", config.browser.headless);
  config.browser.no_sandbox = doc.get_bool("browser.no_sandbox", config.browser.no_sandbox);
  config.browser.extra_args =
      doc.get_string_array("browser.extra_args", config.browser.extra_args);
  config.browser.page_timeout_secs =
      doc.get_u64("browser.page_timeout_secs", config.browser.page_timeout_secs);
  config.browser.launch_timeout_secs =
      doc.get_u64("browser.launch_timeout_secs", config.browser.launch_timeout_secs);
}

void load_extractor_config(Config &config, const common::TomlDocument &doc) {
  config.extractor.runner =
      common::to_lower(common::trim(doc.get_string("extractor.runner", config.extractor.runner)));
  config.extractor.command =
      common::expand_path(doc.get_string("extractor.command", config.extractor.command));
  config.extractor.args = doc.get_string_array("extractor.args", config.extractor.args);
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << common::quote_toml_string(values[i]);
  }
  out << ']';
  return out.str();
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  std::lock_guard<std::mutex> lock(g_override_mutex);
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() {
  std::lock_guard<std::mutex> lock(g_override_mutex);
  g_config_path_override = std::nullopt;
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *model = std::getenv("WEBFETCH_MODEL"); model != nullptr && *model) {
    config.answerer.model = std::string(model);
  }
  if (const char *level = std::getenv("WEBFETCH_THINKING_LEVEL"); level != nullptr && *level) {
    config.answerer.thinking_level = std::string(level);
  }
  if (const char *browser = std::getenv("WEBFETCH_BROWSER"); browser != nullptr && *browser) {
    config.browser.executable = browser;
  } else if (const char *puppeteer = std::getenv("PUPPETEER_EXECUTABLE_PATH");
             puppeteer != nullptr && *puppeteer && config.browser.executable.empty()) {
    config.browser.executable = puppeteer;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path = config_path();
  if (!cfg_path.ok()) {
    return common::Result<Config>::failure(cfg_path.error());
  }

  std::error_code ec;
  if (!std::filesystem::exists(cfg_path.value(), ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_file(cfg_path.value());
  if (!text.ok()) {
    return common::Result<Config>::failure(text.error());
  }

  const auto parsed = common::parse_toml(text.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  // Flat top-level keys mirror the legacy JSON config ("model", "thinkingLevel").
  if (auto model = optional_string(doc, "model")) {
    config.answerer.model = std::move(model);
  }
  if (auto level = optional_string(doc, "thinking_level")) {
    config.answerer.thinking_level = std::move(level);
  }

  load_answerer_config(config, doc);
  load_browser_config(config, doc);
  load_extractor_config(config, doc);

  config.cache.ttl_secs = doc.get_u64("cache.ttl_secs", config.cache.ttl_secs);
  config.cache.sweep_interval_secs =
      doc.get_u64("cache.sweep_interval_secs", config.cache.sweep_interval_secs);

  config.pipeline.content_threshold = static_cast<std::size_t>(
      doc.get_u64("pipeline.content_threshold", config.pipeline.content_threshold));
  config.pipeline.max_output_lines = static_cast<std::size_t>(
      doc.get_u64("pipeline.max_output_lines", config.pipeline.max_output_lines));
  config.pipeline.max_output_bytes = static_cast<std::size_t>(
      doc.get_u64("pipeline.max_output_bytes", config.pipeline.max_output_bytes));

  config.process.kill_grace_ms = doc.get_u64("process.kill_grace_ms", config.process.kill_grace_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

Config load_config_or_default() {
  auto loaded = load_config();
  if (loaded.ok()) {
    return std::move(loaded).value();
  }
  Config config;
  apply_env_overrides(config);
  return config;
}

common::Status save_config(const Config &config) {
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Status::error(dir.error());
  }
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }

  std::ofstream file(path.value(), std::ios::trunc);
  if (!file.is_open()) {
    return common::Status::error("failed to open config for writing: " + path.value().string());
  }

  file << "[answerer]\n";
  file << "command = " << common::quote_toml_string(config.answerer.command) << "\n";
  if (config.answerer.model.has_value()) {
    file << "model = " << common::quote_toml_string(*config.answerer.model) << "\n";
  }
  if (config.answerer.thinking_level.has_value()) {
    file << "thinking_level = " << common::quote_toml_string(*config.answerer.thinking_level)
         << "\n";
  }

  file << "\n[browser]\n";
  file << "executable = " << common::quote_toml_string(config.browser.executable) << "\n";
  file << "headless = " << bool_to_toml(config.browser.headless) << "\n";
  file << "no_sandbox = " << bool_to_toml(config.browser.no_sandbox) << "\n";
  file << "extra_args = " << string_array_to_toml(config.browser.extra_args) << "\n";
  file << "page_timeout_secs = " << config.browser.page_timeout_secs << "\n";
  file << "launch_timeout_secs = " << config.browser.launch_timeout_secs << "\n";

  file << "\n[extractor]\n";
  file << "runner = " << common::quote_toml_string(config.extractor.runner) << "\n";
  file << "command = " << common::quote_toml_string(config.extractor.command) << "\n";
  file << "args = " << string_array_to_toml(config.extractor.args) << "\n";

  file << "\n[cache]\n";
  file << "ttl_secs = " << config.cache.ttl_secs << "\n";
  file << "sweep_interval_secs = " << config.cache.sweep_interval_secs << "\n";

  file << "\n[pipeline]\n";
  file << "content_threshold = " << config.pipeline.content_threshold << "\n";
  file << "max_output_lines = " << config.pipeline.max_output_lines << "\n";
  file << "max_output_bytes = " << config.pipeline.max_output_bytes << "\n";

  file << "\n[process]\n";
  file << "kill_grace_ms = " << config.process.kill_grace_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  if (!file.good()) {
    return common::Status::error("failed to write config: " + path.value().string());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.answerer.command).empty()) {
    return common::Result<std::vector<std::string>>::failure("answerer.command must not be empty");
  }

  if (config.answerer.thinking_level.has_value()) {
    static const std::set<std::string> kLevels = {"off",    "minimal", "low",
                                                  "medium", "high",    "xhigh"};
    if (kLevels.count(common::to_lower(*config.answerer.thinking_level)) == 0) {
      warnings.push_back("answerer.thinking_level '" + *config.answerer.thinking_level +
                         "' is not a known level");
    }
  }

  if (config.browser.page_timeout_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "browser.page_timeout_secs must be greater than 0");
  }
  if (config.browser.launch_timeout_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "browser.launch_timeout_secs must be greater than 0");
  }
  if (!config.browser.executable.empty() &&
      !common::find_executable(config.browser.executable).has_value()) {
    warnings.push_back("browser.executable not found: " + config.browser.executable);
  }

  const std::string runner = common::to_lower(config.extractor.runner);
  if (runner != "auto" && runner != "uvx" && runner != "uv" && runner != "pipx" &&
      runner != "pip-run" && runner != "command") {
    return common::Result<std::vector<std::string>>::failure("Invalid extractor.runner: " +
                                                              config.extractor.runner);
  }
  if (runner == "command" && common::trim(config.extractor.command).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "extractor.command is required when extractor.runner = \"command\"");
  }

  if (config.cache.ttl_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "cache.ttl_secs must be greater than 0");
  }
  if (config.cache.sweep_interval_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "cache.sweep_interval_secs must be greater than 0");
  }
  if (config.cache.sweep_interval_secs > config.cache.ttl_secs) {
    warnings.push_back("cache.sweep_interval_secs is longer than cache.ttl_secs");
  }

  if (config.pipeline.max_output_lines == 0 || config.pipeline.max_output_bytes == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "pipeline output limits must be greater than 0");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace webfetch::config
