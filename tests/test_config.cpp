#include "test_framework.hpp"

#include "webfetch/config/config.hpp"
#include "webfetch/observability/factory.hpp"
#include "webfetch/observability/global.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

std::filesystem::path make_temp_dir() {
  std::string pattern = (std::filesystem::temp_directory_path() / "webfetch-config-XXXXXX").string();
  if (::mkdtemp(pattern.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed");
  }
  return pattern;
}

/// Points the config loader at a scratch file and clears env overrides.
class ConfigOverrideGuard {
public:
  ConfigOverrideGuard() : dir_(make_temp_dir()) {
    for (const char *name : kEnv) {
      ::unsetenv(name);
    }
    webfetch::config::set_config_path_override(dir_ / "config.toml");
  }

  ~ConfigOverrideGuard() {
    webfetch::config::clear_config_path_override();
    for (const char *name : kEnv) {
      ::unsetenv(name);
    }
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;

  void write(const std::string &text) const {
    std::ofstream out(dir_ / "config.toml", std::ios::trunc);
    out << text;
  }

  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

private:
  static constexpr const char *kEnv[] = {"WEBFETCH_MODEL", "WEBFETCH_THINKING_LEVEL",
                                         "WEBFETCH_BROWSER", "PUPPETEER_EXECUTABLE_PATH"};
  std::filesystem::path dir_;
};

} // namespace

void register_config_tests(std::vector<webfetch::tests::TestCase> &tests) {
  using webfetch::tests::require;
  namespace cfg = webfetch::config;

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     ConfigOverrideGuard guard;
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.answerer.command == "pi", "default answerer command");
                     require(!config.answerer.model.has_value(), "no model override by default");
                     require(config.cache.ttl_secs == 900, "default ttl");
                     require(config.pipeline.content_threshold == 50'000, "default threshold");
                     require(config.browser.page_timeout_secs == 30, "default page timeout");
                   }});

  tests.push_back({"config_loads_sections", [] {
                     ConfigOverrideGuard guard;
                     guard.write(R"(
[answerer]
model = "anthropic/claude-haiku"
thinking_level = "low"

[browser]
no_sandbox = true
extra_args = ["--lang=en"]
page_timeout_secs = 10

[extractor]
runner = "UVX"

[cache]
ttl_secs = 60
sweep_interval_secs = 20

[pipeline]
content_threshold = 1000

[observability]
backend = "none"
)");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.answerer.model.value_or("") == "anthropic/claude-haiku",
                             "model override");
                     require(config.answerer.thinking_level.value_or("") == "low",
                             "thinking override");
                     require(config.browser.no_sandbox, "no_sandbox");
                     require(config.browser.extra_args.size() == 1, "extra args");
                     require(config.browser.page_timeout_secs == 10, "page timeout");
                     require(config.extractor.runner == "uvx", "runner is lowercased");
                     require(config.cache.ttl_secs == 60 && config.cache.sweep_interval_secs == 20,
                             "cache timings");
                     require(config.pipeline.content_threshold == 1000, "threshold");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_top_level_model_keys", [] {
                     ConfigOverrideGuard guard;
                     guard.write("model = \"openai/gpt-mini\"\nthinking_level = \"minimal\"\n");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().answerer.model.value_or("") == "openai/gpt-mini",
                             "top-level model");
                     require(loaded.value().answerer.thinking_level.value_or("") == "minimal",
                             "top-level thinking level");
                   }});

  tests.push_back({"config_blank_model_is_not_an_override", [] {
                     ConfigOverrideGuard guard;
                     guard.write("[answerer]\nmodel = \"  \"\n");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(!loaded.value().answerer.model.has_value(),
                             "blank model should be ignored");
                   }});

  tests.push_back({"config_malformed_file_falls_back_silently", [] {
                     ConfigOverrideGuard guard;
                     guard.write("[answerer\nmodel = \"x\"\n");
                     require(!cfg::load_config().ok(), "strict load should fail");
                     const auto config = cfg::load_config_or_default();
                     require(!config.answerer.model.has_value(), "defaults expected");
                     require(config.answerer.command == "pi", "default command expected");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     ConfigOverrideGuard guard;
                     guard.write("[answerer]\nmodel = \"from-file\"\n");
                     ::setenv("WEBFETCH_MODEL", "from-env", 1);
                     ::setenv("WEBFETCH_THINKING_LEVEL", "high", 1);
                     ::setenv("PUPPETEER_EXECUTABLE_PATH", "/opt/chrome/chrome", 1);
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().answerer.model.value_or("") == "from-env",
                             "env model wins");
                     require(loaded.value().answerer.thinking_level.value_or("") == "high",
                             "env thinking level");
                     require(loaded.value().browser.executable == "/opt/chrome/chrome",
                             "puppeteer executable path");
                   }});

  tests.push_back({"config_save_then_load", [] {
                     ConfigOverrideGuard guard;
                     cfg::Config config;
                     config.answerer.model = "m";
                     config.browser.extra_args = {"--a", "--b=\"q\""};
                     config.extractor.runner = "command";
                     config.extractor.command = "/usr/bin/trafilatura";
                     config.process.kill_grace_ms = 250;
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().answerer.model.value_or("") == "m", "model");
                     require(loaded.value().browser.extra_args == config.browser.extra_args,
                             "extra args");
                     require(loaded.value().extractor.command == "/usr/bin/trafilatura",
                             "command");
                     require(loaded.value().process.kill_grace_ms == 250, "kill grace");
                   }});

  tests.push_back({"config_validation", [] {
                     cfg::Config config;
                     auto ok = cfg::validate_config(config);
                     require(ok.ok(), ok.error());
                     require(ok.value().empty(), "defaults should not warn");

                     config.extractor.runner = "command";
                     require(!cfg::validate_config(config).ok(),
                             "command runner without command is an error");
                     config.extractor.runner = "conda";
                     require(!cfg::validate_config(config).ok(), "unknown runner is an error");
                     config.extractor.runner = "auto";

                     config.observability.backend = "otel";
                     require(!cfg::validate_config(config).ok(), "unknown backend is an error");
                     config.observability.backend = "log";

                     config.answerer.thinking_level = "extreme";
                     config.cache.sweep_interval_secs = config.cache.ttl_secs + 1;
                     auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     require(warned.value().size() == 2, "expected two warnings");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     cfg::Config config;
                     require(webfetch::observability::create_observer(config)->name() == "log",
                             "log backend by default");
                     config.observability.backend = "none";
                     require(webfetch::observability::create_observer(config)->name() == "none",
                             "none backend");
                   }});
}
