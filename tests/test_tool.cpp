#include "test_framework.hpp"

#include "webfetch/cli/commands.hpp"
#include "webfetch/common/json_util.hpp"
#include "webfetch/runtime/session.hpp"
#include "webfetch/tools/builtin/web_fetch.hpp"

namespace {

namespace b = webfetch::browser;
namespace e = webfetch::extract;
namespace a = webfetch::answer;

class StaticFetcher final : public b::IPageFetcher {
public:
  [[nodiscard]] b::FetchOutcome fetch(const std::string &locator,
                                      webfetch::common::CancellationToken &) override {
    ++calls;
    return b::Rendered{.markup = "<html><body>hello</body></html>", .final_locator = locator};
  }
  int calls = 0;
};

class StaticExtractor final : public e::IContentExtractor {
public:
  explicit StaticExtractor(std::string text) : text_(std::move(text)) {}

  [[nodiscard]] e::ExtractionOutcome extract(const std::string &,
                                             webfetch::common::CancellationToken &) override {
    return e::Extracted{.text = text_};
  }

private:
  std::string text_;
};

class RecordingAnswerer final : public a::IAnswerRunner {
public:
  [[nodiscard]] a::AnswerOutcome answer(const a::AnswerRequest &request,
                                        webfetch::common::CancellationToken &) override {
    last_request = request;
    ++calls;
    return a::Answered{.text = "answer from " + request.model};
  }
  int calls = 0;
  a::AnswerRequest last_request;
};

struct ToolHarness {
  std::shared_ptr<StaticFetcher> fetcher = std::make_shared<StaticFetcher>();
  std::shared_ptr<RecordingAnswerer> answerer = std::make_shared<RecordingAnswerer>();
  std::shared_ptr<webfetch::pipeline::Orchestrator> orchestrator;

  explicit ToolHarness(std::string page_text = "Extracted page")
      : orchestrator(std::make_shared<webfetch::pipeline::Orchestrator>(
            std::make_shared<webfetch::cache::ResponseCache>(), fetcher,
            std::make_shared<StaticExtractor>(std::move(page_text)), answerer)) {}

  webfetch::tools::WebFetchTool tool(std::optional<std::string> model = std::nullopt,
                                     std::optional<std::string> thinking = std::nullopt) {
    webfetch::config::AnswererConfig config;
    config.model = std::move(model);
    config.thinking_level = std::move(thinking);
    return webfetch::tools::WebFetchTool(orchestrator, config);
  }
};

webfetch::runtime::SessionOptions fake_session_options() {
  webfetch::runtime::SessionOptions options;
  options.fetcher = std::make_shared<StaticFetcher>();
  options.extractor = std::make_shared<StaticExtractor>("session page");
  options.answerer = std::make_shared<RecordingAnswerer>();
  options.keep_global_observer = true;
  return options;
}

} // namespace

void register_tool_tests(std::vector<webfetch::tests::TestCase> &tests) {
  using webfetch::tests::require;

  tests.push_back({"web_fetch_tool_schema", [] {
                     ToolHarness h;
                     auto tool = h.tool();
                     require(tool.name() == "web_fetch", "tool name");
                     require(tool.is_safe(), "web_fetch does not modify files");
                     require(webfetch::common::json_is_valid(tool.parameters_schema()),
                             "schema should be valid JSON");
                     require(tool.parameters_schema().find("\"required\":[\"url\"]") !=
                                 std::string::npos,
                             "url is required");
                     require(tool.description().find("cached for 15 minutes") !=
                                 std::string::npos,
                             "description mentions caching");
                   }});

  tests.push_back({"web_fetch_tool_missing_url", [] {
                     ToolHarness h;
                     auto tool = h.tool();
                     auto result = tool.execute({}, {});
                     require(!result.ok() && result.error() == "Missing url", "missing url");
                     auto blank = tool.execute({{"url", "   "}}, {});
                     require(!blank.ok(), "blank url rejected");
                     require(h.fetcher->calls == 0, "nothing fetched");
                   }});

  tests.push_back({"web_fetch_tool_returns_content_and_metadata", [] {
                     ToolHarness h;
                     auto tool = h.tool();
                     webfetch::tools::ToolContext ctx;
                     std::vector<std::string> updates;
                     ctx.on_update = [&](const std::string &message) { updates.push_back(message); };

                     auto first = tool.execute({{"url", "http://example.com/page"}}, ctx);
                     require(first.ok() && first.value().success, "fetch should succeed");
                     require(first.value().output == "Extracted page", "raw content");
                     require(first.value().metadata.at("cached") == "false", "first is not cached");
                     require(!first.value().truncated, "not truncated");
                     require(!updates.empty() && updates.front() ==
                                                     "Fetching https://example.com/page...",
                             "progress forwarded");

                     auto second = tool.execute({{"url", "https://example.com/page"}}, ctx);
                     require(second.ok() && second.value().metadata.at("cached") == "true",
                             "second call hits the cache");
                     require(h.fetcher->calls == 1, "one fetch");
                   }});

  tests.push_back({"web_fetch_tool_error_metadata", [] {
                     ToolHarness h;
                     auto tool = h.tool();
                     auto result = tool.execute({{"url", "ftp://example.com"}}, {});
                     require(result.ok(), "pipeline errors are tool results");
                     require(!result.value().success, "marked as failure");
                     require(result.value().metadata.at("error_kind") == "invalid_locator",
                             "error kind recorded");
                     auto bare = tool.execute({{"url", "example.com/page"}}, {});
                     require(bare.ok() && !bare.value().success,
                             "scheme-less input is rejected");
                     require(h.fetcher->calls == 0, "nothing fetched for invalid input");
                   }});

  tests.push_back({"web_fetch_tool_model_resolution", [] {
                     ToolHarness h;
                     webfetch::tools::ToolContext ctx;
                     ctx.session_model = "session/model";
                     ctx.session_thinking_level = "medium";

                     auto configured = h.tool("config/model", "high");
                     require(configured.resolve_model(ctx) == "config/model", "config wins");
                     require(configured.resolve_thinking_level(ctx) == "high",
                             "configured thinking wins");

                     auto blank = h.tool("  ");
                     require(blank.resolve_model(ctx) == "session/model",
                             "blank config falls back to session");
                     require(blank.resolve_thinking_level(ctx) == "medium", "session thinking");

                     auto none = h.tool();
                     require(!none.resolve_model(webfetch::tools::ToolContext{}).has_value(),
                             "no model anywhere");

                     auto result = configured.execute(
                         {{"url", "https://example.com/q"}, {"prompt", "What is it?"}}, ctx);
                     require(result.ok() && result.value().output == "answer from config/model",
                             "answerer uses the resolved model");
                     require(h.answerer->last_request.thinking_level == "high",
                             "answerer gets the thinking level");
                   }});

  tests.push_back({"web_fetch_tool_truncated_flag_follows_pipeline", [] {
                     ToolHarness quoting("Docs quote the footer: [Output truncated: 1 of 9 lines]");
                     auto tool = quoting.tool();
                     auto small = tool.execute({{"url", "https://example.com/quote"}}, {});
                     require(small.ok() && small.value().success, "fetch should succeed");
                     require(!small.value().truncated,
                             "footer text inside the page is not a truncation");

                     std::string long_page;
                     for (int i = 0; i < 2500; ++i) {
                       long_page += "row " + std::to_string(i) + "\n";
                     }
                     ToolHarness large(long_page);
                     auto large_tool = large.tool();
                     auto cut = large_tool.execute(
                         {{"url", "https://example.com/long"}, {"prompt", "x"}}, {});
                     require(cut.ok() && cut.value().truncated,
                             "fallback output cut to the line limit is flagged");
                   }});

  tests.push_back({"web_fetch_tool_prompt_without_model_falls_back", [] {
                     ToolHarness h;
                     auto tool = h.tool();
                     auto result =
                         tool.execute({{"url", "https://example.com/"}, {"prompt", "Why?"}}, {});
                     require(result.ok() && result.value().success, "fallback succeeds");
                     require(result.value().output.find("answerer unavailable") !=
                                 std::string::npos,
                             "fallback note");
                     require(h.answerer->calls == 0, "no answerer call");
                   }});

  tests.push_back({"session_start_stop", [] {
                     webfetch::runtime::Session session(webfetch::config::Config{},
                                                        fake_session_options());
                     require(!session.started(), "not started yet");
                     require(session.web_fetch_tool() == nullptr, "no tool before start");
                     require(session.start().ok(), "start should succeed");
                     require(session.start().ok(), "start is idempotent");
                     require(session.started(), "started");

                     auto tool = session.web_fetch_tool();
                     require(tool != nullptr, "tool available");
                     auto result = tool->execute({{"url", "https://example.com/s"}}, {});
                     require(result.ok() && result.value().output == "session page",
                             "tool runs through the session pipeline");
                     require(session.cache().size() == 1, "content cached");

                     session.stop();
                     require(!session.started(), "stopped");
                     session.stop();
                   }});

  tests.push_back({"session_detects_no_runner", [] {
                     auto options = fake_session_options();
                     options.extractor.reset();
                     options.probe = [](const std::string &) { return false; };
                     webfetch::runtime::Session session(webfetch::config::Config{}, options);
                     require(session.start().ok(), "session starts without a runner");
                     auto result = session.web_fetch_tool()->execute(
                         {{"url", "https://example.com/"}}, {});
                     require(result.ok() && !result.value().success,
                             "fetch fails at extraction");
                     require(result.value().output.find("uv") != std::string::npos,
                             "error names the missing runner: " + result.value().output);
                   }});

  tests.push_back({"cli_parse_args", [] {
                     using webfetch::cli::parse_args;
                     auto parsed = parse_args({"https://example.com", "-p", "Who?", "--model=a/b",
                                               "--thinking", "low", "-q"});
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     require(parsed.value().url == "https://example.com", "url");
                     require(parsed.value().prompt == "Who?", "prompt");
                     require(parsed.value().model == "a/b", "model");
                     require(parsed.value().thinking_level == "low", "thinking");
                     require(parsed.value().quiet, "quiet");

                     require(parse_args({"--help"}).value().help, "help without url");
                     require(parse_args({"--check-config", "--config", "/tmp/x.toml"})
                                     .value()
                                     .config_path == "/tmp/x.toml",
                             "config path");
                   }});

  tests.push_back({"cli_parse_args_errors", [] {
                     using webfetch::cli::parse_args;
                     require(parse_args({}).error() == "missing url", "missing url");
                     require(parse_args({"a", "b"}).error() == "unexpected argument: b",
                             "extra positional");
                     require(parse_args({"a", "--bogus"}).error() == "unknown option: --bogus",
                             "unknown option");
                     require(parse_args({"a", "--prompt"}).error() ==
                                 "missing value for --prompt",
                             "missing value");
                     require(webfetch::cli::usage().find("--prompt") != std::string::npos,
                             "usage lists options");
                   }});
}
