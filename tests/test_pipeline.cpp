#include "test_framework.hpp"

#include "webfetch/pipeline/decision.hpp"
#include "webfetch/pipeline/orchestrator.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace {

namespace b = webfetch::browser;
namespace e = webfetch::extract;
namespace a = webfetch::answer;
namespace p = webfetch::pipeline;
using webfetch::common::ErrorKind;
using webfetch::common::StageFailure;

class FakeFetcher final : public b::IPageFetcher {
public:
  explicit FakeFetcher(b::FetchOutcome outcome) : outcome_(std::move(outcome)) {}

  [[nodiscard]] b::FetchOutcome fetch(const std::string &locator,
                                      webfetch::common::CancellationToken &cancel) override {
    ++calls;
    last_locator = locator;
    if (block_until_cancelled) {
      cancel.wait_for(std::chrono::seconds(10));
      return webfetch::common::aborted_failure();
    }
    return outcome_;
  }

  std::atomic<int> calls{0};
  std::string last_locator;
  bool block_until_cancelled = false;

private:
  b::FetchOutcome outcome_;
};

class FakeExtractor final : public e::IContentExtractor {
public:
  explicit FakeExtractor(e::ExtractionOutcome outcome) : outcome_(std::move(outcome)) {}

  [[nodiscard]] e::ExtractionOutcome extract(const std::string &markup,
                                             webfetch::common::CancellationToken &) override {
    ++calls;
    last_markup = markup;
    return outcome_;
  }

  int calls = 0;
  std::string last_markup;

private:
  e::ExtractionOutcome outcome_;
};

class FakeAnswerer final : public a::IAnswerRunner {
public:
  explicit FakeAnswerer(a::AnswerOutcome outcome) : outcome_(std::move(outcome)) {}

  [[nodiscard]] a::AnswerOutcome answer(const a::AnswerRequest &request,
                                        webfetch::common::CancellationToken &) override {
    ++calls;
    last_request = request;
    return outcome_;
  }

  int calls = 0;
  a::AnswerRequest last_request;

private:
  a::AnswerOutcome outcome_;
};

struct Harness {
  std::shared_ptr<webfetch::cache::ResponseCache> cache =
      std::make_shared<webfetch::cache::ResponseCache>();
  std::shared_ptr<FakeFetcher> fetcher;
  std::shared_ptr<FakeExtractor> extractor;
  std::shared_ptr<FakeAnswerer> answerer;
  std::vector<std::string> progress;
  webfetch::common::CancellationToken cancel;

  explicit Harness(std::string page_text,
                   a::AnswerOutcome answer = a::Answered{.text = "model answer"},
                   b::FetchOutcome fetched = b::Rendered{.markup = "<html>page</html>",
                                                         .final_locator = "https://example.com/"})
      : fetcher(std::make_shared<FakeFetcher>(std::move(fetched))),
        extractor(std::make_shared<FakeExtractor>(e::Extracted{.text = std::move(page_text)})),
        answerer(std::make_shared<FakeAnswerer>(std::move(answer))) {}

  p::FetchResponse run(const std::string &url, std::optional<std::string> prompt = std::nullopt,
                       std::optional<std::string> model = std::string("anthropic/claude-haiku")) {
    p::Orchestrator orchestrator(cache, fetcher, extractor, answerer);
    p::FetchRequest request;
    request.url = url;
    request.prompt = std::move(prompt);
    request.model = std::move(model);
    request.thinking_level = "low";
    return orchestrator.run(request, cancel,
                            [this](const std::string &message) { progress.push_back(message); });
  }
};

} // namespace

void register_pipeline_tests(std::vector<webfetch::tests::TestCase> &tests) {
  using webfetch::tests::require;

  tests.push_back({"decision_table", [] {
                     require(std::holds_alternative<p::ReturnRaw>(p::decide(false, 40'000, true)),
                             "small page without prompt returns raw");
                     require(!std::get<p::ReturnRaw>(p::decide(false, 40'000, false)).truncate,
                             "small page is not truncated");
                     require(std::holds_alternative<p::Summarize>(p::decide(false, 60'000, true)),
                             "large page with answerer is summarized");
                     const auto large_no_answerer = p::decide(false, 60'000, false);
                     require(std::holds_alternative<p::ReturnRaw>(large_no_answerer) &&
                                 std::get<p::ReturnRaw>(large_no_answerer).truncate,
                             "large page without answerer is truncated raw");
                     require(std::holds_alternative<p::AnswerPrompt>(p::decide(true, 10, true)),
                             "prompt with answerer");
                     require(std::holds_alternative<p::AnswerPrompt>(p::decide(true, 90'000, true)),
                             "prompt with answerer at any length");
                     require(std::holds_alternative<p::FallbackRaw>(p::decide(true, 10, false)),
                             "prompt without answerer falls back");
                     require(std::holds_alternative<p::ReturnRaw>(p::decide(false, 50'000, true)),
                             "threshold is inclusive");
                   }});

  tests.push_back({"decision_character_count_is_code_points", [] {
                     require(p::character_count("abc") == 3, "ascii");
                     require(p::character_count("h\xC3\xA9llo \xF0\x9F\x98\x80") == 7,
                             "multibyte characters count once");
                   }});

  tests.push_back({"truncate_head_line_limit", [] {
                     std::string content;
                     for (int i = 0; i < 10; ++i) {
                       content += "line" + std::to_string(i) + "\n";
                     }
                     const auto result = p::truncate_head(content, 3, 1024);
                     require(result.truncated, "should truncate");
                     require(result.content == "line0\nline1\nline2", "kept lines");
                     require(result.output_lines == 3 && result.total_lines == 11, "line counts");
                     require(p::render_truncated(result) ==
                                 "line0\nline1\nline2\n\n[Output truncated: 3 of 11 lines (17B "
                                 "of 60B)]",
                             "footer: " + p::render_truncated(result));
                   }});

  tests.push_back({"truncate_head_byte_limit", [] {
                     const std::string content = std::string(100, 'a') + "\n" +
                                                 std::string(100, 'b') + "\n" +
                                                 std::string(100, 'c');
                     const auto result = p::truncate_head(content, 2000, 250);
                     require(result.truncated, "should truncate");
                     require(result.content == std::string(100, 'a') + "\n" +
                                                   std::string(100, 'b'),
                             "whole lines within the byte budget");
                     require(result.output_bytes == 201, "kept bytes");
                     const auto untouched = p::truncate_head("short", 2000, 250);
                     require(!untouched.truncated && p::render_truncated(untouched) == "short",
                             "small content untouched");
                   }});

  tests.push_back({"format_size_units", [] {
                     require(p::format_size(512) == "512B", "bytes");
                     require(p::format_size(1536) == "1.5KB", "kilobytes");
                     require(p::format_size(2 * 1024 * 1024) == "2.0MB", "megabytes");
                   }});

  tests.push_back({"instructions_carry_guardrails", [] {
                     const auto instruction = p::answer_instruction("List the authors");
                     require(instruction.find("List the authors") == 0, "prompt first");
                     require(instruction.find("125 characters") != std::string::npos,
                             "quote limit guardrail");
                     require(p::summarize_instruction().find("call web_fetch again") !=
                                 std::string::npos,
                             "summary invites a follow-up prompt");
                   }});

  tests.push_back({"orchestrator_invalid_locator_spawns_nothing", [] {
                     Harness h("text");
                     const auto response = h.run("ftp://example.com/file");
                     require(response.is_error, "should be an error");
                     require(response.error_kind == ErrorKind::InvalidLocator, "invalid locator");
                     require(h.fetcher->calls == 0 && h.extractor->calls == 0,
                             "no stage should run");
                     require(h.progress.empty(), "no progress for invalid input");
                   }});

  tests.push_back({"orchestrator_small_page_returns_raw_and_caches", [] {
                     Harness h("# Title\n\nBody text");
                     const auto response = h.run("http://example.com/docs");
                     require(!response.is_error, response.text);
                     require(response.text == "# Title\n\nBody text", "raw content expected");
                     require(!response.truncated, "small content is not truncated");
                     require(h.fetcher->last_locator == "https://example.com/docs",
                             "fetch should use the normalized locator");
                     require(h.extractor->last_markup == "<html>page</html>",
                             "extractor gets the markup");
                     require(h.answerer->calls == 0, "no answerer for small pages");
                     require(h.progress == std::vector<std::string>(
                                              {"Fetching https://example.com/docs...",
                                               "Extracting content..."}),
                             "progress checkpoints");
                     require(h.cache->get("https://example.com/docs").has_value(),
                             "content should be cached");
                   }});

  tests.push_back({"orchestrator_cache_hit_skips_fetch", [] {
                     Harness h("cached body");
                     (void)h.run("https://example.com/a");
                     h.progress.clear();
                     const auto response = h.run("http://example.com/a", "Summarize it");
                     require(response.from_cache, "second call should hit the cache");
                     require(h.fetcher->calls == 1, "fetch should run once");
                     require(response.text == "model answer", "prompt still answered");
                     require(h.progress == std::vector<std::string>({"Cache hit, processing..."}),
                             "cache hits emit a single progress message");
                   }});

  tests.push_back({"orchestrator_cross_host_redirect_not_extracted", [] {
                     Harness h("unused", a::Answered{.text = "x"},
                               b::Redirected{.target_locator = "https://other.example/landing"});
                     const auto response = h.run("https://example.com/start");
                     require(!response.is_error, "redirect is informational");
                     require(response.text ==
                                 "The URL redirected to a different host: "
                                 "https://other.example/landing\n\nTo fetch the content, make a "
                                 "new web_fetch call with this URL: https://other.example/landing",
                             "unexpected text: " + response.text);
                     require(h.extractor->calls == 0, "no extraction after a cross-host redirect");
                     require(h.cache->size() == 0, "redirects are not cached");
                   }});

  tests.push_back({"orchestrator_fetch_failure_is_error", [] {
                     Harness h("unused", a::Answered{.text = "x"},
                               StageFailure{.kind = ErrorKind::Timeout,
                                            .reason = "Page load timed out after 30 seconds for "
                                                      "URL: https://example.com/",
                                            .diagnostic = {}});
                     const auto response = h.run("https://example.com/");
                     require(response.is_error, "fetch failure should be an error");
                     require(response.error_kind == ErrorKind::Timeout, "timeout kind");
                     require(h.extractor->calls == 0, "no extraction");
                   }});

  tests.push_back({"orchestrator_extraction_failure_is_error", [] {
                     Harness h("unused");
                     h.extractor = std::make_shared<FakeExtractor>(
                         StageFailure{.kind = ErrorKind::EmptyOutput,
                                      .reason = "no content extracted",
                                      .diagnostic = {}});
                     const auto response = h.run("https://example.com/");
                     require(response.is_error && response.error_kind == ErrorKind::EmptyOutput,
                             "extraction failure should surface");
                     require(h.cache->size() == 0, "failures are not cached");
                   }});

  tests.push_back({"orchestrator_prompt_uses_answerer", [] {
                     Harness h("Short page");
                     const auto response = h.run("https://example.com/", "Who wrote it?");
                     require(response.text == "model answer", "answer expected");
                     require(h.answerer->last_request.content == "Short page", "content passed");
                     require(h.answerer->last_request.instruction.find("Who wrote it?") == 0,
                             "instruction starts with the prompt");
                     require(h.answerer->last_request.model == "anthropic/claude-haiku",
                             "model passed");
                     require(h.answerer->last_request.thinking_level == "low",
                             "thinking level passed");
                     require(h.progress.back() == "Processing with answerer...",
                             "answerer progress message");
                   }});

  tests.push_back({"orchestrator_large_page_is_summarized", [] {
                     Harness h(std::string(60'000, 'x'));
                     const auto response = h.run("https://example.com/");
                     require(response.text == "model answer", "summary expected");
                     require(h.answerer->last_request.instruction == p::summarize_instruction(),
                             "summary instruction");
                     require(h.progress.back() == "Page content is large, generating summary...",
                             "summary progress message");
                   }});

  tests.push_back({"orchestrator_large_page_without_answerer_truncates", [] {
                     std::string page;
                     for (int i = 0; i < 3000; ++i) {
                       page += "line of text number " + std::to_string(i) + "\n";
                     }
                     Harness h(page);
                     const auto response = h.run("https://example.com/", std::nullopt, std::nullopt);
                     require(!response.is_error, response.text);
                     require(h.answerer->calls == 0, "no answerer without a model");
                     require(response.text.find("[Output truncated: 2000 of") != std::string::npos,
                             "truncation footer expected");
                     require(response.truncated, "response should be flagged as truncated");
                     require(response.text.find("LLM") == std::string::npos &&
                                 response.text.find("summary") == std::string::npos,
                             "no answerer note expected");
                   }});

  tests.push_back({"orchestrator_prompt_without_answerer_falls_back", [] {
                     Harness h("Some content");
                     const auto response = h.run("https://example.com/", "What?", std::string(""));
                     require(!response.is_error, "fallback is not an error");
                     require(response.text.find("Some content") == 0, "raw content first");
                     require(response.text.find("answerer unavailable") != std::string::npos,
                             "unavailable note expected");
                     require(h.answerer->calls == 0, "answerer must not run");
                   }});

  tests.push_back({"orchestrator_answerer_failure_falls_back", [] {
                     Harness h("Body", StageFailure{.kind = ErrorKind::ProcessExitFailure,
                                                    .reason = "Sub-agent failed (exit code 1): x",
                                                    .diagnostic = {}});
                     const auto prompted = h.run("https://example.com/p", "Question?");
                     require(!prompted.is_error, "degrades instead of failing");
                     require(prompted.text ==
                                 "Body\n\nLLM processing failed: Sub-agent failed (exit code 1): "
                                 "x. Returning raw extracted content instead.",
                             "unexpected text: " + prompted.text);

                     Harness big(std::string(60'000, 'y'),
                                 StageFailure{.kind = ErrorKind::EmptyOutput,
                                              .reason = "Sub-agent returned no response",
                                              .diagnostic = {}});
                     const auto summarized = big.run("https://example.com/big");
                     require(!summarized.is_error, "summary failure degrades");
                     require(summarized.text.find("Could not generate summary: Sub-agent "
                                                  "returned no response.") != std::string::npos,
                             "summary failure note expected");
                     require(summarized.text.find("[Output truncated:") != std::string::npos,
                             "raw content is truncated");
                   }});

  tests.push_back({"orchestrator_abort_preempts", [] {
                     Harness h("unused");
                     h.fetcher->block_until_cancelled = true;
                     std::thread canceller([&]() {
                       std::this_thread::sleep_for(std::chrono::milliseconds(50));
                       h.cancel.cancel();
                     });
                     const auto response = h.run("https://example.com/");
                     canceller.join();
                     require(response.is_error && response.error_kind == ErrorKind::Aborted,
                             "abort should win");
                     require(h.extractor->calls == 0, "no stage after abort");
                   }});

  tests.push_back({"orchestrator_answerer_abort_is_error", [] {
                     Harness h("Body", webfetch::common::aborted_failure());
                     const auto response = h.run("https://example.com/", "Question?");
                     require(response.is_error && response.error_kind == ErrorKind::Aborted,
                             "aborted answerer should not fall back");
                   }});
}
