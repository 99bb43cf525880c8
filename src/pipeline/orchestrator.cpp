#include "webfetch/pipeline/orchestrator.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/observability/global.hpp"
#include "webfetch/url/locator.hpp"

namespace webfetch::pipeline {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

FetchResponse text_response(std::string text) {
  FetchResponse response;
  response.text = std::move(text);
  return response;
}

FetchResponse error_response(common::ErrorKind kind, std::string text) {
  FetchResponse response;
  response.text = std::move(text);
  response.is_error = true;
  response.error_kind = kind;
  return response;
}

FetchResponse failure_response(const common::StageFailure &failure) {
  return error_response(failure.kind, failure.reason);
}

FetchResponse aborted_response() { return error_response(common::ErrorKind::Aborted, "Aborted"); }

void notify(const ProgressCallback &progress, const std::string &message) {
  if (progress) {
    progress(message);
  }
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<cache::ResponseCache> cache,
                           std::shared_ptr<browser::IPageFetcher> fetcher,
                           std::shared_ptr<extract::IContentExtractor> extractor,
                           std::shared_ptr<answer::IAnswerRunner> answerer,
                           config::PipelineConfig config)
    : cache_(std::move(cache)), fetcher_(std::move(fetcher)), extractor_(std::move(extractor)),
      answerer_(std::move(answerer)), config_(config) {}

FetchResponse Orchestrator::raw_response(const std::string &content, bool truncate,
                                         const std::string &note) const {
  FetchResponse response;
  if (truncate) {
    const TruncationResult truncation =
        truncate_head(content, config_.max_output_lines, config_.max_output_bytes);
    response.text = render_truncated(truncation);
    response.truncated = truncation.truncated;
  } else {
    response.text = content;
  }
  if (!note.empty()) {
    response.text += "\n\n" + note;
  }
  return response;
}

FetchResponse Orchestrator::run(const FetchRequest &request, common::CancellationToken &cancel,
                                const ProgressCallback &progress) {
  auto normalized = url::normalize_locator(request.url);
  if (!normalized.ok()) {
    return error_response(common::ErrorKind::InvalidLocator, normalized.error());
  }
  const std::string &locator = normalized.value();

  if (cancel.is_cancelled()) {
    return aborted_response();
  }

  if (auto cached = cache_->get(locator)) {
    notify(progress, "Cache hit, processing...");
    auto response = process_content(*cached, request, cancel, ProgressCallback{});
    response.from_cache = true;
    return response;
  }

  notify(progress, "Fetching " + locator + "...");
  const browser::FetchOutcome fetched = fetcher_->fetch(locator, cancel);
  if (cancel.is_cancelled()) {
    return aborted_response();
  }

  std::string markup;
  if (const auto *failure = std::get_if<common::StageFailure>(&fetched)) {
    return failure_response(*failure);
  }
  if (const auto *redirect = std::get_if<browser::Redirected>(&fetched)) {
    return text_response("The URL redirected to a different host: " + redirect->target_locator +
                         "\n\nTo fetch the content, make a new web_fetch call with this URL: " +
                         redirect->target_locator);
  }
  markup = std::get<browser::Rendered>(fetched).markup;

  notify(progress, "Extracting content...");
  const extract::ExtractionOutcome extracted = extractor_->extract(markup, cancel);
  if (cancel.is_cancelled()) {
    return aborted_response();
  }
  if (const auto *failure = std::get_if<common::StageFailure>(&extracted)) {
    return failure_response(*failure);
  }
  const std::string &content = std::get<extract::Extracted>(extracted).text;

  cache_->set(locator, content);
  return process_content(content, request, cancel, progress);
}

FetchResponse Orchestrator::process_content(const std::string &content,
                                            const FetchRequest &request,
                                            common::CancellationToken &cancel,
                                            const ProgressCallback &progress) {
  const bool prompt_present =
      request.prompt.has_value() && !common::trim(*request.prompt).empty();
  const bool answerer_available =
      answerer_ != nullptr && request.model.has_value() && !request.model->empty();

  const Decision decision = decide(prompt_present, character_count(content), answerer_available,
                                   config_.content_threshold);
  observability::record_event("pipeline", "decision " + std::string(decision_name(decision)));

  auto run_answerer = [&](const std::string &instruction) {
    answer::AnswerRequest answer_request;
    answer_request.content = content;
    answer_request.instruction = instruction;
    answer_request.model = *request.model;
    answer_request.thinking_level = request.thinking_level;
    return answerer_->answer(answer_request, cancel);
  };

  return std::visit(
      overloaded{
          [&](const ReturnRaw &raw) {
            return raw_response(content, raw.truncate);
          },
          [&](const FallbackRaw &fallback) {
            return raw_response(content, true, fallback.note);
          },
          [&](const AnswerPrompt &) {
            notify(progress, "Processing with answerer...");
            const answer::AnswerOutcome outcome = run_answerer(answer_instruction(*request.prompt));
            if (const auto *answered = std::get_if<answer::Answered>(&outcome)) {
              return text_response(answered->text);
            }
            const auto &failure = std::get<common::StageFailure>(outcome);
            if (failure.kind == common::ErrorKind::Aborted || cancel.is_cancelled()) {
              return aborted_response();
            }
            observability::record_error("pipeline", "answerer failed: " + failure.reason);
            return raw_response(content, true,
                                "LLM processing failed: " + failure.reason +
                                    ". Returning raw extracted content instead.");
          },
          [&](const Summarize &) {
            notify(progress, "Page content is large, generating summary...");
            const answer::AnswerOutcome outcome = run_answerer(summarize_instruction());
            if (const auto *answered = std::get_if<answer::Answered>(&outcome)) {
              return text_response(answered->text);
            }
            const auto &failure = std::get<common::StageFailure>(outcome);
            if (failure.kind == common::ErrorKind::Aborted || cancel.is_cancelled()) {
              return aborted_response();
            }
            observability::record_error("pipeline", "summary failed: " + failure.reason);
            return raw_response(content, true,
                                "Could not generate summary: " + failure.reason +
                                    ". Returning truncated raw content. Consider calling "
                                    "web_fetch again with a prompt to extract specific "
                                    "information.");
          },
      },
      decision);
}

} // namespace webfetch::pipeline
