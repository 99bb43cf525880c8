#include "webfetch/browser/cdp.hpp"

#include <sstream>

namespace webfetch::browser {

namespace {

constexpr auto READ_SLICE = std::chrono::milliseconds(100);

} // namespace

CDPClient::CDPClient(std::unique_ptr<ICDPTransport> transport)
    : transport_(std::move(transport)) {}

CDPClient::~CDPClient() { disconnect(); }

common::Status CDPClient::connect(const std::string &ws_url) {
  if (!transport_) {
    return common::Status::error("CDP transport missing");
  }
  if (running_.load()) {
    return common::Status::error("CDP client already connected");
  }
  auto status = transport_->connect(ws_url);
  if (!status.ok()) {
    return status;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_reason_.reset();
  }
  running_ = true;
  reader_ = std::thread([this]() { reader_loop(); });
  return common::Status::success();
}

void CDPClient::disconnect() {
  running_ = false;
  if (transport_) {
    transport_->close();
  }
  if (reader_.joinable()) {
    reader_.join();
  }
  fail_pending("CDP client disconnected");
}

void CDPClient::interrupt() {
  if (transport_) {
    transport_->close();
  }
  fail_pending("CDP connection closed");
}

bool CDPClient::is_connected() const {
  return running_.load() && transport_ && transport_->is_connected();
}

void CDPClient::set_session_id(std::string session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_id_ = std::move(session_id);
}

std::string CDPClient::session_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_id_;
}

common::Result<JsonMap> CDPClient::send_command(const std::string &method, const JsonMap &params,
                                                std::chrono::milliseconds timeout) {
  return send_command_json(method, params.empty() ? "{}" : common::json_serialize_flat(params),
                           timeout);
}

common::Result<JsonMap> CDPClient::send_command_json(const std::string &method,
                                                     const std::string &params_json,
                                                     std::chrono::milliseconds timeout) {
  auto call = std::make_shared<PendingCall>();
  int id = 0;
  std::string session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_reason_.has_value()) {
      return common::Result<JsonMap>::failure(*closed_reason_);
    }
    id = next_id_++;
    session = session_id_;
    pending_[id] = call;
  }

  std::ostringstream out;
  out << R"({"id":)" << id << R"(,"method":")" << common::json_escape(method)
      << R"(","params":)" << (params_json.empty() ? "{}" : params_json);
  if (!session.empty()) {
    out << R"(,"sessionId":")" << common::json_escape(session) << '"';
  }
  out << '}';

  common::Status sent = common::Status::success();
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    sent = transport_->send_text(out.str());
  }
  if (!sent.ok()) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
    return common::Result<JsonMap>::failure("CDP send failed: " + sent.error());
  }

  std::unique_lock<std::mutex> lock(mutex_);
  const bool finished = cv_.wait_for(lock, timeout, [&]() { return call->done; });
  pending_.erase(id);
  if (!finished) {
    return common::Result<JsonMap>::failure("CDP command timed out: " + method);
  }
  if (!call->error.empty()) {
    return common::Result<JsonMap>::failure(call->error);
  }
  return common::Result<JsonMap>::success(
      common::json_parse_flat(common::json_get_object(call->response, "result")));
}

void CDPClient::on_event(const std::string &method, EventCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_[method].push_back(std::move(callback));
}

common::Result<JsonMap> CDPClient::evaluate_js(const std::string &expression) {
  const std::string params = R"({"expression":")" + common::json_escape(expression) +
                             R"(","returnByValue":true,"awaitPromise":true})";
  auto response = send_command_json("Runtime.evaluate", params);
  if (!response.ok()) {
    return response;
  }
  const auto exception = response.value().find("exceptionDetails");
  if (exception != response.value().end()) {
    std::string text = common::json_get_string(exception->second, "text");
    return common::Result<JsonMap>::failure("javascript exception: " +
                                            (text.empty() ? exception->second : text));
  }
  return response;
}

void CDPClient::reader_loop() {
  while (running_.load()) {
    auto message = transport_->receive_text(READ_SLICE);
    if (message.ok()) {
      dispatch(message.value());
      continue;
    }
    if (!transport_->is_connected()) {
      fail_pending("CDP connection closed");
      break;
    }
  }
}

void CDPClient::dispatch(const std::string &message) {
  const std::string id_text = common::json_get_number(message, "id");
  if (!id_text.empty()) {
    int id = 0;
    try {
      id = std::stoi(id_text);
    } catch (const std::exception &) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      return;
    }
    const std::string error_obj = common::json_get_object(message, "error");
    if (!error_obj.empty()) {
      const std::string error_msg = common::json_get_string(error_obj, "message");
      it->second->error = "CDP error: " + (error_msg.empty() ? error_obj : error_msg);
    } else {
      it->second->response = message;
    }
    it->second->done = true;
    cv_.notify_all();
    return;
  }

  const std::string method = common::json_get_string(message, "method");
  if (method.empty()) {
    return;
  }
  std::vector<EventCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = callbacks_.find(method);
    if (it == callbacks_.end()) {
      return;
    }
    callbacks = it->second;
  }
  const JsonMap params = common::json_parse_flat(common::json_get_object(message, "params"));
  for (const auto &callback : callbacks) {
    callback(method, params);
  }
}

void CDPClient::fail_pending(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_reason_ = reason;
  for (auto &[id, call] : pending_) {
    if (!call->done) {
      call->error = reason;
      call->done = true;
    }
  }
  cv_.notify_all();
}

} // namespace webfetch::browser
