#pragma once

#include "webfetch/browser/cdp.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace webfetch::browser {

struct WebSocketEndpoint {
  std::string host;
  std::uint16_t port = 0;
  std::string path = "/";
};

/// Parse "ws://host:port/path". TLS endpoints are not supported.
[[nodiscard]] common::Result<WebSocketEndpoint> parse_ws_url(std::string_view ws_url);

/// Sec-WebSocket-Accept for a given Sec-WebSocket-Key (RFC 6455 section 4.2.2).
[[nodiscard]] std::string websocket_accept_key(std::string_view client_key);

/// Client-side frame: FIN set, masked with `mask`.
[[nodiscard]] std::string encode_client_frame(std::uint8_t opcode, std::string_view payload,
                                              const std::uint8_t mask[4]);

/// Minimal RFC 6455 client over a plain TCP socket, enough for a local DevTools
/// endpoint: text messages, fragmentation, ping/pong and close.
class WebSocketTransport final : public ICDPTransport {
public:
  WebSocketTransport() = default;
  ~WebSocketTransport() override;

  [[nodiscard]] common::Status connect(const std::string &ws_url) override;
  void close() override;
  [[nodiscard]] bool is_connected() const override;
  [[nodiscard]] common::Status send_text(const std::string &payload) override;
  [[nodiscard]] common::Result<std::string>
  receive_text(std::chrono::milliseconds timeout) override;

private:
  [[nodiscard]] common::Status send_frame(std::uint8_t opcode, std::string_view payload);
  [[nodiscard]] common::Status write_all(std::string_view data);
  /// Append whatever arrives within `timeout`. False on EOF or error.
  [[nodiscard]] bool fill(std::chrono::milliseconds timeout);

  int fd_ = -1;
  std::atomic<bool> connected_{false};
  std::mutex write_mutex_;
  std::string buffer_;
  std::string fragments_;
};

} // namespace webfetch::browser
