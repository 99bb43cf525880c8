#include "webfetch/browser/websocket.hpp"

#include "webfetch/common/fs.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace webfetch::browser {

namespace {

constexpr std::string_view WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(5);
constexpr std::uint64_t MAX_FRAME_BYTES = 512ULL * 1024 * 1024;

constexpr std::uint8_t OP_CONTINUATION = 0x0;
constexpr std::uint8_t OP_TEXT = 0x1;
constexpr std::uint8_t OP_BINARY = 0x2;
constexpr std::uint8_t OP_CLOSE = 0x8;
constexpr std::uint8_t OP_PING = 0x9;
constexpr std::uint8_t OP_PONG = 0xA;

std::string base64_encode(const unsigned char *data, std::size_t size) {
  std::string out(4 * ((size + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data,
                                      static_cast<int>(size));
  out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
  return out;
}

std::string header_value(std::string_view headers, std::string_view name) {
  const std::string wanted = common::to_lower(name);
  for (const auto &line : common::split_lines(headers)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (common::to_lower(common::trim(std::string_view(line).substr(0, colon))) == wanted) {
      return common::trim(std::string_view(line).substr(colon + 1));
    }
  }
  return "";
}

} // namespace

common::Result<WebSocketEndpoint> parse_ws_url(std::string_view ws_url) {
  constexpr std::string_view prefix = "ws://";
  if (!common::starts_with(ws_url, prefix)) {
    return common::Result<WebSocketEndpoint>::failure("unsupported websocket url: " +
                                                      std::string(ws_url));
  }
  std::string_view rest = ws_url.substr(prefix.size());
  const auto slash = rest.find('/');
  const std::string_view authority = rest.substr(0, slash);

  WebSocketEndpoint endpoint;
  endpoint.path = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));

  const auto colon = authority.rfind(':');
  if (colon == std::string_view::npos || colon + 1 >= authority.size()) {
    return common::Result<WebSocketEndpoint>::failure("websocket url has no port: " +
                                                      std::string(ws_url));
  }
  endpoint.host = std::string(authority.substr(0, colon));
  if (common::starts_with(endpoint.host, "[") && common::ends_with(endpoint.host, "]")) {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }
  try {
    const int port = std::stoi(std::string(authority.substr(colon + 1)));
    if (port <= 0 || port > 65535) {
      throw std::out_of_range("port");
    }
    endpoint.port = static_cast<std::uint16_t>(port);
  } catch (const std::exception &) {
    return common::Result<WebSocketEndpoint>::failure("invalid websocket port: " +
                                                      std::string(ws_url));
  }
  if (endpoint.host.empty()) {
    return common::Result<WebSocketEndpoint>::failure("websocket url has no host: " +
                                                      std::string(ws_url));
  }
  return common::Result<WebSocketEndpoint>::success(std::move(endpoint));
}

std::string websocket_accept_key(std::string_view client_key) {
  const std::string material = std::string(client_key) + std::string(WS_GUID);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(material.data()), material.size(), digest.data());
  return base64_encode(digest.data(), digest.size());
}

std::string encode_client_frame(std::uint8_t opcode, std::string_view payload,
                                const std::uint8_t mask[4]) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80 | (opcode & 0x0f)));

  const std::uint64_t size = payload.size();
  if (size < 126) {
    frame.push_back(static_cast<char>(0x80 | size));
  } else if (size <= 0xffff) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>((size >> 8) & 0xff));
    frame.push_back(static_cast<char>(size & 0xff));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((size >> shift) & 0xff));
    }
  }
  for (int i = 0; i < 4; ++i) {
    frame.push_back(static_cast<char>(mask[i]));
  }
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]));
  }
  return frame;
}

WebSocketTransport::~WebSocketTransport() {
  close();
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

common::Status WebSocketTransport::connect(const std::string &ws_url) {
  if (connected_.load()) {
    return common::Status::error("websocket already connected");
  }
  auto endpoint = parse_ws_url(ws_url);
  if (!endpoint.ok()) {
    return common::Status::error(endpoint.error());
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *addresses = nullptr;
  const std::string port = std::to_string(endpoint.value().port);
  const int rc = getaddrinfo(endpoint.value().host.c_str(), port.c_str(), &hints, &addresses);
  if (rc != 0) {
    return common::Status::error("failed to resolve " + endpoint.value().host + ": " +
                                 gai_strerror(rc));
  }

  int fd = -1;
  std::string last_error = "no addresses";
  for (addrinfo *ai = addresses; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
    fd = -1;
  }
  freeaddrinfo(addresses);
  if (fd < 0) {
    return common::Status::error("failed to connect to " + ws_url + ": " + last_error);
  }

  const int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  if (fd_ != -1) {
    ::close(fd_);
  }
  fd_ = fd;
  buffer_.clear();
  fragments_.clear();

  std::array<unsigned char, 16> nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return common::Status::error("failed to generate websocket key");
  }
  const std::string key = base64_encode(nonce.data(), nonce.size());

  std::string request = "GET " + endpoint.value().path + " HTTP/1.1\r\n";
  request += "Host: " + endpoint.value().host + ":" + port + "\r\n";
  request += "Upgrade: websocket\r\n";
  request += "Connection: Upgrade\r\n";
  request += "Sec-WebSocket-Key: " + key + "\r\n";
  request += "Sec-WebSocket-Version: 13\r\n\r\n";
  if (auto written = write_all(request); !written.ok()) {
    return written;
  }

  const auto deadline = std::chrono::steady_clock::now() + HANDSHAKE_TIMEOUT;
  std::size_t header_end = std::string::npos;
  while ((header_end = buffer_.find("\r\n\r\n")) == std::string::npos) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return common::Status::error("websocket handshake timed out");
    }
    if (!fill(remaining)) {
      return common::Status::error("websocket handshake failed: connection closed");
    }
  }

  const std::string headers = buffer_.substr(0, header_end);
  buffer_.erase(0, header_end + 4);

  const auto first_line_end = headers.find("\r\n");
  const std::string status_line = headers.substr(0, first_line_end);
  if (status_line.find(" 101") == std::string::npos) {
    return common::Status::error("websocket upgrade rejected: " + status_line);
  }
  if (header_value(headers, "Sec-WebSocket-Accept") != websocket_accept_key(key)) {
    return common::Status::error("websocket upgrade returned a bad accept key");
  }

  connected_ = true;
  return common::Status::success();
}

void WebSocketTransport::close() {
  if (connected_.exchange(false) && fd_ != -1) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

bool WebSocketTransport::is_connected() const { return connected_.load(); }

common::Status WebSocketTransport::send_text(const std::string &payload) {
  if (!connected_.load()) {
    return common::Status::error("websocket not connected");
  }
  return send_frame(OP_TEXT, payload);
}

common::Status WebSocketTransport::send_frame(std::uint8_t opcode, std::string_view payload) {
  std::uint8_t mask[4] = {0, 0, 0, 0};
  if (RAND_bytes(mask, 4) != 1) {
    return common::Status::error("failed to generate websocket mask");
  }
  const std::string frame = encode_client_frame(opcode, payload, mask);
  std::lock_guard<std::mutex> lock(write_mutex_);
  return write_all(frame);
}

common::Status WebSocketTransport::write_all(std::string_view data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t sent = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return common::Status::error("websocket write failed: " + std::string(std::strerror(errno)));
    }
    offset += static_cast<std::size_t>(sent);
  }
  return common::Status::success();
}

bool WebSocketTransport::fill(std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready == 0) {
    return true;
  }
  if (ready < 0) {
    return errno == EINTR;
  }
  std::array<char, 16384> chunk{};
  const ssize_t bytes = ::recv(fd_, chunk.data(), chunk.size(), 0);
  if (bytes > 0) {
    buffer_.append(chunk.data(), static_cast<std::size_t>(bytes));
    return true;
  }
  if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

common::Result<std::string> WebSocketTransport::receive_text(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (!connected_.load()) {
      return common::Result<std::string>::failure("closed");
    }

    if (buffer_.size() >= 2) {
      const auto b0 = static_cast<std::uint8_t>(buffer_[0]);
      const auto b1 = static_cast<std::uint8_t>(buffer_[1]);
      const bool fin = (b0 & 0x80) != 0;
      const std::uint8_t opcode = b0 & 0x0f;
      const bool masked = (b1 & 0x80) != 0;
      std::uint64_t length = b1 & 0x7f;
      std::size_t header = 2;
      bool complete = true;

      if (length == 126) {
        header = 4;
        complete = buffer_.size() >= header;
        if (complete) {
          length = (static_cast<std::uint64_t>(static_cast<std::uint8_t>(buffer_[2])) << 8) |
                   static_cast<std::uint8_t>(buffer_[3]);
        }
      } else if (length == 127) {
        header = 10;
        complete = buffer_.size() >= header;
        if (complete) {
          length = 0;
          for (std::size_t i = 2; i < 10; ++i) {
            length = (length << 8) | static_cast<std::uint8_t>(buffer_[i]);
          }
        }
      }
      if (complete && length > MAX_FRAME_BYTES) {
        close();
        return common::Result<std::string>::failure("websocket frame too large");
      }
      const std::size_t mask_offset = header;
      if (masked) {
        header += 4;
      }

      if (complete && buffer_.size() >= header + length) {
        std::string payload = buffer_.substr(header, static_cast<std::size_t>(length));
        if (masked) {
          for (std::size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<char>(payload[i] ^ buffer_[mask_offset + (i % 4)]);
          }
        }
        buffer_.erase(0, header + static_cast<std::size_t>(length));

        switch (opcode) {
        case OP_TEXT:
        case OP_BINARY:
          if (fin) {
            return common::Result<std::string>::success(std::move(payload));
          }
          fragments_ = std::move(payload);
          continue;
        case OP_CONTINUATION:
          fragments_ += payload;
          if (fin) {
            std::string message = std::move(fragments_);
            fragments_.clear();
            return common::Result<std::string>::success(std::move(message));
          }
          continue;
        case OP_CLOSE:
          close();
          return common::Result<std::string>::failure("closed");
        case OP_PING: {
          auto pong = send_frame(OP_PONG, payload);
          if (!pong.ok()) {
            close();
            return common::Result<std::string>::failure(pong.error());
          }
          continue;
        }
        case OP_PONG:
        default:
          continue;
        }
      }
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return common::Result<std::string>::failure("timeout");
    }
    if (!fill(remaining)) {
      connected_ = false;
      return common::Result<std::string>::failure("closed");
    }
  }
}

} // namespace webfetch::browser
