#pragma once
#include "net.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace visionsync {

// Message-oriented duplex channel used by the agent connection.
class IFrameTransport {
public:
  virtual ~IFrameTransport() = default;

  // Throws Error(TransportLost) if the endpoint is unreachable or refuses.
  virtual void open(const std::string &url) = 0;
  // Throws Error(TransportLost).
  virtual void send_text(const std::string &text) = 0;
  // Blocks for the next complete message. Throws Error(TransportLost) on a
  // read error, a close frame or after close().
  virtual std::string receive() = 0;
  // Idempotent; unblocks a pending receive().
  virtual void close() = 0;
};

namespace ws {

struct Url {
  bool secure = false;
  std::string host;
  int port = 80;
  std::string path = "/";
};

// ws://host[:port][/path] or wss://...
std::optional<Url> parse_url(const std::string &url);

enum class Opcode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

struct Frame {
  bool fin = true;
  Opcode opcode = Opcode::Text;
  std::string payload;
};

using Mask = std::array<std::uint8_t, 4>;

// RFC 6455 section 5.2. A mask is required for client-to-server frames.
std::string encode_frame(Opcode op, const std::string &payload,
                         const std::optional<Mask> &mask, bool fin = true);
// Masked with a random key.
std::string encode_client_frame(Opcode op, const std::string &payload);

// base64(SHA1(key + GUID))
std::string accept_key(const std::string &client_key);

// Incremental frame parser. Unmasks masked frames.
class FrameDecoder {
public:
  explicit FrameDecoder(size_t max_payload = 16 * 1024 * 1024)
      : max_payload_(max_payload) {}

  void feed(const char *data, size_t n) { buf_.append(data, n); }
  // Next complete frame, or nullopt if more bytes are needed. Throws
  // Error(DecodeError) on reserved bits, unknown opcodes, oversized or
  // fragmented control frames.
  std::optional<Frame> next();
  size_t buffered() const { return buf_.size(); }

private:
  std::string buf_;
  size_t max_payload_;
};

// Joins continuation frames into whole messages.
class MessageAssembler {
public:
  // Returns the complete message once its final fragment arrives. Throws
  // Error(DecodeError) on an unexpected continuation.
  std::optional<std::string> push(const Frame &f);

private:
  bool in_progress_ = false;
  std::string partial_;
};

} // namespace ws

// RFC 6455 client over TCP, with TLS (OpenSSL) for wss://.
class WebSocketTransport final : public IFrameTransport {
public:
  explicit WebSocketTransport(
      std::chrono::milliseconds connect_timeout = std::chrono::seconds(10));
  ~WebSocketTransport() override;

  void open(const std::string &url) override;
  void send_text(const std::string &text) override;
  std::string receive() override;
  void close() override;

private:
  struct Tls;

  std::chrono::milliseconds connect_timeout_;
  net::Socket sock_;
  std::unique_ptr<Tls> tls_;
  std::mutex io_mu_;
  std::atomic<bool> closed_{true};
  ws::FrameDecoder decoder_;
  ws::MessageAssembler assembler_;

  void handshake(const ws::Url &u);
  void write_raw(const std::string &bytes);
  // Bytes read, 0 on close. Throws Error(TransportLost).
  size_t read_raw(char *buf, size_t len);
  std::string read_http_head();
};

} // namespace visionsync
