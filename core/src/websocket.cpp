#include "visionsync/websocket.hpp"
#include "visionsync/crypto.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>

namespace visionsync {

namespace ws {

static const char *kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::optional<Url> parse_url(const std::string &url) {
  Url u;
  std::string rest;
  if (url.rfind("wss://", 0) == 0) {
    u.secure = true;
    u.port = 443;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    rest = url.substr(5);
  } else {
    return std::nullopt;
  }

  size_t path_pos = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_pos);
  if (path_pos != std::string::npos) {
    u.path = rest.substr(path_pos);
    if (u.path[0] == '?')
      u.path = "/" + u.path;
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    std::string port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos)
      return std::nullopt;
    u.port = std::stoi(port);
    if (u.port <= 0 || u.port > 65535)
      return std::nullopt;
    authority = authority.substr(0, colon);
  }
  if (authority.empty())
    return std::nullopt;
  u.host = authority;
  return u;
}

std::string encode_frame(Opcode op, const std::string &payload,
                         const std::optional<Mask> &mask, bool fin) {
  std::string out;
  out.push_back((char)((fin ? 0x80 : 0x00) | (uint8_t)op));
  const uint8_t mask_bit = mask ? 0x80 : 0x00;
  const uint64_t len = payload.size();
  if (len < 126) {
    out.push_back((char)(mask_bit | len));
  } else if (len <= 0xFFFF) {
    out.push_back((char)(mask_bit | 126));
    out.push_back((char)((len >> 8) & 0xFF));
    out.push_back((char)(len & 0xFF));
  } else {
    out.push_back((char)(mask_bit | 127));
    for (int i = 7; i >= 0; --i)
      out.push_back((char)((len >> (8 * i)) & 0xFF));
  }
  if (!mask) {
    out += payload;
    return out;
  }
  for (uint8_t b : *mask)
    out.push_back((char)b);
  for (size_t i = 0; i < payload.size(); ++i)
    out.push_back((char)((uint8_t)payload[i] ^ (*mask)[i % 4]));
  return out;
}

std::string encode_client_frame(Opcode op, const std::string &payload) {
  auto r = crypto::random_bytes(4);
  return encode_frame(op, payload, Mask{r[0], r[1], r[2], r[3]});
}

std::string accept_key(const std::string &client_key) {
  return crypto::base64_encode(crypto::sha1(client_key + kGuid));
}

static bool known_opcode(uint8_t op) {
  return op <= 0x2 || (op >= 0x8 && op <= 0xA);
}

std::optional<Frame> FrameDecoder::next() {
  if (buf_.size() < 2)
    return std::nullopt;
  const uint8_t b0 = (uint8_t)buf_[0];
  const uint8_t b1 = (uint8_t)buf_[1];
  if (b0 & 0x70)
    throw Error(ErrorCode::DecodeError, "reserved bits set");
  const uint8_t op = b0 & 0x0F;
  if (!known_opcode(op))
    throw Error(ErrorCode::DecodeError, "unknown opcode " + std::to_string(op));

  Frame f;
  f.fin = (b0 & 0x80) != 0;
  f.opcode = (Opcode)op;
  const bool masked = (b1 & 0x80) != 0;
  uint64_t len = b1 & 0x7F;
  size_t header = 2;
  if (len == 126) {
    if (buf_.size() < 4)
      return std::nullopt;
    len = ((uint64_t)(uint8_t)buf_[2] << 8) | (uint8_t)buf_[3];
    header = 4;
  } else if (len == 127) {
    if (buf_.size() < 10)
      return std::nullopt;
    len = 0;
    for (int i = 2; i < 10; ++i)
      len = (len << 8) | (uint8_t)buf_[i];
    header = 10;
  }
  if (op >= 0x8 && (!f.fin || len > 125))
    throw Error(ErrorCode::DecodeError, "invalid control frame");
  if (len > max_payload_)
    throw Error(ErrorCode::DecodeError,
                "frame too large: " + std::to_string(len));

  Mask mask{};
  if (masked) {
    if (buf_.size() < header + 4)
      return std::nullopt;
    for (int i = 0; i < 4; ++i)
      mask[i] = (uint8_t)buf_[header + i];
    header += 4;
  }
  if (buf_.size() < header + len)
    return std::nullopt;

  f.payload = buf_.substr(header, (size_t)len);
  if (masked) {
    for (size_t i = 0; i < f.payload.size(); ++i)
      f.payload[i] = (char)((uint8_t)f.payload[i] ^ mask[i % 4]);
  }
  buf_.erase(0, header + (size_t)len);
  return f;
}

std::optional<std::string> MessageAssembler::push(const Frame &f) {
  if (f.opcode == Opcode::Continuation) {
    if (!in_progress_)
      throw Error(ErrorCode::DecodeError, "continuation without a message");
    partial_ += f.payload;
    if (!f.fin)
      return std::nullopt;
    in_progress_ = false;
    return std::move(partial_);
  }
  if (in_progress_)
    throw Error(ErrorCode::DecodeError, "interleaved data message");
  if (f.fin)
    return f.payload;
  in_progress_ = true;
  partial_ = f.payload;
  return std::nullopt;
}

} // namespace ws

struct WebSocketTransport::Tls {
  SSL_CTX *ctx = nullptr;
  SSL *ssl = nullptr;

  ~Tls() {
    if (ssl)
      SSL_free(ssl);
    if (ctx)
      SSL_CTX_free(ctx);
  }
};

static std::string openssl_error() {
  unsigned long e = ERR_get_error();
  if (e == 0)
    return "unknown TLS error";
  char buf[256];
  ERR_error_string_n(e, buf, sizeof(buf));
  return buf;
}

static void set_recv_timeout(int fd, std::chrono::milliseconds t) {
  timeval tv{};
  tv.tv_sec = (time_t)(t.count() / 1000);
  tv.tv_usec = (suseconds_t)((t.count() % 1000) * 1000);
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

WebSocketTransport::WebSocketTransport(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {}

WebSocketTransport::~WebSocketTransport() {
  close();
  tls_.reset();
  sock_.close();
}

void WebSocketTransport::open(const std::string &url) {
  auto u = ws::parse_url(url);
  if (!u)
    throw Error(ErrorCode::TransportLost, "invalid WebSocket URL: " + url);

  tls_.reset();
  decoder_ = ws::FrameDecoder();
  assembler_ = ws::MessageAssembler();
  sock_ = net::tcp_connect(u->host, u->port, connect_timeout_);

  if (u->secure) {
    tls_ = std::make_unique<Tls>();
    tls_->ctx = SSL_CTX_new(TLS_client_method());
    if (!tls_->ctx)
      throw Error(ErrorCode::TransportLost, openssl_error());
    SSL_CTX_set_default_verify_paths(tls_->ctx);
    SSL_CTX_set_verify(tls_->ctx, SSL_VERIFY_PEER, nullptr);
    tls_->ssl = SSL_new(tls_->ctx);
    if (!tls_->ssl)
      throw Error(ErrorCode::TransportLost, openssl_error());
    SSL_set_fd(tls_->ssl, sock_.fd());
    SSL_set_tlsext_host_name(tls_->ssl, u->host.c_str());
    SSL_set1_host(tls_->ssl, u->host.c_str());
    set_recv_timeout(sock_.fd(), connect_timeout_);
    if (SSL_connect(tls_->ssl) <= 0)
      throw Error(ErrorCode::TransportLost,
                  "TLS handshake failed: " + openssl_error());
  }

  closed_ = false;
  try {
    handshake(*u);
  } catch (...) {
    closed_ = true;
    sock_.shutdown();
    throw;
  }
  VS_LOG_DEBUG(LogCategory::Connection, "WebSocket open: " + url);
}

void WebSocketTransport::handshake(const ws::Url &u) {
  const std::string key = crypto::base64_encode(crypto::random_bytes(16));
  std::string req = "GET " + u.path + " HTTP/1.1\r\n";
  req += "Host: " + u.host + ":" + std::to_string(u.port) + "\r\n";
  req += "Upgrade: websocket\r\n";
  req += "Connection: Upgrade\r\n";
  req += "Sec-WebSocket-Key: " + key + "\r\n";
  req += "Sec-WebSocket-Version: 13\r\n\r\n";

  set_recv_timeout(sock_.fd(), connect_timeout_);
  write_raw(req);
  std::string head = read_http_head();
  set_recv_timeout(sock_.fd(), std::chrono::milliseconds(0));

  std::istringstream hs(head);
  std::string status_line;
  std::getline(hs, status_line);
  if (!status_line.empty() && status_line.back() == '\r')
    status_line.pop_back();
  if (status_line.rfind("HTTP/1.1 101", 0) != 0)
    throw Error(ErrorCode::TransportLost, "upgrade refused: " + status_line);

  std::string accept;
  std::string line;
  while (std::getline(hs, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    std::string name = line.substr(0, colon);
    for (auto &c : name)
      c = (char)std::tolower((unsigned char)c);
    if (name != "sec-websocket-accept")
      continue;
    accept = line.substr(colon + 1);
    accept.erase(0, accept.find_first_not_of(" \t"));
    while (!accept.empty() && (accept.back() == '\r' || accept.back() == ' '))
      accept.pop_back();
  }
  if (accept != ws::accept_key(key))
    throw Error(ErrorCode::TransportLost, "bad Sec-WebSocket-Accept");
}

std::string WebSocketTransport::read_http_head() {
  std::string raw;
  char buf[1024];
  while (true) {
    size_t end = raw.find("\r\n\r\n");
    if (end != std::string::npos) {
      // bytes past the head already belong to the frame stream
      if (raw.size() > end + 4)
        decoder_.feed(raw.data() + end + 4, raw.size() - end - 4);
      return raw.substr(0, end + 2);
    }
    if (raw.size() > 16 * 1024)
      throw Error(ErrorCode::TransportLost, "upgrade response too large");
    size_t n = read_raw(buf, sizeof(buf));
    if (n == 0)
      throw Error(ErrorCode::TransportLost, "closed during upgrade");
    raw.append(buf, n);
  }
}

void WebSocketTransport::write_raw(const std::string &bytes) {
  std::lock_guard<std::mutex> lk(io_mu_);
  if (tls_) {
    size_t off = 0;
    while (off < bytes.size()) {
      int w = SSL_write(tls_->ssl, bytes.data() + off,
                        (int)(bytes.size() - off));
      if (w <= 0)
        throw Error(ErrorCode::TransportLost,
                    "TLS write failed: " + openssl_error());
      off += (size_t)w;
    }
    return;
  }
  if (!net::write_all(sock_.fd(), bytes.data(), bytes.size()))
    throw Error(ErrorCode::TransportLost,
                "write failed: " + net::last_error_text());
}

size_t WebSocketTransport::read_raw(char *buf, size_t len) {
  if (!tls_) {
    while (true) {
      ssize_t r = ::recv(sock_.fd(), buf, len, 0);
      if (r >= 0)
        return (size_t)r;
      if (errno == EINTR)
        continue;
      throw Error(ErrorCode::TransportLost, net::last_error_text());
    }
  }

  // SSL objects are not safe for concurrent read/write, so reads wait for
  // readiness outside the lock and then take it.
  while (true) {
    if (SSL_pending(tls_->ssl) == 0) {
      pollfd pfd{sock_.fd(), POLLIN, 0};
      int pr = ::poll(&pfd, 1, 200);
      if (pr < 0 && errno != EINTR)
        throw Error(ErrorCode::TransportLost, net::last_error_text());
      if (pr <= 0)
        continue;
    }
    std::lock_guard<std::mutex> lk(io_mu_);
    int r = SSL_read(tls_->ssl, buf, (int)len);
    if (r > 0)
      return (size_t)r;
    int err = SSL_get_error(tls_->ssl, r);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
      continue;
    if (err == SSL_ERROR_ZERO_RETURN)
      return 0;
    throw Error(ErrorCode::TransportLost, "TLS read failed: " + openssl_error());
  }
}

void WebSocketTransport::send_text(const std::string &text) {
  if (closed_)
    throw Error(ErrorCode::TransportLost, "socket is not connected");
  write_raw(ws::encode_client_frame(ws::Opcode::Text, text));
}

std::string WebSocketTransport::receive() {
  char buf[8192];
  while (true) {
    if (closed_)
      throw Error(ErrorCode::TransportLost, "socket is not connected");

    std::optional<ws::Frame> f;
    try {
      f = decoder_.next();
    } catch (const Error &e) {
      throw Error(ErrorCode::TransportLost,
                  std::string("protocol error: ") + e.what());
    }
    if (f) {
      switch (f->opcode) {
      case ws::Opcode::Ping:
        write_raw(ws::encode_client_frame(ws::Opcode::Pong, f->payload));
        continue;
      case ws::Opcode::Pong:
        continue;
      case ws::Opcode::Close: {
        std::string why = "closed by peer";
        if (f->payload.size() >= 2) {
          int code = ((uint8_t)f->payload[0] << 8) | (uint8_t)f->payload[1];
          why += " (" + std::to_string(code);
          if (f->payload.size() > 2)
            why += " " + f->payload.substr(2);
          why += ")";
        }
        close();
        throw Error(ErrorCode::TransportLost, why);
      }
      default:
        try {
          if (auto msg = assembler_.push(*f))
            return *msg;
        } catch (const Error &e) {
          throw Error(ErrorCode::TransportLost,
                      std::string("protocol error: ") + e.what());
        }
        continue;
      }
    }

    size_t n = read_raw(buf, sizeof(buf));
    if (n == 0) {
      closed_ = true;
      throw Error(ErrorCode::TransportLost, "connection closed by peer");
    }
    decoder_.feed(buf, n);
  }
}

void WebSocketTransport::close() {
  if (closed_.exchange(true))
    return;
  try {
    write_raw(ws::encode_client_frame(ws::Opcode::Close, std::string("\x03\xe8", 2)));
  } catch (const Error &e) {
    VS_LOG_DEBUG(LogCategory::Connection,
                 std::string("close frame not sent: ") + e.what());
  }
  if (tls_) {
    std::lock_guard<std::mutex> lk(io_mu_);
    SSL_shutdown(tls_->ssl);
  }
  sock_.shutdown();
}

} // namespace visionsync
