#include "visionsync/session.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"

namespace visionsync {

ConnectionSession::ConnectionSession(Config cfg, TransportFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)) {}

ConnectionSession::~ConnectionSession() {
  disconnect();
  // Only left joinable when the owner is destroyed from inside a handler.
  if (retired_.joinable())
    retired_.detach();
}

void ConnectionSession::connect(const ServiceDescriptor &service) {
  VS_LOG_INFO(LogCategory::Connection,
              "Connecting to " + service.name + " at " + service.websocket_url);
  connect(service.websocket_url);
}

void ConnectionSession::connect(const std::string &websocket_url) {
  disconnect();

  if (!ws::parse_url(websocket_url)) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      state_ = ConnectionState::failed("Invalid URL");
      last_error_ = "Invalid URL: " + websocket_url;
    }
    VS_LOG_ERROR(LogCategory::Connection, "Invalid URL: " + websocket_url);
    cv_.notify_all();
    notify_state(ConnectionState::failed("Invalid URL"));
    return;
  }

  auto t = factory_();
  std::uint64_t gen;
  {
    std::lock_guard<std::mutex> lk(mu_);
    gen = ++generation_;
    state_ = ConnectionState::connecting();
    endpoint_ = websocket_url;
    transport_ = t;
    worker_ = std::thread(&ConnectionSession::run, this, gen, t, websocket_url);
  }
  notify_state(ConnectionState::connecting());
}

void ConnectionSession::run(std::uint64_t gen,
                            std::shared_ptr<IFrameTransport> t,
                            std::string url) {
  try {
    t->open(url);
  } catch (const Error &e) {
    fail(gen, e.what());
    return;
  }
  if (!active(gen)) {
    t->close();
    return;
  }

  send(protocol::make_handshake(cfg_));

  while (active(gen)) {
    std::string text;
    try {
      text = t->receive();
    } catch (const Error &e) {
      fail(gen, std::string("Connection lost: ") + e.what());
      return;
    }
    if (!active(gen))
      return;
    handle_frame(gen, text);
  }
}

void ConnectionSession::handle_frame(std::uint64_t gen,
                                     const std::string &text) {
  protocol::ProtocolMessage msg;
  protocol::Body body;
  try {
    msg = protocol::decode_envelope(text);
    body = protocol::decode_body(msg);
  } catch (const Error &e) {
    VS_LOG_WARN(LogCategory::Connection,
                std::string("Dropping frame: ") + e.what());
    return;
  }

  if (std::holds_alternative<protocol::Accepted>(body)) {
    bool entered = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (gen == generation_ &&
          state_.phase == ConnectionPhase::Connecting) {
        state_ = ConnectionState::connected();
        last_error_.clear();
        entered = true;
      }
    }
    if (entered) {
      VS_LOG_INFO(LogCategory::Connection, "Connection accepted");
      cv_.notify_all();
      keepalive_.start(cfg_.keepalive_interval, [this, gen] {
        if (!active(gen))
          return;
        if (send(protocol::make_ping()))
          pings_sent_++;
      });
      notify_state(ConnectionState::connected());
    }
  } else if (const auto *r = std::get_if<protocol::Rejected>(&body)) {
    std::string reason = "Connection rejected";
    if (!r->reason.empty())
      reason += ": " + r->reason;
    VS_LOG_WARN(LogCategory::Connection, reason);
    fail(gen, reason);
  } else if (std::holds_alternative<protocol::Ping>(body)) {
    send(protocol::make_pong());
  } else if (std::holds_alternative<protocol::Pong>(body)) {
    pongs_received_++;
    VS_LOG_TRACE(LogCategory::Connection, "Received pong");
  } else if (const auto *e = std::get_if<protocol::Echo>(&body)) {
    // Only requests are answered; a reply carries "original".
    if (!json::get_obj(msg.payload, "original"))
      send(protocol::make_echo(e->original));
  } else if (const auto *u = std::get_if<protocol::Unknown>(&body)) {
    VS_LOG_DEBUG(LogCategory::Connection, "Unhandled message type: " + u->type);
  }

  MessageHandler h;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (gen != generation_)
      return;
    h = on_message_;
  }
  if (h)
    h(msg, body);
}

bool ConnectionSession::send(const protocol::ProtocolMessage &msg) {
  std::shared_ptr<IFrameTransport> t;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_.phase != ConnectionPhase::Connecting &&
        state_.phase != ConnectionPhase::Connected) {
      VS_LOG_WARN(LogCategory::Connection,
                  "Cannot send " + msg.type + ": not connected");
      return false;
    }
    t = transport_;
  }
  try {
    t->send_text(protocol::encode(msg));
  } catch (const Error &e) {
    std::lock_guard<std::mutex> lk(mu_);
    last_error_ = std::string("Send error: ") + e.what();
    VS_LOG_ERROR(LogCategory::Connection, last_error_);
    return false;
  }
  VS_LOG_TRACE(LogCategory::Connection, "Message sent: " + msg.type);
  return true;
}

void ConnectionSession::fail(std::uint64_t gen, const std::string &reason) {
  std::shared_ptr<IFrameTransport> t;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (gen != generation_ || (state_.phase != ConnectionPhase::Connecting &&
                               state_.phase != ConnectionPhase::Connected))
      return;
    state_ = ConnectionState::failed(reason);
    last_error_ = reason;
    t = transport_;
  }
  VS_LOG_ERROR(LogCategory::Connection, reason);
  keepalive_.stop();
  if (t)
    t->close();
  cv_.notify_all();
  notify_state(ConnectionState::failed(reason));
}

void ConnectionSession::disconnect() {
  std::shared_ptr<IFrameTransport> t;
  std::thread worker;
  std::thread retired;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++generation_;
    t = std::move(transport_);
    worker = std::move(worker_);
    retired = std::move(retired_);
    endpoint_.clear();
    changed = state_.phase != ConnectionPhase::Disconnected;
    state_ = ConnectionState::disconnected();
  }
  if (t)
    t->close();
  const auto self = std::this_thread::get_id();
  for (std::thread *w : {&retired, &worker}) {
    if (!w->joinable())
      continue;
    if (w->get_id() == self) {
      std::lock_guard<std::mutex> lk(mu_);
      retired_ = std::move(*w);
    } else {
      w->join();
    }
  }
  keepalive_.stop();
  cv_.notify_all();
  if (changed) {
    VS_LOG_INFO(LogCategory::Connection, "Disconnected");
    notify_state(ConnectionState::disconnected());
  }
}

bool ConnectionSession::wait_for_settled(
    std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [this] {
    return state_.phase != ConnectionPhase::Connecting;
  });
}

bool ConnectionSession::active(std::uint64_t gen) const {
  std::lock_guard<std::mutex> lk(mu_);
  return gen == generation_ && (state_.phase == ConnectionPhase::Connecting ||
                                state_.phase == ConnectionPhase::Connected);
}

ConnectionState ConnectionSession::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

std::string ConnectionSession::last_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_error_;
}

void ConnectionSession::clear_error() {
  std::lock_guard<std::mutex> lk(mu_);
  last_error_.clear();
}

std::string ConnectionSession::endpoint() const {
  std::lock_guard<std::mutex> lk(mu_);
  return endpoint_;
}

void ConnectionSession::set_message_handler(MessageHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  on_message_ = std::move(h);
}

void ConnectionSession::set_state_handler(StateHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  on_state_ = std::move(h);
}

void ConnectionSession::notify_state(const ConnectionState &s) {
  StateHandler h;
  {
    std::lock_guard<std::mutex> lk(mu_);
    h = on_state_;
  }
  if (h)
    h(s);
}

} // namespace visionsync
