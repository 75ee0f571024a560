#pragma once
#include "config.hpp"
#include "periodic_task.hpp"
#include "protocol.hpp"
#include "types.hpp"
#include "websocket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace visionsync {

using TransportFactory = std::function<std::shared_ptr<IFrameTransport>()>;

// One logical channel to an agent service.
//
// Disconnected -> Connecting -> Connected -> {Disconnected | Failed}
// Connecting -> Failed on transport error or rejection. Failed only leaves via
// disconnect() (or a new connect(), which disconnects first).
//
// Frames are read and dispatched by a single receive thread, in arrival
// order. Handlers run on that thread and may call send() or disconnect().
class ConnectionSession {
public:
  using MessageHandler = std::function<void(const protocol::ProtocolMessage &,
                                            const protocol::Body &)>;
  using StateHandler = std::function<void(const ConnectionState &)>;

  ConnectionSession(Config cfg, TransportFactory factory);
  ConnectionSession(const ConnectionSession &) = delete;
  ConnectionSession &operator=(const ConnectionSession &) = delete;
  ~ConnectionSession();

  // Returns once the attempt is under way; the outcome is observed through
  // state(), the state handler or wait_for_settled().
  void connect(const ServiceDescriptor &service);
  void connect(const std::string &websocket_url);

  // Legal while Connecting or Connected; otherwise logs a warning and
  // returns false. A write failure sets last_error() but leaves the state to
  // the receive loop.
  bool send(const protocol::ProtocolMessage &msg);

  // Idempotent, callable from any state, including from a handler.
  void disconnect();

  // Blocks until the state is no longer Connecting. False on timeout.
  bool wait_for_settled(std::chrono::milliseconds timeout) const;

  ConnectionState state() const;
  std::string last_error() const;
  void clear_error();
  std::string endpoint() const;

  void set_message_handler(MessageHandler h);
  void set_state_handler(StateHandler h);

  std::uint64_t pings_sent() const { return pings_sent_; }
  std::uint64_t pongs_received() const { return pongs_received_; }

private:
  Config cfg_;
  TransportFactory factory_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  ConnectionState state_;
  std::string last_error_;
  std::string endpoint_;
  std::uint64_t generation_ = 0;
  std::shared_ptr<IFrameTransport> transport_;
  std::thread worker_;
  // A receive thread that disconnected from inside a handler; joined by the
  // next disconnect() from another thread or by the destructor.
  std::thread retired_;
  MessageHandler on_message_;
  StateHandler on_state_;

  PeriodicTask keepalive_;
  std::atomic<std::uint64_t> pings_sent_{0};
  std::atomic<std::uint64_t> pongs_received_{0};

  void run(std::uint64_t gen, std::shared_ptr<IFrameTransport> t,
           std::string url);
  void handle_frame(std::uint64_t gen, const std::string &text);
  void fail(std::uint64_t gen, const std::string &reason);
  bool active(std::uint64_t gen) const;
  void notify_state(const ConnectionState &s);
};

} // namespace visionsync
