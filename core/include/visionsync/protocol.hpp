#pragma once
#include "config.hpp"
#include "tinyjson.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace visionsync::protocol {

namespace type {
inline constexpr const char *ClientHandshake = "ClientHandshake";
inline constexpr const char *ConnectionAccepted = "ConnectionAccepted";
inline constexpr const char *ConnectionRejected = "ConnectionRejected";
inline constexpr const char *AIConversation = "AIConversation";
inline constexpr const char *Ping = "Ping";
inline constexpr const char *Pong = "Pong";
inline constexpr const char *Echo = "Echo";
} // namespace type

// Wire envelope. Unknown types are carried through untouched.
struct ProtocolMessage {
  std::string type;
  json::Object payload;
  std::int64_t timestamp = 0; // epoch milliseconds
  std::string id;
  bool is_streaming = false;
  bool is_final = true;
  std::string stream_id;
  int chunk_index = 0;
};

struct Handshake {
  std::string client_type;
  std::string version;
  std::vector<std::string> capabilities;
};

struct Accepted {
  json::Object info; // server-supplied details, if any
};

struct Rejected {
  std::string reason;
};

// Fields are optional on the wire; mapping to a conversation entry decides
// what is required.
struct Conversation {
  std::string session_id;
  std::optional<std::string> role;
  std::optional<std::string> content;
  std::optional<std::string> text;
  std::optional<std::string> message_id;
  std::optional<std::string> kind; // "say:text", "ask:followup", ...
  std::optional<bool> partial;
  json::Object metadata;
};

struct Ping {};
struct Pong {};

struct Echo {
  json::Object original;
};

struct Unknown {
  std::string type;
};

using Body = std::variant<Handshake, Accepted, Rejected, Conversation, Ping,
                          Pong, Echo, Unknown>;

std::int64_t now_ms();

// Pass one: parse JSON and read the envelope. Throws Error(DecodeError) on
// malformed JSON, a non-object frame or a missing "type".
ProtocolMessage decode_envelope(const std::string &text);

// Pass two: decode the payload shape selected by `type`. Throws
// Error(DecodeError) when a known type carries an unusable payload.
Body decode_body(const ProtocolMessage &msg);

std::string encode(const ProtocolMessage &msg);

// Fresh id, current timestamp, stream id = fresh id.
ProtocolMessage make_message(const std::string &type,
                             json::Object payload = {});

ProtocolMessage make_handshake(const Config &cfg);
ProtocolMessage make_ping();
ProtocolMessage make_pong();
// Reply carrying the received payload under "original".
ProtocolMessage make_echo(const json::Object &original);

enum class Role { User, Assistant, System };
const char *role_name(Role r);

ProtocolMessage make_complete_message(const std::string &session_id, Role role,
                                      const std::string &content,
                                      const std::string &message_id = {});
// partial = !is_final; stream id = message id.
ProtocolMessage make_stream_chunk(const std::string &session_id, Role role,
                                  const std::string &content,
                                  const std::string &message_id, bool is_final,
                                  int chunk_index);
ProtocolMessage make_user_message(const std::string &session_id,
                                  const std::string &content,
                                  const std::string &message_id = {});
ProtocolMessage make_error_message(const std::string &session_id,
                                   const std::string &error,
                                   const std::string &message_id = {});

} // namespace visionsync::protocol
