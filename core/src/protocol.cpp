#include "visionsync/protocol.hpp"
#include "visionsync/crypto.hpp"
#include "visionsync/errors.hpp"

#include <chrono>

namespace visionsync::protocol {

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ProtocolMessage decode_envelope(const std::string &text) {
  json::Value v;
  try {
    v = json::parse(text);
  } catch (const json::ParseError &e) {
    throw Error(ErrorCode::DecodeError,
                std::string("malformed frame: ") + e.what());
  }
  if (!v.is_obj())
    throw Error(ErrorCode::DecodeError, "frame is not a JSON object");
  const auto &o = v.as_obj();

  ProtocolMessage m;
  auto type = json::get_str(o, "type");
  if (!type || type->empty())
    throw Error(ErrorCode::DecodeError, "frame has no type");
  m.type = *type;

  auto it = o.find("payload");
  if (it != o.end() && !it->second.is_null()) {
    if (!it->second.is_obj())
      throw Error(ErrorCode::DecodeError, "payload is not an object");
    m.payload = it->second.as_obj();
  }

  m.timestamp = now_ms();
  if (auto ts = json::get_num(o, "timestamp")) {
    if (!json::in_range<std::int64_t>(*ts))
      throw Error(ErrorCode::DecodeError, "timestamp out of range");
    m.timestamp = static_cast<std::int64_t>(*ts);
  }
  m.id = json::get_str(o, "id").value_or(crypto::new_uuid());
  m.is_streaming = json::get_bool(o, "isStreaming").value_or(false);
  m.is_final = json::get_bool(o, "isFinal").value_or(true);
  m.stream_id = json::get_str(o, "streamId").value_or(crypto::new_uuid());
  if (auto idx = json::get_num(o, "chunkIndex")) {
    if (!json::in_range<int>(*idx))
      throw Error(ErrorCode::DecodeError, "chunkIndex out of range");
    m.chunk_index = static_cast<int>(*idx);
  }
  return m;
}

Body decode_body(const ProtocolMessage &msg) {
  const auto &p = msg.payload;

  if (msg.type == type::ClientHandshake) {
    auto client_type = json::get_str(p, "clientType");
    auto version = json::get_str(p, "version");
    if (!client_type || !version)
      throw Error(ErrorCode::DecodeError,
                  "handshake needs clientType and version");
    return Handshake{*client_type, *version,
                     json::get_str_list(p, "capabilities")};
  }
  if (msg.type == type::ConnectionAccepted)
    return Accepted{p};
  if (msg.type == type::ConnectionRejected) {
    Rejected r;
    for (const char *key : {"reason", "message", "error"}) {
      if (auto s = json::get_str(p, key)) {
        r.reason = *s;
        break;
      }
    }
    return r;
  }
  if (msg.type == type::AIConversation) {
    Conversation c;
    c.session_id = json::get_str(p, "sessionId").value_or("");
    c.role = json::get_str(p, "role");
    c.content = json::get_str(p, "content");
    c.text = json::get_str(p, "text");
    c.kind = json::get_str(p, "type");
    c.partial = json::get_bool(p, "partial");
    if (const auto *meta = json::get_obj(p, "metadata"))
      c.metadata = *meta;
    c.message_id = json::get_str(p, "messageId");
    if (!c.message_id)
      c.message_id = json::get_str(c.metadata, "messageId");
    return c;
  }
  if (msg.type == type::Ping)
    return Ping{};
  if (msg.type == type::Pong)
    return Pong{};
  if (msg.type == type::Echo) {
    if (const auto *orig = json::get_obj(p, "original"))
      return Echo{*orig};
    return Echo{p};
  }
  return Unknown{msg.type};
}

std::string encode(const ProtocolMessage &msg) {
  json::Object o;
  o["type"] = msg.type;
  o["payload"] = msg.payload;
  o["timestamp"] = (double)msg.timestamp;
  o["id"] = msg.id;
  o["isStreaming"] = msg.is_streaming;
  o["isFinal"] = msg.is_final;
  o["streamId"] = msg.stream_id;
  o["chunkIndex"] = msg.chunk_index;
  return json::dumps(o);
}

ProtocolMessage make_message(const std::string &t, json::Object payload) {
  ProtocolMessage m;
  m.type = t;
  m.payload = std::move(payload);
  m.timestamp = now_ms();
  m.id = crypto::new_uuid();
  m.stream_id = crypto::new_uuid();
  return m;
}

ProtocolMessage make_handshake(const Config &cfg) {
  json::Object p;
  p["clientType"] = cfg.client_type;
  p["version"] = cfg.client_version;
  p["capabilities"] = json::str_list(cfg.capabilities);
  return make_message(type::ClientHandshake, std::move(p));
}

ProtocolMessage make_ping() { return make_message(type::Ping); }

ProtocolMessage make_pong() { return make_message(type::Pong); }

ProtocolMessage make_echo(const json::Object &original) {
  json::Object p;
  p["original"] = original;
  p["timestamp"] = (double)now_ms();
  return make_message(type::Echo, std::move(p));
}

const char *role_name(Role r) {
  switch (r) {
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  case Role::System:
    return "system";
  }
  return "assistant";
}

static json::Object conversation_payload(const std::string &session_id,
                                         Role role, const std::string &content,
                                         const std::string &message_id,
                                         const char *kind, bool partial) {
  json::Object p;
  p["sessionId"] = session_id;
  p["role"] = role_name(role);
  p["content"] = content;
  p["text"] = content;
  p["messageId"] = message_id.empty() ? crypto::new_uuid() : message_id;
  p["type"] = kind;
  p["partial"] = partial;
  return p;
}

ProtocolMessage make_complete_message(const std::string &session_id, Role role,
                                      const std::string &content,
                                      const std::string &message_id) {
  return make_message(type::AIConversation,
                      conversation_payload(session_id, role, content,
                                           message_id, "say:text", false));
}

ProtocolMessage make_stream_chunk(const std::string &session_id, Role role,
                                  const std::string &content,
                                  const std::string &message_id, bool is_final,
                                  int chunk_index) {
  auto m = make_message(type::AIConversation,
                        conversation_payload(session_id, role, content,
                                             message_id, "say:text",
                                             !is_final));
  m.is_streaming = true;
  m.is_final = is_final;
  m.stream_id = m.payload.at("messageId").as_str();
  m.chunk_index = chunk_index;
  return m;
}

ProtocolMessage make_user_message(const std::string &session_id,
                                  const std::string &content,
                                  const std::string &message_id) {
  return make_message(type::AIConversation,
                      conversation_payload(session_id, Role::User, content,
                                           message_id, "ask:followup", false));
}

ProtocolMessage make_error_message(const std::string &session_id,
                                   const std::string &error,
                                   const std::string &message_id) {
  return make_message(type::AIConversation,
                      conversation_payload(session_id, Role::Assistant, error,
                                           message_id, "say:error", false));
}

} // namespace visionsync::protocol
