#include "doctest/doctest.h"
#include "visionsync/errors.hpp"
#include "visionsync/protocol.hpp"

using namespace visionsync;
using namespace visionsync::protocol;

static ErrorCode decode_error_code(const std::string &text) {
  try {
    decode_envelope(text);
  } catch (const Error &e) {
    return e.code();
  }
  return ErrorCode::InvalidArgument;
}

DOCTEST_TEST_CASE("envelope defaults for missing streaming fields") {
  auto m = decode_envelope(R"({"type":"Ping","payload":{}})");
  DOCTEST_REQUIRE_EQ(m.type, "Ping");
  DOCTEST_REQUIRE(!m.is_streaming);
  DOCTEST_REQUIRE(m.is_final);
  DOCTEST_REQUIRE_EQ(m.chunk_index, 0);
  DOCTEST_REQUIRE(!m.id.empty());
  DOCTEST_REQUIRE(!m.stream_id.empty());
  DOCTEST_REQUIRE(m.timestamp > 0);
  DOCTEST_REQUIRE(std::holds_alternative<Ping>(decode_body(m)));
}

DOCTEST_TEST_CASE("envelope keeps streaming fields") {
  auto m = decode_envelope(
      R"({"type":"AIConversation","id":"m1","timestamp":1700000000000,)"
      R"("isStreaming":true,"isFinal":false,"streamId":"s1","chunkIndex":3,)"
      R"("payload":{"sessionId":"x","role":"assistant","text":"Hel","partial":true}})");
  DOCTEST_REQUIRE_EQ(m.id, "m1");
  DOCTEST_REQUIRE_EQ(m.timestamp, 1700000000000LL);
  DOCTEST_REQUIRE(m.is_streaming);
  DOCTEST_REQUIRE(!m.is_final);
  DOCTEST_REQUIRE_EQ(m.stream_id, "s1");
  DOCTEST_REQUIRE_EQ(m.chunk_index, 3);

  auto body = decode_body(m);
  const auto *c = std::get_if<Conversation>(&body);
  DOCTEST_REQUIRE(c != nullptr);
  DOCTEST_REQUIRE_EQ(c->session_id, "x");
  DOCTEST_REQUIRE_EQ(*c->role, "assistant");
  DOCTEST_REQUIRE(!c->content.has_value());
  DOCTEST_REQUIRE_EQ(*c->text, "Hel");
  DOCTEST_REQUIRE(*c->partial);
}

DOCTEST_TEST_CASE("malformed frames are decode errors") {
  DOCTEST_REQUIRE(decode_error_code("{not json") == ErrorCode::DecodeError);
  DOCTEST_REQUIRE(decode_error_code("[1,2]") == ErrorCode::DecodeError);
  DOCTEST_REQUIRE(decode_error_code(R"({"payload":{}})") ==
                  ErrorCode::DecodeError);
}

DOCTEST_TEST_CASE("numbers outside the field range are decode errors") {
  DOCTEST_REQUIRE(decode_error_code(
                      R"({"type":"AIConversation","timestamp":1e30,"payload":{}})") ==
                  ErrorCode::DecodeError);
  DOCTEST_REQUIRE(decode_error_code(
                      R"({"type":"AIConversation","chunkIndex":1e20,"payload":{}})") ==
                  ErrorCode::DecodeError);
  DOCTEST_REQUIRE(decode_error_code(
                      R"({"type":"AIConversation","chunkIndex":-3e9,"payload":{}})") ==
                  ErrorCode::DecodeError);

  auto m = decode_envelope(
      R"({"type":"AIConversation","chunkIndex":2147483647,"payload":{}})");
  DOCTEST_REQUIRE_EQ(m.chunk_index, 2147483647);
}

DOCTEST_TEST_CASE("body decoding by type") {
  auto rej = decode_body(
      decode_envelope(R"({"type":"ConnectionRejected","payload":{"message":"full"}})"));
  DOCTEST_REQUIRE_EQ(std::get<Rejected>(rej).reason, "full");

  auto acc = decode_body(decode_envelope(
      R"({"type":"ConnectionAccepted","payload":{"server":"agent"}})"));
  DOCTEST_REQUIRE(std::holds_alternative<Accepted>(acc));

  auto unk = decode_body(decode_envelope(R"({"type":"TriggerSend"})"));
  DOCTEST_REQUIRE_EQ(std::get<Unknown>(unk).type, "TriggerSend");

  auto echo = decode_body(
      decode_envelope(R"({"type":"Echo","payload":{"hello":"world"}})"));
  DOCTEST_REQUIRE_EQ(std::get<Echo>(echo).original.at("hello").as_str(),
                     "world");

  auto bad = decode_envelope(
      R"({"type":"ClientHandshake","payload":{"clientType":"x"}})");
  DOCTEST_REQUIRE_THROWS_AS(decode_body(bad), Error);
}

DOCTEST_TEST_CASE("conversation message id falls back to metadata") {
  auto body = decode_body(decode_envelope(
      R"({"type":"AIConversation","payload":{"role":"assistant","content":"x",)"
      R"("metadata":{"messageId":"meta-1"}}})"));
  DOCTEST_REQUIRE_EQ(*std::get<Conversation>(body).message_id, "meta-1");
}

DOCTEST_TEST_CASE("encoded envelopes use the wire field names") {
  Config cfg;
  auto hs = make_handshake(cfg);
  auto o = json::parse(encode(hs)).as_obj();
  DOCTEST_REQUIRE_EQ(o.at("type").as_str(), "ClientHandshake");
  DOCTEST_REQUIRE(o.count("isStreaming") == 1);
  DOCTEST_REQUIRE(o.count("isFinal") == 1);
  DOCTEST_REQUIRE(o.count("streamId") == 1);
  DOCTEST_REQUIRE(o.count("chunkIndex") == 1);
  const auto &p = o.at("payload").as_obj();
  DOCTEST_REQUIRE_EQ(p.at("clientType").as_str(), "visionOS");
  DOCTEST_REQUIRE_EQ(p.at("version").as_str(), "1.0.0");
  DOCTEST_REQUIRE_EQ(p.at("capabilities").as_arr().size(), 3u);

  auto back = decode_body(decode_envelope(encode(hs)));
  DOCTEST_REQUIRE_EQ(std::get<Handshake>(back).client_type, "visionOS");
}

DOCTEST_TEST_CASE("conversation factories") {
  auto chunk = make_stream_chunk("s", Role::Assistant, "Hel", "m1", false, 0);
  DOCTEST_REQUIRE(chunk.is_streaming);
  DOCTEST_REQUIRE(!chunk.is_final);
  DOCTEST_REQUIRE_EQ(chunk.stream_id, "m1");
  DOCTEST_REQUIRE(chunk.payload.at("partial").as_bool());
  DOCTEST_REQUIRE_EQ(chunk.payload.at("messageId").as_str(), "m1");

  auto user = make_user_message("s", "hi");
  DOCTEST_REQUIRE_EQ(user.type, "AIConversation");
  DOCTEST_REQUIRE_EQ(user.payload.at("role").as_str(), "user");
  DOCTEST_REQUIRE_EQ(user.payload.at("type").as_str(), "ask:followup");

  auto err = make_error_message("s", "boom");
  DOCTEST_REQUIRE_EQ(err.payload.at("type").as_str(), "say:error");

  auto echo = make_echo(json::Object{{"k", json::Value("v")}});
  DOCTEST_REQUIRE_EQ(echo.type, "Echo");
  DOCTEST_REQUIRE_EQ(
      echo.payload.at("original").as_obj().at("k").as_str(), "v");

  DOCTEST_REQUIRE(make_ping().id != make_ping().id);
}
