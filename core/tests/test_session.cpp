#include "doctest/doctest.h"
#include "test_support.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/session.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>

using namespace visionsync;
using visionsync_test::eventually;

namespace {

struct FakeFrameTransport : IFrameTransport {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::string> inbox;
  std::vector<std::string> sent;
  std::string opened_url;
  bool closed = false;
  bool dropped = false;
  bool fail_open = false;
  bool fail_send = false;

  void open(const std::string &url) override {
    std::lock_guard<std::mutex> lk(mu);
    if (fail_open)
      throw Error(ErrorCode::TransportLost, "connection refused");
    opened_url = url;
  }
  void send_text(const std::string &text) override {
    std::lock_guard<std::mutex> lk(mu);
    if (fail_send || closed)
      throw Error(ErrorCode::TransportLost, "broken pipe");
    sent.push_back(text);
  }
  std::string receive() override {
    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [&] { return !inbox.empty() || closed || dropped; });
    if (closed)
      throw Error(ErrorCode::TransportLost, "closed");
    if (dropped)
      throw Error(ErrorCode::TransportLost, "reset by peer");
    std::string s = inbox.front();
    inbox.pop_front();
    return s;
  }
  void close() override {
    {
      std::lock_guard<std::mutex> lk(mu);
      closed = true;
    }
    cv.notify_all();
  }

  void push(const std::string &frame) {
    {
      std::lock_guard<std::mutex> lk(mu);
      inbox.push_back(frame);
    }
    cv.notify_all();
  }
  void drop() {
    {
      std::lock_guard<std::mutex> lk(mu);
      dropped = true;
    }
    cv.notify_all();
  }
  bool is_closed() {
    std::lock_guard<std::mutex> lk(mu);
    return closed;
  }
  std::vector<protocol::ProtocolMessage> sent_messages() {
    std::lock_guard<std::mutex> lk(mu);
    std::vector<protocol::ProtocolMessage> out;
    for (const auto &s : sent)
      out.push_back(protocol::decode_envelope(s));
    return out;
  }
  size_t count_sent(const std::string &type) {
    size_t n = 0;
    for (const auto &m : sent_messages())
      if (m.type == type)
        n++;
    return n;
  }
};

struct Harness {
  Config cfg;
  std::vector<std::shared_ptr<FakeFrameTransport>> transports;
  std::unique_ptr<ConnectionSession> session;

  Harness() {
    cfg.keepalive_interval = std::chrono::milliseconds(60000);
  }

  ConnectionSession &make() {
    session = std::make_unique<ConnectionSession>(cfg, [this] {
      auto t = std::make_shared<FakeFrameTransport>();
      transports.push_back(t);
      return t;
    });
    return *session;
  }

  FakeFrameTransport &last() { return *transports.back(); }
};

const std::string kAccepted =
    R"({"type":"ConnectionAccepted","id":"a1","payload":{}})";

void connect_and_accept(Harness &h) {
  h.session->connect("ws://10.0.0.5:9000");
  DOCTEST_REQUIRE(eventually([&] { return h.last().sent_messages().size() == 1; }));
  h.last().push(kAccepted);
  DOCTEST_REQUIRE(h.session->wait_for_settled(std::chrono::seconds(2)));
  DOCTEST_REQUIRE(h.session->state().is_connected());
}

} // namespace

DOCTEST_TEST_CASE("handshake is the first frame and acceptance connects") {
  Harness h;
  auto &s = h.make();
  std::vector<ConnectionState> seen;
  std::mutex seen_mu;
  s.set_state_handler([&](const ConnectionState &st) {
    std::lock_guard<std::mutex> lk(seen_mu);
    seen.push_back(st);
  });

  ServiceDescriptor d;
  d.name = "Agent-A";
  d.websocket_url = "ws://10.0.0.5:9000";
  s.connect(d);
  DOCTEST_REQUIRE_EQ(s.endpoint(), "ws://10.0.0.5:9000");

  DOCTEST_REQUIRE(eventually([&] { return h.last().sent_messages().size() == 1; }));
  DOCTEST_REQUIRE(s.state().phase == ConnectionPhase::Connecting);
  DOCTEST_REQUIRE_EQ(h.last().opened_url, "ws://10.0.0.5:9000");

  auto first = h.last().sent_messages()[0];
  DOCTEST_REQUIRE_EQ(first.type, "ClientHandshake");
  DOCTEST_REQUIRE_EQ(first.payload.at("clientType").as_str(), "visionOS");

  h.last().push(kAccepted);
  DOCTEST_REQUIRE(s.wait_for_settled(std::chrono::seconds(2)));
  DOCTEST_REQUIRE(s.state().is_connected());

  s.disconnect();
  std::lock_guard<std::mutex> lk(seen_mu);
  DOCTEST_REQUIRE_EQ(seen.size(), 3u);
  DOCTEST_REQUIRE(seen[0].phase == ConnectionPhase::Connecting);
  DOCTEST_REQUIRE(seen[1].phase == ConnectionPhase::Connected);
  DOCTEST_REQUIRE(seen[2].phase == ConnectionPhase::Disconnected);
}

DOCTEST_TEST_CASE("rejection fails the session and closes the transport") {
  Harness h;
  auto &s = h.make();
  s.connect("ws://10.0.0.5:9000");
  DOCTEST_REQUIRE(eventually([&] { return h.last().sent_messages().size() == 1; }));
  h.last().push(
      R"({"type":"ConnectionRejected","payload":{"reason":"too many clients"}})");

  DOCTEST_REQUIRE(s.wait_for_settled(std::chrono::seconds(2)));
  DOCTEST_REQUIRE(s.state() ==
                  ConnectionState::failed("Connection rejected: too many clients"));
  DOCTEST_REQUIRE_EQ(s.last_error(), "Connection rejected: too many clients");
  DOCTEST_REQUIRE(h.last().is_closed());
  DOCTEST_REQUIRE(!s.send(protocol::make_ping()));
}

DOCTEST_TEST_CASE("unreachable endpoint fails the attempt") {
  Config cfg;
  ConnectionSession refusing(cfg, [] {
    auto t = std::make_shared<FakeFrameTransport>();
    t->fail_open = true;
    return t;
  });
  refusing.connect("ws://10.0.0.99:9000");
  DOCTEST_REQUIRE(refusing.wait_for_settled(std::chrono::seconds(2)));
  DOCTEST_REQUIRE(refusing.state().is_failed());
  DOCTEST_REQUIRE_EQ(refusing.last_error(), "connection refused");
}

DOCTEST_TEST_CASE("invalid url fails without a transport") {
  Harness h;
  auto &s = h.make();
  s.connect("http://10.0.0.5:9000");
  DOCTEST_REQUIRE(s.state() == ConnectionState::failed("Invalid URL"));
  DOCTEST_REQUIRE(h.transports.empty());
  DOCTEST_REQUIRE_EQ(s.state().to_string(), "Failed(Invalid URL)");
}

DOCTEST_TEST_CASE("disconnect from any state yields Disconnected") {
  Harness h;
  auto &s = h.make();

  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());

  s.connect("ws://10.0.0.5:9000");
  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
  DOCTEST_REQUIRE(h.last().is_closed());
  DOCTEST_REQUIRE(s.endpoint().empty());

  connect_and_accept(h);
  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());

  s.connect("bogus");
  DOCTEST_REQUIRE(s.state().is_failed());
  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
}

DOCTEST_TEST_CASE("lost transport moves Connected to Failed") {
  Harness h;
  auto &s = h.make();
  connect_and_accept(h);

  h.last().drop();
  DOCTEST_REQUIRE(eventually([&] { return s.state().is_failed(); }));
  DOCTEST_REQUIRE_EQ(s.last_error(), "Connection lost: reset by peer");

  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
}

DOCTEST_TEST_CASE("server ping gets a pong and echo requests are answered") {
  Harness h;
  auto &s = h.make();
  connect_and_accept(h);
  auto &t = h.last();

  t.push(R"({"type":"Ping","payload":{}})");
  DOCTEST_REQUIRE(eventually([&] { return t.count_sent("Pong") == 1; }));

  t.push(R"({"type":"Echo","payload":{"n":7}})");
  DOCTEST_REQUIRE(eventually([&] { return t.count_sent("Echo") == 1; }));
  protocol::ProtocolMessage reply;
  for (const auto &m : t.sent_messages())
    if (m.type == "Echo")
      reply = m;
  DOCTEST_REQUIRE_EQ(reply.payload.at("original").as_obj().at("n").as_num(), 7);

  // A reply is not answered again.
  t.push(R"({"type":"Echo","payload":{"original":{"n":7}}})");
  t.push(R"({"type":"Pong","payload":{}})");
  DOCTEST_REQUIRE(eventually([&] { return s.pongs_received() == 1; }));
  DOCTEST_REQUIRE_EQ(t.count_sent("Echo"), 1u);
}

DOCTEST_TEST_CASE("keepalive pings while connected and stops on disconnect") {
  Harness h;
  h.cfg.keepalive_interval = std::chrono::milliseconds(20);
  auto &s = h.make();
  connect_and_accept(h);

  DOCTEST_REQUIRE(eventually([&] { return h.last().count_sent("Ping") >= 2; }));
  DOCTEST_REQUIRE(s.pings_sent() >= 2);

  s.disconnect();
  auto before = s.pings_sent();
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  DOCTEST_REQUIRE_EQ(s.pings_sent(), before);
}

DOCTEST_TEST_CASE("messages reach the handler in arrival order") {
  Harness h;
  auto &s = h.make();
  std::mutex mu;
  std::vector<std::string> ids;
  s.set_message_handler(
      [&](const protocol::ProtocolMessage &m, const protocol::Body &) {
        std::lock_guard<std::mutex> lk(mu);
        if (m.type == "AIConversation")
          ids.push_back(m.id);
      });
  connect_and_accept(h);

  for (int i = 0; i < 20; ++i)
    h.last().push(R"({"type":"AIConversation","id":"c)" + std::to_string(i) +
                  R"(","payload":{"role":"assistant","content":"x"}})");
  h.last().push("{garbage");

  DOCTEST_REQUIRE(eventually([&] {
    std::lock_guard<std::mutex> lk(mu);
    return ids.size() == 20;
  }));
  std::lock_guard<std::mutex> lk(mu);
  for (int i = 0; i < 20; ++i)
    DOCTEST_REQUIRE_EQ(ids[(size_t)i], "c" + std::to_string(i));
  DOCTEST_REQUIRE(s.state().is_connected());
}

DOCTEST_TEST_CASE("send outside a connection is refused") {
  Harness h;
  auto &s = h.make();
  DOCTEST_REQUIRE(!s.send(protocol::make_ping()));
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
}

DOCTEST_TEST_CASE("send failure records an error without changing state") {
  Harness h;
  auto &s = h.make();
  connect_and_accept(h);
  {
    std::lock_guard<std::mutex> lk(h.last().mu);
    h.last().fail_send = true;
  }
  DOCTEST_REQUIRE(!s.send(protocol::make_user_message("s", "hi")));
  DOCTEST_REQUIRE_EQ(s.last_error(), "Send error: broken pipe");
  DOCTEST_REQUIRE(s.state().is_connected());
  s.clear_error();
  DOCTEST_REQUIRE(s.last_error().empty());
}

DOCTEST_TEST_CASE("handler may disconnect from the receive thread") {
  Harness h;
  auto &s = h.make();
  std::atomic<bool> handler_done{false};
  s.set_message_handler(
      [&](const protocol::ProtocolMessage &m, const protocol::Body &) {
        if (m.type != "Echo")
          return;
        s.disconnect();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        handler_done = true;
      });
  connect_and_accept(h);
  h.last().push(R"({"type":"Echo","payload":{"original":{}}})");
  DOCTEST_REQUIRE(eventually([&] {
    return s.state() == ConnectionState::disconnected();
  }));

  // Destroying the session right away waits for the receive thread.
  h.session.reset();
  DOCTEST_REQUIRE(handler_done.load());
}

DOCTEST_TEST_CASE("reconnect supersedes the previous attempt") {
  Harness h;
  auto &s = h.make();
  int frames = 0;
  std::mutex mu;
  s.set_message_handler(
      [&](const protocol::ProtocolMessage &m, const protocol::Body &) {
        std::lock_guard<std::mutex> lk(mu);
        if (m.type == "AIConversation")
          frames++;
      });
  connect_and_accept(h);
  auto old = h.transports.back();

  connect_and_accept(h);
  DOCTEST_REQUIRE_EQ(h.transports.size(), 2u);
  DOCTEST_REQUIRE(old->is_closed());

  old->push(R"({"type":"AIConversation","payload":{"role":"assistant","content":"stale"}})");
  h.last().push(R"({"type":"AIConversation","payload":{"role":"assistant","content":"fresh"}})");
  DOCTEST_REQUIRE(eventually([&] {
    std::lock_guard<std::mutex> lk(mu);
    return frames == 1;
  }));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  std::lock_guard<std::mutex> lk(mu);
  DOCTEST_REQUIRE_EQ(frames, 1);
}
