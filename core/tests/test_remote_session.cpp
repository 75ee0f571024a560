#include "doctest/doctest.h"
#include "visionsync/fake_remote_backend.hpp"
#include "visionsync/remote_session.hpp"

#include <algorithm>

using namespace visionsync;

namespace {

struct Fixture {
  Config cfg;
  std::shared_ptr<FakeRemoteBackend> backend =
      std::make_shared<FakeRemoteBackend>("/home/dev");
  std::chrono::steady_clock::time_point now{};
  std::unique_ptr<RemoteSession> session;

  HostConfiguration host() const {
    HostConfiguration h;
    h.name = "box";
    h.hostname = "example.local";
    h.username = "dev";
    h.password = "secret";
    return h;
  }

  RemoteSession &make() {
    session = std::make_unique<RemoteSession>(cfg, backend,
                                              [this] { return now; });
    return *session;
  }

  RemoteSession &connected() {
    auto &s = make();
    DOCTEST_REQUIRE(s.connect(host()));
    return s;
  }
};

std::vector<std::string> names(const std::vector<RemoteFile> &files) {
  std::vector<std::string> out;
  for (const auto &f : files)
    out.push_back(f.name);
  return out;
}

bool has_line(const RemoteSession &s, const std::string &line) {
  auto lines = s.output_lines();
  return std::find(lines.begin(), lines.end(), line) != lines.end();
}

} // namespace

DOCTEST_TEST_CASE("connect resolves home and writes the banner") {
  Fixture fx;
  fx.backend->add_file("/home/dev/notes.txt", "hello");
  auto &s = fx.connected();

  DOCTEST_REQUIRE(s.state().is_connected());
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev");
  DOCTEST_REQUIRE(fx.backend->sftp_open());
  DOCTEST_REQUIRE(s.host().has_value());

  auto lines = s.output_lines();
  DOCTEST_REQUIRE(lines.size() >= 3);
  DOCTEST_REQUIRE_EQ(lines[0], "Connected to example.local as dev");
  DOCTEST_REQUIRE(lines[1].rfind("Session ID: ", 0) == 0);
  DOCTEST_REQUIRE_EQ(lines[1].size(), 20u);
  DOCTEST_REQUIRE_EQ(lines[2], "");

  // The initial listing is already cached.
  auto cached = s.cached_listing("/home/dev");
  DOCTEST_REQUIRE(cached.has_value());
  DOCTEST_REQUIRE_EQ(names(*cached), std::vector<std::string>{"notes.txt"});
}

DOCTEST_TEST_CASE("rejected credentials fail the connection") {
  Fixture fx;
  fx.backend->set_password("other");
  auto &s = fx.make();

  DOCTEST_REQUIRE(!s.connect(fx.host()));
  DOCTEST_REQUIRE(s.state().is_failed());
  DOCTEST_REQUIRE(s.last_error().find("Authentication failed") !=
                  std::string::npos);
  DOCTEST_REQUIRE(s.output_lines().back().rfind("Connection failed: ", 0) == 0);
  DOCTEST_REQUIRE(s.current_directory().empty());

  // No retry; a fresh connect is allowed.
  DOCTEST_REQUIRE_EQ(fx.backend->connect_calls(), 1);
  fx.backend->set_password("secret");
  DOCTEST_REQUIRE(s.connect(fx.host()));
  DOCTEST_REQUIRE(s.state().is_connected());
}

DOCTEST_TEST_CASE("command history collapses immediate repeats") {
  Fixture fx;
  fx.backend->script("ls", {"a\nb\n", 0});
  auto &s = fx.connected();

  s.execute_command("ls");
  s.execute_command("ls");
  s.execute_command("pwd");

  DOCTEST_REQUIRE_EQ(s.history(), (std::vector<std::string>{"ls", "pwd"}));
  DOCTEST_REQUIRE_EQ(*s.history_at(1), "pwd");
  DOCTEST_REQUIRE(!s.history_at(2).has_value());

  s.execute_command("ls");
  DOCTEST_REQUIRE_EQ(s.history().size(), 3u);
}

DOCTEST_TEST_CASE("command output goes to the terminal buffer") {
  Fixture fx;
  fx.backend->script("ls", {"a\nb\n", 0});
  auto &s = fx.connected();
  s.clear_output();

  DOCTEST_REQUIRE_EQ(s.execute_command("  ls  "), "a\nb\n");
  DOCTEST_REQUIRE_EQ(s.output_text(), "$ ls\na\nb");

  s.execute_command("frobnicate");
  DOCTEST_REQUIRE(has_line(s, "sh: frobnicate: command not found"));
  DOCTEST_REQUIRE(s.state().is_connected());
}

DOCTEST_TEST_CASE("cd resyncs the working directory") {
  Fixture fx;
  fx.backend->add_dir("/home/dev/src/app");
  auto &s = fx.connected();

  s.execute_command("cd src");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev/src");
  auto calls = fx.backend->exec_calls();
  DOCTEST_REQUIRE_EQ(calls.back().command, "cd src && pwd");
  DOCTEST_REQUIRE_EQ(calls.back().working_dir, "/home/dev");

  s.execute_command("cd app");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev/src/app");
  s.execute_command("cd ..");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev/src");

  s.execute_command("cd missing");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev/src");
  DOCTEST_REQUIRE(has_line(s, "sh: cd: missing: No such file or directory"));

  s.execute_command("cd");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev");

  // Later commands run in the tracked directory.
  s.execute_command("cd src");
  s.execute_command("echo hi");
  DOCTEST_REQUIRE_EQ(fx.backend->exec_calls().back().working_dir,
                     "/home/dev/src");
}

DOCTEST_TEST_CASE("chained cd command runs once") {
  Fixture fx;
  fx.backend->add_dir("/home/dev/build");
  auto &s = fx.connected();
  auto before = fx.backend->exec_calls().size();

  std::string out = s.execute_command("cd build && echo deploy");
  DOCTEST_REQUIRE_EQ(out, "deploy\n");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/home/dev/build");

  auto calls = fx.backend->exec_calls();
  DOCTEST_REQUIRE_EQ(calls.size(), before + 1);
  int deploys = 0;
  for (const auto &c : calls)
    if (c.command.find("echo deploy") != std::string::npos)
      deploys++;
  DOCTEST_REQUIRE_EQ(deploys, 1);

  // The pwd line is consumed, not shown.
  DOCTEST_REQUIRE(has_line(s, "deploy"));
  DOCTEST_REQUIRE(!has_line(s, "/home/dev/build"));
}

DOCTEST_TEST_CASE("pwd output sets the working directory") {
  Fixture fx;
  auto &s = fx.connected();
  fx.backend->script("pwd", {"/srv/www\n", 0});
  s.execute_command("pwd");
  DOCTEST_REQUIRE_EQ(s.current_directory(), "/srv/www");
}

DOCTEST_TEST_CASE("empty commands are ignored") {
  Fixture fx;
  auto &s = fx.connected();
  auto calls = fx.backend->exec_calls().size();
  auto lines = s.output_lines().size();

  DOCTEST_REQUIRE_EQ(s.execute_command("   "), "");
  DOCTEST_REQUIRE(s.history().empty());
  DOCTEST_REQUIRE_EQ(fx.backend->exec_calls().size(), calls);
  DOCTEST_REQUIRE_EQ(s.output_lines().size(), lines);
}

DOCTEST_TEST_CASE("commands require a connection") {
  Fixture fx;
  auto &s = fx.make();
  bool threw = false;
  try {
    s.execute_command("ls");
  } catch (const Error &e) {
    threw = true;
    DOCTEST_REQUIRE(e.code() == ErrorCode::NotConnected);
  }
  DOCTEST_REQUIRE(threw);
  DOCTEST_REQUIRE_EQ(s.output_lines().back(), "Error: Not connected to server");
  DOCTEST_REQUIRE_THROWS_AS(s.list_directory("/"), Error);
  DOCTEST_REQUIRE_THROWS_AS(s.read_file("/etc/hosts"), Error);
}

DOCTEST_TEST_CASE("a failed command is reported and the session survives") {
  Fixture fx;
  auto &s = fx.connected();
  fx.backend->fail_next(ErrorCode::RemoteOperationFailed, "channel refused");

  DOCTEST_REQUIRE_THROWS_AS(s.execute_command("uptime"), Error);
  DOCTEST_REQUIRE_EQ(s.output_lines().back(),
                     "Error executing command: channel refused");
  DOCTEST_REQUIRE(s.state().is_connected());
  DOCTEST_REQUIRE_EQ(s.execute_command("echo ok"), "ok\n");
}

DOCTEST_TEST_CASE("a dropped transport fails the session") {
  Fixture fx;
  auto &s = fx.connected();
  fx.backend->drop_connection();

  bool lost = false;
  try {
    s.execute_command("echo x");
  } catch (const Error &e) {
    lost = e.code() == ErrorCode::TransportLost;
  }
  DOCTEST_REQUIRE(lost);
  DOCTEST_REQUIRE(s.state().is_failed());

  DOCTEST_REQUIRE(s.connect(fx.host()));
  DOCTEST_REQUIRE(s.state().is_connected());
}

DOCTEST_TEST_CASE("listings sort directories first and hide dot entries") {
  Fixture fx;
  fx.backend->add_file("/home/dev/b.txt", "b");
  fx.backend->add_dir("/home/dev/Zeta");
  fx.backend->add_file("/home/dev/alpha.txt", "a");
  fx.backend->add_dir("/home/dev/beta");
  fx.backend->add_file("/home/dev/.profile", "p");
  auto &s = fx.connected();

  auto files = s.list_directory();
  DOCTEST_REQUIRE_EQ(names(files), (std::vector<std::string>{
                                       "beta", "Zeta", ".profile",
                                       "alpha.txt", "b.txt"}));
  DOCTEST_REQUIRE(files[0].is_directory);
  DOCTEST_REQUIRE_EQ(files[0].path, "/home/dev/beta");
  DOCTEST_REQUIRE(!files[3].is_directory);
  DOCTEST_REQUIRE_EQ(files[3].size, 1u);
  DOCTEST_REQUIRE(files[2].is_hidden());

  // Relative and non-canonical paths resolve to the same listing.
  fx.backend->add_file("/home/dev/beta/inner.txt", "i");
  DOCTEST_REQUIRE_EQ(names(s.list_directory("beta")),
                     std::vector<std::string>{"inner.txt"});
  DOCTEST_REQUIRE_EQ(names(s.list_directory("/home/dev/Zeta/../beta")),
                     std::vector<std::string>{"inner.txt"});
}

DOCTEST_TEST_CASE("non-canonical paths reuse the cached listing") {
  Fixture fx;
  fx.backend->add_file("/home/dev/beta/inner.txt", "i");
  fx.backend->add_dir("/home/dev/gamma");
  auto &s = fx.connected();

  s.list_directory("gamma/../beta");
  int resolved = fx.backend->realpath_calls();
  int listed = fx.backend->list_calls();
  s.list_directory("gamma/../beta");
  DOCTEST_REQUIRE_EQ(fx.backend->realpath_calls(), resolved);
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), listed);

  // Refreshing through the alias drops the canonical listing too.
  fx.backend->add_file("/home/dev/beta/new.txt", "n");
  auto files = s.refresh_directory("gamma/../beta");
  DOCTEST_REQUIRE_EQ(files.size(), 2u);
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), listed + 1);
}

DOCTEST_TEST_CASE("directory cache honours the TTL") {
  Fixture fx;
  auto &s = fx.connected();
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 1);

  s.list_directory("/home/dev");
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 1);

  fx.now += std::chrono::seconds(299);
  s.list_directory("/home/dev");
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 1);

  fx.now += std::chrono::seconds(2);
  DOCTEST_REQUIRE(!s.cached_listing("/home/dev").has_value());
  s.list_directory("/home/dev");
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 2);

  s.refresh_directory("/home/dev");
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 3);

  s.clear_cache();
  s.list_directory("/home/dev");
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 4);
}

DOCTEST_TEST_CASE("delete invalidates the parent listing") {
  Fixture fx;
  fx.backend->add_file("/home/dev/old.log", "x");
  fx.backend->add_dir("/home/dev/empty");
  auto &s = fx.connected();

  auto files = s.list_directory();
  DOCTEST_REQUIRE_EQ(files.size(), 2u);
  s.delete_file(files[1]); // old.log
  DOCTEST_REQUIRE(!fx.backend->exists("/home/dev/old.log"));
  DOCTEST_REQUIRE(!s.cached_listing("/home/dev").has_value());

  s.delete_file(files[0]); // empty/
  auto after = s.list_directory();
  DOCTEST_REQUIRE(after.empty());
  DOCTEST_REQUIRE_EQ(fx.backend->list_calls(), 2);

  RemoteFile ghost;
  ghost.name = "ghost";
  ghost.path = "/home/dev/ghost";
  DOCTEST_REQUIRE_THROWS_AS(s.delete_file(ghost), Error);
  DOCTEST_REQUIRE(s.state().is_connected());
}

DOCTEST_TEST_CASE("upload and read back") {
  Fixture fx;
  auto &s = fx.connected();
  DOCTEST_REQUIRE_EQ(s.upload("photo.jpg", "JPEGDATA"), "/home/dev/photo.jpg");
  DOCTEST_REQUIRE(!s.cached_listing("/home/dev").has_value());
  DOCTEST_REQUIRE_EQ(s.read_file("photo.jpg"), "JPEGDATA");
  DOCTEST_REQUIRE_EQ(names(s.list_directory()),
                     std::vector<std::string>{"photo.jpg"});

  DOCTEST_REQUIRE_THROWS_AS(s.write_file("/nowhere/x", "y"), Error);
}

DOCTEST_TEST_CASE("reads are bounded by the preview limit") {
  Fixture fx;
  fx.cfg.max_preview_bytes = 4;
  fx.backend->add_file("/home/dev/big.bin", "0123456789");
  auto &s = fx.connected();
  DOCTEST_REQUIRE_THROWS_AS(s.read_file("/home/dev/big.bin"), Error);
}

DOCTEST_TEST_CASE("terminal buffer keeps the newest lines") {
  Fixture fx;
  fx.cfg.terminal_max_lines = 5;
  auto &s = fx.connected();
  for (int i = 0; i < 10; ++i)
    s.execute_command("echo line" + std::to_string(i));

  auto lines = s.output_lines();
  DOCTEST_REQUIRE_EQ(lines.size(), 5u);
  DOCTEST_REQUIRE_EQ(lines.back(), "line9");
  DOCTEST_REQUIRE_EQ(lines[3], "$ echo line9");
}

DOCTEST_TEST_CASE("disconnect resets the session") {
  Fixture fx;
  auto &s = fx.connected();
  s.disconnect();

  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
  DOCTEST_REQUIRE(s.current_directory().empty());
  DOCTEST_REQUIRE(!s.cached_listing("/home/dev").has_value());
  DOCTEST_REQUIRE_EQ(s.output_lines().back(), "Disconnected from server");
  DOCTEST_REQUIRE(!fx.backend->is_connected());

  auto n = s.output_lines().size();
  s.disconnect();
  DOCTEST_REQUIRE_EQ(s.output_lines().size(), n);

  // Failed also resets to Disconnected.
  fx.backend->set_password("other");
  DOCTEST_REQUIRE(!s.connect(fx.host()));
  s.disconnect();
  DOCTEST_REQUIRE(s.state() == ConnectionState::disconnected());
}
