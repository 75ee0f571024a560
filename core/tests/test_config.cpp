#include "doctest/doctest.h"
#include "visionsync/config.hpp"
#include "visionsync/errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace visionsync;

namespace {

// Removes the file on scope exit.
struct TempFile {
  std::string path;
  explicit TempFile(const std::string &name)
      : path((std::filesystem::temp_directory_path() /
              ("visionsync_test_" + name + "_" +
               std::to_string(std::rand())))
                 .string()) {}
  ~TempFile() { std::remove(path.c_str()); }

  void write(const std::string &text) const {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << text;
  }
};

ErrorCode config_error_code(const std::string &text) {
  try {
    config_from_json(json::parse(text).as_obj());
  } catch (const Error &e) {
    return e.code();
  }
  return ErrorCode::InvalidArgument;
}

} // namespace

DOCTEST_TEST_CASE("config defaults") {
  Config cfg;
  DOCTEST_REQUIRE_EQ(cfg.discovery_port, 8766);
  DOCTEST_REQUIRE_EQ(cfg.discovery_path, "/discover");
  DOCTEST_REQUIRE_EQ(cfg.probe_timeout.count(), 2000);
  DOCTEST_REQUIRE_EQ(cfg.max_concurrent_probes, 50u);
  DOCTEST_REQUIRE_EQ(cfg.keepalive_interval.count(), 30000);
  DOCTEST_REQUIRE_EQ(cfg.client_type, "visionOS");
  DOCTEST_REQUIRE_EQ(cfg.terminal_max_lines, 1000u);
  DOCTEST_REQUIRE_EQ(cfg.directory_cache_ttl.count(), 300);
  DOCTEST_REQUIRE_EQ(cfg.max_preview_bytes, 10u * 1024 * 1024);
  DOCTEST_REQUIRE_EQ(cfg.interface_priority.front(), "en0");
}

DOCTEST_TEST_CASE("config overrides and unknown keys") {
  auto cfg = config_from_json(
      json::parse(R"({"discovery_port":9000,"probe_timeout_ms":500,)"
                  R"("interface_priority":["wlan*"],"log_level":"debug",)"
                  R"("future_option":true})")
          .as_obj());
  DOCTEST_REQUIRE_EQ(cfg.discovery_port, 9000);
  DOCTEST_REQUIRE_EQ(cfg.probe_timeout.count(), 500);
  DOCTEST_REQUIRE_EQ(cfg.interface_priority.size(), 1u);
  DOCTEST_REQUIRE_EQ(cfg.log_level, "debug");
  DOCTEST_REQUIRE_EQ(cfg.max_concurrent_probes, 50u);
}

DOCTEST_TEST_CASE("config rejects wrong types and bad values") {
  DOCTEST_REQUIRE(config_error_code(R"({"discovery_port":"8766"})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"discovery_port":70000})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"max_concurrent_probes":0})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"capabilities":[1,2]})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"log_level":"loud"})") ==
                  ErrorCode::ConfigError);
}

DOCTEST_TEST_CASE("config rejects numbers too large for the setting") {
  DOCTEST_REQUIRE(config_error_code(R"({"discovery_port":1e12})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"probe_timeout_ms":1e30})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"max_concurrent_probes":1e25})") ==
                  ErrorCode::ConfigError);
  DOCTEST_REQUIRE(config_error_code(R"({"terminal_max_lines":1e300})") ==
                  ErrorCode::ConfigError);
}

DOCTEST_TEST_CASE("config file save and load") {
  TempFile tmp("config");
  Config cfg;
  cfg.keepalive_interval = std::chrono::milliseconds(1500);
  cfg.capabilities = {"echo"};
  save_config(tmp.path, cfg);

  Config back = load_config(tmp.path);
  DOCTEST_REQUIRE_EQ(back.keepalive_interval.count(), 1500);
  DOCTEST_REQUIRE_EQ(back.capabilities.size(), 1u);

  tmp.write("{broken");
  DOCTEST_REQUIRE_THROWS_AS(load_config(tmp.path), Error);
  DOCTEST_REQUIRE_THROWS_AS(load_config(tmp.path + ".missing"), Error);
}

DOCTEST_TEST_CASE("host specs") {
  auto h = parse_host_spec("pi@raspberrypi.local:2222");
  DOCTEST_REQUIRE(h.has_value());
  DOCTEST_REQUIRE_EQ(h->username, "pi");
  DOCTEST_REQUIRE_EQ(h->hostname, "raspberrypi.local");
  DOCTEST_REQUIRE_EQ(h->port, 2222);

  h = parse_host_spec("dev@10.0.0.4");
  DOCTEST_REQUIRE(h.has_value());
  DOCTEST_REQUIRE_EQ(h->port, 22);

  DOCTEST_REQUIRE(!parse_host_spec("no-user"));
  DOCTEST_REQUIRE(!parse_host_spec("@host"));
  DOCTEST_REQUIRE(!parse_host_spec("u@host:99999"));
}

DOCTEST_TEST_CASE("host store") {
  TempFile tmp("hosts");
  HostStore store(tmp.path);
  store.load();
  DOCTEST_REQUIRE(store.hosts().empty());

  auto a = *parse_host_spec("dev@build.local");
  a.name = "build";
  store.upsert(a);
  auto b = *parse_host_spec("pi@pi.local:2200");
  b.name = "pi";
  store.upsert(b);
  a.port = 2022;
  store.upsert(a);
  DOCTEST_REQUIRE_EQ(store.hosts().size(), 2u);
  DOCTEST_REQUIRE_EQ(store.find("build")->port, 2022);
  store.save();

  HostStore reloaded(tmp.path);
  reloaded.load();
  DOCTEST_REQUIRE_EQ(reloaded.hosts().size(), 2u);
  DOCTEST_REQUIRE_EQ(reloaded.find("pi")->hostname, "pi.local");
  DOCTEST_REQUIRE(reloaded.remove("pi"));
  DOCTEST_REQUIRE(!reloaded.remove("pi"));
  DOCTEST_REQUIRE(!reloaded.find("pi").has_value());

  tmp.write(R"([{"name":"x"}])");
  DOCTEST_REQUIRE_THROWS_AS(reloaded.load(), Error);
  tmp.write(R"([{"name":"x","hostname":"h","username":"u","port":1e12}])");
  try {
    reloaded.load();
    DOCTEST_FAIL("out-of-range port accepted");
  } catch (const Error &e) {
    DOCTEST_REQUIRE(e.code() == ErrorCode::ConfigError);
  }
}
