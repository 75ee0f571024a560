#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace visionsync {

inline constexpr std::string_view PROTOCOL_VERSION = "1.0.0";

// Validated agent endpoint returned by discovery. Identity is the endpoint URL.
struct ServiceDescriptor {
  std::string name;
  std::string websocket_url;
  std::string version;
  std::string platform;
  std::string app;
  std::vector<std::string> capabilities;

  bool operator==(const ServiceDescriptor &o) const {
    return websocket_url == o.websocket_url;
  }
};

struct LocalNetworkInfo {
  std::string address;        // e.g. "192.168.1.23"
  std::string subnet_prefix;  // e.g. "192.168.1.0/24"
  std::string interface_name; // e.g. "wlan0"
};

enum class ConnectionPhase { Disconnected, Connecting, Connected, Failed };

struct ConnectionState {
  ConnectionPhase phase = ConnectionPhase::Disconnected;
  std::string reason; // only meaningful when phase == Failed

  static ConnectionState disconnected() { return {}; }
  static ConnectionState connecting() {
    return {ConnectionPhase::Connecting, {}};
  }
  static ConnectionState connected() {
    return {ConnectionPhase::Connected, {}};
  }
  static ConnectionState failed(std::string why) {
    return {ConnectionPhase::Failed, std::move(why)};
  }

  bool is_connected() const { return phase == ConnectionPhase::Connected; }
  bool is_failed() const { return phase == ConnectionPhase::Failed; }

  bool operator==(const ConnectionState &o) const {
    return phase == o.phase && reason == o.reason;
  }
  bool operator!=(const ConnectionState &o) const { return !(*this == o); }

  // "Disconnected", "Connecting", "Connected" or "Failed(<reason>)"
  std::string to_string() const;
};

struct HostConfiguration {
  std::string name;
  std::string hostname;
  int port = 22;
  std::string username;
  std::string password;
};

struct RemoteFile {
  std::string name;
  std::string path;
  bool is_directory = false;
  std::uint64_t size = 0;
  std::int64_t modified = 0; // seconds since epoch
  std::uint32_t permissions = 0;

  bool is_hidden() const { return !name.empty() && name[0] == '.'; }
};

} // namespace visionsync
