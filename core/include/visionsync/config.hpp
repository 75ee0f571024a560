#pragma once
#include "tinyjson.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace visionsync {

struct Config {
  // discovery
  int discovery_port = 8766;
  std::string discovery_path = "/discover";
  std::chrono::milliseconds probe_timeout{2000};
  size_t max_concurrent_probes = 50;
  // Exact interface names, or prefixes ending in '*'.
  std::vector<std::string> interface_priority = {
      "en0", "en1", "eth*", "en*", "wlan*", "wl*", "pdp_ip0", "awdl0"};

  // agent channel
  std::chrono::milliseconds keepalive_interval{30000};
  std::string client_type = "visionOS";
  std::string client_version = std::string(PROTOCOL_VERSION);
  std::vector<std::string> capabilities = {"ai_conversation", "trigger_send",
                                           "echo"};

  // remote session
  size_t terminal_max_lines = 1000;
  std::chrono::seconds directory_cache_ttl{300};
  std::uint64_t max_preview_bytes = 10 * 1024 * 1024;

  std::string log_level = "info";
};

// Missing keys keep their defaults; a present key of the wrong type throws
// Error(ConfigError).
Config config_from_json(const json::Object &o);
json::Object config_to_json(const Config &cfg);

// Throws Error(ConfigError) when the file cannot be read or parsed.
Config load_config(const std::string &path);
void save_config(const std::string &path, const Config &cfg);

// $HOME/.visionsync.json, or ./.visionsync.json without HOME.
std::string default_config_path();
std::string default_hosts_path();

// "user@host[:port]" -> HostConfiguration (name = host). nullopt on bad input.
std::optional<HostConfiguration> parse_host_spec(const std::string &spec);

// Saved remote hosts, persisted as a JSON array.
class HostStore {
public:
  explicit HostStore(std::string path) : path_(std::move(path)) {}

  // Missing file is an empty store; a malformed file throws Error(ConfigError).
  void load();
  void save() const;

  // Replaces the entry with the same name, or appends.
  void upsert(const HostConfiguration &host);
  bool remove(const std::string &name);
  std::optional<HostConfiguration> find(const std::string &name) const;

  const std::vector<HostConfiguration> &hosts() const { return hosts_; }

private:
  std::string path_;
  std::vector<HostConfiguration> hosts_;
};

} // namespace visionsync
