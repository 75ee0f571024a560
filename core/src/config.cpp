#include "visionsync/config.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace visionsync {

namespace {

const json::Value *lookup(const json::Object &o, const std::string &key) {
  auto it = o.find(key);
  if (it == o.end() || it->second.is_null())
    return nullptr;
  return &it->second;
}

[[noreturn]] void wrong_type(const std::string &key, const char *want) {
  throw Error(ErrorCode::ConfigError,
              "config key '" + key + "' must be " + want);
}

void read_str(const json::Object &o, const std::string &key,
              std::string &out) {
  if (auto *v = lookup(o, key)) {
    if (!v->is_str())
      wrong_type(key, "a string");
    out = v->as_str();
  }
}

template <typename T>
void read_uint(const json::Object &o, const std::string &key, T &out) {
  if (auto *v = lookup(o, key)) {
    if (!v->is_num() || v->as_num() < 0)
      wrong_type(key, "a non-negative number");
    if (!json::in_range<T>(v->as_num()))
      throw Error(ErrorCode::ConfigError,
                  "config key '" + key + "' out of range");
    out = static_cast<T>(v->as_num());
  }
}

void read_list(const json::Object &o, const std::string &key,
               std::vector<std::string> &out) {
  if (auto *v = lookup(o, key)) {
    if (!v->is_arr())
      wrong_type(key, "an array of strings");
    std::vector<std::string> items;
    for (const auto &e : v->as_arr()) {
      if (!e.is_str())
        wrong_type(key, "an array of strings");
      items.push_back(e.as_str());
    }
    out = std::move(items);
  }
}

std::string read_file(const std::string &path, bool &found) {
  std::ifstream f(path, std::ios::binary);
  found = static_cast<bool>(f);
  if (!found)
    return {};
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

void write_file(const std::string &path, const std::string &data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f)
    throw Error(ErrorCode::ConfigError, "cannot write " + path);
  f << data;
  if (!f)
    throw Error(ErrorCode::ConfigError, "write failed: " + path);
}

json::Value parse_or_throw(const std::string &path, const std::string &text) {
  try {
    return json::parse(text);
  } catch (const json::ParseError &e) {
    throw Error(ErrorCode::ConfigError, path + ": " + e.what());
  }
}

std::string home_file(const char *name) {
  const char *home = std::getenv("HOME");
  if (!home || !*home)
    return std::string("./") + name;
  return std::string(home) + "/" + name;
}

} // namespace

Config config_from_json(const json::Object &o) {
  Config cfg;
  int port = cfg.discovery_port;
  read_uint(o, "discovery_port", port);
  if (port <= 0 || port > 65535)
    throw Error(ErrorCode::ConfigError, "discovery_port out of range");
  cfg.discovery_port = port;
  read_str(o, "discovery_path", cfg.discovery_path);

  long long timeout_ms = cfg.probe_timeout.count();
  read_uint(o, "probe_timeout_ms", timeout_ms);
  cfg.probe_timeout = std::chrono::milliseconds(timeout_ms);

  read_uint(o, "max_concurrent_probes", cfg.max_concurrent_probes);
  if (cfg.max_concurrent_probes == 0)
    throw Error(ErrorCode::ConfigError, "max_concurrent_probes must be > 0");
  read_list(o, "interface_priority", cfg.interface_priority);

  long long keepalive = cfg.keepalive_interval.count();
  read_uint(o, "keepalive_interval_ms", keepalive);
  if (keepalive == 0)
    throw Error(ErrorCode::ConfigError, "keepalive_interval_ms must be > 0");
  cfg.keepalive_interval = std::chrono::milliseconds(keepalive);
  read_str(o, "client_type", cfg.client_type);
  read_str(o, "client_version", cfg.client_version);
  read_list(o, "capabilities", cfg.capabilities);

  read_uint(o, "terminal_max_lines", cfg.terminal_max_lines);
  long long ttl = cfg.directory_cache_ttl.count();
  read_uint(o, "directory_cache_ttl_s", ttl);
  cfg.directory_cache_ttl = std::chrono::seconds(ttl);
  read_uint(o, "max_preview_bytes", cfg.max_preview_bytes);

  read_str(o, "log_level", cfg.log_level);
  LogLevel lvl;
  if (!parse_log_level(cfg.log_level, lvl))
    throw Error(ErrorCode::ConfigError, "unknown log_level: " + cfg.log_level);
  return cfg;
}

json::Object config_to_json(const Config &cfg) {
  json::Object o;
  o["discovery_port"] = cfg.discovery_port;
  o["discovery_path"] = cfg.discovery_path;
  o["probe_timeout_ms"] = (double)cfg.probe_timeout.count();
  o["max_concurrent_probes"] = (double)cfg.max_concurrent_probes;
  o["interface_priority"] = json::str_list(cfg.interface_priority);
  o["keepalive_interval_ms"] = (double)cfg.keepalive_interval.count();
  o["client_type"] = cfg.client_type;
  o["client_version"] = cfg.client_version;
  o["capabilities"] = json::str_list(cfg.capabilities);
  o["terminal_max_lines"] = (double)cfg.terminal_max_lines;
  o["directory_cache_ttl_s"] = (double)cfg.directory_cache_ttl.count();
  o["max_preview_bytes"] = (double)cfg.max_preview_bytes;
  o["log_level"] = cfg.log_level;
  return o;
}

Config load_config(const std::string &path) {
  bool found = false;
  std::string text = read_file(path, found);
  if (!found)
    throw Error(ErrorCode::ConfigError, "cannot read " + path);
  json::Value v = parse_or_throw(path, text);
  if (!v.is_obj())
    throw Error(ErrorCode::ConfigError, path + ": expected a JSON object");
  Config cfg = config_from_json(v.as_obj());
  VS_LOG_DEBUG(LogCategory::General, "Loaded config from " + path);
  return cfg;
}

void save_config(const std::string &path, const Config &cfg) {
  write_file(path, json::dumps(config_to_json(cfg)));
}

std::string default_config_path() { return home_file(".visionsync.json"); }

std::string default_hosts_path() {
  return home_file(".visionsync_hosts.json");
}

std::optional<HostConfiguration> parse_host_spec(const std::string &spec) {
  auto at = spec.find('@');
  if (at == std::string::npos || at == 0 || at + 1 >= spec.size())
    return std::nullopt;
  HostConfiguration h;
  h.username = spec.substr(0, at);
  std::string rest = spec.substr(at + 1);
  auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    std::string port = rest.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos)
      return std::nullopt;
    h.port = std::stoi(port);
    if (h.port <= 0 || h.port > 65535)
      return std::nullopt;
    rest = rest.substr(0, colon);
  }
  if (rest.empty())
    return std::nullopt;
  h.hostname = rest;
  h.name = rest;
  return h;
}

void HostStore::load() {
  hosts_.clear();
  bool found = false;
  std::string text = read_file(path_, found);
  if (!found)
    return;
  json::Value v = parse_or_throw(path_, text);
  if (!v.is_arr())
    throw Error(ErrorCode::ConfigError, path_ + ": expected a JSON array");
  for (const auto &e : v.as_arr()) {
    if (!e.is_obj())
      throw Error(ErrorCode::ConfigError, path_ + ": host entry not an object");
    const auto &o = e.as_obj();
    auto name = json::get_str(o, "name");
    auto hostname = json::get_str(o, "hostname");
    auto username = json::get_str(o, "username");
    if (!name || !hostname || !username)
      throw Error(ErrorCode::ConfigError,
                  path_ + ": host entry needs name, hostname and username");
    HostConfiguration h;
    h.name = *name;
    h.hostname = *hostname;
    h.username = *username;
    double port = json::get_num(o, "port").value_or(22);
    if (!(port >= 1 && port <= 65535))
      throw Error(ErrorCode::ConfigError,
                  path_ + ": port of host '" + h.name + "' out of range");
    h.port = static_cast<int>(port);
    h.password = json::get_str(o, "password").value_or("");
    hosts_.push_back(std::move(h));
  }
}

void HostStore::save() const {
  json::Array arr;
  for (const auto &h : hosts_) {
    json::Object o;
    o["name"] = h.name;
    o["hostname"] = h.hostname;
    o["port"] = h.port;
    o["username"] = h.username;
    if (!h.password.empty())
      o["password"] = h.password;
    arr.push_back(std::move(o));
  }
  write_file(path_, json::dumps(arr));
}

void HostStore::upsert(const HostConfiguration &host) {
  for (auto &h : hosts_) {
    if (h.name == host.name) {
      h = host;
      return;
    }
  }
  hosts_.push_back(host);
}

bool HostStore::remove(const std::string &name) {
  for (auto it = hosts_.begin(); it != hosts_.end(); ++it) {
    if (it->name == name) {
      hosts_.erase(it);
      return true;
    }
  }
  return false;
}

std::optional<HostConfiguration>
HostStore::find(const std::string &name) const {
  for (const auto &h : hosts_)
    if (h.name == name)
      return h;
  return std::nullopt;
}

} // namespace visionsync
