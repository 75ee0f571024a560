#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "visionsync/coalescer.hpp"
#include "visionsync/config.hpp"
#include "visionsync/crypto.hpp"
#include "visionsync/discovery.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"
#include "visionsync/remote_session.hpp"
#include "visionsync/session.hpp"
#include "visionsync/ssh2_backend.hpp"
#include "visionsync/tinyjson.hpp"
#include "visionsync/websocket.hpp"

using namespace visionsync;

static int usage() {
  std::cerr << "Usage: visionsync <command> [args] [--config path] "
               "[--log-level level]\n"
            << "Commands:\n"
            << "  scan [--prefix a.b.c] [--port N]\n"
            << "  connect <ws-url> [--send text] [--seconds N]\n"
            << "  ssh <host> <command...>\n"
            << "  ls <host> [path]\n"
            << "  cat <host> <path>\n"
            << "  rm <host> <path>\n"
            << "  put <host> <local> <remote>\n"
            << "  hosts list\n"
            << "  hosts add <name> <user@host[:port]>\n"
            << "  hosts remove <name>\n"
            << "  config [--show]\n"
            << "<host> is a saved host name or user@host[:port]; the password "
               "comes from VISIONSYNC_PASSWORD or the saved entry.\n";
  return 2;
}

static json::Object service_json(const ServiceDescriptor &d) {
  json::Object o;
  o["name"] = d.name;
  o["websocket_url"] = d.websocket_url;
  o["version"] = d.version;
  o["platform"] = d.platform;
  o["app"] = d.app;
  o["capabilities"] = json::str_list(d.capabilities);
  return o;
}

static json::Object file_json(const RemoteFile &f) {
  json::Object o;
  o["name"] = f.name;
  o["path"] = f.path;
  o["is_directory"] = f.is_directory;
  o["size"] = (double)f.size;
  o["modified"] = (double)f.modified;
  o["permissions"] = (double)f.permissions;
  return o;
}

static std::optional<HostConfiguration> resolve_host(const std::string &spec) {
  HostStore store(default_hosts_path());
  store.load();
  auto host = store.find(spec);
  if (!host)
    host = parse_host_spec(spec);
  if (!host)
    return std::nullopt;
  if (const char *pw = std::getenv("VISIONSYNC_PASSWORD"))
    host->password = pw;
  return host;
}

static std::string parent_of(const std::string &path) {
  auto slash = path.rfind('/');
  if (slash == std::string::npos)
    return ".";
  if (slash == 0)
    return "/";
  return path.substr(0, slash);
}

int main(int argc, char **argv) {
  if (argc < 2)
    return usage();

  std::string config_path = default_config_path();
  std::string log_level;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else {
      args.push_back(a);
    }
  }
  if (args.empty())
    return usage();
  const std::string cmd = args[0];

  auto option = [&](const std::string &name) -> std::optional<std::string> {
    for (size_t i = 1; i + 1 < args.size(); ++i)
      if (args[i] == name)
        return args[i + 1];
    return std::nullopt;
  };

  try {
    Config cfg;
    if (std::ifstream(config_path).good())
      cfg = load_config(config_path);
    if (!log_level.empty())
      cfg.log_level = log_level;
    LogLevel lvl;
    if (!parse_log_level(cfg.log_level, lvl)) {
      std::cerr << "unknown log level: " << cfg.log_level << "\n";
      return 2;
    }
    Logger::get().set_level(lvl);

    if (cmd == "scan") {
      if (auto port = option("--port"))
        cfg.discovery_port = std::stoi(*port);
      ServiceDiscovery discovery(cfg,
                                 std::make_shared<SystemNetworkInterfaces>(),
                                 std::make_shared<HttpProbeClient>());
      auto found = option("--prefix") ? discovery.scan(*option("--prefix"))
                                      : discovery.discover();
      for (const auto &d : found)
        std::cout << json::dumps(service_json(d)) << "\n";
      return 0;
    }

    if (cmd == "connect") {
      if (args.size() < 2)
        return usage();
      int seconds = 5;
      if (auto s = option("--seconds"))
        seconds = std::stoi(*s);

      ConnectionSession session(
          cfg, [] { return std::make_shared<WebSocketTransport>(); });
      MessageCoalescer conversation;
      session.set_message_handler(
          [&](const protocol::ProtocolMessage &msg, const protocol::Body &body) {
            if (std::holds_alternative<protocol::Conversation>(body))
              conversation.ingest(msg);
          });

      session.connect(args[1]);
      session.wait_for_settled(std::chrono::seconds(15));
      if (!session.state().is_connected()) {
        std::cerr << "connect failed: " << session.state().to_string() << "\n";
        session.disconnect();
        return 1;
      }
      std::cout << "Connected to " << args[1] << "\n";

      if (auto text = option("--send")) {
        auto msg = protocol::make_user_message(crypto::new_uuid(), *text);
        if (!session.send(msg)) {
          std::cerr << session.last_error() << "\n";
          session.disconnect();
          return 1;
        }
      }

      std::this_thread::sleep_for(std::chrono::seconds(seconds));
      for (const auto &m : conversation.visible())
        std::cout << "[" << kind_name(m.kind) << "] " << m.text << "\n";
      bool ok = session.state().is_connected();
      if (!ok)
        std::cerr << session.state().to_string() << "\n";
      session.disconnect();
      return ok ? 0 : 1;
    }

    if (cmd == "hosts") {
      HostStore store(default_hosts_path());
      store.load();
      if (args.size() >= 2 && args[1] == "list") {
        for (const auto &h : store.hosts())
          std::cout << h.name << "\t" << h.username << "@" << h.hostname << ":"
                    << h.port << "\n";
        return 0;
      }
      if (args.size() >= 4 && args[1] == "add") {
        auto h = parse_host_spec(args[3]);
        if (!h) {
          std::cerr << "bad host spec: " << args[3] << "\n";
          return 2;
        }
        h->name = args[2];
        store.upsert(*h);
        store.save();
        std::cout << "Saved host: " << h->name << "\n";
        return 0;
      }
      if (args.size() >= 3 && args[1] == "remove") {
        if (!store.remove(args[2])) {
          std::cerr << "no such host: " << args[2] << "\n";
          return 1;
        }
        store.save();
        return 0;
      }
      return usage();
    }

    if (cmd == "config") {
      if (args.size() >= 2 && args[1] == "--show") {
        std::cout << json::dumps(config_to_json(cfg)) << "\n";
        return 0;
      }
      save_config(config_path, cfg);
      std::cout << "Config saved: " << config_path << "\n";
      return 0;
    }

    if (cmd == "ssh" || cmd == "ls" || cmd == "cat" || cmd == "rm" ||
        cmd == "put") {
      if (args.size() < 2)
        return usage();
      auto host = resolve_host(args[1]);
      if (!host) {
        std::cerr << "unknown host: " << args[1] << "\n";
        return 2;
      }

      RemoteSession remote(cfg, std::make_shared<Ssh2Backend>());
      if (!remote.connect(*host)) {
        std::cerr << "connection failed: " << remote.last_error() << "\n";
        return 1;
      }

      int rc = 0;
      if (cmd == "ssh") {
        if (args.size() < 3)
          return usage();
        std::string command;
        for (size_t i = 2; i < args.size(); ++i)
          command += (i > 2 ? " " : "") + args[i];
        std::cout << remote.execute_command(command);
      } else if (cmd == "ls") {
        auto files = remote.list_directory(args.size() > 2 ? args[2] : "");
        for (const auto &f : files)
          std::cout << json::dumps(file_json(f)) << "\n";
      } else if (cmd == "cat") {
        if (args.size() < 3)
          return usage();
        std::cout << remote.read_file(args[2]);
      } else if (cmd == "rm") {
        if (args.size() < 3)
          return usage();
        rc = 1;
        for (const auto &f : remote.list_directory(parent_of(args[2]))) {
          if (f.path == args[2] || f.name == args[2]) {
            remote.delete_file(f);
            rc = 0;
            break;
          }
        }
        if (rc)
          std::cerr << "not found: " << args[2] << "\n";
      } else if (cmd == "put") {
        if (args.size() < 4)
          return usage();
        std::ifstream in(args[2], std::ios::binary);
        if (!in) {
          std::cerr << "cannot read " << args[2] << "\n";
          return 1;
        }
        std::ostringstream data;
        data << in.rdbuf();
        remote.write_file(args[3], data.str());
        std::cout << "Uploaded " << args[2] << " -> " << args[3] << "\n";
      }
      remote.disconnect();
      return rc;
    }
  } catch (const Error &e) {
    std::cerr << e.describe() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  return usage();
}
