#pragma once
#include "visionsync/coalescer.hpp"
#include "visionsync/discovery.hpp"
#include "visionsync/session.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace visionsync_gui {

struct ServiceRow {
  std::string name;
  std::string url;
  std::string detail; // "macOS / Agent"
};

struct MessageRow {
  std::string id;
  std::string kind; // "say:text", "ask:followup", ...
  std::string text;
  bool partial = false;
};

// Agent panel: discovered services, the channel status and the
// conversation. Owns none of the collaborators; destruction disconnects the
// session.
class AgentViewModel {
public:
  AgentViewModel(visionsync::ServiceDiscovery *discovery,
                 visionsync::ConnectionSession *session,
                 visionsync::MessageCoalescer *conversation);
  ~AgentViewModel();

  // Blocking scan of the local segment. False, with error() set, when no
  // network is available.
  bool refresh();
  std::vector<ServiceRow> services() const;

  bool connect(size_t index);
  bool reconnect();
  void disconnect();

  // Sends an AIConversation user message and records it locally.
  bool send_user_message(const std::string &text);
  void clear_conversation();

  std::string status_text() const;
  std::vector<MessageRow> rows() const;
  std::string error() const;
  std::string session_id() const;

private:
  visionsync::ServiceDiscovery *discovery_;
  visionsync::ConnectionSession *session_;
  visionsync::MessageCoalescer *conversation_;

  mutable std::mutex mu_;
  std::vector<visionsync::ServiceDescriptor> services_;
  std::optional<visionsync::ServiceDescriptor> selected_;
  std::string session_id_;
  std::string error_;

  void on_message(const visionsync::protocol::ProtocolMessage &msg,
                  const visionsync::protocol::Body &body);
};

} // namespace visionsync_gui
