#include "agent_viewmodel.hpp"
#include "visionsync/crypto.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"

using visionsync::ConnectionPhase;
using visionsync::LogCategory;

namespace visionsync_gui {

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

AgentViewModel::AgentViewModel(visionsync::ServiceDiscovery *discovery,
                               visionsync::ConnectionSession *session,
                               visionsync::MessageCoalescer *conversation)
    : discovery_(discovery), session_(session), conversation_(conversation),
      session_id_(visionsync::crypto::new_uuid()) {
  session_->set_message_handler(
      [this](const visionsync::protocol::ProtocolMessage &msg,
             const visionsync::protocol::Body &body) { on_message(msg, body); });
}

AgentViewModel::~AgentViewModel() {
  session_->set_message_handler(nullptr);
  // Joins the receive thread, so no handler call is still using this.
  session_->disconnect();
}

void AgentViewModel::on_message(const visionsync::protocol::ProtocolMessage &msg,
                                const visionsync::protocol::Body &body) {
  const auto *c = std::get_if<visionsync::protocol::Conversation>(&body);
  if (!c)
    return;
  if (!c->session_id.empty()) {
    std::lock_guard<std::mutex> lk(mu_);
    session_id_ = c->session_id;
  }
  conversation_->ingest(msg);
}

bool AgentViewModel::refresh() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    error_.clear();
  }
  std::vector<visionsync::ServiceDescriptor> found;
  try {
    found = discovery_->discover();
  } catch (const visionsync::Error &e) {
    std::lock_guard<std::mutex> lk(mu_);
    error_ = e.what();
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  services_ = found;
  return true;
}

std::vector<ServiceRow> AgentViewModel::services() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ServiceRow> rows;
  for (const auto &s : services_) {
    ServiceRow r;
    r.name = s.name;
    r.url = s.websocket_url;
    r.detail = s.platform;
    if (!s.app.empty())
      r.detail += " / " + s.app;
    rows.push_back(std::move(r));
  }
  return rows;
}

bool AgentViewModel::connect(size_t index) {
  visionsync::ServiceDescriptor target;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (index >= services_.size()) {
      error_ = "No such service";
      return false;
    }
    target = services_[index];
    selected_ = target;
    error_.clear();
  }
  session_->connect(target);
  return true;
}

bool AgentViewModel::reconnect() {
  std::optional<visionsync::ServiceDescriptor> target;
  {
    std::lock_guard<std::mutex> lk(mu_);
    target = selected_;
  }
  if (!target)
    return false;
  VS_LOG_INFO(LogCategory::Connection, "Reconnecting to " + target->name);
  session_->connect(*target);
  return true;
}

void AgentViewModel::disconnect() { session_->disconnect(); }

bool AgentViewModel::send_user_message(const std::string &text) {
  const std::string t = trim(text);
  if (t.empty())
    return false;
  if (!session_->state().is_connected()) {
    std::lock_guard<std::mutex> lk(mu_);
    error_ = "Not connected to an agent";
    return false;
  }

  auto msg = visionsync::protocol::make_user_message(session_id(), t);
  if (!session_->send(msg)) {
    std::lock_guard<std::mutex> lk(mu_);
    error_ = session_->last_error();
    return false;
  }
  // Keyed by the wire messageId so an echoed copy from the agent folds into
  // this entry.
  if (auto local = visionsync::to_conversation_message(msg))
    conversation_->add(std::move(*local));
  return true;
}

void AgentViewModel::clear_conversation() { conversation_->clear(); }

std::string AgentViewModel::status_text() const {
  switch (session_->state().phase) {
  case ConnectionPhase::Disconnected:
    return "Offline";
  case ConnectionPhase::Connecting:
    return "Connecting...";
  case ConnectionPhase::Connected:
    return "Online";
  case ConnectionPhase::Failed:
    return "Connection Failed";
  }
  return "Offline";
}

std::vector<MessageRow> AgentViewModel::rows() const {
  std::vector<MessageRow> out;
  for (const auto &m : conversation_->visible()) {
    MessageRow r;
    r.id = m.logical_id();
    r.kind = visionsync::kind_name(m.kind);
    r.text = m.text;
    r.partial = m.partial;
    out.push_back(std::move(r));
  }
  return out;
}

std::string AgentViewModel::error() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!error_.empty())
    return error_;
  return session_->last_error();
}

std::string AgentViewModel::session_id() const {
  std::lock_guard<std::mutex> lk(mu_);
  return session_id_;
}

} // namespace visionsync_gui
