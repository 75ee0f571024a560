#include "visionsync/coalescer.hpp"
#include "visionsync/crypto.hpp"
#include "visionsync/logger.hpp"

#include <cctype>
#include <utility>

namespace visionsync {

namespace {

const std::pair<AskType, const char *> kAskNames[] = {
    {AskType::Followup, "followup"},
    {AskType::Command, "command"},
    {AskType::CommandOutput, "command_output"},
    {AskType::Tool, "tool"},
    {AskType::BrowserActionLaunch, "browser_action_launch"},
    {AskType::UseMcpServer, "use_mcp_server"},
    {AskType::CompletionResult, "completion_result"},
    {AskType::ApiReqFailed, "api_req_failed"},
    {AskType::ResumeCompletedTask, "resume_completed_task"},
    {AskType::MistakeLimitReached, "mistake_limit_reached"},
    {AskType::AutoApprovalMaxReqReached, "auto_approval_max_req_reached"},
    {AskType::ResumeTask, "resume_task"},
    {AskType::FilePermission, "file_permission"},
    {AskType::DiffApproval, "diff_approval"},
};

const std::pair<SayType, const char *> kSayNames[] = {
    {SayType::Text, "text"},
    {SayType::CompletionResult, "completion_result"},
    {SayType::Error, "error"},
    {SayType::CommandOutput, "command_output"},
    {SayType::UserFeedback, "user_feedback"},
    {SayType::Reasoning, "reasoning"},
    {SayType::Image, "image"},
    {SayType::ApiReqStarted, "api_req_started"},
    {SayType::ApiReqFinished, "api_req_finished"},
    {SayType::TaskCompleted, "task_completed"},
    {SayType::TaskError, "task_error"},
    {SayType::TaskStarted, "task_started"},
    {SayType::ToolsUsed, "tools_used"},
    {SayType::WebSearchStarted, "web_search_started"},
    {SayType::WebSearchFinished, "web_search_finished"},
    {SayType::CommandStarted, "command_started"},
    {SayType::CommandFinished, "command_finished"},
    {SayType::FileReadStarted, "file_read_started"},
    {SayType::FileReadFinished, "file_read_finished"},
    {SayType::FileWriteStarted, "file_write_started"},
    {SayType::FileWriteFinished, "file_write_finished"},
};

// "taskStarted" -> "task_started"; snake_case passes through.
std::string snake_case(const std::string &s) {
  std::string out;
  for (char c : s) {
    if (std::isupper((unsigned char)c)) {
      if (!out.empty())
        out.push_back('_');
      out.push_back((char)std::tolower((unsigned char)c));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

const char *ask_type_name(AskType t) {
  for (const auto &[v, n] : kAskNames)
    if (v == t)
      return n;
  return "followup";
}

const char *say_type_name(SayType t) {
  for (const auto &[v, n] : kSayNames)
    if (v == t)
      return n;
  return "text";
}

std::optional<AskType> parse_ask_type(const std::string &name) {
  const std::string key = snake_case(name);
  for (const auto &[v, n] : kAskNames)
    if (key == n)
      return v;
  return std::nullopt;
}

std::optional<SayType> parse_say_type(const std::string &name) {
  const std::string key = snake_case(name);
  for (const auto &[v, n] : kSayNames)
    if (key == n)
      return v;
  return std::nullopt;
}

std::optional<MessageKind> parse_kind(const std::string &tagged) {
  auto colon = tagged.find(':');
  if (colon == std::string::npos)
    return std::nullopt;
  const std::string category = tagged.substr(0, colon);
  const std::string name = tagged.substr(colon + 1);
  if (category == "ask") {
    if (auto a = parse_ask_type(name))
      return MessageKind(*a);
  } else if (category == "say") {
    if (auto s = parse_say_type(name))
      return MessageKind(*s);
  }
  return std::nullopt;
}

std::string kind_name(const MessageKind &k) {
  if (const auto *a = std::get_if<AskType>(&k))
    return std::string("ask:") + ask_type_name(*a);
  return std::string("say:") + say_type_name(std::get<SayType>(k));
}

bool is_visible(const MessageKind &k) {
  if (std::holds_alternative<AskType>(k))
    return true;
  switch (std::get<SayType>(k)) {
  case SayType::Text:
  case SayType::CompletionResult:
  case SayType::Error:
  case SayType::CommandOutput:
  case SayType::UserFeedback:
  case SayType::Reasoning:
  case SayType::Image:
    return true;
  default:
    return false;
  }
}

static MessageKind resolve_kind(const protocol::Conversation &c) {
  if (c.kind) {
    if (auto k = parse_kind(*c.kind))
      return *k;
  }
  auto original = json::get_str(c.metadata, "originalType");
  if (original && *original == "ask") {
    if (auto t = json::get_str(c.metadata, "askType"))
      if (auto a = parse_ask_type(*t))
        return *a;
  } else if (original && *original == "say") {
    if (auto t = json::get_str(c.metadata, "sayType"))
      if (auto s = parse_say_type(*t))
        return *s;
  }
  if (c.role && *c.role == "user")
    return AskType::Followup;
  return SayType::Text;
}

std::optional<ConversationMessage>
to_conversation_message(const protocol::ProtocolMessage &msg) {
  if (msg.type != protocol::type::AIConversation)
    return std::nullopt;
  auto body = protocol::decode_body(msg);
  const auto &c = std::get<protocol::Conversation>(body);
  const auto &content = c.content ? c.content : c.text;
  if (!c.role || !content)
    return std::nullopt;

  ConversationMessage m;
  m.id = msg.id;
  m.message_id = c.message_id;
  m.kind = resolve_kind(c);
  m.text = *content;
  m.partial = c.partial.value_or(false);
  m.timestamp = msg.timestamp;
  return m;
}

bool MessageCoalescer::ingest(const protocol::ProtocolMessage &msg) {
  auto m = to_conversation_message(msg);
  if (!m) {
    VS_LOG_WARN(LogCategory::Conversation,
                "Dropping " + msg.type + " " + msg.id +
                    ": missing role or content");
    return false;
  }
  add(std::move(*m));
  return true;
}

void MessageCoalescer::add(ConversationMessage m) {
  std::vector<ConversationMessage> snapshot;
  VisibleHandler h;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string &lid = m.logical_id();

    ConversationMessage *open = nullptr;
    ConversationMessage *latest = nullptr;
    for (auto it = all_.rbegin(); it != all_.rend(); ++it) {
      if (it->logical_id() != lid)
        continue;
      if (!latest)
        latest = &*it;
      if (it->partial) {
        open = &*it;
        break;
      }
    }

    if (open) {
      VS_LOG_DEBUG(LogCategory::Conversation,
                   std::string(m.partial ? "Streaming update to " : "Completing ") + lid);
      open->text = m.text;
      open->partial = m.partial;
    } else if (!m.partial && latest && !latest->partial &&
               latest->text == m.text && latest->kind == m.kind) {
      VS_LOG_TRACE(LogCategory::Conversation, "Duplicate final for " + lid);
      return;
    } else {
      VS_LOG_DEBUG(LogCategory::Conversation,
                   std::string(m.partial ? "New partial " : "New message ") + lid);
      all_.push_back(std::move(m));
    }
    publish_locked(snapshot, h);
  }
  if (h)
    h(snapshot);
}

void MessageCoalescer::add_user_message(const std::string &text) {
  ConversationMessage m;
  m.id = crypto::new_uuid();
  m.kind = AskType::Followup;
  m.text = text;
  m.timestamp = protocol::now_ms();
  add(std::move(m));
}

void MessageCoalescer::clear() {
  std::vector<ConversationMessage> snapshot;
  VisibleHandler h;
  {
    std::lock_guard<std::mutex> lk(mu_);
    all_.clear();
    publish_locked(snapshot, h);
  }
  VS_LOG_INFO(LogCategory::Conversation, "Cleared all messages");
  if (h)
    h(snapshot);
}

void MessageCoalescer::publish_locked(std::vector<ConversationMessage> &out,
                                      VisibleHandler &h) {
  visible_.clear();
  for (const auto &m : all_)
    if (is_visible(m.kind))
      visible_.push_back(m);
  out = visible_;
  h = on_visible_;
}

std::vector<ConversationMessage> MessageCoalescer::all() const {
  std::lock_guard<std::mutex> lk(mu_);
  return all_;
}

std::vector<ConversationMessage> MessageCoalescer::visible() const {
  std::lock_guard<std::mutex> lk(mu_);
  return visible_;
}

void MessageCoalescer::set_visible_handler(VisibleHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  on_visible_ = std::move(h);
}

} // namespace visionsync
