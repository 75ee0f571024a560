#pragma once
#include "protocol.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace visionsync {

// Requests the agent puts to the user.
enum class AskType {
  Followup,
  Command,
  CommandOutput,
  Tool,
  BrowserActionLaunch,
  UseMcpServer,
  CompletionResult,
  ApiReqFailed,
  ResumeCompletedTask,
  MistakeLimitReached,
  AutoApprovalMaxReqReached,
  ResumeTask,
  FilePermission,
  DiffApproval,
};

// Statements from the agent. The lifecycle kinds after Image are
// bookkeeping and never shown.
enum class SayType {
  Text,
  CompletionResult,
  Error,
  CommandOutput,
  UserFeedback,
  Reasoning,
  Image,
  ApiReqStarted,
  ApiReqFinished,
  TaskCompleted,
  TaskError,
  TaskStarted,
  ToolsUsed,
  WebSearchStarted,
  WebSearchFinished,
  CommandStarted,
  CommandFinished,
  FileReadStarted,
  FileReadFinished,
  FileWriteStarted,
  FileWriteFinished,
};

using MessageKind = std::variant<AskType, SayType>;

// "ask_type" names as sent on the wire, e.g. "completion_result".
const char *ask_type_name(AskType t);
const char *say_type_name(SayType t);
// Accepts snake_case or camelCase ("taskStarted").
std::optional<AskType> parse_ask_type(const std::string &name);
std::optional<SayType> parse_say_type(const std::string &name);
// "say:text", "ask:followup"
std::optional<MessageKind> parse_kind(const std::string &tagged);
std::string kind_name(const MessageKind &k);
bool is_visible(const MessageKind &k);

struct ConversationMessage {
  std::string id;
  std::optional<std::string> message_id;
  MessageKind kind = SayType::Text;
  std::string text;
  bool partial = false;
  std::int64_t timestamp = 0;

  // Groups partial and final updates of one message.
  const std::string &logical_id() const {
    return message_id ? *message_id : id;
  }
};

// nullopt unless msg is an AIConversation carrying role and content (or
// text).
std::optional<ConversationMessage>
to_conversation_message(const protocol::ProtocolMessage &msg);

// Folds streamed partial updates into a stable, ordered message list.
// Thread-safe; the visible handler runs outside the lock.
class MessageCoalescer {
public:
  using VisibleHandler =
      std::function<void(const std::vector<ConversationMessage> &)>;

  // Maps and adds an inbound AIConversation. Returns false, leaving every
  // entry untouched, when it cannot be mapped.
  bool ingest(const protocol::ProtocolMessage &msg);

  // A partial update overwrites the most recent still-partial entry with the
  // same logical id, else appends. A final update closes that entry in place,
  // else appends, except that repeating the final text of the latest entry
  // for that id is a no-op.
  void add(ConversationMessage m);

  void add_user_message(const std::string &text);
  void clear();

  std::vector<ConversationMessage> all() const;
  std::vector<ConversationMessage> visible() const;

  void set_visible_handler(VisibleHandler h);

private:
  mutable std::mutex mu_;
  std::vector<ConversationMessage> all_;
  std::vector<ConversationMessage> visible_;
  VisibleHandler on_visible_;

  void publish_locked(std::vector<ConversationMessage> &out,
                      VisibleHandler &h);
};

} // namespace visionsync
