#pragma once

#include <string>
#include <utility>
#include <vector>

namespace amilive {

// Ordered header list. Repeated keys are legal (Variable, ChanVariable, Output).
using Headers = std::vector<std::pair<std::string, std::string>>;

// One blank-line-terminated block as read from the wire, CR/LF stripped.
using RawBlock = std::vector<std::string>;

enum class MessageKind { Event, Response, Unknown };

const char* to_string(MessageKind kind);

class ProtocolMessage {
public:
  ProtocolMessage() = default;
  ProtocolMessage(MessageKind kind, Headers headers);

  // Splits every line at the first ':' and classifies the result.
  // Throws ProtocolDecodeError when no line carries a key.
  static ProtocolMessage parse(const RawBlock& block);

  MessageKind kind() const { return kind_; }
  bool is_event() const { return kind_ == MessageKind::Event; }
  bool is_response() const { return kind_ == MessageKind::Response; }

  // Case-insensitive lookups; first occurrence wins.
  bool has(const std::string& key) const;
  std::string get(const std::string& key) const;
  std::vector<std::string> get_all(const std::string& key) const;

  // Value of "Event" for events, empty otherwise.
  std::string name() const;
  std::string action_id() const { return get("ActionID"); }

  // Response: Success (case-insensitive).
  bool is_success() const;

  const Headers& headers() const { return headers_; }

private:
  MessageKind kind_ = MessageKind::Unknown;
  Headers headers_;
};

// Builds "Action: <name>\r\n<params...>ActionID: <id>\r\n\r\n".
// A caller supplied ActionID is dropped in favour of action_id.
std::string serialize_action(const std::string& name, const Headers& params,
                             const std::string& action_id);

}  // namespace amilive
