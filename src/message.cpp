#include "amilive/message.hpp"

#include <sstream>

#include "amilive/error.hpp"
#include "amilive/strings.hpp"

namespace amilive {

const char* to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::Event: return "Event";
    case MessageKind::Response: return "Response";
    case MessageKind::Unknown: return "Unknown";
  }
  return "Unknown";
}

ProtocolMessage::ProtocolMessage(MessageKind kind, Headers headers)
    : kind_(kind), headers_(std::move(headers)) {}

ProtocolMessage ProtocolMessage::parse(const RawBlock& block) {
  Headers headers;
  headers.reserve(block.size());
  bool keyed = false;

  for (const auto& line : block) {
    auto pos = line.find(':');
    if (pos == std::string::npos) {
      // Command output continuation ("Response: Follows" style)
      std::string text = trim(line);
      if (!text.empty()) headers.emplace_back("Output", text);
      continue;
    }
    std::string k = trim(line.substr(0, pos));
    if (k.empty()) continue;
    headers.emplace_back(std::move(k), trim(line.substr(pos + 1)));
    keyed = true;
  }

  if (!keyed) {
    std::string first = block.empty() ? std::string() : block.front();
    throw ProtocolDecodeError("block without any 'Key: Value' line: '" + first + "'");
  }

  ProtocolMessage msg(MessageKind::Unknown, std::move(headers));
  if (msg.has("Event")) {
    msg.kind_ = MessageKind::Event;
  } else if (msg.has("Response")) {
    msg.kind_ = MessageKind::Response;
  }
  return msg;
}

bool ProtocolMessage::has(const std::string& key) const {
  for (const auto& [k, v] : headers_) {
    if (iequals(k, key)) return true;
  }
  return false;
}

std::string ProtocolMessage::get(const std::string& key) const {
  for (const auto& [k, v] : headers_) {
    if (iequals(k, key)) return v;
  }
  return "";
}

std::vector<std::string> ProtocolMessage::get_all(const std::string& key) const {
  std::vector<std::string> out;
  for (const auto& [k, v] : headers_) {
    if (iequals(k, key)) out.push_back(v);
  }
  return out;
}

std::string ProtocolMessage::name() const {
  return is_event() ? get("Event") : std::string();
}

bool ProtocolMessage::is_success() const {
  return iequals(get("Response"), "success");
}

std::string serialize_action(const std::string& name, const Headers& params,
                             const std::string& action_id) {
  std::ostringstream oss;
  oss << "Action: " << name << "\r\n";
  for (const auto& [k, v] : params) {
    if (iequals(k, "ActionID") || iequals(k, "Action")) continue;
    oss << k << ": " << v << "\r\n";
  }
  oss << "ActionID: " << action_id << "\r\n"
      << "\r\n";
  return oss.str();
}

}  // namespace amilive
