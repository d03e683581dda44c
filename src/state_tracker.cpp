#include "amilive/state_tracker.hpp"

#include <algorithm>
#include <cctype>

#include "amilive/log.hpp"
#include "amilive/strings.hpp"

namespace amilive {

const char* to_string(CallDirection dir) {
  switch (dir) {
    case CallDirection::Inbound: return "inbound";
    case CallDirection::Outbound: return "outbound";
    case CallDirection::Internal: return "internal";
  }
  return "internal";
}

StateTracker::StateTracker(const Settings& settings)
    : extension_prefixes_(settings.extension_prefixes) {
  for (const auto& m : settings.inbound_context_markers) inbound_markers_.push_back(lower(m));
  for (const auto& m : settings.outbound_context_markers) outbound_markers_.push_back(lower(m));
}

void StateTracker::apply(const ProtocolMessage& m) {
  const std::string event = m.name();
  if (event.empty()) return;

  // Channel lifecycle
  if (iequals(event, "Newchannel")) return on_newchannel(m);
  if (iequals(event, "Newstate")) return on_newstate(m);
  if (iequals(event, "Hangup")) return on_hangup(m);
  if (iequals(event, "Rename")) return on_rename(m);
  if (iequals(event, "NewCallerid")) return on_new_callerid(m);
  if (iequals(event, "BridgeEnter")) return on_bridge(m, true);
  if (iequals(event, "BridgeLeave")) return on_bridge(m, false);

  // Devices / hints
  if (iequals(event, "DeviceStateChange")) {
    return on_device_state(m.get("Device"), m.get("State"));
  }
  if (iequals(event, "ExtensionStatus")) {
    std::string device = m.get("Hint");
    if (device.empty() && !m.get("Exten").empty()) {
      device = m.get("Exten") + "@" + m.get("Context");
    }
    std::string state = m.get("StatusText");
    if (state.empty()) state = m.get("Status");
    return on_device_state(device, state);
  }

  // Queue events carry no derived state here; registered handlers still get them.
}

void StateTracker::on_newchannel(const ProtocolMessage& m) {
  CallRecord c;
  c.uniqueid = m.get("Uniqueid");
  if (c.uniqueid.empty()) return;
  c.channel = m.get("Channel");
  c.caller_id = m.get("CallerIDNum");
  c.destination = m.get("Exten");
  c.context = m.get("Context");
  c.extension = extract_extension(c.channel);
  c.state = "ringing";
  c.direction = classify_direction(c.context);
  c.created = std::chrono::system_clock::now();

  AMILIVE_DEBUG("Newchannel: " << c.channel << " " << c.caller_id << " -> " << c.destination
                << " [" << to_string(c.direction) << "]");

  std::lock_guard<std::mutex> lk(mutex_);
  calls_[c.uniqueid] = std::move(c);
}

void StateTracker::on_newstate(const ProtocolMessage& m) {
  std::string state = m.get("ChannelStateDesc");
  if (state.empty()) state = m.get("ChannelState");
  if (state.empty()) state = "unknown";

  std::lock_guard<std::mutex> lk(mutex_);
  auto it = calls_.find(m.get("Uniqueid"));
  if (it == calls_.end()) return;
  it->second.state = state;
}

void StateTracker::on_hangup(const ProtocolMessage& m) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = calls_.find(m.get("Uniqueid"));
  if (it == calls_.end()) return;
  AMILIVE_DEBUG("Hangup: " << it->second.channel);
  calls_.erase(it);
}

void StateTracker::on_rename(const ProtocolMessage& m) {
  std::string newn = m.get("Newname");
  if (newn.empty()) return;

  std::lock_guard<std::mutex> lk(mutex_);
  auto it = calls_.find(m.get("Uniqueid"));
  if (it == calls_.end()) return;
  it->second.channel = newn;
  it->second.extension = extract_extension(newn);
}

void StateTracker::on_new_callerid(const ProtocolMessage& m) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = calls_.find(m.get("Uniqueid"));
  if (it == calls_.end()) return;
  it->second.caller_id = m.get("CallerIDNum");
}

void StateTracker::on_bridge(const ProtocolMessage& m, bool enter) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = calls_.find(m.get("Uniqueid"));
  if (it == calls_.end()) return;
  if (enter) {
    it->second.state = "bridged";
  } else if (it->second.state == "bridged") {
    it->second.state = "up";
  }
}

void StateTracker::on_device_state(const std::string& device, const std::string& state) {
  if (device.empty()) return;
  std::lock_guard<std::mutex> lk(mutex_);
  auto& d = devices_[device];
  d.device = device;
  d.state = state;
  d.updated = std::chrono::system_clock::now();
}

std::vector<CallRecord> StateTracker::active_calls() const {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<CallRecord> out;
  out.reserve(calls_.size());
  for (const auto& [id, c] : calls_) out.push_back(c);
  std::sort(out.begin(), out.end(), [](const CallRecord& a, const CallRecord& b) {
    return a.created < b.created;
  });
  return out;
}

std::map<std::string, DeviceState> StateTracker::device_states() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return devices_;
}

void StateTracker::clear() {
  std::lock_guard<std::mutex> lk(mutex_);
  calls_.clear();
  devices_.clear();
}

CallDirection StateTracker::classify_direction(const std::string& context) const {
  std::string ctx = lower(context);
  for (const auto& m : inbound_markers_) {
    if (ctx.find(m) != std::string::npos) return CallDirection::Inbound;
  }
  for (const auto& m : outbound_markers_) {
    if (ctx.find(m) != std::string::npos) return CallDirection::Outbound;
  }
  return CallDirection::Internal;
}

std::string StateTracker::extract_extension(const std::string& channel) const {
  // SIP/1001-00000001 -> 1001, PJSIP/provider-0000001b -> ""
  for (const auto& p : extension_prefixes_) {
    if (p.empty()) continue;
    for (auto pos = channel.find(p); pos != std::string::npos; pos = channel.find(p, pos + 1)) {
      auto begin = pos + p.size();
      auto end = begin;
      while (end < channel.size() && std::isdigit(static_cast<unsigned char>(channel[end]))) end++;
      if (end > begin) return channel.substr(begin, end - begin);
    }
  }
  return "";
}

}  // namespace amilive
