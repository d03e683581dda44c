#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "amilive/message.hpp"
#include "amilive/settings.hpp"

namespace amilive {

enum class CallDirection { Inbound, Outbound, Internal };

const char* to_string(CallDirection dir);

struct CallRecord {
  std::string uniqueid;
  std::string channel;
  std::string caller_id;
  std::string destination;  // dialed Exten
  std::string context;
  std::string extension;    // local extension derived from the channel, may be empty
  std::string state;        // "ringing" on creation, then verbatim from Newstate
  CallDirection direction = CallDirection::Internal;
  std::chrono::system_clock::time_point created = std::chrono::system_clock::now();
};

struct DeviceState {
  std::string device;
  std::string state;
  std::chrono::system_clock::time_point updated = std::chrono::system_clock::now();
};

// Derived live state: calls keyed by Uniqueid, devices keyed by device name.
// apply() is called from the listener thread only; the accessors copy under
// the lock and may be called from anywhere.
class StateTracker {
public:
  explicit StateTracker(const Settings& settings);

  // Ignores events it has no rule for.
  void apply(const ProtocolMessage& event);

  std::vector<CallRecord> active_calls() const;
  std::map<std::string, DeviceState> device_states() const;

  void clear();

  CallDirection classify_direction(const std::string& context) const;
  std::string extract_extension(const std::string& channel) const;

private:
  void on_newchannel(const ProtocolMessage& m);
  void on_newstate(const ProtocolMessage& m);
  void on_hangup(const ProtocolMessage& m);
  void on_rename(const ProtocolMessage& m);
  void on_new_callerid(const ProtocolMessage& m);
  void on_bridge(const ProtocolMessage& m, bool enter);
  void on_device_state(const std::string& device, const std::string& state);

  std::vector<std::string> inbound_markers_;
  std::vector<std::string> outbound_markers_;
  std::vector<std::string> extension_prefixes_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, CallRecord> calls_;
  std::map<std::string, DeviceState> devices_;
};

}  // namespace amilive
