#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace amilive {

struct Settings {
  std::string host = "127.0.0.1";
  std::uint16_t port = 5038;
  std::string username;
  std::string secret;
  std::string events = "on";  // Login "Events:" mask

  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds read_timeout{30000};    // greeting
  std::chrono::milliseconds action_timeout{10000};
  std::chrono::milliseconds reconnect_backoff{2000};
  std::chrono::milliseconds ping_interval{30000};   // 0 disables the keepalive

  std::string action_id_prefix = "amilive";

  // How many timed-out ActionIDs are remembered. A response arriving later
  // than that many further timeouts is forwarded to "*" handlers instead of
  // being discarded.
  std::size_t expired_action_memory = 256;

  // Larger incoming blocks are dropped and logged.
  std::size_t max_block_bytes = 1 << 20;

  // Sent after login, best effort.
  std::vector<std::string> initial_actions = {"QueueStatus", "ExtensionStateList", "DeviceStateList"};

  // Direction heuristics on the lowercased dialplan context.
  std::vector<std::string> inbound_context_markers = {"from-external", "from-pstn"};
  std::vector<std::string> outbound_context_markers = {"from-internal"};

  // Channel technology prefixes whose trailing digits are a local extension.
  std::vector<std::string> extension_prefixes = {"SIP/", "PJSIP/"};

  // Throws std::invalid_argument naming every problem found.
  void validate() const;

  // "user@host:port" (no secret).
  std::string describe() const;
};

}  // namespace amilive
