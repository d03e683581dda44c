#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "amilive/message.hpp"

namespace amilive {

struct ActionResult {
  ProtocolMessage response;
  // Event-list actions only: every event carrying the ActionID, the
  // "EventList: Complete" one included.
  std::vector<ProtocolMessage> events;
};

// Matches responses to in-flight actions by ActionID.
//
// open() hands out a fresh token and a future; the listener feeds every
// parsed message to resolve(); the sender blocks in await(). Tokens come from
// a per-instance counter, so they never repeat while an action is outstanding.
//
// Tokens of timed-out actions are remembered, the last `expired_memory` of
// them, so their late responses can be discarded. Older ones are forgotten
// and such a response is reported as Forward like any foreign one.
class Correlator {
public:
  enum class Disposition {
    Consumed,   // fulfilled (or advanced) a pending action
    Discarded,  // late response for an action that already timed out
    Forward     // not ours: hand it to the dispatcher
  };

  struct Ticket {
    std::string action;
    std::string action_id;
    std::future<ActionResult> result;
  };

  explicit Correlator(std::string prefix, std::size_t expired_memory = 256);

  Ticket open(const std::string& action, bool event_list = false);

  // Throws ActionTimeout (slot released) or whatever the slot was failed with.
  ActionResult await(Ticket& ticket, std::chrono::milliseconds timeout);

  // Drops a slot whose action never made it onto the wire.
  void cancel(const std::string& action_id);

  Disposition resolve(const ProtocolMessage& message);

  // Fails every outstanding action with ConnectionClosed.
  void fail_all(const std::string& reason);

  std::size_t outstanding() const;

private:
  struct PendingAction {
    std::string action;
    std::chrono::steady_clock::time_point issued;
    bool event_list = false;
    ActionResult partial;
    std::promise<ActionResult> slot;
  };

  bool expire(const std::string& action_id);

  std::string prefix_;
  std::atomic<std::uint64_t> counter_{0};
  std::size_t expired_memory_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, PendingAction> pending_;
  std::deque<std::string> expired_;
};

}  // namespace amilive
