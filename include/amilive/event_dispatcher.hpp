#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "amilive/message.hpp"
#include "amilive/state_tracker.hpp"

namespace amilive {

using EventHandler = std::function<void(const ProtocolMessage&)>;

// Delivers messages in the order dispatch() is called: the state tracker
// first, then the handlers registered for the event name (case-insensitive)
// in registration order, then the "*" handlers. A throwing handler is logged
// and skipped.
class EventDispatcher {
public:
  static constexpr const char* kAnyEvent = "*";

  explicit EventDispatcher(StateTracker& tracker);

  // Safe from any thread, including from inside a handler; takes effect
  // for the next dispatched message.
  void register_handler(const std::string& event, EventHandler handler);

  // Events go to the tracker and named handlers; anything else (an
  // unmatched Response) only to the "*" handlers.
  void dispatch(const ProtocolMessage& message);

  std::size_t dispatched() const;

private:
  void invoke(const EventHandler& handler, const ProtocolMessage& message,
              const std::string& name);

  StateTracker& tracker_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<EventHandler>> handlers_;  // key = lowercased name
  std::size_t dispatched_ = 0;
};

}  // namespace amilive
