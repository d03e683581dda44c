#include "amilive/event_dispatcher.hpp"

#include <exception>

#include "amilive/log.hpp"
#include "amilive/strings.hpp"

namespace amilive {

EventDispatcher::EventDispatcher(StateTracker& tracker) : tracker_(tracker) {}

void EventDispatcher::register_handler(const std::string& event, EventHandler handler) {
  std::lock_guard<std::mutex> lk(mutex_);
  handlers_[lower(event)].push_back(std::move(handler));
}

void EventDispatcher::dispatch(const ProtocolMessage& message) {
  const std::string name = message.name();

  // Snapshot under the lock so handlers can register more handlers.
  std::vector<EventHandler> named;
  std::vector<EventHandler> any;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    dispatched_++;
    if (!name.empty()) {
      auto it = handlers_.find(lower(name));
      if (it != handlers_.end()) named = it->second;
    }
    auto it = handlers_.find(kAnyEvent);
    if (it != handlers_.end()) any = it->second;
  }

  if (message.is_event()) {
    try {
      tracker_.apply(message);
    } catch (const std::exception& ex) {
      AMILIVE_ERROR("state tracker failed on " << name << ": " << ex.what());
    } catch (...) {
      AMILIVE_ERROR("state tracker failed on " << name << ": unknown exception");
    }
  }

  for (const auto& h : named) invoke(h, message, name);
  for (const auto& h : any) invoke(h, message, name.empty() ? to_string(message.kind()) : name);
}

void EventDispatcher::invoke(const EventHandler& handler, const ProtocolMessage& message,
                             const std::string& name) {
  try {
    handler(message);
  } catch (const std::exception& ex) {
    AMILIVE_ERROR("event handler for " << name << " failed: " << ex.what());
  } catch (...) {
    AMILIVE_ERROR("event handler for " << name << " failed: unknown exception");
  }
}

std::size_t EventDispatcher::dispatched() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return dispatched_;
}

}  // namespace amilive
