#include "amilive/correlator.hpp"

#include <algorithm>
#include <exception>

#include "amilive/error.hpp"
#include "amilive/log.hpp"
#include "amilive/strings.hpp"

namespace amilive {

Correlator::Correlator(std::string prefix, std::size_t expired_memory)
    : prefix_(std::move(prefix)), expired_memory_(expired_memory) {}

Correlator::Ticket Correlator::open(const std::string& action, bool event_list) {
  Ticket t;
  t.action = action;
  t.action_id = prefix_ + "-" + std::to_string(++counter_);

  PendingAction p;
  p.action = action;
  p.issued = std::chrono::steady_clock::now();
  p.event_list = event_list;
  t.result = p.slot.get_future();

  std::lock_guard<std::mutex> lk(mutex_);
  pending_.emplace(t.action_id, std::move(p));
  return t;
}

ActionResult Correlator::await(Ticket& ticket, std::chrono::milliseconds timeout) {
  if (ticket.result.wait_for(timeout) != std::future_status::ready) {
    // Lost the race against a fulfilment if expire() finds nothing.
    if (expire(ticket.action_id)) throw ActionTimeout(ticket.action, ticket.action_id);
  }
  return ticket.result.get();
}

void Correlator::cancel(const std::string& action_id) {
  std::lock_guard<std::mutex> lk(mutex_);
  pending_.erase(action_id);
}

bool Correlator::expire(const std::string& action_id) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = pending_.find(action_id);
  if (it == pending_.end()) return false;
  pending_.erase(it);

  expired_.push_back(action_id);
  while (expired_.size() > expired_memory_) expired_.pop_front();
  return true;
}

Correlator::Disposition Correlator::resolve(const ProtocolMessage& message) {
  const std::string id = message.action_id();
  if (id.empty() || message.kind() == MessageKind::Unknown) return Disposition::Forward;

  std::lock_guard<std::mutex> lk(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    if (message.is_response() &&
        std::find(expired_.begin(), expired_.end(), id) != expired_.end()) {
      AMILIVE_DEBUG("discarding late response for " << id);
      return Disposition::Discarded;
    }
    return Disposition::Forward;
  }

  PendingAction& p = it->second;

  if (message.is_response()) {
    p.partial.response = message;
    if (p.event_list && iequals(message.get("EventList"), "start")) {
      return Disposition::Consumed;
    }
    p.slot.set_value(std::move(p.partial));
    pending_.erase(it);
    return Disposition::Consumed;
  }

  // Event: only list members belong to an action, and they are still dispatched.
  if (p.event_list) {
    p.partial.events.push_back(message);
    if (iequals(message.get("EventList"), "Complete")) {
      p.slot.set_value(std::move(p.partial));
      pending_.erase(it);
    }
  }
  return Disposition::Forward;
}

void Correlator::fail_all(const std::string& reason) {
  std::lock_guard<std::mutex> lk(mutex_);
  for (auto& [id, p] : pending_) {
    p.slot.set_exception(std::make_exception_ptr(ConnectionClosed(p.action + ": " + reason)));
  }
  pending_.clear();
}

std::size_t Correlator::outstanding() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return pending_.size();
}

}  // namespace amilive
