#pragma once

#include <stdexcept>
#include <string>

#include "amilive/message.hpp"

namespace amilive {

// Root of everything the client throws.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// connect/read/write failure; the supervisor reconnects on it
class TransportError : public Error {
public:
  using Error::Error;
};

// Login rejected by the manager. Carries the rejecting response.
class AuthenticationFailure : public Error {
public:
  explicit AuthenticationFailure(ProtocolMessage response)
      : Error("AMI login rejected: " +
              (response.get("Message").empty() ? response.get("Response") : response.get("Message"))),
        response_(std::move(response)) {}

  const ProtocolMessage& response() const { return response_; }

private:
  ProtocolMessage response_;
};

class ActionTimeout : public Error {
public:
  ActionTimeout(const std::string& action, const std::string& action_id)
      : Error("no response to " + action + " (ActionID " + action_id + ")"),
        action_id_(action_id) {}

  const std::string& action_id() const { return action_id_; }

private:
  std::string action_id_;
};

class ProtocolDecodeError : public Error {
public:
  using Error::Error;
};

// Action sent while not connected, or still outstanding when the connection went away.
class ConnectionClosed : public Error {
public:
  using Error::Error;
};

}  // namespace amilive
