#include "amilive/settings.hpp"

#include <stdexcept>

namespace amilive {

void Settings::validate() const {
  std::vector<std::string> errors;

  if (host.empty()) errors.push_back("host must be set");
  if (port == 0) errors.push_back("port " + std::to_string(port) + " is not valid");
  if (username.empty()) errors.push_back("username must be set");
  if (secret.empty()) errors.push_back("secret must be set");

  if (connect_timeout.count() <= 0) errors.push_back("connect timeout must be positive");
  if (read_timeout.count() <= 0) errors.push_back("read timeout must be positive");
  if (action_timeout.count() <= 0) errors.push_back("action timeout must be positive");
  if (reconnect_backoff.count() < 0) errors.push_back("reconnect backoff must not be negative");
  if (ping_interval.count() < 0) errors.push_back("ping interval must not be negative");
  if (action_id_prefix.empty()) errors.push_back("action id prefix must be set");
  if (max_block_bytes == 0) errors.push_back("max block size must be positive");

  if (errors.empty()) return;

  std::string msg = "Configuration errors: ";
  for (std::size_t i = 0; i < errors.size(); i++) {
    if (i) msg += ", ";
    msg += errors[i];
  }
  throw std::invalid_argument(msg);
}

std::string Settings::describe() const {
  return username + "@" + host + ":" + std::to_string(port);
}

}  // namespace amilive
