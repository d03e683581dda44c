#pragma once

#include "amilive/settings.hpp"

namespace amilive {

// CLI: <host> <port> <user> <secret>, then environment overrides:
//   AMI_HOST AMI_PORT AMI_USERNAME|AMI_USER AMI_PASSWORD|AMI_SECRET
//   AMI_CONNECT_TIMEOUT AMI_READ_TIMEOUT AMI_ACTION_TIMEOUT
//   AMI_RECONNECT_BACKOFF AMI_PING_INTERVAL   (seconds)
//   LOG_LEVEL                                 (applied to the logger)
// Malformed numbers throw std::invalid_argument.
Settings load_settings(int argc, char** argv);

}  // namespace amilive
