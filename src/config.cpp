#include "amilive/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "amilive/log.hpp"

namespace amilive {

static std::string getenv_s(const char* k) {
  const char* v = std::getenv(k);
  return v ? std::string(v) : "";
}

static long to_long(const std::string& name, const std::string& s) {
  try {
    std::size_t used = 0;
    long v = std::stol(s, &used);
    if (used != s.size()) throw std::invalid_argument(s);
    return v;
  } catch (const std::logic_error&) {
    throw std::invalid_argument(name + " is not a number: '" + s + "'");
  }
}

static std::uint16_t to_port(const std::string& name, const std::string& s) {
  long v = to_long(name, s);
  if (v < 1 || v > 65535) throw std::invalid_argument(name + " " + s + " is not valid");
  return static_cast<std::uint16_t>(v);
}

static void seconds_from_env(const char* k, std::chrono::milliseconds& out) {
  std::string v = getenv_s(k);
  if (!v.empty()) out = std::chrono::seconds(to_long(k, v));
}

Settings load_settings(int argc, char** argv) {
  Settings cfg;

  if (argc >= 3) {
    cfg.host = argv[1];
    cfg.port = to_port("port", argv[2]);
  }
  if (argc >= 4) cfg.username = argv[3];
  if (argc >= 5) cfg.secret = argv[4];

  if (!getenv_s("AMI_HOST").empty()) cfg.host = getenv_s("AMI_HOST");
  if (!getenv_s("AMI_PORT").empty()) cfg.port = to_port("AMI_PORT", getenv_s("AMI_PORT"));
  if (!getenv_s("AMI_USER").empty()) cfg.username = getenv_s("AMI_USER");
  if (!getenv_s("AMI_USERNAME").empty()) cfg.username = getenv_s("AMI_USERNAME");
  if (!getenv_s("AMI_SECRET").empty()) cfg.secret = getenv_s("AMI_SECRET");
  if (!getenv_s("AMI_PASSWORD").empty()) cfg.secret = getenv_s("AMI_PASSWORD");

  seconds_from_env("AMI_CONNECT_TIMEOUT", cfg.connect_timeout);
  seconds_from_env("AMI_READ_TIMEOUT", cfg.read_timeout);
  seconds_from_env("AMI_ACTION_TIMEOUT", cfg.action_timeout);
  seconds_from_env("AMI_RECONNECT_BACKOFF", cfg.reconnect_backoff);
  seconds_from_env("AMI_PING_INTERVAL", cfg.ping_interval);

  if (!getenv_s("LOG_LEVEL").empty()) {
    log::Logger::instance().set_level(log::parse_level(getenv_s("LOG_LEVEL")));
  }

  return cfg;
}

}  // namespace amilive
