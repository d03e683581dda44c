#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>

namespace amilive {
namespace log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error };

const char* level_name(Level lvl);

// "debug" | "info" | "warn"/"warning" | "error", case-insensitive. Unknown -> Info.
Level parse_level(const std::string& name);

// Process-wide logger. Every line is timestamped, kept in a bounded in-memory
// history (the monitor's log view reads it) and, when a sink is set, written out.
class Logger {
public:
  static Logger& instance();

  void set_level(Level lvl);
  Level level() const;

  // nullptr silences the stream output; the history is still kept.
  void set_output(std::ostream* os);
  void set_history_limit(std::size_t n);

  void log(Level lvl, const std::string& msg);

  std::deque<std::string> history() const;

private:
  Logger();

  mutable std::mutex mutex_;
  std::ostream* out_;
  Level level_;
  std::size_t history_limit_;
  std::deque<std::string> history_;
};

// Collects << into one line and logs it on destruction.
class LogStream {
public:
  explicit LogStream(Level lvl) : lvl_(lvl) {}
  ~LogStream() { Logger::instance().log(lvl_, ss_.str()); }

  template <typename T>
  LogStream& operator<<(const T& v) {
    ss_ << v;
    return *this;
  }

private:
  Level lvl_;
  std::ostringstream ss_;
};

}  // namespace log
}  // namespace amilive

#define AMILIVE_LOG_LEVEL(lvl) ::amilive::log::LogStream((lvl))

#define AMILIVE_DEBUG(msg) AMILIVE_LOG_LEVEL(::amilive::log::Level::Debug) << msg
#define AMILIVE_INFO(msg)  AMILIVE_LOG_LEVEL(::amilive::log::Level::Info) << msg
#define AMILIVE_WARN(msg)  AMILIVE_LOG_LEVEL(::amilive::log::Level::Warn) << msg
#define AMILIVE_ERROR(msg) AMILIVE_LOG_LEVEL(::amilive::log::Level::Error) << msg
