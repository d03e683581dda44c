#include "amilive/log.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>

#include "amilive/strings.hpp"

namespace amilive {
namespace log {

static inline std::string now_ts() {
  auto t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
  }
  return "?";
}

Level parse_level(const std::string& name) {
  std::string l = lower(trim(name));
  if (l == "debug") return Level::Debug;
  if (l == "warn" || l == "warning") return Level::Warn;
  if (l == "error") return Level::Error;
  return Level::Info;
}

Logger& Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::Logger() : out_(&std::cerr), level_(Level::Info), history_limit_(2000) {}

void Logger::set_level(Level lvl) {
  std::lock_guard<std::mutex> lk(mutex_);
  level_ = lvl;
}

Level Logger::level() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return level_;
}

void Logger::set_output(std::ostream* os) {
  std::lock_guard<std::mutex> lk(mutex_);
  out_ = os;
}

void Logger::set_history_limit(std::size_t n) {
  std::lock_guard<std::mutex> lk(mutex_);
  history_limit_ = n;
  while (history_.size() > history_limit_) history_.pop_front();
}

void Logger::log(Level lvl, const std::string& msg) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (lvl < level_) return;

  std::string line = now_ts() + " [" + level_name(lvl) + "] " + msg;
  if (out_) *out_ << line << std::endl;

  if (history_limit_ == 0) return;
  history_.push_back(std::move(line));
  while (history_.size() > history_limit_) history_.pop_front();
}

std::deque<std::string> Logger::history() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return history_;
}

}  // namespace log
}  // namespace amilive
