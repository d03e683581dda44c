#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "amilive/client.hpp"
#include "amilive/error.hpp"
#include "amilive/frame_reader.hpp"
#include "amilive/message.hpp"
#include "amilive/transport.hpp"

// -----------------------------------------------------------------------------
// Scripted in-memory Asterisk manager.
//
// Every transport made by factory() talks to the same MockManager; connecting
// starts a new session (fresh inbound buffer, greeting queued) and makes any
// older transport see end of stream. Actions written by the client are parsed
// and answered by the script, or by the defaults below when the script
// declines:
//   Login  -> Success / Error depending on username and secret
//   Logoff -> Goodbye
//   other  -> Success
// -----------------------------------------------------------------------------

inline std::string wire_block(const amilive::Headers& headers) {
  std::string out;
  for (const auto& [k, v] : headers) out += k + ": " + v + "\r\n";
  out += "\r\n";
  return out;
}

class MockManager : public std::enable_shared_from_this<MockManager> {
public:
  // Returns true when it took care of the action (answering it or not).
  using Script = std::function<bool(MockManager&, const amilive::ProtocolMessage&)>;

  std::string username = "admin";
  std::string secret = "s3cret";
  std::string greeting = "Asterisk Call Manager/5.0.1";

  void set_script(Script s) {
    std::lock_guard<std::mutex> lk(mu_);
    script_ = std::move(s);
  }

  void refuse_connections(bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    refuse_ = on;
  }

  // Server -> client bytes on the current session.
  void push(const std::string& bytes) {
    std::lock_guard<std::mutex> lk(mu_);
    inbound_ += bytes;
    cv_.notify_all();
  }

  void push_block(const amilive::Headers& headers) { push(wire_block(headers)); }

  void respond(const amilive::ProtocolMessage& action, const std::string& response,
               const amilive::Headers& extra = {}) {
    amilive::Headers h{{"Response", response}, {"ActionID", action.action_id()}};
    h.insert(h.end(), extra.begin(), extra.end());
    push_block(h);
  }

  // Peer closes the current session; buffered bytes are still readable.
  void hang_up() {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = false;
    cv_.notify_all();
  }

  std::vector<amilive::ProtocolMessage> actions() const {
    std::lock_guard<std::mutex> lk(mu_);
    return actions_;
  }

  std::size_t count(const std::string& action) const {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(
        std::count_if(actions_.begin(), actions_.end(), [&](const amilive::ProtocolMessage& m) {
          return m.get("Action") == action;
        }));
  }

  std::size_t connections() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connection_;
  }

  amilive::AmiClient::TransportFactory factory();

private:
  friend class MockTransport;

  void on_written(const std::string& data) {
    amilive::FrameReader reader(false);
    reader.feed(data);
    while (auto block = reader.next()) {
      auto msg = amilive::ProtocolMessage::parse(*block);
      Script script;
      {
        std::lock_guard<std::mutex> lk(mu_);
        actions_.push_back(msg);
        script = script_;
      }
      if (script && script(*this, msg)) continue;
      answer_default(msg);
    }
  }

  void answer_default(const amilive::ProtocolMessage& action) {
    const std::string name = action.get("Action");
    if (name == "Login") {
      if (action.get("Username") == username && action.get("Secret") == secret) {
        respond(action, "Success", {{"Message", "Authentication accepted"}});
      } else {
        respond(action, "Error", {{"Message", "Authentication failed"}});
      }
    } else if (name == "Logoff") {
      respond(action, "Goodbye", {{"Message", "Thanks for all the fish."}});
    } else {
      respond(action, "Success");
    }
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  Script script_;
  bool refuse_ = false;
  std::uint64_t connection_ = 0;
  bool open_ = false;
  std::string inbound_;
  std::vector<amilive::ProtocolMessage> actions_;
};

class MockTransport : public amilive::Transport {
public:
  explicit MockTransport(std::shared_ptr<MockManager> m) : m_(std::move(m)) {}

  void connect(const std::string&, std::uint16_t, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lk(m_->mu_);
    if (m_->refuse_) throw amilive::TransportError("connection refused");
    id_ = ++m_->connection_;
    m_->open_ = true;
    m_->inbound_ = m_->greeting + "\r\n";
    m_->cv_.notify_all();
  }

  std::size_t read_some(char* data, std::size_t size) override {
    return read(data, size, std::nullopt);
  }

  std::size_t read_some(char* data, std::size_t size, std::chrono::milliseconds timeout) override {
    return read(data, size, timeout);
  }

  void write(const std::string& data) override {
    {
      std::lock_guard<std::mutex> lk(m_->mu_);
      if (shut_ || id_ != m_->connection_ || !m_->open_) {
        throw amilive::TransportError("broken pipe");
      }
    }
    m_->on_written(data);
  }

  void shutdown() override {
    std::lock_guard<std::mutex> lk(m_->mu_);
    shut_ = true;
    m_->cv_.notify_all();
  }

private:
  std::size_t read(char* data, std::size_t size, std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> lk(m_->mu_);
    auto ready = [this] {
      return shut_ || id_ != m_->connection_ || !m_->open_ || !m_->inbound_.empty();
    };
    if (timeout) {
      if (!m_->cv_.wait_for(lk, *timeout, ready)) throw amilive::TransportError("read timed out");
    } else {
      m_->cv_.wait(lk, ready);
    }

    if (shut_ || id_ != m_->connection_) throw amilive::TransportError("connection closed");
    if (m_->inbound_.empty()) throw amilive::TransportError("connection closed by peer");

    std::size_t n = std::min(size, m_->inbound_.size());
    std::memcpy(data, m_->inbound_.data(), n);
    m_->inbound_.erase(0, n);
    return n;
  }

  std::shared_ptr<MockManager> m_;
  std::uint64_t id_ = 0;
  bool shut_ = false;  // guarded by m_->mu_
};

inline amilive::AmiClient::TransportFactory MockManager::factory() {
  auto self = shared_from_this();
  return [self] { return std::make_unique<MockTransport>(self); };
}
