#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "amilive/correlator.hpp"
#include "amilive/event_dispatcher.hpp"
#include "amilive/frame_reader.hpp"
#include "amilive/message.hpp"
#include "amilive/settings.hpp"
#include "amilive/state_tracker.hpp"
#include "amilive/transport.hpp"

namespace amilive {

enum class ConnectionState { Disconnected, Connecting, ConnectedLoggedOut, Ready };

const char* to_string(ConnectionState s);

// Persistent AMI client: owns the connection, the listener thread, the
// action correlator, the event dispatcher and the derived call/device state.
//
//   connect()  Disconnected -> Connecting -> ConnectedLoggedOut -> Ready
//   any failure, disconnect() or loss of the socket -> Disconnected
//
// The listener never reconnects on its own. Either call reconnect() or let
// start() run the supervision thread, which reconnects after the configured
// backoff and sends a keepalive Ping every ping_interval.
//
// Event handlers run on the listener thread. They must not call send_action()
// or disconnect(): the response they would wait for is read by that thread.
class AmiClient {
public:
  using TransportFactory = std::function<std::unique_ptr<Transport>()>;

  explicit AmiClient(Settings settings);
  AmiClient(Settings settings, TransportFactory factory);
  ~AmiClient();

  AmiClient(const AmiClient&) = delete;
  AmiClient& operator=(const AmiClient&) = delete;

  // Throws TransportError, AuthenticationFailure, ActionTimeout or
  // ConnectionClosed; the client is Disconnected again when it does.
  // No-op unless Disconnected.
  void connect();

  // Logoff (best effort), close, fail outstanding actions, clear state.
  void disconnect();

  // disconnect(), sleep reconnect_backoff, connect().
  void reconnect();

  void start();
  void stop();

  // Thread-safe. Throws ConnectionClosed when not Ready, ActionTimeout,
  // TransportError when the write fails.
  ProtocolMessage send_action(const std::string& action, const Headers& params = {});

  // For actions answered with "EventList: start" (QueueStatus, Status, ...).
  ActionResult send_list_action(const std::string& action, const Headers& params = {});

  // "*" receives every forwarded message.
  void register_event_handler(const std::string& event, EventHandler handler);

  std::vector<CallRecord> active_calls() const { return tracker_.active_calls(); }
  std::map<std::string, DeviceState> device_states() const { return tracker_.device_states(); }

  bool is_connected() const;
  ConnectionState state() const;

  const Settings& settings() const { return settings_; }

private:
  ActionResult transact(const std::string& action, const Headers& params, bool event_list,
                        bool require_ready);

  void run_listener(std::shared_ptr<Transport> transport, FrameReader reader,
                    std::uint64_t generation);
  void handle_block(const RawBlock& block);
  void on_connection_lost(std::uint64_t generation, const std::string& reason);

  void open_session();
  void teardown(bool logoff);
  void request_initial_status();

  void supervise();
  bool wait_for_stop(std::chrono::milliseconds d);

  Settings settings_;
  TransportFactory factory_;
  StateTracker tracker_;
  EventDispatcher dispatcher_;
  Correlator correlator_;

  std::mutex op_mutex_;     // connect / disconnect
  std::mutex write_mutex_;  // one action frame on the wire at a time

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ConnectionState state_ = ConnectionState::Disconnected;
  std::shared_ptr<Transport> transport_;
  std::thread listener_;
  std::uint64_t generation_ = 0;
  bool closing_ = false;
  bool stopping_ = false;

  std::thread supervisor_;
};

}  // namespace amilive
