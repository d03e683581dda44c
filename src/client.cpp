#include "amilive/client.hpp"

#include "amilive/error.hpp"
#include "amilive/log.hpp"
#include "amilive/tcp_transport.hpp"

namespace amilive {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting: return "Connecting";
    case ConnectionState::ConnectedLoggedOut: return "Connected-LoggedOut";
    case ConnectionState::Ready: return "Ready";
  }
  return "?";
}

AmiClient::AmiClient(Settings settings)
    : AmiClient(std::move(settings), [] { return std::make_unique<TcpTransport>(); }) {}

AmiClient::AmiClient(Settings settings, TransportFactory factory)
    : settings_(std::move(settings)),
      factory_(std::move(factory)),
      tracker_(settings_),
      dispatcher_(tracker_),
      correlator_(settings_.action_id_prefix, settings_.expired_action_memory) {
  settings_.validate();
}

AmiClient::~AmiClient() {
  stop();
  disconnect();
}

// --- Connection lifecycle ---

void AmiClient::connect() {
  {
    std::lock_guard<std::mutex> op(op_mutex_);
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (state_ != ConnectionState::Disconnected) return;
    }
    teardown(false);  // leftovers of a lost connection
    open_session();
  }
  request_initial_status();
}

void AmiClient::open_session() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    state_ = ConnectionState::Connecting;
  }
  AMILIVE_INFO("Connecting to AMI at " << settings_.host << ":" << settings_.port);

  try {
    std::shared_ptr<Transport> transport = factory_();
    transport->connect(settings_.host, settings_.port, settings_.connect_timeout);

    // Greeting line, bounded by the read timeout
    FrameReader reader(true, settings_.max_block_bytes);
    char buf[1024];
    auto deadline = std::chrono::steady_clock::now() + settings_.read_timeout;
    while (!reader.greeting()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) throw TransportError("no greeting from " + settings_.host);
      std::size_t n = transport->read_some(buf, sizeof(buf), left);
      reader.feed(buf, n);
    }
    AMILIVE_DEBUG("AMI greeting: " << *reader.greeting());

    {
      std::lock_guard<std::mutex> lk(mutex_);
      transport_ = transport;
      state_ = ConnectionState::ConnectedLoggedOut;
      std::uint64_t gen = ++generation_;
      listener_ = std::thread(&AmiClient::run_listener, this, transport, std::move(reader), gen);
    }

    ActionResult login = transact("Login",
                                  {{"Username", settings_.username},
                                   {"Secret", settings_.secret},
                                   {"Events", settings_.events}},
                                  false, false);
    if (!login.response.is_success()) throw AuthenticationFailure(login.response);

    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ != ConnectionState::ConnectedLoggedOut) {
      throw ConnectionClosed("connection lost during login");
    }
    state_ = ConnectionState::Ready;
  } catch (const std::exception& ex) {
    AMILIVE_ERROR("AMI connection failed: " << ex.what());
    teardown(false);
    throw;
  }

  AMILIVE_INFO("AMI client connected and logged in as " << settings_.username);
}

void AmiClient::request_initial_status() {
  for (const auto& action : settings_.initial_actions) {
    try {
      ActionResult r = send_list_action(action);
      if (!r.response.is_success()) {
        AMILIVE_WARN("Initial " << action << " rejected: " << r.response.get("Message"));
      } else {
        AMILIVE_DEBUG("Initial " << action << ": " << r.events.size() << " events");
      }
    } catch (const Error& ex) {
      AMILIVE_WARN("Initial " << action << " failed: " << ex.what());
    }
  }
}

void AmiClient::disconnect() {
  std::lock_guard<std::mutex> op(op_mutex_);
  teardown(true);
}

void AmiClient::teardown(bool logoff) {
  bool was_up = false;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    was_up = transport_ && (state_ == ConnectionState::Ready ||
                            state_ == ConnectionState::ConnectedLoggedOut);
    closing_ = true;
  }

  if (logoff && was_up) {
    try {
      transact("Logoff", {}, false, false);
    } catch (const Error& ex) {
      AMILIVE_DEBUG("Logoff ignored: " << ex.what());
    }
  }

  std::shared_ptr<Transport> transport;
  std::thread listener;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    state_ = ConnectionState::Disconnected;
    ++generation_;
    closing_ = false;
    transport = std::move(transport_);
    listener = std::move(listener_);
  }

  if (transport) transport->shutdown();
  if (listener.joinable()) listener.join();
  transport.reset();

  correlator_.fail_all("connection closed");
  tracker_.clear();
  cv_.notify_all();

  if (was_up) AMILIVE_INFO("Disconnected from AMI");
}

void AmiClient::reconnect() {
  disconnect();
  std::this_thread::sleep_for(settings_.reconnect_backoff);
  connect();
}

bool AmiClient::is_connected() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return state_ == ConnectionState::Ready;
}

ConnectionState AmiClient::state() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return state_;
}

// --- Actions ---

ProtocolMessage AmiClient::send_action(const std::string& action, const Headers& params) {
  return transact(action, params, false, true).response;
}

ActionResult AmiClient::send_list_action(const std::string& action, const Headers& params) {
  return transact(action, params, true, true);
}

ActionResult AmiClient::transact(const std::string& action, const Headers& params,
                                 bool event_list, bool require_ready) {
  std::shared_ptr<Transport> transport;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    bool usable = state_ == ConnectionState::Ready ||
                  (!require_ready && state_ == ConnectionState::ConnectedLoggedOut);
    if (!usable || !transport_) throw ConnectionClosed("not connected to AMI");
    transport = transport_;
  }

  Correlator::Ticket ticket = correlator_.open(action, event_list);
  try {
    std::lock_guard<std::mutex> wl(write_mutex_);
    transport->write(serialize_action(action, params, ticket.action_id));
  } catch (const TransportError&) {
    correlator_.cancel(ticket.action_id);
    throw;
  }
  AMILIVE_DEBUG("-> " << action << " (" << ticket.action_id << ")");

  return correlator_.await(ticket, settings_.action_timeout);
}

void AmiClient::register_event_handler(const std::string& event, EventHandler handler) {
  dispatcher_.register_handler(event, std::move(handler));
}

// --- Listener ---

void AmiClient::run_listener(std::shared_ptr<Transport> transport, FrameReader reader,
                             std::uint64_t generation) {
  AMILIVE_DEBUG("AMI event listener started");
  char buf[8192];
  try {
    while (auto block = reader.next()) handle_block(*block);
    while (true) {
      std::size_t n = transport->read_some(buf, sizeof(buf));
      try {
        reader.feed(buf, n);
      } catch (const ProtocolDecodeError& ex) {
        AMILIVE_WARN("AMI stream: " << ex.what());
      }
      while (auto block = reader.next()) handle_block(*block);
    }
  } catch (const TransportError& ex) {
    if (reader.has_partial()) AMILIVE_DEBUG("Dropping unterminated block at end of stream");
    on_connection_lost(generation, ex.what());
  }
}

void AmiClient::handle_block(const RawBlock& block) {
  ProtocolMessage msg;
  try {
    msg = ProtocolMessage::parse(block);
  } catch (const ProtocolDecodeError& ex) {
    AMILIVE_WARN("Dropping malformed block: " << ex.what());
    return;
  }

  if (msg.kind() == MessageKind::Unknown) {
    AMILIVE_DEBUG("Dropping unclassified block starting '" << block.front() << "'");
    return;
  }

  if (correlator_.resolve(msg) != Correlator::Disposition::Forward) return;
  dispatcher_.dispatch(msg);
}

void AmiClient::on_connection_lost(std::uint64_t generation, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (generation != generation_ || closing_ || state_ == ConnectionState::Disconnected) {
      AMILIVE_DEBUG("AMI event listener stopped: " << reason);
      return;
    }
    state_ = ConnectionState::Disconnected;
  }
  AMILIVE_WARN("AMI connection lost: " << reason);
  correlator_.fail_all("connection lost");
  cv_.notify_all();
}

// --- Supervision ---

void AmiClient::start() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (supervisor_.joinable()) return;
  stopping_ = false;
  supervisor_ = std::thread(&AmiClient::supervise, this);
}

void AmiClient::stop() {
  std::thread t;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    stopping_ = true;
    t = std::move(supervisor_);
  }
  cv_.notify_all();
  if (t.joinable()) t.join();
}

bool AmiClient::wait_for_stop(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mutex_);
  return cv_.wait_for(lk, d, [this] { return stopping_; });
}

void AmiClient::supervise() {
  while (true) {
    if (!is_connected()) {
      try {
        connect();
      } catch (const std::exception& ex) {
        AMILIVE_WARN("AMI connect failed: " << ex.what() << "; retrying in "
                     << settings_.reconnect_backoff.count() << " ms");
        if (wait_for_stop(settings_.reconnect_backoff)) return;
        continue;
      }
    }

    bool ping_due = false;
    std::uint64_t seen_generation = 0;
    {
      std::unique_lock<std::mutex> lk(mutex_);
      auto wake = [this] { return stopping_ || state_ != ConnectionState::Ready; };
      if (settings_.ping_interval.count() > 0) {
        ping_due = !cv_.wait_for(lk, settings_.ping_interval, wake);
      } else {
        cv_.wait(lk, wake);
      }
      if (stopping_) return;
      seen_generation = generation_;
    }

    bool ping_failed = false;
    if (ping_due) {
      try {
        send_action("Ping");
        continue;
      } catch (const Error& ex) {
        AMILIVE_WARN("AMI keepalive failed: " << ex.what());
        ping_failed = true;
      }
    }

    {
      std::lock_guard<std::mutex> op(op_mutex_);
      bool superseded = false;
      {
        std::lock_guard<std::mutex> lk(mutex_);
        // Another thread reconnected while we waited for op_mutex_.
        superseded = generation_ != seen_generation ||
                     (state_ == ConnectionState::Ready && !ping_failed);
      }
      if (superseded) {
        AMILIVE_DEBUG("AMI session replaced meanwhile, nothing to tear down");
        continue;
      }
      AMILIVE_INFO("Reconnecting to AMI in " << settings_.reconnect_backoff.count() << " ms");
      teardown(false);
    }
    if (wait_for_stop(settings_.reconnect_backoff)) return;
  }
}

}  // namespace amilive
