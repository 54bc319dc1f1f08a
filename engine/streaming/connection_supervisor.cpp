#include "connection_supervisor.hpp"
#include "engine/common/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mdstream {
namespace engine {
namespace streaming {

SupervisorOptions SupervisorOptions::FromConfig(const common::ConfigManager& config) {
  SupervisorOptions options;
  options.heartbeat_interval = config.GetMilliseconds("supervisor.heartbeat_interval_ms", options.heartbeat_interval);
  options.missed_heartbeats = config.GetInt("supervisor.missed_heartbeats", options.missed_heartbeats);
  options.heartbeat_check_interval =
      config.GetMilliseconds("supervisor.heartbeat_check_interval_ms", options.heartbeat_check_interval);
  options.reconnect_attempt_timeout =
      config.GetMilliseconds("supervisor.reconnect_attempt_timeout_ms", options.reconnect_attempt_timeout);
  options.max_reconnect_attempts = config.GetInt("supervisor.max_reconnect_attempts", options.max_reconnect_attempts);
  options.reconnect_base_delay = config.GetMilliseconds("supervisor.reconnect_base_delay_ms", options.reconnect_base_delay);
  options.reconnect_max_delay = config.GetMilliseconds("supervisor.reconnect_max_delay_ms", options.reconnect_max_delay);
  options.unsubscribe_grace_period =
      config.GetMilliseconds("supervisor.unsubscribe_grace_period_ms", options.unsubscribe_grace_period);
  options.sync_permit_timeout = config.GetMilliseconds("supervisor.sync_permit_timeout_ms", options.sync_permit_timeout);
  options.connect_workers = static_cast<size_t>(config.GetInt("supervisor.connect_workers", 2));
  options.missed_heartbeats = std::max(1, options.missed_heartbeats);
  options.max_reconnect_attempts = std::max(1, options.max_reconnect_attempts);
  return options;
}

ConnectionSupervisor::ConnectionSupervisor(SupervisorOptions options,
                                           TransportFactoryFn transport_factory,
                                           RateLimiter* rate_limiter,
                                           common::MetricsEmitter* metrics,
                                           common::TimeSource time_source,
                                           common::WallTimeSource wall_time_source)
    : options_(options),
      transport_factory_(std::move(transport_factory)),
      rate_limiter_(rate_limiter),
      metrics_(metrics),
      time_source_(std::move(time_source)),
      wall_time_source_(std::move(wall_time_source)),
      control_thread_("supervisor"),
      connect_pool_("supervisor_connect", options.connect_workers) {}

ConnectionSupervisor::~ConnectionSupervisor() {
  Stop();
}

void ConnectionSupervisor::SetTickSink(TickSink sink) {
  tick_sink_ = std::move(sink);
}

void ConnectionSupervisor::SetGapListener(GapListener* listener) {
  gap_listener_ = listener;
}

void ConnectionSupervisor::Start() {
  if (running_.exchange(true)) {
    return;
  }
  control_thread_.Start();
  connect_pool_.Start();
  if (options_.run_heartbeat_ticker) {
    const auto cadence = std::max(std::chrono::milliseconds(1),
                                  std::min(options_.heartbeat_check_interval, options_.heartbeat_interval));
    heartbeat_task_id_ = control_thread_.SchedulePeriodic([this]() { CheckHeartbeats(); }, cadence);
  }
  SPDLOG_INFO("ConnectionSupervisor: started (heartbeat {}ms x{}, grace {}ms)",
              options_.heartbeat_interval.count(), options_.missed_heartbeats,
              options_.unsubscribe_grace_period.count());
}

void ConnectionSupervisor::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  control_thread_.CancelPeriodic(heartbeat_task_id_);
  control_thread_.Stop();
  connect_pool_.Stop();

  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, conn] : connections_) {
      to_close.push_back(DetachTransportLocked(*conn));
    }
    connections_.clear();
    key_index_.clear();
    consumer_index_.clear();
  }
  state_cv_.notify_all();
  CloseTransports(to_close);
  SPDLOG_INFO("ConnectionSupervisor: stopped, closed {} connections", to_close.size());
}

//=============================================================================
// Record management
//=============================================================================

ConnectionSupervisor::Connection* ConnectionSupervisor::FindLocked(ConnectionId id) {
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second.get();
}

const ConnectionSupervisor::Connection* ConnectionSupervisor::FindLocked(ConnectionId id) const {
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second.get();
}

ConnectionSupervisor::Connection* ConnectionSupervisor::FindByKeyLocked(const ConnectionKey& key) {
  auto it = key_index_.find(key);
  return it == key_index_.end() ? nullptr : FindLocked(it->second);
}

const ConnectionSupervisor::Connection* ConnectionSupervisor::FindByKeyLocked(const ConnectionKey& key) const {
  auto it = key_index_.find(key);
  return it == key_index_.end() ? nullptr : FindLocked(it->second);
}

ConnectionSupervisor::Connection& ConnectionSupervisor::CreateRecordLocked(const ConnectionKey& key) {
  auto conn = std::make_unique<Connection>();
  conn->id = next_id_++;
  conn->key = key;
  conn->last_inbound = time_source_();
  conn->last_ping = conn->last_inbound;
  auto& ref = *conn;
  key_index_[key] = conn->id;
  connections_[conn->id] = std::move(conn);
  SPDLOG_DEBUG("ConnectionSupervisor: created record {} for {}", ref.id, key.ToString());
  return ref;
}

std::shared_ptr<ProviderTransport> ConnectionSupervisor::DetachTransportLocked(Connection& conn) {
  // Bumping the generation makes callbacks from the old transport stale
  ++conn.generation;
  conn.active_symbols.clear();
  conn.sync_scheduled = false;
  return std::move(conn.transport);
}

std::shared_ptr<ProviderTransport> ConnectionSupervisor::ReleaseRecordLocked(Connection& conn,
                                                                             const std::string& reason) {
  control_thread_.CancelDelayed(conn.grace_task_id);
  control_thread_.CancelDelayed(conn.retry_task_id);
  auto transport = DetachTransportLocked(conn);

  const ConnectionId id = conn.id;
  const ConnectionKey key = conn.key;
  common::EmitMetric(metrics_, common::metrics::kConnectionReleased,
                     {{"provider", key.provider_id}, {"capability", key.capability_id},
                      {"state", ToString(conn.state)}, {"reason", reason}});
  SPDLOG_INFO("ConnectionSupervisor: released {} (id {}, state {}): {}",
              key.ToString(), id, ToString(conn.state), reason);

  for (auto it = consumer_index_.begin(); it != consumer_index_.end();) {
    it->second.erase(id);
    it = it->second.empty() ? consumer_index_.erase(it) : std::next(it);
  }
  auto key_it = key_index_.find(key);
  if (key_it != key_index_.end() && key_it->second == id) {
    key_index_.erase(key_it);
  }
  connections_.erase(id);
  state_cv_.notify_all();
  return transport;
}

bool ConnectionSupervisor::TransitionLocked(Connection& conn, ConnectionEvent event) {
  auto next = NextState(conn.state, event);
  if (!next) {
    SPDLOG_ERROR("ConnectionSupervisor: illegal event {} in state {} for {}",
                 ToString(event), ToString(conn.state), conn.key.ToString());
    return false;
  }

  const ConnectionState from = conn.state;
  conn.state = *next;
  SPDLOG_INFO("ConnectionSupervisor: {} {} -> {} ({})",
              conn.key.ToString(), ToString(from), ToString(*next), ToString(event));
  common::EmitMetric(metrics_, common::metrics::kConnectionStateTransition,
                     {{"provider", conn.key.provider_id}, {"capability", conn.key.capability_id},
                      {"from", ToString(from)}, {"to", ToString(*next)}, {"event", ToString(event)}});
  state_cv_.notify_all();
  return true;
}

std::vector<std::string> ConnectionSupervisor::DesiredSymbolsLocked(const Connection& conn) const {
  std::vector<std::string> symbols;
  symbols.reserve(conn.symbol_consumers.size());
  for (const auto& [symbol, consumers] : conn.symbol_consumers) {
    symbols.push_back(symbol);
  }
  std::sort(symbols.begin(), symbols.end());
  return symbols;
}

ConnectionInfo ConnectionSupervisor::SnapshotLocked(const Connection& conn) const {
  ConnectionInfo info;
  info.id = conn.id;
  info.key = conn.key;
  info.state = conn.state;
  info.symbols = DesiredSymbolsLocked(conn);
  info.active_symbols.assign(conn.active_symbols.begin(), conn.active_symbols.end());
  std::unordered_set<ConsumerId> consumers;
  for (const auto& [symbol, symbol_consumers] : conn.symbol_consumers) {
    consumers.insert(symbol_consumers.begin(), symbol_consumers.end());
  }
  info.consumer_count = consumers.size();
  info.last_inbound = conn.last_inbound;
  info.last_sequence = conn.last_sequence;
  info.last_received_ms = conn.last_received_ms;
  info.reconnect_attempts = conn.reconnect_attempts;
  info.grace_pending = conn.grace_task_id >= 0;
  info.last_error = conn.last_error;
  return info;
}

//=============================================================================
// Subscription surface
//=============================================================================

ConnectionId ConnectionSupervisor::Subscribe(const ConsumerId& consumer, const ConnectionKey& key,
                                             const std::vector<std::string>& symbols) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  ConnectionId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load()) {
      SPDLOG_ERROR("ConnectionSupervisor: subscribe for {} while stopped", key.ToString());
      return 0;
    }

    Connection* conn = FindByKeyLocked(key);

    // A finished record is replaced by a fresh Idle one; its consumers carry over
    if (conn && (conn->state == ConnectionState::kClosed || conn->state == ConnectionState::kDisconnected)) {
      auto carried = conn->symbol_consumers;
      to_close.push_back(ReleaseRecordLocked(*conn, "replaced by new subscription"));
      conn = &CreateRecordLocked(key);
      conn->symbol_consumers = std::move(carried);
      for (const auto& [symbol, consumers] : conn->symbol_consumers) {
        for (const auto& carried_consumer : consumers) {
          consumer_index_[carried_consumer].insert(conn->id);
        }
      }
    }
    if (!conn) {
      conn = &CreateRecordLocked(key);
    }

    for (const auto& symbol : symbols) {
      if (!symbol.empty()) {
        conn->symbol_consumers[symbol].insert(consumer);
      }
    }
    if (!symbols.empty()) {
      consumer_index_[consumer].insert(conn->id);
    }

    if (conn->symbol_consumers.empty()) {
      OnNoSubscribersLocked(*conn, to_close);
      conn = FindByKeyLocked(key);
      id = conn ? conn->id : 0;
    } else {
      if (conn->grace_task_id >= 0) {
        control_thread_.CancelDelayed(conn->grace_task_id);
        conn->grace_task_id = -1;
        SPDLOG_DEBUG("ConnectionSupervisor: {} resubscribed during grace period", key.ToString());
      }

      if (conn->state == ConnectionState::kIdle) {
        TransitionLocked(*conn, ConnectionEvent::kSubscribeRequested);
        StartConnectAttemptLocked(*conn);
      } else if (conn->state == ConnectionState::kConnected) {
        ScheduleSyncLocked(*conn);
      }
      id = conn->id;
    }
  }
  CloseTransports(to_close);
  return id;
}

void ConnectionSupervisor::Unsubscribe(const ConsumerId& consumer, const ConnectionKey& key,
                                       const std::vector<std::string>& symbols) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindByKeyLocked(key);
    if (!conn) {
      return;
    }

    for (const auto& symbol : symbols) {
      auto it = conn->symbol_consumers.find(symbol);
      if (it == conn->symbol_consumers.end()) {
        continue;
      }
      it->second.erase(consumer);
      if (it->second.empty()) {
        conn->symbol_consumers.erase(it);
      }
    }

    bool still_attached = std::any_of(conn->symbol_consumers.begin(), conn->symbol_consumers.end(),
                                      [&consumer](const auto& entry) { return entry.second.count(consumer) > 0; });
    if (!still_attached) {
      auto index_it = consumer_index_.find(consumer);
      if (index_it != consumer_index_.end()) {
        index_it->second.erase(conn->id);
        if (index_it->second.empty()) {
          consumer_index_.erase(index_it);
        }
      }
    }

    if (conn->state == ConnectionState::kConnected) {
      ScheduleSyncLocked(*conn);
    }
    if (conn->symbol_consumers.empty()) {
      OnNoSubscribersLocked(*conn, to_close);
    }
  }
  CloseTransports(to_close);
}

void ConnectionSupervisor::UnsubscribeAll(const ConsumerId& consumer) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = consumer_index_.find(consumer);
    if (index_it == consumer_index_.end()) {
      return;
    }
    std::set<ConnectionId> ids = std::move(index_it->second);
    consumer_index_.erase(index_it);

    for (ConnectionId id : ids) {
      Connection* conn = FindLocked(id);
      if (!conn) {
        continue;
      }
      for (auto it = conn->symbol_consumers.begin(); it != conn->symbol_consumers.end();) {
        it->second.erase(consumer);
        it = it->second.empty() ? conn->symbol_consumers.erase(it) : std::next(it);
      }
      if (conn->state == ConnectionState::kConnected) {
        ScheduleSyncLocked(*conn);
      }
      if (conn->symbol_consumers.empty()) {
        OnNoSubscribersLocked(*conn, to_close);
      }
    }
  }
  CloseTransports(to_close);
}

void ConnectionSupervisor::OnNoSubscribersLocked(Connection& conn,
                                                 std::vector<std::shared_ptr<ProviderTransport>>& to_close) {
  if (conn.state == ConnectionState::kDisconnected) {
    TransitionLocked(conn, ConnectionEvent::kNoSubscribers);
    to_close.push_back(ReleaseRecordLocked(conn, "no subscribers"));
    return;
  }
  if (conn.state == ConnectionState::kClosed) {
    to_close.push_back(ReleaseRecordLocked(conn, "no subscribers"));
    return;
  }
  if (conn.grace_task_id >= 0) {
    return;
  }

  const ConnectionId id = conn.id;
  conn.grace_task_id = control_thread_.PostDelayed([this, id]() { OnGraceExpired(id); },
                                                   options_.unsubscribe_grace_period);
  SPDLOG_DEBUG("ConnectionSupervisor: {} has no subscribers, grace {}ms",
               conn.key.ToString(), options_.unsubscribe_grace_period.count());
}

void ConnectionSupervisor::OnGraceExpired(ConnectionId id) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->grace_task_id < 0) {
      return;
    }
    conn->grace_task_id = -1;
    if (!conn->symbol_consumers.empty()) {
      return;
    }
    if (conn->state == ConnectionState::kDisconnected) {
      TransitionLocked(*conn, ConnectionEvent::kNoSubscribers);
    }
    // Not a state transition: the record itself is destroyed
    to_close.push_back(ReleaseRecordLocked(*conn, "unsubscribe grace period elapsed"));
  }
  CloseTransports(to_close);
}

bool ConnectionSupervisor::Disconnect(const ConnectionKey& key) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindByKeyLocked(key);
    if (!conn) {
      return false;
    }
    conn->symbol_consumers.clear();
    if (conn->state == ConnectionState::kDisconnected) {
      TransitionLocked(*conn, ConnectionEvent::kNoSubscribers);
    }
    to_close.push_back(ReleaseRecordLocked(*conn, "disconnect requested"));
  }
  CloseTransports(to_close);
  return true;
}

bool ConnectionSupervisor::ForceReconnect(const ConnectionKey& key, const std::string& reason) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindByKeyLocked(key);
    if (!conn || conn->state != ConnectionState::kConnected) {
      return false;
    }
    SPDLOG_WARN("ConnectionSupervisor: forcing reconnect of {}: {}", key.ToString(), reason);
    conn->last_error = reason;
    TransitionLocked(*conn, ConnectionEvent::kTransportClosed);
    to_close.push_back(DetachTransportLocked(*conn));
    conn->reconnect_attempts = 0;
    ScheduleRetryLocked(*conn);
  }
  CloseTransports(to_close);
  return true;
}

//=============================================================================
// Connect / reconnect
//=============================================================================

void ConnectionSupervisor::StartConnectAttemptLocked(Connection& conn) {
  auto transport = transport_factory_ ? transport_factory_(conn.key) : nullptr;
  if (!transport) {
    conn.last_error = "no transport available for provider " + conn.key.provider_id;
    SPDLOG_ERROR("ConnectionSupervisor: {}", conn.last_error);
    if (conn.state == ConnectionState::kConnecting) {
      TransitionLocked(conn, ConnectionEvent::kHandshakeFailed);
      TransitionLocked(conn, ConnectionEvent::kFatalError);
    } else if (conn.state == ConnectionState::kReconnecting) {
      TransitionLocked(conn, ConnectionEvent::kReconnectExhausted);
    }
    return;
  }

  const ConnectionId id = conn.id;
  const uint64_t generation = ++conn.generation;

  TransportCallbacks callbacks;
  callbacks.on_tick = [this, id, generation](const Tick& tick) {
    OnTransportTick(id, generation, tick);
  };
  callbacks.on_heartbeat = [this, id, generation]() {
    OnTransportInbound(id, generation);
  };
  callbacks.on_closed = [this, id, generation](const std::string& reason) {
    control_thread_.Post([this, id, generation, reason]() { OnTransportClosed(id, generation, reason); });
  };
  callbacks.on_protocol_violation = [this, id, generation](const std::string& reason) {
    control_thread_.Post([this, id, generation, reason]() { OnTransportViolation(id, generation, reason); });
  };
  transport->SetCallbacks(std::move(callbacks));
  conn.transport = transport;

  if (!connect_pool_.Submit([this, id, generation, transport]() { RunConnect(id, generation, transport); })) {
    control_thread_.Post([this, id, generation]() {
      OnConnectResult(id, generation, ConnectOutcome::kFailed, "connect queue rejected attempt");
    });
  }
}

void ConnectionSupervisor::RunConnect(ConnectionId id, uint64_t generation,
                                      std::shared_ptr<ProviderTransport> transport) {
  ConnectOutcome outcome = ConnectOutcome::kConnected;
  std::string error;
  try {
    transport->Connect(options_.reconnect_attempt_timeout);
  } catch (const common::AuthError& e) {
    outcome = ConnectOutcome::kAuthRejected;
    error = e.what();
  } catch (const std::exception& e) {
    outcome = ConnectOutcome::kFailed;
    error = e.what();
  }

  if (outcome != ConnectOutcome::kConnected) {
    SPDLOG_WARN("ConnectionSupervisor: connect {} failed: {}", transport->GetKey().ToString(), error);
  }
  control_thread_.Post([this, id, generation, outcome, error]() {
    OnConnectResult(id, generation, outcome, error);
  });
}

void ConnectionSupervisor::OnConnectResult(ConnectionId id, uint64_t generation, ConnectOutcome outcome,
                                           const std::string& error) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  std::optional<GapReport> gap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->generation != generation) {
      return;
    }

    std::string failure = error;
    if (outcome == ConnectOutcome::kConnected && (!conn->transport || !conn->transport->IsConnected())) {
      outcome = ConnectOutcome::kFailed;
      failure = "transport closed during handshake";
    }

    const bool reconnecting = conn->state == ConnectionState::kReconnecting;
    switch (outcome) {
      case ConnectOutcome::kConnected: {
        if (!TransitionLocked(*conn, reconnecting ? ConnectionEvent::kReconnectSucceeded
                                                  : ConnectionEvent::kHandshakeSucceeded)) {
          to_close.push_back(DetachTransportLocked(*conn));
          break;
        }
        conn->reconnect_attempts = 0;
        conn->last_error.clear();
        conn->last_inbound = time_source_();
        conn->last_ping = conn->last_inbound;
        conn->last_sequence = 0;
        conn->active_symbols.clear();
        conn->sync_scheduled = false;

        if (conn->had_session && !conn->symbol_consumers.empty()) {
          GapReport report;
          report.cause = GapReport::Cause::kReconnect;
          report.connection_id = conn->id;
          report.key = conn->key;
          report.symbols = DesiredSymbolsLocked(*conn);
          report.last_received_ms = conn->last_received_ms;
          report.detected_ms = common::ToEpochMillis(wall_time_source_());
          gap = std::move(report);
        }
        conn->had_session = true;
        ScheduleSyncLocked(*conn);
        break;
      }

      case ConnectOutcome::kAuthRejected:
        conn->last_error = failure;
        to_close.push_back(DetachTransportLocked(*conn));
        if (reconnecting) {
          // Credentials revoked mid-session: stop retrying
          TransitionLocked(*conn, ConnectionEvent::kReconnectExhausted);
          if (conn->symbol_consumers.empty()) {
            OnNoSubscribersLocked(*conn, to_close);
          }
        } else {
          TransitionLocked(*conn, ConnectionEvent::kHandshakeFailed);
          TransitionLocked(*conn, ConnectionEvent::kFatalError);
        }
        break;

      case ConnectOutcome::kFailed:
        conn->last_error = failure;
        to_close.push_back(DetachTransportLocked(*conn));
        ++conn->reconnect_attempts;
        if (reconnecting) {
          if (conn->reconnect_attempts >= options_.max_reconnect_attempts) {
            SPDLOG_ERROR("ConnectionSupervisor: {} reconnect exhausted after {} attempts: {}",
                         conn->key.ToString(), conn->reconnect_attempts, failure);
            TransitionLocked(*conn, ConnectionEvent::kReconnectExhausted);
            if (conn->symbol_consumers.empty()) {
              OnNoSubscribersLocked(*conn, to_close);
            }
          } else {
            ScheduleRetryLocked(*conn);
          }
        } else if (TransitionLocked(*conn, ConnectionEvent::kHandshakeFailed)) {
          ScheduleRetryLocked(*conn);
        }
        break;
    }
  }
  CloseTransports(to_close);
  NotifyGap(gap);
}

std::chrono::milliseconds ConnectionSupervisor::BackoffDelay(int attempt) const {
  int exponent = std::clamp(attempt - 1, 0, 20);
  auto delay = options_.reconnect_base_delay * (int64_t{1} << exponent);
  return std::min(delay, options_.reconnect_max_delay);
}

void ConnectionSupervisor::ScheduleRetryLocked(Connection& conn) {
  control_thread_.CancelDelayed(conn.retry_task_id);
  auto delay = BackoffDelay(std::max(1, conn.reconnect_attempts));
  const ConnectionId id = conn.id;
  const uint64_t generation = conn.generation;
  conn.retry_task_id = control_thread_.PostDelayed([this, id, generation]() { OnRetryTimer(id, generation); },
                                                   delay);
  SPDLOG_INFO("ConnectionSupervisor: {} retry in {}ms (attempt {})",
              conn.key.ToString(), delay.count(), conn.reconnect_attempts + 1);
}

void ConnectionSupervisor::OnRetryTimer(ConnectionId id, uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  Connection* conn = FindLocked(id);
  if (!conn || conn->generation != generation) {
    return;
  }
  conn->retry_task_id = -1;

  if (conn->state == ConnectionState::kError) {
    TransitionLocked(*conn, ConnectionEvent::kRetryAfterBackoff);
  }
  if (conn->state == ConnectionState::kReconnecting) {
    StartConnectAttemptLocked(*conn);
  }
}

//=============================================================================
// Symbol sync
//=============================================================================

void ConnectionSupervisor::ScheduleSyncLocked(Connection& conn) {
  if (conn.state != ConnectionState::kConnected || conn.sync_scheduled) {
    return;
  }
  conn.sync_scheduled = true;
  const ConnectionId id = conn.id;
  if (!connect_pool_.Submit([this, id]() { RunSync(id); })) {
    conn.sync_scheduled = false;
  }
}

void ConnectionSupervisor::RunSync(ConnectionId id) {
  while (true) {
    std::shared_ptr<ProviderTransport> transport;
    std::vector<std::string> to_add;
    std::vector<std::string> to_remove;
    std::string provider_id;
    uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Connection* conn = FindLocked(id);
      if (!conn) {
        return;
      }
      if (conn->state != ConnectionState::kConnected || !conn->transport) {
        conn->sync_scheduled = false;
        return;
      }
      for (const auto& [symbol, consumers] : conn->symbol_consumers) {
        if (conn->active_symbols.count(symbol) == 0) to_add.push_back(symbol);
      }
      for (const auto& symbol : conn->active_symbols) {
        if (conn->symbol_consumers.count(symbol) == 0) to_remove.push_back(symbol);
      }
      if (to_add.empty() && to_remove.empty()) {
        conn->sync_scheduled = false;
        return;
      }
      transport = conn->transport;
      provider_id = conn->key.provider_id;
      generation = conn->generation;
    }

    auto acquire = [this, &provider_id]() {
      if (!rate_limiter_) return true;
      return rate_limiter_->AcquireBlocking(provider_id, options_.sync_permit_timeout).IsPermit();
    };

    bool added = to_add.empty() || (acquire() && transport->Subscribe(to_add));
    bool removed = to_remove.empty() || (acquire() && transport->Unsubscribe(to_remove));

    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->generation != generation) {
      // Reconnected meanwhile; the new session runs its own sync
      return;
    }
    if (added) conn->active_symbols.insert(to_add.begin(), to_add.end());
    if (removed) {
      for (const auto& symbol : to_remove) conn->active_symbols.erase(symbol);
    }
    if (!added || !removed) {
      SPDLOG_WARN("ConnectionSupervisor: symbol sync for {} deferred (rate limited or link busy)",
                  conn->key.ToString());
      conn->sync_scheduled = false;
      control_thread_.PostDelayed([this, id]() {
        std::lock_guard<std::mutex> retry_lock(mutex_);
        if (Connection* retry_conn = FindLocked(id)) {
          ScheduleSyncLocked(*retry_conn);
        }
      }, options_.reconnect_base_delay);
      return;
    }
    SPDLOG_DEBUG("ConnectionSupervisor: {} synced +{} -{} symbols",
                 conn->key.ToString(), to_add.size(), to_remove.size());
  }
}

//=============================================================================
// Transport callbacks
//=============================================================================

void ConnectionSupervisor::OnTransportTick(ConnectionId id, uint64_t generation, const Tick& tick) {
  std::optional<GapReport> gap;
  ConnectionKey key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->generation != generation) {
      return;
    }
    conn->last_inbound = time_source_();

    if (tick.sequence > 0) {
      if (conn->last_sequence > 0 && tick.sequence > conn->last_sequence + 1) {
        GapReport report;
        report.cause = GapReport::Cause::kSequenceGap;
        report.connection_id = id;
        report.key = conn->key;
        report.symbols = DesiredSymbolsLocked(*conn);
        report.last_received_ms = conn->last_received_ms;
        report.detected_ms = common::ToEpochMillis(wall_time_source_());
        report.expected_sequence = conn->last_sequence + 1;
        report.received_sequence = tick.sequence;
        SPDLOG_WARN("ConnectionSupervisor: {} sequence gap, expected {} got {}",
                    conn->key.ToString(), report.expected_sequence, report.received_sequence);
        gap = std::move(report);
      }
      conn->last_sequence = std::max(conn->last_sequence, tick.sequence);
    }
    conn->last_received_ms = tick.timestamp_ms > 0 ? tick.timestamp_ms
                                                   : common::ToEpochMillis(wall_time_source_());
    key = conn->key;
  }

  NotifyGap(gap);
  if (tick_sink_) {
    tick_sink_(id, key, tick);
  }
}

void ConnectionSupervisor::OnTransportInbound(ConnectionId id, uint64_t generation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->generation != generation) {
      return;
    }
    conn->last_inbound = time_source_();
    ++conn->inbound_frames;
  }
  state_cv_.notify_all();
}

void ConnectionSupervisor::OnTransportClosed(ConnectionId id, uint64_t generation, const std::string& reason) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->generation != generation || conn->state != ConnectionState::kConnected) {
      // Closes during a handshake are reported by the connect result
      return;
    }
    conn->last_error = reason;
    TransitionLocked(*conn, ConnectionEvent::kTransportClosed);
    to_close.push_back(DetachTransportLocked(*conn));
    conn->reconnect_attempts = 0;
    ScheduleRetryLocked(*conn);
  }
  CloseTransports(to_close);
}

void ConnectionSupervisor::OnTransportViolation(ConnectionId id, uint64_t generation, const std::string& reason) {
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(id);
    if (!conn || conn->generation != generation) {
      return;
    }
    if (conn->state != ConnectionState::kConnected && conn->state != ConnectionState::kConnecting) {
      return;
    }
    conn->last_error = reason;
    TransitionLocked(*conn, ConnectionEvent::kProtocolViolation);
    to_close.push_back(DetachTransportLocked(*conn));
    ++conn->reconnect_attempts;
    ScheduleRetryLocked(*conn);
  }
  CloseTransports(to_close);
}

//=============================================================================
// Health
//=============================================================================

void ConnectionSupervisor::CheckHeartbeats() {
  const auto now = time_source_();
  const auto timeout = options_.heartbeat_interval * options_.missed_heartbeats;

  std::vector<std::shared_ptr<ProviderTransport>> to_ping;
  std::vector<std::shared_ptr<ProviderTransport>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, conn] : connections_) {
      if (conn->state != ConnectionState::kConnected) {
        continue;
      }
      auto silence = std::chrono::duration_cast<std::chrono::milliseconds>(now - conn->last_inbound);
      if (silence >= timeout) {
        SPDLOG_WARN("ConnectionSupervisor: {} silent for {}ms, {} heartbeats missed",
                    conn->key.ToString(), silence.count(), options_.missed_heartbeats);
        conn->last_error = "heartbeat timeout";
        TransitionLocked(*conn, ConnectionEvent::kHeartbeatTimeout);
        to_close.push_back(DetachTransportLocked(*conn));
        conn->reconnect_attempts = 0;
        ScheduleRetryLocked(*conn);
      } else if (conn->transport && now - conn->last_ping >= options_.heartbeat_interval) {
        conn->last_ping = now;
        to_ping.push_back(conn->transport);
      }
    }
  }

  for (auto& transport : to_ping) {
    if (!transport->SendHeartbeat()) {
      SPDLOG_DEBUG("ConnectionSupervisor: heartbeat not sent on {}", transport->GetKey().ToString());
    }
  }
  CloseTransports(to_close);
}

bool ConnectionSupervisor::ProbeHeartbeat(ConnectionId connection_id, std::chrono::milliseconds timeout) {
  std::shared_ptr<ProviderTransport> transport;
  uint64_t frames_before = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Connection* conn = FindLocked(connection_id);
    if (!conn || conn->state != ConnectionState::kConnected || !conn->transport) {
      return false;
    }
    transport = conn->transport;
    frames_before = conn->inbound_frames;
  }

  if (!transport->SendHeartbeat()) {
    return false;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  return state_cv_.wait_for(lock, timeout, [this, connection_id, frames_before]() {
    const Connection* conn = FindLocked(connection_id);
    return !conn || conn->state != ConnectionState::kConnected || conn->inbound_frames > frames_before;
  }) && [this, connection_id, frames_before]() {
    const Connection* conn = FindLocked(connection_id);
    return conn && conn->state == ConnectionState::kConnected && conn->inbound_frames > frames_before;
  }();
}

//=============================================================================
// Queries
//=============================================================================

std::vector<ConnectionInfo> ConnectionSupervisor::GetConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionInfo> result;
  result.reserve(connections_.size());
  for (const auto& [id, conn] : connections_) {
    result.push_back(SnapshotLocked(*conn));
  }
  std::sort(result.begin(), result.end(),
            [](const ConnectionInfo& a, const ConnectionInfo& b) { return a.id < b.id; });
  return result;
}

std::optional<ConnectionInfo> ConnectionSupervisor::GetConnection(const ConnectionKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Connection* conn = FindByKeyLocked(key);
  if (!conn) return std::nullopt;
  return SnapshotLocked(*conn);
}

std::optional<ConnectionInfo> ConnectionSupervisor::GetConnectionById(ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Connection* conn = FindLocked(connection_id);
  if (!conn) return std::nullopt;
  return SnapshotLocked(*conn);
}

std::optional<ConnectionState> ConnectionSupervisor::GetState(const ConnectionKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Connection* conn = FindByKeyLocked(key);
  if (!conn) return std::nullopt;
  return conn->state;
}

std::vector<ConsumerId> ConnectionSupervisor::GetConsumers(ConnectionId connection_id,
                                                           const std::string& symbol) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Connection* conn = FindLocked(connection_id);
  if (!conn) return {};
  auto it = conn->symbol_consumers.find(symbol);
  if (it == conn->symbol_consumers.end()) return {};
  std::vector<ConsumerId> consumers(it->second.begin(), it->second.end());
  std::sort(consumers.begin(), consumers.end());
  return consumers;
}

bool ConnectionSupervisor::WaitForState(const ConnectionKey& key, ConnectionState state,
                                        std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return state_cv_.wait_for(lock, timeout, [this, &key, state]() {
    const Connection* conn = FindByKeyLocked(key);
    return conn && conn->state == state;
  });
}

//=============================================================================
// Helpers
//=============================================================================

void ConnectionSupervisor::CloseTransports(std::vector<std::shared_ptr<ProviderTransport>>& transports) {
  for (auto& transport : transports) {
    if (transport) {
      transport->Close();
    }
  }
  transports.clear();
}

void ConnectionSupervisor::NotifyGap(const std::optional<GapReport>& report) {
  if (report && gap_listener_ && !report->symbols.empty()) {
    gap_listener_->OnGap(*report);
  }
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
