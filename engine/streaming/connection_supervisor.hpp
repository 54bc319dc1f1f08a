#pragma once

#include "connection_state.hpp"
#include "provider_transport.hpp"
#include "rate_limiter.hpp"
#include "tick.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/event_thread.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/common/time_source.hpp"
#include "engine/common/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

using ConsumerId = std::string;
using ConnectionId = uint64_t;

struct SupervisorOptions {
  std::chrono::milliseconds heartbeat_interval{30000};
  int missed_heartbeats = 2;
  // Silence is sampled at this cadence (capped at heartbeat_interval); pings
  // still go out once per heartbeat_interval
  std::chrono::milliseconds heartbeat_check_interval{1000};
  std::chrono::milliseconds reconnect_attempt_timeout{10000};
  int max_reconnect_attempts = 5;
  std::chrono::milliseconds reconnect_base_delay{1000};
  std::chrono::milliseconds reconnect_max_delay{30000};
  std::chrono::milliseconds unsubscribe_grace_period{10000};
  std::chrono::milliseconds sync_permit_timeout{2000};
  size_t connect_workers = 2;
  // Tests drive CheckHeartbeats() directly with a manual clock
  bool run_heartbeat_ticker = true;

  static SupervisorOptions FromConfig(const common::ConfigManager& config);
};

// Point-in-time view of a connection record
struct ConnectionInfo {
  ConnectionId id = 0;
  ConnectionKey key;
  ConnectionState state = ConnectionState::kIdle;
  std::vector<std::string> symbols;          // symbols with at least one consumer
  std::vector<std::string> active_symbols;   // symbols subscribed upstream
  size_t consumer_count = 0;
  common::SteadyClock::time_point last_inbound;
  uint64_t last_sequence = 0;
  int64_t last_received_ms = 0;
  int reconnect_attempts = 0;
  bool grace_pending = false;
  std::string last_error;
};

// Missed-data condition detected on a connection
struct GapReport {
  enum class Cause { kSequenceGap, kReconnect };

  Cause cause = Cause::kReconnect;
  ConnectionId connection_id = 0;
  ConnectionKey key;
  std::vector<std::string> symbols;
  int64_t last_received_ms = 0;   // last tick received before the gap, 0 if none
  int64_t detected_ms = 0;
  uint64_t expected_sequence = 0;
  uint64_t received_sequence = 0;
};

class GapListener {
 public:
  virtual ~GapListener() = default;

  // Called from IO or supervisor threads; implementations must not block
  virtual void OnGap(const GapReport& report) = 0;
};

// Control surface used by recovery and health checking
class SupervisorControl {
 public:
  virtual ~SupervisorControl() = default;

  virtual std::vector<ConnectionInfo> GetConnections() const = 0;
  virtual std::optional<ConnectionInfo> GetConnectionById(ConnectionId connection_id) const = 0;
  virtual bool ProbeHeartbeat(ConnectionId connection_id, std::chrono::milliseconds timeout) = 0;
  virtual bool ForceReconnect(const ConnectionKey& key, const std::string& reason) = 0;
};

// Inbound tick, in receipt order per connection
using TickSink = std::function<void(ConnectionId connection_id, const ConnectionKey& key, const Tick& tick)>;

using TransportFactoryFn = std::function<std::shared_ptr<ProviderTransport>(const ConnectionKey& key)>;

/**
 * @brief Owns one provider transport per (provider, capability) pair
 *
 * Connection records live in an id-indexed arena; subscriptions are
 * reference-counted per symbol as a set of consumers. Lifecycle follows the
 * NextState() table; every applied transition emits
 * connection.state_transition.
 *
 * Threads: a supervisor EventThread runs timers (heartbeat ticker, grace,
 * backoff) and transport close handling; a small WorkerPool runs blocking
 * handshakes and symbol sync; ticks are dispatched on the transport IO thread.
 * Transports are never closed while the supervisor lock is held.
 */
class ConnectionSupervisor : public SupervisorControl {
 public:
  ConnectionSupervisor(SupervisorOptions options,
                       TransportFactoryFn transport_factory,
                       RateLimiter* rate_limiter,
                       common::MetricsEmitter* metrics = nullptr,
                       common::TimeSource time_source = common::DefaultTimeSource(),
                       common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());
  ~ConnectionSupervisor() override;

  // Non-copyable, non-movable
  ConnectionSupervisor(const ConnectionSupervisor&) = delete;
  ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

  // Set before Start()
  void SetTickSink(TickSink sink);
  void SetGapListener(GapListener* listener);

  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  //=== Subscription surface ===
  /** @brief Idempotent; creates and connects the record on first subscription */
  ConnectionId Subscribe(const ConsumerId& consumer, const ConnectionKey& key,
                         const std::vector<std::string>& symbols);

  /** @brief Idempotent; the last unsubscribe starts the grace timer */
  void Unsubscribe(const ConsumerId& consumer, const ConnectionKey& key,
                   const std::vector<std::string>& symbols);

  void UnsubscribeAll(const ConsumerId& consumer);

  /** @brief Drop all subscriptions and release the connection immediately */
  bool Disconnect(const ConnectionKey& key);

  /** @brief Close the live transport and go through the reconnect path */
  bool ForceReconnect(const ConnectionKey& key, const std::string& reason) override;

  //=== Health ===
  /** @brief Send a heartbeat and wait for any inbound frame */
  bool ProbeHeartbeat(ConnectionId connection_id, std::chrono::milliseconds timeout) override;

  /** @brief Heartbeat ticker body: ping live links, time out silent ones */
  void CheckHeartbeats();

  //=== Queries ===
  std::vector<ConnectionInfo> GetConnections() const override;
  std::optional<ConnectionInfo> GetConnection(const ConnectionKey& key) const;
  std::optional<ConnectionInfo> GetConnectionById(ConnectionId connection_id) const override;
  std::optional<ConnectionState> GetState(const ConnectionKey& key) const;
  std::vector<ConsumerId> GetConsumers(ConnectionId connection_id, const std::string& symbol) const;

  /** @brief Block until the record for key reaches state (tests, admin) */
  bool WaitForState(const ConnectionKey& key, ConnectionState state, std::chrono::milliseconds timeout) const;

 private:
  struct Connection {
    ConnectionId id = 0;
    ConnectionKey key;
    ConnectionState state = ConnectionState::kIdle;
    std::shared_ptr<ProviderTransport> transport;
    uint64_t generation = 0;

    // symbol -> consumers; a symbol is desired while its set is non-empty
    std::unordered_map<std::string, std::unordered_set<ConsumerId>> symbol_consumers;
    std::set<std::string> active_symbols;
    bool sync_scheduled = false;

    common::SteadyClock::time_point last_inbound;
    common::SteadyClock::time_point last_ping;
    uint64_t inbound_frames = 0;
    uint64_t last_sequence = 0;
    int64_t last_received_ms = 0;
    bool had_session = false;

    int reconnect_attempts = 0;
    int grace_task_id = -1;
    int retry_task_id = -1;
    std::string last_error;
  };

  enum class ConnectOutcome { kConnected, kFailed, kAuthRejected };

  //=== Record management (mutex_ held) ===
  Connection* FindLocked(ConnectionId id);
  const Connection* FindLocked(ConnectionId id) const;
  Connection* FindByKeyLocked(const ConnectionKey& key);
  const Connection* FindByKeyLocked(const ConnectionKey& key) const;
  Connection& CreateRecordLocked(const ConnectionKey& key);
  std::shared_ptr<ProviderTransport> ReleaseRecordLocked(Connection& conn, const std::string& reason);
  bool TransitionLocked(Connection& conn, ConnectionEvent event);
  ConnectionInfo SnapshotLocked(const Connection& conn) const;
  std::vector<std::string> DesiredSymbolsLocked(const Connection& conn) const;

  //=== Connect / reconnect ===
  void StartConnectAttemptLocked(Connection& conn);
  void RunConnect(ConnectionId id, uint64_t generation, std::shared_ptr<ProviderTransport> transport);
  void OnConnectResult(ConnectionId id, uint64_t generation, ConnectOutcome outcome, const std::string& error);
  std::shared_ptr<ProviderTransport> DetachTransportLocked(Connection& conn);
  void ScheduleRetryLocked(Connection& conn);
  void OnRetryTimer(ConnectionId id, uint64_t generation);
  std::chrono::milliseconds BackoffDelay(int attempt) const;
  void OnNoSubscribersLocked(Connection& conn, std::vector<std::shared_ptr<ProviderTransport>>& to_close);
  void OnGraceExpired(ConnectionId id);

  //=== Symbol sync ===
  void ScheduleSyncLocked(Connection& conn);
  void RunSync(ConnectionId id);

  //=== Transport callbacks ===
  void OnTransportTick(ConnectionId id, uint64_t generation, const Tick& tick);
  void OnTransportInbound(ConnectionId id, uint64_t generation);
  void OnTransportClosed(ConnectionId id, uint64_t generation, const std::string& reason);
  void OnTransportViolation(ConnectionId id, uint64_t generation, const std::string& reason);

  void CloseTransports(std::vector<std::shared_ptr<ProviderTransport>>& transports);
  void NotifyGap(const std::optional<GapReport>& report);

  SupervisorOptions options_;
  TransportFactoryFn transport_factory_;
  RateLimiter* rate_limiter_;
  common::MetricsEmitter* metrics_;
  common::TimeSource time_source_;
  common::WallTimeSource wall_time_source_;

  TickSink tick_sink_;
  GapListener* gap_listener_ = nullptr;

  common::EventThread control_thread_;
  common::WorkerPool connect_pool_;
  std::atomic<bool> running_{false};
  int heartbeat_task_id_ = -1;

  mutable std::mutex mutex_;
  mutable std::condition_variable state_cv_;
  ConnectionId next_id_ = 1;
  std::unordered_map<ConnectionId, std::unique_ptr<Connection>> connections_;
  std::unordered_map<ConnectionKey, ConnectionId, ConnectionKeyHash> key_index_;
  std::unordered_map<ConsumerId, std::set<ConnectionId>> consumer_index_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
