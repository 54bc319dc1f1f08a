#pragma once

#include "engine/common/config_manager.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/common/time_source.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

enum class DeliveryMode { kLegacy, kGateway };
enum class ValidationMode { kProduction, kDevelopment };
enum class FlagHealth { kHealthy, kDegraded, kCritical };

const char* ToString(DeliveryMode mode);
const char* ToString(FlagHealth health);

struct AutoRollbackThresholds {
  double client_disconnection_spike = 0.20;   // disconnected / connected clients
  double gateway_error_rate = 0.05;           // failed / attempted broadcasts
  uint64_t emergency_fallback_triggers = 10;  // gateway -> direct fallbacks
  uint64_t min_samples = 20;                  // rates below this sample size are ignored
};

/**
 * @brief Delivery flags, loaded once at startup
 *
 * strict_mode and allow_legacy_fallback are mutually exclusive; so are
 * strict_mode and a disabled gateway_only_mode.
 */
struct FeatureFlagConfig {
  bool gateway_only_mode = true;
  bool strict_mode = true;
  bool allow_legacy_fallback = false;
  ValidationMode validation_mode = ValidationMode::kProduction;
  std::chrono::milliseconds health_check_interval{30000};
  std::chrono::milliseconds gateway_failover_timeout{5000};
  std::chrono::milliseconds observation_window{300000};
  AutoRollbackThresholds auto_rollback;
  double max_gateway_error_rate = 0.01;  // legacy removal readiness

  // feature_flags.*
  static FeatureFlagConfig FromConfig(const common::ConfigManager& config);

  /** @brief Conflicts always; range errors only in production validation mode */
  std::vector<std::string> Validate() const;
};

struct AuditEntry {
  int64_t timestamp_ms = 0;
  std::string action;
  std::string actor;
  std::string reason;
};

/**
 * @brief Process-wide delivery mode flags
 *
 * Business logic never mutates the configuration. The emergency override
 * (operator or auto-rollback) is the only runtime mutation path; each use is
 * validated, logged with an AUDIT marker and appended to the audit trail.
 */
class FeatureFlagSet {
 public:
  using ModeListener = std::function<void(DeliveryMode mode)>;

  explicit FeatureFlagSet(FeatureFlagConfig config,
                          common::MetricsEmitter* metrics = nullptr,
                          common::WallTimeSource wall_time_source = common::DefaultWallTimeSource());

  // Non-copyable, non-movable
  FeatureFlagSet(const FeatureFlagSet&) = delete;
  FeatureFlagSet& operator=(const FeatureFlagSet&) = delete;

  FeatureFlagConfig GetConfig() const;

  /** @brief Throws ConfigConflict listing every validation error */
  void ValidateOrThrow() const;

  /**
   * @brief Errors of the effective flag state
   *
   * The configuration errors, plus one entry while an emergency override
   * holds legacy delivery open under strict_mode.
   */
  std::vector<std::string> Validate() const;

  DeliveryMode GetDeliveryMode() const;

  // Called after every mode change, outside the flag lock
  void SetModeListener(ModeListener listener);

  //=== Emergency override ===
  /** @brief Force legacy delivery; reason is mandatory. False if already active */
  bool EmergencyEnableLegacy(const std::string& reason, const std::string& actor = "operator");
  bool CloseEmergencyOverride(const std::string& reason, const std::string& actor = "operator");
  bool IsEmergencyOverrideActive() const;
  std::string GetOverrideReason() const;

  void AcknowledgeLegacyRemoval(const std::string& operator_id);
  bool IsLegacyRemovalAcknowledged() const;

  //=== Gateway outcome tracking ===
  // total_clients is the connected population before the disconnections;
  // the spike ratio uses the window's peak population
  void RecordClientDisconnections(uint64_t disconnected, uint64_t total_clients);
  void RecordGatewayResult(uint64_t failed, uint64_t total);
  void RecordFallbackTrigger();

  /** @brief Error rate over the current observation window (0 with no samples) */
  double GetGatewayErrorRate() const;

  FlagHealth GetHealthStatus() const;
  std::vector<AuditEntry> GetAuditTrail() const;

 private:
  struct ObservationWindow {
    int64_t start_ms = 0;
    uint64_t gateway_total = 0;
    uint64_t gateway_failed = 0;
    uint64_t clients_total = 0;   // peak population
    uint64_t clients_disconnected = 0;
    uint64_t fallback_triggers = 0;
  };

  int64_t NowMs() const;
  void RollWindowLocked(int64_t now_ms);
  double ErrorRateLocked() const;
  // Returns the breach description, empty if no threshold is crossed
  std::string CheckRollbackLocked() const;
  bool ActivateOverrideLocked(const std::string& reason, const std::string& actor);
  std::vector<std::string> ValidateLocked() const;
  void AuditLocked(const std::string& action, const std::string& actor, const std::string& reason);
  void MaybeAutoRollback();
  void NotifyMode(DeliveryMode mode);

  FeatureFlagConfig config_;
  common::MetricsEmitter* metrics_;
  common::WallTimeSource wall_time_source_;
  ModeListener listener_;

  mutable std::mutex mutex_;
  bool override_active_ = false;
  bool override_automatic_ = false;
  std::string override_reason_;
  std::string removal_acknowledged_by_;
  ObservationWindow window_;
  std::deque<AuditEntry> audit_trail_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
