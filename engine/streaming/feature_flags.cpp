#include "feature_flags.hpp"
#include "engine/common/errors.hpp"
#include "engine/common/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mdstream {
namespace engine {
namespace streaming {

namespace {
constexpr size_t kMaxAuditEntries = 1000;

bool InUnitRange(double value) {
  return value > 0.0 && value <= 1.0;
}
}  // namespace

const char* ToString(DeliveryMode mode) {
  return mode == DeliveryMode::kLegacy ? "legacy" : "gateway";
}

const char* ToString(FlagHealth health) {
  switch (health) {
    case FlagHealth::kHealthy: return "healthy";
    case FlagHealth::kDegraded: return "degraded";
    case FlagHealth::kCritical: return "critical";
  }
  return "unknown";
}

FeatureFlagConfig FeatureFlagConfig::FromConfig(const common::ConfigManager& config) {
  FeatureFlagConfig flags;
  flags.gateway_only_mode = config.GetBool("feature_flags.gateway_only_mode", flags.gateway_only_mode);
  flags.strict_mode = config.GetBool("feature_flags.strict_mode", flags.strict_mode);
  flags.allow_legacy_fallback = config.GetBool("feature_flags.allow_legacy_fallback", flags.allow_legacy_fallback);
  flags.validation_mode = config.GetString("feature_flags.validation_mode", "production") == "development"
                              ? ValidationMode::kDevelopment
                              : ValidationMode::kProduction;
  flags.health_check_interval =
      config.GetMilliseconds("feature_flags.health_check_interval_ms", flags.health_check_interval);
  flags.gateway_failover_timeout =
      config.GetMilliseconds("feature_flags.gateway_failover_timeout_ms", flags.gateway_failover_timeout);
  flags.observation_window = config.GetMilliseconds("feature_flags.observation_window_ms", flags.observation_window);

  auto& rollback = flags.auto_rollback;
  rollback.client_disconnection_spike =
      config.GetDouble("feature_flags.auto_rollback.client_disconnection_spike", rollback.client_disconnection_spike);
  rollback.gateway_error_rate =
      config.GetDouble("feature_flags.auto_rollback.gateway_error_rate", rollback.gateway_error_rate);
  rollback.emergency_fallback_triggers = static_cast<uint64_t>(config.GetInt64(
      "feature_flags.auto_rollback.emergency_fallback_triggers",
      static_cast<int64_t>(rollback.emergency_fallback_triggers)));
  rollback.min_samples = static_cast<uint64_t>(config.GetInt64(
      "feature_flags.auto_rollback.min_samples", static_cast<int64_t>(rollback.min_samples)));
  flags.max_gateway_error_rate = config.GetDouble("feature_flags.max_gateway_error_rate", flags.max_gateway_error_rate);
  return flags;
}

std::vector<std::string> FeatureFlagConfig::Validate() const {
  std::vector<std::string> errors;
  if (strict_mode && allow_legacy_fallback) {
    errors.push_back("strict_mode and allow_legacy_fallback cannot both be enabled");
  }
  if (strict_mode && !gateway_only_mode) {
    errors.push_back("strict_mode requires gateway_only_mode");
  }

  std::vector<std::string> range_errors;
  if (!InUnitRange(auto_rollback.client_disconnection_spike)) {
    range_errors.push_back("auto_rollback.client_disconnection_spike must be in (0, 1]");
  }
  if (!InUnitRange(auto_rollback.gateway_error_rate)) {
    range_errors.push_back("auto_rollback.gateway_error_rate must be in (0, 1]");
  }
  if (!InUnitRange(max_gateway_error_rate)) {
    range_errors.push_back("max_gateway_error_rate must be in (0, 1]");
  }
  if (observation_window.count() <= 0) {
    range_errors.push_back("observation_window must be positive");
  }
  if (auto_rollback.emergency_fallback_triggers == 0) {
    range_errors.push_back("auto_rollback.emergency_fallback_triggers must be positive");
  }

  if (validation_mode == ValidationMode::kProduction) {
    errors.insert(errors.end(), range_errors.begin(), range_errors.end());
  } else {
    for (const auto& warning : range_errors) {
      SPDLOG_WARN("FeatureFlagConfig: {} (ignored in development mode)", warning);
    }
  }
  return errors;
}

FeatureFlagSet::FeatureFlagSet(FeatureFlagConfig config,
                               common::MetricsEmitter* metrics,
                               common::WallTimeSource wall_time_source)
    : config_(config), metrics_(metrics), wall_time_source_(std::move(wall_time_source)) {
  window_.start_ms = NowMs();
}

int64_t FeatureFlagSet::NowMs() const {
  return common::ToEpochMillis(wall_time_source_());
}

FeatureFlagConfig FeatureFlagSet::GetConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

void FeatureFlagSet::ValidateOrThrow() const {
  auto errors = GetConfig().Validate();
  if (errors.empty()) {
    return;
  }
  const std::string message = common::Join(errors, "; ");
  SPDLOG_ERROR("FeatureFlagSet: AUDIT configuration conflict: {}", message);
  common::EmitMetric(metrics_, common::metrics::kFeatureFlagConflict, {{"errors", message}});
  throw common::ConfigConflict(message);
}

std::vector<std::string> FeatureFlagSet::Validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ValidateLocked();
}

std::vector<std::string> FeatureFlagSet::ValidateLocked() const {
  auto errors = config_.Validate();
  if (override_active_ && config_.strict_mode) {
    errors.push_back("emergency legacy override active under strict_mode: " + override_reason_);
  }
  return errors;
}

DeliveryMode FeatureFlagSet::GetDeliveryMode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return (!config_.gateway_only_mode || override_active_) ? DeliveryMode::kLegacy : DeliveryMode::kGateway;
}

void FeatureFlagSet::SetModeListener(ModeListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void FeatureFlagSet::NotifyMode(DeliveryMode mode) {
  ModeListener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(mode);
  }
}

//=============================================================================
// Emergency override
//=============================================================================

bool FeatureFlagSet::ActivateOverrideLocked(const std::string& reason, const std::string& actor) {
  if (override_active_) {
    return false;
  }
  auto errors = config_.Validate();
  if (!errors.empty()) {
    const std::string message = common::Join(errors, "; ");
    SPDLOG_ERROR("FeatureFlagSet: AUDIT emergency override refused, configuration invalid: {}", message);
    common::EmitMetric(metrics_, common::metrics::kFeatureFlagConflict, {{"errors", message}});
    throw common::ConfigConflict(message);
  }

  override_active_ = true;
  override_reason_ = reason;
  AuditLocked("emergency_enable_legacy", actor, reason);
  if (config_.strict_mode) {
    // Legacy delivery now runs against strict_mode until the override closes
    const std::string message = common::Join(ValidateLocked(), "; ");
    AuditLocked("strict_mode_exception", actor, reason);
    SPDLOG_ERROR("FeatureFlagSet: AUDIT strict_mode exception opened by {}: {}", actor, message);
    common::EmitMetric(metrics_, common::metrics::kFeatureFlagConflict,
                       {{"errors", message}, {"exception", "emergency_override"}});
  }
  SPDLOG_WARN("FeatureFlagSet: AUDIT emergency legacy override enabled by {}: {}", actor, reason);
  common::EmitMetric(metrics_, common::metrics::kFeatureFlagEmergencyOverride,
                     {{"action", "enable"}, {"actor", actor}, {"reason", reason}});
  return true;
}

bool FeatureFlagSet::EmergencyEnableLegacy(const std::string& reason, const std::string& actor) {
  if (reason.empty()) {
    throw std::invalid_argument("emergency override requires a reason");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ActivateOverrideLocked(reason, actor)) {
      return false;
    }
    override_automatic_ = false;
  }
  NotifyMode(GetDeliveryMode());
  return true;
}

bool FeatureFlagSet::CloseEmergencyOverride(const std::string& reason, const std::string& actor) {
  if (reason.empty()) {
    throw std::invalid_argument("closing the emergency override requires a reason");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!override_active_) {
      return false;
    }
    override_active_ = false;
    override_automatic_ = false;
    override_reason_.clear();
    // Fresh observation window for the restored gateway path
    window_ = ObservationWindow{};
    window_.start_ms = NowMs();
    AuditLocked("close_emergency_override", actor, reason);
    SPDLOG_WARN("FeatureFlagSet: AUDIT emergency override closed by {}: {}", actor, reason);
    common::EmitMetric(metrics_, common::metrics::kFeatureFlagEmergencyOverride,
                       {{"action", "close"}, {"actor", actor}, {"reason", reason}});
  }
  NotifyMode(GetDeliveryMode());
  return true;
}

bool FeatureFlagSet::IsEmergencyOverrideActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return override_active_;
}

std::string FeatureFlagSet::GetOverrideReason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return override_reason_;
}

void FeatureFlagSet::AcknowledgeLegacyRemoval(const std::string& operator_id) {
  if (operator_id.empty()) {
    throw std::invalid_argument("legacy removal acknowledgement requires an operator id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  removal_acknowledged_by_ = operator_id;
  AuditLocked("acknowledge_legacy_removal", operator_id, "");
  SPDLOG_WARN("FeatureFlagSet: AUDIT legacy removal acknowledged by {}", operator_id);
}

bool FeatureFlagSet::IsLegacyRemovalAcknowledged() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !removal_acknowledged_by_.empty();
}

void FeatureFlagSet::AuditLocked(const std::string& action, const std::string& actor, const std::string& reason) {
  audit_trail_.push_back(AuditEntry{NowMs(), action, actor, reason});
  while (audit_trail_.size() > kMaxAuditEntries) {
    audit_trail_.pop_front();
  }
}

std::vector<AuditEntry> FeatureFlagSet::GetAuditTrail() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<AuditEntry>(audit_trail_.begin(), audit_trail_.end());
}

//=============================================================================
// Observation window and auto-rollback
//=============================================================================

void FeatureFlagSet::RollWindowLocked(int64_t now_ms) {
  if (now_ms - window_.start_ms >= config_.observation_window.count()) {
    window_ = ObservationWindow{};
    window_.start_ms = now_ms;
  }
}

double FeatureFlagSet::ErrorRateLocked() const {
  if (window_.gateway_total == 0) {
    return 0.0;
  }
  return static_cast<double>(window_.gateway_failed) / static_cast<double>(window_.gateway_total);
}

double FeatureFlagSet::GetGatewayErrorRate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (NowMs() - window_.start_ms >= config_.observation_window.count()) {
    return 0.0;
  }
  return ErrorRateLocked();
}

void FeatureFlagSet::RecordClientDisconnections(uint64_t disconnected, uint64_t total_clients) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    RollWindowLocked(NowMs());
    window_.clients_disconnected += disconnected;
    window_.clients_total = std::max(window_.clients_total, total_clients);
  }
  MaybeAutoRollback();
}

void FeatureFlagSet::RecordGatewayResult(uint64_t failed, uint64_t total) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    RollWindowLocked(NowMs());
    window_.gateway_failed += failed;
    window_.gateway_total += total;
  }
  if (failed > 0) {
    common::EmitMetric(metrics_, common::metrics::kGatewayError, {}, static_cast<double>(failed));
  }
  MaybeAutoRollback();
}

void FeatureFlagSet::RecordFallbackTrigger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    RollWindowLocked(NowMs());
    ++window_.fallback_triggers;
  }
  MaybeAutoRollback();
}

std::string FeatureFlagSet::CheckRollbackLocked() const {
  const auto& thresholds = config_.auto_rollback;
  if (window_.clients_total >= thresholds.min_samples) {
    double spike = static_cast<double>(window_.clients_disconnected) / static_cast<double>(window_.clients_total);
    if (spike >= thresholds.client_disconnection_spike) {
      return "client disconnection spike " + std::to_string(spike);
    }
  }
  if (window_.gateway_total >= thresholds.min_samples && ErrorRateLocked() >= thresholds.gateway_error_rate) {
    return "gateway error rate " + std::to_string(ErrorRateLocked());
  }
  if (window_.fallback_triggers >= thresholds.emergency_fallback_triggers) {
    return std::to_string(window_.fallback_triggers) + " emergency fallback triggers";
  }
  return {};
}

void FeatureFlagSet::MaybeAutoRollback() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (override_active_) {
      return;
    }
    const std::string breach = CheckRollbackLocked();
    if (breach.empty()) {
      return;
    }
    common::EmitMetric(metrics_, common::metrics::kFeatureFlagAutoRollback,
                       {{"breach", breach}, {"applied", config_.strict_mode ? "false" : "true"}});
    if (config_.strict_mode) {
      SPDLOG_ERROR("FeatureFlagSet: AUDIT auto-rollback threshold crossed ({}) but strict mode forbids legacy",
                   breach);
      // Restart the window so the breach is reported once per window
      window_ = ObservationWindow{};
      window_.start_ms = NowMs();
      return;
    }
    if (!ActivateOverrideLocked("auto-rollback: " + breach, "auto_rollback")) {
      return;
    }
    override_automatic_ = true;
  }
  NotifyMode(GetDeliveryMode());
}

FlagHealth FeatureFlagSet::GetHealthStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool window_live = NowMs() - window_.start_ms < config_.observation_window.count();
  const double error_rate = window_live ? ErrorRateLocked() : 0.0;
  if ((override_active_ && override_automatic_) || error_rate >= config_.auto_rollback.gateway_error_rate) {
    return FlagHealth::kCritical;
  }
  if (override_active_ || error_rate > config_.max_gateway_error_rate) {
    return FlagHealth::kDegraded;
  }
  return FlagHealth::kHealthy;
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
