#include "recovery_worker.hpp"
#include "engine/common/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mdstream {
namespace engine {
namespace streaming {

const char* ToString(RecoveryPriority priority) {
  switch (priority) {
    case RecoveryPriority::kHigh: return "high";
    case RecoveryPriority::kNormal: return "normal";
    case RecoveryPriority::kLow: return "low";
  }
  return "unknown";
}

const char* ToString(RecoveryHealth health) {
  switch (health) {
    case RecoveryHealth::kHealthy: return "healthy";
    case RecoveryHealth::kDegraded: return "degraded";
    case RecoveryHealth::kUnhealthy: return "unhealthy";
  }
  return "unknown";
}

RecoveryOptions RecoveryOptions::FromConfig(const common::ConfigManager& config) {
  RecoveryOptions options;
  options.max_window = config.GetMilliseconds("recovery.max_window_ms", options.max_window);
  for (const auto& provider : config.GetObjectKeys("recovery.providers")) {
    const std::string key = "recovery.providers." + provider + ".max_window_ms";
    if (config.HasKey(key)) {
      options.provider_max_window[provider] = config.GetMilliseconds(key, options.max_window);
    }
  }
  options.max_points_per_request = static_cast<size_t>(
      config.GetInt("recovery.max_points_per_request", static_cast<int>(options.max_points_per_request)));
  options.max_gap_age = config.GetMilliseconds("recovery.max_gap_age_ms", options.max_gap_age);
  options.max_attempts = std::max(1, config.GetInt("recovery.max_attempts", options.max_attempts));
  options.backoff_base = config.GetMilliseconds("recovery.backoff_base_ms", options.backoff_base);
  options.backoff_max = config.GetMilliseconds("recovery.backoff_max_ms", options.backoff_max);
  options.permit_timeout = config.GetMilliseconds("recovery.permit_timeout_ms", options.permit_timeout);
  options.replay_batch_size = static_cast<size_t>(
      std::max(1, config.GetInt("recovery.replay_batch_size", static_cast<int>(options.replay_batch_size))));
  options.health_check_batch_size = static_cast<size_t>(
      std::max(1, config.GetInt("recovery.health_check_batch_size", static_cast<int>(options.health_check_batch_size))));
  options.health_check_batch_pause =
      config.GetMilliseconds("recovery.health_check_batch_pause_ms", options.health_check_batch_pause);
  options.inactivity_threshold = config.GetMilliseconds("recovery.inactivity_threshold_ms", options.inactivity_threshold);
  options.quick_probe_timeout = config.GetMilliseconds("recovery.quick_probe_timeout_ms", options.quick_probe_timeout);
  options.full_probe_timeout = config.GetMilliseconds("recovery.full_probe_timeout_ms", options.full_probe_timeout);
  options.full_probe_retries = config.GetInt("recovery.full_probe_retries", options.full_probe_retries);
  return options;
}

std::chrono::milliseconds RecoveryOptions::MaxWindowFor(const std::string& provider_id) const {
  auto it = provider_max_window.find(provider_id);
  return it == provider_max_window.end() ? max_window : it->second;
}

nlohmann::json RecoveryMetrics::ToJson() const {
  return nlohmann::json{
      {"total_jobs", total_jobs},
      {"pending_jobs", pending_jobs},
      {"active_jobs", active_jobs},
      {"completed_jobs", completed_jobs},
      {"failed_jobs", failed_jobs},
      {"degraded_jobs", degraded_jobs},
      {"rejected_gaps", rejected_gaps},
      {"merged_gaps", merged_gaps},
      {"ticks_replayed", ticks_replayed}};
}

RecoveryWorker::RecoveryWorker(RecoveryOptions options,
                               std::shared_ptr<HistoryReplaySource> source,
                               SupervisorControl* supervisor,
                               RateLimiter* rate_limiter,
                               common::MetricsEmitter* metrics,
                               common::TimeSource time_source,
                               common::WallTimeSource wall_time_source)
    : options_(std::move(options)),
      source_(std::move(source)),
      supervisor_(supervisor),
      rate_limiter_(rate_limiter),
      metrics_(metrics),
      time_source_(std::move(time_source)),
      wall_time_source_(std::move(wall_time_source)) {
  if (!source_) {
    throw std::invalid_argument("RecoveryWorker requires a history replay source");
  }
}

RecoveryWorker::~RecoveryWorker() {
  Stop();
}

void RecoveryWorker::SetReplaySink(ReplaySink sink) {
  replay_sink_ = std::move(sink);
}

void RecoveryWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread([this]() { Run(); });
  SPDLOG_INFO("RecoveryWorker: started (max window {}ms, {} attempts)",
              options_.max_window.count(), options_.max_attempts);
}

void RecoveryWorker::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }

  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = pending_.size();
    pending_.clear();
    pending_by_conn_.clear();
  }
  idle_cv_.notify_all();
  SPDLOG_INFO("RecoveryWorker: stopped, dropped {} pending jobs", dropped);
}

void RecoveryWorker::OnGap(const GapReport& report) {
  Submit(report);
}

RecoveryPriority RecoveryWorker::ComputePriority(int64_t last_received_ms, int64_t detected_ms,
                                                 size_t symbol_count) const {
  if (last_received_ms > 0 && detected_ms - last_received_ms < options_.high_priority_gap.count()) {
    return RecoveryPriority::kHigh;
  }
  if (symbol_count > options_.low_priority_symbol_count) {
    return RecoveryPriority::kLow;
  }
  return RecoveryPriority::kNormal;
}

bool RecoveryWorker::Submit(const GapReport& report) {
  const int64_t detected_ms = report.detected_ms > 0 ? report.detected_ms
                                                     : common::ToEpochMillis(wall_time_source_());
  if (report.symbols.empty()) {
    return false;
  }

  if (report.last_received_ms > 0 && detected_ms - report.last_received_ms > options_.max_gap_age.count()) {
    SPDLOG_WARN("RecoveryWorker: rejecting gap on {} older than {}ms (last tick at {})",
                report.key.ToString(), options_.max_gap_age.count(), report.last_received_ms);
    common::EmitMetric(metrics_, common::metrics::kRecoveryFailed,
                       {{"provider", report.key.provider_id}, {"capability", report.key.capability_id},
                        {"reason", "gap_too_old"}});
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_counters_.rejected_gaps;
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = pending_by_conn_.find(report.connection_id);
  if (existing != pending_by_conn_.end()) {
    auto& job = pending_.at(existing->second);
    job.symbols.insert(report.symbols.begin(), report.symbols.end());
    if (report.last_received_ms > 0 &&
        (job.last_received_ms == 0 || report.last_received_ms < job.last_received_ms)) {
      job.last_received_ms = report.last_received_ms;
    }
    job.priority = ComputePriority(job.last_received_ms, job.detected_ms, job.symbols.size());
    ++metrics_counters_.merged_gaps;
    SPDLOG_DEBUG("RecoveryWorker: merged gap into job {} ({} symbols)", job.job_id, job.symbols.size());
    cv_.notify_one();
    return true;
  }

  RecoveryJob job;
  job.job_id = next_job_id_++;
  job.connection_id = report.connection_id;
  job.key = report.key;
  job.symbols.insert(report.symbols.begin(), report.symbols.end());
  job.last_received_ms = report.last_received_ms;
  job.detected_ms = detected_ms;
  job.priority = ComputePriority(job.last_received_ms, job.detected_ms, job.symbols.size());
  job.not_before = common::SteadyClock::now();

  SPDLOG_INFO("RecoveryWorker: queued job {} for {} ({} symbols, {} priority)",
              job.job_id, job.key.ToString(), job.symbols.size(), ToString(job.priority));
  pending_by_conn_[job.connection_id] = job.job_id;
  pending_.emplace(job.job_id, std::move(job));
  ++metrics_counters_.total_jobs;
  cv_.notify_one();
  return true;
}

//=============================================================================
// Worker loop
//=============================================================================

void RecoveryWorker::Run() {
  while (running_.load()) {
    RecoveryJob job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!PopReadyJobLocked(lock, job)) {
        continue;
      }
      ++active_;
    }

    JobOutcome outcome = JobOutcome::kExhausted;
    try {
      outcome = Process(job);
    } catch (const std::exception& e) {
      SPDLOG_ERROR("RecoveryWorker: job {} raised: {}", job.job_id, e.what());
      outcome = job.attempts >= options_.max_attempts ? JobOutcome::kExhausted : JobOutcome::kRetry;
    }
    if (outcome == JobOutcome::kExhausted) {
      OnExhausted(job);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      switch (outcome) {
        case JobOutcome::kCompleted:
          ++metrics_counters_.completed_jobs;
          break;
        case JobOutcome::kExhausted:
          ++metrics_counters_.failed_jobs;
          break;
        case JobOutcome::kDegraded:
          ++metrics_counters_.degraded_jobs;
          break;
        case JobOutcome::kRetry: {
          job.not_before = common::SteadyClock::now() + BackoffDelay(job.attempts);
          auto existing = pending_by_conn_.find(job.connection_id);
          if (existing != pending_by_conn_.end()) {
            // A newer gap arrived meanwhile; fold the retry into it
            auto& newer = pending_.at(existing->second);
            newer.symbols.insert(job.symbols.begin(), job.symbols.end());
            if (job.last_received_ms > 0 &&
                (newer.last_received_ms == 0 || job.last_received_ms < newer.last_received_ms)) {
              newer.last_received_ms = job.last_received_ms;
            }
            newer.attempts = std::max(newer.attempts, job.attempts);
          } else {
            pending_by_conn_[job.connection_id] = job.job_id;
            pending_.emplace(job.job_id, std::move(job));
          }
          break;
        }
      }
    }
    idle_cv_.notify_all();
  }
}

bool RecoveryWorker::PopReadyJobLocked(std::unique_lock<std::mutex>& lock, RecoveryJob& job) {
  while (running_.load()) {
    if (pending_.empty()) {
      cv_.wait(lock, [this]() { return !running_.load() || !pending_.empty(); });
      continue;
    }

    const auto now = common::SteadyClock::now();
    auto best = pending_.end();
    auto earliest = common::SteadyClock::time_point::max();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      if (it->second.not_before > now) {
        earliest = std::min(earliest, it->second.not_before);
        continue;
      }
      // Ties go to the older job (map iterates by job id)
      if (best == pending_.end() || it->second.priority < best->second.priority) {
        best = it;
      }
    }

    if (best != pending_.end()) {
      job = std::move(best->second);
      pending_by_conn_.erase(job.connection_id);
      pending_.erase(best);
      return true;
    }
    cv_.wait_until(lock, earliest);
  }
  return false;
}

RecoveryWindow RecoveryWorker::ComputeWindow(const RecoveryJob& job) const {
  const int64_t now_ms = common::ToEpochMillis(wall_time_source_());
  const int64_t floor_ms = now_ms - options_.MaxWindowFor(job.key.provider_id).count();

  RecoveryWindow window;
  window.from_ms = job.last_received_ms > 0 ? std::max(job.last_received_ms, floor_ms) : floor_ms;
  window.to_ms = now_ms;
  window.max_points = options_.max_points_per_request;
  return window;
}

RecoveryWorker::JobOutcome RecoveryWorker::Process(RecoveryJob& job) {
  ++job.attempts;
  const RecoveryWindow window = ComputeWindow(job);
  const JobOutcome on_failure = job.attempts >= options_.max_attempts ? JobOutcome::kExhausted
                                                                      : JobOutcome::kRetry;

  auto tags = Tags(job);
  tags["attempt"] = std::to_string(job.attempts);
  common::EmitMetric(metrics_, common::metrics::kRecoveryAttempt, tags);
  SPDLOG_INFO("RecoveryWorker: job {} attempt {}/{} for {} window [{}, {}]",
              job.job_id, job.attempts, options_.max_attempts, job.key.ToString(),
              window.from_ms, window.to_ms);

  if (rate_limiter_) {
    auto permit = rate_limiter_->AcquireBlocking(job.key.provider_id, options_.permit_timeout);
    if (!permit.IsPermit()) {
      SPDLOG_WARN("RecoveryWorker: job {} no rate limit permit within {}ms",
                  job.job_id, options_.permit_timeout.count());
      return on_failure;
    }
  }

  TickBatch ticks;
  try {
    ticks = source_->Fetch(job.key, std::vector<std::string>(job.symbols.begin(), job.symbols.end()), window);
  } catch (const common::RecoveryUnavailable& e) {
    SPDLOG_ERROR("RecoveryWorker: history unavailable for {}: {}; running batch health check",
                 job.key.ToString(), e.what());
    degraded_.store(true);
    common::EmitMetric(metrics_, common::metrics::kRecoveryDegraded, Tags(job));
    RunHealthCheck();
    return JobOutcome::kDegraded;
  } catch (const std::exception& e) {
    SPDLOG_WARN("RecoveryWorker: job {} attempt {} failed: {}", job.job_id, job.attempts, e.what());
    return on_failure;
  }

  degraded_.store(false);
  const size_t delivered = ticks.size();
  Deliver(job, std::move(ticks));
  common::EmitMetric(metrics_, common::metrics::kRecoveryCompleted, Tags(job), static_cast<double>(delivered));
  return JobOutcome::kCompleted;
}

void RecoveryWorker::Deliver(const RecoveryJob& job, TickBatch ticks) {
  ticks.erase(std::remove_if(ticks.begin(), ticks.end(),
                             [&job](const Tick& tick) { return job.symbols.count(tick.symbol) == 0; }),
              ticks.end());
  std::stable_sort(ticks.begin(), ticks.end(),
                   [](const Tick& a, const Tick& b) { return a.timestamp_ms < b.timestamp_ms; });
  for (auto& tick : ticks) {
    tick.recovered = true;
  }

  if (replay_sink_) {
    for (size_t offset = 0; offset < ticks.size(); offset += options_.replay_batch_size) {
      const size_t end = std::min(ticks.size(), offset + options_.replay_batch_size);
      TickBatch batch(ticks.begin() + offset, ticks.begin() + end);
      replay_sink_(job.connection_id, job.key, batch);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_counters_.ticks_replayed += ticks.size();
  }
  SPDLOG_INFO("RecoveryWorker: job {} replayed {} ticks for {}", job.job_id, ticks.size(), job.key.ToString());
}

void RecoveryWorker::OnExhausted(const RecoveryJob& job) {
  auto tags = Tags(job);
  tags["reason"] = "retries_exhausted";
  common::EmitMetric(metrics_, common::metrics::kRecoveryFailed, tags);
  SPDLOG_ERROR("RecoveryWorker: job {} for {} failed after {} attempts",
               job.job_id, job.key.ToString(), job.attempts);

  if (!supervisor_) {
    return;
  }
  auto info = supervisor_->GetConnectionById(job.connection_id);
  if (!info || info->state != ConnectionState::kConnected) {
    return;
  }
  if (supervisor_->ProbeHeartbeat(job.connection_id, options_.quick_probe_timeout)) {
    SPDLOG_INFO("RecoveryWorker: {} heartbeats recovered, no reconnect", job.key.ToString());
    return;
  }
  supervisor_->ForceReconnect(job.key, "recovery retries exhausted");
}

std::chrono::milliseconds RecoveryWorker::BackoffDelay(int attempt) const {
  int exponent = std::clamp(attempt - 1, 0, 20);
  auto delay = options_.backoff_base * (int64_t{1} << exponent);
  return std::min(delay, options_.backoff_max);
}

common::MetricTags RecoveryWorker::Tags(const RecoveryJob& job) const {
  return {{"provider", job.key.provider_id},
          {"capability", job.key.capability_id},
          {"priority", ToString(job.priority)},
          {"symbols", std::to_string(job.symbols.size())}};
}

//=============================================================================
// Degraded mode
//=============================================================================

HealthCheckReport RecoveryWorker::RunHealthCheck() {
  HealthCheckReport report;
  if (!supervisor_) {
    return report;
  }

  auto connections = supervisor_->GetConnections();
  report.total = connections.size();
  for (size_t offset = 0; offset < connections.size(); offset += options_.health_check_batch_size) {
    if (offset > 0 && !PauseBetweenBatches()) {
      break;
    }
    const size_t end = std::min(connections.size(), offset + options_.health_check_batch_size);
    size_t batch_healthy = 0;
    for (size_t i = offset; i < end; ++i) {
      if (CheckConnection(connections[i], report)) {
        ++batch_healthy;
      }
    }
    report.healthy += batch_healthy;
    ++report.batches;
    common::EmitMetric(metrics_, common::metrics::kHealthCheckBatch,
                       {{"batch", std::to_string(report.batches)},
                        {"size", std::to_string(end - offset)},
                        {"healthy", std::to_string(batch_healthy)}});
  }
  report.unhealthy = report.total - report.healthy;

  if (report.total > 0 && report.HealthRate() < 0.5) {
    SPDLOG_ERROR("RecoveryWorker: health check {}/{} connections healthy ({:.0f}%)",
                 report.healthy, report.total, report.HealthRate() * 100.0);
  } else {
    SPDLOG_INFO("RecoveryWorker: health check {}/{} connections healthy, {} quick probes, {} full probes",
                report.healthy, report.total, report.quick_probes, report.full_probes);
  }
  return report;
}

bool RecoveryWorker::CheckConnection(const ConnectionInfo& info, HealthCheckReport& report) {
  // Tier 1: status and inactivity
  if (info.state != ConnectionState::kConnected) {
    return false;
  }
  if (time_source_() - info.last_inbound < options_.inactivity_threshold) {
    return true;
  }

  // Tier 2: short probe for suspicious links
  ++report.quick_probes;
  if (supervisor_->ProbeHeartbeat(info.id, options_.quick_probe_timeout)) {
    return true;
  }

  // Tier 3: full probe with retries
  for (int attempt = 0; attempt < options_.full_probe_retries; ++attempt) {
    ++report.full_probes;
    if (supervisor_->ProbeHeartbeat(info.id, options_.full_probe_timeout)) {
      return true;
    }
  }
  SPDLOG_WARN("RecoveryWorker: {} failed health probes", info.key.ToString());
  return false;
}

bool RecoveryWorker::PauseBetweenBatches() {
  if (options_.health_check_batch_pause.count() <= 0) {
    return true;
  }
  if (!running_.load()) {
    std::this_thread::sleep_for(options_.health_check_batch_pause);
    return true;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, options_.health_check_batch_pause, [this]() { return !running_.load(); });
  return running_.load();
}

//=============================================================================
// Status
//=============================================================================

RecoveryMetrics RecoveryWorker::GetMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RecoveryMetrics snapshot = metrics_counters_;
  snapshot.pending_jobs = pending_.size();
  snapshot.active_jobs = active_;
  return snapshot;
}

RecoveryHealth RecoveryWorker::GetHealth() const {
  uint64_t failed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failed = metrics_counters_.failed_jobs;
  }
  if (failed >= options_.unhealthy_failure_count) {
    return RecoveryHealth::kUnhealthy;
  }
  if (!running_.load() || degraded_.load() || failed >= options_.degraded_failure_count) {
    return RecoveryHealth::kDegraded;
  }
  return RecoveryHealth::kHealthy;
}

bool RecoveryWorker::WaitIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return pending_.empty() && active_ == 0; });
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
