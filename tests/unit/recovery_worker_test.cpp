#include <gtest/gtest.h>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "engine/common/config_manager.hpp"
#include "engine/common/errors.hpp"
#include "engine/common/metrics_emitter.hpp"
#include "engine/streaming/rate_limiter.hpp"
#include "engine/streaming/recovery_worker.hpp"
#include "test_clock.hpp"

using namespace mdstream::engine::streaming;
using mdstream::engine::common::ConfigManager;
using mdstream::engine::common::CountingMetricsEmitter;
using mdstream::engine::common::RecoveryUnavailable;
using mdstream::engine::common::ToEpochMillis;
using mdstream::engine::common::TransportError;
using mdstream::test::ManualClock;

namespace {

const std::chrono::milliseconds kWait{3000};

// History backend following a script of outcomes, then serving its tick set
class ScriptedHistorySource : public HistoryReplaySource {
 public:
  enum class Step { kServe, kFail, kUnavailable };

  struct Call {
    ConnectionKey key;
    std::vector<std::string> symbols;
    RecoveryWindow window;
  };

  TickBatch Fetch(const ConnectionKey& key, const std::vector<std::string>& symbols,
                  const RecoveryWindow& window) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back({key, symbols, window});
    Step step = Step::kServe;
    if (!script_.empty()) {
      step = script_.front();
      script_.pop_front();
    } else if (always_fail_) {
      step = Step::kFail;
    }
    if (step == Step::kFail) {
      throw TransportError("history request failed");
    }
    if (step == Step::kUnavailable) {
      throw RecoveryUnavailable("history backend unreachable");
    }
    return ticks_;
  }

  void Push(Step step) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(step);
  }

  void SetAlwaysFail(bool always_fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_fail_ = always_fail;
  }

  void SetTicks(TickBatch ticks) {
    std::lock_guard<std::mutex> lock(mutex_);
    ticks_ = std::move(ticks);
  }

  std::vector<Call> GetCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::deque<Step> script_;
  bool always_fail_ = false;
  TickBatch ticks_;
  std::vector<Call> calls_;
};

// Supervisor stand-in with scripted connections and probe answers
class FakeSupervisorControl : public SupervisorControl {
 public:
  std::vector<ConnectionInfo> GetConnections() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++list_calls_;
    return connections_;
  }

  std::optional<ConnectionInfo> GetConnectionById(ConnectionId connection_id) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& info : connections_) {
      if (info.id == connection_id) return info;
    }
    return std::nullopt;
  }

  bool ProbeHeartbeat(ConnectionId connection_id, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++probes_[connection_id];
    auto it = probe_results_.find(connection_id);
    return it != probe_results_.end() && it->second;
  }

  bool ForceReconnect(const ConnectionKey& key, const std::string&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_.push_back(key);
    return true;
  }

  void Add(ConnectionInfo info, bool probe_result) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_results_[info.id] = probe_result;
    connections_.push_back(std::move(info));
  }

  int GetListCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_calls_;
  }

  int GetProbes(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = probes_.find(id);
    return it == probes_.end() ? 0 : it->second;
  }

  std::vector<ConnectionKey> GetForced() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forced_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<ConnectionInfo> connections_;
  std::map<ConnectionId, bool> probe_results_;
  std::map<ConnectionId, int> probes_;
  std::vector<ConnectionKey> forced_;
  mutable int list_calls_ = 0;
};

Tick MakeTick(const std::string& symbol, int64_t timestamp_ms) {
  Tick tick;
  tick.symbol = symbol;
  tick.last_price = 10.0;
  tick.timestamp_ms = timestamp_ms;
  return tick;
}

}  // namespace

class RecoveryWorkerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (worker_) {
      worker_->Stop();
    }
  }

  void Create(RecoveryOptions options, RateLimiter* limiter = nullptr) {
    worker_ = std::make_unique<RecoveryWorker>(options, source_, &supervisor_, limiter, &metrics_,
                                               clock_.Source(), clock_.WallSource());
    worker_->SetReplaySink([this](ConnectionId, const ConnectionKey&, const TickBatch& batch) {
      std::lock_guard<std::mutex> lock(replay_mutex_);
      batches_.push_back(batch);
    });
  }

  static RecoveryOptions FastOptions() {
    RecoveryOptions options;
    options.backoff_base = std::chrono::milliseconds(5);
    options.backoff_max = std::chrono::milliseconds(20);
    options.health_check_batch_pause = std::chrono::milliseconds(0);
    return options;
  }

  GapReport MakeGap(ConnectionId id, std::vector<std::string> symbols, int64_t silence_ms) {
    GapReport report;
    report.cause = GapReport::Cause::kReconnect;
    report.connection_id = id;
    report.key = key_;
    report.symbols = std::move(symbols);
    report.detected_ms = NowMs();
    report.last_received_ms = NowMs() - silence_ms;
    return report;
  }

  int64_t NowMs() const { return ToEpochMillis(clock_.Wall()); }

  std::vector<TickBatch> GetBatches() {
    std::lock_guard<std::mutex> lock(replay_mutex_);
    return batches_;
  }

  const ConnectionKey key_{"P1", "quote"};
  ManualClock clock_;
  CountingMetricsEmitter metrics_;
  std::shared_ptr<ScriptedHistorySource> source_ = std::make_shared<ScriptedHistorySource>();
  FakeSupervisorControl supervisor_;
  std::mutex replay_mutex_;
  std::vector<TickBatch> batches_;
  std::unique_ptr<RecoveryWorker> worker_;
};

TEST_F(RecoveryWorkerTest, RequiresHistorySource) {
  EXPECT_THROW(RecoveryWorker(RecoveryOptions{}, nullptr, nullptr, nullptr), std::invalid_argument);
}

TEST_F(RecoveryWorkerTest, ReplaysSortedFilteredTicksInBatches) {
  RecoveryOptions options = FastOptions();
  options.replay_batch_size = 2;
  Create(options);

  const int64_t now = NowMs();
  source_->SetTicks({MakeTick("AAPL", now - 1000), MakeTick("MSFT", now - 4000), MakeTick("AAPL", now - 3000),
                     MakeTick("TSLA", now - 2500), MakeTick("AAPL", now - 2000), MakeTick("MSFT", now - 500)});
  worker_->Start();
  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL", "MSFT"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));

  auto batches = GetBatches();
  ASSERT_EQ(batches.size(), 3u);
  std::vector<Tick> replayed;
  for (const auto& batch : batches) {
    EXPECT_LE(batch.size(), 2u);
    replayed.insert(replayed.end(), batch.begin(), batch.end());
  }
  ASSERT_EQ(replayed.size(), 5u);
  for (size_t i = 0; i < replayed.size(); ++i) {
    EXPECT_TRUE(replayed[i].recovered);
    EXPECT_NE(replayed[i].symbol, "TSLA");
    if (i > 0) {
      EXPECT_LE(replayed[i - 1].timestamp_ms, replayed[i].timestamp_ms);
    }
  }

  auto calls = source_->GetCalls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].symbols, (std::vector<std::string>{"AAPL", "MSFT"}));
  EXPECT_EQ(calls[0].window.from_ms, now - 10000);
  EXPECT_EQ(calls[0].window.to_ms, now);

  auto stats = worker_->GetMetrics();
  EXPECT_EQ(stats.completed_jobs, 1u);
  EXPECT_EQ(stats.ticks_replayed, 5u);
  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kHealthy);
}

TEST_F(RecoveryWorkerTest, WindowIsClampedToProviderMaximum) {
  RecoveryOptions options = FastOptions();
  options.max_window = std::chrono::minutes(5);
  options.provider_max_window["P2"] = std::chrono::minutes(1);
  options.max_points_per_request = 250;
  Create(options);

  const int64_t now = NowMs();
  RecoveryJob job;
  job.key = key_;
  job.last_received_ms = now - 3600 * 1000;
  auto window = worker_->ComputeWindow(job);
  EXPECT_EQ(window.from_ms, now - 300000);
  EXPECT_EQ(window.to_ms, now);
  EXPECT_EQ(window.max_points, 250u);

  job.key = ConnectionKey{"P2", "quote"};
  EXPECT_EQ(worker_->ComputeWindow(job).DurationMs(), 60000);

  // Unknown last tick replays the full window
  job.last_received_ms = 0;
  EXPECT_EQ(worker_->ComputeWindow(job).from_ms, now - 60000);
}

TEST_F(RecoveryWorkerTest, PriorityRules) {
  Create(FastOptions());
  const int64_t now = NowMs();
  EXPECT_EQ(worker_->ComputePriority(now - 5000, now, 100), RecoveryPriority::kHigh);
  EXPECT_EQ(worker_->ComputePriority(now - 60000, now, 3), RecoveryPriority::kNormal);
  EXPECT_EQ(worker_->ComputePriority(now - 60000, now, 51), RecoveryPriority::kLow);
  EXPECT_EQ(worker_->ComputePriority(0, now, 3), RecoveryPriority::kNormal);
}

TEST_F(RecoveryWorkerTest, HighPriorityJobRunsFirst) {
  Create(FastOptions());
  std::vector<std::string> many;
  for (int i = 0; i < 60; ++i) {
    many.push_back("SYM" + std::to_string(i));
  }
  ASSERT_TRUE(worker_->Submit(MakeGap(1, many, 120000)));
  ASSERT_TRUE(worker_->Submit(MakeGap(2, {"AAPL"}, 2000)));

  worker_->Start();
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  auto calls = source_->GetCalls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].symbols, (std::vector<std::string>{"AAPL"}));
  EXPECT_EQ(calls[1].symbols.size(), 60u);
}

TEST_F(RecoveryWorkerTest, RejectsStaleAndEmptyGaps) {
  Create(FastOptions());
  EXPECT_FALSE(worker_->Submit(MakeGap(1, {"AAPL"}, 25LL * 3600 * 1000)));
  EXPECT_FALSE(worker_->Submit(MakeGap(1, {}, 1000)));

  auto stats = worker_->GetMetrics();
  EXPECT_EQ(stats.rejected_gaps, 1u);
  EXPECT_EQ(stats.total_jobs, 0u);
  EXPECT_DOUBLE_EQ(metrics_.GetCount("recovery.failed"), 1.0);
}

TEST_F(RecoveryWorkerTest, PendingGapsOnSameConnectionMerge) {
  Create(FastOptions());
  ASSERT_TRUE(worker_->Submit(MakeGap(7, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->Submit(MakeGap(7, {"MSFT"}, 20000)));

  auto stats = worker_->GetMetrics();
  EXPECT_EQ(stats.total_jobs, 1u);
  EXPECT_EQ(stats.merged_gaps, 1u);
  EXPECT_EQ(stats.pending_jobs, 1u);

  worker_->Start();
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  auto calls = source_->GetCalls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].symbols, (std::vector<std::string>{"AAPL", "MSFT"}));
  // The earliest last tick wins
  EXPECT_EQ(calls[0].window.from_ms, NowMs() - 20000);
}

TEST_F(RecoveryWorkerTest, RetriesWithBackoffThenCompletes) {
  Create(FastOptions());
  source_->Push(ScriptedHistorySource::Step::kFail);
  source_->SetTicks({MakeTick("AAPL", NowMs() - 100)});
  worker_->Start();

  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));

  EXPECT_EQ(source_->GetCalls().size(), 2u);
  auto stats = worker_->GetMetrics();
  EXPECT_EQ(stats.completed_jobs, 1u);
  EXPECT_EQ(stats.failed_jobs, 0u);
  EXPECT_DOUBLE_EQ(metrics_.GetCount("recovery.attempt"), 2.0);
  EXPECT_EQ(GetBatches().size(), 1u);
}

TEST_F(RecoveryWorkerTest, ExhaustedJobForcesReconnectWhenProbeFails) {
  RecoveryOptions options = FastOptions();
  options.max_attempts = 2;
  Create(options);
  ConnectionInfo info;
  info.id = 1;
  info.key = key_;
  info.state = ConnectionState::kConnected;
  supervisor_.Add(info, false);
  source_->SetAlwaysFail(true);
  worker_->Start();

  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));

  EXPECT_EQ(source_->GetCalls().size(), 2u);
  EXPECT_EQ(worker_->GetMetrics().failed_jobs, 1u);
  EXPECT_EQ(supervisor_.GetProbes(1), 1);
  auto forced = supervisor_.GetForced();
  ASSERT_EQ(forced.size(), 1u);
  EXPECT_EQ(forced[0], key_);
}

TEST_F(RecoveryWorkerTest, ExhaustedJobKeepsConnectionWhenHeartbeatAnswers) {
  RecoveryOptions options = FastOptions();
  options.max_attempts = 1;
  Create(options);
  ConnectionInfo info;
  info.id = 1;
  info.key = key_;
  info.state = ConnectionState::kConnected;
  supervisor_.Add(info, true);
  source_->SetAlwaysFail(true);
  worker_->Start();

  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  EXPECT_EQ(supervisor_.GetProbes(1), 1);
  EXPECT_TRUE(supervisor_.GetForced().empty());
}

TEST_F(RecoveryWorkerTest, PermitTimeoutCountsAsFailure) {
  RateLimiter limiter(RateLimitBudget{0.001, 1.0});
  ASSERT_TRUE(limiter.TryAcquire("P1"));
  RecoveryOptions options = FastOptions();
  options.max_attempts = 1;
  options.permit_timeout = std::chrono::milliseconds(20);
  Create(options, &limiter);
  worker_->Start();

  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  EXPECT_TRUE(source_->GetCalls().empty());
  EXPECT_EQ(worker_->GetMetrics().failed_jobs, 1u);
  worker_->Stop();
}

TEST_F(RecoveryWorkerTest, UnavailableHistoryEntersDegradedMode) {
  Create(FastOptions());
  source_->Push(ScriptedHistorySource::Step::kUnavailable);
  worker_->Start();

  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  EXPECT_TRUE(worker_->IsDegraded());
  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kDegraded);
  EXPECT_EQ(worker_->GetMetrics().degraded_jobs, 1u);
  EXPECT_GE(supervisor_.GetListCalls(), 1);
  EXPECT_DOUBLE_EQ(metrics_.GetCount("recovery.degraded"), 1.0);

  // The next successful replay clears degraded mode
  ASSERT_TRUE(worker_->Submit(MakeGap(2, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  EXPECT_FALSE(worker_->IsDegraded());
  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kHealthy);
}

TEST_F(RecoveryWorkerTest, HealthCheckEscalatesThroughProbeTiers) {
  RecoveryOptions options = FastOptions();
  options.health_check_batch_size = 2;
  options.full_probe_retries = 2;
  Create(options);

  const auto now = clock_.Steady();
  ConnectionInfo fresh;
  fresh.id = 1;
  fresh.state = ConnectionState::kConnected;
  fresh.last_inbound = now - std::chrono::seconds(5);
  supervisor_.Add(fresh, false);

  ConnectionInfo quiet_alive = fresh;
  quiet_alive.id = 2;
  quiet_alive.last_inbound = now - std::chrono::minutes(5);
  supervisor_.Add(quiet_alive, true);

  ConnectionInfo quiet_dead = quiet_alive;
  quiet_dead.id = 3;
  supervisor_.Add(quiet_dead, false);

  ConnectionInfo down = fresh;
  down.id = 4;
  down.state = ConnectionState::kDisconnected;
  supervisor_.Add(down, true);

  auto report = worker_->RunHealthCheck();
  EXPECT_EQ(report.total, 4u);
  EXPECT_EQ(report.healthy, 2u);
  EXPECT_EQ(report.unhealthy, 2u);
  EXPECT_EQ(report.batches, 2u);
  EXPECT_EQ(report.quick_probes, 2u);
  EXPECT_EQ(report.full_probes, 2u);
  EXPECT_DOUBLE_EQ(report.HealthRate(), 0.5);

  EXPECT_EQ(supervisor_.GetProbes(1), 0);
  EXPECT_EQ(supervisor_.GetProbes(2), 1);
  EXPECT_EQ(supervisor_.GetProbes(3), 3);
  EXPECT_EQ(supervisor_.GetProbes(4), 0);
  EXPECT_DOUBLE_EQ(metrics_.GetCount("health_check.batch"), 2.0);
}

TEST_F(RecoveryWorkerTest, HealthFollowsFailureThresholds) {
  RecoveryOptions options = FastOptions();
  options.max_attempts = 1;
  options.degraded_failure_count = 1;
  options.unhealthy_failure_count = 2;
  Create(options);
  source_->SetAlwaysFail(true);

  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kDegraded);  // not running
  worker_->Start();
  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kHealthy);

  ASSERT_TRUE(worker_->Submit(MakeGap(1, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kDegraded);

  ASSERT_TRUE(worker_->Submit(MakeGap(2, {"AAPL"}, 10000)));
  ASSERT_TRUE(worker_->WaitIdle(kWait));
  EXPECT_EQ(worker_->GetHealth(), RecoveryHealth::kUnhealthy);
}

TEST(RecoveryOptionsTest, FromConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({
    "recovery": {
      "max_window_ms": 120000,
      "max_attempts": 0,
      "providers": {"P2": {"max_window_ms": 30000}, "P3": {}}
    }
  })"));
  auto options = RecoveryOptions::FromConfig(config);
  EXPECT_EQ(options.max_window.count(), 120000);
  EXPECT_EQ(options.max_attempts, 1);
  EXPECT_EQ(options.MaxWindowFor("P2").count(), 30000);
  EXPECT_EQ(options.MaxWindowFor("P3").count(), 120000);
}
