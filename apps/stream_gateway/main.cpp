/**
 * @file stream_gateway/main.cpp
 * @brief Market data streaming gateway
 *
 * Supervises provider connections, fills data gaps from provider history,
 * and fans ticks out to remote consumers:
 * - gRPC TickStream.StreamTicks for live ticks
 * - REST snapshot endpoint backed by the market-aware tiered cache
 * - REST admin endpoints for legacy delivery rollback and removal
 *
 * Configuration: config/stream_gateway.json
 *
 * Usage:
 *   ./stream_gateway --config_file=config/stream_gateway.json
 *
 * REST API:
 *   GET  /connections
 *   GET  /recovery
 *   GET  /snapshot?provider=P1&capability=quote&symbol=AAPL
 *   GET  /cache/stats
 *   POST /cache/invalidate?pattern=quote:*
 *   GET  /admin/legacy/readiness
 *   POST /admin/legacy/enable?reason=...
 *   POST /admin/legacy/close?reason=...
 *   POST /admin/legacy/ack?operator=...
 */

#include "engine/caching/cache_tier_manager.hpp"
#include "engine/caching/market_session.hpp"
#include "engine/caching/smart_cache_orchestrator.hpp"
#include "engine/caching/ttl_policy.hpp"
#include "engine/caching/warm_store.hpp"
#include "engine/common/application_kernel.hpp"
#include "engine/common/errors.hpp"
#include "engine/common/grpc_server.hpp"
#include "engine/streaming/broadcast_router.hpp"
#include "engine/streaming/connection_supervisor.hpp"
#include "engine/streaming/feature_flags.hpp"
#include "engine/streaming/http_history_source.hpp"
#include "engine/streaming/provider_transport_factory.hpp"
#include "engine/streaming/rate_limited_history_source.hpp"
#include "engine/streaming/rate_limiter.hpp"
#include "engine/streaming/recovery_worker.hpp"
#include "engine/streaming/tick_json_converter.hpp"
#include "engine/streaming/tick_stream_service.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

using namespace mdstream::engine::common;
using namespace mdstream::engine::streaming;
namespace caching = mdstream::engine::caching;

/**
 * @brief Gateway application using ApplicationKernel
 *
 * Lifecycle:
 * 1. OnInitialize: build the pipeline from config, register REST handlers
 * 2. OnStart: start supervisor, router (validates flags), recovery, cache, gRPC
 * 3. OnStop: stop in reverse order
 */
class StreamGatewayApp : public ApplicationKernel {
 public:
  StreamGatewayApp() {
    SetAppName("stream_gateway");
  }

 protected:
  std::map<std::string, std::string> GetEnvironmentOverrides() const override {
    return {
        {"MDSTREAM_GRPC_ADDRESS", "grpc.address"},
        {"MDSTREAM_REST_PORT", "app.rest_port"},
        {"MDSTREAM_LOG_LEVEL", "app.log.level"},
        {"MDSTREAM_HISTORY_URL", "recovery.history.base_url"},
        {"MDSTREAM_GATEWAY_ONLY_MODE", "feature_flags.gateway_only_mode"},
        {"MDSTREAM_STRICT_MODE", "feature_flags.strict_mode"},
        {"MDSTREAM_ALLOW_LEGACY_FALLBACK", "feature_flags.allow_legacy_fallback"},
    };
  }

  void OnInitialize() override {
    auto& config = GetConfig();

    rate_limiter_ = std::make_unique<RateLimiter>(RateLimitBudget{}, DefaultTimeSource(), &GetMetrics());
    rate_limiter_->LoadFromConfig(config);

    supervisor_ = std::make_unique<ConnectionSupervisor>(
        SupervisorOptions::FromConfig(config),
        [this](const ConnectionKey& key) {
          return ProviderTransportFactory::GetInstance().Create(key, GetConfig());
        },
        rate_limiter_.get(), &GetMetrics());

    flags_ = std::make_shared<FeatureFlagSet>(FeatureFlagConfig::FromConfig(config), &GetMetrics());
    router_ = std::make_unique<BroadcastRouter>(flags_, *supervisor_);

    history_source_ = std::make_shared<HttpHistorySource>(HttpHistorySource::Options::FromConfig(config));
    recovery_ = std::make_unique<RecoveryWorker>(
        RecoveryOptions::FromConfig(config), history_source_, supervisor_.get(),
        rate_limiter_.get(), &GetMetrics());
    recovery_->SetReplaySink([this](ConnectionId connection_id, const ConnectionKey&, const TickBatch& batch) {
      router_->OnTicks(connection_id, batch);
    });

    supervisor_->SetTickSink([this](ConnectionId connection_id, const ConnectionKey&, const Tick& tick) {
      router_->OnTick(connection_id, tick);
    });
    supervisor_->SetGapListener(recovery_.get());

    const int max_queue_depth = std::max(1, config.GetInt("grpc.max_queue_depth", 10000));
    tick_service_ = std::make_unique<TickStreamServiceImpl>(*router_, static_cast<size_t>(max_queue_depth));
    grpc_address_ = config.GetString("grpc.address", "0.0.0.0:50061");

    auto calendar = std::make_shared<caching::MarketSessionCalendar>();
    calendar->LoadFromConfig(config);
    cache_ = std::make_unique<caching::CacheTierManager>(
        caching::CacheTierOptions::FromConfig(config),
        std::make_shared<caching::InMemoryWarmStore>(),
        calendar, caching::TtlPolicy::FromConfig(config), &GetMetrics());
    orchestrator_ = std::make_unique<caching::SmartCacheOrchestrator>(
        *cache_, caching::OrchestratorOptions::FromConfig(config), &GetMetrics());
    snapshot_lookback_ms_ = config.GetInt64("cache.snapshot_lookback_ms", 60000);
    // Snapshot fetches go through the same per-provider budget as recovery
    snapshot_source_ = std::make_shared<RateLimitedHistorySource>(
        history_source_, *rate_limiter_,
        config.GetMilliseconds("cache.snapshot_permit_timeout_ms", std::chrono::milliseconds(2000)));

    RegisterRoutes();
  }

  void OnStart() override {
    supervisor_->Start();
    // Throws ConfigConflict on conflicting flags; Run() then exits non-zero
    router_->Start();
    recovery_->Start();
    orchestrator_->Start();

    if (!grpc_server_.Start(grpc_address_, tick_service_.get())) {
      throw std::runtime_error("Failed to start gRPC server on " + grpc_address_);
    }
    SPDLOG_INFO("StreamGatewayApp: serving ticks on {} in {} mode",
                grpc_address_, ToString(router_->GetDeliveryMode()));
  }

  void OnStop() override {
    // Cancel streams before the server drains active RPCs
    if (tick_service_) {
      tick_service_->Stop();
    }
    grpc_server_.Stop();
    if (orchestrator_) {
      orchestrator_->Stop();
    }
    if (recovery_) {
      recovery_->Stop();
    }
    if (router_) {
      router_->Stop();
    }
    if (supervisor_) {
      supervisor_->Stop();
    }
  }

  std::string GetHealthStatus() const override {
    if (!flags_ || !recovery_) {
      return "healthy";
    }
    const FlagHealth flag_health = flags_->GetHealthStatus();
    const RecoveryHealth recovery_health = recovery_->GetHealth();
    if (flag_health == FlagHealth::kCritical || recovery_health == RecoveryHealth::kUnhealthy) {
      return "critical";
    }
    if (flag_health == FlagHealth::kDegraded || recovery_health == RecoveryHealth::kDegraded) {
      return "degraded";
    }
    return "healthy";
  }

 private:
  void RegisterRoutes() {
    auto& rest = GetRestServer();

    rest.RegisterHandler("GET", "/connections", [this](const HttpRequest&, HttpResponse& resp) {
      nlohmann::json connections = nlohmann::json::array();
      for (const auto& info : supervisor_->GetConnections()) {
        nlohmann::json item;
        item["id"] = info.id;
        item["provider"] = info.key.provider_id;
        item["capability"] = info.key.capability_id;
        item["state"] = ToString(info.state);
        item["symbols"] = info.symbols;
        item["active_symbols"] = info.active_symbols;
        item["consumers"] = info.consumer_count;
        item["last_sequence"] = info.last_sequence;
        item["reconnect_attempts"] = info.reconnect_attempts;
        item["grace_pending"] = info.grace_pending;
        if (!info.last_error.empty()) {
          item["last_error"] = info.last_error;
        }
        connections.push_back(item);
      }
      nlohmann::json body;
      body["connections"] = connections;
      body["router"] = router_->GetStats().ToJson();
      WriteJson(resp, http::status::ok, body);
    });

    rest.RegisterHandler("GET", "/recovery", [this](const HttpRequest&, HttpResponse& resp) {
      nlohmann::json body = recovery_->GetMetrics().ToJson();
      body["health"] = ToString(recovery_->GetHealth());
      body["degraded"] = recovery_->IsDegraded();
      WriteJson(resp, http::status::ok, body);
    });

    rest.RegisterHandler("GET", "/snapshot", [this](const HttpRequest& req, HttpResponse& resp) {
      HandleSnapshot(req, resp);
    });

    rest.RegisterHandler("GET", "/cache/stats", [this](const HttpRequest&, HttpResponse& resp) {
      nlohmann::json body = cache_->GetStats().ToJson();
      body["in_flight"] = orchestrator_->GetInFlightCount();
      body["refreshing"] = orchestrator_->GetRefreshingCount();
      body["fetches"] = orchestrator_->GetFetchCount();
      body["refreshes"] = orchestrator_->GetRefreshCount();
      WriteJson(resp, http::status::ok, body);
    });

    rest.RegisterHandler("POST", "/cache/invalidate", [this](const HttpRequest& req, HttpResponse& resp) {
      const std::string pattern = GetQueryParam(std::string(req.target()), "pattern");
      if (pattern.empty()) {
        WriteJson(resp, http::status::bad_request, {{"error", "Missing pattern parameter"}});
        return;
      }
      const size_t removed = cache_->Invalidate(pattern);
      WriteJson(resp, http::status::ok, {{"pattern", pattern}, {"removed", removed}});
    });

    rest.RegisterHandler("GET", "/admin/legacy/readiness", [this](const HttpRequest&, HttpResponse& resp) {
      const LegacyReadiness readiness = router_->IsReadyForLegacyRemoval();
      nlohmann::json body;
      body["ready"] = readiness.ready;
      body["reason"] = readiness.reason;
      body["mode"] = ToString(router_->GetDeliveryMode());
      body["gateway_error_rate"] = flags_->GetGatewayErrorRate();
      body["acknowledged"] = flags_->IsLegacyRemovalAcknowledged();
      WriteJson(resp, http::status::ok, body);
    });

    rest.RegisterHandler("POST", "/admin/legacy/enable", [this](const HttpRequest& req, HttpResponse& resp) {
      const std::string reason = GetQueryParam(std::string(req.target()), "reason");
      if (reason.empty()) {
        WriteJson(resp, http::status::bad_request, {{"error", "Missing reason parameter"}});
        return;
      }
      try {
        const bool changed = router_->EmergencyEnableLegacy(reason);
        WriteJson(resp, http::status::ok,
                  {{"changed", changed}, {"mode", ToString(router_->GetDeliveryMode())}});
      } catch (const ConfigConflict& e) {
        WriteJson(resp, http::status::conflict, {{"error", e.what()}});
      }
    });

    rest.RegisterHandler("POST", "/admin/legacy/close", [this](const HttpRequest& req, HttpResponse& resp) {
      const std::string reason = GetQueryParam(std::string(req.target()), "reason");
      if (reason.empty()) {
        WriteJson(resp, http::status::bad_request, {{"error", "Missing reason parameter"}});
        return;
      }
      const bool changed = router_->CloseEmergencyOverride(reason);
      WriteJson(resp, http::status::ok,
                {{"changed", changed}, {"mode", ToString(router_->GetDeliveryMode())}});
    });

    rest.RegisterHandler("POST", "/admin/legacy/ack", [this](const HttpRequest& req, HttpResponse& resp) {
      const std::string operator_id = GetQueryParam(std::string(req.target()), "operator");
      if (operator_id.empty()) {
        WriteJson(resp, http::status::bad_request, {{"error", "Missing operator parameter"}});
        return;
      }
      router_->GetFlags().AcknowledgeLegacyRemoval(operator_id);
      WriteJson(resp, http::status::ok, {{"acknowledged", true}, {"operator", operator_id}});
    });
  }

  // Latest tick for one symbol, read through the cache from provider history
  void HandleSnapshot(const HttpRequest& req, HttpResponse& resp) {
    const std::string target(req.target());
    ConnectionKey key{GetQueryParam(target, "provider"), GetQueryParam(target, "capability")};
    const std::string symbol = GetQueryParam(target, "symbol");
    if (key.provider_id.empty() || key.capability_id.empty() || symbol.empty()) {
      WriteJson(resp, http::status::bad_request,
                {{"error", "provider, capability and symbol are required"}});
      return;
    }

    caching::GetOptions options;
    options.context.symbol = symbol;
    options.context.kind = caching::DataKind::kRealtime;

    // Owns its captures; may run again on a refresh worker
    auto source = snapshot_source_;
    const int64_t lookback_ms = snapshot_lookback_ms_;
    caching::FetchFn fetch = [source, key, symbol, lookback_ms]() {
      RecoveryWindow window;
      window.to_ms = ToEpochMillis(WallClock::now());
      window.from_ms = window.to_ms - lookback_ms;
      window.max_points = 1000;
      TickBatch ticks = source->Fetch(key, {symbol}, window);
      if (ticks.empty()) {
        throw std::runtime_error("no ticks for " + symbol + " on " + key.ToString());
      }
      const auto latest = std::max_element(ticks.begin(), ticks.end(), [](const Tick& a, const Tick& b) {
        return a.timestamp_ms < b.timestamp_ms;
      });
      return TickJsonConverter::ToJson(*latest);
    };

    const std::string cache_key = key.capability_id + ":" + key.provider_id + ":" + symbol;
    try {
      const caching::CacheResult result = orchestrator_->GetOrCompute(cache_key, std::move(fetch), options);
      nlohmann::json body;
      body["tick"] = nlohmann::json::parse(result.value);
      body["stale"] = result.stale;
      body["source"] = caching::ToString(result.source);
      body["ttl_ms"] = result.ttl.count();
      WriteJson(resp, http::status::ok, body);
    } catch (const FetchTimeout& e) {
      WriteJson(resp, http::status::gateway_timeout, {{"error", e.what()}});
    } catch (const CacheFetchError& e) {
      WriteJson(resp, http::status::bad_gateway, {{"error", e.what()}});
    } catch (const nlohmann::json::exception& e) {
      WriteJson(resp, http::status::internal_server_error, {{"error", e.what()}});
    }
  }

  std::unique_ptr<RateLimiter> rate_limiter_;
  std::unique_ptr<ConnectionSupervisor> supervisor_;
  std::shared_ptr<FeatureFlagSet> flags_;
  std::unique_ptr<BroadcastRouter> router_;
  std::shared_ptr<HttpHistorySource> history_source_;
  std::shared_ptr<RateLimitedHistorySource> snapshot_source_;
  std::unique_ptr<RecoveryWorker> recovery_;
  std::unique_ptr<TickStreamServiceImpl> tick_service_;
  std::unique_ptr<caching::CacheTierManager> cache_;
  std::unique_ptr<caching::SmartCacheOrchestrator> orchestrator_;
  GrpcServer grpc_server_;
  std::string grpc_address_;
  int64_t snapshot_lookback_ms_ = 60000;
};

int main(int argc, char** argv) {
  StreamGatewayApp app;
  return app.Run(argc, argv);
}
