#pragma once

#include "history_replay_source.hpp"
#include "engine/common/config_manager.hpp"
#include <chrono>
#include <string>

namespace mdstream {
namespace engine {
namespace streaming {

/**
 * @brief History backend over HTTP(S)
 *
 * Issues GET {base_url}/history?provider=&capability=&symbols=&from=&to=&limit=
 * and decodes {"ticks":[...]} (or a bare array) with TickJsonConverter.
 * One blocking request per Fetch(); safe to call from several threads.
 */
class HttpHistorySource : public HistoryReplaySource {
 public:
  struct Options {
    std::string base_url = "http://localhost:8090";
    std::chrono::milliseconds request_timeout{5000};
    bool tls_verify = true;

    // recovery.history.base_url / request_timeout_ms / tls_verify
    static Options FromConfig(const common::ConfigManager& config);
  };

  explicit HttpHistorySource(Options options);

  // Non-copyable, movable
  HttpHistorySource(const HttpHistorySource&) = delete;
  HttpHistorySource& operator=(const HttpHistorySource&) = delete;
  HttpHistorySource(HttpHistorySource&&) = default;
  HttpHistorySource& operator=(HttpHistorySource&&) = default;

  TickBatch Fetch(const ConnectionKey& key,
                  const std::vector<std::string>& symbols,
                  const RecoveryWindow& window) override;

  /** @brief Request target for a replay, exposed for logging and tests */
  static std::string BuildTarget(const std::string& base_path,
                                 const ConnectionKey& key,
                                 const std::vector<std::string>& symbols,
                                 const RecoveryWindow& window);

 private:
  Options options_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
