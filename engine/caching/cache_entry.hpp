#pragma once

#include "compression.hpp"
#include "market_session.hpp"
#include "ttl_policy.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mdstream {
namespace engine {
namespace caching {

// Describes what is being cached so the tier manager can pick TTL,
// compression and the invalidation category.
struct MarketContext {
  std::string symbol;                        // market inferred from it when market is unset
  std::optional<Market> market;
  std::optional<MarketStatus> status;        // pinned status, bypasses the calendar
  DataKind kind = DataKind::kRealtime;
  CompressionProfile profile = CompressionProfile::kStreaming;
  std::optional<std::chrono::milliseconds> ttl_override;
  std::string category;                      // defaults to the key prefix before ':'
};

struct CacheEntry {
  std::string key;
  std::string data;              // stored form, zlib stream when compressed
  bool compressed = false;
  size_t original_size = 0;
  std::string category;
  MarketStatus status = MarketStatus::kMarketClosed;
  int64_t created_ms = 0;        // wall clock
  int64_t expires_ms = 0;
  std::chrono::milliseconds ttl{0};

  bool IsExpired(int64_t now_ms) const { return now_ms >= expires_ms; }
  std::chrono::milliseconds Remaining(int64_t now_ms) const {
    return std::chrono::milliseconds(expires_ms > now_ms ? expires_ms - now_ms : 0);
  }

  // Decompresses when needed; throws std::runtime_error on corrupt data
  std::string Value() const {
    return compressed ? CompressionPolicy::Decompress(data, original_size) : data;
  }
};

// "quote:AAPL" -> "quote"; keys without a separator have no category
inline std::string CategoryOf(const std::string& key) {
  const auto pos = key.find(':');
  return pos == std::string::npos ? std::string() : key.substr(0, pos);
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
