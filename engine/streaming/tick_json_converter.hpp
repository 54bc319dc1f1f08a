#pragma once

#include "tick.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

// Decoded provider frame
struct ProviderFrame {
  enum class Type { kTick, kHeartbeat, kSubscribed, kAuth, kError, kUnknown };

  Type type = Type::kUnknown;
  Tick tick;                          // kTick
  std::vector<std::string> symbols;   // kSubscribed
  std::string status;                 // kAuth: "ok" | "denied"
  std::string code;                   // kError
  std::string message;                // kError
  int64_t timestamp_ms = 0;
};

/**
 * @brief Converts ticks to and from the JSON used on provider sockets,
 *        history responses and cache payloads
 *
 * Tick object:
 * {
 *   "symbol": "AAPL", "seq": 42, "last": 189.5, "bid": 189.49,
 *   "ask": 189.51, "volume": 1200, "ts": 1700000000000, "recovered": false
 * }
 *
 * Provider frames carry a "type" field: "tick" (tick fields inline),
 * "heartbeat", "pong", "subscribed", "auth", "error".
 * Client frames carry an "op" field: "auth", "subscribe", "unsubscribe", "ping".
 *
 * All methods are static (stateless converter).
 */
class TickJsonConverter {
 public:
  static nlohmann::json ToJsonObject(const Tick& tick);
  static std::string ToJson(const Tick& tick);

  /** @brief Parse a tick object; nullopt if symbol or price fields are malformed */
  static std::optional<Tick> FromJsonObject(const nlohmann::json& json_obj);

  static std::string BatchToJson(const TickBatch& ticks);
  /** @brief Parse a JSON array (or {"ticks": [...]}); throws std::exception on malformed input */
  static TickBatch BatchFromJson(const std::string& text);

  /** @brief Decode a provider frame; throws nlohmann::json::exception on invalid JSON */
  static ProviderFrame ParseFrame(const std::string& text);

  //=== Frame encoders ===
  static std::string TickFrame(const Tick& tick);
  static std::string HeartbeatFrame(int64_t timestamp_ms);
  static std::string AuthFrame(const std::string& api_key);
  static std::string AuthResultFrame(bool accepted);
  static std::string SubscribeFrame(const std::string& capability, const std::vector<std::string>& symbols);
  static std::string UnsubscribeFrame(const std::string& capability, const std::vector<std::string>& symbols);
  static std::string SubscribedFrame(const std::vector<std::string>& symbols);
  static std::string PingFrame(int64_t timestamp_ms);
  static std::string ErrorFrame(const std::string& code, const std::string& message);
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
