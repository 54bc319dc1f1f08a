#include "tick_json_converter.hpp"

#include <stdexcept>

namespace mdstream {
namespace engine {
namespace streaming {

nlohmann::json TickJsonConverter::ToJsonObject(const Tick& tick) {
  nlohmann::json json_obj;
  json_obj["symbol"] = tick.symbol;
  json_obj["seq"] = tick.sequence;
  json_obj["last"] = tick.last_price;
  json_obj["bid"] = tick.bid_price;
  json_obj["ask"] = tick.ask_price;
  json_obj["volume"] = tick.volume;
  json_obj["ts"] = tick.timestamp_ms;
  if (tick.recovered) {
    json_obj["recovered"] = true;
  }
  return json_obj;
}

std::string TickJsonConverter::ToJson(const Tick& tick) {
  return ToJsonObject(tick).dump();
}

std::optional<Tick> TickJsonConverter::FromJsonObject(const nlohmann::json& json_obj) {
  if (!json_obj.is_object() || !json_obj.contains("symbol") || !json_obj["symbol"].is_string()) {
    return std::nullopt;
  }

  Tick tick;
  tick.symbol = json_obj["symbol"].get<std::string>();
  if (tick.symbol.empty()) {
    return std::nullopt;
  }

  auto number = [&json_obj](const char* name, double fallback) -> std::optional<double> {
    auto it = json_obj.find(name);
    if (it == json_obj.end() || it->is_null()) return fallback;
    if (!it->is_number()) return std::nullopt;
    return it->get<double>();
  };

  auto last = number("last", 0.0);
  auto bid = number("bid", 0.0);
  auto ask = number("ask", 0.0);
  auto volume = number("volume", 0.0);
  if (!last || !bid || !ask || !volume) {
    return std::nullopt;
  }
  tick.last_price = *last;
  tick.bid_price = *bid;
  tick.ask_price = *ask;
  tick.volume = *volume;
  tick.sequence = json_obj.value("seq", uint64_t{0});
  tick.timestamp_ms = json_obj.value("ts", int64_t{0});
  tick.recovered = json_obj.value("recovered", false);
  return tick;
}

std::string TickJsonConverter::BatchToJson(const TickBatch& ticks) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& tick : ticks) {
    array.push_back(ToJsonObject(tick));
  }
  return array.dump();
}

TickBatch TickJsonConverter::BatchFromJson(const std::string& text) {
  auto json_obj = nlohmann::json::parse(text);
  // History responses wrap the array as {"ticks": [...]}
  const nlohmann::json& array = json_obj.is_object() ? json_obj.at("ticks") : json_obj;
  if (!array.is_array()) {
    throw std::invalid_argument("tick batch is not an array");
  }

  TickBatch ticks;
  ticks.reserve(array.size());
  for (const auto& item : array) {
    if (auto tick = FromJsonObject(item)) {
      ticks.push_back(std::move(*tick));
    }
  }
  return ticks;
}

ProviderFrame TickJsonConverter::ParseFrame(const std::string& text) {
  auto json_obj = nlohmann::json::parse(text);
  ProviderFrame frame;
  if (!json_obj.is_object()) {
    return frame;
  }

  std::string type = json_obj.value("type", "");
  frame.timestamp_ms = json_obj.value("ts", int64_t{0});

  if (type == "tick") {
    auto tick = FromJsonObject(json_obj);
    if (tick) {
      frame.type = ProviderFrame::Type::kTick;
      frame.tick = std::move(*tick);
    }
  } else if (type == "heartbeat" || type == "pong") {
    frame.type = ProviderFrame::Type::kHeartbeat;
  } else if (type == "subscribed") {
    frame.type = ProviderFrame::Type::kSubscribed;
    if (json_obj.contains("symbols") && json_obj["symbols"].is_array()) {
      for (const auto& symbol : json_obj["symbols"]) {
        if (symbol.is_string()) frame.symbols.push_back(symbol.get<std::string>());
      }
    }
  } else if (type == "auth") {
    frame.type = ProviderFrame::Type::kAuth;
    frame.status = json_obj.value("status", "");
  } else if (type == "error") {
    frame.type = ProviderFrame::Type::kError;
    frame.code = json_obj.value("code", "");
    frame.message = json_obj.value("message", "");
  }
  return frame;
}

std::string TickJsonConverter::TickFrame(const Tick& tick) {
  auto json_obj = ToJsonObject(tick);
  json_obj["type"] = "tick";
  return json_obj.dump();
}

std::string TickJsonConverter::HeartbeatFrame(int64_t timestamp_ms) {
  return nlohmann::json{{"type", "heartbeat"}, {"ts", timestamp_ms}}.dump();
}

std::string TickJsonConverter::AuthFrame(const std::string& api_key) {
  return nlohmann::json{{"op", "auth"}, {"api_key", api_key}}.dump();
}

std::string TickJsonConverter::AuthResultFrame(bool accepted) {
  return nlohmann::json{{"type", "auth"}, {"status", accepted ? "ok" : "denied"}}.dump();
}

std::string TickJsonConverter::SubscribeFrame(const std::string& capability,
                                              const std::vector<std::string>& symbols) {
  return nlohmann::json{{"op", "subscribe"}, {"capability", capability}, {"symbols", symbols}}.dump();
}

std::string TickJsonConverter::UnsubscribeFrame(const std::string& capability,
                                                const std::vector<std::string>& symbols) {
  return nlohmann::json{{"op", "unsubscribe"}, {"capability", capability}, {"symbols", symbols}}.dump();
}

std::string TickJsonConverter::SubscribedFrame(const std::vector<std::string>& symbols) {
  return nlohmann::json{{"type", "subscribed"}, {"symbols", symbols}}.dump();
}

std::string TickJsonConverter::PingFrame(int64_t timestamp_ms) {
  return nlohmann::json{{"op", "ping"}, {"ts", timestamp_ms}}.dump();
}

std::string TickJsonConverter::ErrorFrame(const std::string& code, const std::string& message) {
  return nlohmann::json{{"type", "error"}, {"code", code}, {"message", message}}.dump();
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
