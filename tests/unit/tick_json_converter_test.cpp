#include <gtest/gtest.h>
#include "engine/streaming/tick_json_converter.hpp"
#include <nlohmann/json.hpp>

using namespace mdstream::engine::streaming;

class TickJsonConverterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tick_.symbol = "AAPL";
    tick_.sequence = 42;
    tick_.last_price = 189.5;
    tick_.bid_price = 189.49;
    tick_.ask_price = 189.51;
    tick_.volume = 1200;
    tick_.timestamp_ms = 1767225600000;
  }

  Tick tick_;
};

TEST_F(TickJsonConverterTest, BasicConversion) {
  nlohmann::json json_obj = nlohmann::json::parse(TickJsonConverter::ToJson(tick_));

  EXPECT_EQ(json_obj["symbol"], "AAPL");
  EXPECT_EQ(json_obj["seq"], 42);
  EXPECT_DOUBLE_EQ(json_obj["last"].get<double>(), 189.5);
  EXPECT_EQ(json_obj["ts"], 1767225600000);
  // Live ticks omit the flag
  EXPECT_FALSE(json_obj.contains("recovered"));

  tick_.recovered = true;
  EXPECT_TRUE(TickJsonConverter::ToJsonObject(tick_)["recovered"].get<bool>());
}

TEST_F(TickJsonConverterTest, ParseToleratesMissingOptionalFields) {
  auto tick = TickJsonConverter::FromJsonObject(nlohmann::json{{"symbol", "MSFT"}, {"last", 410.0}});
  ASSERT_TRUE(tick.has_value());
  EXPECT_EQ(tick->symbol, "MSFT");
  EXPECT_EQ(tick->sequence, 0u);
  EXPECT_DOUBLE_EQ(tick->bid_price, 0.0);
  EXPECT_FALSE(tick->recovered);
}

TEST_F(TickJsonConverterTest, ParseRejectsMalformedTicks) {
  EXPECT_FALSE(TickJsonConverter::FromJsonObject(nlohmann::json{{"last", 1.0}}).has_value());
  EXPECT_FALSE(TickJsonConverter::FromJsonObject(nlohmann::json{{"symbol", ""}}).has_value());
  EXPECT_FALSE(TickJsonConverter::FromJsonObject(nlohmann::json{{"symbol", 7}}).has_value());
  EXPECT_FALSE(TickJsonConverter::FromJsonObject(nlohmann::json{{"symbol", "A"}, {"last", "1.0"}}).has_value());
  EXPECT_FALSE(TickJsonConverter::FromJsonObject(nlohmann::json::array()).has_value());
}

TEST_F(TickJsonConverterTest, BatchSkipsBadItems) {
  Tick other = tick_;
  other.symbol = "MSFT";
  other.sequence = 43;
  auto text = TickJsonConverter::BatchToJson({tick_, other});

  auto ticks = TickJsonConverter::BatchFromJson(text);
  ASSERT_EQ(ticks.size(), 2u);
  EXPECT_EQ(ticks[1].symbol, "MSFT");
  EXPECT_EQ(ticks[1].sequence, 43u);

  auto wrapped = TickJsonConverter::BatchFromJson(
      R"({"ticks": [{"symbol": "AAPL", "last": 1.0, "ts": 5}, {"symbol": ""}, {"nope": true}]})");
  ASSERT_EQ(wrapped.size(), 1u);
  EXPECT_EQ(wrapped[0].timestamp_ms, 5);
}

TEST_F(TickJsonConverterTest, BatchThrowsOnMalformedInput) {
  EXPECT_THROW(TickJsonConverter::BatchFromJson("not json"), std::exception);
  EXPECT_THROW(TickJsonConverter::BatchFromJson(R"({"data": []})"), std::exception);
  EXPECT_THROW(TickJsonConverter::BatchFromJson(R"("text")"), std::exception);
}

TEST_F(TickJsonConverterTest, ParseProviderFrames) {
  auto tick_frame = TickJsonConverter::ParseFrame(TickJsonConverter::TickFrame(tick_));
  EXPECT_EQ(tick_frame.type, ProviderFrame::Type::kTick);
  EXPECT_EQ(tick_frame.tick.symbol, "AAPL");
  EXPECT_EQ(tick_frame.tick.sequence, 42u);

  auto heartbeat = TickJsonConverter::ParseFrame(TickJsonConverter::HeartbeatFrame(99));
  EXPECT_EQ(heartbeat.type, ProviderFrame::Type::kHeartbeat);
  EXPECT_EQ(heartbeat.timestamp_ms, 99);
  EXPECT_EQ(TickJsonConverter::ParseFrame(R"({"type":"pong","ts":1})").type, ProviderFrame::Type::kHeartbeat);

  auto subscribed = TickJsonConverter::ParseFrame(TickJsonConverter::SubscribedFrame({"AAPL", "MSFT"}));
  EXPECT_EQ(subscribed.type, ProviderFrame::Type::kSubscribed);
  EXPECT_EQ(subscribed.symbols, (std::vector<std::string>{"AAPL", "MSFT"}));

  auto denied = TickJsonConverter::ParseFrame(TickJsonConverter::AuthResultFrame(false));
  EXPECT_EQ(denied.type, ProviderFrame::Type::kAuth);
  EXPECT_EQ(denied.status, "denied");

  auto error = TickJsonConverter::ParseFrame(TickJsonConverter::ErrorFrame("rate_limited", "slow down"));
  EXPECT_EQ(error.type, ProviderFrame::Type::kError);
  EXPECT_EQ(error.code, "rate_limited");
  EXPECT_EQ(error.message, "slow down");

  EXPECT_EQ(TickJsonConverter::ParseFrame(R"({"type":"tick","symbol":""})").type, ProviderFrame::Type::kUnknown);
  EXPECT_EQ(TickJsonConverter::ParseFrame("[1,2]").type, ProviderFrame::Type::kUnknown);
  EXPECT_THROW(TickJsonConverter::ParseFrame("{"), nlohmann::json::exception);
}

TEST_F(TickJsonConverterTest, ClientFrames) {
  auto subscribe = nlohmann::json::parse(TickJsonConverter::SubscribeFrame("quote", {"AAPL"}));
  EXPECT_EQ(subscribe["op"], "subscribe");
  EXPECT_EQ(subscribe["capability"], "quote");
  EXPECT_EQ(subscribe["symbols"][0], "AAPL");

  EXPECT_EQ(nlohmann::json::parse(TickJsonConverter::UnsubscribeFrame("quote", {}))["op"], "unsubscribe");
  EXPECT_EQ(nlohmann::json::parse(TickJsonConverter::AuthFrame("k"))["api_key"], "k");
  EXPECT_EQ(nlohmann::json::parse(TickJsonConverter::PingFrame(7))["ts"], 7);
}
