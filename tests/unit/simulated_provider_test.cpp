#include <gtest/gtest.h>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/common/errors.hpp"
#include "engine/mock/simulated_provider.hpp"
#include "engine/mock/simulated_provider_server.hpp"
#include "engine/streaming/http_history_source.hpp"
#include "test_clock.hpp"

using namespace mdstream::engine::mock;
using mdstream::engine::common::HttpRequest;
using mdstream::engine::common::HttpResponse;
using mdstream::engine::common::RecoveryUnavailable;
using mdstream::engine::streaming::ConnectionKey;
using mdstream::engine::streaming::HttpHistorySource;
using mdstream::engine::streaming::RecoveryWindow;
using mdstream::test::ManualClock;

class SimulatedProviderTest : public ::testing::Test {
 protected:
  SimulatedProviderOptions Options() {
    SimulatedProviderOptions options;
    options.provider_id = "P1";
    options.history_capacity = 3;
    return options;
  }

  ManualClock clock_;
};

TEST_F(SimulatedProviderTest, GeneratedTicksAreRecorded) {
  SimulatedProvider provider(Options(), clock_.WallSource());
  auto tick = provider.GenerateTick("AAPL");
  EXPECT_EQ(tick.symbol, "AAPL");
  EXPECT_GT(tick.last_price, 0.0);
  EXPECT_LT(tick.bid_price, tick.ask_price);
  EXPECT_EQ(tick.timestamp_ms, 1767225600000);

  auto history = provider.GetHistory({"AAPL"}, 0, 1767225600000, 10);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_DOUBLE_EQ(history[0].last_price, tick.last_price);
}

TEST_F(SimulatedProviderTest, HistoryIsWindowedSortedAndCapped) {
  SimulatedProvider provider(Options(), clock_.WallSource());
  const int64_t start = 1767225600000;
  for (int i = 0; i < 5; ++i) {
    provider.GenerateTick("AAPL");
    clock_.Advance(std::chrono::milliseconds(10));
    provider.GenerateTick("MSFT");
    clock_.Advance(std::chrono::milliseconds(10));
  }

  // Capacity 3 keeps the last three per symbol
  auto all = provider.GetHistory({"AAPL", "MSFT"}, start, start + 1000, 0);
  ASSERT_EQ(all.size(), 6u);
  EXPECT_EQ(all.front().timestamp_ms, start + 40);
  for (size_t i = 1; i < all.size(); ++i) {
    EXPECT_LE(all[i - 1].timestamp_ms, all[i].timestamp_ms);
  }

  auto window = provider.GetHistory({"AAPL"}, start + 60, start + 80, 0);
  ASSERT_EQ(window.size(), 2u);
  EXPECT_EQ(window[0].timestamp_ms, start + 60);

  EXPECT_EQ(provider.GetHistory({"AAPL", "MSFT"}, start, start + 1000, 4).size(), 4u);
  EXPECT_TRUE(provider.GetHistory({"TSLA"}, start, start + 1000, 0).empty());
}

TEST_F(SimulatedProviderTest, SymbolsAreReferenceCounted) {
  SimulatedProvider provider(Options(), clock_.WallSource());
  provider.AddSymbols({"AAPL", "MSFT"});
  provider.AddSymbols({"AAPL"});
  provider.RemoveSymbols({"AAPL", "MSFT"});
  EXPECT_EQ(provider.GetActiveSymbols(), std::vector<std::string>{"AAPL"});
  provider.RemoveSymbols({"AAPL", "AAPL"});
  EXPECT_TRUE(provider.GetActiveSymbols().empty());
}

TEST_F(SimulatedProviderTest, PriceFixtureAndApiKey) {
  auto options = Options();
  options.price_volatility = 1e-9;
  options.api_key = "secret";
  SimulatedProvider provider(options, clock_.WallSource());

  EXPECT_TRUE(provider.LoadPriceFixture(R"({"AAPL": 189.5, "BAD": -1, "TEXT": "x"})"));
  EXPECT_NEAR(provider.GenerateTick("AAPL").last_price, 189.5, 1e-3);
  EXPECT_NEAR(provider.GenerateTick("BAD").last_price, 100.0, 1e-3);
  EXPECT_FALSE(provider.LoadPriceFixture("[1, 2]"));
  EXPECT_FALSE(provider.LoadPriceFixture("{"));
  EXPECT_FALSE(provider.LoadPriceFixtureFromFile("/nonexistent/prices.json"));

  EXPECT_TRUE(provider.CheckApiKey("secret"));
  EXPECT_FALSE(provider.CheckApiKey(""));
}

TEST_F(SimulatedProviderTest, ListenersReceiveTicksForActiveSymbols) {
  auto options = Options();
  options.tick_interval = std::chrono::milliseconds(5);
  SimulatedProvider provider(options);

  std::mutex mutex;
  std::vector<std::string> seen;
  auto id = provider.AddListener([&](const mdstream::engine::streaming::Tick& tick) {
    std::lock_guard<std::mutex> lock(mutex);
    seen.push_back(tick.symbol);
  });
  provider.AddSymbols({"AAPL"});
  provider.Start();
  ASSERT_TRUE(mdstream::test::WaitUntil([&] {
    std::lock_guard<std::mutex> lock(mutex);
    return seen.size() >= 3;
  }));
  provider.RemoveListener(id);
  provider.Stop();

  std::lock_guard<std::mutex> lock(mutex);
  for (const auto& symbol : seen) {
    EXPECT_EQ(symbol, "AAPL");
  }
}

//=============================================================================
// History endpoint
//=============================================================================

class HistoryEndpointTest : public SimulatedProviderTest {
 protected:
  HttpResponse Get(const std::string& target) {
    HttpRequest req{mdstream::engine::common::http::verb::get, target, 11};
    HttpResponse resp;
    server_.HandleHistory(req, resp);
    return resp;
  }

  SimulatedProvider provider_{Options(), clock_.WallSource()};
  SimulatedProviderServer server_{provider_, "127.0.0.1", 0, 0};
};

TEST_F(HistoryEndpointTest, ServesRequestedWindow) {
  provider_.GenerateTick("AAPL");
  provider_.GenerateTick("MSFT");
  provider_.GenerateTick("TSLA");

  RecoveryWindow window{1767225600000 - 1000, 1767225600000, 10};
  auto resp = Get(HttpHistorySource::BuildTarget("/", {"P1", "quote"}, {"AAPL", "MSFT"}, window));
  ASSERT_EQ(resp.result_int(), 200u);
  auto body = nlohmann::json::parse(resp.body());
  ASSERT_EQ(body["ticks"].size(), 2u);
  EXPECT_EQ(body["ticks"][0]["ts"], 1767225600000);
}

TEST_F(HistoryEndpointTest, RejectsBadRequests) {
  EXPECT_EQ(Get("/history?provider=P2&symbols=AAPL&from=0&to=1").result_int(), 404u);
  EXPECT_EQ(Get("/history?provider=P1&from=0&to=1").result_int(), 400u);
  EXPECT_EQ(Get("/history?symbols=AAPL&from=abc&to=1").result_int(), 400u);
  EXPECT_EQ(Get("/history?symbols=AAPL&to=1").result_int(), 400u);
}

TEST(HttpHistorySourceTest, BuildTargetEncodesParameters) {
  RecoveryWindow window{1000, 2000, 50};
  EXPECT_EQ(HttpHistorySource::BuildTarget("/api/", {"P 1", "quote"}, {"AAPL", "BRK.B"}, window),
            "/api/history?provider=P%201&capability=quote&symbols=AAPL%2CBRK.B&from=1000&to=2000&limit=50");
  EXPECT_EQ(HttpHistorySource::BuildTarget("", {"P1", "quote"}, {}, window),
            "/history?provider=P1&capability=quote&symbols=&from=1000&to=2000&limit=50");
}

TEST(HttpHistorySourceTest, UnreachableBackendIsRecoveryUnavailable) {
  HttpHistorySource::Options options;
  options.base_url = "http://127.0.0.1:1";
  options.request_timeout = std::chrono::milliseconds(500);
  HttpHistorySource source(options);
  EXPECT_THROW(source.Fetch({"P1", "quote"}, {"AAPL"}, RecoveryWindow{0, 1, 10}), RecoveryUnavailable);
}
