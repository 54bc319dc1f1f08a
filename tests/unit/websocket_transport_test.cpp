#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "engine/common/errors.hpp"
#include "engine/mock/simulated_provider.hpp"
#include "engine/mock/simulated_provider_server.hpp"
#include "engine/streaming/connection_supervisor.hpp"
#include "engine/streaming/websocket_transport.hpp"
#include "fake_transport.hpp"
#include "test_clock.hpp"

using namespace mdstream::engine::streaming;
using mdstream::engine::common::AuthError;
using mdstream::engine::common::TransportError;
using mdstream::engine::mock::SimulatedProvider;
using mdstream::engine::mock::SimulatedProviderOptions;
using mdstream::engine::mock::SimulatedProviderServer;
using mdstream::test::RecordingGapListener;
using mdstream::test::WaitUntil;

// Runs against a simulated provider on an ephemeral local port
class WebSocketTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SimulatedProviderOptions options;
    options.provider_id = "P1";
    options.api_key = "secret";
    options.tick_interval = std::chrono::milliseconds(10);
    provider_ = std::make_unique<SimulatedProvider>(options);
    server_ = std::make_unique<SimulatedProviderServer>(*provider_, "127.0.0.1", 0, 0);
    ASSERT_TRUE(server_->Start());
    provider_->Start();
  }

  void TearDown() override {
    if (transport_) {
      transport_->Close();
    }
    server_->Stop();
    provider_->Stop();
  }

  WebSocketTransport::Options TransportOptions(const std::string& api_key = "secret") {
    WebSocketTransport::Options options;
    options.url = "ws://127.0.0.1:" + std::to_string(server_->GetWebSocketPort()) + "/{capability}";
    options.api_key = api_key;
    return options;
  }

  void Open(const std::string& api_key = "secret") {
    transport_ = std::make_unique<WebSocketTransport>(key_, TransportOptions(api_key));
    TransportCallbacks callbacks;
    callbacks.on_tick = [this](const Tick& tick) {
      std::lock_guard<std::mutex> lock(mutex_);
      ticks_.push_back(tick);
    };
    callbacks.on_heartbeat = [this] { ++inbound_; };
    callbacks.on_closed = [this](const std::string&) { ++closed_; };
    callbacks.on_protocol_violation = [this](const std::string&) { ++violations_; };
    transport_->SetCallbacks(std::move(callbacks));
  }

  std::vector<Tick> Ticks() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
  }

  const ConnectionKey key_{"P1", "quote"};
  std::unique_ptr<SimulatedProvider> provider_;
  std::unique_ptr<SimulatedProviderServer> server_;
  std::unique_ptr<WebSocketTransport> transport_;

  std::mutex mutex_;
  std::vector<Tick> ticks_;
  std::atomic<int> inbound_{0};
  std::atomic<int> closed_{0};
  std::atomic<int> violations_{0};
};

TEST_F(WebSocketTransportTest, StreamsSubscribedSymbols) {
  Open();
  transport_->Connect(std::chrono::seconds(2));
  EXPECT_TRUE(transport_->IsConnected());
  ASSERT_TRUE(transport_->Subscribe({"AAPL"}));

  ASSERT_TRUE(WaitUntil([&] { return Ticks().size() >= 3; }));
  auto ticks = Ticks();
  for (size_t i = 0; i < ticks.size(); ++i) {
    EXPECT_EQ(ticks[i].symbol, "AAPL");
    EXPECT_EQ(ticks[i].sequence, i + 1);
  }
  EXPECT_EQ(server_->GetSessionCount(), 1u);
}

TEST_F(WebSocketTransportTest, HeartbeatIsAnswered) {
  Open();
  transport_->Connect(std::chrono::seconds(2));
  const int before = inbound_.load();
  ASSERT_TRUE(transport_->SendHeartbeat());
  EXPECT_TRUE(WaitUntil([&] { return inbound_.load() > before; }));
}

TEST_F(WebSocketTransportTest, InjectedGapSkipsSequenceNumbers) {
  Open();
  transport_->Connect(std::chrono::seconds(2));
  transport_->Subscribe({"AAPL"});
  ASSERT_TRUE(WaitUntil([&] { return !Ticks().empty(); }));

  server_->InjectSequenceGap(3);
  const size_t seen = Ticks().size();
  ASSERT_TRUE(WaitUntil([&] { return Ticks().size() > seen + 1; }));

  auto ticks = Ticks();
  bool skipped = false;
  for (size_t i = 1; i < ticks.size(); ++i) {
    if (ticks[i].sequence == ticks[i - 1].sequence + 4) {
      skipped = true;
    }
  }
  EXPECT_TRUE(skipped);
}

TEST_F(WebSocketTransportTest, DroppedSessionRaisesClosed) {
  Open();
  transport_->Connect(std::chrono::seconds(2));
  ASSERT_TRUE(WaitUntil([&] { return server_->GetSessionCount() == 1u; }));
  server_->DropAllSessions();
  EXPECT_TRUE(WaitUntil([&] { return closed_.load() == 1; }));
  EXPECT_FALSE(transport_->IsConnected());
}

TEST_F(WebSocketTransportTest, RejectedCredentialsAreAuthErrors) {
  Open("wrong");
  EXPECT_THROW(transport_->Connect(std::chrono::seconds(2)), AuthError);
  EXPECT_FALSE(transport_->IsConnected());
}

TEST_F(WebSocketTransportTest, ConnectFailuresAreTransportErrors) {
  auto options = TransportOptions();
  options.url = "http://127.0.0.1:1/";
  WebSocketTransport bad_scheme(key_, options);
  EXPECT_THROW(bad_scheme.Connect(std::chrono::milliseconds(500)), TransportError);

  options.url = "ws://127.0.0.1:1/";
  WebSocketTransport refused(key_, options);
  EXPECT_THROW(refused.Connect(std::chrono::milliseconds(500)), TransportError);
  EXPECT_FALSE(refused.SendHeartbeat());
}

TEST_F(WebSocketTransportTest, SupervisorReconnectsAfterProviderDrop) {
  SupervisorOptions options;
  options.reconnect_base_delay = std::chrono::milliseconds(20);
  options.reconnect_max_delay = std::chrono::milliseconds(100);
  options.run_heartbeat_ticker = false;

  RecordingGapListener gaps;
  std::atomic<int> ticks{0};
  ConnectionSupervisor supervisor(options, [this](const ConnectionKey& key) -> std::shared_ptr<ProviderTransport> {
    return std::make_shared<WebSocketTransport>(key, TransportOptions());
  }, nullptr);
  supervisor.SetGapListener(&gaps);
  supervisor.SetTickSink([&](ConnectionId, const ConnectionKey&, const Tick&) { ++ticks; });
  supervisor.Start();

  ASSERT_NE(supervisor.Subscribe("client-1", key_, {"AAPL", "MSFT"}), 0u);
  ASSERT_TRUE(supervisor.WaitForState(key_, ConnectionState::kConnected, std::chrono::seconds(2)));
  ASSERT_TRUE(WaitUntil([&] { return ticks.load() >= 4; }));
  EXPECT_EQ(provider_->GetActiveSymbols(), (std::vector<std::string>{"AAPL", "MSFT"}));

  server_->DropAllSessions();
  ASSERT_TRUE(WaitUntil([&] { return gaps.Count() >= 1; }, std::chrono::seconds(3)));
  ASSERT_TRUE(supervisor.WaitForState(key_, ConnectionState::kConnected, std::chrono::seconds(2)));
  EXPECT_EQ(gaps.GetReports().front().cause, GapReport::Cause::kReconnect);

  const int before = ticks.load();
  EXPECT_TRUE(WaitUntil([&] { return ticks.load() > before + 2; }));
  supervisor.Stop();
}
