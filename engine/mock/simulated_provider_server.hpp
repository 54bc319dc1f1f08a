#pragma once

#include "simulated_provider.hpp"
#include "engine/common/rest_server.hpp"
#include "engine/streaming/tick.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mdstream {
namespace engine {
namespace mock {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class SimulatedProviderServer;

// One provider socket. All state is touched on the server's IO thread only.
class SimulatedProviderSession : public std::enable_shared_from_this<SimulatedProviderSession> {
 public:
  SimulatedProviderSession(tcp::socket socket, SimulatedProvider& provider, SimulatedProviderServer& server,
                           uint64_t session_id);

  void Run();
  // Thread-safe; both post onto the IO thread
  void PushTick(const streaming::Tick& tick);
  void Close();
  // Drops the provider listener and subscriptions; idempotent
  void Release();

 private:
  void OnAccept(beast::error_code ec);
  void DoRead();
  void OnRead(beast::error_code ec, std::size_t bytes_transferred);
  void HandleClientFrame(const std::string& text);
  void Send(std::string frame);
  void DoWrite();
  void OnWrite(beast::error_code ec, std::size_t bytes_transferred);

  websocket::stream<beast::tcp_stream> ws_;
  SimulatedProvider& provider_;
  SimulatedProviderServer& server_;
  const uint64_t session_id_;
  beast::flat_buffer buffer_;
  std::deque<std::string> write_queue_;
  std::set<std::string> symbols_;
  uint64_t sequence_ = 0;
  uint64_t listener_id_ = 0;
  bool authenticated_ = false;
  bool released_ = false;
};

/**
 * @brief Simulated market data provider
 *
 * WebSocket endpoint speaking the provider frame protocol (auth, subscribe,
 * unsubscribe, ping; tick, heartbeat, subscribed, auth, error) plus an HTTP
 * GET /history endpoint answering {"ticks": [...]}.
 *
 * Fault hooks drive reconnect, heartbeat and gap scenarios end to end.
 */
class SimulatedProviderServer {
 public:
  SimulatedProviderServer(SimulatedProvider& provider, std::string address,
                          uint16_t ws_port, uint16_t history_port);
  ~SimulatedProviderServer();

  // Non-copyable, non-movable
  SimulatedProviderServer(const SimulatedProviderServer&) = delete;
  SimulatedProviderServer& operator=(const SimulatedProviderServer&) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // Bound port, useful when started on port 0
  uint16_t GetWebSocketPort() const { return bound_ws_port_.load(); }
  size_t GetSessionCount() const;

  //=== Fault hooks ===
  // Closes every provider socket
  void DropAllSessions();
  // Paused sessions stop sending ticks and answering pings
  void SetPaused(bool paused) { paused_.store(paused); }
  bool IsPaused() const { return paused_.load(); }
  // The next tick sent on any session skips this many sequence numbers
  void InjectSequenceGap(uint64_t skipped) { pending_gap_.store(skipped); }
  uint64_t TakeSequenceGap() { return pending_gap_.exchange(0); }

  void HandleHistory(const common::HttpRequest& req, common::HttpResponse& resp);

 private:
  friend class SimulatedProviderSession;

  void AcceptLoop();
  void OnAccept(beast::error_code ec, tcp::socket socket);
  void RegisterSession(uint64_t id, std::weak_ptr<SimulatedProviderSession> session);
  void UnregisterSession(uint64_t id);

  SimulatedProvider& provider_;
  std::string address_;
  uint16_t ws_port_;
  uint16_t history_port_;
  std::atomic<uint16_t> bound_ws_port_{0};

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  common::RestServer history_server_;

  std::atomic<bool> paused_{false};
  std::atomic<uint64_t> pending_gap_{0};

  mutable std::mutex sessions_mutex_;
  std::map<uint64_t, std::weak_ptr<SimulatedProviderSession>> sessions_;
  std::atomic<uint64_t> next_session_id_{1};
};

}  // namespace mock
}  // namespace engine
}  // namespace mdstream
