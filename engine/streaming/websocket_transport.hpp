#pragma once

#include "provider_transport.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/time_source.hpp"
#include "engine/common/util.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mdstream {
namespace engine {
namespace streaming {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Provider link over WebSocket (ws:// or wss://) carrying JSON frames
//
// One io_context and IO thread per transport. Inbound frames are decoded on
// the IO thread and delivered synchronously, which keeps receipt order.
// Outbound frames are queued onto the IO thread.
class WebSocketTransport : public ProviderTransport {
 public:
  struct Options {
    std::string url;              // "{capability}" is replaced with the capability id
    std::string api_key;          // sent as an auth frame after the handshake when set
    bool tls_verify = true;
    size_t max_pending_writes = 1024;

    // providers.<id>.url / api_key / tls_verify / max_pending_writes
    static Options FromConfig(const common::ConfigManager& config, const ConnectionKey& key);
  };

  WebSocketTransport(ConnectionKey key, Options options);
  ~WebSocketTransport() override;

  void Connect(std::chrono::milliseconds timeout) override;
  bool Subscribe(const std::vector<std::string>& symbols) override;
  bool Unsubscribe(const std::vector<std::string>& symbols) override;
  bool SendHeartbeat() override;
  void Close() override;
  bool IsConnected() const override { return connected_.load(); }

 private:
  using PlainStream = websocket::stream<beast::tcp_stream>;
  using TlsStream = websocket::stream<ssl::stream<beast::tcp_stream>>;

  beast::tcp_stream& LowestLayer();
  template <typename Fn>
  void WithStream(Fn&& fn) {
    if (tls_ws_) {
      fn(*tls_ws_);
    } else {
      fn(*plain_ws_);
    }
  }

  void CreateStreams();
  void Handshake(std::chrono::milliseconds timeout);
  void Authenticate(common::SteadyClock::time_point deadline);
  void WriteBlocking(const std::string& frame, common::SteadyClock::time_point deadline);
  std::string ReadBlocking(common::SteadyClock::time_point deadline);
  void RunUntil(const bool& done, common::SteadyClock::time_point deadline, const char* operation);
  void StartIO();
  void RunIO();
  void DoRead();
  void OnRead(beast::error_code ec, std::size_t bytes_transferred);
  void HandleFrame(const std::string& text);
  bool QueueWrite(std::string frame);
  void DoWrite();
  void ShutdownStream();
  void ResetStreams();

  Options options_;
  common::ParsedUrl url_;

  std::unique_ptr<net::io_context> ioc_;
  std::unique_ptr<ssl::context> ssl_ctx_;
  std::unique_ptr<PlainStream> plain_ws_;
  std::unique_ptr<TlsStream> tls_ws_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
  std::thread io_thread_;

  beast::flat_buffer read_buffer_;
  std::deque<std::string> write_queue_;   // IO thread only
  std::atomic<size_t> pending_writes_{0};

  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
