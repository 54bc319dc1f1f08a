#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mdstream {
namespace engine {
namespace common {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// HTTP request handler type
using HttpHandler = std::function<void(const HttpRequest& req, HttpResponse& resp)>;

// Fill resp with a JSON body and status
void WriteJson(HttpResponse& resp, http::status status, const nlohmann::json& body);

// Value of a query parameter from a request target, empty if absent
std::string GetQueryParam(const std::string& target, const std::string& name);

// REST server for admin commands and state queries
//
// Built-in endpoints:
//   GET  /health      - {"status": "healthy"|"degraded"|"critical"}, 503 on critical
//   GET  /status      - status callback or uptime
//   GET  /metrics     - metrics callback or uptime
//   POST /admin/stop  - invokes stop callback
class RestServer {
 public:
  RestServer();
  ~RestServer();

  // Non-copyable, non-movable
  RestServer(const RestServer&) = delete;
  RestServer& operator=(const RestServer&) = delete;

  bool Start(const std::string& address, uint16_t port);
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // Register custom endpoint handler; registered paths also match as prefixes
  // followed by '/' or '?'
  void RegisterHandler(const std::string& method, const std::string& path, HttpHandler handler);

  std::chrono::seconds GetUptime() const;

  void SetAppName(const std::string& name) { app_name_ = name; }
  void SetMetricsCallback(std::function<nlohmann::json()> callback) { metrics_callback_ = std::move(callback); }
  void SetStatusCallback(std::function<nlohmann::json()> callback) { status_callback_ = std::move(callback); }
  void SetHealthCallback(std::function<std::string()> callback) { health_callback_ = std::move(callback); }
  void SetStopCallback(std::function<void()> callback) { stop_callback_ = std::move(callback); }

  // Route a request without a socket (used by tests and the accept loop)
  void HandleRequest(const HttpRequest& req, HttpResponse& resp);

 private:
  std::string app_name_;
  std::atomic<bool> running_{false};
  std::atomic<bool> should_stop_{false};
  std::thread server_thread_;
  std::chrono::steady_clock::time_point start_time_;

  // IO context and acceptor for interruptible shutdown
  std::shared_ptr<net::io_context> ioc_;
  std::shared_ptr<tcp::acceptor> acceptor_;
  std::mutex ioc_mutex_;

  // method -> path -> handler
  std::map<std::string, std::map<std::string, HttpHandler>> handlers_;
  std::mutex handlers_mutex_;

  std::function<nlohmann::json()> metrics_callback_;
  std::function<nlohmann::json()> status_callback_;
  std::function<std::string()> health_callback_;
  std::function<void()> stop_callback_;

  void RunServer(const std::string& address, uint16_t port);
  void StartAccept();
  bool DispatchCustom(const std::string& method, const std::string& target,
                      const HttpRequest& req, HttpResponse& resp);
  void HandleHealth(HttpResponse& resp);
  void HandleStatus(HttpResponse& resp);
  void HandleMetrics(HttpResponse& resp);
  void HandleStop(HttpResponse& resp);

  nlohmann::json GetDefaultStatus() const;
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
