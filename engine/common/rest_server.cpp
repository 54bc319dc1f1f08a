#include "rest_server.hpp"
#include "util.hpp"

#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace common {

void WriteJson(HttpResponse& resp, http::status status, const nlohmann::json& body) {
  resp.result(status);
  resp.set(http::field::content_type, "application/json");
  resp.body() = body.dump();
  resp.prepare_payload();
}

std::string GetQueryParam(const std::string& target, const std::string& name) {
  size_t query = target.find('?');
  if (query == std::string::npos) {
    return "";
  }
  size_t pos = query + 1;
  while (pos < target.size()) {
    size_t amp = target.find('&', pos);
    std::string pair = target.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    size_t eq = pair.find('=');
    if (eq != std::string::npos && pair.substr(0, eq) == name) {
      return UrlDecode(pair.substr(eq + 1));
    }
    if (amp == std::string::npos) break;
    pos = amp + 1;
  }
  return "";
}

RestServer::RestServer() : app_name_("mdstream") {
  start_time_ = std::chrono::steady_clock::now();
}

RestServer::~RestServer() {
  Stop();
}

bool RestServer::Start(const std::string& address, uint16_t port) {
  if (running_.exchange(true)) {
    return false;
  }

  should_stop_ = false;
  start_time_ = std::chrono::steady_clock::now();

  server_thread_ = std::thread(&RestServer::RunServer, this, address, port);
  SPDLOG_INFO("RestServer: starting on {}:{}", address, port);
  return true;
}

void RestServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  should_stop_ = true;

  // Cancel acceptor and stop io_context to interrupt the accept loop
  {
    std::lock_guard<std::mutex> lock(ioc_mutex_);
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->cancel(ec);
      acceptor_->close(ec);
    }
    if (ioc_) {
      ioc_->stop();
    }
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // Callbacks capture objects that are about to be destroyed
  metrics_callback_ = nullptr;
  status_callback_ = nullptr;
  health_callback_ = nullptr;
  stop_callback_ = nullptr;
  SPDLOG_INFO("RestServer: stopped");
}

void RestServer::RegisterHandler(const std::string& method, const std::string& path, HttpHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[method][path] = std::move(handler);
}

std::chrono::seconds RestServer::GetUptime() const {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
}

void RestServer::RunServer(const std::string& address, uint16_t port) {
  try {
    {
      std::lock_guard<std::mutex> lock(ioc_mutex_);
      ioc_ = std::make_shared<net::io_context>(1);
      auto endpoint = tcp::endpoint(net::ip::make_address(address), port);
      acceptor_ = std::make_shared<tcp::acceptor>(*ioc_, endpoint);
    }

    SPDLOG_INFO("RestServer: listening on {}:{}", address, port);
    StartAccept();

    // Exits when Stop() calls ioc_->stop()
    ioc_->run();
    SPDLOG_DEBUG("RestServer: io_context stopped");
  } catch (const std::exception& e) {
    SPDLOG_ERROR("RestServer: server error: {}", e.what());
    running_ = false;
  }

  std::lock_guard<std::mutex> lock(ioc_mutex_);
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }
  acceptor_.reset();
  ioc_.reset();
}

void RestServer::StartAccept() {
  if (should_stop_.load()) {
    return;
  }

  std::shared_ptr<net::io_context> ioc;
  std::shared_ptr<tcp::acceptor> acceptor;
  {
    std::lock_guard<std::mutex> lock(ioc_mutex_);
    if (!acceptor_ || !ioc_ || should_stop_.load()) {
      return;
    }
    ioc = ioc_;
    acceptor = acceptor_;
  }

  auto socket = std::make_shared<tcp::socket>(*ioc);
  acceptor->async_accept(*socket,
    [this, socket, ioc, acceptor](boost::system::error_code ec) {
      if (ec) {
        if (ec == boost::asio::error::operation_aborted) {
          SPDLOG_DEBUG("RestServer: accept cancelled");
        } else {
          SPDLOG_ERROR("RestServer: accept error: {}", ec.message());
        }
        return;
      }

      // Admin traffic is low volume; one short-lived thread per request
      std::thread([this, socket]() {
        try {
          beast::flat_buffer buffer;
          HttpRequest req;
          http::read(*socket, buffer, req);

          HttpResponse resp;
          resp.version(req.version());
          resp.keep_alive(false);
          HandleRequest(req, resp);

          http::write(*socket, resp);
          boost::system::error_code shutdown_ec;
          socket->shutdown(tcp::socket::shutdown_send, shutdown_ec);
        } catch (const std::exception& e) {
          SPDLOG_ERROR("RestServer: request error: {}", e.what());
        }
      }).detach();

      if (!should_stop_.load()) {
        StartAccept();
      }
    });
}

void RestServer::HandleRequest(const HttpRequest& req, HttpResponse& resp) {
  std::string method = std::string(req.method_string());
  std::string target = std::string(req.target());
  std::string path = target.substr(0, target.find('?'));

  try {
    if (DispatchCustom(method, target, req, resp)) {
      return;
    }

    if (path == "/health") {
      HandleHealth(resp);
    } else if (path == "/status") {
      HandleStatus(resp);
    } else if (path == "/metrics") {
      HandleMetrics(resp);
    } else if (path == "/admin/stop" && method == "POST") {
      HandleStop(resp);
    } else {
      WriteJson(resp, http::status::not_found, {{"status", "error"}, {"message", "Not found"}});
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("RestServer: handler for {} {} failed: {}", method, path, e.what());
    WriteJson(resp, http::status::internal_server_error,
              {{"status", "error"}, {"message", e.what()}});
  }
}

bool RestServer::DispatchCustom(const std::string& method, const std::string& target,
                                const HttpRequest& req, HttpResponse& resp) {
  HttpHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto method_it = handlers_.find(method);
    if (method_it == handlers_.end()) {
      return false;
    }

    // Exact match first, then prefix match for paths with parameters
    auto path_it = method_it->second.find(target.substr(0, target.find('?')));
    if (path_it != method_it->second.end()) {
      handler = path_it->second;
    } else {
      for (const auto& [registered_path, registered] : method_it->second) {
        if (target.length() > registered_path.length() &&
            target.compare(0, registered_path.length(), registered_path) == 0 &&
            (target[registered_path.length()] == '/' ||
             target[registered_path.length()] == '?')) {
          handler = registered;
          break;
        }
      }
    }
  }

  if (!handler) {
    return false;
  }
  handler(req, resp);
  return true;
}

void RestServer::HandleHealth(HttpResponse& resp) {
  std::string status = "healthy";
  auto callback = health_callback_;
  if (callback) {
    status = callback();
  }
  WriteJson(resp, status == "critical" ? http::status::service_unavailable : http::status::ok,
            {{"status", status}});
}

void RestServer::HandleStatus(HttpResponse& resp) {
  auto callback = status_callback_;
  WriteJson(resp, http::status::ok, callback ? callback() : GetDefaultStatus());
}

void RestServer::HandleMetrics(HttpResponse& resp) {
  nlohmann::json metrics_json;
  auto callback = metrics_callback_;
  if (callback) {
    metrics_json = callback();
  }
  metrics_json["uptime_seconds"] = GetUptime().count();
  WriteJson(resp, http::status::ok, metrics_json);
}

void RestServer::HandleStop(HttpResponse& resp) {
  WriteJson(resp, http::status::ok, {{"status", "ok"}, {"message", "Stop command received"}});

  auto callback = stop_callback_;
  if (callback) {
    callback();
  }
}

nlohmann::json RestServer::GetDefaultStatus() const {
  nlohmann::json status_json;
  status_json["app_name"] = app_name_;
  status_json["uptime_seconds"] = GetUptime().count();
  status_json["state"] = "running";
  return status_json;
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
