#include "websocket_transport.hpp"
#include "tick_json_converter.hpp"
#include "engine/common/errors.hpp"
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace streaming {

namespace http = boost::beast::http;

WebSocketTransport::Options WebSocketTransport::Options::FromConfig(
    const common::ConfigManager& config, const ConnectionKey& key) {
  const std::string prefix = "providers." + key.provider_id;
  Options options;
  options.url = common::ReplacePlaceholder(config.GetString(prefix + ".url", "ws://localhost:8089/{capability}"),
                                           "capability", key.capability_id);
  options.api_key = config.GetString(prefix + ".api_key", "");
  options.tls_verify = config.GetBool(prefix + ".tls_verify", true);
  options.max_pending_writes = static_cast<size_t>(config.GetInt(prefix + ".max_pending_writes", 1024));
  return options;
}

WebSocketTransport::WebSocketTransport(ConnectionKey key, Options options)
    : ProviderTransport(std::move(key)), options_(std::move(options)) {}

WebSocketTransport::~WebSocketTransport() {
  Close();
  if (io_thread_.joinable()) {
    // Close() from a callback leaves the IO thread to finish on its own
    if (io_thread_.get_id() == std::this_thread::get_id()) {
      io_thread_.detach();
    } else {
      io_thread_.join();
    }
  }
}

//=============================================================================
// Connect
//=============================================================================

void WebSocketTransport::Connect(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    throw common::TransportError("WebSocketTransport: " + GetKey().ToString() + " already connected");
  }

  url_ = common::ParseUrl(options_.url);
  if (url_.scheme != "ws" && url_.scheme != "wss") {
    throw common::TransportError("WebSocketTransport: unsupported URL scheme in " + options_.url);
  }

  const auto deadline = common::SteadyClock::now() + timeout;
  SPDLOG_DEBUG("WebSocketTransport: connecting {} to {}:{}{}",
               GetKey().ToString(), url_.host, url_.port, url_.path);

  try {
    CreateStreams();
    Handshake(timeout);
    if (!options_.api_key.empty()) {
      Authenticate(deadline);
    }
  } catch (const common::MdStreamError&) {
    ResetStreams();
    throw;
  } catch (const std::exception& e) {
    ResetStreams();
    throw common::TransportError("WebSocketTransport: " + GetKey().ToString() + " connect failed: " + e.what());
  }

  muted_ = false;
  StartIO();
  SPDLOG_INFO("WebSocketTransport: {} connected to {}:{}", GetKey().ToString(), url_.host, url_.port);
}

void WebSocketTransport::CreateStreams() {
  ioc_ = std::make_unique<net::io_context>(1);
  read_buffer_.clear();

  if (url_.IsSecure()) {
    ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tlsv12_client);
    ssl_ctx_->set_default_verify_paths();
    ssl_ctx_->set_verify_mode(options_.tls_verify ? ssl::verify_peer : ssl::verify_none);
    tls_ws_ = std::make_unique<TlsStream>(*ioc_, *ssl_ctx_);
    // SNI
    if (!SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), url_.host.c_str())) {
      throw common::TransportError("WebSocketTransport: failed to set SNI host " + url_.host);
    }
  } else {
    plain_ws_ = std::make_unique<PlainStream>(*ioc_);
  }
}

beast::tcp_stream& WebSocketTransport::LowestLayer() {
  if (tls_ws_) {
    return beast::get_lowest_layer(*tls_ws_);
  }
  return beast::get_lowest_layer(*plain_ws_);
}

void WebSocketTransport::RunUntil(const bool& done, common::SteadyClock::time_point deadline,
                                  const char* operation) {
  ioc_->restart();
  ioc_->run_until(deadline);
  if (done) {
    return;
  }

  // Abort outstanding operations and drain their handlers
  beast::error_code ec;
  LowestLayer().socket().close(ec);
  ioc_->restart();
  ioc_->poll();
  throw common::TransportError(std::string("WebSocketTransport: ") + operation + " timed out for " +
                               GetKey().ToString());
}

void WebSocketTransport::Handshake(std::chrono::milliseconds timeout) {
  bool done = false;
  beast::error_code result_ec;
  websocket::response_type upgrade_response;
  const std::string host_header = url_.host + ":" + url_.port;

  auto finish = [&done, &result_ec](beast::error_code ec) {
    result_ec = ec;
    done = true;
  };
  auto ws_handshake = [this, finish, &upgrade_response, host_header]() {
    WithStream([&](auto& ws) {
      ws.async_handshake(upgrade_response, host_header, url_.path, finish);
    });
  };

  tcp::resolver resolver(*ioc_);
  LowestLayer().expires_after(timeout);
  resolver.async_resolve(url_.host, url_.port,
      [this, finish, ws_handshake](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          finish(ec);
          return;
        }
        LowestLayer().async_connect(results,
            [this, finish, ws_handshake](beast::error_code ec, const tcp::endpoint&) {
              if (ec) {
                finish(ec);
                return;
              }
              if (tls_ws_) {
                tls_ws_->next_layer().async_handshake(ssl::stream_base::client,
                    [finish, ws_handshake](beast::error_code ec) {
                      if (ec) {
                        finish(ec);
                        return;
                      }
                      ws_handshake();
                    });
              } else {
                ws_handshake();
              }
            });
      });

  RunUntil(done, common::SteadyClock::now() + timeout, "handshake");

  if (result_ec) {
    auto status = upgrade_response.result();
    if (status == http::status::unauthorized || status == http::status::forbidden) {
      throw common::AuthError("WebSocketTransport: " + GetKey().ToString() + " upgrade rejected with " +
                              std::to_string(static_cast<int>(status)));
    }
    throw common::TransportError("WebSocketTransport: " + GetKey().ToString() + " handshake failed: " +
                                 result_ec.message());
  }

  // Handshake done; liveness is tracked by the supervisor heartbeat
  LowestLayer().expires_never();
  WithStream([this](auto& ws) {
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.text(true);
    ws.control_callback([this](websocket::frame_type, beast::string_view) {
      NotifyHeartbeat();
    });
  });
}

void WebSocketTransport::WriteBlocking(const std::string& frame, common::SteadyClock::time_point deadline) {
  bool done = false;
  beast::error_code result_ec;
  WithStream([&](auto& ws) {
    ws.async_write(net::buffer(frame), [&](beast::error_code ec, std::size_t) {
      result_ec = ec;
      done = true;
    });
  });
  RunUntil(done, deadline, "write");
  if (result_ec) {
    throw common::TransportError("WebSocketTransport: write failed: " + result_ec.message());
  }
}

std::string WebSocketTransport::ReadBlocking(common::SteadyClock::time_point deadline) {
  bool done = false;
  beast::error_code result_ec;
  WithStream([&](auto& ws) {
    ws.async_read(read_buffer_, [&](beast::error_code ec, std::size_t) {
      result_ec = ec;
      done = true;
    });
  });
  RunUntil(done, deadline, "read");
  if (result_ec) {
    throw common::TransportError("WebSocketTransport: read failed: " + result_ec.message());
  }
  std::string text = beast::buffers_to_string(read_buffer_.data());
  read_buffer_.consume(read_buffer_.size());
  return text;
}

void WebSocketTransport::Authenticate(common::SteadyClock::time_point deadline) {
  WriteBlocking(TickJsonConverter::AuthFrame(options_.api_key), deadline);

  // Providers may interleave heartbeats before the auth result
  while (true) {
    auto frame = TickJsonConverter::ParseFrame(ReadBlocking(deadline));
    if (frame.type == ProviderFrame::Type::kAuth) {
      if (frame.status == "ok") {
        SPDLOG_DEBUG("WebSocketTransport: {} authenticated", GetKey().ToString());
        return;
      }
      throw common::AuthError("WebSocketTransport: " + GetKey().ToString() + " credentials rejected");
    }
    if (frame.type == ProviderFrame::Type::kError) {
      if (frame.code == "auth") {
        throw common::AuthError("WebSocketTransport: " + GetKey().ToString() + " " + frame.message);
      }
      throw common::TransportError("WebSocketTransport: " + GetKey().ToString() + " error during auth: " +
                                   frame.message);
    }
  }
}

//=============================================================================
// IO loop
//=============================================================================

void WebSocketTransport::StartIO() {
  write_queue_.clear();
  pending_writes_ = 0;
  running_ = true;
  connected_ = true;
  ioc_->restart();
  work_guard_.emplace(net::make_work_guard(*ioc_));
  DoRead();
  io_thread_ = std::thread(&WebSocketTransport::RunIO, this);
}

void WebSocketTransport::RunIO() {
  try {
    ioc_->run();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("WebSocketTransport: IO thread for {} failed: {}", GetKey().ToString(), e.what());
    connected_ = false;
    if (running_.load()) {
      NotifyClosed(std::string("io error: ") + e.what());
    }
  }
  SPDLOG_DEBUG("WebSocketTransport: IO thread for {} exited", GetKey().ToString());
}

void WebSocketTransport::DoRead() {
  WithStream([this](auto& ws) {
    ws.async_read(read_buffer_, [this](beast::error_code ec, std::size_t bytes_transferred) {
      OnRead(ec, bytes_transferred);
    });
  });
}

void WebSocketTransport::OnRead(beast::error_code ec, std::size_t bytes_transferred) {
  if (ec) {
    connected_ = false;
    if (!running_.load()) {
      return;
    }
    std::string reason = ec == websocket::error::closed ? "closed by provider" : ec.message();
    SPDLOG_WARN("WebSocketTransport: {} read failed: {}", GetKey().ToString(), reason);
    NotifyClosed(reason);
    return;
  }

  std::string text = beast::buffers_to_string(read_buffer_.data());
  read_buffer_.consume(read_buffer_.size());
  SPDLOG_TRACE("WebSocketTransport: {} received {} bytes", GetKey().ToString(), bytes_transferred);

  HandleFrame(text);

  if (running_.load() && connected_.load()) {
    DoRead();
  }
}

void WebSocketTransport::HandleFrame(const std::string& text) {
  ProviderFrame frame;
  try {
    frame = TickJsonConverter::ParseFrame(text);
  } catch (const nlohmann::json::exception& e) {
    connected_ = false;
    NotifyProtocolViolation(std::string("malformed frame: ") + e.what());
    return;
  }

  NotifyHeartbeat();

  switch (frame.type) {
    case ProviderFrame::Type::kTick:
      NotifyTick(frame.tick);
      break;
    case ProviderFrame::Type::kError:
      connected_ = false;
      NotifyProtocolViolation("provider error " + frame.code + ": " + frame.message);
      break;
    case ProviderFrame::Type::kSubscribed:
      SPDLOG_DEBUG("WebSocketTransport: {} confirmed {} symbols", GetKey().ToString(), frame.symbols.size());
      break;
    case ProviderFrame::Type::kHeartbeat:
    case ProviderFrame::Type::kAuth:
    case ProviderFrame::Type::kUnknown:
      break;
  }
}

//=============================================================================
// Outbound
//=============================================================================

bool WebSocketTransport::QueueWrite(std::string frame) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!connected_.load() || !ioc_) {
    return false;
  }
  if (pending_writes_.load() >= options_.max_pending_writes) {
    SPDLOG_WARN("WebSocketTransport: {} write queue full ({})", GetKey().ToString(), options_.max_pending_writes);
    return false;
  }

  pending_writes_.fetch_add(1);
  net::post(*ioc_, [this, frame = std::move(frame)]() mutable {
    write_queue_.push_back(std::move(frame));
    if (write_queue_.size() == 1) {
      DoWrite();
    }
  });
  return true;
}

void WebSocketTransport::DoWrite() {
  WithStream([this](auto& ws) {
    ws.async_write(net::buffer(write_queue_.front()), [this](beast::error_code ec, std::size_t) {
      pending_writes_.fetch_sub(1);
      write_queue_.pop_front();
      if (ec) {
        // The read side observes the failure and reports the close
        SPDLOG_DEBUG("WebSocketTransport: {} write failed: {}", GetKey().ToString(), ec.message());
        pending_writes_.fetch_sub(write_queue_.size());
        write_queue_.clear();
        return;
      }
      if (!write_queue_.empty()) {
        DoWrite();
      }
    });
  });
}

bool WebSocketTransport::Subscribe(const std::vector<std::string>& symbols) {
  if (symbols.empty()) return true;
  return QueueWrite(TickJsonConverter::SubscribeFrame(GetKey().capability_id, symbols));
}

bool WebSocketTransport::Unsubscribe(const std::vector<std::string>& symbols) {
  if (symbols.empty()) return true;
  return QueueWrite(TickJsonConverter::UnsubscribeFrame(GetKey().capability_id, symbols));
}

bool WebSocketTransport::SendHeartbeat() {
  return QueueWrite(TickJsonConverter::PingFrame(common::ToEpochMillis(common::WallClock::now())));
}

//=============================================================================
// Close
//=============================================================================

void WebSocketTransport::ShutdownStream() {
  // Runs on the IO thread
  auto close_socket = [this]() {
    beast::error_code ec;
    LowestLayer().socket().shutdown(tcp::socket::shutdown_both, ec);
    LowestLayer().socket().close(ec);
  };

  bool is_open = false;
  WithStream([&](auto& ws) { is_open = ws.is_open(); });
  // A close frame cannot be sent while a write is in flight
  if (!is_open || !write_queue_.empty()) {
    close_socket();
    return;
  }

  WithStream([this, close_socket](auto& ws) {
    websocket::stream_base::timeout opt{std::chrono::seconds(1), websocket::stream_base::none(), false};
    ws.set_option(opt);
    ws.async_close(websocket::close_code::normal, [close_socket](beast::error_code) {
      close_socket();
    });
  });
}

void WebSocketTransport::Close() {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  muted_ = true;
  connected_ = false;

  if (!running_.exchange(false)) {
    return;
  }

  net::post(*ioc_, [this]() { ShutdownStream(); });
  work_guard_.reset();

  if (io_thread_.get_id() == std::this_thread::get_id()) {
    // Called from a callback; the destructor joins
    return;
  }

  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  ResetStreams();
  SPDLOG_DEBUG("WebSocketTransport: {} closed", GetKey().ToString());
}

void WebSocketTransport::ResetStreams() {
  plain_ws_.reset();
  tls_ws_.reset();
  ssl_ctx_.reset();
  work_guard_.reset();
  ioc_.reset();
  read_buffer_.clear();
  write_queue_.clear();
  pending_writes_ = 0;
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
