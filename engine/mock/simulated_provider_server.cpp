#include "simulated_provider_server.hpp"
#include "engine/common/util.hpp"
#include "engine/streaming/tick_json_converter.hpp"

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace mock {

namespace {

constexpr size_t kMaxQueuedFrames = 10000;

}  // namespace

//=============================================================================
// SimulatedProviderSession
//=============================================================================

SimulatedProviderSession::SimulatedProviderSession(tcp::socket socket, SimulatedProvider& provider,
                                                   SimulatedProviderServer& server, uint64_t session_id)
    : ws_(std::move(socket)), provider_(provider), server_(server), session_id_(session_id) {}

void SimulatedProviderSession::Run() {
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
    res.set(http::field::server, "mdstream-simulated-provider");
  }));
  ws_.async_accept(beast::bind_front_handler(&SimulatedProviderSession::OnAccept, shared_from_this()));
}

void SimulatedProviderSession::OnAccept(beast::error_code ec) {
  if (ec) {
    SPDLOG_ERROR("SimulatedProviderSession: accept error: {}", ec.message());
    Release();
    return;
  }
  ws_.text(true);
  std::weak_ptr<SimulatedProviderSession> weak = shared_from_this();
  listener_id_ = provider_.AddListener([weak](const streaming::Tick& tick) {
    if (auto session = weak.lock()) {
      session->PushTick(tick);
    }
  });
  SPDLOG_INFO("SimulatedProviderSession: session {} connected", session_id_);
  DoRead();
}

void SimulatedProviderSession::PushTick(const streaming::Tick& tick) {
  net::post(ws_.get_executor(), [self = shared_from_this(), tick = tick]() mutable {
    if (self->released_ || self->symbols_.count(tick.symbol) == 0 || self->server_.IsPaused()) {
      return;
    }
    self->sequence_ += 1 + self->server_.TakeSequenceGap();
    tick.sequence = self->sequence_;
    self->Send(streaming::TickJsonConverter::TickFrame(tick));
  });
}

void SimulatedProviderSession::Close() {
  net::post(ws_.get_executor(), [self = shared_from_this()] {
    if (self->released_) {
      return;
    }
    SPDLOG_INFO("SimulatedProviderSession: closing session {}", self->session_id_);
    self->Release();
    beast::error_code ec;
    beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(self->ws_).socket().close(ec);
  });
}

void SimulatedProviderSession::Release() {
  if (released_) {
    return;
  }
  released_ = true;
  if (listener_id_ != 0) {
    provider_.RemoveListener(listener_id_);
  }
  provider_.RemoveSymbols(std::vector<std::string>(symbols_.begin(), symbols_.end()));
  symbols_.clear();
  server_.UnregisterSession(session_id_);
}

void SimulatedProviderSession::DoRead() {
  ws_.async_read(buffer_, beast::bind_front_handler(&SimulatedProviderSession::OnRead, shared_from_this()));
}

void SimulatedProviderSession::OnRead(beast::error_code ec, std::size_t bytes_transferred) {
  if (ec) {
    if (ec == websocket::error::closed) {
      SPDLOG_INFO("SimulatedProviderSession: session {} closed by client", session_id_);
    } else if (!released_) {
      SPDLOG_WARN("SimulatedProviderSession: session {} read error: {}", session_id_, ec.message());
    }
    Release();
    return;
  }

  std::string text = beast::buffers_to_string(buffer_.data());
  buffer_.consume(bytes_transferred);
  HandleClientFrame(text);

  if (!released_) {
    DoRead();
  }
}

void SimulatedProviderSession::HandleClientFrame(const std::string& text) {
  nlohmann::json frame;
  try {
    frame = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    Send(streaming::TickJsonConverter::ErrorFrame("bad_request", e.what()));
    return;
  }
  const std::string op = frame.is_object() ? frame.value("op", "") : "";

  if (op == "ping") {
    if (!server_.IsPaused()) {
      Send(streaming::TickJsonConverter::HeartbeatFrame(frame.value("ts", int64_t{0})));
    }
    return;
  }

  if (op == "auth") {
    authenticated_ = provider_.CheckApiKey(frame.value("api_key", ""));
    Send(streaming::TickJsonConverter::AuthResultFrame(authenticated_));
    if (!authenticated_) {
      SPDLOG_WARN("SimulatedProviderSession: session {} rejected credentials", session_id_);
    }
    return;
  }

  if (!authenticated_ && !provider_.CheckApiKey("")) {
    Send(streaming::TickJsonConverter::ErrorFrame("auth", "not authenticated"));
    return;
  }

  if (op == "subscribe" || op == "unsubscribe") {
    std::vector<std::string> requested;
    if (frame.contains("symbols") && frame["symbols"].is_array()) {
      for (const auto& symbol : frame["symbols"]) {
        if (symbol.is_string() && !symbol.get<std::string>().empty()) {
          requested.push_back(symbol.get<std::string>());
        }
      }
    }

    std::vector<std::string> changed;
    for (const auto& symbol : requested) {
      const bool applied = op == "subscribe" ? symbols_.insert(symbol).second : symbols_.erase(symbol) > 0;
      if (applied) {
        changed.push_back(symbol);
      }
    }
    if (op == "subscribe") {
      provider_.AddSymbols(changed);
      Send(streaming::TickJsonConverter::SubscribedFrame(
          std::vector<std::string>(symbols_.begin(), symbols_.end())));
    } else {
      provider_.RemoveSymbols(changed);
    }
    SPDLOG_DEBUG("SimulatedProviderSession: session {} {} {} symbols", session_id_, op, changed.size());
    return;
  }

  Send(streaming::TickJsonConverter::ErrorFrame("unknown_op", "unsupported op '" + op + "'"));
}

void SimulatedProviderSession::Send(std::string frame) {
  if (released_) {
    return;
  }
  if (write_queue_.size() >= kMaxQueuedFrames) {
    SPDLOG_WARN("SimulatedProviderSession: session {} write queue full, dropping frame", session_id_);
    return;
  }
  write_queue_.push_back(std::move(frame));
  if (write_queue_.size() == 1) {
    DoWrite();
  }
}

void SimulatedProviderSession::DoWrite() {
  ws_.async_write(net::buffer(write_queue_.front()),
                  beast::bind_front_handler(&SimulatedProviderSession::OnWrite, shared_from_this()));
}

void SimulatedProviderSession::OnWrite(beast::error_code ec, std::size_t bytes_transferred) {
  if (ec) {
    if (!released_) {
      SPDLOG_WARN("SimulatedProviderSession: session {} write error: {}", session_id_, ec.message());
    }
    Release();
    return;
  }
  SPDLOG_TRACE("SimulatedProviderSession: session {} wrote {} bytes", session_id_, bytes_transferred);
  if (!write_queue_.empty()) {
    write_queue_.pop_front();
  }
  if (!write_queue_.empty()) {
    DoWrite();
  }
}

//=============================================================================
// SimulatedProviderServer
//=============================================================================

SimulatedProviderServer::SimulatedProviderServer(SimulatedProvider& provider, std::string address,
                                                 uint16_t ws_port, uint16_t history_port)
    : provider_(provider),
      address_(std::move(address)),
      ws_port_(ws_port),
      history_port_(history_port),
      acceptor_(ioc_) {
  history_server_.SetAppName("simulated-provider");
  history_server_.RegisterHandler("GET", "/history",
                                  [this](const common::HttpRequest& req, common::HttpResponse& resp) {
                                    HandleHistory(req, resp);
                                  });
}

SimulatedProviderServer::~SimulatedProviderServer() {
  Stop();
}

bool SimulatedProviderServer::Start() {
  if (running_.exchange(true)) {
    SPDLOG_WARN("SimulatedProviderServer: already running");
    return false;
  }

  beast::error_code ec;
  tcp::endpoint endpoint(net::ip::make_address(address_, ec), ws_port_);
  if (ec) {
    SPDLOG_ERROR("SimulatedProviderServer: invalid address {}: {}", address_, ec.message());
    running_ = false;
    return false;
  }

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      SPDLOG_WARN("SimulatedProviderServer: reuse_address failed: {}", ec.message());
      ec.clear();
    }
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    SPDLOG_ERROR("SimulatedProviderServer: failed to listen on {}:{}: {}", address_, ws_port_, ec.message());
    beast::error_code ignored;
    acceptor_.close(ignored);
    running_ = false;
    return false;
  }
  bound_ws_port_ = acceptor_.local_endpoint().port();

  if (history_port_ > 0) {
    history_server_.Start(address_, history_port_);
  }

  ioc_.restart();
  server_thread_ = std::thread([this]() {
    AcceptLoop();
    ioc_.run();
    SPDLOG_DEBUG("SimulatedProviderServer: io_context finished");
  });
  SPDLOG_INFO("SimulatedProviderServer: {} listening on ws://{}:{} (history port {})",
              provider_.GetProviderId(), address_, bound_ws_port_.load(), history_port_);
  return true;
}

void SimulatedProviderServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  history_server_.Stop();
  ioc_.stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  beast::error_code ec;
  acceptor_.close(ec);

  // IO thread is gone; release leftover sessions from here
  std::vector<std::shared_ptr<SimulatedProviderSession>> leftover;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [id, weak] : sessions_) {
      if (auto session = weak.lock()) {
        leftover.push_back(session);
      }
    }
  }
  for (auto& session : leftover) {
    session->Release();
  }
  SPDLOG_INFO("SimulatedProviderServer: stopped");
}

size_t SimulatedProviderServer::GetSessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

void SimulatedProviderServer::DropAllSessions() {
  std::vector<std::shared_ptr<SimulatedProviderSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [id, weak] : sessions_) {
      if (auto session = weak.lock()) {
        sessions.push_back(session);
      }
    }
  }
  SPDLOG_WARN("SimulatedProviderServer: dropping {} sessions", sessions.size());
  for (auto& session : sessions) {
    session->Close();
  }
}

void SimulatedProviderServer::AcceptLoop() {
  if (!running_.load()) {
    return;
  }
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    OnAccept(ec, std::move(socket));
    if (running_.load()) {
      AcceptLoop();
    }
  });
}

void SimulatedProviderServer::OnAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (running_.load()) {
      SPDLOG_ERROR("SimulatedProviderServer: accept error: {}", ec.message());
    }
    return;
  }
  const uint64_t id = next_session_id_.fetch_add(1);
  auto session = std::make_shared<SimulatedProviderSession>(std::move(socket), provider_, *this, id);
  RegisterSession(id, session);
  session->Run();
}

void SimulatedProviderServer::RegisterSession(uint64_t id, std::weak_ptr<SimulatedProviderSession> session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_[id] = std::move(session);
}

void SimulatedProviderServer::UnregisterSession(uint64_t id) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(id);
}

void SimulatedProviderServer::HandleHistory(const common::HttpRequest& req, common::HttpResponse& resp) {
  const std::string target(req.target());
  const std::string provider = common::GetQueryParam(target, "provider");
  if (!provider.empty() && provider != provider_.GetProviderId()) {
    common::WriteJson(resp, http::status::not_found,
                      {{"error", "unknown provider"}, {"provider", provider}});
    return;
  }

  const auto symbols = common::Split(common::GetQueryParam(target, "symbols"), ',');
  if (symbols.empty()) {
    common::WriteJson(resp, http::status::bad_request, {{"error", "symbols is required"}});
    return;
  }

  int64_t from_ms = 0;
  int64_t to_ms = 0;
  size_t limit = 1000;
  try {
    from_ms = std::stoll(common::GetQueryParam(target, "from"));
    to_ms = std::stoll(common::GetQueryParam(target, "to"));
    const std::string limit_param = common::GetQueryParam(target, "limit");
    if (!limit_param.empty()) {
      limit = static_cast<size_t>(std::stoull(limit_param));
    }
  } catch (const std::logic_error&) {
    common::WriteJson(resp, http::status::bad_request, {{"error", "from and to must be epoch milliseconds"}});
    return;
  }

  nlohmann::json ticks = nlohmann::json::array();
  for (const auto& tick : provider_.GetHistory(symbols, from_ms, to_ms, limit)) {
    ticks.push_back(streaming::TickJsonConverter::ToJsonObject(tick));
  }
  SPDLOG_DEBUG("SimulatedProviderServer: history [{}, {}] for {} symbols -> {} ticks",
               from_ms, to_ms, symbols.size(), ticks.size());
  common::WriteJson(resp, http::status::ok, {{"ticks", ticks}});
}

}  // namespace mock
}  // namespace engine
}  // namespace mdstream
