#include "http_history_source.hpp"
#include "tick_json_converter.hpp"
#include "engine/common/errors.hpp"
#include "engine/common/util.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace streaming {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Runs one async operation to completion on a private io_context
template <typename Initiate>
beast::error_code RunOp(net::io_context& ioc, Initiate&& initiate) {
  beast::error_code result;
  initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

template <typename Stream>
http::response<http::string_body> Exchange(net::io_context& ioc, Stream& stream,
                                           const http::request<http::string_body>& req,
                                           std::chrono::milliseconds timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  auto ec = RunOp(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
  if (ec) {
    throw common::TransportError("history request write failed: " + ec.message());
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::get_lowest_layer(stream).expires_after(timeout);
  ec = RunOp(ioc, [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });
  if (ec) {
    throw common::TransportError("history response read failed: " + ec.message());
  }
  return res;
}

}  // namespace

HttpHistorySource::Options HttpHistorySource::Options::FromConfig(const common::ConfigManager& config) {
  Options options;
  options.base_url = config.GetString("recovery.history.base_url", options.base_url);
  options.request_timeout = config.GetMilliseconds("recovery.history.request_timeout_ms", options.request_timeout);
  options.tls_verify = config.GetBool("recovery.history.tls_verify", options.tls_verify);
  return options;
}

HttpHistorySource::HttpHistorySource(Options options) : options_(std::move(options)) {}

std::string HttpHistorySource::BuildTarget(const std::string& base_path,
                                           const ConnectionKey& key,
                                           const std::vector<std::string>& symbols,
                                           const RecoveryWindow& window) {
  std::string target = base_path;
  while (!target.empty() && target.back() == '/') {
    target.pop_back();
  }
  target += "/history?provider=" + common::UrlEncode(key.provider_id);
  target += "&capability=" + common::UrlEncode(key.capability_id);
  target += "&symbols=" + common::UrlEncode(common::Join(symbols, ","));
  target += "&from=" + std::to_string(window.from_ms);
  target += "&to=" + std::to_string(window.to_ms);
  target += "&limit=" + std::to_string(window.max_points);
  return target;
}

TickBatch HttpHistorySource::Fetch(const ConnectionKey& key,
                                   const std::vector<std::string>& symbols,
                                   const RecoveryWindow& window) {
  auto url = common::ParseUrl(options_.base_url);
  std::string base_path = url.path;
  auto query = base_path.find('?');
  if (query != std::string::npos) {
    base_path = base_path.substr(0, query);
  }
  const std::string target = BuildTarget(base_path, key, symbols, window);

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::error_code ec;
  auto const results = resolver.resolve(url.host, url.port, ec);
  if (ec) {
    throw common::RecoveryUnavailable("history backend " + url.host + " not resolvable: " + ec.message());
  }

  http::request<http::string_body> req{http::verb::get, target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::accept, "application/json");

  http::response<http::string_body> res;
  if (url.IsSecure()) {
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(options_.tls_verify ? ssl::verify_peer : ssl::verify_none);

    ssl::stream<beast::tcp_stream> stream(ioc, ctx);
    SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str());

    beast::get_lowest_layer(stream).expires_after(options_.request_timeout);
    ec = RunOp(ioc, [&](auto handler) { beast::get_lowest_layer(stream).async_connect(results, std::move(handler)); });
    if (ec) {
      throw common::RecoveryUnavailable("history backend " + url.host + ":" + url.port + " unreachable: " + ec.message());
    }
    ec = RunOp(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });
    if (ec) {
      throw common::TransportError("history TLS handshake failed: " + ec.message());
    }

    res = Exchange(ioc, stream, req, options_.request_timeout);

    beast::error_code shutdown_ec;
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
    shutdown_ec = RunOp(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
    // Ignore "stream truncated" and "not connected" errors - these are harmless
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected && shutdown_ec != ssl::error::stream_truncated) {
      SPDLOG_DEBUG("HttpHistorySource: shutdown warning: {}", shutdown_ec.message());
    }
  } else {
    beast::tcp_stream stream(ioc);
    stream.expires_after(options_.request_timeout);
    ec = RunOp(ioc, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
    if (ec) {
      throw common::RecoveryUnavailable("history backend " + url.host + ":" + url.port + " unreachable: " + ec.message());
    }

    res = Exchange(ioc, stream, req, options_.request_timeout);

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
  }

  if (res.result() != http::status::ok) {
    SPDLOG_ERROR("HttpHistorySource: HTTP error {} for {}: {}",
                 static_cast<int>(res.result()), target, res.body());
    throw common::TransportError("history request failed with HTTP " +
                                 std::to_string(static_cast<int>(res.result())));
  }

  try {
    auto ticks = TickJsonConverter::BatchFromJson(res.body());
    SPDLOG_DEBUG("HttpHistorySource: {} ticks for {} [{}, {}]",
                 ticks.size(), key.ToString(), window.from_ms, window.to_ms);
    return ticks;
  } catch (const std::exception& e) {
    throw common::TransportError(std::string("history response malformed: ") + e.what());
  }
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
