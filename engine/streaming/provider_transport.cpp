#include "provider_transport.hpp"

#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace streaming {

ProviderTransport::ProviderTransport(ConnectionKey key) : key_(std::move(key)) {}

void ProviderTransport::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void ProviderTransport::NotifyTick(const Tick& tick) {
  if (muted_.load() || !callbacks_.on_tick) return;
  try {
    callbacks_.on_tick(tick);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ProviderTransport: tick callback for {} failed: {}", key_.ToString(), e.what());
  }
}

void ProviderTransport::NotifyHeartbeat() {
  if (muted_.load() || !callbacks_.on_heartbeat) return;
  callbacks_.on_heartbeat();
}

void ProviderTransport::NotifyClosed(const std::string& reason) {
  if (muted_.exchange(true)) return;
  SPDLOG_DEBUG("ProviderTransport: {} closed: {}", key_.ToString(), reason);
  if (callbacks_.on_closed) {
    callbacks_.on_closed(reason);
  }
}

void ProviderTransport::NotifyProtocolViolation(const std::string& reason) {
  if (muted_.exchange(true)) return;
  SPDLOG_WARN("ProviderTransport: {} protocol violation: {}", key_.ToString(), reason);
  if (callbacks_.on_protocol_violation) {
    callbacks_.on_protocol_violation(reason);
  }
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
