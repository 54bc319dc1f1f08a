#pragma once

#include "tick.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

// Callbacks raised by a transport from its IO thread
struct TransportCallbacks {
  std::function<void(const Tick&)> on_tick;
  // Any inbound frame counts as liveness
  std::function<void()> on_heartbeat;
  std::function<void(const std::string& reason)> on_closed;
  std::function<void(const std::string& reason)> on_protocol_violation;
};

// Abstract capability-typed stream source for one provider link
//
// Connect() is blocking and runs on a worker thread. After a successful
// Connect() the transport delivers frames through the callbacks, in receipt
// order, until Close() or a transport-level failure (on_closed).
class ProviderTransport {
 public:
  explicit ProviderTransport(ConnectionKey key);
  virtual ~ProviderTransport() = default;

  // Non-copyable, non-movable
  ProviderTransport(const ProviderTransport&) = delete;
  ProviderTransport& operator=(const ProviderTransport&) = delete;

  // Must be called before Connect()
  void SetCallbacks(TransportCallbacks callbacks);

  // Handshake within timeout. Throws TransportError, or AuthError when the
  // provider rejects the credentials.
  virtual void Connect(std::chrono::milliseconds timeout) = 0;

  virtual bool Subscribe(const std::vector<std::string>& symbols) = 0;
  virtual bool Unsubscribe(const std::vector<std::string>& symbols) = 0;

  // Send a heartbeat/ping; false when the link is not writable
  virtual bool SendHeartbeat() = 0;

  // Idempotent; no callbacks are raised after Close() returns
  virtual void Close() = 0;

  virtual bool IsConnected() const = 0;

  const ConnectionKey& GetKey() const { return key_; }

 protected:
  void NotifyTick(const Tick& tick);
  void NotifyHeartbeat();
  void NotifyClosed(const std::string& reason);
  void NotifyProtocolViolation(const std::string& reason);

  // Suppresses callbacks; set by Close()
  std::atomic<bool> muted_{false};

 private:
  ConnectionKey key_;
  TransportCallbacks callbacks_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
