#pragma once

#include <array>
#include <optional>

namespace mdstream {
namespace engine {
namespace streaming {

enum class ConnectionState {
  kIdle,
  kConnecting,
  kConnected,
  kReconnecting,
  kDisconnected,
  kError,
  kClosed
};

enum class ConnectionEvent {
  kSubscribeRequested,
  kHandshakeSucceeded,
  kHandshakeFailed,
  kProtocolViolation,
  kHeartbeatTimeout,
  kTransportClosed,
  kReconnectSucceeded,
  kReconnectExhausted,
  kRetryAfterBackoff,
  kFatalError,
  kNoSubscribers
};

constexpr std::array<ConnectionState, 7> kAllConnectionStates = {
    ConnectionState::kIdle,         ConnectionState::kConnecting, ConnectionState::kConnected,
    ConnectionState::kReconnecting, ConnectionState::kDisconnected, ConnectionState::kError,
    ConnectionState::kClosed};

constexpr std::array<ConnectionEvent, 11> kAllConnectionEvents = {
    ConnectionEvent::kSubscribeRequested, ConnectionEvent::kHandshakeSucceeded,
    ConnectionEvent::kHandshakeFailed,    ConnectionEvent::kProtocolViolation,
    ConnectionEvent::kHeartbeatTimeout,   ConnectionEvent::kTransportClosed,
    ConnectionEvent::kReconnectSucceeded, ConnectionEvent::kReconnectExhausted,
    ConnectionEvent::kRetryAfterBackoff,  ConnectionEvent::kFatalError,
    ConnectionEvent::kNoSubscribers};

const char* ToString(ConnectionState state);
const char* ToString(ConnectionEvent event);

// Transition table of the connection lifecycle. Returns nullopt when the event
// is not legal in the given state; callers must not change state in that case.
//
//   Idle          + SubscribeRequested              -> Connecting
//   Connecting    + HandshakeSucceeded              -> Connected
//   Connecting    + HandshakeFailed|ProtocolViolation -> Error
//   Connected     + ProtocolViolation               -> Error
//   Connected     + HeartbeatTimeout|TransportClosed -> Reconnecting
//   Reconnecting  + ReconnectSucceeded              -> Connected
//   Reconnecting  + ReconnectExhausted              -> Disconnected
//   Error         + RetryAfterBackoff               -> Reconnecting
//   Error         + FatalError                      -> Closed
//   Disconnected  + NoSubscribers                   -> Closed
std::optional<ConnectionState> NextState(ConnectionState state, ConnectionEvent event);

// True while the connection holds (or is acquiring) a live transport
bool IsActive(ConnectionState state);

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
