#include "connection_state.hpp"

namespace mdstream {
namespace engine {
namespace streaming {

const char* ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kIdle: return "Idle";
    case ConnectionState::kConnecting: return "Connecting";
    case ConnectionState::kConnected: return "Connected";
    case ConnectionState::kReconnecting: return "Reconnecting";
    case ConnectionState::kDisconnected: return "Disconnected";
    case ConnectionState::kError: return "Error";
    case ConnectionState::kClosed: return "Closed";
  }
  return "Unknown";
}

const char* ToString(ConnectionEvent event) {
  switch (event) {
    case ConnectionEvent::kSubscribeRequested: return "SubscribeRequested";
    case ConnectionEvent::kHandshakeSucceeded: return "HandshakeSucceeded";
    case ConnectionEvent::kHandshakeFailed: return "HandshakeFailed";
    case ConnectionEvent::kProtocolViolation: return "ProtocolViolation";
    case ConnectionEvent::kHeartbeatTimeout: return "HeartbeatTimeout";
    case ConnectionEvent::kTransportClosed: return "TransportClosed";
    case ConnectionEvent::kReconnectSucceeded: return "ReconnectSucceeded";
    case ConnectionEvent::kReconnectExhausted: return "ReconnectExhausted";
    case ConnectionEvent::kRetryAfterBackoff: return "RetryAfterBackoff";
    case ConnectionEvent::kFatalError: return "FatalError";
    case ConnectionEvent::kNoSubscribers: return "NoSubscribers";
  }
  return "Unknown";
}

std::optional<ConnectionState> NextState(ConnectionState state, ConnectionEvent event) {
  using S = ConnectionState;
  using E = ConnectionEvent;

  switch (state) {
    case S::kIdle:
      if (event == E::kSubscribeRequested) return S::kConnecting;
      break;
    case S::kConnecting:
      if (event == E::kHandshakeSucceeded) return S::kConnected;
      if (event == E::kHandshakeFailed || event == E::kProtocolViolation) return S::kError;
      break;
    case S::kConnected:
      if (event == E::kProtocolViolation) return S::kError;
      if (event == E::kHeartbeatTimeout || event == E::kTransportClosed) return S::kReconnecting;
      break;
    case S::kReconnecting:
      if (event == E::kReconnectSucceeded) return S::kConnected;
      if (event == E::kReconnectExhausted) return S::kDisconnected;
      break;
    case S::kError:
      if (event == E::kRetryAfterBackoff) return S::kReconnecting;
      if (event == E::kFatalError) return S::kClosed;
      break;
    case S::kDisconnected:
      if (event == E::kNoSubscribers) return S::kClosed;
      break;
    case S::kClosed:
      break;
  }
  return std::nullopt;
}

bool IsActive(ConnectionState state) {
  return state == ConnectionState::kConnecting || state == ConnectionState::kConnected ||
         state == ConnectionState::kReconnecting;
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
