#pragma once

#include <stdexcept>
#include <string>

namespace mdstream {
namespace engine {
namespace common {

enum class ErrorCode {
  kTransport,
  kAuth,
  kRateLimitExceeded,
  kRecoveryUnavailable,
  kCacheFetch,
  kConfigConflict,
  kFetchTimeout
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kTransport: return "TransportError";
    case ErrorCode::kAuth: return "AuthError";
    case ErrorCode::kRateLimitExceeded: return "RateLimitExceeded";
    case ErrorCode::kRecoveryUnavailable: return "RecoveryUnavailable";
    case ErrorCode::kCacheFetch: return "CacheFetchError";
    case ErrorCode::kConfigConflict: return "ConfigConflict";
    case ErrorCode::kFetchTimeout: return "FetchTimeout";
  }
  return "Unknown";
}

/**
 * @brief Base of all typed errors raised by mdstream components
 */
class MdStreamError : public std::runtime_error {
 public:
  MdStreamError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Connection-level failure; the supervisor reconnects.
class TransportError : public MdStreamError {
 public:
  explicit TransportError(const std::string& message)
      : MdStreamError(ErrorCode::kTransport, message) {}
};

// Credentials rejected by the provider. Never retried.
class AuthError : public MdStreamError {
 public:
  explicit AuthError(const std::string& message)
      : MdStreamError(ErrorCode::kAuth, message) {}
};

class RateLimitExceeded : public MdStreamError {
 public:
  explicit RateLimitExceeded(const std::string& message)
      : MdStreamError(ErrorCode::kRateLimitExceeded, message) {}
};

// History backend unreachable; the recovery worker degrades to batch health checks.
class RecoveryUnavailable : public MdStreamError {
 public:
  explicit RecoveryUnavailable(const std::string& message)
      : MdStreamError(ErrorCode::kRecoveryUnavailable, message) {}
};

class CacheFetchError : public MdStreamError {
 public:
  explicit CacheFetchError(const std::string& message)
      : MdStreamError(ErrorCode::kCacheFetch, message) {}
};

// Mutually exclusive flags enabled together. Fatal at startup.
class ConfigConflict : public MdStreamError {
 public:
  explicit ConfigConflict(const std::string& message)
      : MdStreamError(ErrorCode::kConfigConflict, message) {}
};

class FetchTimeout : public MdStreamError {
 public:
  explicit FetchTimeout(const std::string& message)
      : MdStreamError(ErrorCode::kFetchTimeout, message) {}
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
