#pragma once

#include <string>
#include <vector>

namespace mdstream {
namespace engine {
namespace common {

// Parsed ws/wss/http/https URL components
struct ParsedUrl {
  std::string scheme;  // "ws", "wss", "http", "https"
  std::string host;
  std::string port;
  std::string path;    // includes query string, "/" if absent

  bool IsSecure() const { return scheme == "wss" || scheme == "https"; }
};

// Parse a URL into its components
// Example: "wss://stream.example.com:9443/ws/quotes?token=abc"
//   -> scheme="wss", host="stream.example.com", port="9443", path="/ws/quotes?token=abc"
//
// Missing port defaults to 443 for secure schemes, 80 otherwise. A URL
// without "://" is treated as a bare host.
ParsedUrl ParseUrl(const std::string& url);

// Percent-encode a query parameter value
std::string UrlEncode(const std::string& value);

// Decode %XX escapes and '+'; malformed escapes are kept verbatim
std::string UrlDecode(const std::string& value);

std::vector<std::string> Split(const std::string& text, char separator);

// Join strings with a separator
std::string Join(const std::vector<std::string>& parts, const std::string& separator);

// Replace every "{name}" placeholder occurrence with value
std::string ReplacePlaceholder(std::string text, const std::string& name, const std::string& value);

}  // namespace common
}  // namespace engine
}  // namespace mdstream
