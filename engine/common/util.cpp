#include "util.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace mdstream {
namespace engine {
namespace common {

ParsedUrl ParseUrl(const std::string& url) {
  ParsedUrl result;
  result.path = "/";

  std::string rest = url;
  size_t protocol_end = url.find("://");
  if (protocol_end != std::string::npos) {
    result.scheme = url.substr(0, protocol_end);
    for (auto& c : result.scheme) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    rest = url.substr(protocol_end + 3);
  }

  // Split host[:port] from path
  std::string host_port = rest;
  size_t slash = rest.find_first_of("/?");
  if (slash != std::string::npos) {
    host_port = rest.substr(0, slash);
    result.path = rest.substr(slash);
    if (result.path[0] == '?') {
      result.path = "/" + result.path;
    }
  }

  size_t colon = host_port.rfind(':');
  if (colon != std::string::npos) {
    result.host = host_port.substr(0, colon);
    result.port = host_port.substr(colon + 1);
  } else {
    result.host = host_port;
  }

  if (result.port.empty()) {
    result.port = result.IsSecure() ? "443" : "80";
  }
  return result;
}

std::string UrlEncode(const std::string& value) {
  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      encoded += buf;
    }
  }
  return encoded;
}

std::string UrlDecode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (c == '+') {
      decoded += ' ';
    } else if (c == '%' && i + 2 < value.size() && std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      decoded += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      decoded += c;
    }
  }
  return decoded;
}

// Split on a single character; empty fields are dropped
std::vector<std::string> Split(const std::string& text, char separator) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(separator, start);
    if (end == std::string::npos) {
      end = text.size();
    }
    if (end > start) {
      parts.push_back(text.substr(start, end - start));
    }
    start = end + 1;
  }
  return parts;
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string joined;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) joined += separator;
    joined += parts[i];
  }
  return joined;
}

std::string ReplacePlaceholder(std::string text, const std::string& name, const std::string& value) {
  const std::string token = "{" + name + "}";
  size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
  return text;
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
