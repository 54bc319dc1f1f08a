#include "config_manager.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace mdstream {
namespace engine {
namespace common {

bool ConfigManager::LoadFromFile(const std::string& config_path) {
  try {
    std::ifstream file(config_path);
    if (!file.is_open()) {
      SPDLOG_WARN("Failed to open config file: {}", config_path);
      return false;
    }
    config_root_ = nlohmann::json::parse(file);
    return AcceptRoot(config_path);
  } catch (const std::exception& e) {
    SPDLOG_WARN("Failed to load config from {}: {}", config_path, e.what());
    return false;
  }
}

bool ConfigManager::LoadFromString(const std::string& json_text) {
  try {
    config_root_ = nlohmann::json::parse(json_text);
    return AcceptRoot("<inline>");
  } catch (const std::exception& e) {
    SPDLOG_WARN("Failed to parse inline config: {}", e.what());
    return false;
  }
}

bool ConfigManager::AcceptRoot(const std::string& source) {
  if (!config_root_.is_object()) {
    SPDLOG_WARN("Config from {} loaded but root is not an object", source);
    config_root_ = nlohmann::json();
    return false;
  }
  SPDLOG_INFO("Loaded config from: {} (has {} top-level keys)", source, config_root_.size());
  std::string keys;
  for (auto it = config_root_.begin(); it != config_root_.end(); ++it) {
    if (!keys.empty()) keys += ", ";
    keys += it.key();
  }
  SPDLOG_TRACE("Config top-level keys: {}", keys);
  return true;
}

void ConfigManager::PrintAllConfig() const {
  try {
    SPDLOG_INFO("Effective config:\n{}", config_root_.dump(2));
    for (const auto& [key, value] : overrides_) {
      SPDLOG_INFO("  override {} = {}", key, value);
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Failed to print config: {}", e.what());
  }
}

std::string ConfigManager::GetConfigDir() {
  const char* env = std::getenv("MDSTREAM_CONFIG_DIR");
  return env ? std::string(env) : "config";
}

int ConfigManager::ApplyEnvironmentOverrides(const std::map<std::string, std::string>& env_to_key) {
  int applied = 0;
  for (const auto& [env_name, key] : env_to_key) {
    const char* value = std::getenv(env_name.c_str());
    if (!value) {
      continue;
    }
    overrides_[key] = value;
    ++applied;
    SPDLOG_DEBUG("ConfigManager: {} overridden from environment {}", key, env_name);
  }
  return applied;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    SPDLOG_TRACE("GetString('{}'): found in overrides: {}", key, it->second);
    return it->second;
  }

  nlohmann::json node = GetNode(key);
  if (node.is_string()) {
    return node.get<std::string>();
  }

  SPDLOG_TRACE("GetString('{}'): not found, using default: {}", key, default_value);
  return default_value;
}

int ConfigManager::GetInt(const std::string& key, int default_value) const {
  return static_cast<int>(GetInt64(key, default_value));
}

int64_t ConfigManager::GetInt64(const std::string& key, int64_t default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stoll(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetInt('{}'): override '{}' is not an integer ({}), using default {}",
                  key, it->second, e.what(), default_value);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number()) {
    SPDLOG_TRACE("GetInt('{}'): node not a number, using default {}", key, default_value);
    return default_value;
  }
  return node.get<int64_t>();
}

double ConfigManager::GetDouble(const std::string& key, double default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetDouble('{}'): override '{}' is not a number ({}), using default {}",
                  key, it->second, e.what(), default_value);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number()) {
    return default_value;
  }
  return node.get<double>();
}

bool ConfigManager::GetBool(const std::string& key, bool default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    const std::string& val = it->second;
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    return default_value;
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_boolean()) {
    return default_value;
  }
  return node.get<bool>();
}

std::chrono::milliseconds ConfigManager::GetMilliseconds(const std::string& key,
                                                         std::chrono::milliseconds default_value) const {
  return std::chrono::milliseconds(GetInt64(key, default_value.count()));
}

bool ConfigManager::HasKey(const std::string& key) const {
  return overrides_.count(key) > 0 || !GetNode(key).is_null();
}

nlohmann::json ConfigManager::GetNodeValue(const std::string& key) const {
  return GetNode(key);
}

std::vector<std::string> ConfigManager::GetStringArray(const std::string& key) const {
  std::vector<std::string> result;
  nlohmann::json node = GetNode(key);
  if (!node.is_array()) {
    return result;
  }
  for (const auto& item : node) {
    if (item.is_string()) {
      result.push_back(item.get<std::string>());
    }
  }
  return result;
}

std::vector<std::string> ConfigManager::GetObjectKeys(const std::string& key) const {
  std::vector<std::string> result;
  nlohmann::json node = GetNode(key);
  if (!node.is_object()) {
    return result;
  }
  for (auto it = node.begin(); it != node.end(); ++it) {
    result.push_back(it.key());
  }
  return result;
}

void ConfigManager::SetString(const std::string& key, const std::string& value) {
  overrides_[key] = value;
}

void ConfigManager::SetInt(const std::string& key, int value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetDouble(const std::string& key, double value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetBool(const std::string& key, bool value) {
  overrides_[key] = value ? "true" : "false";
}

nlohmann::json ConfigManager::GetNode(const std::string& key) const {
  if (config_root_.is_null()) {
    return nlohmann::json();
  }

  // Dot notation: "supervisor.heartbeat_interval_ms"
  const nlohmann::json* node = &config_root_;
  size_t start = 0;
  while (start <= key.size()) {
    size_t dot = key.find('.', start);
    std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!part.empty()) {
      if (!node->is_object() || !node->contains(part)) {
        SPDLOG_TRACE("GetNode('{}'): key '{}' not found", key, part);
        return nlohmann::json();
      }
      node = &(*node)[part];
    }
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return *node;
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
