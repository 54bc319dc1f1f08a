#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdstream {
namespace engine {
namespace common {

// Unified configuration manager
//
// Values are resolved in order: programmatic/environment overrides, then the
// loaded JSON document (dot notation, e.g. "supervisor.heartbeat_interval_ms"),
// then the caller-supplied default.
class ConfigManager {
 public:
  ConfigManager() = default;
  ~ConfigManager() = default;

  // Load configuration from JSON file
  bool LoadFromFile(const std::string& config_path);

  // Load configuration from an in-memory JSON document
  bool LoadFromString(const std::string& json_text);

  // Print all config
  void PrintAllConfig() const;

  // Config directory from MDSTREAM_CONFIG_DIR, "config" if unset
  static std::string GetConfigDir();

  // Apply overrides from environment variables: env name -> config key.
  // Returns the number of variables found.
  int ApplyEnvironmentOverrides(const std::map<std::string, std::string>& env_to_key);

  std::string GetString(const std::string& key, const std::string& default_value = "") const;
  int GetInt(const std::string& key, int default_value = 0) const;
  int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;
  double GetDouble(const std::string& key, double default_value = 0.0) const;
  bool GetBool(const std::string& key, bool default_value = false) const;

  // Millisecond durations, stored as integers under "*_ms" keys
  std::chrono::milliseconds GetMilliseconds(const std::string& key,
                                            std::chrono::milliseconds default_value) const;

  // Check whether a key resolves to a value
  bool HasKey(const std::string& key) const;

  // Get any node (object, array, string, number, etc.)
  nlohmann::json GetNodeValue(const std::string& key) const;

  // Get string array
  std::vector<std::string> GetStringArray(const std::string& key) const;

  // Keys of an object node ("providers" -> ["P1", "P2"])
  std::vector<std::string> GetObjectKeys(const std::string& key) const;

  // Set value (for command-line and environment overrides)
  void SetString(const std::string& key, const std::string& value);
  void SetInt(const std::string& key, int value);
  void SetDouble(const std::string& key, double value);
  void SetBool(const std::string& key, bool value);

 private:
  nlohmann::json config_root_;
  std::unordered_map<std::string, std::string> overrides_;

  bool AcceptRoot(const std::string& source);
  nlohmann::json GetNode(const std::string& key) const;
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
