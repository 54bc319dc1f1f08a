#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "engine/common/config_manager.hpp"

using namespace mdstream::engine::common;

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_config_path_ = std::filesystem::temp_directory_path() / "mdstream_test_config.json";

    nlohmann::json config = {
      {"app", {
        {"log", {
          {"file", "test.log"},
          {"level", "debug"}
        }},
        {"rest_port", 8080}
      }},
      {"supervisor", {
        {"heartbeat_interval_ms", 15000},
        {"missed_heartbeats", 3}
      }},
      {"providers", {
        {"P1", {
          {"url", "wss://p1.example.com/{capability}"},
          {"transport", "websocket"}
        }},
        {"P2", {
          {"url", "ws://localhost:9000/{capability}"}
        }}
      }},
      {"test_string_array", {"a", "b", "c"}},
      {"test_bool", true},
      {"test_int", 42},
      {"test_big_int", 86400000000},
      {"test_double", 3.14},
      {"test_string", "hello"}
    };

    std::ofstream file(test_config_path_);
    file << config.dump(2);
    file.close();
  }

  void TearDown() override {
    if (std::filesystem::exists(test_config_path_)) {
      std::filesystem::remove(test_config_path_);
    }
  }

  std::filesystem::path test_config_path_;
};

TEST_F(ConfigManagerTest, LoadFromFile_Success) {
  ConfigManager config;
  EXPECT_TRUE(config.LoadFromFile(test_config_path_.string()));
}

TEST_F(ConfigManagerTest, LoadFromFile_NonExistent) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromFile("/nonexistent/file.json"));
}

TEST_F(ConfigManagerTest, LoadFromString_RejectsNonObjectRoot) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromString("[1, 2, 3]"));
  EXPECT_FALSE(config.LoadFromString("{not json"));
  EXPECT_TRUE(config.LoadFromString(R"({"a": {"b": 7}})"));
  EXPECT_EQ(config.GetInt("a.b"), 7);
}

TEST_F(ConfigManagerTest, GetString_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("test_string"), "hello");
  EXPECT_EQ(config.GetString("app.log.file"), "test.log");
  EXPECT_EQ(config.GetString("providers.P1.url"), "wss://p1.example.com/{capability}");
}

TEST_F(ConfigManagerTest, GetString_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("nonexistent"), "");
  EXPECT_EQ(config.GetString("nonexistent", "default"), "default");
  EXPECT_EQ(config.GetString("providers.P2.transport", "websocket"), "websocket");
}

TEST_F(ConfigManagerTest, GetInt_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("test_int"), 42);
  EXPECT_EQ(config.GetInt("app.rest_port"), 8080);
  EXPECT_EQ(config.GetInt64("test_big_int"), 86400000000LL);
}

TEST_F(ConfigManagerTest, GetInt_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("nonexistent"), 0);
  EXPECT_EQ(config.GetInt("nonexistent", 99), 99);
  // Strings are not coerced
  EXPECT_EQ(config.GetInt("test_string", 5), 5);
}

TEST_F(ConfigManagerTest, GetMilliseconds) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetMilliseconds("supervisor.heartbeat_interval_ms", std::chrono::milliseconds(30000)),
            std::chrono::milliseconds(15000));
  EXPECT_EQ(config.GetMilliseconds("supervisor.unsubscribe_grace_period_ms", std::chrono::milliseconds(10000)),
            std::chrono::milliseconds(10000));
}

TEST_F(ConfigManagerTest, GetDouble_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_DOUBLE_EQ(config.GetDouble("test_double"), 3.14);
  EXPECT_DOUBLE_EQ(config.GetDouble("test_int"), 42.0);
}

TEST_F(ConfigManagerTest, GetDouble_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_DOUBLE_EQ(config.GetDouble("nonexistent"), 0.0);
  EXPECT_DOUBLE_EQ(config.GetDouble("nonexistent", 9.9), 9.9);
}

TEST_F(ConfigManagerTest, GetBool_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_TRUE(config.GetBool("test_bool"));
}

TEST_F(ConfigManagerTest, GetBool_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_FALSE(config.GetBool("nonexistent"));
  EXPECT_TRUE(config.GetBool("nonexistent", true));
}

TEST_F(ConfigManagerTest, GetStringArray_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  auto arr = config.GetStringArray("test_string_array");
  ASSERT_EQ(arr.size(), 3u);
  EXPECT_EQ(arr[0], "a");
  EXPECT_EQ(arr[1], "b");
  EXPECT_EQ(arr[2], "c");
  EXPECT_TRUE(config.GetStringArray("test_string").empty());
}

TEST_F(ConfigManagerTest, GetObjectKeys) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  auto keys = config.GetObjectKeys("providers");
  ASSERT_EQ(keys.size(), 2u);
  EXPECT_EQ(keys[0], "P1");
  EXPECT_EQ(keys[1], "P2");
  EXPECT_TRUE(config.GetObjectKeys("test_int").empty());
}

TEST_F(ConfigManagerTest, HasKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_TRUE(config.HasKey("providers.P1"));
  EXPECT_FALSE(config.HasKey("providers.P3"));
  config.SetString("providers.P3.url", "ws://p3");
  EXPECT_TRUE(config.HasKey("providers.P3.url"));
}

TEST_F(ConfigManagerTest, GetNodeValue_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  auto node = config.GetNodeValue("supervisor");
  EXPECT_TRUE(node.is_object());
  EXPECT_TRUE(node.contains("missed_heartbeats"));
}

TEST_F(ConfigManagerTest, SetString_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetString("test_string", "overridden");
  EXPECT_EQ(config.GetString("test_string"), "overridden");
}

TEST_F(ConfigManagerTest, SetInt_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetInt("test_int", 999);
  EXPECT_EQ(config.GetInt("test_int"), 999);
}

TEST_F(ConfigManagerTest, SetDouble_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetDouble("test_double", 99.9);
  EXPECT_NEAR(config.GetDouble("test_double"), 99.9, 1e-9);
}

TEST_F(ConfigManagerTest, SetBool_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetBool("test_bool", false);
  EXPECT_FALSE(config.GetBool("test_bool"));
}

TEST_F(ConfigManagerTest, EnvironmentOverrides) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  ::setenv("MDSTREAM_TEST_HEARTBEAT_MS", "5000", 1);
  ::setenv("MDSTREAM_TEST_STRICT", "no", 1);
  ::unsetenv("MDSTREAM_TEST_UNSET");

  int applied = config.ApplyEnvironmentOverrides({
      {"MDSTREAM_TEST_HEARTBEAT_MS", "supervisor.heartbeat_interval_ms"},
      {"MDSTREAM_TEST_STRICT", "feature_flags.strict_mode"},
      {"MDSTREAM_TEST_UNSET", "app.rest_port"},
  });

  EXPECT_EQ(applied, 2);
  EXPECT_EQ(config.GetInt("supervisor.heartbeat_interval_ms"), 5000);
  EXPECT_FALSE(config.GetBool("feature_flags.strict_mode", true));
  EXPECT_EQ(config.GetInt("app.rest_port"), 8080);

  ::unsetenv("MDSTREAM_TEST_HEARTBEAT_MS");
  ::unsetenv("MDSTREAM_TEST_STRICT");
}

TEST_F(ConfigManagerTest, InvalidIntegerOverrideFallsBackToDefault) {
  ConfigManager config;
  config.SetString("supervisor.missed_heartbeats", "two");
  EXPECT_EQ(config.GetInt("supervisor.missed_heartbeats", 2), 2);
}

TEST_F(ConfigManagerTest, GetConfigDir) {
  std::string dir = ConfigManager::GetConfigDir();
  EXPECT_FALSE(dir.empty());
}

TEST_F(ConfigManagerTest, PrintAllConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  // Should not throw
  config.PrintAllConfig();
}
