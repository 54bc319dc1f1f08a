#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "engine/caching/cache_entry.hpp"
#include "engine/caching/compression.hpp"
#include "engine/common/config_manager.hpp"

using namespace mdstream::engine::caching;
using mdstream::engine::common::ConfigManager;

TEST(CompressionPolicyTest, ThresholdsArePerProfileAndExclusive) {
  CompressionPolicy policy;
  EXPECT_EQ(policy.ThresholdFor(CompressionProfile::kStreaming), 1024u);
  EXPECT_EQ(policy.ThresholdFor(CompressionProfile::kBatch), 10240u);

  EXPECT_FALSE(policy.ShouldCompress(1024, CompressionProfile::kStreaming));
  EXPECT_TRUE(policy.ShouldCompress(1025, CompressionProfile::kStreaming));
  EXPECT_FALSE(policy.ShouldCompress(5000, CompressionProfile::kBatch));
  EXPECT_TRUE(policy.ShouldCompress(10241, CompressionProfile::kBatch));
}

TEST(CompressionPolicyTest, CompressedPayloadRestoresExactly) {
  CompressionPolicy policy;
  std::string payload;
  for (int i = 0; i < 200; ++i) {
    payload += R"({"symbol":"AAPL","price":189.25,"volume":1200},)";
  }
  auto compressed = policy.Compress(payload);
  EXPECT_LT(compressed.size(), payload.size() / 4);
  EXPECT_EQ(CompressionPolicy::Decompress(compressed, payload.size()), payload);
}

TEST(CompressionPolicyTest, CorruptDataThrows) {
  EXPECT_THROW(CompressionPolicy::Decompress("not a zlib stream", 64), std::runtime_error);

  CompressionPolicy policy;
  auto compressed = policy.Compress(std::string(4096, 'x'));
  // Size mismatch is corruption as well
  EXPECT_THROW(CompressionPolicy::Decompress(compressed, 100), std::runtime_error);
}

TEST(CompressionPolicyTest, CacheEntryValueDecompresses) {
  CompressionPolicy policy;
  const std::string payload(3000, 'q');
  CacheEntry entry;
  entry.data = policy.Compress(payload);
  entry.compressed = true;
  entry.original_size = payload.size();
  EXPECT_EQ(entry.Value(), payload);

  CacheEntry plain;
  plain.data = "raw";
  EXPECT_EQ(plain.Value(), "raw");
}

TEST(CompressionPolicyTest, OptionsFromConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({
    "cache": {"compression": {"streaming_threshold_bytes": 512, "level": 42}}
  })"));
  auto options = CompressionOptions::FromConfig(config);
  EXPECT_EQ(options.streaming_threshold_bytes, 512u);
  EXPECT_EQ(options.batch_threshold_bytes, 10240u);
  EXPECT_EQ(options.level, 9);
}

TEST(CacheEntryTest, ExpiryAndCategory) {
  CacheEntry entry;
  entry.expires_ms = 1000;
  EXPECT_FALSE(entry.IsExpired(999));
  EXPECT_TRUE(entry.IsExpired(1000));
  EXPECT_EQ(entry.Remaining(400).count(), 600);
  EXPECT_EQ(entry.Remaining(2000).count(), 0);

  EXPECT_EQ(CategoryOf("quote:AAPL"), "quote");
  EXPECT_EQ(CategoryOf("kline:1m:AAPL"), "kline");
  EXPECT_EQ(CategoryOf("plain"), "");
}
