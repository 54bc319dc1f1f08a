#pragma once

#include "engine/common/config_manager.hpp"

#include <cstddef>
#include <string>

namespace mdstream {
namespace engine {
namespace caching {

// Streaming payloads are small and latency sensitive; batch payloads are
// large and compress well.
enum class CompressionProfile { kStreaming, kBatch };

const char* ToString(CompressionProfile profile);

struct CompressionOptions {
  size_t streaming_threshold_bytes = 1024;
  size_t batch_threshold_bytes = 10240;
  int level = 6;  // zlib level, 1 (fast) .. 9 (small)

  // cache.compression.*
  static CompressionOptions FromConfig(const common::ConfigManager& config);
};

class CompressionPolicy {
 public:
  explicit CompressionPolicy(CompressionOptions options = CompressionOptions());

  size_t ThresholdFor(CompressionProfile profile) const;

  // Strictly above the profile threshold
  bool ShouldCompress(size_t payload_size, CompressionProfile profile) const;

  // zlib stream format; throws std::runtime_error on a zlib failure
  std::string Compress(const std::string& payload) const;
  static std::string Decompress(const std::string& data, size_t original_size);

  const CompressionOptions& GetOptions() const { return options_; }

 private:
  CompressionOptions options_;
};

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
