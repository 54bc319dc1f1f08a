#include "compression.hpp"
#include <zlib.h>
#include <algorithm>
#include <stdexcept>

namespace mdstream {
namespace engine {
namespace caching {

const char* ToString(CompressionProfile profile) {
  return profile == CompressionProfile::kStreaming ? "streaming" : "batch";
}

CompressionOptions CompressionOptions::FromConfig(const common::ConfigManager& config) {
  CompressionOptions options;
  options.streaming_threshold_bytes = static_cast<size_t>(std::max<int64_t>(
      0, config.GetInt64("cache.compression.streaming_threshold_bytes",
                         static_cast<int64_t>(options.streaming_threshold_bytes))));
  options.batch_threshold_bytes = static_cast<size_t>(std::max<int64_t>(
      0, config.GetInt64("cache.compression.batch_threshold_bytes",
                         static_cast<int64_t>(options.batch_threshold_bytes))));
  options.level = std::clamp(config.GetInt("cache.compression.level", options.level), 1, 9);
  return options;
}

CompressionPolicy::CompressionPolicy(CompressionOptions options) : options_(options) {}

size_t CompressionPolicy::ThresholdFor(CompressionProfile profile) const {
  return profile == CompressionProfile::kStreaming ? options_.streaming_threshold_bytes
                                                   : options_.batch_threshold_bytes;
}

bool CompressionPolicy::ShouldCompress(size_t payload_size, CompressionProfile profile) const {
  return payload_size > ThresholdFor(profile);
}

std::string CompressionPolicy::Compress(const std::string& payload) const {
  uLongf bound = compressBound(static_cast<uLong>(payload.size()));
  std::string out(bound, '\0');
  const int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &bound,
                           reinterpret_cast<const Bytef*>(payload.data()),
                           static_cast<uLong>(payload.size()), options_.level);
  if (rc != Z_OK) {
    throw std::runtime_error("zlib compress failed: " + std::to_string(rc));
  }
  out.resize(bound);
  return out;
}

std::string CompressionPolicy::Decompress(const std::string& data, size_t original_size) {
  std::string out(original_size, '\0');
  uLongf out_size = static_cast<uLongf>(original_size);
  const int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &out_size,
                            reinterpret_cast<const Bytef*>(data.data()),
                            static_cast<uLong>(data.size()));
  if (rc != Z_OK || out_size != original_size) {
    throw std::runtime_error("zlib uncompress failed: " + std::to_string(rc));
  }
  return out;
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
