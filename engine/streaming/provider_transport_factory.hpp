#pragma once

#include "provider_transport.hpp"
#include "engine/common/config_manager.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mdstream {
namespace engine {
namespace streaming {

// Registry of transport types ("websocket", ...) keyed by
// providers.<id>.transport in the configuration
class ProviderTransportFactory {
 public:
  using TransportCreator = std::function<std::shared_ptr<ProviderTransport>(
      const ConnectionKey& key, const common::ConfigManager& config)>;

  static ProviderTransportFactory& GetInstance();

  void RegisterTransport(const std::string& type, TransportCreator creator);

  // Create the transport configured for key.provider_id; nullptr if the
  // provider or its transport type is unknown
  std::shared_ptr<ProviderTransport> Create(const ConnectionKey& key,
                                            const common::ConfigManager& config) const;

  bool IsRegistered(const std::string& type) const;

 private:
  ProviderTransportFactory();
  ~ProviderTransportFactory() = default;
  ProviderTransportFactory(const ProviderTransportFactory&) = delete;
  ProviderTransportFactory& operator=(const ProviderTransportFactory&) = delete;

  std::unordered_map<std::string, TransportCreator> creators_;
  mutable std::mutex mutex_;
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
