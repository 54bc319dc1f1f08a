#include "provider_transport_factory.hpp"
#include "websocket_transport.hpp"
#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace streaming {

ProviderTransportFactory& ProviderTransportFactory::GetInstance() {
  static ProviderTransportFactory instance;
  return instance;
}

// Built-in transports
ProviderTransportFactory::ProviderTransportFactory() {
  creators_["websocket"] = [](const ConnectionKey& key, const common::ConfigManager& config) {
    return std::make_shared<WebSocketTransport>(key, WebSocketTransport::Options::FromConfig(config, key));
  };
}

void ProviderTransportFactory::RegisterTransport(const std::string& type, TransportCreator creator) {
  std::lock_guard<std::mutex> lock(mutex_);
  creators_[type] = std::move(creator);
}

std::shared_ptr<ProviderTransport> ProviderTransportFactory::Create(
    const ConnectionKey& key, const common::ConfigManager& config) const {
  const std::string prefix = "providers." + key.provider_id;
  if (!config.HasKey(prefix)) {
    SPDLOG_ERROR("ProviderTransportFactory: provider {} is not configured", key.provider_id);
    return nullptr;
  }
  std::string type = config.GetString(prefix + ".transport", "websocket");

  TransportCreator creator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = creators_.find(type);
    if (it == creators_.end()) {
      SPDLOG_ERROR("ProviderTransportFactory: unknown transport type {} for {}", type, key.ToString());
      return nullptr;
    }
    creator = it->second;
  }
  return creator(key, config);
}

bool ProviderTransportFactory::IsRegistered(const std::string& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return creators_.find(type) != creators_.end();
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
