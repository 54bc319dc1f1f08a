#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "engine/common/application_kernel.hpp"
#include "engine/mock/simulated_provider.hpp"
#include "engine/mock/simulated_provider_server.hpp"

using namespace mdstream::engine::common;
using namespace mdstream::engine::mock;

class MockProviderApp : public ApplicationKernel {
 public:
  MockProviderApp() {
    SetAppName("mock_provider");
  }

 protected:
  std::map<std::string, std::string> GetEnvironmentOverrides() const override {
    return {
        {"MDSTREAM_MOCK_WS_PORT", "mock_provider.ws_port"},
        {"MDSTREAM_MOCK_HISTORY_PORT", "mock_provider.history_port"},
        {"MDSTREAM_MOCK_API_KEY", "mock_provider.api_key"},
    };
  }

  void OnStart() override {
    auto options = SimulatedProviderOptions::FromConfig(GetConfig());
    std::string address = GetConfig().GetString("mock_provider.address", "0.0.0.0");
    uint16_t ws_port = static_cast<uint16_t>(GetConfig().GetInt("mock_provider.ws_port", 8089));
    uint16_t history_port = static_cast<uint16_t>(GetConfig().GetInt("mock_provider.history_port", 8090));
    std::string fixture_file = GetConfig().GetString("mock_provider.fixture_file", "");

    SPDLOG_INFO("MockProviderApp: provider={}, address={}, ws_port={}, history_port={}, fixture_file={}",
                options.provider_id, address, ws_port, history_port, fixture_file);

    provider_ = std::make_unique<SimulatedProvider>(options);

    if (!fixture_file.empty()) {
      // Relative fixture paths resolve from the working directory
      std::filesystem::path fixture_path(fixture_file);
      if (!fixture_path.is_absolute()) {
        char* cwd = std::getenv("PWD");
        if (cwd) {
          fixture_path = std::filesystem::path(cwd) / fixture_path;
        } else {
          fixture_path = std::filesystem::absolute(fixture_path);
        }
      }
      if (!provider_->LoadPriceFixtureFromFile(fixture_path.string())) {
        SPDLOG_WARN("MockProviderApp: failed to load fixture file {}", fixture_path.string());
      }
    }

    server_ = std::make_unique<SimulatedProviderServer>(*provider_, address, ws_port, history_port);
    if (!server_->Start()) {
      throw std::runtime_error("Failed to start mock provider server");
    }
    provider_->Start();

    SPDLOG_INFO("Mock provider running on {}:{} (history on port {})",
                address, server_->GetWebSocketPort(), history_port);
  }

  void OnStop() override {
    if (provider_) {
      provider_->Stop();
    }
    if (server_) {
      server_->Stop();
    }
  }

 private:
  std::unique_ptr<SimulatedProvider> provider_;
  std::unique_ptr<SimulatedProviderServer> server_;
};

int main(int argc, char** argv) {
  MockProviderApp app;
  return app.Run(argc, argv);
}
