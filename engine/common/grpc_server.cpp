#include "grpc_server.hpp"

#include <spdlog/spdlog.h>

namespace mdstream {
namespace engine {
namespace common {

GrpcServer::GrpcServer() = default;

GrpcServer::~GrpcServer() {
  Stop();
}

bool GrpcServer::Start(const std::string& address,
                       const std::vector<grpc::Service*>& services,
                       const Options& options) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (running_.load()) {
    SPDLOG_WARN("GrpcServer: already running");
    return false;
  }

  if (services.empty()) {
    SPDLOG_ERROR("GrpcServer: no services to register");
    return false;
  }

  try {
    grpc::ServerBuilder builder;

    if (options.enable_health_check) {
      grpc::EnableDefaultHealthCheckService(true);
    }

    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &bound_port_);
    builder.SetMaxSendMessageSize(options.max_send_message_bytes);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, options.keepalive_time_ms);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, options.keepalive_timeout_ms);
    for (auto* service : services) {
      if (!service) {
        SPDLOG_ERROR("GrpcServer: null service passed for {}", address);
        return false;
      }
      builder.RegisterService(service);
    }

    server_ = builder.BuildAndStart();
    if (!server_ || bound_port_ == 0) {
      SPDLOG_ERROR("GrpcServer: failed to start on {}", address);
      server_.reset();
      return false;
    }

    running_.store(true);
    SPDLOG_INFO("GrpcServer: listening on {} (port {}, {} services)",
                address, bound_port_, services.size());

    wait_thread_ = std::thread(&GrpcServer::WaitThread, this);
    return true;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("GrpcServer: exception starting on {}: {}", address, e.what());
    return false;
  }
}

void GrpcServer::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!running_.exchange(false)) {
    return;
  }

  if (server_) {
    SPDLOG_DEBUG("GrpcServer: shutting down");
    server_->Shutdown();

    if (wait_thread_.joinable()) {
      wait_thread_.join();
    }

    server_.reset();
    bound_port_ = 0;
    SPDLOG_DEBUG("GrpcServer: shutdown complete");
  }
}

void GrpcServer::WaitThread() {
  if (server_) {
    server_->Wait();
    SPDLOG_DEBUG("GrpcServer: wait thread finished");
  }
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
