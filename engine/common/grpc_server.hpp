#pragma once

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mdstream {
namespace engine {
namespace common {

// gRPC server wrapper owning the server lifecycle
// Services are registered by pointer and must outlive the server.
class GrpcServer {
 public:
  struct Options {
    bool enable_health_check = true;
    int max_send_message_bytes = 4 * 1024 * 1024;
    int keepalive_time_ms = 30000;
    int keepalive_timeout_ms = 10000;
  };

  GrpcServer();
  ~GrpcServer();

  // Non-copyable, non-movable
  GrpcServer(const GrpcServer&) = delete;
  GrpcServer& operator=(const GrpcServer&) = delete;

  // Start serving on address (e.g. "0.0.0.0:50061"; port 0 picks a free port)
  bool Start(const std::string& address,
             const std::vector<grpc::Service*>& services,
             const Options& options);
  bool Start(const std::string& address, grpc::Service* service) {
    return Start(address, std::vector<grpc::Service*>{service}, Options{});
  }

  // Shutdown, wait for active RPCs to drain, join the wait thread
  void Stop();

  bool IsRunning() const { return running_.load(); }

  // Port actually bound (useful when started on port 0)
  int GetBoundPort() const { return bound_port_; }

 private:
  std::unique_ptr<grpc::Server> server_;
  std::thread wait_thread_;
  std::atomic<bool> running_{false};
  int bound_port_ = 0;
  std::mutex mutex_;

  void WaitThread();
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
