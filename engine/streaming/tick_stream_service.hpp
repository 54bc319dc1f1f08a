#pragma once

#include "broadcast_router.hpp"
#include "engine/common/rcu_ptr.hpp"
#include "engine/common/thread_safe_object_pool.hpp"
#include "market_stream.grpc.pb.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <grpcpp/grpcpp.h>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace mdstream {
namespace engine {
namespace streaming {

/**
 * @brief Per-stream state and bounded message queue
 *
 * The router delivers into the queue from provider IO threads; the RPC
 * handler thread drains it into the gRPC writer. A full queue drops its
 * oldest tick to make room.
 */
class RemoteConsumer {
 public:
  using PooledTick = common::ThreadSafeObjectPool<market_data::Tick>::PooledObject;

  RemoteConsumer(std::string consumer_id, ConnectionKey key, size_t max_queue_depth);

  // Ignored once closed
  void Push(PooledTick tick);
  // Empty handle when nothing arrived within timeout or the stream closed
  PooledTick WaitPop(std::chrono::milliseconds timeout);
  void Close();

  bool IsActive() const { return active_.load(); }
  size_t GetQueueDepth() const;
  uint64_t GetDropped() const { return dropped_.load(); }

  const std::string consumer_id;
  const ConnectionKey key;

 private:
  const size_t max_queue_depth_;
  std::queue<PooledTick> tick_queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::atomic<bool> active_{true};
  std::atomic<uint64_t> dropped_{0};
};

/**
 * @brief gRPC service attaching remote consumers to the BroadcastRouter
 *
 * Each StreamTicks call registers a router consumer for the requested
 * (provider, capability, symbols) and streams ticks until the client
 * cancels or the service stops. Slow clients lose the oldest ticks once
 * their queue reaches max_queue_depth.
 */
class TickStreamServiceImpl final : public market_data::TickStream::Service {
 public:
  TickStreamServiceImpl(BroadcastRouter& router, size_t max_queue_depth = 10000);
  ~TickStreamServiceImpl() override;

  /** @brief Cancel all open streams */
  void Stop();

  grpc::Status StreamTicks(grpc::ServerContext* context,
                           const market_data::StreamTicksRequest* request,
                           grpc::ServerWriter<market_data::Tick>* writer) override;

  size_t GetStreamCount() const;
  // Ticks dropped from the queues of currently open streams
  uint64_t GetDroppedCount() const;

  static void ToProto(const Tick& tick, const ConnectionKey& key, market_data::Tick* out);

 private:
  void Enqueue(const std::shared_ptr<RemoteConsumer>& consumer, const Tick& tick);
  void RemoveConsumer(uint64_t stream_id);

  BroadcastRouter& router_;
  size_t max_queue_depth_;
  std::shared_ptr<common::ThreadSafeObjectPool<market_data::Tick>> tick_pool_;

  // Stream map (RCU pattern for lock-free reads)
  using ConsumerMap = std::map<uint64_t, std::shared_ptr<RemoteConsumer>>;
  common::RCUPtr<ConsumerMap> consumers_;
  std::atomic<uint64_t> next_stream_id_{1};
  std::atomic<bool> stopped_{false};
};

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
