#include "tick_stream_service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mdstream {
namespace engine {
namespace streaming {

//=============================================================================
// RemoteConsumer
//=============================================================================

RemoteConsumer::RemoteConsumer(std::string consumer_id, ConnectionKey key, size_t max_queue_depth)
    : consumer_id(std::move(consumer_id)), key(std::move(key)), max_queue_depth_(max_queue_depth) {}

void RemoteConsumer::Push(PooledTick tick) {
  if (!active_.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (max_queue_depth_ > 0 && tick_queue_.size() >= max_queue_depth_) {
    tick_queue_.pop();
    if (dropped_.fetch_add(1) % 1000 == 0) {
      SPDLOG_WARN("RemoteConsumer: {} is slow, dropping oldest ticks", consumer_id);
    }
  }
  tick_queue_.push(std::move(tick));
  queue_cv_.notify_one();
}

RemoteConsumer::PooledTick RemoteConsumer::WaitPop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  queue_cv_.wait_for(lock, timeout, [this] { return !tick_queue_.empty() || !active_.load(); });
  if (tick_queue_.empty() || !active_.load()) {
    return PooledTick();
  }
  PooledTick tick = std::move(tick_queue_.front());
  tick_queue_.pop();
  return tick;
}

void RemoteConsumer::Close() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    active_ = false;
  }
  queue_cv_.notify_all();
}

size_t RemoteConsumer::GetQueueDepth() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return tick_queue_.size();
}

//=============================================================================
// TickStreamServiceImpl
//=============================================================================

TickStreamServiceImpl::TickStreamServiceImpl(BroadcastRouter& router, size_t max_queue_depth)
    : router_(router),
      max_queue_depth_(max_queue_depth),
      tick_pool_(common::GetThreadSafeObjectPool<market_data::Tick>()) {}

TickStreamServiceImpl::~TickStreamServiceImpl() {
  Stop();
}

void TickStreamServiceImpl::Stop() {
  stopped_.store(true);
  auto snapshot = consumers_.Read();
  for (auto& [id, consumer] : *snapshot) {
    consumer->Close();
  }
}

size_t TickStreamServiceImpl::GetStreamCount() const {
  return consumers_.Read()->size();
}

uint64_t TickStreamServiceImpl::GetDroppedCount() const {
  uint64_t dropped = 0;
  auto snapshot = consumers_.Read();
  for (const auto& [id, consumer] : *snapshot) {
    dropped += consumer->GetDropped();
  }
  return dropped;
}

void TickStreamServiceImpl::ToProto(const Tick& tick, const ConnectionKey& key, market_data::Tick* out) {
  out->set_symbol(tick.symbol);
  out->set_sequence(tick.sequence);
  out->set_last_price(tick.last_price);
  out->set_bid_price(tick.bid_price);
  out->set_ask_price(tick.ask_price);
  out->set_volume(tick.volume);
  out->set_timestamp_ms(tick.timestamp_ms);
  out->set_recovered(tick.recovered);
  out->set_provider(key.provider_id);
  out->set_capability(key.capability_id);
}

grpc::Status TickStreamServiceImpl::StreamTicks(grpc::ServerContext* context,
                                                const market_data::StreamTicksRequest* request,
                                                grpc::ServerWriter<market_data::Tick>* writer) {
  if (stopped_.load()) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "Service stopping");
  }
  if (request->provider().empty() || request->capability().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "provider and capability are required");
  }
  if (request->symbols().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "at least one symbol is required");
  }

  const uint64_t stream_id = next_stream_id_.fetch_add(1);
  auto consumer = std::make_shared<RemoteConsumer>(
      request->client_id().empty() ? "grpc-" + std::to_string(stream_id)
                                   : request->client_id() + "#" + std::to_string(stream_id),
      ConnectionKey{request->provider(), request->capability()}, max_queue_depth_);
  std::vector<std::string> symbols(request->symbols().begin(), request->symbols().end());

  std::weak_ptr<RemoteConsumer> weak = consumer;
  if (!router_.RegisterConsumer(consumer->consumer_id, [this, weak](const Tick& tick) {
        if (auto target = weak.lock()) {
          Enqueue(target, tick);
        }
      })) {
    return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "consumer already attached");
  }

  consumers_.Mutate([&](ConsumerMap& map) { map[stream_id] = consumer; });
  SPDLOG_INFO("TickStreamServiceImpl: stream {} ({}) for {} [{} symbols] from {}",
              stream_id, consumer->consumer_id, consumer->key.ToString(), symbols.size(), context->peer());

  try {
    router_.Subscribe(consumer->consumer_id, consumer->key, symbols);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("TickStreamServiceImpl: subscribe failed for stream {}: {}", stream_id, e.what());
    router_.UnregisterConsumer(consumer->consumer_id);
    RemoveConsumer(stream_id);
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }

  // Drain the queue on the RPC thread until the client goes away
  while (consumer->IsActive() && !context->IsCancelled()) {
    RemoteConsumer::PooledTick pooled_tick = consumer->WaitPop(std::chrono::milliseconds(100));
    if (!pooled_tick) {
      continue;
    }
    if (!writer->Write(*pooled_tick)) {
      SPDLOG_WARN("TickStreamServiceImpl: write failed for stream {}", stream_id);
      break;
    }
  }

  router_.UnregisterConsumer(consumer->consumer_id);
  RemoveConsumer(stream_id);
  SPDLOG_INFO("TickStreamServiceImpl: stream {} closed ({} ticks dropped)", stream_id, consumer->GetDropped());
  return grpc::Status::OK;
}

void TickStreamServiceImpl::Enqueue(const std::shared_ptr<RemoteConsumer>& consumer, const Tick& tick) {
  if (!consumer->IsActive()) {
    return;
  }
  auto pooled_tick = tick_pool_->Acquire();
  if (!pooled_tick) {
    throw std::runtime_error("tick pool exhausted");
  }
  ToProto(tick, consumer->key, pooled_tick.get());
  consumer->Push(std::move(pooled_tick));
}

void TickStreamServiceImpl::RemoveConsumer(uint64_t stream_id) {
  consumers_.Mutate([stream_id](ConsumerMap& map) {
    auto it = map.find(stream_id);
    if (it != map.end()) {
      it->second->Close();
      map.erase(it);
    }
  });
}

}  // namespace streaming
}  // namespace engine
}  // namespace mdstream
