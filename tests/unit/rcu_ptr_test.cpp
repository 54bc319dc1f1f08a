#include "engine/common/rcu_ptr.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mdstream::engine::common;

// Symbol -> subscribed consumers, the shape the broadcast bus publishes
using RoutingTable = std::map<std::string, std::set<std::string>>;

TEST(RCUPtrTest, DefaultConstructionHoldsEmptySnapshot) {
  RCUPtr<RoutingTable> rcu;
  auto snapshot = rcu.Read();
  ASSERT_NE(snapshot, nullptr);
  EXPECT_TRUE(snapshot->empty());
  EXPECT_TRUE(static_cast<bool>(rcu));
}

TEST(RCUPtrTest, NullInitialSnapshot) {
  RCUPtr<RoutingTable> rcu(nullptr);
  EXPECT_FALSE(static_cast<bool>(rcu));
  EXPECT_EQ(rcu.Read(), nullptr);

  // Mutate starts from an empty table when nothing is published
  rcu.Mutate([](RoutingTable& table) { table["AAPL"].insert("c1"); });
  ASSERT_TRUE(static_cast<bool>(rcu));
  EXPECT_EQ(rcu->at("AAPL").size(), 1u);
}

TEST(RCUPtrTest, UpdateAndExchange) {
  RCUPtr<RoutingTable> rcu;
  rcu.Update(std::make_shared<RoutingTable>(RoutingTable{{"AAPL", {"c1"}}}));
  EXPECT_EQ(rcu.Read()->count("AAPL"), 1u);

  auto previous = rcu.Exchange(std::make_shared<RoutingTable>(RoutingTable{{"MSFT", {"c2"}}}));
  ASSERT_NE(previous, nullptr);
  EXPECT_EQ(previous->count("AAPL"), 1u);
  EXPECT_EQ(rcu.Read()->count("AAPL"), 0u);
  EXPECT_EQ(rcu.Read()->count("MSFT"), 1u);
}

TEST(RCUPtrTest, ReaderSnapshotSurvivesMutation) {
  RCUPtr<RoutingTable> rcu;
  rcu.Mutate([](RoutingTable& table) { table["AAPL"] = {"c1", "c2", "c3"}; });

  auto in_flight = rcu.Read();
  rcu.Mutate([](RoutingTable& table) {
    table["AAPL"].erase("c1");
    table["AAPL"].erase("c2");
  });

  // A delivery that started before the unsubscribe still sees all three
  EXPECT_EQ(in_flight->at("AAPL").size(), 3u);
  EXPECT_EQ(rcu.Read()->at("AAPL").size(), 1u);
  EXPECT_EQ(rcu.Read()->at("AAPL").count("c3"), 1u);
}

TEST(RCUPtrTest, MutateReturnsValue) {
  RCUPtr<RoutingTable> rcu;
  bool inserted = rcu.Mutate([](RoutingTable& table) {
    return table["AAPL"].insert("c1").second;
  });
  bool inserted_again = rcu.Mutate([](RoutingTable& table) {
    return table["AAPL"].insert("c1").second;
  });
  EXPECT_TRUE(inserted);
  EXPECT_FALSE(inserted_again);
}

TEST(RCUPtrTest, ConcurrentMutateLosesNoUpdate) {
  RCUPtr<RoutingTable> rcu;
  constexpr int kWriters = 4;
  constexpr int kPerWriter = 250;

  std::atomic<bool> stop_readers{false};
  std::atomic<int> reads{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < 2; ++i) {
    readers.emplace_back([&]() {
      while (!stop_readers.load()) {
        auto snapshot = rcu.Read();
        ASSERT_NE(snapshot, nullptr);
        reads++;
      }
    });
  }

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&rcu, w]() {
      for (int i = 0; i < kPerWriter; ++i) {
        rcu.Mutate([w, i](RoutingTable& table) {
          table["SYM" + std::to_string(w)].insert("c" + std::to_string(i));
        });
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }
  stop_readers = true;
  for (auto& t : readers) {
    t.join();
  }

  auto final_table = rcu.Read();
  ASSERT_EQ(final_table->size(), static_cast<size_t>(kWriters));
  for (int w = 0; w < kWriters; ++w) {
    EXPECT_EQ(final_table->at("SYM" + std::to_string(w)).size(), static_cast<size_t>(kPerWriter));
  }
  EXPECT_GT(reads.load(), 0);
}

TEST(RCUPtrTest, OldSnapshotReclaimedWhenLastReaderDrops) {
  RCUPtr<RoutingTable> rcu(std::make_shared<RoutingTable>(RoutingTable{{"AAPL", {"c1"}}}));
  std::weak_ptr<RoutingTable> weak;
  {
    auto snapshot = rcu.Read();
    weak = snapshot;
    rcu.Update(std::make_shared<RoutingTable>());
    EXPECT_FALSE(weak.expired());
  }
  EXPECT_TRUE(weak.expired());
}
