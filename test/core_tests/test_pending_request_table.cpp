#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "core/pending_request_table.hpp"

using namespace gvrelay;
using namespace gvrelay::core;
using namespace std::chrono_literals;

class PendingRequestTableTest : public testing::Test {
 protected:
  PendingRequestTable table_{5s};
  const SteadyClock::time_point t0_ = SteadyClock::now();
};

/**
 * @brief 记录后可以按事务ID取回请求方与接口
 */
TEST_F(PendingRequestTableTest, RecordThenResolve) {
  EXPECT_FALSE(
      table_.record(0x1234, "192.168.1.50", 54321, "192.168.1.1", t0_));
  EXPECT_TRUE(table_.contains(0x1234));
  EXPECT_EQ(table_.size(), 1u);

  auto entry = table_.resolve(0x1234, t0_ + 100ms);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->transaction_id, 0x1234);
  EXPECT_EQ(entry->requester_ip, "192.168.1.50");
  EXPECT_EQ(entry->requester_port, 54321);
  EXPECT_EQ(entry->interface_ip, "192.168.1.1");
  EXPECT_EQ(entry->created_at, t0_);
}

/**
 * @brief 条目只能使用一次
 */
TEST_F(PendingRequestTableTest, ResolveIsSingleUse) {
  table_.record(0x0001, "10.0.0.2", 40000, "10.0.0.1", t0_);

  ASSERT_TRUE(table_.resolve(0x0001, t0_).has_value());
  EXPECT_FALSE(table_.contains(0x0001));

  auto second = table_.resolve(0x0001, t0_);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, RelayErrorCode::kUnmatchedReply);
}

TEST_F(PendingRequestTableTest, ResolveUnknownIdIsUnmatched) {
  auto result = table_.resolve(0xBEEF, t0_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, RelayErrorCode::kUnmatchedReply);
  EXPECT_NE(result.error().message.find("0xbeef"), std::string::npos);
}

/**
 * @brief 相同事务ID的后一个请求覆盖前一个 (last write wins)
 */
TEST_F(PendingRequestTableTest, CollisionLastWriteWins) {
  EXPECT_FALSE(table_.record(0x0042, "10.0.0.2", 40000, "10.0.0.1", t0_));
  EXPECT_TRUE(
      table_.record(0x0042, "10.0.1.7", 40001, "10.0.1.1", t0_ + 10ms));
  EXPECT_EQ(table_.size(), 1u);

  auto entry = table_.resolve(0x0042, t0_ + 20ms);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->requester_ip, "10.0.1.7");
  EXPECT_EQ(entry->requester_port, 40001);
  EXPECT_EQ(entry->interface_ip, "10.0.1.1");
}

/**
 * @brief 超过 TTL 的条目无法解析，并在解析时被删除
 */
TEST_F(PendingRequestTableTest, ExpiredEntryIsUnmatchedAndRemoved) {
  table_.record(0x0007, "10.0.0.2", 40000, "10.0.0.1", t0_);

  auto result = table_.resolve(0x0007, t0_ + 5s + 1ms);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, RelayErrorCode::kUnmatchedReply);
  EXPECT_FALSE(table_.contains(0x0007));
}

TEST_F(PendingRequestTableTest, EntryAtExactlyTtlIsStillLive) {
  table_.record(0x0008, "10.0.0.2", 40000, "10.0.0.1", t0_);
  EXPECT_TRUE(table_.resolve(0x0008, t0_ + 5s).has_value());
}

TEST_F(PendingRequestTableTest, SweepRemovesOnlyExpiredEntries) {
  table_.record(0x0001, "10.0.0.2", 40000, "10.0.0.1", t0_);
  table_.record(0x0002, "10.0.0.3", 40000, "10.0.0.1", t0_ + 2s);
  table_.record(0x0003, "10.0.0.4", 40000, "10.0.0.1", t0_ + 4s);

  EXPECT_EQ(table_.sweep(t0_ + 6s), 1u);
  EXPECT_FALSE(table_.contains(0x0001));
  EXPECT_TRUE(table_.contains(0x0002));
  EXPECT_TRUE(table_.contains(0x0003));

  EXPECT_EQ(table_.sweep(t0_ + 6s, 1s), 2u);
  EXPECT_EQ(table_.size(), 0u);
  EXPECT_EQ(table_.sweep(t0_ + 60s), 0u);
}

TEST_F(PendingRequestTableTest, DefaultTtl) {
  PendingRequestTable table;
  EXPECT_EQ(table.ttl(), constants::kDefaultRequestTtl);
  EXPECT_EQ(table_.ttl(), 5s);
}

/**
 * @brief 并发记录与解析：每个事务ID恰好被解析一次
 */
TEST_F(PendingRequestTableTest, ConcurrentRecordAndResolve) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([this, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const auto id = static_cast<TransactionId>(t * kPerThread + i);
        table_.record(id, "10.0.0.2", 40000, "10.0.0.1");
      }
    });
  }
  for (auto& thread : writers) {
    thread.join();
  }
  ASSERT_EQ(table_.size(), static_cast<size_t>(kThreads * kPerThread));

  std::atomic<int> resolved{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < kThreads; ++t) {
    readers.emplace_back([this, &resolved] {
      for (int id = 0; id < kThreads * kPerThread; ++id) {
        if (table_.resolve(static_cast<TransactionId>(id)).has_value()) {
          ++resolved;
        }
      }
    });
  }
  for (auto& thread : readers) {
    thread.join();
  }

  EXPECT_EQ(resolved.load(), kThreads * kPerThread);
  EXPECT_EQ(table_.size(), 0u);
}
