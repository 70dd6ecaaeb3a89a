#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "core/relay_stats.hpp"

using namespace gvrelay;
using namespace gvrelay::core;

TEST(RelayStatsTest, StartsAtZero) {
  RelayStats stats;
  const auto snapshot = stats.snapshot();
  EXPECT_EQ(snapshot.requests_received, 0u);
  EXPECT_EQ(snapshot.unicast_forwards, 0u);
  EXPECT_EQ(snapshot.replies_received, 0u);
  EXPECT_EQ(snapshot.replies_relayed, 0u);
  EXPECT_EQ(snapshot.errors, 0u);
  EXPECT_EQ(snapshot.pending, 0u);
}

/**
 * @brief 错误总数只包含 malformed/bind/forward/relay 四类
 */
TEST(RelayStatsTest, ErrorCategories) {
  RelayStats stats;
  stats.recordError(RelayErrorCode::kMalformedPacket);
  stats.recordError(RelayErrorCode::kBindFailure);
  stats.recordError(RelayErrorCode::kForwardFailure);
  stats.recordError(RelayErrorCode::kForwardFailure);
  stats.recordError(RelayErrorCode::kRelayFailure);
  stats.recordError(RelayErrorCode::kUnmatchedReply);
  stats.recordError(RelayErrorCode::kConfiguration);

  const auto snapshot = stats.snapshot();
  EXPECT_EQ(snapshot.errors, 5u);
  EXPECT_EQ(stats.getErrors(), 5u);
  EXPECT_EQ(snapshot.malformed_packets, 1u);
  EXPECT_EQ(snapshot.bind_failures, 1u);
  EXPECT_EQ(snapshot.forward_failures, 2u);
  EXPECT_EQ(snapshot.relay_failures, 1u);
  EXPECT_EQ(snapshot.unmatched_replies, 1u);
}

TEST(RelayStatsTest, Summary) {
  RelayStats stats;
  stats.incrementRequestsReceived();
  stats.incrementUnicastForwards();
  stats.incrementUnicastForwards();
  stats.incrementRepliesReceived();
  stats.incrementRepliesRelayed();
  stats.addExpiredRequests(3);

  const auto snapshot = stats.snapshot(4);
  EXPECT_EQ(snapshot.expired_requests, 3u);
  EXPECT_EQ(snapshot.summary(),
            "RX=1, FWD=2, RESP_RX=1, RESP_FWD=1, ERR=0, PENDING=4");
}

TEST(RelayStatsTest, ConcurrentIncrements) {
  RelayStats stats;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&stats] {
      for (int i = 0; i < 1000; ++i) {
        stats.incrementRequestsReceived();
        stats.recordError(RelayErrorCode::kForwardFailure);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto snapshot = stats.snapshot();
  EXPECT_EQ(snapshot.requests_received, 8000u);
  EXPECT_EQ(snapshot.forward_failures, 8000u);
  EXPECT_EQ(snapshot.errors, 8000u);
}
