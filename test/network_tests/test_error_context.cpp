#include <gtest/gtest.h>

#include "network/error_context.hpp"

using namespace gvrelay;
using namespace gvrelay::network;

TEST(ErrorContextTest, LevelForErrorKinds) {
  using logger::LogLevel;
  EXPECT_EQ(ErrorLogger::levelFor(RelayErrorCode::kMalformedPacket),
            LogLevel::DEBUG);
  EXPECT_EQ(ErrorLogger::levelFor(RelayErrorCode::kUnmatchedReply),
            LogLevel::DEBUG);
  EXPECT_EQ(ErrorLogger::levelFor(RelayErrorCode::kForwardFailure),
            LogLevel::ERROR);
  EXPECT_EQ(ErrorLogger::levelFor(RelayErrorCode::kRelayFailure),
            LogLevel::ERROR);
  EXPECT_EQ(ErrorLogger::levelFor(RelayErrorCode::kBindFailure),
            LogLevel::ERROR);
  EXPECT_EQ(ErrorLogger::levelFor(RelayErrorCode::kConfiguration),
            LogLevel::FATAL);
}

TEST(ErrorContextTest, CancellationCodes) {
  EXPECT_TRUE(ErrorHelper::isCancellation(boost::asio::error::operation_aborted));
  EXPECT_TRUE(ErrorHelper::isCancellation(boost::asio::error::bad_descriptor));
  EXPECT_FALSE(ErrorHelper::isCancellation(boost::asio::error::timed_out));
  EXPECT_FALSE(ErrorHelper::isCancellation(boost::system::error_code{}));
}

TEST(ErrorContextTest, UnreachableCodes) {
  EXPECT_TRUE(ErrorHelper::isUnreachable(boost::asio::error::host_unreachable));
  EXPECT_TRUE(
      ErrorHelper::isUnreachable(boost::asio::error::connection_refused));
  EXPECT_FALSE(ErrorHelper::isUnreachable(boost::asio::error::would_block));
}

TEST(ErrorContextTest, LogRelayErrorAcceptsMissingTransaction) {
  const NetworkContext ctx("forward", "10.0.0.5:3956");
  EXPECT_NO_THROW(ErrorLogger::logRelayError(
      ctx, RelayError{RelayErrorCode::kForwardFailure, "network unreachable"}));

  const NetworkContext with_id("relay", "10.0.0.9:50000", TransactionId{0x1234});
  EXPECT_TRUE(with_id.transaction_id.has_value());
  EXPECT_NO_THROW(ErrorLogger::logRelayError(
      with_id, RelayError{RelayErrorCode::kRelayFailure, "send failed"}));
}
