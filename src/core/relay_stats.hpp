#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "common/relay_error.hpp"

namespace gvrelay::core {

struct RelayStatsSnapshot {
  std::uint64_t requests_received = 0;
  std::uint64_t unicast_forwards = 0;
  std::uint64_t replies_received = 0;
  std::uint64_t replies_relayed = 0;
  std::uint64_t errors = 0;

  std::uint64_t malformed_packets = 0;
  std::uint64_t bind_failures = 0;
  std::uint64_t forward_failures = 0;
  std::uint64_t relay_failures = 0;
  std::uint64_t unmatched_replies = 0;
  std::uint64_t expired_requests = 0;

  std::size_t pending = 0;

  /// @brief "RX=.. FWD=.. RESP_RX=.. RESP_FWD=.. ERR=.. PENDING=.."
  auto summary() const -> std::string;
};

/**
 * @brief Relay counters, shared by every worker thread.
 *
 * All counters are independent atomics, so a snapshot taken while traffic is
 * flowing is not a consistent cut across counters.
 */
class RelayStats {
 public:
  RelayStats() = default;
  RelayStats(const RelayStats&) = delete;
  auto operator=(const RelayStats&) -> RelayStats& = delete;

  void incrementRequestsReceived() { requests_received_.fetch_add(1); }
  void incrementUnicastForwards() { unicast_forwards_.fetch_add(1); }
  void incrementRepliesReceived() { replies_received_.fetch_add(1); }
  void incrementRepliesRelayed() { replies_relayed_.fetch_add(1); }
  void addExpiredRequests(std::uint64_t count) {
    expired_requests_.fetch_add(count);
  }

  /**
   * @brief Counts an error by category. kUnmatchedReply is tracked but does
   * not add to the total error count; kConfiguration is never counted.
   */
  void recordError(RelayErrorCode code);

  [[nodiscard]] auto getErrors() const -> std::uint64_t {
    return errors_.load();
  }

  [[nodiscard]] auto snapshot(std::size_t pending = 0) const
      -> RelayStatsSnapshot;

 private:
  std::atomic<std::uint64_t> requests_received_{0};
  std::atomic<std::uint64_t> unicast_forwards_{0};
  std::atomic<std::uint64_t> replies_received_{0};
  std::atomic<std::uint64_t> replies_relayed_{0};
  std::atomic<std::uint64_t> errors_{0};

  std::atomic<std::uint64_t> malformed_packets_{0};
  std::atomic<std::uint64_t> bind_failures_{0};
  std::atomic<std::uint64_t> forward_failures_{0};
  std::atomic<std::uint64_t> relay_failures_{0};
  std::atomic<std::uint64_t> unmatched_replies_{0};
  std::atomic<std::uint64_t> expired_requests_{0};
};

}  // namespace gvrelay::core
