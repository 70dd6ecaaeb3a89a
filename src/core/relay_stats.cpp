#include "relay_stats.hpp"

#include <fmt/format.h>

namespace gvrelay::core {

auto RelayStatsSnapshot::summary() const -> std::string {
  return fmt::format("RX={}, FWD={}, RESP_RX={}, RESP_FWD={}, ERR={}, PENDING={}",
                     requests_received, unicast_forwards, replies_received,
                     replies_relayed, errors, pending);
}

void RelayStats::recordError(const RelayErrorCode code) {
  switch (code) {
    case RelayErrorCode::kMalformedPacket:
      malformed_packets_.fetch_add(1);
      break;
    case RelayErrorCode::kBindFailure:
      bind_failures_.fetch_add(1);
      break;
    case RelayErrorCode::kForwardFailure:
      forward_failures_.fetch_add(1);
      break;
    case RelayErrorCode::kRelayFailure:
      relay_failures_.fetch_add(1);
      break;
    case RelayErrorCode::kUnmatchedReply:
      unmatched_replies_.fetch_add(1);
      return;
    case RelayErrorCode::kConfiguration:
      return;
  }
  errors_.fetch_add(1);
}

auto RelayStats::snapshot(const std::size_t pending) const
    -> RelayStatsSnapshot {
  RelayStatsSnapshot s;
  s.requests_received = requests_received_.load();
  s.unicast_forwards = unicast_forwards_.load();
  s.replies_received = replies_received_.load();
  s.replies_relayed = replies_relayed_.load();
  s.errors = errors_.load();
  s.malformed_packets = malformed_packets_.load();
  s.bind_failures = bind_failures_.load();
  s.forward_failures = forward_failures_.load();
  s.relay_failures = relay_failures_.load();
  s.unmatched_replies = unmatched_replies_.load();
  s.expired_requests = expired_requests_.load();
  s.pending = pending;
  return s;
}

}  // namespace gvrelay::core
