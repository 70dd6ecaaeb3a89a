#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <tl/expected.hpp>
#include <unordered_map>

#include "common/constants.hpp"
#include "common/relay_error.hpp"
#include "common/types.hpp"

namespace gvrelay::core {

/**
 * @brief A discovery request waiting for a device reply.
 */
struct PendingRequest {
  TransactionId transaction_id = 0;
  IpAddress requester_ip;
  Port requester_port = 0;
  /// Local address the request arrived on; the reply must leave from here.
  IpAddress interface_ip;
  SteadyClock::time_point created_at;
};

/**
 * @brief Correlates in-flight discovery transactions with their requesters.
 *
 * The transaction id is the only key. Recording an id that is already present
 * replaces the older entry (last write wins). Entries are single-use: a
 * successful resolve removes them.
 *
 * 此类是线程安全的；所有访问都经过同一个互斥锁。
 */
class PendingRequestTable {
 public:
  using Clock = SteadyClock;

  explicit PendingRequestTable(
      Clock::duration ttl = constants::kDefaultRequestTtl);

  PendingRequestTable(const PendingRequestTable&) = delete;
  auto operator=(const PendingRequestTable&) -> PendingRequestTable& = delete;

  /**
   * @brief Inserts or overwrites the entry for @p transaction_id.
   * @return true if an existing entry was replaced.
   */
  auto record(TransactionId transaction_id, IpAddress requester_ip,
              Port requester_port, IpAddress interface_ip,
              Clock::time_point now = Clock::now()) -> bool;

  /**
   * @brief Removes and returns the entry for @p transaction_id.
   *
   * Fails with kUnmatchedReply when no entry exists or the entry is older
   * than the TTL; an expired entry is dropped as a side effect.
   */
  auto resolve(TransactionId transaction_id,
               Clock::time_point now = Clock::now())
      -> tl::expected<PendingRequest, RelayError>;

  /**
   * @brief Removes every entry with now - created_at > ttl.
   * @return the number of removed entries.
   */
  auto sweep(Clock::time_point now, Clock::duration ttl) -> std::size_t;
  auto sweep(Clock::time_point now = Clock::now()) -> std::size_t;

  [[nodiscard]] auto contains(TransactionId transaction_id) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto ttl() const -> Clock::duration { return ttl_; }

 private:
  const Clock::duration ttl_;
  std::unordered_map<TransactionId, PendingRequest> entries_;
  mutable std::mutex mutex_;
};

}  // namespace gvrelay::core
