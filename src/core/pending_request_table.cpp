#include "pending_request_table.hpp"

#include "common/string_utils.hpp"

namespace gvrelay::core {

PendingRequestTable::PendingRequestTable(const Clock::duration ttl)
    : ttl_(ttl) {}

auto PendingRequestTable::record(const TransactionId transaction_id,
                                 IpAddress requester_ip,
                                 const Port requester_port,
                                 IpAddress interface_ip,
                                 const Clock::time_point now) -> bool {
  PendingRequest entry{transaction_id, std::move(requester_ip), requester_port,
                       std::move(interface_ip), now};

  std::lock_guard lock(mutex_);
  const auto result = entries_.insert_or_assign(transaction_id,
                                                std::move(entry));
  return !result.second;
}

auto PendingRequestTable::resolve(const TransactionId transaction_id,
                                  const Clock::time_point now)
    -> tl::expected<PendingRequest, RelayError> {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(transaction_id);
  if (it == entries_.end()) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kUnmatchedReply,
                   "no pending request for transaction " +
                       common::format_transaction_id(transaction_id)});
  }

  if (now - it->second.created_at > ttl_) {
    entries_.erase(it);
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kUnmatchedReply,
                   "pending request for transaction " +
                       common::format_transaction_id(transaction_id) +
                       " has expired"});
  }

  PendingRequest entry = std::move(it->second);
  entries_.erase(it);
  return entry;
}

auto PendingRequestTable::sweep(const Clock::time_point now,
                                const Clock::duration ttl) -> std::size_t {
  std::lock_guard lock(mutex_);

  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.created_at > ttl) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

auto PendingRequestTable::sweep(const Clock::time_point now) -> std::size_t {
  return sweep(now, ttl_);
}

auto PendingRequestTable::contains(const TransactionId transaction_id) const
    -> bool {
  std::lock_guard lock(mutex_);
  return entries_.count(transaction_id) != 0;
}

auto PendingRequestTable::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace gvrelay::core
