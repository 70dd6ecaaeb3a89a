#ifndef GVRELAY_NETWORK_RESPONSE_RELAY_HPP
#define GVRELAY_NETWORK_RESPONSE_RELAY_HPP

#include <boost/asio.hpp>
#include <cstddef>
#include <tl/expected.hpp>

#include "common/relay_error.hpp"
#include "common/types.hpp"
#include "core/pending_request_table.hpp"
#include "core/relay_stats.hpp"

namespace gvrelay::network {

namespace net = boost::asio;
using udp = net::ip::udp;

/**
 * @brief Sends device discovery replies back to the original requester.
 *
 * A reply is correlated by transaction id and re-emitted, byte for byte, from
 * a socket bound to the interface address the request arrived on. Clients
 * that bound their discovery socket to one interface drop replies whose
 * source address does not belong to it.
 *
 * relay() is safe to call from any thread.
 */
class ResponseRelay {
 public:
  struct Delivery {
    core::PendingRequest request;
    udp::endpoint source;  // local endpoint the reply left from
    std::size_t bytes = 0;
  };

  ResponseRelay(core::PendingRequestTable& table, core::RelayStats& stats);

  ResponseRelay(const ResponseRelay&) = delete;
  auto operator=(const ResponseRelay&) -> ResponseRelay& = delete;

  /**
   * @brief Correlates @p reply and forwards it to its requester.
   *
   * Errors: kMalformedPacket (not a discovery reply), kUnmatchedReply (no live
   * entry, e.g. expired or already answered), kRelayFailure (bind/send).
   * Every outcome is counted in the stats.
   */
  auto relay(const Bytes& reply,
             SteadyClock::time_point now = SteadyClock::now())
      -> tl::expected<Delivery, RelayError>;

 private:
  auto sendFromInterface(const Bytes& reply,
                         const core::PendingRequest& request)
      -> tl::expected<udp::endpoint, RelayError>;

  void logDeviceInfo(const Bytes& reply) const;

  // Only hosts short-lived synchronous sockets; never run.
  net::io_context ioc_;
  core::PendingRequestTable& table_;
  core::RelayStats& stats_;
};

}  // namespace gvrelay::network

#endif  // GVRELAY_NETWORK_RESPONSE_RELAY_HPP
