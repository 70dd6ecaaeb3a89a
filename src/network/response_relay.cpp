#include "network/response_relay.hpp"

#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "network/error_context.hpp"
#include "network/gvcp_packet.hpp"

namespace gvrelay::network {

ResponseRelay::ResponseRelay(core::PendingRequestTable& table,
                             core::RelayStats& stats)
    : table_(table), stats_(stats) {}

auto ResponseRelay::relay(const Bytes& reply,
                          const SteadyClock::time_point now)
    -> tl::expected<Delivery, RelayError> {
  auto header = gvcp::parseHeader(reply);
  if (!header || !gvcp::isDiscoveryReply(*header)) {
    RelayError error = header ? RelayError{RelayErrorCode::kMalformedPacket,
                                           "not a discovery reply: " +
                                               gvcp::describeHeader(*header)}
                              : header.error();
    stats_.recordError(error.code);
    ErrorLogger::logRelayError(NetworkContext("relay", "device"), error);
    return tl::make_unexpected(std::move(error));
  }

  const TransactionId id = header->transaction_id;
  auto request = table_.resolve(id, now);
  if (!request) {
    stats_.recordError(request.error().code);
    ErrorLogger::logRelayError(NetworkContext("relay", "device", id),
                               request.error());
    return tl::make_unexpected(request.error());
  }

  if (logger::Logger::shouldLog(logger::LogLevel::DEBUG)) {
    logDeviceInfo(reply);
  }

  auto source = sendFromInterface(reply, *request);
  if (!source) {
    stats_.recordError(source.error().code);
    ErrorLogger::logRelayError(
        NetworkContext("relay",
                       request->requester_ip + ":" +
                           std::to_string(request->requester_port),
                       id),
        source.error());
    return tl::make_unexpected(source.error());
  }

  stats_.incrementRepliesRelayed();
  LOG_DEBUG << "Relayed reply " << common::format_transaction_id(id) << " ("
            << reply.size() << " bytes) from " << source->address().to_string()
            << ":" << source->port() << " to " << request->requester_ip << ":"
            << request->requester_port;

  return Delivery{std::move(*request), *source, reply.size()};
}

auto ResponseRelay::sendFromInterface(const Bytes& reply,
                                      const core::PendingRequest& request)
    -> tl::expected<udp::endpoint, RelayError> {
  boost::system::error_code ec;

  const auto interface_address =
      net::ip::make_address_v4(request.interface_ip, ec);
  if (ec) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kRelayFailure,
        "invalid interface address '" + request.interface_ip + "'"});
  }
  const auto requester_address =
      net::ip::make_address_v4(request.requester_ip, ec);
  if (ec) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kRelayFailure,
        "invalid requester address '" + request.requester_ip + "'"});
  }

  udp::socket socket(ioc_);
  socket.open(udp::v4(), ec);
  if (ec) {
    return tl::make_unexpected(RelayError{RelayErrorCode::kRelayFailure,
                                          "open failed: " + ec.message()});
  }

  // The source address is what the requester validates.
  socket.bind(udp::endpoint(interface_address, 0), ec);
  if (ec) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kRelayFailure,
                   "bind to " + request.interface_ip + " failed: " +
                       ec.message()});
  }

  if (requester_address.to_uint() == 0xFFFFFFFFu) {
    socket.set_option(net::socket_base::broadcast(true), ec);
  }

  socket.send_to(net::buffer(reply),
                 udp::endpoint(requester_address, request.requester_port), 0,
                 ec);
  if (ec) {
    return tl::make_unexpected(RelayError{RelayErrorCode::kRelayFailure,
                                          "send failed: " + ec.message()});
  }

  auto source = socket.local_endpoint(ec);
  if (ec) {
    source = udp::endpoint(interface_address, 0);
  }
  socket.close(ec);
  return source;
}

void ResponseRelay::logDeviceInfo(const Bytes& reply) const {
  auto info = gvcp::parseDeviceInfo(reply);
  if (!info) {
    LOG_DEBUG << "Discovery reply without a full bootstrap block: "
              << info.error().message;
    return;
  }
  LOG_DEBUG << "Device " << info->manufacturer << " " << info->model
            << " (serial " << info->serial_number << ", MAC "
            << info->macString() << ", IP " << info->current_ip << ")";
}

}  // namespace gvrelay::network
