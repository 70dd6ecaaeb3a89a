#include "network/response_listener.hpp"

#include <algorithm>

#include "common/logging.hpp"
#include "network/error_context.hpp"
#include "network/gvcp_packet.hpp"

namespace gvrelay::network {

ResponseListener::ResponseListener(const std::vector<DeviceEndpoint>& devices,
                                   ResponseRelay& relay,
                                   core::RelayStats& stats)
    : socket_(ioc_), relay_(relay), stats_(stats) {
  for (const auto& device : devices) {
    boost::system::error_code ec;
    const auto address = net::ip::make_address_v4(device.ip, ec);
    if (!ec) {
      device_addresses_.push_back(address);
    }
  }
}

ResponseListener::~ResponseListener() { stop(); }

auto ResponseListener::bind(const std::string& address, const Port port)
    -> tl::expected<udp::endpoint, RelayError> {
  boost::system::error_code ec;
  const auto bind_address = net::ip::make_address_v4(address, ec);
  if (ec) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kBindFailure, "invalid address '" + address + "'"});
  }

  const udp::endpoint listen_endpoint(bind_address, port);
  socket_.open(listen_endpoint.protocol(), ec);
  if (!ec) {
    socket_.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    socket_.bind(listen_endpoint, ec);
  }
  if (!ec) {
    local_endpoint_ = socket_.local_endpoint(ec);
  }
  if (ec) {
    boost::system::error_code ignored;
    socket_.close(ignored);
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kBindFailure,
        "response listener bind to " + address + ":" + std::to_string(port) +
            " failed: " + ec.message()});
  }

  return local_endpoint_;
}

void ResponseListener::start() {
  if (!socket_.is_open() || thread_.joinable()) {
    return;
  }

  LOG_INFO << "Response listener waiting for device replies on "
           << local_endpoint_.address().to_string() << ":"
           << local_endpoint_.port();
  stop_flag_ = false;
  do_receive();
  thread_ = std::thread([this] {
    try {
      ioc_.run();
    } catch (const std::exception& e) {
      LOG_ERROR << "Response listener stopped unexpectedly: " << e.what();
    }
  });
}

void ResponseListener::stop() {
  stop_flag_ = true;
  if (thread_.joinable()) {
    net::post(ioc_, [this] {
      boost::system::error_code ignored;
      socket_.close(ignored);
    });
    thread_.join();
  } else if (socket_.is_open()) {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }
}

void ResponseListener::sendToDevice(std::shared_ptr<const Bytes> request,
                                    const udp::endpoint& device) {
  net::post(ioc_, [this, request = std::move(request), device] {
    if (!socket_.is_open()) {
      return;
    }
    socket_.async_send_to(
        net::buffer(*request), device,
        [this, request, device](const boost::system::error_code& ec,
                                std::size_t /*bytes_transferred*/) {
          const std::string target =
              device.address().to_string() + ":" +
              std::to_string(device.port());
          if (ec) {
            const RelayError error{RelayErrorCode::kForwardFailure,
                                   ec.message()};
            stats_.recordError(error.code);
            ErrorLogger::logRelayError(NetworkContext("forward", target),
                                       error);
            return;
          }
          stats_.incrementUnicastForwards();
          LOG_DEBUG << "Forwarded to " << target << " via response listener";
        });
  });
}

auto ResponseListener::localEndpoint() const -> udp::endpoint {
  return local_endpoint_;
}

void ResponseListener::do_receive() {
  if (stop_flag_) return;

  socket_.async_receive_from(
      net::buffer(recv_buffer_), remote_endpoint_,
      [this](const boost::system::error_code& ec, const std::size_t bytes) {
        handle_receive(ec, bytes);
      });
}

void ResponseListener::handle_receive(const boost::system::error_code& error,
                                      const std::size_t bytes_transferred) {
  if (error) {
    if (ErrorHelper::isCancellation(error) || stop_flag_) {
      return;
    }
    // ICMP errors from earlier sends surface here; keep listening
    LOG_DEBUG << "Response listener receive error: " << error.message();
    do_receive();
    return;
  }

  try {
    const std::string sender = remote_endpoint_.address().to_string() + ":" +
                               std::to_string(remote_endpoint_.port());
    Bytes datagram(recv_buffer_.begin(),
                   recv_buffer_.begin() + bytes_transferred);

    if (!isConfiguredDevice(remote_endpoint_)) {
      LOG_DEBUG << "Ignoring " << bytes_transferred << " bytes from "
                << sender << ": not a configured device";
    } else if (!gvcp::isDiscoveryReply(datagram)) {
      LOG_DEBUG << "Ignoring non-discovery packet from " << sender;
    } else {
      stats_.incrementRepliesReceived();
      if (auto delivery = relay_.relay(datagram); delivery) {
        LOG_DEBUG << "Late reply from " << sender << " relayed to "
                  << delivery->request.requester_ip << ":"
                  << delivery->request.requester_port;
      }
    }
  } catch (const std::exception& e) {
    stats_.recordError(RelayErrorCode::kRelayFailure);
    LOG_ERROR << "Response listener failed to handle datagram: " << e.what();
  }

  do_receive();
}

auto ResponseListener::isConfiguredDevice(const udp::endpoint& sender) const
    -> bool {
  if (!sender.address().is_v4()) {
    return false;
  }
  const auto address = sender.address().to_v4();
  return std::find(device_addresses_.begin(), device_addresses_.end(),
                   address) != device_addresses_.end();
}

}  // namespace gvrelay::network
