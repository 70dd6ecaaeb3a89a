#include "network/interface_listener.hpp"

#include <sys/socket.h>

#include <cerrno>

#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "network/error_context.hpp"
#include "network/gvcp_packet.hpp"

namespace gvrelay::network {

InterfaceListener::InterfaceListener(IpAddress interface_ip,
                                     std::string device_name,
                                     const Port listen_port,
                                     const BindMode mode,
                                     core::PendingRequestTable& table,
                                     DeviceForwarder& forwarder,
                                     core::RelayStats& stats)
    : interface_ip_(std::move(interface_ip)),
      device_name_(std::move(device_name)),
      listen_port_(listen_port),
      mode_(mode),
      table_(table),
      forwarder_(forwarder),
      stats_(stats),
      socket_(ioc_) {}

InterfaceListener::~InterfaceListener() { stop(); }

auto InterfaceListener::bind() -> tl::expected<udp::endpoint, RelayError> {
  boost::system::error_code ec;
  auto address = net::ip::make_address_v4(interface_ip_, ec);
  if (!ec && mode_ == BindMode::kDevice) {
    address = net::ip::address_v4::any();
  }

  const udp::endpoint listen_endpoint(address, listen_port_);
  if (!ec) {
    socket_.open(listen_endpoint.protocol(), ec);
  }
  if (!ec) {
    socket_.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    socket_.set_option(net::socket_base::broadcast(true), ec);
  }
  if (!ec && mode_ == BindMode::kDevice) {
    ec = bindToDevice();
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

    const RelayError error{RelayErrorCode::kBindFailure,
                           "cannot listen on " + interface_ip_ + ":" +
                               std::to_string(listen_port_) + ": " +
                               ec.message()};
    stats_.recordError(error.code);
    ErrorLogger::logRelayError(NetworkContext("bind", interface_ip_), error);
    return tl::make_unexpected(error);
  }

  bound_ = true;
  return local_endpoint_;
}

auto InterfaceListener::bindToDevice() -> boost::system::error_code {
#ifdef SO_BINDTODEVICE
  if (device_name_.empty()) {
    return boost::asio::error::no_such_device;
  }
  if (::setsockopt(socket_.native_handle(), SOL_SOCKET, SO_BINDTODEVICE,
                   device_name_.c_str(),
                   static_cast<socklen_t>(device_name_.size())) != 0) {
    return {errno, boost::system::system_category()};
  }
  return {};
#else
  return boost::asio::error::operation_not_supported;
#endif
}

void InterfaceListener::start() {
  if (!bound_ || thread_.joinable()) {
    return;
  }

  LOG_INFO << "Listening for discovery broadcasts on " << interface_ip_
           << (device_name_.empty() ? "" : " (" + device_name_ + ")")
           << ", bound to " << local_endpoint_.address().to_string() << ":"
           << local_endpoint_.port();

  stop_flag_ = false;
  do_receive();
  thread_ = std::thread([this] {
    try {
      ioc_.run();
    } catch (const std::exception& e) {
      LOG_ERROR << "Listener on " << interface_ip_
                << " stopped unexpectedly: " << e.what();
    }
  });
}

void InterfaceListener::stop() {
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

auto InterfaceListener::processDatagram(const Bytes& datagram,
                                        const udp::endpoint& sender,
                                        const SteadyClock::time_point now)
    -> tl::expected<DatagramAction, RelayError> {
  const std::string sender_ip = sender.address().to_string();
  const std::string sender_str =
      sender_ip + ":" + std::to_string(sender.port());

  auto header = gvcp::parseHeader(datagram);
  if (!header) {
    stats_.recordError(header.error().code);
    ErrorLogger::logRelayError(NetworkContext("receive", sender_str),
                               header.error());
    return tl::make_unexpected(header.error());
  }

  if (!gvcp::isDiscoveryRequest(*header)) {
    LOG_DEBUG << "Ignoring " << gvcp::describeHeader(*header) << " from "
              << sender_str << " on " << interface_ip_;
    return DatagramAction::kIgnored;
  }

  const bool replaced = table_.record(header->transaction_id, sender_ip,
                                      sender.port(), interface_ip_, now);
  stats_.incrementRequestsReceived();

  LOG_INFO << "Discovery request "
           << common::format_transaction_id(header->transaction_id)
           << " from " << sender_str << " on " << interface_ip_;
  if (replaced) {
    LOG_DEBUG << "Transaction "
              << common::format_transaction_id(header->transaction_id)
              << " was already pending; newest requester wins";
  }
  LOG_TRACE << "Request bytes: " << common::to_hex(datagram);

  const auto report = forwarder_.forward(datagram);
  if (report.sent == 0 && report.failed > 0) {
    LOG_WARNING << "Request "
                << common::format_transaction_id(header->transaction_id)
                << " could not be forwarded to any device";
  }

  return DatagramAction::kForwarded;
}

void InterfaceListener::do_receive() {
  if (stop_flag_) return;

  socket_.async_receive_from(
      net::buffer(recv_buffer_), remote_endpoint_,
      [this](const boost::system::error_code& ec, const std::size_t bytes) {
        handle_receive(ec, bytes);
      });
}

void InterfaceListener::handle_receive(const boost::system::error_code& error,
                                       const std::size_t bytes_transferred) {
  if (error) {
    if (ErrorHelper::isCancellation(error) || stop_flag_) {
      return;
    }
    LOG_WARNING << "Receive error on " << interface_ip_ << ": "
                << error.message();
    do_receive();
    return;
  }

  try {
    const Bytes datagram(recv_buffer_.begin(),
                         recv_buffer_.begin() + bytes_transferred);
    // 错误已在 processDatagram 中计数并记录
    (void)processDatagram(datagram, remote_endpoint_);
  } catch (const std::exception& e) {
    stats_.recordError(RelayErrorCode::kForwardFailure);
    LOG_ERROR << "Failed to handle datagram on " << interface_ip_ << ": "
              << e.what();
  }

  do_receive();
}

}  // namespace gvrelay::network
