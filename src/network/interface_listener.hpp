#ifndef GVRELAY_NETWORK_INTERFACE_LISTENER_HPP
#define GVRELAY_NETWORK_INTERFACE_LISTENER_HPP

#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <string>
#include <thread>
#include <tl/expected.hpp>

#include "common/constants.hpp"
#include "common/relay_error.hpp"
#include "common/types.hpp"
#include "core/pending_request_table.hpp"
#include "core/relay_stats.hpp"
#include "network/device_forwarder.hpp"

namespace gvrelay::network {

namespace net = boost::asio;
using udp = net::ip::udp;

enum class BindMode : std::uint8_t {
  kAddress,  // bind (interface_ip, port)
  kDevice    // bind (0.0.0.0, port) + SO_BINDTODEVICE，可收到子网广播
};

enum class DatagramAction : std::uint8_t { kForwarded, kIgnored };

/**
 * @brief Receives discovery broadcasts on one local interface.
 *
 * Each listener owns its socket, io_context and thread. A discovery request
 * is recorded in the pending table against this listener's interface address
 * and then handed to the DeviceForwarder.
 */
class InterfaceListener {
 public:
  InterfaceListener(IpAddress interface_ip, std::string device_name,
                    Port listen_port, BindMode mode,
                    core::PendingRequestTable& table,
                    DeviceForwarder& forwarder, core::RelayStats& stats);
  ~InterfaceListener();

  InterfaceListener(const InterfaceListener&) = delete;
  auto operator=(const InterfaceListener&) -> InterfaceListener& = delete;

  /**
   * @brief Opens and binds the socket.
   *
   * A failure is counted as kBindFailure and logged; the listener stays
   * unusable but nothing else is affected.
   */
  auto bind() -> tl::expected<udp::endpoint, RelayError>;

  void start();
  void stop();

  /**
   * @brief Classifies one datagram and, for a discovery request, records it
   * and forwards it to the devices.
   *
   * Returns kMalformedPacket for datagrams shorter than a header; those never
   * touch the pending table.
   */
  auto processDatagram(const Bytes& datagram, const udp::endpoint& sender,
                       SteadyClock::time_point now = SteadyClock::now())
      -> tl::expected<DatagramAction, RelayError>;

  [[nodiscard]] auto interfaceIp() const -> const IpAddress& {
    return interface_ip_;
  }
  [[nodiscard]] auto localEndpoint() const -> udp::endpoint {
    return local_endpoint_;
  }
  [[nodiscard]] auto isBound() const -> bool { return bound_; }

 private:
  void do_receive();
  void handle_receive(const boost::system::error_code& error,
                      std::size_t bytes_transferred);
  auto bindToDevice() -> boost::system::error_code;

  const IpAddress interface_ip_;
  const std::string device_name_;
  const Port listen_port_;
  const BindMode mode_;

  core::PendingRequestTable& table_;
  DeviceForwarder& forwarder_;
  core::RelayStats& stats_;

  net::io_context ioc_;
  udp::socket socket_;
  udp::endpoint remote_endpoint_;
  udp::endpoint local_endpoint_;
  std::array<std::uint8_t, constants::kReceiveBufferSize> recv_buffer_{};
  std::thread thread_;
  std::atomic<bool> stop_flag_{false};
  bool bound_ = false;
};

}  // namespace gvrelay::network

#endif  // GVRELAY_NETWORK_INTERFACE_LISTENER_HPP
