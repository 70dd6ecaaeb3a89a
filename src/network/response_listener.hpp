#ifndef GVRELAY_NETWORK_RESPONSE_LISTENER_HPP
#define GVRELAY_NETWORK_RESPONSE_LISTENER_HPP

#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <thread>
#include <tl/expected.hpp>
#include <vector>

#include "common/constants.hpp"
#include "common/relay_error.hpp"
#include "common/types.hpp"
#include "core/relay_stats.hpp"
#include "network/device_endpoint.hpp"
#include "network/response_relay.hpp"

namespace gvrelay::network {

/**
 * @brief Long-lived socket that catches device replies arriving outside the
 * forwarder's inline wait.
 *
 * Only discovery replies whose source address is a configured device are
 * handed to the ResponseRelay. In shared forward mode the forwarder also
 * sends its requests through this socket, so devices answer here.
 */
class ResponseListener {
 public:
  ResponseListener(const std::vector<DeviceEndpoint>& devices,
                   ResponseRelay& relay, core::RelayStats& stats);
  ~ResponseListener();

  ResponseListener(const ResponseListener&) = delete;
  auto operator=(const ResponseListener&) -> ResponseListener& = delete;

  /// @brief Port 0 picks an ephemeral port.
  auto bind(const std::string& address, Port port)
      -> tl::expected<udp::endpoint, RelayError>;

  void start();
  void stop();

  /**
   * @brief Queues @p request for sending to @p device from the listener
   * socket. Send failures are counted as kForwardFailure.
   */
  void sendToDevice(std::shared_ptr<const Bytes> request,
                    const udp::endpoint& device);

  [[nodiscard]] auto localEndpoint() const -> udp::endpoint;

 private:
  void do_receive();
  void handle_receive(const boost::system::error_code& error,
                      std::size_t bytes_transferred);
  auto isConfiguredDevice(const udp::endpoint& sender) const -> bool;

  net::io_context ioc_;
  udp::socket socket_;
  udp::endpoint remote_endpoint_;
  udp::endpoint local_endpoint_;
  std::array<std::uint8_t, constants::kReceiveBufferSize> recv_buffer_{};
  std::vector<net::ip::address_v4> device_addresses_;
  ResponseRelay& relay_;
  core::RelayStats& stats_;
  std::thread thread_;
  std::atomic<bool> stop_flag_{false};
};

}  // namespace gvrelay::network

#endif  // GVRELAY_NETWORK_RESPONSE_LISTENER_HPP
