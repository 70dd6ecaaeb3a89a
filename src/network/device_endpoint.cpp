#include "network/device_endpoint.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <stdexcept>

#include "common/string_utils.hpp"

namespace gvrelay::network {

auto DeviceEndpoint::parse(const std::string& text)
    -> tl::expected<DeviceEndpoint, RelayError> {
  const std::string trimmed = common::trim(text);
  std::string address = trimmed;
  DeviceEndpoint endpoint;

  if (const auto colon = trimmed.rfind(':'); colon != std::string::npos) {
    address = trimmed.substr(0, colon);
    const std::string port_text = trimmed.substr(colon + 1);
    try {
      std::size_t consumed = 0;
      const int port = std::stoi(port_text, &consumed);
      if (consumed != port_text.size() || port < 1 || port > 65535) {
        throw std::out_of_range(port_text);
      }
      endpoint.port = static_cast<Port>(port);
    } catch (const std::exception&) {
      return tl::make_unexpected(
          RelayError{RelayErrorCode::kConfiguration,
                     "invalid port in device address '" + text + "'"});
    }
  }

  boost::system::error_code ec;
  const auto parsed = boost::asio::ip::make_address_v4(address, ec);
  if (ec || parsed.is_unspecified()) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kConfiguration,
        "invalid device address '" + text + "': expected a.b.c.d[:port]"});
  }

  endpoint.ip = address;
  return endpoint;
}

auto DeviceEndpoint::toString() const -> std::string {
  return ip + ":" + std::to_string(port);
}

}  // namespace gvrelay::network
