#pragma once

#include <string>
#include <tl/expected.hpp>

#include "common/constants.hpp"
#include "common/relay_error.hpp"
#include "common/types.hpp"

namespace gvrelay::network {

/**
 * @brief A device that is reachable by unicast only. Immutable once parsed.
 */
struct DeviceEndpoint {
  IpAddress ip;
  Port port = constants::kGvcpPort;

  /**
   * @brief Parses "a.b.c.d" or "a.b.c.d:port".
   *
   * Only dotted-quad IPv4 literals are accepted; host names are rejected with
   * kConfiguration.
   */
  static auto parse(const std::string& text)
      -> tl::expected<DeviceEndpoint, RelayError>;

  auto toString() const -> std::string;

  auto operator==(const DeviceEndpoint& other) const -> bool {
    return ip == other.ip && port == other.port;
  }
};

}  // namespace gvrelay::network
