#pragma once

#include <optional>
#include <string>
#include <tl/expected.hpp>
#include <vector>

#include "common/relay_error.hpp"
#include "common/types.hpp"

namespace gvrelay::network {

/**
 * @brief 本机的一个 IPv4 网络接口
 */
struct NetworkInterface {
  std::string name;    // e.g. "eth0"
  IpAddress address;
  IpAddress netmask;
  IpAddress broadcast;  // 接口不支持广播时为空
};

/**
 * @brief Finds the local interfaces a relay listener can bind to.
 */
class InterfaceEnumerator {
 public:
  /**
   * @brief Lists IPv4 interfaces that are up, skipping loopback.
   */
  static auto list() -> tl::expected<std::vector<NetworkInterface>, RelayError>;

  /**
   * @brief Looks up an interface by its address, loopback included.
   */
  static auto findByAddress(const IpAddress& address)
      -> std::optional<NetworkInterface>;

  /**
   * @brief Returns the local address the routing table would use to reach
   * @p destination. No packet is sent.
   */
  static auto sourceAddressFor(const IpAddress& destination)
      -> tl::expected<IpAddress, RelayError>;
};

}  // namespace gvrelay::network
