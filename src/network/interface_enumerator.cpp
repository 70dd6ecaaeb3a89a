#include "network/interface_enumerator.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <boost/asio.hpp>
#include <cerrno>
#include <cstring>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace gvrelay::network {

namespace {

auto to_string(const sockaddr* address) -> IpAddress {
  if (address == nullptr || address->sa_family != AF_INET) {
    return {};
  }
  const auto* in = reinterpret_cast<const sockaddr_in*>(address);
  char buffer[INET_ADDRSTRLEN] = {};
  if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return buffer;
}

/**
 * @brief 遍历 getifaddrs 返回的所有 IPv4 接口
 */
auto collect(bool include_loopback)
    -> tl::expected<std::vector<NetworkInterface>, RelayError> {
  ifaddrs* head = nullptr;
  if (getifaddrs(&head) != 0) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kConfiguration,
                   std::string("getifaddrs failed: ") + std::strerror(errno)});
  }

  std::vector<NetworkInterface> interfaces;
  for (const ifaddrs* entry = head; entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((entry->ifa_flags & IFF_UP) == 0) {
      continue;
    }
    if (!include_loopback && (entry->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }

    NetworkInterface iface;
    iface.name = entry->ifa_name != nullptr ? entry->ifa_name : "";
    iface.address = to_string(entry->ifa_addr);
    iface.netmask = to_string(entry->ifa_netmask);
    if ((entry->ifa_flags & IFF_BROADCAST) != 0) {
      iface.broadcast = to_string(entry->ifa_broadaddr);
    }
    interfaces.push_back(std::move(iface));
  }
  freeifaddrs(head);

  return interfaces;
}

}  // namespace

auto InterfaceEnumerator::list()
    -> tl::expected<std::vector<NetworkInterface>, RelayError> {
  auto interfaces = collect(false);
  if (interfaces) {
    for (const auto& iface : *interfaces) {
      LOG_DEBUG << "Found interface " << iface.name << " " << iface.address
                << "/" << iface.netmask;
    }
  }
  return interfaces;
}

auto InterfaceEnumerator::findByAddress(const IpAddress& address)
    -> std::optional<NetworkInterface> {
  auto interfaces = collect(true);
  if (!interfaces) {
    LOG_WARNING << interfaces.error().message;
    return std::nullopt;
  }
  for (auto& iface : *interfaces) {
    if (iface.address == address) {
      return iface;
    }
  }
  return std::nullopt;
}

auto InterfaceEnumerator::sourceAddressFor(const IpAddress& destination)
    -> tl::expected<IpAddress, RelayError> {
  namespace net = boost::asio;
  using udp = net::ip::udp;

  boost::system::error_code ec;
  const auto address = net::ip::make_address_v4(destination, ec);
  if (ec) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kConfiguration,
                   "invalid destination '" + destination + "'"});
  }

  // connect() on a UDP socket only selects a route; nothing is transmitted
  net::io_context ioc;
  udp::socket socket(ioc);
  socket.open(udp::v4(), ec);
  if (!ec) {
    socket.connect(udp::endpoint(address, constants::kGvcpPort), ec);
  }
  udp::endpoint local;
  if (!ec) {
    local = socket.local_endpoint(ec);
  }
  boost::system::error_code ignored;
  socket.close(ignored);

  if (ec) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kConfiguration,
                   "no route to " + destination + ": " + ec.message()});
  }
  return local.address().to_string();
}

}  // namespace gvrelay::network
