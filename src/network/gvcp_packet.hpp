#ifndef GVRELAY_NETWORK_GVCP_PACKET_HPP
#define GVRELAY_NETWORK_GVCP_PACKET_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <tl/expected.hpp>

#include "common/relay_error.hpp"
#include "common/types.hpp"

namespace gvrelay::network::gvcp {

constexpr std::size_t kHeaderSize = 8;

// packet_type
constexpr std::uint8_t kPacketTypeAck = 0x00;
constexpr std::uint8_t kPacketTypeCommand = 0x42;
constexpr std::uint8_t kPacketTypeError = 0x80;

// flags
constexpr std::uint8_t kFlagAckRequired = 0x01;
constexpr std::uint8_t kFlagAllowBroadcastAck = 0x10;

// command
constexpr std::uint16_t kDiscoveryCommand = 0x0002;
constexpr std::uint16_t kDiscoveryAck = 0x0003;

/// @brief Size of the bootstrap block carried by a discovery acknowledge.
constexpr std::size_t kDiscoveryAckPayloadSize = 0xF8;

struct Header {
  std::uint8_t packet_type = 0;
  std::uint8_t flags = 0;
  std::uint16_t command = 0;
  std::uint16_t payload_size = 0;
  TransactionId transaction_id = 0;
};

/**
 * @brief Decodes the fixed 8-byte GVCP header.
 *
 * Fails with kMalformedPacket when fewer than 8 bytes are available. The
 * payload_size field is reported as-is and never validated against the
 * datagram length.
 */
auto parseHeader(const std::uint8_t* data, std::size_t size)
    -> tl::expected<Header, RelayError>;
auto parseHeader(const Bytes& datagram) -> tl::expected<Header, RelayError>;

auto encodeHeader(const Header& header) -> std::array<std::uint8_t, kHeaderSize>;

/// @brief Command packet (0x42) carrying DISCOVERY_CMD (0x0002).
auto isDiscoveryRequest(const Header& header) -> bool;
/// @brief Acknowledge packet (0x00) carrying DISCOVERY_ACK (0x0003).
auto isDiscoveryReply(const Header& header) -> bool;

// Byte-buffer forms; false for truncated buffers.
auto isDiscoveryRequest(const Bytes& datagram) -> bool;
auto isDiscoveryReply(const Bytes& datagram) -> bool;

auto makeDiscoveryRequest(TransactionId transaction_id,
                          std::uint8_t flags = kFlagAckRequired) -> Bytes;
auto makeDiscoveryReply(TransactionId transaction_id, const Bytes& payload)
    -> Bytes;

/// @brief One-line description, e.g. "CMD DISCOVERY id=0x1234 flags=0x01 size=0".
auto describeHeader(const Header& header) -> std::string;

/**
 * @brief Device identity decoded from the bootstrap block of a discovery
 * acknowledge. Only used for logging; the relay forwards replies untouched.
 */
struct DeviceInfo {
  std::uint16_t version_major = 0;
  std::uint16_t version_minor = 0;
  std::uint32_t device_mode = 0;
  std::array<std::uint8_t, 6> mac{};
  std::string current_ip;
  std::string manufacturer;
  std::string model;
  std::string device_version;
  std::string serial_number;
  std::string user_name;

  auto macString() const -> std::string;
};

auto parseDeviceInfo(const Bytes& reply) -> tl::expected<DeviceInfo, RelayError>;

}  // namespace gvrelay::network::gvcp

#endif  // GVRELAY_NETWORK_GVCP_PACKET_HPP
