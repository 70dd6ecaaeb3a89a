#include "network/gvcp_packet.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace gvrelay::network::gvcp {

namespace {

// Bootstrap register offsets, relative to the start of the ack payload.
constexpr std::size_t kVersionOffset = 0x00;
constexpr std::size_t kDeviceModeOffset = 0x04;
constexpr std::size_t kMacHighOffset = 0x08;
constexpr std::size_t kMacLowOffset = 0x0C;
constexpr std::size_t kCurrentIpOffset = 0x24;
constexpr std::size_t kManufacturerOffset = 0x48;
constexpr std::size_t kModelOffset = 0x68;
constexpr std::size_t kDeviceVersionOffset = 0x88;
constexpr std::size_t kSerialNumberOffset = 0xD8;
constexpr std::size_t kUserNameOffset = 0xE8;

constexpr std::size_t kLongStringSize = 32;
constexpr std::size_t kShortStringSize = 16;

auto readU16(const std::uint8_t* p) -> std::uint16_t {
  return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

auto readU32(const std::uint8_t* p) -> std::uint32_t {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

// NUL-terminated (or full-width) string field
auto readString(const std::uint8_t* p, std::size_t width) -> std::string {
  const auto* end = std::find(p, p + width, std::uint8_t{0});
  return std::string(p, end);
}

auto commandName(std::uint16_t command) -> const char* {
  switch (command) {
    case kDiscoveryCommand:
      return "DISCOVERY";
    case kDiscoveryAck:
      return "DISCOVERY_ACK";
    case 0x0080:
      return "READREG";
    case 0x0081:
      return "READREG_ACK";
    case 0x0082:
      return "WRITEREG";
    case 0x0083:
      return "WRITEREG_ACK";
    case 0x0084:
      return "READMEM";
    case 0x0085:
      return "READMEM_ACK";
    default:
      return "UNKNOWN";
  }
}

auto packetTypeName(std::uint8_t packet_type) -> const char* {
  switch (packet_type) {
    case kPacketTypeAck:
      return "ACK";
    case kPacketTypeCommand:
      return "CMD";
    case kPacketTypeError:
      return "ERR";
    default:
      return "???";
  }
}

}  // namespace

auto parseHeader(const std::uint8_t* data, const std::size_t size)
    -> tl::expected<Header, RelayError> {
  if (data == nullptr || size < kHeaderSize) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kMalformedPacket,
        fmt::format("datagram of {} bytes is shorter than the {}-byte header",
                    size, kHeaderSize)});
  }

  Header header;
  header.packet_type = data[0];
  header.flags = data[1];
  header.command = readU16(data + 2);
  header.payload_size = readU16(data + 4);
  header.transaction_id = readU16(data + 6);
  return header;
}

auto parseHeader(const Bytes& datagram) -> tl::expected<Header, RelayError> {
  return parseHeader(datagram.data(), datagram.size());
}

auto encodeHeader(const Header& header)
    -> std::array<std::uint8_t, kHeaderSize> {
  return {header.packet_type,
          header.flags,
          static_cast<std::uint8_t>(header.command >> 8),
          static_cast<std::uint8_t>(header.command & 0xFF),
          static_cast<std::uint8_t>(header.payload_size >> 8),
          static_cast<std::uint8_t>(header.payload_size & 0xFF),
          static_cast<std::uint8_t>(header.transaction_id >> 8),
          static_cast<std::uint8_t>(header.transaction_id & 0xFF)};
}

auto isDiscoveryRequest(const Header& header) -> bool {
  return header.packet_type == kPacketTypeCommand &&
         header.command == kDiscoveryCommand;
}

auto isDiscoveryReply(const Header& header) -> bool {
  return header.packet_type == kPacketTypeAck &&
         header.command == kDiscoveryAck;
}

auto isDiscoveryRequest(const Bytes& datagram) -> bool {
  const auto header = parseHeader(datagram);
  return header.has_value() && isDiscoveryRequest(*header);
}

auto isDiscoveryReply(const Bytes& datagram) -> bool {
  const auto header = parseHeader(datagram);
  return header.has_value() && isDiscoveryReply(*header);
}

auto makeDiscoveryRequest(const TransactionId transaction_id,
                          const std::uint8_t flags) -> Bytes {
  Header header;
  header.packet_type = kPacketTypeCommand;
  header.flags = flags;
  header.command = kDiscoveryCommand;
  header.payload_size = 0;
  header.transaction_id = transaction_id;

  const auto encoded = encodeHeader(header);
  return Bytes(encoded.begin(), encoded.end());
}

auto makeDiscoveryReply(const TransactionId transaction_id,
                        const Bytes& payload) -> Bytes {
  Header header;
  header.packet_type = kPacketTypeAck;
  header.command = kDiscoveryAck;
  header.payload_size = static_cast<std::uint16_t>(payload.size());
  header.transaction_id = transaction_id;

  const auto encoded = encodeHeader(header);
  Bytes packet(encoded.begin(), encoded.end());
  packet.insert(packet.end(), payload.begin(), payload.end());
  return packet;
}

auto describeHeader(const Header& header) -> std::string {
  return fmt::format("{} {} id=0x{:04x} flags=0x{:02x} size={}",
                     packetTypeName(header.packet_type),
                     commandName(header.command), header.transaction_id,
                     header.flags, header.payload_size);
}

auto DeviceInfo::macString() const -> std::string {
  return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}", mac[0],
                     mac[1], mac[2], mac[3], mac[4], mac[5]);
}

auto parseDeviceInfo(const Bytes& reply)
    -> tl::expected<DeviceInfo, RelayError> {
  auto header = parseHeader(reply);
  if (!header) {
    return tl::make_unexpected(header.error());
  }
  if (!isDiscoveryReply(*header)) {
    return tl::make_unexpected(
        RelayError{RelayErrorCode::kMalformedPacket,
                   "not a discovery acknowledge: " + describeHeader(*header)});
  }
  if (reply.size() < kHeaderSize + kDiscoveryAckPayloadSize) {
    return tl::make_unexpected(RelayError{
        RelayErrorCode::kMalformedPacket,
        fmt::format("discovery acknowledge payload is {} bytes, expected {}",
                    reply.size() - kHeaderSize, kDiscoveryAckPayloadSize)});
  }

  const std::uint8_t* payload = reply.data() + kHeaderSize;

  DeviceInfo info;
  info.version_major = readU16(payload + kVersionOffset);
  info.version_minor = readU16(payload + kVersionOffset + 2);
  info.device_mode = readU32(payload + kDeviceModeOffset);
  // MAC high register holds the two upper bytes in its low half
  info.mac[0] = payload[kMacHighOffset + 2];
  info.mac[1] = payload[kMacHighOffset + 3];
  std::copy_n(payload + kMacLowOffset, 4, info.mac.begin() + 2);
  info.current_ip = fmt::format(
      "{}.{}.{}.{}", payload[kCurrentIpOffset], payload[kCurrentIpOffset + 1],
      payload[kCurrentIpOffset + 2], payload[kCurrentIpOffset + 3]);
  info.manufacturer = readString(payload + kManufacturerOffset, kLongStringSize);
  info.model = readString(payload + kModelOffset, kLongStringSize);
  info.device_version =
      readString(payload + kDeviceVersionOffset, kLongStringSize);
  info.serial_number =
      readString(payload + kSerialNumberOffset, kShortStringSize);
  info.user_name = readString(payload + kUserNameOffset, kShortStringSize);
  return info;
}

}  // namespace gvrelay::network::gvcp
