#include <gtest/gtest.h>

#include <algorithm>

#include "network/gvcp_packet.hpp"

using namespace gvrelay;
using namespace gvrelay::network;

/**
 * @brief 解析规范的发现请求
 */
TEST(GvcpPacketTest, ParseDiscoveryRequestHeader) {
  const Bytes datagram = {0x42, 0x11, 0x00, 0x02, 0x00, 0x00, 0x12, 0x34};

  auto header = gvcp::parseHeader(datagram);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->packet_type, 0x42);
  EXPECT_EQ(header->flags, 0x11);
  EXPECT_EQ(header->command, 0x0002);
  EXPECT_EQ(header->payload_size, 0);
  EXPECT_EQ(header->transaction_id, 0x1234);
  EXPECT_TRUE(gvcp::isDiscoveryRequest(*header));
  EXPECT_FALSE(gvcp::isDiscoveryReply(*header));
}

TEST(GvcpPacketTest, ShortDatagramIsMalformed) {
  for (std::size_t size = 0; size < gvcp::kHeaderSize; ++size) {
    const Bytes datagram(size, 0x42);
    auto header = gvcp::parseHeader(datagram);
    ASSERT_FALSE(header.has_value()) << "size " << size;
    EXPECT_EQ(header.error().code, RelayErrorCode::kMalformedPacket);
    EXPECT_FALSE(gvcp::isDiscoveryRequest(datagram));
    EXPECT_FALSE(gvcp::isDiscoveryReply(datagram));
  }
  EXPECT_FALSE(gvcp::parseHeader(nullptr, 8).has_value());
}

/**
 * @brief 只有 0x42/0x0002 组合才是发现请求
 */
TEST(GvcpPacketTest, DiscoveryRequestClassification) {
  gvcp::Header header;
  header.packet_type = gvcp::kPacketTypeCommand;
  header.command = gvcp::kDiscoveryCommand;
  EXPECT_TRUE(gvcp::isDiscoveryRequest(header));

  header.command = 0x0080;  // READREG
  EXPECT_FALSE(gvcp::isDiscoveryRequest(header));

  header.packet_type = gvcp::kPacketTypeAck;
  header.command = gvcp::kDiscoveryCommand;
  EXPECT_FALSE(gvcp::isDiscoveryRequest(header));

  header.command = gvcp::kDiscoveryAck;
  EXPECT_TRUE(gvcp::isDiscoveryReply(header));

  header.packet_type = gvcp::kPacketTypeError;
  EXPECT_FALSE(gvcp::isDiscoveryReply(header));
}

/**
 * @brief payload_size 与实际长度不一致不影响分类
 */
TEST(GvcpPacketTest, PayloadSizeIsNotValidated) {
  const Bytes datagram = {0x42, 0x01, 0x00, 0x02, 0xFF, 0xFF, 0x00, 0x01};
  EXPECT_TRUE(gvcp::isDiscoveryRequest(datagram));

  Bytes reply = {0x00, 0x00, 0x00, 0x03, 0x00, 0xF8, 0x00, 0x01};
  EXPECT_TRUE(gvcp::isDiscoveryReply(reply));
}

TEST(GvcpPacketTest, EncodeHeaderIsBigEndian) {
  gvcp::Header header;
  header.packet_type = 0x42;
  header.flags = 0x01;
  header.command = 0x0002;
  header.payload_size = 0x0102;
  header.transaction_id = 0xABCD;

  const auto encoded = gvcp::encodeHeader(header);
  const std::array<std::uint8_t, 8> expected = {0x42, 0x01, 0x00, 0x02,
                                                0x01, 0x02, 0xAB, 0xCD};
  EXPECT_EQ(encoded, expected);
}

TEST(GvcpPacketTest, PacketBuilders) {
  const auto request = gvcp::makeDiscoveryRequest(0x0042);
  ASSERT_EQ(request.size(), gvcp::kHeaderSize);
  EXPECT_EQ(request[1], gvcp::kFlagAckRequired);
  EXPECT_TRUE(gvcp::isDiscoveryRequest(request));

  const auto broadcast_request = gvcp::makeDiscoveryRequest(
      0x0043, gvcp::kFlagAckRequired | gvcp::kFlagAllowBroadcastAck);
  EXPECT_EQ(broadcast_request[1], 0x11);

  const Bytes payload(gvcp::kDiscoveryAckPayloadSize, 0xAA);
  const auto reply = gvcp::makeDiscoveryReply(0x0042, payload);
  ASSERT_EQ(reply.size(), gvcp::kHeaderSize + payload.size());
  auto header = gvcp::parseHeader(reply);
  ASSERT_TRUE(header.has_value());
  EXPECT_TRUE(gvcp::isDiscoveryReply(*header));
  EXPECT_EQ(header->payload_size, gvcp::kDiscoveryAckPayloadSize);
  EXPECT_EQ(header->transaction_id, 0x0042);
}

TEST(GvcpPacketTest, DescribeHeader) {
  auto header = gvcp::parseHeader(gvcp::makeDiscoveryRequest(0x1234));
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(gvcp::describeHeader(*header),
            "CMD DISCOVERY id=0x1234 flags=0x01 size=0");
}

/**
 * @brief 从发现应答的 bootstrap 区域解析设备信息
 */
TEST(GvcpPacketTest, ParseDeviceInfo) {
  Bytes payload(gvcp::kDiscoveryAckPayloadSize, 0);
  payload[0x01] = 0x02;  // version 2.0
  payload[0x07] = 0x01;
  payload[0x0A] = 0x02;
  payload[0x0B] = 0x4B;
  payload[0x0C] = 0x12;
  payload[0x0D] = 0x34;
  payload[0x0E] = 0x56;
  payload[0x0F] = 0x78;
  payload[0x24] = 192;
  payload[0x25] = 168;
  payload[0x26] = 4;
  payload[0x27] = 20;
  auto put = [&payload](std::size_t offset, const std::string& value) {
    std::copy(value.begin(), value.end(), payload.begin() + offset);
  };
  put(0x48, "Espressif");
  put(0x68, "ESP32-CAM");
  put(0x88, "1.0.0");
  put(0xD8, "SN0001");
  put(0xE8, "bench");

  auto info = gvcp::parseDeviceInfo(gvcp::makeDiscoveryReply(0x0001, payload));
  ASSERT_TRUE(info.has_value()) << info.error().message;
  EXPECT_EQ(info->version_major, 2);
  EXPECT_EQ(info->version_minor, 0);
  EXPECT_EQ(info->device_mode, 1u);
  EXPECT_EQ(info->macString(), "02:4b:12:34:56:78");
  EXPECT_EQ(info->current_ip, "192.168.4.20");
  EXPECT_EQ(info->manufacturer, "Espressif");
  EXPECT_EQ(info->model, "ESP32-CAM");
  EXPECT_EQ(info->device_version, "1.0.0");
  EXPECT_EQ(info->serial_number, "SN0001");
  EXPECT_EQ(info->user_name, "bench");
}

/**
 * @brief 字符串字段没有结尾 NUL 时截断在字段宽度，非 ASCII 字节原样保留
 */
TEST(GvcpPacketTest, ParseDeviceInfoStringFieldBounds) {
  Bytes payload(gvcp::kDiscoveryAckPayloadSize, 0);
  // 序列号字段 16 字节全部填满，紧随其后的用户名字段从 0xE8 开始
  std::fill(payload.begin() + 0xD8, payload.begin() + 0xE8, 'S');
  payload[0xE8] = 'c';
  payload[0xE9] = 'a';
  payload[0xEA] = 'm';
  payload[0xEB] = 0xE9;
  payload[0xEC] = 0x00;
  payload[0xED] = 'x';

  auto info = gvcp::parseDeviceInfo(gvcp::makeDiscoveryReply(0x0002, payload));
  ASSERT_TRUE(info.has_value()) << info.error().message;
  EXPECT_EQ(info->serial_number, std::string(16, 'S'));
  ASSERT_EQ(info->user_name.size(), 4u);
  EXPECT_EQ(info->user_name.substr(0, 3), "cam");
  EXPECT_EQ(static_cast<std::uint8_t>(info->user_name[3]), 0xE9);
  EXPECT_TRUE(info->manufacturer.empty());
}

TEST(GvcpPacketTest, ParseDeviceInfoRejectsShortOrWrongPackets) {
  auto truncated = gvcp::parseDeviceInfo(
      gvcp::makeDiscoveryReply(0x0001, Bytes(16, 0)));
  ASSERT_FALSE(truncated.has_value());
  EXPECT_EQ(truncated.error().code, RelayErrorCode::kMalformedPacket);

  EXPECT_FALSE(
      gvcp::parseDeviceInfo(gvcp::makeDiscoveryRequest(0x0001)).has_value());
}
