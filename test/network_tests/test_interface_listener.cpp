#include <gtest/gtest.h>

#include <chrono>

#include "core/pending_request_table.hpp"
#include "core/relay_stats.hpp"
#include "network/device_forwarder.hpp"
#include "network/gvcp_packet.hpp"
#include "network/interface_listener.hpp"
#include "network/response_relay.hpp"
#include "utils/network_utils.hpp"

using namespace gvrelay;
using namespace gvrelay::network;
using namespace std::chrono_literals;

class InterfaceListenerTest : public testing::Test {
 protected:
  void SetUp() override {
    device_.start();
    forwarder_ = std::make_unique<DeviceForwarder>(
        std::vector<DeviceEndpoint>{DeviceEndpoint{"127.0.0.1", device_.port()}},
        relay_, stats_, 1000ms);
    forwarder_->start();
  }

  void TearDown() override {
    if (listener_) {
      listener_->stop();
    }
    forwarder_->stop();
    device_.stop();
  }

  auto createListener(const std::string& ip = "127.0.0.1",
                      BindMode mode = BindMode::kAddress,
                      const std::string& device_name = "")
      -> InterfaceListener& {
    listener_ = std::make_unique<InterfaceListener>(
        ip, device_name, test::get_available_udp_port(ip), mode, table_,
        *forwarder_, stats_);
    return *listener_;
  }

  test::FakeDevice device_;
  core::PendingRequestTable table_{std::chrono::seconds(5)};
  core::RelayStats stats_;
  ResponseRelay relay_{table_, stats_};
  std::unique_ptr<DeviceForwarder> forwarder_;
  std::unique_ptr<InterfaceListener> listener_;
};

TEST_F(InterfaceListenerTest, BindsInterfaceAddress) {
  auto& listener = createListener();
  auto bound = listener.bind();
  ASSERT_TRUE(bound.has_value()) << bound.error().message;
  EXPECT_TRUE(listener.isBound());
  EXPECT_EQ(bound->address().to_string(), "127.0.0.1");
  EXPECT_EQ(listener.localEndpoint(), *bound);
  EXPECT_EQ(listener.interfaceIp(), "127.0.0.1");
}

/**
 * @brief 无法绑定的接口只禁用该监听器，并计为 BindFailure
 */
TEST_F(InterfaceListenerTest, BindFailureIsCounted) {
  auto& listener = createListener("203.0.113.77");
  auto bound = listener.bind();
  ASSERT_FALSE(bound.has_value());
  EXPECT_EQ(bound.error().code, RelayErrorCode::kBindFailure);
  EXPECT_FALSE(listener.isBound());

  const auto snapshot = stats_.snapshot();
  EXPECT_EQ(snapshot.bind_failures, 1u);
  EXPECT_EQ(snapshot.errors, 1u);

  // 未绑定时 start 不做任何事
  listener.start();
  listener.stop();
}

TEST_F(InterfaceListenerTest, DeviceModeRequiresInterfaceName) {
  auto& listener = createListener("127.0.0.1", BindMode::kDevice, "");
  auto bound = listener.bind();
  ASSERT_FALSE(bound.has_value());
  EXPECT_EQ(bound.error().code, RelayErrorCode::kBindFailure);
}

/**
 * @brief 4 字节的畸形数据报：计数、不修改待处理表
 */
TEST_F(InterfaceListenerTest, MalformedDatagramLeavesTableUntouched) {
  auto& listener = createListener();
  const udp::endpoint sender(net::ip::make_address_v4("127.0.0.1"), 50000);

  auto result = listener.processDatagram(Bytes{0x42, 0x01, 0x00, 0x02}, sender);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, RelayErrorCode::kMalformedPacket);

  EXPECT_EQ(table_.size(), 0u);
  const auto snapshot = stats_.snapshot();
  EXPECT_EQ(snapshot.malformed_packets, 1u);
  EXPECT_EQ(snapshot.errors, 1u);
  EXPECT_EQ(snapshot.requests_received, 0u);
  EXPECT_EQ(device_.requestsReceived(), 0);
}

TEST_F(InterfaceListenerTest, NonDiscoveryPacketIsIgnored) {
  auto& listener = createListener();
  const udp::endpoint sender(net::ip::make_address_v4("127.0.0.1"), 50000);

  gvcp::Header readreg;
  readreg.packet_type = gvcp::kPacketTypeCommand;
  readreg.command = 0x0080;
  readreg.transaction_id = 0x0009;
  const auto encoded = gvcp::encodeHeader(readreg);

  auto result =
      listener.processDatagram(Bytes(encoded.begin(), encoded.end()), sender);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, DatagramAction::kIgnored);
  EXPECT_EQ(table_.size(), 0u);
  EXPECT_EQ(stats_.snapshot().errors, 0u);
}

/**
 * @brief 发现请求被记录（请求方 + 接口）并转发给设备
 */
TEST_F(InterfaceListenerTest, DiscoveryRequestIsRecordedAndForwarded) {
  auto& listener = createListener();
  const udp::endpoint sender(net::ip::make_address_v4("127.0.0.1"), 50000);
  const auto request = gvcp::makeDiscoveryRequest(0x3001);

  auto result = listener.processDatagram(request, sender);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, DatagramAction::kForwarded);
  EXPECT_EQ(stats_.snapshot().requests_received, 1u);
  EXPECT_EQ(stats_.snapshot().unicast_forwards, 1u);

  ASSERT_TRUE(test::wait_for([this] { return device_.requestsReceived() == 1; }));
  EXPECT_EQ(device_.lastRequest(), request);
}

/**
 * @brief 通过 socket 的完整路径：畸形包之后监听器仍然工作
 */
TEST_F(InterfaceListenerTest, ReceiveLoopSurvivesMalformedPackets) {
  auto& listener = createListener();
  auto bound = listener.bind();
  ASSERT_TRUE(bound.has_value());
  listener.start();

  test::UdpPeer requester("127.0.0.1");
  requester.sendTo(Bytes{0xde, 0xad, 0xbe, 0xef}, *bound);
  requester.sendTo(gvcp::makeDiscoveryRequest(0x3002), *bound);

  auto reply = requester.receive();
  ASSERT_TRUE(reply.has_value());
  auto header = gvcp::parseHeader(reply->data);
  ASSERT_TRUE(header.has_value());
  EXPECT_TRUE(gvcp::isDiscoveryReply(*header));
  EXPECT_EQ(header->transaction_id, 0x3002);
  EXPECT_EQ(reply->sender.address().to_string(), "127.0.0.1");

  ASSERT_TRUE(test::wait_for(
      [this] { return stats_.snapshot().replies_relayed == 1; }));
  const auto snapshot = stats_.snapshot();
  EXPECT_EQ(snapshot.malformed_packets, 1u);
  EXPECT_EQ(snapshot.requests_received, 1u);

  listener.stop();
}
