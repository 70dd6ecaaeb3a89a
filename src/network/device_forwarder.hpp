#ifndef GVRELAY_NETWORK_DEVICE_FORWARDER_HPP
#define GVRELAY_NETWORK_DEVICE_FORWARDER_HPP

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

#include "common/constants.hpp"
#include "common/types.hpp"
#include "core/relay_stats.hpp"
#include "network/device_endpoint.hpp"
#include "network/response_relay.hpp"

namespace gvrelay::network {

class ResponseListener;

enum class ForwardMode : std::uint8_t {
  kInline,  // 每个设备一个临时 socket，在其上等待回复
  kShared   // 通过 ResponseListener 的长期 socket 发送
};

struct ForwardReport {
  std::size_t sent = 0;
  std::size_t failed = 0;
};

/**
 * @brief Unicasts a discovery request to every configured device.
 *
 * In inline mode each device gets its own ephemeral socket. The send happens
 * synchronously in forward(); waiting for the reply is scheduled on the
 * forwarder's own io_context so that the listener that called forward() is
 * never blocked. A reply arriving within the wait window is handed to the
 * ResponseRelay, anything later is lost unless a ResponseListener catches
 * it.
 */
class DeviceForwarder {
 public:
  DeviceForwarder(std::vector<DeviceEndpoint> devices, ResponseRelay& relay,
                  core::RelayStats& stats, std::chrono::milliseconds reply_wait,
                  ForwardMode mode = ForwardMode::kInline);
  ~DeviceForwarder();

  DeviceForwarder(const DeviceForwarder&) = delete;
  auto operator=(const DeviceForwarder&) -> DeviceForwarder& = delete;

  void start(std::size_t threads = constants::kForwarderThreadCount);
  void stop();

  /**
   * @brief 共享模式下使用的发送端；为空时回退到 inline 模式
   */
  void setSharedSender(ResponseListener* listener);

  /**
   * @brief Sends @p request to each device in configuration order.
   *
   * A failure for one device is counted, logged and skipped; it never stops
   * the remaining devices from being tried.
   */
  auto forward(const Bytes& request) -> ForwardReport;

  /// @brief Inline attempts still waiting for a reply.
  [[nodiscard]] auto inFlight() const -> std::size_t {
    return in_flight_.load();
  }

  [[nodiscard]] auto devices() const -> const std::vector<DeviceEndpoint>& {
    return devices_;
  }

  [[nodiscard]] auto mode() const -> ForwardMode { return mode_; }

 private:
  class ForwardAttempt;

  void forwardShared(const Bytes& request, ForwardReport& report);
  void forwardInline(const Bytes& request,
                     std::optional<TransactionId> transaction_id,
                     ForwardReport& report);

  const std::vector<DeviceEndpoint> devices_;
  ResponseRelay& relay_;
  core::RelayStats& stats_;
  const std::chrono::milliseconds reply_wait_;
  const ForwardMode mode_;
  std::atomic<ResponseListener*> shared_sender_{nullptr};
  std::atomic<std::size_t> in_flight_{0};

  net::io_context ioc_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> threads_;
};

}  // namespace gvrelay::network

#endif  // GVRELAY_NETWORK_DEVICE_FORWARDER_HPP
