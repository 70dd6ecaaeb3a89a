#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <optional>
#include <thread>
#include <tl/expected.hpp>
#include <vector>

#include "common/relay_error.hpp"
#include "core/pending_request_table.hpp"
#include "core/relay_stats.hpp"
#include "network/interface_enumerator.hpp"
#include "server/relay_options.hpp"

namespace net = boost::asio;

namespace gvrelay {
namespace network {
class ResponseRelay;
class DeviceForwarder;
class ResponseListener;
class InterfaceListener;
}  // namespace network

namespace server {

/**
 * @brief 中继服务：持有待处理请求表、统计、所有监听器和转发器
 *
 * start() 之后每个接口监听器、转发器、响应监听器和定时任务各自运行在
 * 独立线程上；stop() 关闭全部 socket 并等待线程退出。
 */
class RelayServer {
 public:
  explicit RelayServer(RelayOptions options);
  ~RelayServer();

  RelayServer(const RelayServer&) = delete;
  auto operator=(const RelayServer&) -> RelayServer& = delete;

  /**
   * @brief Binds every selected interface and starts relaying.
   *
   * Fails with kConfiguration when no interface is usable or none of them
   * could be bound. Individual bind failures only disable that interface.
   */
  auto start() -> tl::expected<void, RelayError>;
  void stop();

  [[nodiscard]] auto isRunning() const -> bool { return running_; }
  [[nodiscard]] auto snapshot() const -> core::RelayStatsSnapshot;

  /// @brief Interface addresses with a bound listener.
  [[nodiscard]] auto boundInterfaces() const -> std::vector<IpAddress>;

  [[nodiscard]] auto responseListenerEndpoint() const
      -> std::optional<net::ip::udp::endpoint>;

  [[nodiscard]] auto options() const -> const RelayOptions& {
    return options_;
  }

 private:
  auto selectInterfaces() const
      -> tl::expected<std::vector<network::NetworkInterface>, RelayError>;
  void startResponseListener();
  void scheduleSweep();
  void scheduleStats();

  RelayOptions options_;
  core::PendingRequestTable table_;
  core::RelayStats stats_;

  std::unique_ptr<network::ResponseRelay> relay_;
  std::unique_ptr<network::DeviceForwarder> forwarder_;
  std::unique_ptr<network::ResponseListener> response_listener_;
  std::vector<std::unique_ptr<network::InterfaceListener>> listeners_;

  std::unique_ptr<net::io_context> housekeeping_ioc_;
  std::unique_ptr<net::steady_timer> sweep_timer_;
  std::unique_ptr<net::steady_timer> stats_timer_;
  std::thread housekeeping_thread_;

  std::atomic<bool> running_{false};
};

}  // namespace server
}  // namespace gvrelay
