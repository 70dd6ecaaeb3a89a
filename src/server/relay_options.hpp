#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <tl/expected.hpp>
#include <vector>

#include "common/config_manager.hpp"
#include "common/constants.hpp"
#include "common/relay_error.hpp"
#include "common/types.hpp"
#include "network/device_endpoint.hpp"
#include "network/device_forwarder.hpp"
#include "network/interface_listener.hpp"

namespace gvrelay::server {

/**
 * @brief 自动选择接口时的策略
 */
enum class InterfaceSelection : std::uint8_t {
  kAll,    // 所有非回环 IPv4 接口
  kRoutes  // 仅路由到已配置设备的接口
};

/**
 * @brief 完整的、已校验的中继运行参数
 */
struct RelayOptions {
  std::vector<network::DeviceEndpoint> devices;
  std::vector<IpAddress> interfaces;  // 为空时自动检测
  Port listen_port = constants::kGvcpPort;

  std::chrono::milliseconds request_ttl = constants::kDefaultRequestTtl;
  std::chrono::milliseconds forward_wait = constants::kDefaultForwardWait;
  std::chrono::milliseconds sweep_interval = constants::kDefaultSweepInterval;
  std::chrono::milliseconds stats_interval = constants::kDefaultStatsInterval;

  network::BindMode bind_mode = network::BindMode::kAddress;
  network::ForwardMode forward_mode = network::ForwardMode::kInline;
  InterfaceSelection interface_selection = InterfaceSelection::kAll;

  bool response_listener_enabled = false;
  Port response_port = 0;  // 0 = 临时端口

  bool debug = false;
  bool dashboard = false;
};

/**
 * @brief 命令行中显式给出的参数；未给出的项保持为空，由配置文件补全
 */
struct CommandLine {
  std::vector<std::string> devices;
  std::vector<std::string> interfaces;
  std::string config_path = constants::kDefaultConfigPath;
  std::optional<int> ttl_ms;
  std::optional<int> listen_port;
  std::optional<std::string> bind_mode;
  std::optional<std::string> forward_mode;
  std::optional<int> response_port;
  bool debug = false;
  bool dashboard = false;
  bool help = false;
};

/**
 * @brief Parses argv. Unknown options and missing option values are
 * kConfiguration errors.
 */
auto parseCommandLine(int argc, const char* const argv[])
    -> tl::expected<CommandLine, RelayError>;

/**
 * @brief Merges the command line over the loaded configuration and validates
 * the result.
 *
 * Fails with kConfiguration when no device is given, a device address is
 * invalid, or a numeric or enumerated value is out of range.
 */
auto resolveOptions(const CommandLine& command_line,
                    const common::ConfigManager& config)
    -> tl::expected<RelayOptions, RelayError>;

auto usage(const std::string& program) -> std::string;

auto toString(network::BindMode mode) -> std::string;
auto toString(network::ForwardMode mode) -> std::string;

}  // namespace gvrelay::server
