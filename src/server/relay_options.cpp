#include "server/relay_options.hpp"

#include <sstream>

#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace gvrelay::server {

namespace {

auto configError(const std::string& message) -> RelayError {
  return RelayError{RelayErrorCode::kConfiguration, message};
}

auto parseInt(const std::string& option, const std::string& value)
    -> tl::expected<int, RelayError> {
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return tl::make_unexpected(
          configError("invalid number for " + option + ": '" + value + "'"));
    }
    return parsed;
  } catch (const std::exception&) {
    return tl::make_unexpected(
        configError("invalid number for " + option + ": '" + value + "'"));
  }
}

auto toPort(const std::string& name, const int value)
    -> tl::expected<Port, RelayError> {
  if (value < 0 || value > 65535) {
    return tl::make_unexpected(configError(
        name + " must be between 0 and 65535, got " + std::to_string(value)));
  }
  return static_cast<Port>(value);
}

auto toDuration(const std::string& name, const int value)
    -> tl::expected<std::chrono::milliseconds, RelayError> {
  if (value <= 0) {
    return tl::make_unexpected(configError(
        name + " must be a positive number of milliseconds, got " +
        std::to_string(value)));
  }
  return std::chrono::milliseconds(value);
}

auto parseBindMode(const std::string& value)
    -> tl::expected<network::BindMode, RelayError> {
  if (value == "address") return network::BindMode::kAddress;
  if (value == "device") return network::BindMode::kDevice;
  return tl::make_unexpected(configError(
      "bind mode must be 'address' or 'device', got '" + value + "'"));
}

auto parseForwardMode(const std::string& value)
    -> tl::expected<network::ForwardMode, RelayError> {
  if (value == "inline") return network::ForwardMode::kInline;
  if (value == "shared") return network::ForwardMode::kShared;
  return tl::make_unexpected(configError(
      "forward mode must be 'inline' or 'shared', got '" + value + "'"));
}

auto parseInterfaceSelection(const std::string& value)
    -> tl::expected<InterfaceSelection, RelayError> {
  if (value == "all") return InterfaceSelection::kAll;
  if (value == "routes") return InterfaceSelection::kRoutes;
  return tl::make_unexpected(configError(
      "interface selection must be 'all' or 'routes', got '" + value + "'"));
}

}  // namespace

auto parseCommandLine(const int argc, const char* const argv[])
    -> tl::expected<CommandLine, RelayError> {
  CommandLine command_line;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto next_value = [&]() -> tl::expected<std::string, RelayError> {
      if (i + 1 >= argc) {
        return tl::make_unexpected(configError("missing value for " + arg));
      }
      return std::string(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      command_line.help = true;
    } else if (arg == "-d" || arg == "--debug") {
      command_line.debug = true;
    } else if (arg == "--dashboard") {
      command_line.dashboard = true;
    } else if (arg == "-i" || arg == "--interfaces") {
      auto value = next_value();
      if (!value) return tl::make_unexpected(value.error());
      for (auto& iface : common::split_list(*value)) {
        command_line.interfaces.push_back(std::move(iface));
      }
    } else if (arg == "-c" || arg == "--config") {
      auto value = next_value();
      if (!value) return tl::make_unexpected(value.error());
      command_line.config_path = *value;
    } else if (arg == "-t" || arg == "--ttl") {
      auto value = next_value().and_then(
          [&](const std::string& v) { return parseInt(arg, v); });
      if (!value) return tl::make_unexpected(value.error());
      command_line.ttl_ms = *value;
    } else if (arg == "-p" || arg == "--port") {
      auto value = next_value().and_then(
          [&](const std::string& v) { return parseInt(arg, v); });
      if (!value) return tl::make_unexpected(value.error());
      command_line.listen_port = *value;
    } else if (arg == "--response-port") {
      auto value = next_value().and_then(
          [&](const std::string& v) { return parseInt(arg, v); });
      if (!value) return tl::make_unexpected(value.error());
      command_line.response_port = *value;
    } else if (arg == "--bind-mode") {
      auto value = next_value();
      if (!value) return tl::make_unexpected(value.error());
      command_line.bind_mode = *value;
    } else if (arg == "--forward-mode") {
      auto value = next_value();
      if (!value) return tl::make_unexpected(value.error());
      command_line.forward_mode = *value;
    } else if (!arg.empty() && arg[0] == '-') {
      return tl::make_unexpected(configError("unknown option " + arg));
    } else {
      command_line.devices.push_back(arg);
    }
  }

  return command_line;
}

auto resolveOptions(const CommandLine& command_line,
                    const common::ConfigManager& config)
    -> tl::expected<RelayOptions, RelayError> {
  RelayOptions options;

  // 设备：命令行优先，否则使用配置文件
  std::vector<std::string> device_texts = command_line.devices;
  if (device_texts.empty()) {
    if (auto configured = config.getStringList("relay.devices"); configured) {
      device_texts = *configured;
    }
  }
  if (device_texts.empty()) {
    return tl::make_unexpected(
        configError("no devices configured; pass at least one device address"));
  }
  for (const auto& text : device_texts) {
    auto device = network::DeviceEndpoint::parse(text);
    if (!device) {
      return tl::make_unexpected(device.error());
    }
    options.devices.push_back(*device);
  }

  options.interfaces = command_line.interfaces;
  if (options.interfaces.empty()) {
    if (auto configured = config.getStringList("relay.interfaces");
        configured) {
      options.interfaces = *configured;
    }
  }
  for (const auto& iface : options.interfaces) {
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(iface, ec);
    if (ec) {
      return tl::make_unexpected(
          configError("invalid interface address '" + iface + "'"));
    }
  }

  const int listen_port = command_line.listen_port.value_or(
      config.getWithDefault("relay.listen_port",
                            static_cast<int>(constants::kGvcpPort)));
  auto port = toPort("listen port", listen_port);
  if (!port) return tl::make_unexpected(port.error());
  options.listen_port = *port;

  const int ttl_ms = command_line.ttl_ms.value_or(config.getWithDefault(
      "relay.request_ttl_ms",
      static_cast<int>(constants::kDefaultRequestTtl.count())));
  auto ttl = toDuration("request TTL", ttl_ms);
  if (!ttl) return tl::make_unexpected(ttl.error());
  options.request_ttl = *ttl;

  auto forward_wait = toDuration(
      "relay.forward_wait_ms",
      config.getWithDefault(
          "relay.forward_wait_ms",
          static_cast<int>(constants::kDefaultForwardWait.count())));
  if (!forward_wait) return tl::make_unexpected(forward_wait.error());
  options.forward_wait = *forward_wait;

  auto sweep_interval = toDuration(
      "relay.sweep_interval_ms",
      config.getWithDefault(
          "relay.sweep_interval_ms",
          static_cast<int>(constants::kDefaultSweepInterval.count())));
  if (!sweep_interval) return tl::make_unexpected(sweep_interval.error());
  options.sweep_interval = *sweep_interval;

  auto stats_interval = toDuration(
      "relay.stats_interval_ms",
      config.getWithDefault(
          "relay.stats_interval_ms",
          static_cast<int>(constants::kDefaultStatsInterval.count())));
  if (!stats_interval) return tl::make_unexpected(stats_interval.error());
  options.stats_interval = *stats_interval;

  auto bind_mode = parseBindMode(command_line.bind_mode.value_or(
      config.getWithDefault("relay.bind_mode", std::string("address"))));
  if (!bind_mode) return tl::make_unexpected(bind_mode.error());
  options.bind_mode = *bind_mode;

  auto forward_mode = parseForwardMode(command_line.forward_mode.value_or(
      config.getWithDefault("relay.forward_mode", std::string("inline"))));
  if (!forward_mode) return tl::make_unexpected(forward_mode.error());
  options.forward_mode = *forward_mode;

  auto selection = parseInterfaceSelection(
      config.getWithDefault("relay.interface_selection", std::string("all")));
  if (!selection) return tl::make_unexpected(selection.error());
  options.interface_selection = *selection;

  // --response-port 隐式启用响应监听器
  options.response_listener_enabled =
      command_line.response_port.has_value() ||
      config.getWithDefault("relay.response_listener.enabled", false);
  auto response_port = toPort(
      "response port",
      command_line.response_port.value_or(
          config.getWithDefault("relay.response_listener.port", 0)));
  if (!response_port) return tl::make_unexpected(response_port.error());
  options.response_port = *response_port;

  if (options.forward_mode == network::ForwardMode::kShared &&
      !options.response_listener_enabled) {
    LOG_INFO << "Shared forward mode requires the response listener; "
                "enabling it";
    options.response_listener_enabled = true;
  }

  options.debug = command_line.debug;
  options.dashboard = command_line.dashboard;

  return options;
}

auto usage(const std::string& program) -> std::string {
  std::ostringstream oss;
  oss << "Usage: " << program << " [options] <device-ip[:port]>...\n"
      << "\n"
      << "Relays GigE Vision discovery broadcasts to devices that are only\n"
      << "reachable by unicast, and their replies back to the requester.\n"
      << "\n"
      << "Options:\n"
      << "  -i, --interfaces <ip[,ip...]>  interface addresses to listen on\n"
      << "                                 (repeatable; default: auto)\n"
      << "  -c, --config <file>            JSON config (default: "
      << constants::kDefaultConfigPath << ")\n"
      << "  -t, --ttl <ms>                 pending request TTL (default: "
      << constants::kDefaultRequestTtl.count() << ")\n"
      << "  -p, --port <port>              discovery listen port (default: "
      << constants::kGvcpPort << ")\n"
      << "      --bind-mode <address|device>\n"
      << "      --forward-mode <inline|shared>\n"
      << "      --response-port <port>     enable the response listener\n"
      << "      --dashboard                interactive status screen\n"
      << "  -d, --debug                    debug logging\n"
      << "  -h, --help                     show this help\n";
  return oss.str();
}

auto toString(const network::BindMode mode) -> std::string {
  return mode == network::BindMode::kDevice ? "device" : "address";
}

auto toString(const network::ForwardMode mode) -> std::string {
  return mode == network::ForwardMode::kShared ? "shared" : "inline";
}

}  // namespace gvrelay::server
