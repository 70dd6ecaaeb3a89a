#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "common/config_manager.hpp"
#include "common/logging.hpp"
#include "dashboard.hpp"
#include "dashboard_log_stream.hpp"
#include "relay_server.hpp"
#include "server/relay_options.hpp"

static std::atomic<bool> g_stop_signal(false);

void signal_handler(const int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stop_signal = true;
  }
}

auto main(const int argc, char* argv[]) -> int {
  using namespace gvrelay;

  logger::Logger::Init(argv[0], logger::LogConfig{});

  auto command_line = server::parseCommandLine(argc, argv);
  if (!command_line) {
    std::cerr << command_line.error().message << "\n\n"
              << server::usage(argv[0]);
    return 1;
  }
  if (command_line->help) {
    std::cout << server::usage(argv[0]);
    return 0;
  }

  // 加载配置；文件缺失时使用默认值，环境变量仍然生效
  auto& config = common::ConfigManager::getInstance();
  if (auto loaded = config.loadFromFile(command_line->config_path); !loaded) {
    LOG_WARNING << "Using default configuration: " << loaded.error().message;
    if (auto defaults = config.loadFromJson(nlohmann::json::object());
        !defaults) {
      LOG_FATAL << defaults.error().message;
      return 1;
    }
  }

  logger::Logger::InitFromConfigManager(argv[0]);
  if (command_line->debug) {
    logger::Logger::setGlobalLevel(logger::LogLevel::DEBUG);
  }

  if (!config.validateConfig()) {
    LOG_FATAL << "Invalid configuration in " << command_line->config_path;
    return 1;
  }

  auto options = server::resolveOptions(*command_line, config);
  if (!options) {
    LOG_FATAL << "Configuration error: " << options.error().message;
    std::cerr << "\n" << server::usage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  LOG_INFO << "gvrelay starting...";

  server::RelayServer relay(*options);
  if (auto started = relay.start(); !started) {
    LOG_FATAL << "Failed to start: " << started.error().message;
    return 1;
  }

  std::shared_ptr<server::Dashboard> dashboard;
  if (options->dashboard) {
    std::vector<std::string> devices;
    for (const auto& device : options->devices) {
      devices.push_back(device.toString());
    }
    dashboard = std::make_shared<server::Dashboard>(
        devices, relay.boundInterfaces(),
        [&relay] { return relay.snapshot(); });

    dashboard->setCommandHandler([&relay, &dashboard](const std::string& cmd) {
      if (cmd == "stats") {
        dashboard->addLogEntry("INFO", relay.snapshot().summary());
      } else if (cmd == "devices") {
        for (const auto& device : relay.options().devices) {
          dashboard->addLogEntry("INFO", "device " + device.toString());
        }
      } else {
        dashboard->addLogEntry("WARN",
                               "未知命令: " + cmd + " (输入 help 查看帮助)");
      }
    });
    dashboard->setExitHandler([] { g_stop_signal = true; });

    server::DashboardLogStream::attach(dashboard,
                                       logger::Logger::getGlobalLevel());
    dashboard->start();
    dashboard->updateStatus("运行中");
  } else {
    LOG_INFO << "Relay running. Press Ctrl+C to exit.";
  }

  while (!g_stop_signal) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (dashboard) {
    dashboard->stop();
    server::DashboardLogStream::detach(true);
  }

  LOG_INFO << "Shutting down...";
  relay.stop();

  std::cout << "Final counters: " << relay.snapshot().summary() << std::endl;
  logger::Logger::shutdown();
  return 0;
}
