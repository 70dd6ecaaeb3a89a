#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

#include "common/config_manager.hpp"
#include "server/relay_options.hpp"

using namespace gvrelay;
using namespace gvrelay::server;
using gvrelay::common::ConfigManager;

namespace {

auto parse(std::vector<const char*> args) -> tl::expected<CommandLine, RelayError> {
  args.insert(args.begin(), "gvrelay");
  return parseCommandLine(static_cast<int>(args.size()), args.data());
}

}  // namespace

class RelayOptionsTest : public testing::Test {
 protected:
  void SetUp() override {
    unsetenv("GVRELAY_DEVICES");
    unsetenv("GVRELAY_INTERFACES");
    unsetenv("GVRELAY_REQUEST_TTL_MS");
    unsetenv("GVRELAY_DEBUG");
    ASSERT_TRUE(config().loadFromJson(nlohmann::json::object()).has_value());
  }

  void TearDown() override {
    ASSERT_TRUE(config().loadFromJson(nlohmann::json::object()).has_value());
  }

  static auto config() -> ConfigManager& { return ConfigManager::getInstance(); }
};

TEST_F(RelayOptionsTest, ParsesPositionalDevicesAndFlags) {
  auto command_line = parse({"-i", "192.168.1.10,10.0.0.2", "-i", "172.16.0.1",
                             "-t", "2500", "-p", "3957", "-d", "192.168.4.20",
                             "192.168.4.21:4000"});
  ASSERT_TRUE(command_line.has_value()) << command_line.error().message;

  EXPECT_EQ(command_line->devices,
            (std::vector<std::string>{"192.168.4.20", "192.168.4.21:4000"}));
  EXPECT_EQ(command_line->interfaces,
            (std::vector<std::string>{"192.168.1.10", "10.0.0.2", "172.16.0.1"}));
  EXPECT_EQ(command_line->ttl_ms, 2500);
  EXPECT_EQ(command_line->listen_port, 3957);
  EXPECT_TRUE(command_line->debug);
  EXPECT_FALSE(command_line->help);
}

TEST_F(RelayOptionsTest, ParseErrors) {
  auto unknown = parse({"--frobnicate", "192.168.4.20"});
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code, RelayErrorCode::kConfiguration);

  auto missing = parse({"192.168.4.20", "-t"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, RelayErrorCode::kConfiguration);

  auto not_a_number = parse({"-t", "12ms", "192.168.4.20"});
  ASSERT_FALSE(not_a_number.has_value());
  EXPECT_EQ(not_a_number.error().code, RelayErrorCode::kConfiguration);
}

TEST_F(RelayOptionsTest, HelpNeedsNoDevices) {
  auto command_line = parse({"--help"});
  ASSERT_TRUE(command_line.has_value());
  EXPECT_TRUE(command_line->help);
  EXPECT_NE(usage("gvrelay").find("--forward-mode"), std::string::npos);
}

TEST_F(RelayOptionsTest, DefaultsApplyWhenNothingIsConfigured) {
  auto command_line = parse({"192.168.4.20"});
  ASSERT_TRUE(command_line.has_value());

  auto options = resolveOptions(*command_line, config());
  ASSERT_TRUE(options.has_value()) << options.error().message;

  ASSERT_EQ(options->devices.size(), 1u);
  EXPECT_EQ(options->devices[0].ip, "192.168.4.20");
  EXPECT_EQ(options->devices[0].port, constants::kGvcpPort);
  EXPECT_TRUE(options->interfaces.empty());
  EXPECT_EQ(options->listen_port, constants::kGvcpPort);
  EXPECT_EQ(options->request_ttl, constants::kDefaultRequestTtl);
  EXPECT_EQ(options->bind_mode, network::BindMode::kAddress);
  EXPECT_EQ(options->forward_mode, network::ForwardMode::kInline);
  EXPECT_EQ(options->interface_selection, InterfaceSelection::kAll);
  EXPECT_FALSE(options->response_listener_enabled);
}

TEST_F(RelayOptionsTest, NoDevicesIsAConfigurationError) {
  auto command_line = parse({"-i", "127.0.0.1"});
  ASSERT_TRUE(command_line.has_value());

  auto options = resolveOptions(*command_line, config());
  ASSERT_FALSE(options.has_value());
  EXPECT_EQ(options.error().code, RelayErrorCode::kConfiguration);
}

TEST_F(RelayOptionsTest, InvalidValuesAreRejected) {
  auto bad_device = parse({"192.168.4.300"});
  ASSERT_TRUE(bad_device.has_value());
  EXPECT_FALSE(resolveOptions(*bad_device, config()).has_value());

  auto bad_interface = parse({"-i", "eth0", "192.168.4.20"});
  ASSERT_TRUE(bad_interface.has_value());
  EXPECT_FALSE(resolveOptions(*bad_interface, config()).has_value());

  auto bad_ttl = parse({"-t", "0", "192.168.4.20"});
  ASSERT_TRUE(bad_ttl.has_value());
  EXPECT_FALSE(resolveOptions(*bad_ttl, config()).has_value());

  auto bad_port = parse({"-p", "70000", "192.168.4.20"});
  ASSERT_TRUE(bad_port.has_value());
  EXPECT_FALSE(resolveOptions(*bad_port, config()).has_value());

  auto bad_mode = parse({"--bind-mode", "promiscuous", "192.168.4.20"});
  ASSERT_TRUE(bad_mode.has_value());
  auto options = resolveOptions(*bad_mode, config());
  ASSERT_FALSE(options.has_value());
  EXPECT_EQ(options.error().code, RelayErrorCode::kConfiguration);
}

/**
 * @brief 配置文件中的端口超出范围时报错，而不是静默使用默认端口
 */
TEST_F(RelayOptionsTest, ConfiguredPortOutOfRangeIsRejected) {
  auto command_line = parse({"192.168.4.20"});
  ASSERT_TRUE(command_line.has_value());

  config().set("relay.listen_port", 70000);
  auto listen = resolveOptions(*command_line, config());
  ASSERT_FALSE(listen.has_value());
  EXPECT_EQ(listen.error().code, RelayErrorCode::kConfiguration);
  EXPECT_NE(listen.error().message.find("70000"), std::string::npos);

  config().set("relay.listen_port", 3956);
  config().set("relay.response_listener.port", -1);
  auto response = resolveOptions(*command_line, config());
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error().code, RelayErrorCode::kConfiguration);

  config().set("relay.response_listener.port", 0);
  auto ephemeral = resolveOptions(*command_line, config());
  ASSERT_TRUE(ephemeral.has_value()) << ephemeral.error().message;
  EXPECT_EQ(ephemeral->response_port, 0);
}

/**
 * @brief 配置文件提供默认值，命令行覆盖配置文件
 */
TEST_F(RelayOptionsTest, CommandLineOverridesConfiguration) {
  ASSERT_TRUE(config()
                  .loadFromJson({{"relay",
                                  {{"devices", {"10.1.1.1", "10.1.1.2"}},
                                   {"interfaces", {"10.1.0.5"}},
                                   {"request_ttl_ms", 3000},
                                   {"listen_port", 3960},
                                   {"bind_mode", "device"},
                                   {"interface_selection", "routes"}}}})
                  .has_value());

  auto from_config = parse({});
  ASSERT_TRUE(from_config.has_value());
  auto options = resolveOptions(*from_config, config());
  ASSERT_TRUE(options.has_value()) << options.error().message;
  EXPECT_EQ(options->devices.size(), 2u);
  EXPECT_EQ(options->interfaces, (std::vector<std::string>{"10.1.0.5"}));
  EXPECT_EQ(options->request_ttl.count(), 3000);
  EXPECT_EQ(options->listen_port, 3960);
  EXPECT_EQ(options->bind_mode, network::BindMode::kDevice);
  EXPECT_EQ(options->interface_selection, InterfaceSelection::kRoutes);

  auto overridden = parse({"-t", "800", "-p", "4000", "--bind-mode", "address",
                           "10.2.2.2"});
  ASSERT_TRUE(overridden.has_value());
  options = resolveOptions(*overridden, config());
  ASSERT_TRUE(options.has_value()) << options.error().message;
  ASSERT_EQ(options->devices.size(), 1u);
  EXPECT_EQ(options->devices[0].ip, "10.2.2.2");
  EXPECT_EQ(options->request_ttl.count(), 800);
  EXPECT_EQ(options->listen_port, 4000);
  EXPECT_EQ(options->bind_mode, network::BindMode::kAddress);
}

TEST_F(RelayOptionsTest, ResponsePortEnablesListener) {
  auto command_line = parse({"--response-port", "40001", "192.168.4.20"});
  ASSERT_TRUE(command_line.has_value());
  auto options = resolveOptions(*command_line, config());
  ASSERT_TRUE(options.has_value());
  EXPECT_TRUE(options->response_listener_enabled);
  EXPECT_EQ(options->response_port, 40001);
}

TEST_F(RelayOptionsTest, SharedModeForcesResponseListener) {
  auto command_line = parse({"--forward-mode", "shared", "192.168.4.20"});
  ASSERT_TRUE(command_line.has_value());
  auto options = resolveOptions(*command_line, config());
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->forward_mode, network::ForwardMode::kShared);
  EXPECT_TRUE(options->response_listener_enabled);
  EXPECT_EQ(options->response_port, 0);
  EXPECT_EQ(toString(options->forward_mode), "shared");
}

TEST_F(RelayOptionsTest, DevicesFromEnvironment) {
  setenv("GVRELAY_DEVICES", "10.9.9.1, 10.9.9.2:3999", 1);
  ASSERT_TRUE(config().loadFromJson(nlohmann::json::object()).has_value());
  unsetenv("GVRELAY_DEVICES");

  auto command_line = parse({});
  ASSERT_TRUE(command_line.has_value());
  auto options = resolveOptions(*command_line, config());
  ASSERT_TRUE(options.has_value()) << options.error().message;
  ASSERT_EQ(options->devices.size(), 2u);
  EXPECT_EQ(options->devices[1].port, 3999);
}
