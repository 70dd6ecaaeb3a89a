#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <tl/expected.hpp>
#include <unordered_map>
#include <vector>

namespace gvrelay::common {

/**
 * @brief 配置错误类型
 */
struct ConfigError {
  std::string message;

  explicit ConfigError(std::string msg) : message(std::move(msg)) {}
};

/**
 * @brief 配置结果类型
 */
template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/**
 * @brief 配置管理器
 *
 * 使用 nlohmann/json 和 tl::expected 提供类型安全的配置访问。
 * 键使用点分路径 (例如 "relay.response_listener.port")。
 * 读取结果带缓存，任何写入都会清空缓存。
 */
class ConfigManager {
 public:
  static ConfigManager& getInstance();

  // 加载配置
  ConfigResult<void> loadFromFile(const std::string& filename);
  ConfigResult<void> loadFromJson(const nlohmann::json& json);

  // 类型安全的获取方法
  ConfigResult<std::string> getString(const std::string& key) const;
  ConfigResult<int> getInt(const std::string& key) const;
  ConfigResult<bool> getBool(const std::string& key) const;
  ConfigResult<std::vector<std::string>> getStringList(
      const std::string& key) const;

  // 获取配置值，如果不存在则使用提供的默认值
  template <typename T>
  T getWithDefault(const std::string& key, const T& default_value) const;

  // 设置值
  template <typename T>
  void set(const std::string& key, const T& value);

  bool hasKey(const std::string& key) const;

  // 验证中继相关配置项的类型和取值范围
  bool validateConfig() const;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  mutable std::shared_mutex mutex_;
  nlohmann::json config_ = nlohmann::json::object();
  mutable std::unordered_map<std::string, nlohmann::json> cache_;

  ConfigResult<nlohmann::json> getJsonValue(const std::string& key) const;

  // 内部方法，假设调用者已持有锁
  void loadEnvironmentVariablesNoLock();
  void setNoLock(const std::string& key, const nlohmann::json& value);
  ConfigResult<nlohmann::json> getJsonValueNoLock(const std::string& key) const;
};

// 模板特化声明
template <>
void ConfigManager::set<std::string>(const std::string& key,
                                     const std::string& value);

template <>
void ConfigManager::set<int>(const std::string& key, const int& value);

template <>
void ConfigManager::set<bool>(const std::string& key, const bool& value);

template <>
void ConfigManager::set<std::vector<std::string>>(
    const std::string& key, const std::vector<std::string>& value);

// getWithDefault 模板特化声明
template <>
std::string ConfigManager::getWithDefault<std::string>(
    const std::string& key, const std::string& default_value) const;

template <>
int ConfigManager::getWithDefault<int>(const std::string& key,
                                       const int& default_value) const;

template <>
bool ConfigManager::getWithDefault<bool>(const std::string& key,
                                         const bool& default_value) const;

}  // namespace gvrelay::common
