#include "config_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace gvrelay::common {

using json = nlohmann::json;

ConfigManager& ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

ConfigResult<void> ConfigManager::loadFromFile(const std::string& filename) {
  try {
    std::ifstream file(filename);
    if (!file.is_open()) {
      return tl::make_unexpected(
          ConfigError{"Failed to open config file: " + filename});
    }

    json json_config;
    file >> json_config;
    if (!json_config.is_object()) {
      return tl::make_unexpected(
          ConfigError{"Config file " + filename + " is not a JSON object"});
    }

    {
      std::unique_lock lock(mutex_);
      config_ = std::move(json_config);
      cache_.clear();
      loadEnvironmentVariablesNoLock();
    }

    LOG_INFO << "Loaded config from: " << filename;
    return {};
  } catch (const std::exception& e) {
    return tl::make_unexpected(ConfigError{"Failed to parse config file " +
                                           filename + ": " + e.what()});
  }
}

ConfigResult<void> ConfigManager::loadFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return tl::make_unexpected(ConfigError{"Config root must be an object"});
  }

  std::unique_lock lock(mutex_);
  config_ = json;
  cache_.clear();
  loadEnvironmentVariablesNoLock();
  return {};
}

ConfigResult<std::string> ConfigManager::getString(
    const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  if (!result->is_string()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not a string, got " +
                                           result->type_name()});
  }
  return result->get<std::string>();
}

ConfigResult<int> ConfigManager::getInt(const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  if (!result->is_number_integer()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not an integer, got " +
                                           result->type_name()});
  }
  return result->get<int>();
}

ConfigResult<bool> ConfigManager::getBool(const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  if (!result->is_boolean()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not a boolean, got " +
                                           result->type_name()});
  }
  return result->get<bool>();
}

ConfigResult<std::vector<std::string>> ConfigManager::getStringList(
    const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }

  // 单个字符串视为只有一个元素的列表
  if (result->is_string()) {
    return std::vector<std::string>{result->get<std::string>()};
  }
  if (!result->is_array()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not an array, got " +
                                           result->type_name()});
  }

  std::vector<std::string> values;
  values.reserve(result->size());
  for (const auto& item : *result) {
    if (!item.is_string()) {
      return tl::make_unexpected(ConfigError{
          "Array at key '" + key + "' contains a non-string element"});
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

bool ConfigManager::hasKey(const std::string& key) const {
  return getJsonValue(key).has_value();
}

bool ConfigManager::validateConfig() const {
  bool is_valid = true;

  // 端口: 0 表示由系统分配
  for (const std::string key :
       {"relay.listen_port", "relay.response_listener.port"}) {
    auto result = getJsonValue(key);
    if (!result.has_value()) {
      continue;
    }
    if (!result->is_number_integer()) {
      LOG_ERROR << "Invalid port type in key '" << key
                << "': expected integer, got " << result->type_name();
      is_valid = false;
      continue;
    }
    const int port = result->get<int>();
    if (port < 0 || port > 65535) {
      LOG_ERROR << "Invalid port value in key '" << key << "': " << port
                << " (must be between 0-65535)";
      is_valid = false;
    }
  }

  for (const std::string key :
       {"relay.request_ttl_ms", "relay.forward_wait_ms",
        "relay.sweep_interval_ms", "relay.stats_interval_ms"}) {
    auto result = getJsonValue(key);
    if (!result.has_value()) {
      continue;
    }
    if (!result->is_number_integer() || result->get<int>() <= 0) {
      LOG_ERROR << "Invalid duration in key '" << key
                << "': expected a positive integer (milliseconds)";
      is_valid = false;
    }
  }

  for (const std::string key : {"relay.devices", "relay.interfaces"}) {
    if (hasKey(key) && !getStringList(key).has_value()) {
      LOG_ERROR << "Invalid list in key '" << key
                << "': expected an array of address strings";
      is_valid = false;
    }
  }

  if (auto level = getString("logging.level"); level.has_value()) {
    std::string upper = level.value();
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    const std::vector<std::string> valid_levels = {
        "TRACE", "DEBUG", "INFO", "WARNING", "WARN", "ERROR", "FATAL"};
    if (std::find(valid_levels.begin(), valid_levels.end(), upper) ==
        valid_levels.end()) {
      LOG_ERROR << "Invalid logging level: " << level.value();
      is_valid = false;
    }
  }

  if (is_valid) {
    LOG_DEBUG << "Configuration validation passed";
  } else {
    LOG_ERROR << "Configuration validation failed";
  }

  return is_valid;
}

ConfigResult<nlohmann::json> ConfigManager::getJsonValue(
    const std::string& key) const {
  // 首先尝试用共享锁读取缓存
  {
    std::shared_lock lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);

  // 双重检查：可能在获取独占锁期间其他线程已经更新了缓存
  auto it = cache_.find(key);
  if (it != cache_.end()) {
    return it->second;
  }

  auto result = getJsonValueNoLock(key);
  if (result.has_value()) {
    cache_[key] = *result;
  }
  return result;
}

ConfigResult<nlohmann::json> ConfigManager::getJsonValueNoLock(
    const std::string& key) const {
  const json* current = &config_;

  size_t start = 0;
  while (start <= key.size()) {
    const size_t end = key.find('.', start);
    const std::string k = key.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    if (!k.empty()) {
      if (!current->is_object() || !current->contains(k)) {
        return tl::make_unexpected(ConfigError{"Key not found: " + key});
      }
      current = &current->at(k);
    }

    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }

  return *current;
}

void ConfigManager::setNoLock(const std::string& key,
                              const nlohmann::json& value) {
  json* current = &config_;

  size_t start = 0;
  while (true) {
    const size_t end = key.find('.', start);
    const std::string k = key.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    if (!current->is_object()) {
      *current = json::object();
    }

    if (end == std::string::npos) {
      (*current)[k] = value;
      return;
    }

    if (!k.empty()) {
      current = &(*current)[k];
    }
    start = end + 1;
  }
}

void ConfigManager::loadEnvironmentVariablesNoLock() {
  if (const char* devices = std::getenv("GVRELAY_DEVICES")) {
    setNoLock("relay.devices", split_list(devices));
  }

  if (const char* interfaces = std::getenv("GVRELAY_INTERFACES")) {
    setNoLock("relay.interfaces", split_list(interfaces));
  }

  if (const char* ttl = std::getenv("GVRELAY_REQUEST_TTL_MS")) {
    try {
      setNoLock("relay.request_ttl_ms", std::stoi(ttl));
    } catch (const std::exception&) {
      LOG_WARNING << "Invalid GVRELAY_REQUEST_TTL_MS value: " << ttl;
    }
  }

  if (const char* debug = std::getenv("GVRELAY_DEBUG")) {
    const std::string value(debug);
    if (value == "1" || value == "true") {
      setNoLock("logging.level", std::string("DEBUG"));
    }
  }
}

// 模板特化实现
template <>
void ConfigManager::set<std::string>(const std::string& key,
                                     const std::string& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
  cache_.clear();
}

template <>
void ConfigManager::set<int>(const std::string& key, const int& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
  cache_.clear();
}

template <>
void ConfigManager::set<bool>(const std::string& key, const bool& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
  cache_.clear();
}

template <>
void ConfigManager::set<std::vector<std::string>>(
    const std::string& key, const std::vector<std::string>& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
  cache_.clear();
}

// 模板特化实现 - getWithDefault
template <>
std::string ConfigManager::getWithDefault<std::string>(
    const std::string& key, const std::string& default_value) const {
  auto result = getString(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key << "': '"
              << default_value << "' (reason: " << result.error().message
              << ")";
    return default_value;
  }
  return result.value();
}

template <>
int ConfigManager::getWithDefault<int>(const std::string& key,
                                       const int& default_value) const {
  auto result = getInt(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << default_value
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

template <>
bool ConfigManager::getWithDefault<bool>(const std::string& key,
                                         const bool& default_value) const {
  auto result = getBool(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << (default_value ? "true" : "false")
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

}  // namespace gvrelay::common
