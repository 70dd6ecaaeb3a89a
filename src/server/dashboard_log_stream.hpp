#pragma once

#include <memory>

#include "common/logging.hpp"

namespace gvrelay::server {

class Dashboard;

/**
 * @brief 日志适配器，将日志输出重定向到状态界面
 *
 * 界面运行期间控制台输出会破坏屏幕内容，因此 attach() 会移除控制台输出流，
 * detach() 时恢复。
 */
class DashboardLogStream : public logger::LogOutputStream {
 public:
  explicit DashboardLogStream(std::shared_ptr<Dashboard> dashboard,
                              logger::LogLevel min_level);

  void write(const logger::LogEntry& entry,
             const std::string& formatted) override;
  void flush() override {}
  logger::LogOutputType getType() const override {
    return logger::LogOutputType::CUSTOM;
  }
  bool shouldLog(logger::LogLevel level) const override {
    return level >= min_level_;
  }

  static void attach(const std::shared_ptr<Dashboard>& dashboard,
                     logger::LogLevel min_level);
  static void detach(bool restore_console);

 private:
  std::shared_ptr<Dashboard> dashboard_;
  logger::LogLevel min_level_;
};

}  // namespace gvrelay::server
