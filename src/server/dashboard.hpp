#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/relay_stats.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/component_base.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/dom/elements.hpp"

namespace gvrelay::server {

/**
 * @brief 中继状态终端界面
 *
 * 提供一个类似GUI的终端界面，包含：
 * - 中继配置（设备与接口）
 * - 实时计数器
 * - 实时日志输出区域
 * - 命令输入区域
 */
class Dashboard {
 public:
  using SnapshotProvider = std::function<core::RelayStatsSnapshot()>;
  using CommandHandler = std::function<void(const std::string&)>;

  Dashboard(std::vector<std::string> devices,
            std::vector<std::string> interfaces, SnapshotProvider provider);
  ~Dashboard();

  Dashboard(const Dashboard&) = delete;
  auto operator=(const Dashboard&) -> Dashboard& = delete;

  void start();
  void stop();

  void addLogEntry(const std::string& level, const std::string& message);
  void updateStatus(const std::string& status);

  // 未识别的命令交给处理器；quit/exit 会关闭界面
  void setCommandHandler(CommandHandler handler);

  // 界面被用户关闭时调用 (Ctrl+C 或 quit)
  void setExitHandler(std::function<void()> handler);

  [[nodiscard]] auto isRunning() const -> bool { return running_; }
  [[nodiscard]] auto logLineCount() const -> size_t;

 private:
  struct LogLine {
    std::string timestamp;
    std::string level;
    std::string message;
  };

  ftxui::Component createUI();
  ftxui::Element renderStatus();
  ftxui::Element renderCounters();
  ftxui::Element renderLogs();

  void handleCommand(const std::string& command);

  const std::vector<std::string> devices_;
  const std::vector<std::string> interfaces_;
  SnapshotProvider snapshot_provider_;

  std::atomic<bool> running_{false};
  std::unique_ptr<std::thread> ui_thread_;
  ftxui::ScreenInteractive* screen_ = nullptr;
  std::mutex screen_mutex_;

  std::string status_{"启动中..."};
  std::mutex status_mutex_;

  std::deque<LogLine> log_lines_;
  mutable std::mutex log_mutex_;
  static constexpr size_t kMaxLogLines = 1000;

  std::string command_input_;
  CommandHandler command_handler_;
  std::function<void()> exit_handler_;
  std::atomic<bool> needs_refresh_{false};
};

}  // namespace gvrelay::server
