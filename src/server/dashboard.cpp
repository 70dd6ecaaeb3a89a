#include "dashboard.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "ftxui/screen/color.hpp"

using namespace ftxui;

namespace gvrelay::server {

Dashboard::Dashboard(std::vector<std::string> devices,
                     std::vector<std::string> interfaces,
                     SnapshotProvider provider)
    : devices_(std::move(devices)),
      interfaces_(std::move(interfaces)),
      snapshot_provider_(std::move(provider)) {}

Dashboard::~Dashboard() { stop(); }

void Dashboard::start() {
  if (running_.exchange(true)) {
    return;  // 已经在运行
  }

  ui_thread_ = std::make_unique<std::thread>([this]() {
    auto screen = ScreenInteractive::TerminalOutput();
    {
      std::lock_guard<std::mutex> lock(screen_mutex_);
      screen_ = &screen;
    }

    auto ui = createUI();

    // 计数器变化不会触发事件，定期刷新界面
    auto refresh_timer = std::thread([this, &screen]() {
      int ticks = 0;
      while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (needs_refresh_.exchange(false) || ++ticks % 10 == 0) {
          screen.PostEvent(Event::Custom);
        }
      }
    });

    screen.Loop(ui);

    {
      std::lock_guard<std::mutex> lock(screen_mutex_);
      screen_ = nullptr;
    }
    const bool closed_by_user = running_.exchange(false);
    refresh_timer.join();

    if (closed_by_user && exit_handler_) {
      exit_handler_();
    }
  });
}

void Dashboard::stop() {
  if (running_.exchange(false)) {
    std::lock_guard<std::mutex> lock(screen_mutex_);
    if (screen_ != nullptr) {
      screen_->ExitLoopClosure()();
    }
  }
  if (ui_thread_ && ui_thread_->joinable()) {
    ui_thread_->join();
  }
}

void Dashboard::addLogEntry(const std::string& level,
                            const std::string& message) {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local_tm{};
  localtime_r(&time_t, &local_tm);
  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();

  std::lock_guard<std::mutex> lock(log_mutex_);
  log_lines_.push_back({oss.str(), level, message});
  if (log_lines_.size() > kMaxLogLines) {
    log_lines_.pop_front();
  }
  needs_refresh_ = true;
}

auto Dashboard::logLineCount() const -> size_t {
  std::lock_guard<std::mutex> lock(log_mutex_);
  return log_lines_.size();
}

void Dashboard::updateStatus(const std::string& status) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  status_ = status;
  needs_refresh_ = true;
}

void Dashboard::setCommandHandler(CommandHandler handler) {
  command_handler_ = std::move(handler);
}

void Dashboard::setExitHandler(std::function<void()> handler) {
  exit_handler_ = std::move(handler);
}

void Dashboard::handleCommand(const std::string& command) {
  if (command == "quit" || command == "exit") {
    std::lock_guard<std::mutex> lock(screen_mutex_);
    if (screen_ != nullptr) {
      screen_->ExitLoopClosure()();
    }
    return;
  }
  if (command == "clear") {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_lines_.clear();
    return;
  }
  if (command == "help") {
    addLogEntry("INFO", "可用命令: stats, devices, clear, help, quit");
    return;
  }
  if (command_handler_) {
    command_handler_(command);
  } else {
    addLogEntry("WARNING", "未知命令: " + command + " (输入 help 查看帮助)");
  }
}

Component Dashboard::createUI() {
  auto input_component = Input(&command_input_, "输入命令...");

  auto command_processor = CatchEvent(input_component, [this](Event event) {
    if (event == Event::Return && !command_input_.empty()) {
      const std::string command = command_input_;
      command_input_.clear();
      handleCommand(command);
      return true;
    }
    return false;
  });

  return Renderer(command_processor, [this, command_processor]() {
    Elements title_elements = {
        text("gvrelay - GigE Vision discovery relay") | bold |
            color(Color::Green),
        filler(), text("Ctrl+C 退出") | color(Color::Yellow)};

    Elements left_panel_elements = {renderStatus(), renderCounters()};

    Elements main_content_elements = {
        vbox(left_panel_elements) | size(WIDTH, EQUAL, 36), separator(),
        renderLogs() | flex};

    Elements command_elements = {text("命令: ") | color(Color::Blue),
                                 command_processor->Render() | flex};

    return vbox(Elements{hbox(title_elements) | border,
                         hbox(main_content_elements) | flex, separator(),
                         hbox(command_elements) | border});
  });
}

Element Dashboard::renderStatus() {
  std::string status;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status = status_;
  }

  Elements elements = {
      text("中继状态") | bold | color(Color::Cyan), separator(),
      hbox(Elements{text("状态: "), text(status) | color(Color::Green)}),
      text("设备:")};
  for (const auto& device : devices_) {
    elements.push_back(text("  " + device));
  }
  elements.push_back(text("接口:"));
  for (const auto& iface : interfaces_) {
    elements.push_back(text("  " + iface));
  }

  return vbox(elements) | border;
}

Element Dashboard::renderCounters() {
  const auto snapshot =
      snapshot_provider_ ? snapshot_provider_() : core::RelayStatsSnapshot{};

  auto row = [](const std::string& label, std::uint64_t value, Color c) {
    return hbox(Elements{text(label), filler(),
                         text(std::to_string(value)) | color(c)});
  };

  Elements elements = {
      text("计数器") | bold | color(Color::Cyan),
      separator(),
      row("请求 RX", snapshot.requests_received, Color::Blue),
      row("转发 FWD", snapshot.unicast_forwards, Color::Blue),
      row("应答 RESP_RX", snapshot.replies_received, Color::Blue),
      row("中继 RESP_FWD", snapshot.replies_relayed, Color::Green),
      row("错误 ERR", snapshot.errors,
          snapshot.errors > 0 ? Color::Red : Color::Green),
      row("未匹配", snapshot.unmatched_replies, Color::Yellow),
      row("过期", snapshot.expired_requests, Color::Yellow),
      row("待处理 PENDING", snapshot.pending, Color::Magenta)};

  return vbox(elements) | border;
}

Element Dashboard::renderLogs() {
  std::lock_guard<std::mutex> lock(log_mutex_);

  Elements log_elements;
  log_elements.push_back(text("实时日志") | bold | color(Color::Cyan));
  log_elements.push_back(separator());

  // 只显示最新的 50 条
  size_t start = log_lines_.size() > 50 ? log_lines_.size() - 50 : 0;
  for (size_t i = start; i < log_lines_.size(); ++i) {
    const auto& line = log_lines_[i];

    Color level_color = Color::White;
    if (line.level == "ERROR" || line.level == "FATAL") {
      level_color = Color::Red;
    } else if (line.level == "WARN" || line.level == "WARNING") {
      level_color = Color::Yellow;
    } else if (line.level == "INFO") {
      level_color = Color::Green;
    } else if (line.level == "DEBUG" || line.level == "TRACE") {
      level_color = Color::Blue;
    }

    log_elements.push_back(hbox(Elements{
        text(line.timestamp) | color(Color::GrayDark), text(" ["),
        text(line.level) | color(level_color), text("] "),
        text(line.message)}));
  }

  if (log_elements.size() == 2) {  // 只有标题和分隔符
    log_elements.push_back(text("暂无日志") | color(Color::GrayDark));
  }

  return vbox(log_elements) | border | vscroll_indicator | yframe;
}

}  // namespace gvrelay::server
