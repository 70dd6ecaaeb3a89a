#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "platform_fixes.hpp"

namespace gvrelay::logger {

enum class LogLevel : std::uint8_t {
  TRACE = 0,
  DEBUG,
  INFO,
  WARNING,
  ERROR,
  FATAL,
  NUM_SEVERITIES
};

/**
 * @brief 日志条目结构
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string file;
  int line;
  std::string function;
  std::thread::id thread_id;
  std::string message;
};

/**
 * @brief 日志配置结构
 */
struct LogConfig {
  // 基础配置
  LogLevel global_level = LogLevel::INFO;
  bool file_enabled = false;
  bool console_enabled = true;

  // 文件输出配置
  std::string log_directory = "./logs";
  std::string filename_pattern = "{program}.log";
  size_t max_file_size_mb = 10;
  size_t max_files = 5;
  bool auto_flush = true;

  // 控制台输出配置
  bool console_colored = true;
  LogLevel console_min_level = LogLevel::TRACE;

  // 格式配置
  std::string format_pattern = "[{timestamp}] [{level}] [{location}] {message}";

  // 从ConfigManager加载配置
  static LogConfig loadFromConfigManager();

  // 应用环境变量覆盖 (GVRELAY_LOG_LEVEL, GVRELAY_LOG_DIR, GVRELAY_LOG_CONSOLE)
  void applyEnvironmentOverrides();

  static LogLevel parseLogLevel(const std::string& level_str);
};

/**
 * @brief 日志输出流类型
 */
enum class LogOutputType : std::uint8_t { FILE, CONSOLE, MEMORY_BUFFER, CUSTOM };

/**
 * @brief 抽象日志输出流
 */
class LogOutputStream {
 public:
  virtual ~LogOutputStream() = default;
  virtual void write(const LogEntry& entry, const std::string& formatted) = 0;
  virtual void flush() = 0;
  virtual LogOutputType getType() const = 0;
  virtual bool shouldLog(LogLevel /*level*/) const { return true; }
};

/**
 * @brief 日志格式化器
 *
 * 支持的占位符: {timestamp} {level} {location} {function} {thread} {message}
 */
class LogFormatter {
 public:
  explicit LogFormatter(const std::string& pattern);
  std::string format(const LogEntry& entry) const;

 private:
  std::string pattern_;
  std::vector<std::function<std::string(const LogEntry&)>> formatters_;
  void parsePattern();
};

/**
 * @brief 文件日志输出流，超过大小上限时轮转
 */
class FileLogStream : public LogOutputStream {
 public:
  FileLogStream(const std::string& directory,
                const std::string& filename_pattern, size_t max_size_mb,
                size_t max_files, bool auto_flush = true,
                const std::string& program_name = "gvrelay");

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;
  LogOutputType getType() const override { return LogOutputType::FILE; }

 private:
  std::string directory_;
  std::string filename_pattern_;
  std::string program_name_;
  size_t max_size_mb_;
  size_t max_files_;
  bool auto_flush_;

  std::unique_ptr<std::ofstream> current_file_;
  std::string current_filename_;
  size_t current_size_ = 0;
  std::mutex file_mutex_;

  void rotateFile();
  std::string generateFilename() const;
};

/**
 * @brief 控制台日志输出流 (stderr)
 */
class ConsoleLogStream : public LogOutputStream {
 public:
  explicit ConsoleLogStream(bool colored = true,
                            LogLevel min_level = LogLevel::TRACE);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;
  LogOutputType getType() const override { return LogOutputType::CONSOLE; }
  bool shouldLog(LogLevel level) const override { return level >= min_level_; }

 private:
  bool colored_;
  LogLevel min_level_;
  std::mutex console_mutex_;

  static const char* colorCode(LogLevel level);
};

/**
 * @brief 内存缓冲区日志输出流（用于测试）
 */
class MemoryLogStream : public LogOutputStream {
 public:
  explicit MemoryLogStream(size_t max_entries = 1000);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override {}
  LogOutputType getType() const override {
    return LogOutputType::MEMORY_BUFFER;
  }

  std::vector<std::string> getEntries() const;
  bool contains(const std::string& needle) const;
  void clear();

 private:
  size_t max_entries_;
  std::vector<std::string> entries_;
  mutable std::mutex buffer_mutex_;
};

/**
 * @brief 主Logger类
 */
class Logger {
 public:
  // 初始化方法
  static void Init(const std::string& program_name, const LogConfig& config);
  static void InitFromConfigManager(const std::string& program_name);

  // 流管理
  static void addOutputStream(std::shared_ptr<LogOutputStream> stream);
  static void removeOutputStream(LogOutputType type);
  static std::vector<LogOutputType> getActiveStreams();

  // 等级管理
  static void setGlobalLevel(LogLevel level);
  static LogLevel getGlobalLevel();

  // 控制接口
  static void flush();
  static void shutdown();

  static void log(LogLevel level, const char* file, int line,
                  const char* function, const std::string& message);

  static bool shouldLog(LogLevel level);

  static const char* levelName(LogLevel level);

  // 流式日志类
  class LogStream {
   public:
    LogStream(const char* file, int line, const char* function,
              LogLevel level);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& val) {
      if (should_log_) {
        stream_ << val;
      }
      return *this;
    }

   private:
    std::ostringstream stream_;
    const char* file_;
    int line_;
    const char* function_;
    LogLevel level_;
    bool should_log_;
  };

 private:
  Logger() = default;
  ~Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  static Logger& getInstance();

  std::string program_name_;
  LogConfig config_;
  std::atomic<LogLevel> global_level_{LogLevel::INFO};
  std::vector<std::shared_ptr<LogOutputStream>> output_streams_;
  std::unique_ptr<LogFormatter> formatter_;

  mutable std::mutex logger_mutex_;

  void writeToStreams(const LogEntry& entry);
};

// 方便使用的宏定义
#define LOG_TRACE                                                        \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       ::gvrelay::logger::LogLevel::TRACE)
#define LOG_DEBUG                                                        \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       ::gvrelay::logger::LogLevel::DEBUG)
#define LOG_INFO                                                         \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       ::gvrelay::logger::LogLevel::INFO)
#define LOG_WARNING                                                      \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       ::gvrelay::logger::LogLevel::WARNING)
#define LOG_ERROR                                                        \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       ::gvrelay::logger::LogLevel::ERROR)
#define LOG_FATAL                                                        \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       ::gvrelay::logger::LogLevel::FATAL)

#define LOG_AT(level)                                                    \
  ::gvrelay::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                       level)

}  // namespace gvrelay::logger
