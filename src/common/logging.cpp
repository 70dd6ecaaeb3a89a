#include "logging.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>

#include "common/config_manager.hpp"

namespace gvrelay::logger {

// ======================== LogConfig 实现 ========================

LogConfig LogConfig::loadFromConfigManager() {
  auto& config_manager = ::gvrelay::common::ConfigManager::getInstance();
  LogConfig log_config;

  // 基础配置
  log_config.global_level =
      parseLogLevel(config_manager.getWithDefault<std::string>(
          "logging.level", "INFO"));
  log_config.file_enabled =
      config_manager.getWithDefault<bool>("logging.file_enabled", false);
  log_config.console_enabled =
      config_manager.getWithDefault<bool>("logging.console_enabled", true);

  // 文件配置
  log_config.log_directory = config_manager.getWithDefault<std::string>(
      "logging.file.directory", "./logs");
  log_config.filename_pattern = config_manager.getWithDefault<std::string>(
      "logging.file.filename_pattern", "{program}.log");
  log_config.max_file_size_mb = static_cast<size_t>(
      config_manager.getWithDefault<int>("logging.file.max_size_mb", 10));
  log_config.max_files = static_cast<size_t>(
      config_manager.getWithDefault<int>("logging.file.max_files", 5));

  // 控制台配置
  log_config.console_colored =
      config_manager.getWithDefault<bool>("logging.console.colored", true);

  // 格式配置
  log_config.format_pattern = config_manager.getWithDefault<std::string>(
      "logging.format.pattern",
      "[{timestamp}] [{level}] [{location}] {message}");

  return log_config;
}

void LogConfig::applyEnvironmentOverrides() {
  if (const char* env_level = std::getenv("GVRELAY_LOG_LEVEL")) {
    global_level = parseLogLevel(env_level);
  }
  if (const char* env_dir = std::getenv("GVRELAY_LOG_DIR")) {
    log_directory = env_dir;
    file_enabled = true;
  }
  if (const char* env_console = std::getenv("GVRELAY_LOG_CONSOLE")) {
    console_enabled =
        (std::string(env_console) == "true" || std::string(env_console) == "1");
  }
}

LogLevel LogConfig::parseLogLevel(const std::string& level_str) {
  std::string upper_level = level_str;
  std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(),
                 ::toupper);

  if (upper_level == "TRACE") return LogLevel::TRACE;
  if (upper_level == "DEBUG") return LogLevel::DEBUG;
  if (upper_level == "INFO") return LogLevel::INFO;
  if (upper_level == "WARNING" || upper_level == "WARN")
    return LogLevel::WARNING;
  if (upper_level == "ERROR") return LogLevel::ERROR;
  if (upper_level == "FATAL") return LogLevel::FATAL;

  return LogLevel::INFO;  // 默认值
}

// ======================== LogFormatter 实现 ========================

LogFormatter::LogFormatter(const std::string& pattern) : pattern_(pattern) {
  parsePattern();
}

std::string LogFormatter::format(const LogEntry& entry) const {
  std::string result;
  result.reserve(256);

  for (const auto& formatter : formatters_) {
    result += formatter(entry);
  }

  return result;
}

void LogFormatter::parsePattern() {
  const std::regex placeholder_regex(R"(\{([^}]+)\})");
  const std::sregex_iterator begin(pattern_.begin(), pattern_.end(),
                                   placeholder_regex);
  const std::sregex_iterator end;

  size_t last_pos = 0;

  for (auto it = begin; it != end; ++it) {
    const std::smatch& match = *it;
    const auto match_pos = static_cast<size_t>(match.position());

    if (match_pos > last_pos) {
      std::string literal = pattern_.substr(last_pos, match_pos - last_pos);
      formatters_.push_back([literal](const LogEntry&) { return literal; });
    }

    const std::string placeholder = match[1].str();
    if (placeholder == "timestamp") {
      formatters_.push_back([](const LogEntry& entry) {
        const auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            entry.timestamp.time_since_epoch()) %
                        1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
      });
    } else if (placeholder == "level") {
      formatters_.push_back([](const LogEntry& entry) {
        return std::string(Logger::levelName(entry.level));
      });
    } else if (placeholder == "location") {
      formatters_.push_back([](const LogEntry& entry) {
        const size_t pos = entry.file.find_last_of("/\\");
        const std::string filename = (pos == std::string::npos)
                                         ? entry.file
                                         : entry.file.substr(pos + 1);
        return filename + ":" + std::to_string(entry.line);
      });
    } else if (placeholder == "function") {
      formatters_.push_back(
          [](const LogEntry& entry) { return entry.function; });
    } else if (placeholder == "thread") {
      formatters_.push_back([](const LogEntry& entry) {
        std::ostringstream oss;
        oss << entry.thread_id;
        return oss.str();
      });
    } else if (placeholder == "message") {
      formatters_.push_back(
          [](const LogEntry& entry) { return entry.message; });
    } else if (placeholder == "pid") {
      formatters_.push_back(
          [](const LogEntry&) { return std::to_string(getpid()); });
    } else {
      // 未知占位符，原样保留
      std::string literal = "{" + placeholder + "}";
      formatters_.push_back([literal](const LogEntry&) { return literal; });
    }

    last_pos = match_pos + static_cast<size_t>(match.length());
  }

  if (last_pos < pattern_.length()) {
    std::string literal = pattern_.substr(last_pos);
    formatters_.push_back([literal](const LogEntry&) { return literal; });
  }
}

// ======================== FileLogStream 实现 ========================

FileLogStream::FileLogStream(const std::string& directory,
                             const std::string& filename_pattern,
                             size_t max_size_mb, size_t max_files,
                             bool auto_flush, const std::string& program_name)
    : directory_(directory),
      filename_pattern_(filename_pattern),
      program_name_(program_name),
      max_size_mb_(max_size_mb),
      max_files_(max_files),
      auto_flush_(auto_flush) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);

  current_filename_ = generateFilename();
  current_file_ =
      std::make_unique<std::ofstream>(current_filename_, std::ios::app);

  if (current_file_->is_open()) {
    current_file_->seekp(0, std::ios::end);
    current_size_ = static_cast<size_t>(current_file_->tellp());
  }
}

void FileLogStream::write(const LogEntry& /*entry*/,
                          const std::string& formatted) {
  std::lock_guard lock(file_mutex_);

  if (!current_file_ || !current_file_->is_open()) {
    return;
  }

  *current_file_ << formatted << '\n';
  current_size_ += formatted.length() + 1;

  if (auto_flush_) {
    current_file_->flush();
  }

  if (current_size_ > max_size_mb_ * 1024 * 1024) {
    rotateFile();
  }
}

void FileLogStream::flush() {
  std::lock_guard lock(file_mutex_);
  if (current_file_ && current_file_->is_open()) {
    current_file_->flush();
  }
}

void FileLogStream::rotateFile() {
  current_file_->close();

  // name.log.N-1 -> name.log.N ... name.log -> name.log.1，最老的文件被覆盖
  std::error_code ec;
  for (size_t i = max_files_; i > 1; --i) {
    const std::string old_name =
        current_filename_ + "." + std::to_string(i - 1);
    const std::string new_name = current_filename_ + "." + std::to_string(i);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  std::filesystem::rename(current_filename_, current_filename_ + ".1", ec);

  current_file_ =
      std::make_unique<std::ofstream>(current_filename_, std::ios::trunc);
  current_size_ = 0;
}

std::string FileLogStream::generateFilename() const {
  std::string filename = filename_pattern_;

  const size_t pos = filename.find("{program}");
  if (pos != std::string::npos) {
    const size_t slash = program_name_.find_last_of("/\\");
    filename.replace(pos, 9,
                     slash == std::string::npos
                         ? program_name_
                         : program_name_.substr(slash + 1));
  }

  return (std::filesystem::path(directory_) / filename).string();
}

// ======================== ConsoleLogStream 实现 ========================

ConsoleLogStream::ConsoleLogStream(bool colored, LogLevel min_level)
    : colored_(colored), min_level_(min_level) {}

void ConsoleLogStream::write(const LogEntry& entry,
                             const std::string& formatted) {
  std::lock_guard lock(console_mutex_);

  if (colored_) {
    std::cerr << colorCode(entry.level) << formatted << "\033[0m" << '\n';
  } else {
    std::cerr << formatted << '\n';
  }
}

void ConsoleLogStream::flush() {
  std::lock_guard lock(console_mutex_);
  std::cerr.flush();
}

const char* ConsoleLogStream::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::TRACE:
      return "\033[37m";  // White
    case LogLevel::DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::INFO:
      return "\033[32m";  // Green
    case LogLevel::WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::ERROR:
      return "\033[31m";  // Red
    case LogLevel::FATAL:
      return "\033[35m";  // Magenta
    default:
      return "";
  }
}

// ======================== MemoryLogStream 实现 ========================

MemoryLogStream::MemoryLogStream(size_t max_entries)
    : max_entries_(max_entries) {}

void MemoryLogStream::write(const LogEntry& /*entry*/,
                            const std::string& formatted) {
  std::lock_guard lock(buffer_mutex_);

  entries_.push_back(formatted);
  if (entries_.size() > max_entries_) {
    entries_.erase(entries_.begin());
  }
}

std::vector<std::string> MemoryLogStream::getEntries() const {
  std::lock_guard lock(buffer_mutex_);
  return entries_;
}

bool MemoryLogStream::contains(const std::string& needle) const {
  std::lock_guard lock(buffer_mutex_);
  return std::any_of(entries_.begin(), entries_.end(),
                     [&needle](const std::string& entry) {
                       return entry.find(needle) != std::string::npos;
                     });
}

void MemoryLogStream::clear() {
  std::lock_guard lock(buffer_mutex_);
  entries_.clear();
}

// ======================== Logger 主类实现 ========================

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::Init(const std::string& program_name, const LogConfig& config) {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  instance.program_name_ = program_name;
  instance.config_ = config;
  instance.global_level_ = config.global_level;
  instance.formatter_ = std::make_unique<LogFormatter>(config.format_pattern);

  instance.output_streams_.clear();

  if (config.file_enabled) {
    instance.output_streams_.push_back(std::make_shared<FileLogStream>(
        config.log_directory, config.filename_pattern, config.max_file_size_mb,
        config.max_files, config.auto_flush, program_name));
  }

  if (config.console_enabled) {
    instance.output_streams_.push_back(std::make_shared<ConsoleLogStream>(
        config.console_colored, config.console_min_level));
  }
}

void Logger::InitFromConfigManager(const std::string& program_name) {
  LogConfig config = LogConfig::loadFromConfigManager();
  config.applyEnvironmentOverrides();
  Init(program_name, config);
}

void Logger::addOutputStream(std::shared_ptr<LogOutputStream> stream) {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);
  if (!instance.formatter_) {
    instance.formatter_ =
        std::make_unique<LogFormatter>(instance.config_.format_pattern);
  }
  instance.output_streams_.push_back(std::move(stream));
}

void Logger::removeOutputStream(LogOutputType type) {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  instance.output_streams_.erase(
      std::remove_if(
          instance.output_streams_.begin(), instance.output_streams_.end(),
          [type](const auto& stream) { return stream->getType() == type; }),
      instance.output_streams_.end());
}

std::vector<LogOutputType> Logger::getActiveStreams() {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  std::vector<LogOutputType> types;
  types.reserve(instance.output_streams_.size());
  for (const auto& stream : instance.output_streams_) {
    types.push_back(stream->getType());
  }
  return types;
}

void Logger::setGlobalLevel(LogLevel level) {
  auto& instance = getInstance();
  instance.global_level_ = level;

  std::lock_guard lock(instance.logger_mutex_);
  instance.config_.global_level = level;
}

LogLevel Logger::getGlobalLevel() { return getInstance().global_level_; }

void Logger::flush() {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  for (auto& stream : instance.output_streams_) {
    stream->flush();
  }
}

void Logger::shutdown() {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  for (auto& stream : instance.output_streams_) {
    stream->flush();
  }
  instance.output_streams_.clear();
  instance.formatter_.reset();
}

void Logger::log(LogLevel level, const char* file, int line,
                 const char* function, const std::string& message) {
  if (!shouldLog(level)) {
    return;
  }

  LogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.level = level;
  entry.file = file;
  entry.line = line;
  entry.function = function;
  entry.thread_id = std::this_thread::get_id();
  entry.message = message;

  getInstance().writeToStreams(entry);
}

bool Logger::shouldLog(LogLevel level) {
  return level >= getInstance().global_level_.load();
}

const char* Logger::levelName(LogLevel level) {
  switch (level) {
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKN";
  }
}

void Logger::writeToStreams(const LogEntry& entry) {
  std::lock_guard lock(logger_mutex_);
  if (!formatter_) {
    return;
  }

  const std::string formatted_message = formatter_->format(entry);
  for (auto& stream : output_streams_) {
    if (stream->shouldLog(entry.level)) {
      stream->write(entry, formatted_message);
    }
  }
}

// ======================== LogStream 实现 ========================

Logger::LogStream::LogStream(const char* file, int line, const char* function,
                             LogLevel level)
    : file_(file),
      line_(line),
      function_(function),
      level_(level),
      should_log_(Logger::shouldLog(level)) {}

Logger::LogStream::~LogStream() {
  if (should_log_) {
    Logger::log(level_, file_, line_, function_, stream_.str());
  }
}

}  // namespace gvrelay::logger
