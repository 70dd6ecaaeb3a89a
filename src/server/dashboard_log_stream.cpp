#include "dashboard_log_stream.hpp"

#include "dashboard.hpp"

namespace gvrelay::server {

DashboardLogStream::DashboardLogStream(std::shared_ptr<Dashboard> dashboard,
                                       const logger::LogLevel min_level)
    : dashboard_(std::move(dashboard)), min_level_(min_level) {}

void DashboardLogStream::write(const logger::LogEntry& entry,
                               const std::string& /*formatted*/) {
  dashboard_->addLogEntry(logger::Logger::levelName(entry.level),
                          entry.message);
}

void DashboardLogStream::attach(const std::shared_ptr<Dashboard>& dashboard,
                                const logger::LogLevel min_level) {
  logger::Logger::removeOutputStream(logger::LogOutputType::CONSOLE);
  logger::Logger::addOutputStream(
      std::make_shared<DashboardLogStream>(dashboard, min_level));
}

void DashboardLogStream::detach(const bool restore_console) {
  logger::Logger::removeOutputStream(logger::LogOutputType::CUSTOM);
  if (restore_console) {
    logger::Logger::addOutputStream(
        std::make_shared<logger::ConsoleLogStream>());
  }
}

}  // namespace gvrelay::server
