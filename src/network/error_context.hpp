#pragma once

/**
 * @file error_context.hpp
 * @brief 中继错误的上下文信息与日志记录
 *
 * 每个数据报或每个设备的错误在本地处理：记录、计数，然后继续。
 */

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <optional>
#include <string>

#include "common/logging.hpp"
#include "common/relay_error.hpp"
#include "common/string_utils.hpp"
#include "common/types.hpp"

namespace gvrelay::network {

/**
 * @brief 网络操作的上下文信息
 */
struct NetworkContext {
  std::string operation;  // 操作类型 (e.g., "receive", "forward", "relay")
  std::string endpoint;   // 对端地址
  std::optional<TransactionId> transaction_id;
  std::chrono::steady_clock::time_point start_time;

  NetworkContext(std::string op, std::string ep,
                 std::optional<TransactionId> id = std::nullopt)
      : operation(std::move(op)),
        endpoint(std::move(ep)),
        transaction_id(id),
        start_time(std::chrono::steady_clock::now()) {}
};

class ErrorLogger {
 public:
  /**
   * @brief 按错误类别选择日志级别并记录
   *
   * UnmatchedReply 和 MalformedPacket 属于正常网络噪声，仅在 DEBUG 级别输出。
   */
  static void logRelayError(const NetworkContext& ctx, const RelayError& error) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.start_time);

    LOG_AT(levelFor(error.code))
        << toString(error.code) << " in " << ctx.operation
        << " - Endpoint: " << ctx.endpoint << ", Transaction: "
        << (ctx.transaction_id
                ? common::format_transaction_id(*ctx.transaction_id)
                : std::string("n/a"))
        << ", Duration: " << elapsed.count() << "ms, Error: " << error.message;
  }

  static auto levelFor(RelayErrorCode code) -> logger::LogLevel {
    switch (code) {
      case RelayErrorCode::kMalformedPacket:
      case RelayErrorCode::kUnmatchedReply:
        return logger::LogLevel::DEBUG;
      case RelayErrorCode::kConfiguration:
        return logger::LogLevel::FATAL;
      default:
        return logger::LogLevel::ERROR;
    }
  }
};

class ErrorHelper {
 public:
  /**
   * @brief 关闭 socket 或超时取消时产生的错误，不需要记录
   */
  static bool isCancellation(const boost::system::error_code& ec) {
    return ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::bad_descriptor;
  }

  /**
   * @brief 对端不可达一类的错误，对无连接的 UDP 来说是暂时性的
   */
  static bool isUnreachable(const boost::system::error_code& ec) {
    return ec == boost::asio::error::host_unreachable ||
           ec == boost::asio::error::network_unreachable ||
           ec == boost::asio::error::connection_refused;
  }
};

}  // namespace gvrelay::network
