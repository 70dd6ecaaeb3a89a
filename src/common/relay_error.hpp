#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace gvrelay {

/**
 * @brief 中继错误分类
 *
 * 除 kConfiguration 外，所有错误都只影响单个数据报或单个设备，
 * 计数并记录后服务继续运行。
 */
enum class RelayErrorCode : std::uint8_t {
  kMalformedPacket,  ///< 数据报过短或无法解析
  kBindFailure,      ///< 接口地址无法绑定
  kForwardFailure,   ///< 向设备单播发送失败
  kUnmatchedReply,   ///< 应答的事务ID没有对应的待处理请求
  kRelayFailure,     ///< 向原请求方回送应答失败
  kConfiguration     ///< 启动期配置错误，致命
};

struct RelayError {
  RelayErrorCode code;
  std::string message;

  RelayError(RelayErrorCode c, std::string msg)
      : code(c), message(std::move(msg)) {}
};

inline auto toString(RelayErrorCode code) -> std::string_view {
  switch (code) {
    case RelayErrorCode::kMalformedPacket:
      return "MalformedPacket";
    case RelayErrorCode::kBindFailure:
      return "BindFailure";
    case RelayErrorCode::kForwardFailure:
      return "ForwardFailure";
    case RelayErrorCode::kUnmatchedReply:
      return "UnmatchedReply";
    case RelayErrorCode::kRelayFailure:
      return "RelayFailure";
    case RelayErrorCode::kConfiguration:
      return "Configuration";
  }
  return "Unknown";
}

}  // namespace gvrelay
