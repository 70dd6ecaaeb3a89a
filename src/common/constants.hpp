#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gvrelay::constants {

//-----------------------------------------------------------------------------
// 协议 (GVCP Protocol)
//-----------------------------------------------------------------------------

/// @brief GVCP 默认端口
constexpr uint16_t kGvcpPort = 3956;

/// @brief 接收缓冲区大小，足以容纳完整的发现应答
constexpr std::size_t kReceiveBufferSize = 2048;

//-----------------------------------------------------------------------------
// 超时与周期 (Timeouts & Intervals)
//-----------------------------------------------------------------------------

/// @brief 待处理请求的默认存活时间
constexpr auto kDefaultRequestTtl = std::chrono::milliseconds(5000);

/// @brief 转发后等待设备即时应答的时间
constexpr auto kDefaultForwardWait = std::chrono::milliseconds(1000);

/// @brief 过期请求清理周期
constexpr auto kDefaultSweepInterval = std::chrono::milliseconds(1000);

/// @brief 统计信息输出周期
constexpr auto kDefaultStatsInterval = std::chrono::milliseconds(10000);

//-----------------------------------------------------------------------------
// 配置 (Configuration)
//-----------------------------------------------------------------------------

/// @brief 默认配置文件路径
const std::string kDefaultConfigPath = "config/relay.json";

/// @brief 转发器工作线程数 (每次转发在自己的 strand 上运行，可多于 1)
constexpr int kForwarderThreadCount = 1;

}  // namespace gvrelay::constants
