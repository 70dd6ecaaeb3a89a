#pragma once

/**
 * @file types.hpp
 * @brief 通用类型定义
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace gvrelay {

using Port = std::uint16_t;
using TransactionId = std::uint16_t;
using IpAddress = std::string;

/// @brief 原始数据报内容
using Bytes = std::vector<std::uint8_t>;

using SteadyClock = std::chrono::steady_clock;

}  // namespace gvrelay
