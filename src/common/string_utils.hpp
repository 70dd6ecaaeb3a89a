#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/types.hpp"

namespace gvrelay::common {

/**
 * @brief 将数据报转换为以空格分隔的十六进制表示，用于调试日志
 * @param data 原始字节
 * @param max_bytes 最多输出的字节数，超出部分以 "..." 表示
 */
std::string to_hex(const Bytes& data, std::size_t max_bytes = 64);

/// @brief 以 0x%04x 形式格式化事务ID
std::string format_transaction_id(TransactionId id);

/// @brief 去除首尾空白
std::string trim(const std::string& input);

/// @brief 按逗号拆分并去除空白，忽略空项
std::vector<std::string> split_list(const std::string& value);

}  // namespace gvrelay::common
