#include "string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <sstream>

namespace gvrelay::common {

auto to_hex(const Bytes& data, const std::size_t max_bytes) -> std::string {
  std::string out;
  const std::size_t count = std::min(data.size(), max_bytes);
  out.reserve(count * 3 + 3);
  for (std::size_t i = 0; i < count; ++i) {
    if (i != 0) {
      out += ' ';
    }
    out += fmt::format("{:02x}", data[i]);
  }
  if (data.size() > max_bytes) {
    out += " ...";
  }
  return out;
}

auto format_transaction_id(const TransactionId id) -> std::string {
  return fmt::format("0x{:04x}", id);
}

auto trim(const std::string& input) -> std::string {
  const auto first = input.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = input.find_last_not_of(" \t\r\n");
  return input.substr(first, last - first + 1);
}

auto split_list(const std::string& value) -> std::vector<std::string> {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

}  // namespace gvrelay::common
