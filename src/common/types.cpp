#include "common/types.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tally {
namespace common {

/**
 * @file types.cpp
 * @brief Template instantiations and helpers for common types
 */

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<std::string>;
template class Result<uint64_t>;

std::string to_hex(const std::vector<uint8_t> &bytes) {
  std::ostringstream oss;
  for (uint8_t byte : bytes) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(byte);
  }
  return oss.str();
}

std::string short_address(const PublicKey &key) {
  if (key.empty()) {
    return "<empty>";
  }
  std::vector<uint8_t> prefix(key.begin(),
                              key.begin() + std::min<size_t>(key.size(), 4));
  return to_hex(prefix) + "..";
}

} // namespace common
} // namespace tally
