#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace gossipnet {
namespace util {

namespace {

bool HasLeadingGarbage(const std::string& str) {
  return str.empty() || std::isspace(static_cast<unsigned char>(str[0]));
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (HasLeadingGarbage(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  if (HasLeadingGarbage(str) || str[0] == '-' || str[0] == '+') {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

} // namespace util
} // namespace gossipnet
