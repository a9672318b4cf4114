#pragma once

/*
 Numeric parsing for gossipsim flags ("--nodes=1000", "--seed=42") and the
 port half of "ip:port" addresses. Every function returns std::nullopt
 instead of throwing: empty input, leading whitespace, trailing characters
 and out-of-range values are all rejected.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace gossipnet {
namespace util {

/**
 * Parse an integer in [min, max]
 *
 *   SafeParseInt("1000", 1, 60000) -> 1000
 *   SafeParseInt("0", 1, 60000)    -> std::nullopt
 *   SafeParseInt("4peers", 0, 10)  -> std::nullopt
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// RNG seeds: full uint64 range, no sign allowed
std::optional<uint64_t> SafeParseUInt64(const std::string& str);

// 1-65535
std::optional<uint16_t> SafeParsePort(const std::string& str);

} // namespace util
} // namespace gossipnet
