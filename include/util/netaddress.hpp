#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings used as simulated host names
 - Parse "ip:port" / "[ipv6]:port" strings

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - ParseIPPort: Split and validate an "ip:port" string
*/

#include <cstdint>
#include <optional>
#include <string>

namespace gossipnet {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address():
 * 1. Rejects empty strings, hostnames and malformed addresses
 * 2. Normalizes IPv4-mapped IPv6 addresses (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation
 *
 * Without normalization "127.0.0.1" and "::ffff:127.0.0.1" would register as
 * two distinct listeners.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

/**
 * Parse "IP:port" string into separate IP and port components
 *
 * Supports both IPv4 and IPv6 formats:
 * - IPv4: "127.0.0.1:8000"
 * - IPv6: "[::1]:8000"
 *
 * @return true if successfully parsed, false otherwise
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

} // namespace util
} // namespace gossipnet
