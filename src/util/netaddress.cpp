#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>

namespace gossipnet {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();
  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip;
  std::string port_str;

  if (address_port[0] == '[') {
    // "[IPv6]:port"
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.length() || address_port[bracket_end + 1] != ':') {
      return false;
    }
    ip = address_port.substr(1, bracket_end - 1);
    port_str = address_port.substr(bracket_end + 2);
  } else {
    size_t first_colon = address_port.find(':');
    if (first_colon == std::string::npos) {
      return false;
    }
    // Unbracketed IPv6 is ambiguous
    if (address_port.find(':', first_colon + 1) != std::string::npos) {
      return false;
    }
    ip = address_port.substr(0, first_colon);
    port_str = address_port.substr(first_colon + 1);
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

} // namespace util
} // namespace gossipnet
