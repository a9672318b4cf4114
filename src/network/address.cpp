// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/address.hpp"
#include "util/netaddress.hpp"

namespace gossipnet {
namespace network {

std::string Address::ToString() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

bool Address::IsValid() const {
  return util::IsValidIPAddress(host);
}

std::optional<Address> Address::Parse(const std::string& address_port) {
  std::string ip;
  uint16_t port = 0;
  if (!util::ParseIPPort(address_port, ip, port)) {
    return std::nullopt;
  }
  return Address{std::move(ip), port};
}

} // namespace network
} // namespace gossipnet
