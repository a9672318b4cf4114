// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace gossipnet {
namespace network {

// Address - (host, port) identity of a simulated listener
//
// The only routing key in the simulated transport. Hosts are numeric IP
// strings in canonical form; see Address::Parse.
struct Address {
  std::string host;
  uint16_t port = 0;

  Address() = default;
  Address(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  // "127.0.0.1:8000", or "[::1]:8000" for IPv6 hosts
  std::string ToString() const;

  // True if host is a valid numeric IP address
  bool IsValid() const;

  // Parse "ip:port" / "[ipv6]:port"; host is normalized
  static std::optional<Address> Parse(const std::string& address_port);

  auto operator<=>(const Address&) const = default;
  bool operator==(const Address&) const = default;
};

} // namespace network
} // namespace gossipnet
