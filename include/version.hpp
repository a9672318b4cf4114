// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace gossipnet {

// Software version
constexpr int GOSSIPNET_VERSION_MAJOR = 1;
constexpr int GOSSIPNET_VERSION_MINOR = 0;
constexpr int GOSSIPNET_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(GOSSIPNET_VERSION_MAJOR) + "." +
         std::to_string(GOSSIPNET_VERSION_MINOR) + "." +
         std::to_string(GOSSIPNET_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "gossipsim version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m";
constexpr const char *YELLOW = "\033[1;33m";
} // namespace colors

// Startup banner for the simulation driver
inline std::string GetStartupBanner(size_t node_count, size_t peers_per_node) {
  std::string banner;
  banner += "\n";
  banner += colors::GREEN;
  banner += "  gossipsim " + GetVersionString() + "\n";
  banner += colors::RESET;
  banner += "  epidemic dissemination over " + std::to_string(node_count) +
            " simulated nodes, " + std::to_string(peers_per_node) +
            " peers each\n";
  return banner;
}

} // namespace gossipnet
