// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gossipnet {
namespace util {

/**
 * Wall-clock helpers for trace timestamps and the export document
 *
 * Trace events and gossip bodies carry system_clock time points; on the wire
 * and in the export they are rendered as RFC 3339 UTC strings with
 * millisecond precision ("2025-10-25T14:33:09.123Z").
 */

using TimePoint = std::chrono::system_clock::time_point;

// Current wall-clock time
TimePoint Now();

// Milliseconds since the Unix epoch
int64_t ToUnixMillis(TimePoint tp);

/**
 * Format a time point as RFC 3339 UTC with milliseconds
 *
 * Example: FormatRFC3339(FromUnixMillis(1729868000123)) -> "2024-10-25T14:53:20.123Z"
 */
std::string FormatRFC3339(TimePoint tp);

// Inverse of ToUnixMillis
TimePoint FromUnixMillis(int64_t millis);

} // namespace util
} // namespace gossipnet
