#pragma once

#include "util/time.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace gossipnet {
namespace gossip {

// One accepted (first-time) gossip delivery
struct MessageTrace {
  util::TimePoint timestamp;
  std::string message_id;
  int original_sender = -1;
  int immediate_forwarder = -1;
  int receiver = -1;
  std::string content;
  int ttl = 0;             // ttl of the copy as received
  bool is_direct = false;  // forwarder == original sender
};

/**
 * TraceLog - append-only record of gossip deliveries
 *
 * Shared by every node of a network; Record() is called from receive loops
 * concurrently.
 */
class TraceLog {
public:
  TraceLog();

  void Record(MessageTrace trace);

  // Copy of all traces, stable-sorted by timestamp
  std::vector<MessageTrace> Snapshot() const;

  size_t Size() const;

  util::TimePoint start_time() const { return start_time_; }

private:
  const util::TimePoint start_time_;
  mutable std::mutex mutex_;
  std::vector<MessageTrace> traces_;
};

} // namespace gossip
} // namespace gossipnet
