#include "gossip/trace_log.hpp"
#include <algorithm>

namespace gossipnet {
namespace gossip {

TraceLog::TraceLog() : start_time_(util::Now()) {}

void TraceLog::Record(MessageTrace trace) {
  std::lock_guard<std::mutex> lock(mutex_);
  traces_.push_back(std::move(trace));
}

std::vector<MessageTrace> TraceLog::Snapshot() const {
  std::vector<MessageTrace> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result = traces_;
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const MessageTrace &a, const MessageTrace &b) {
                     return a.timestamp < b.timestamp;
                   });
  return result;
}

size_t TraceLog::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return traces_.size();
}

} // namespace gossip
} // namespace gossipnet
