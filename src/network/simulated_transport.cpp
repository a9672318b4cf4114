#include "network/simulated_transport.hpp"
#include "util/logging.hpp"
#include <mutex>

namespace gossipnet {
namespace network {

// ============================================================================
// Listener / outbound handles
// ============================================================================

class SimulatedTransport::SimulatedListener : public Listener {
public:
  SimulatedListener(SimulatedTransport &transport, Address addr,
                    InboundQueuePtr queue)
      : transport_(transport), address_(std::move(addr)),
        queue_(std::move(queue)) {}

  ~SimulatedListener() override { Close(); }

  std::optional<Message> Receive() override { return queue_->Pop(); }

  std::optional<Message> TryReceive() override { return queue_->TryPop(); }

  void Close() override {
    if (closed_.exchange(true)) {
      return;
    }
    transport_.Deregister(address_, queue_);
  }

  bool IsOpen() const override { return !closed_.load(); }

  const Address &address() const override { return address_; }

private:
  SimulatedTransport &transport_;
  const Address address_;
  InboundQueuePtr queue_;
  std::atomic<bool> closed_{false};
};

class SimulatedTransport::SimulatedOutbound : public OutboundConnection {
public:
  SimulatedOutbound(SimulatedTransport &transport, Address remote)
      : transport_(transport), remote_(std::move(remote)) {}

  TransportResult Send(Message msg) override {
    if (closed_.load()) {
      return TransportResult::ConnectionClosed;
    }
    msg.to = remote_;
    return transport_.Send(msg);
  }

  void Close() override { closed_.store(true); }

  bool IsOpen() const override { return !closed_.load(); }

  const Address &remote_address() const override { return remote_; }

private:
  SimulatedTransport &transport_;
  const Address remote_;
  std::atomic<bool> closed_{false};
};

// ============================================================================
// SimulatedTransport
// ============================================================================

SimulatedTransport::SimulatedTransport(const Config &config) : config_(config) {}

SimulatedTransport::~SimulatedTransport() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto &[addr, queue] : listeners_) {
    queue->Close();
  }
  listeners_.clear();
}

TransportResult SimulatedTransport::Listen(const Address &addr, ListenerPtr &out) {
  if (!addr.IsValid()) {
    LOG_NET_WARN("Listen rejected invalid address {}", addr.ToString());
    return TransportResult::InvalidAddress;
  }

  auto queue = std::make_shared<InboundQueue>(config_.queue_capacity);
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!listeners_.emplace(addr, queue).second) {
      LOG_NET_DEBUG("Listen failed: {} already in use", addr.ToString());
      return TransportResult::AddressInUse;
    }
  }

  out = std::make_shared<SimulatedListener>(*this, addr, std::move(queue));
  LOG_NET_DEBUG("Listening on {} (queue capacity {})", addr.ToString(),
                config_.queue_capacity);
  return TransportResult::Success;
}

TransportResult SimulatedTransport::Dial(const Address &addr, OutboundConnectionPtr &out) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (listeners_.find(addr) == listeners_.end()) {
      return TransportResult::AddressNotFound;
    }
  }
  out = std::make_shared<SimulatedOutbound>(*this, addr);
  return TransportResult::Success;
}

TransportResult SimulatedTransport::Send(const Message &msg) {
  messages_sent_.fetch_add(1, std::memory_order_relaxed);

  // Held for the whole delivery: Deregister needs the exclusive lock, so the
  // destination queue stays registered until TryPush returns.
  std::shared_lock<std::shared_mutex> lock(mutex_);

  if (IsMarkedLocked(msg.from) || IsMarkedLocked(msg.to)) {
    rejected_partitioned_.fetch_add(1, std::memory_order_relaxed);
    return TransportResult::NetworkPartitioned;
  }

  auto it = listeners_.find(msg.to);
  if (it == listeners_.end()) {
    rejected_not_found_.fetch_add(1, std::memory_order_relaxed);
    return TransportResult::AddressNotFound;
  }

  switch (it->second->TryPush(msg)) {
  case InboundQueue::PushResult::Ok:
    messages_enqueued_.fetch_add(1, std::memory_order_relaxed);
    return TransportResult::Success;
  case InboundQueue::PushResult::Full:
    rejected_queue_full_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_TRACE("Queue full at {} (from {})", msg.to.ToString(), msg.from.ToString());
    return TransportResult::QueueFull;
  case InboundQueue::PushResult::Closed:
    break;
  }
  return TransportResult::ConnectionClosed;
}

void SimulatedTransport::Partition(const std::vector<Address> &group_a,
                                   const std::vector<Address> &group_b) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  partitioned_.insert(group_a.begin(), group_a.end());
  partitioned_.insert(group_b.begin(), group_b.end());
  LOG_NET_INFO("Partition applied: {} + {} addresses marked ({} total)",
               group_a.size(), group_b.size(), partitioned_.size());
}

void SimulatedTransport::Heal() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  partitioned_.clear();
  LOG_NET_INFO("Partition healed");
}

bool SimulatedTransport::IsPartitioned(const Address &addr) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return IsMarkedLocked(addr);
}

bool SimulatedTransport::IsPartitioned(const Address &a, const Address &b) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return IsMarkedLocked(a) || IsMarkedLocked(b);
}

bool SimulatedTransport::IsListening(const Address &addr) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listeners_.count(addr) > 0;
}

size_t SimulatedTransport::ListenerCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listeners_.size();
}

size_t SimulatedTransport::PendingMessages() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  size_t total = 0;
  for (const auto &[addr, queue] : listeners_) {
    total += queue->Size();
  }
  return total;
}

SimulatedTransport::Stats SimulatedTransport::GetStats() const {
  Stats stats;
  stats.messages_sent = messages_sent_.load(std::memory_order_relaxed);
  stats.messages_enqueued = messages_enqueued_.load(std::memory_order_relaxed);
  stats.rejected_partitioned = rejected_partitioned_.load(std::memory_order_relaxed);
  stats.rejected_queue_full = rejected_queue_full_.load(std::memory_order_relaxed);
  stats.rejected_not_found = rejected_not_found_.load(std::memory_order_relaxed);
  return stats;
}

void SimulatedTransport::Deregister(const Address &addr, const InboundQueuePtr &queue) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = listeners_.find(addr);
  // A stale listener must not remove a newer registration of the same address
  if (it != listeners_.end() && it->second == queue) {
    listeners_.erase(it);
    LOG_NET_DEBUG("Stopped listening on {}", addr.ToString());
  }
  queue->Close();
}

bool SimulatedTransport::IsMarkedLocked(const Address &addr) const {
  return partitioned_.count(addr) > 0;
}

} // namespace network
} // namespace gossipnet
