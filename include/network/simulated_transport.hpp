#ifndef GOSSIPNET_NETWORK_SIMULATED_TRANSPORT_HPP
#define GOSSIPNET_NETWORK_SIMULATED_TRANSPORT_HPP

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <vector>

namespace gossipnet {
namespace network {

/**
 * SimulatedTransport - In-process address space
 *
 * Replaces sockets with bounded in-memory queues, one per listening address.
 * Supports:
 * - Exclusive address registration (AddressInUse on a second Listen)
 * - Fail-fast delivery: a full destination queue rejects with QueueFull
 * - Network partitions via address marks
 *
 * Partition semantics:
 *   Partition(group_a, group_b) marks every address of both groups. A message
 *   is rejected with NetworkPartitioned if its sender OR its receiver is
 *   marked, so a marked address is unreachable from everyone, not only from
 *   the opposite group. Heal() clears every mark.
 *
 * Locking:
 *   The registry and the partition marks share one reader/writer lock. Send
 *   holds it (shared) for the whole delivery, so the destination queue
 *   cannot be closed mid-delivery; Listen/Close/Partition/Heal take it
 *   exclusively. Ordering is preserved per sender->receiver pair because
 *   each message has a single enqueue point; there is no ordering across
 *   different senders.
 */
class SimulatedTransport : public Transport {
public:
  struct Config {
    size_t queue_capacity;  // Inbound queue capacity per listener

    Config() : queue_capacity(protocol::DEFAULT_QUEUE_CAPACITY) {}
  };

  struct Stats {
    uint64_t messages_sent = 0;         // Send attempts
    uint64_t messages_enqueued = 0;     // Accepted into a queue
    uint64_t rejected_partitioned = 0;
    uint64_t rejected_queue_full = 0;
    uint64_t rejected_not_found = 0;
  };

  explicit SimulatedTransport(const Config &config = Config{});

  // Closes every remaining queue (waking blocked receivers)
  ~SimulatedTransport() override;

  SimulatedTransport(const SimulatedTransport &) = delete;
  SimulatedTransport &operator=(const SimulatedTransport &) = delete;

  TransportResult Listen(const Address &addr, ListenerPtr &out) override;
  TransportResult Dial(const Address &addr, OutboundConnectionPtr &out) override;
  TransportResult Send(const Message &msg) override;

  // Fault injection
  void Partition(const std::vector<Address> &group_a,
                 const std::vector<Address> &group_b);
  void Heal();
  bool IsPartitioned(const Address &addr) const;

  // Would a message between a and b be rejected by a partition mark?
  bool IsPartitioned(const Address &a, const Address &b) const;

  bool IsListening(const Address &addr) const;
  size_t ListenerCount() const;

  // Messages enqueued but not yet received, summed over all listeners
  size_t PendingMessages() const;
  Stats GetStats() const;

private:
  using InboundQueue = util::BoundedQueue<Message>;
  using InboundQueuePtr = std::shared_ptr<InboundQueue>;

  class SimulatedListener;
  class SimulatedOutbound;

  // Remove addr if it is still bound to queue, then close queue
  void Deregister(const Address &addr, const InboundQueuePtr &queue);

  bool IsMarkedLocked(const Address &addr) const;

  const Config config_;

  mutable std::shared_mutex mutex_;
  std::map<Address, InboundQueuePtr> listeners_;
  std::set<Address> partitioned_;

  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> messages_enqueued_{0};
  std::atomic<uint64_t> rejected_partitioned_{0};
  std::atomic<uint64_t> rejected_queue_full_{0};
  std::atomic<uint64_t> rejected_not_found_{0};
};

} // namespace network
} // namespace gossipnet

#endif // GOSSIPNET_NETWORK_SIMULATED_TRANSPORT_HPP
