#pragma once

#include "gossip/gossip_message.hpp"
#include "gossip/trace_log.hpp"
#include "network/node.hpp"
#include "network/protocol.hpp"
#include "util/threadpool.hpp"
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace gossipnet {
namespace gossip {

/**
 * GossipNode - epidemic dissemination on top of a network::Node
 *
 * Per message id a node is either Unseen or Seen; Seen is permanent. The
 * first delivery of an id is logged, counted, traced and (if ttl > 0)
 * forwarded to every peer with ttl - 1. Later deliveries of the same id are
 * no-ops, which is what stops flooding on cyclic topologies.
 *
 * Delivery is best effort: a forward that fails (partitioned, unreachable,
 * queue full) is dropped without retry.
 *
 * Threading:
 * - State (peers, seen set, log, counters) is guarded by one reader/writer
 *   lock, never held across a send
 * - Fan-out sends run on a bounded per-node thread pool that Close() joins
 * - One fan-out worker by default: sends never block, so the peers of a
 *   fan-out are served back to back. fanout_threads > 1 sends to several
 *   peers in parallel
 */
class GossipNode {
public:
  struct Config {
    int max_ttl;                 // Hop budget of originated messages
    uint16_t base_port;          // Node id = port - base_port
    size_t fanout_threads;       // Workers in the fan-out pool (0 is treated as 1)
    size_t max_pending_fanouts;  // Queued sends before new ones are dropped

    Config()
        : max_ttl(protocol::DEFAULT_MAX_TTL), base_port(protocol::ports::BASE),
          fanout_threads(1), max_pending_fanouts(4096) {}
  };

  struct Stats {
    size_t peer_count = 0;
    size_t received_log_size = 0;
    uint64_t messages_sent = 0;      // Successful forward/originate sends
    uint64_t messages_received = 0;  // First-time network deliveries
  };

  /**
   * @param transport Shared address space (must outlive the node)
   * @param id Node id, also used as the gossip "sender" field
   * @param address Listening address
   * @param config Protocol parameters
   * @param trace_log Optional sink for delivery traces (may be nullptr)
   */
  GossipNode(network::Transport &transport, int id, network::Address address,
             const Config &config = Config{}, TraceLog *trace_log = nullptr);

  ~GossipNode();

  GossipNode(const GossipNode &) = delete;
  GossipNode &operator=(const GossipNode &) = delete;

  network::TransportResult Listen();
  bool Start();

  // Stop receiving, then drain and join the fan-out pool. Idempotent.
  void Close();

  // Returns false for our own address or a known peer
  bool AddPeer(const network::Address &peer);

  /**
   * Originate a message
   *
   * The originator marks the id as seen and appends the message to its own
   * received log, then sends it to every peer with ttl = max_ttl.
   *
   * @return The new message id
   */
  std::string Gossip(const std::string &content);

  /**
   * Process a gossip delivery
   *
   * @param msg Decoded gossip body
   * @param immediate_forwarder Id of the node that sent us this copy
   * @return true if the id was new (and therefore accepted)
   */
  bool HandleGossipMessage(GossipMessage msg, int immediate_forwarder);

  // Ask `peer` for its peer list; the answer is merged via AddPeer
  network::TransportResult RequestPeers(const network::Address &peer);

  std::vector<GossipMessage> GetReceivedMessages() const;
  std::vector<network::Address> GetPeers() const;
  bool HasSeen(const std::string &message_id) const;
  Stats GetStats() const;

  // No fan-out queued or running
  bool IsIdle() const { return fanout_pool_.is_idle(); }

  int GetID() const { return id_; }
  const network::Address &GetAddress() const { return node_.address(); }
  network::Node &node() { return node_; }

private:
  void SetupHandlers();

  // Send an encoded gossip body to a snapshot of the current peer set; one
  // encoding is shared by all fan-out tasks
  void SpreadGossip(std::shared_ptr<const std::string> body);

  bool HandleGossip(const network::Message &msg);
  bool HandleDiscover(const network::Message &msg);
  bool HandlePeers(const network::Message &msg);

  const int id_;
  const Config config_;
  TraceLog *trace_log_;

  network::Node node_;
  util::ThreadPool fanout_pool_;

  mutable std::shared_mutex mutex_;
  std::vector<network::Address> peers_;
  std::unordered_set<std::string> seen_;
  std::vector<GossipMessage> received_;
  uint64_t messages_sent_ = 0;
  uint64_t messages_received_ = 0;
};

} // namespace gossip
} // namespace gossipnet
