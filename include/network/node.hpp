#pragma once

#include "network/message_dispatcher.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace gossipnet {
namespace network {

/**
 * Node - one address of the simulated network
 *
 * Wraps a Listener and a MessageDispatcher:
 * - Listen() registers the address with the transport
 * - Handle() binds a handler to a message kind
 * - Start() launches the receive loop, one thread per node
 * - Send() dials, sends and releases the outbound handle (no reuse)
 *
 * Lifecycle:
 *   Created -> Listening -> Running -> Closed
 * Closed is terminal: Listen/Start do nothing and Send returns
 * ConnectionClosed. Close() is idempotent.
 *
 * Threading:
 * - Handlers run on the receive-loop thread, one message at a time
 * - Send() may be called from any thread
 */
class Node {
public:
  Node(Transport &transport, Address address);

  // Closes the node (joins the receive loop)
  ~Node();

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  // Register the address; AddressInUse if someone else holds it
  TransportResult Listen();

  // Register (or replace) the handler for a message kind
  void Handle(MessageKind kind, MessageDispatcher::MessageHandler handler);

  // Launch the receive loop. Returns false if the node is not listening,
  // is already running or has been closed.
  bool Start();

  TransportResult Send(const Address &to, MessageKind kind,
                       const std::vector<uint8_t> &body);
  TransportResult SendString(const Address &to, MessageKind kind,
                             std::string_view body);

  // Send to the sender of `request`
  TransportResult Reply(const Message &request, MessageKind kind,
                        std::string_view body);

  /**
   * Stop receiving and deregister the address
   *
   * Joins the receive loop unless called from a handler running on it, in
   * which case the loop exits after the current handler returns.
   */
  void Close();

  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  bool IsListening() const;

  const Address &address() const { return address_; }

  uint64_t messages_dispatched() const {
    return messages_dispatched_.load(std::memory_order_relaxed);
  }

private:
  void ReceiveLoop(ListenerPtr listener);

  Transport &transport_;
  const Address address_;
  MessageDispatcher dispatcher_;

  mutable std::mutex mutex_;  // Guards listener_ and receive_thread_
  ListenerPtr listener_;
  std::thread receive_thread_;

  std::atomic<bool> closed_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> messages_dispatched_{0};
};

} // namespace network
} // namespace gossipnet
