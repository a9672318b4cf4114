#ifndef GOSSIPNET_NETWORK_MESSAGE_DISPATCHER_HPP
#define GOSSIPNET_NETWORK_MESSAGE_DISPATCHER_HPP

#include "network/message.hpp"
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace gossipnet {
namespace network {

/**
 * MessageDispatcher - Handler table keyed by MessageKind
 *
 * Design:
 * - Protocol layers register one handler per message kind
 * - A later registration for the same kind replaces the earlier one
 * - A handler registered under MessageKind::Default receives every message
 *   whose kind has no dedicated handler (including unrecognised tags)
 * - Thread-safe registration and dispatch
 *
 * Error model:
 * - A handler reports failure by returning false or throwing
 *   std::exception; both are logged and turned into a false return value.
 *   Dispatch never propagates a handler exception, so a failing handler
 *   cannot stop the node's receive loop.
 *
 * Ownership Model:
 * - Handlers receive the message by const reference, valid only during the
 *   call. Copy what must outlive the handler.
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   dispatcher.RegisterHandler(MessageKind::Ping,
 *     [this](const Message& m) {
 *       return node_.Reply(m, MessageKind::Pong, "pong") == TransportResult::Success;
 *     });
 *   dispatcher.Dispatch(msg);
 */
class MessageDispatcher {
public:
  using MessageHandler = std::function<bool(const Message&)>;

  MessageDispatcher() = default;
  ~MessageDispatcher() = default;

  // Non-copyable
  MessageDispatcher(const MessageDispatcher&) = delete;
  MessageDispatcher& operator=(const MessageDispatcher&) = delete;

  /**
   * Register handler for a message kind
   *
   * @param kind Message kind (MessageKind::Default for the fallback slot)
   * @param handler Function to handle this kind (required, must not be empty)
   *
   * Note: Unknown kind and empty handlers are rejected
   */
  void RegisterHandler(MessageKind kind, MessageHandler handler);

  void UnregisterHandler(MessageKind kind);

  /**
   * Dispatch message to its handler, or to the Default handler
   *
   * @return false if no handler was found or the handler failed
   */
  bool Dispatch(const Message& msg);

  bool HasHandler(MessageKind kind) const;

  /**
   * Registered kinds (for diagnostics)
   *
   * @return Kinds sorted by enum value
   */
  std::vector<MessageKind> GetRegisteredKinds() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<MessageKind, MessageHandler> handlers_;
};

} // namespace network
} // namespace gossipnet

#endif // GOSSIPNET_NETWORK_MESSAGE_DISPATCHER_HPP
