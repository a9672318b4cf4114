#pragma once

#include "network/address.hpp"
#include "network/message.hpp"
#include <memory>
#include <optional>

namespace gossipnet {
namespace network {

// Abstract transport interface for network communication
// Allows dependency injection of different implementations:
// - SimulatedTransport: in-process address space with fault injection
//
// Every node of a simulated network receives the same Transport by
// reference; the harness that builds the network owns it and must keep it
// alive until every node is closed.

// Result codes returned synchronously by every transport operation
enum class TransportResult {
  Success,
  AddressInUse,        // Listen: address already registered
  AddressNotFound,     // Dial/Send: no listener at the destination
  NetworkPartitioned,  // Send: sender or receiver is marked partitioned
  QueueFull,           // Send: destination inbound queue at capacity
  ConnectionClosed,    // Send/Receive on a closed handle or node
  InvalidAddress,      // Listen: host is not a valid IP address
  InvalidMessage,      // Send: kind cannot be put on the wire
};

const char *ToString(TransportResult result);

// Listener - inbound side of a registered address
class Listener {
public:
  virtual ~Listener() = default;

  // Block until a message arrives; std::nullopt once the listener is closed
  virtual std::optional<Message> Receive() = 0;

  // Never blocks
  virtual std::optional<Message> TryReceive() = 0;

  // Deregister the address and release the queue (idempotent)
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  virtual const Address &address() const = 0;
};

// OutboundConnection - lightweight handle to a dialed address
class OutboundConnection {
public:
  virtual ~OutboundConnection() = default;

  // Deliver msg to the dialed address (msg.to is set to the remote address)
  virtual TransportResult Send(Message msg) = 0;

  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  virtual const Address &remote_address() const = 0;
};

using ListenerPtr = std::shared_ptr<Listener>;
using OutboundConnectionPtr = std::shared_ptr<OutboundConnection>;

// Transport - address registry and message router
class Transport {
public:
  virtual ~Transport() = default;

  // Register addr exclusively; out receives the listener on Success
  virtual TransportResult Listen(const Address &addr, ListenerPtr &out) = 0;

  // Obtain an outbound handle; fails with AddressNotFound if nobody listens
  virtual TransportResult Dial(const Address &addr, OutboundConnectionPtr &out) = 0;

  // Enqueue msg into the listener registered at msg.to. Never blocks.
  virtual TransportResult Send(const Message &msg) = 0;
};

} // namespace network
} // namespace gossipnet
