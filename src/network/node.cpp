#include "network/node.hpp"
#include "util/logging.hpp"

namespace gossipnet {
namespace network {

Node::Node(Transport &transport, Address address)
    : transport_(transport), address_(std::move(address)) {}

Node::~Node() { Close(); }

TransportResult Node::Listen() {
  if (IsClosed()) {
    return TransportResult::ConnectionClosed;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (listener_) {
    return TransportResult::Success;
  }

  ListenerPtr listener;
  TransportResult result = transport_.Listen(address_, listener);
  if (result != TransportResult::Success) {
    LOG_NET_WARN("Node {} failed to listen: {}", address_.ToString(),
                 ToString(result));
    return result;
  }
  listener_ = std::move(listener);
  return TransportResult::Success;
}

void Node::Handle(MessageKind kind, MessageDispatcher::MessageHandler handler) {
  dispatcher_.RegisterHandler(kind, std::move(handler));
}

bool Node::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (IsClosed() || !listener_ || receive_thread_.joinable()) {
    return false;
  }

  running_.store(true, std::memory_order_release);
  receive_thread_ = std::thread([this, listener = listener_]() { ReceiveLoop(listener); });
  return true;
}

TransportResult Node::Send(const Address &to, MessageKind kind,
                           const std::vector<uint8_t> &body) {
  if (IsClosed()) {
    return TransportResult::ConnectionClosed;
  }
  if (!IsWireKind(kind)) {
    LOG_NET_ERROR("Node {} refused to send message of kind {}",
                  address_.ToString(), ToString(kind));
    return TransportResult::InvalidMessage;
  }

  OutboundConnectionPtr conn;
  TransportResult result = transport_.Dial(to, conn);
  if (result != TransportResult::Success) {
    return result;
  }

  Message msg;
  msg.from = address_;
  msg.payload = message::EncodePayload(kind, body);
  result = conn->Send(std::move(msg));
  conn->Close();
  return result;
}

TransportResult Node::SendString(const Address &to, MessageKind kind,
                                 std::string_view body) {
  return Send(to, kind, std::vector<uint8_t>(body.begin(), body.end()));
}

TransportResult Node::Reply(const Message &request, MessageKind kind,
                            std::string_view body) {
  return SendString(request.from, kind, body);
}

void Node::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  ListenerPtr listener;
  std::thread thread;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = std::move(listener_);
    thread = std::move(receive_thread_);
  }

  // Closing the listener wakes the blocked Receive()
  if (listener) {
    listener->Close();
  }

  if (thread.joinable()) {
    if (thread.get_id() == std::this_thread::get_id()) {
      thread.detach();
    } else {
      thread.join();
    }
  }
  running_.store(false, std::memory_order_release);
}

bool Node::IsListening() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listener_ && listener_->IsOpen();
}

void Node::ReceiveLoop(ListenerPtr listener) {
  // The loop may outlive a Close() issued from one of its own handlers, so
  // nothing below the final dispatch touches members.
  const std::string name = address_.ToString();
  LOG_NET_TRACE("Receive loop started for {}", name);

  while (auto msg = listener->Receive()) {
    messages_dispatched_.fetch_add(1, std::memory_order_relaxed);
    dispatcher_.Dispatch(*msg);
  }

  LOG_NET_TRACE("Receive loop stopped for {}", name);
}

} // namespace network
} // namespace gossipnet
