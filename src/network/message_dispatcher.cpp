#include "network/message_dispatcher.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace gossipnet {
namespace network {

void MessageDispatcher::RegisterHandler(MessageKind kind, MessageHandler handler) {
  if (kind == MessageKind::Unknown) {
    LOG_NET_WARN("Attempted to register handler for unknown message kind");
    return;
  }

  // Prevent std::bad_function_call at dispatch time
  if (!handler) {
    LOG_NET_ERROR("Attempted to register empty handler for kind: {}", ToString(kind));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[kind] = std::move(handler);
  LOG_NET_TRACE("Registered handler for kind: {}", ToString(kind));
}

void MessageDispatcher::UnregisterHandler(MessageKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(kind) > 0) {
    LOG_NET_TRACE("Unregistered handler for kind: {}", ToString(kind));
  }
}

bool MessageDispatcher::Dispatch(const Message& msg) {
  const MessageKind kind = msg.Kind();

  // Lock scope minimized: handlers run unlocked and may re-register
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(kind);
    if (it == handlers_.end()) {
      it = handlers_.find(MessageKind::Default);
    }
    if (it == handlers_.end()) {
      LOG_NET_WARN("Dropping '{}' message from {} to {}: no handler",
                   msg.Tag(), msg.from.ToString(), msg.to.ToString());
      return false;
    }
    handler = it->second;
  }

  try {
    if (!handler(msg)) {
      LOG_NET_WARN("Handler for '{}' from {} reported failure", msg.Tag(),
                   msg.from.ToString());
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    LOG_NET_ERROR("Handler exception for '{}' from {}: {}", msg.Tag(),
                  msg.from.ToString(), e.what());
    return false;
  }
}

bool MessageDispatcher::HasHandler(MessageKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(kind) > 0;
}

std::vector<MessageKind> MessageDispatcher::GetRegisteredKinds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MessageKind> result;
  result.reserve(handlers_.size());
  for (const auto& [kind, _] : handlers_) {
    result.push_back(kind);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace network
} // namespace gossipnet
