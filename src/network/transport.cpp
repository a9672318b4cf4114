#include "network/transport.hpp"

namespace gossipnet {
namespace network {

const char *ToString(TransportResult result) {
  switch (result) {
  case TransportResult::Success:
    return "Success";
  case TransportResult::AddressInUse:
    return "AddressInUse";
  case TransportResult::AddressNotFound:
    return "AddressNotFound";
  case TransportResult::NetworkPartitioned:
    return "NetworkPartitioned";
  case TransportResult::QueueFull:
    return "QueueFull";
  case TransportResult::ConnectionClosed:
    return "ConnectionClosed";
  case TransportResult::InvalidAddress:
    return "InvalidAddress";
  case TransportResult::InvalidMessage:
    return "InvalidMessage";
  }
  return "Unknown";
}

} // namespace network
} // namespace gossipnet
