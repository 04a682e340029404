#include "relay/chat/chat.hpp"
#include <fmt/core.h>

namespace relay::chat {

const char *disconnect_reason_name(disconnect_reason_e reason) {
  switch (reason) {
  case disconnect_reason_e::TRANSPORT_FAILURE:
    return "transport failure";
  case disconnect_reason_e::TIMEOUT:
    return "timeout";
  case disconnect_reason_e::CONNECTED_ELSEWHERE:
    return "connected elsewhere";
  case disconnect_reason_e::CONNECTION_INVALIDATED:
    return "connection invalidated";
  }
  return "unknown";
}

const char *throwable_class_for(disconnect_reason_e reason) {
  switch (reason) {
  case disconnect_reason_e::CONNECTED_ELSEWHERE:
    return "org/signal/libsignal/net/ConnectedElsewhereException";
  case disconnect_reason_e::CONNECTION_INVALIDATED:
    return "org/signal/libsignal/net/ConnectionInvalidatedException";
  case disconnect_reason_e::TRANSPORT_FAILURE:
  case disconnect_reason_e::TIMEOUT:
    break;
  }
  return "org/signal/libsignal/net/ChatServiceException";
}

std::string disconnect_cause_c::describe() const {
  if (message_.empty()) {
    return disconnect_reason_name(reason_);
  }
  return fmt::format("{}: {}", disconnect_reason_name(reason_), message_);
}

bool server_message_ack_c::send(std::uint16_t status) {
  if (!responder_) {
    return false;
  }
  auto responder = std::move(responder_);
  responder_ = nullptr;
  responder(status);
  return true;
}

} // namespace relay::chat
