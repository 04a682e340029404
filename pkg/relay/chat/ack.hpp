#pragma once

#include "relay/chat/chat.hpp"
#include "relay/relay.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>

namespace relay::chat {

/*
  Pending acknowledgements handed across to the foreign side. The foreign
  side only ever sees the 64-bit handle. It may answer with send() at most
  once, and gives the handle back with destroy() when done with it,
  answered or not. The handle is dead after destroy().
*/
class ack_registry_c {
public:
  ack_registry_c(const ack_registry_c &) = delete;
  ack_registry_c(ack_registry_c &&) = delete;
  ack_registry_c &operator=(const ack_registry_c &) = delete;
  ack_registry_c &operator=(ack_registry_c &&) = delete;

  explicit ack_registry_c(logger_t logger);
  ~ack_registry_c();

  //! \brief Take ownership of an ack and return its handle (never 0)
  std::int64_t mint(server_message_ack_c ack);

  //! \brief Answer the server; false if unknown or already answered
  bool send(std::int64_t handle, std::uint16_t status);
  bool destroy(std::int64_t handle);

  //! \brief Handles not yet destroyed
  std::size_t pending() const;
  //! \brief Handles not yet destroyed and never answered
  std::size_t unanswered() const;

private:
  struct entry_s {
    server_message_ack_c ack;
    bool answered{false};
  };

  logger_t logger_;
  const char *name_{"ack_registry_c"};
  std::atomic<std::int64_t> next_handle_{1};
  mutable std::mutex mutex_;
  std::map<std::int64_t, entry_s> acks_;
};

} // namespace relay::chat
