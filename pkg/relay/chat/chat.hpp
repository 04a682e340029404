#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relay::chat {

class timestamp_c {
public:
  timestamp_c() = default;
  explicit timestamp_c(std::chrono::system_clock::time_point point)
      : point_(point) {}

  static timestamp_c from_epoch_millis(std::uint64_t millis) {
    return timestamp_c(std::chrono::system_clock::time_point(
        std::chrono::milliseconds(millis)));
  }

  std::uint64_t epoch_millis() const {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            point_.time_since_epoch())
            .count());
  }

private:
  std::chrono::system_clock::time_point point_{};
};

enum class disconnect_reason_e {
  TRANSPORT_FAILURE,
  TIMEOUT,
  CONNECTED_ELSEWHERE,
  CONNECTION_INVALIDATED,
};

const char *disconnect_reason_name(disconnect_reason_e reason);

//! \brief JNI name of the Java exception class reporting a reason
const char *throwable_class_for(disconnect_reason_e reason);

//! \brief Why a chat connection ended
class disconnect_cause_c {
public:
  disconnect_cause_c(disconnect_reason_e reason, std::string message)
      : reason_(reason), message_(std::move(message)) {}

  disconnect_reason_e reason() const { return reason_; }
  const std::string &message() const { return message_; }

  //! \brief "<reason>: <message>", used in diagnostics
  std::string describe() const;

private:
  disconnect_reason_e reason_;
  std::string message_;
};

/*
  A server-pushed message waiting for its acknowledgement. The responder
  is invoked at most once, with the status to report to the server.
  Dropping an unsent ack answers nothing.
*/
class server_message_ack_c {
public:
  using responder_t = std::function<void(std::uint16_t status)>;

  server_message_ack_c() = default;
  explicit server_message_ack_c(responder_t responder)
      : responder_(std::move(responder)) {}

  server_message_ack_c(const server_message_ack_c &) = delete;
  server_message_ack_c &operator=(const server_message_ack_c &) = delete;
  server_message_ack_c(server_message_ack_c &&other) noexcept
      : responder_(std::move(other.responder_)) {
    other.responder_ = nullptr;
  }
  server_message_ack_c &operator=(server_message_ack_c &&other) noexcept {
    if (this != &other) {
      responder_ = std::move(other.responder_);
      other.responder_ = nullptr;
    }
    return *this;
  }

  bool is_pending() const { return static_cast<bool>(responder_); }

  //! \brief Answer the server; returns false if already answered
  bool send(std::uint16_t status);

private:
  responder_t responder_;
};

//! \brief Events a chat connection reports to whoever listens on it
class chat_listener_if {
public:
  virtual ~chat_listener_if() = default;
  virtual void received_incoming_message(const std::vector<std::uint8_t> &envelope,
                                         timestamp_c timestamp,
                                         server_message_ack_c ack) = 0;
  virtual void received_queue_empty() = 0;
  virtual void connection_interrupted(const disconnect_cause_c &cause) = 0;
};

//! \brief Hands out a fresh listener for every connection
class make_chat_listener_if {
public:
  virtual ~make_chat_listener_if() = default;
  virtual std::unique_ptr<chat_listener_if> make_listener() const = 0;
};

} // namespace relay::chat
