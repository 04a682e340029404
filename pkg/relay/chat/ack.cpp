#include "relay/chat/ack.hpp"

namespace relay::chat {

ack_registry_c::ack_registry_c(logger_t logger) : logger_(logger) {}

ack_registry_c::~ack_registry_c() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!acks_.empty()) {
    logger_->warn("[{}] Dropping {} acks never given back", name_,
                  acks_.size());
  }
}

std::int64_t ack_registry_c::mint(server_message_ack_c ack) {
  std::int64_t handle = next_handle_.fetch_add(1);
  std::unique_lock<std::mutex> lock(mutex_);
  acks_.emplace(handle, entry_s{std::move(ack), false});
  logger_->trace("[{}] Minted ack handle {} ({} pending)", name_, handle,
                 acks_.size());
  return handle;
}

bool ack_registry_c::send(std::int64_t handle, std::uint16_t status) {
  server_message_ack_c ack;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = acks_.find(handle);
    if (it == acks_.end()) {
      logger_->warn("[{}] Send on unknown ack handle {}", name_, handle);
      return false;
    }
    if (it->second.answered) {
      logger_->warn("[{}] Ack handle {} answered twice", name_, handle);
      return false;
    }
    ack = std::move(it->second.ack);
    it->second.answered = true;
  }

  // Responder runs outside the lock, it may call back into us
  return ack.send(status);
}

bool ack_registry_c::destroy(std::int64_t handle) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto erased = acks_.erase(handle);
  if (erased == 0) {
    logger_->warn("[{}] Destroy on unknown ack handle {}", name_, handle);
    return false;
  }
  return true;
}

std::size_t ack_registry_c::pending() const {
  std::unique_lock<std::mutex> lock(mutex_);
  return acks_.size();
}

std::size_t ack_registry_c::unanswered() const {
  std::unique_lock<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &[handle, entry] : acks_) {
    if (!entry.answered) {
      ++count;
    }
  }
  return count;
}

} // namespace relay::chat
