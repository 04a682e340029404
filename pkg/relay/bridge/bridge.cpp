#include "relay/bridge/bridge.hpp"
#include <fmt/core.h>
#include <limits>

namespace relay::bridge {

bridge_c::bridge_c(logger_t logger, const options_s &options)
    : logger_(logger), acks_(logger), factory_(logger, options) {}

bridge_c::~bridge_c() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!listeners_.empty()) {
    logger_->warn("[{}] Releasing {} listeners never destroyed", name_,
                  listeners_.size());
  }
}

std::int64_t bridge_c::new_listener(foreign::environment_if &env,
                                    foreign::handle_s listener) {
  auto adapter = std::make_unique<listener::listener_adapter_c>(
      factory_.create(env, listener));
  auto handle = static_cast<std::int64_t>(
      reinterpret_cast<std::uintptr_t>(adapter.get()));

  std::unique_lock<std::mutex> lock(mutex_);
  listeners_.emplace(handle, std::move(adapter));
  logger_->debug("[{}] Listener {:x} created ({} live)", name_, handle,
                 listeners_.size());
  return handle;
}

void bridge_c::destroy_listener(std::int64_t handle) {
  std::unique_ptr<listener::listener_adapter_c> adapter;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = listeners_.find(handle);
    if (it == listeners_.end()) {
      throw foreign::invalid_argument_exception(
          fmt::format("unknown chat listener handle {:x}", handle));
    }
    adapter = std::move(it->second);
    listeners_.erase(it);
  }

  // Releasing the global reference may attach, keep it out of the lock
  adapter.reset();
}

chat::make_chat_listener_if *bridge_c::find_listener(std::int64_t handle) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = listeners_.find(handle);
  return it == listeners_.end() ? nullptr : it->second.get();
}

std::size_t bridge_c::live_listeners() const {
  std::unique_lock<std::mutex> lock(mutex_);
  return listeners_.size();
}

bool bridge_c::send_ack(std::int64_t handle, std::int32_t status) {
  if (status < 0 || status > std::numeric_limits<std::uint16_t>::max()) {
    throw foreign::invalid_argument_exception(
        fmt::format("ack status {} is not a valid response status", status));
  }
  return acks_.send(handle, static_cast<std::uint16_t>(status));
}

void bridge_c::destroy_ack(std::int64_t handle) {
  if (!acks_.destroy(handle)) {
    throw foreign::invalid_argument_exception(
        fmt::format("unknown ack handle {}", handle));
  }
}

} // namespace relay::bridge
