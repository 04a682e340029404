/*
  Everything the JNI entry points need, kept free of JNI so it can be
  driven without a JVM. Listener adapters and acks cross into the foreign
  runtime as 64-bit handles owned here until the foreign side gives them
  back.
*/

#pragma once

#include "relay/chat/ack.hpp"
#include "relay/listener/listener.hpp"
#include "relay/relay.hpp"
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <type_traits>

namespace relay::bridge {

enum class failure_e {
  INVALID_ARGUMENT,
  INTERNAL,
};

/*
  Runs a native entry point so nothing escapes into the foreign runtime.
  Any failure is handed to on_failure(kind, message), which raises it on
  the foreign side, and a value-initialised result is returned instead.
  Internal failures are also logged here; invalid arguments are the
  caller's mistake and only reported to them.
*/
template <typename Operation, typename OnFailure>
auto run_at_boundary(logger_t logger, const char *name, Operation &&operation,
                     OnFailure &&on_failure) -> decltype(operation()) {
  using result_t = decltype(operation());
  try {
    return operation();
  } catch (const foreign::type_mismatch_exception &e) {
    on_failure(failure_e::INVALID_ARGUMENT, e.what());
  } catch (const foreign::invalid_argument_exception &e) {
    on_failure(failure_e::INVALID_ARGUMENT, e.what());
  } catch (const std::exception &e) {
    logger->error("[{}] failed: {}", name, e.what());
    on_failure(failure_e::INTERNAL, e.what());
  } catch (...) {
    logger->error("[{}] failed: unknown exception", name);
    on_failure(failure_e::INTERNAL, "unknown native failure");
  }
  if constexpr (!std::is_void_v<result_t>) {
    return result_t{};
  }
}

class bridge_c {
public:
  bridge_c(const bridge_c &) = delete;
  bridge_c(bridge_c &&) = delete;
  bridge_c &operator=(const bridge_c &) = delete;
  bridge_c &operator=(bridge_c &&) = delete;

  bridge_c(logger_t logger, const options_s &options);
  ~bridge_c();

  //! \throws type_mismatch_exception, see listener_factory_c::create
  std::int64_t new_listener(foreign::environment_if &env,
                            foreign::handle_s listener);
  //! \throws invalid_argument_exception for an unknown handle
  void destroy_listener(std::int64_t handle);

  //! \brief Borrow a live listener for a new connection, nullptr if unknown
  chat::make_chat_listener_if *find_listener(std::int64_t handle);
  std::size_t live_listeners() const;

  //! \throws invalid_argument_exception for a status outside 0..65535
  bool send_ack(std::int64_t handle, std::int32_t status);
  //! \throws invalid_argument_exception for an unknown handle
  void destroy_ack(std::int64_t handle);

  chat::ack_registry_c &acks() { return acks_; }

private:
  logger_t logger_;
  const char *name_{"bridge_c"};
  chat::ack_registry_c acks_;
  listener::listener_factory_c factory_;

  mutable std::mutex mutex_;
  std::map<std::int64_t, std::unique_ptr<listener::listener_adapter_c>>
      listeners_;
};

} // namespace relay::bridge
