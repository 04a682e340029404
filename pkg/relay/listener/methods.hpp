/*
  The only foreign methods we ever call. Each one is frozen to its name,
  its JNI signature and the native types of its arguments, so a call site
  passing the wrong thing fails to compile.
*/

#pragma once

#include "relay/foreign/foreign.hpp"
#include <cstdint>
#include <type_traits>
#include <vector>

namespace relay::listener::methods {

template <typename... Args> struct void_method_s {
  const char *name;
  const char *signature;
};

inline constexpr void_method_s<foreign::byte_array_s, std::int64_t, std::int64_t>
    on_incoming_message{"onIncomingMessage", "([BJJ)V"};

inline constexpr void_method_s<> on_queue_empty{"onQueueEmpty", "()V"};

inline constexpr void_method_s<foreign::throwable_s> on_connection_interrupted{
    "onConnectionInterrupted", "(Ljava/lang/Throwable;)V"};

inline foreign::value_t to_value(std::int64_t value) { return value; }
inline foreign::value_t to_value(const foreign::byte_array_s &value) {
  return value.handle;
}
inline foreign::value_t to_value(const foreign::throwable_s &value) {
  return value.handle;
}

template <typename... Args>
void call(foreign::method_invoker_if &invoker, foreign::handle_s target,
          const void_method_s<Args...> &method,
          const std::type_identity_t<Args> &...args) {
  invoker.call_void_method(target, method.name, method.signature,
                           std::vector<foreign::value_t>{to_value(args)...});
}

} // namespace relay::listener::methods
