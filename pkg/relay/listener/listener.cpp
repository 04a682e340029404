#include "relay/listener/listener.hpp"
#include "relay/listener/methods.hpp"
#include <fmt/core.h>

namespace relay::listener {

listener_adapter_c::listener_adapter_c(logger_t logger,
                                       attach_policy_e attach_policy,
                                       foreign::vm_handle_c vm,
                                       foreign::global_ref_c listener)
    : logger_(logger), attach_policy_(attach_policy), vm_(std::move(vm)),
      listener_(std::move(listener)) {}

listener_adapter_c listener_adapter_c::clone() const {
  return listener_adapter_c(logger_, attach_policy_, vm_.rederive(),
                            listener_.clone());
}

std::unique_ptr<chat::chat_listener_if>
listener_adapter_c::make_listener() const {
  return std::make_unique<listener_adapter_c>(clone());
}

void listener_adapter_c::received_incoming_message(
    const std::vector<std::uint8_t> &envelope, chat::timestamp_c timestamp,
    chat::server_message_ack_c ack) {
  attach_and_log_on_error("incoming message", [&](foreign::environment_if &env) {
    foreign::local_ref_c envelope_array(env, env.new_byte_array(envelope));
    std::int64_t ack_handle = env.convert_ack(std::move(ack));
    methods::call(env, listener_.get(), methods::on_incoming_message,
                  foreign::byte_array_s{envelope_array.get()},
                  static_cast<std::int64_t>(timestamp.epoch_millis()),
                  ack_handle);
  });
}

void listener_adapter_c::received_queue_empty() {
  attach_and_log_on_error("queue empty", [&](foreign::environment_if &env) {
    methods::call(env, listener_.get(), methods::on_queue_empty);
  });
}

void listener_adapter_c::connection_interrupted(
    const chat::disconnect_cause_c &cause) {
  attach_and_log_on_error(
      "connection interrupted", [&](foreign::environment_if &env) {
        try {
          foreign::local_ref_c throwable(env, env.to_throwable(cause));
          methods::call(env, listener_.get(),
                        methods::on_connection_interrupted,
                        foreign::throwable_s{throwable.get()});
        } catch (const foreign::attach_failure_exception &) {
          throw;
        } catch (const foreign::bridge_exception &e) {
          logger_->error("[{}] failed to report connection interrupted: "
                         "failed to call onConnectionInterrupted with cause "
                         "{}: {}",
                         name_, cause.describe(), e.what());
        }
      });
}

listener_factory_c::listener_factory_c(logger_t logger,
                                       const options_s &options)
    : logger_(logger), expected_class_(options.listener_class),
      attach_policy_(options.attach_policy) {}

listener_adapter_c
listener_factory_c::create(foreign::environment_if &env,
                           foreign::handle_s listener) const {
  std::string actual_class = env.class_name_of(listener);
  if (actual_class != expected_class_) {
    logger_->error("[{}] Rejected listener of type {}, expected {}", name_,
                   actual_class, expected_class_);
    throw foreign::type_mismatch_exception(fmt::format(
        "expected an object of type {}, got {}", expected_class_,
        actual_class));
  }

  auto vm = foreign::vm_handle_c::from_environment(env);
  auto ref = foreign::global_ref_c::acquire(*vm, listener);
  logger_->debug("[{}] Created listener adapter for {} ({} attach)", name_,
                 actual_class, attach_policy_name(attach_policy_));
  return listener_adapter_c(logger_, attach_policy_, std::move(vm),
                            std::move(ref));
}

} // namespace relay::listener
