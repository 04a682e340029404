#pragma once

#include "relay/chat/chat.hpp"
#include "relay/foreign/attach.hpp"
#include "relay/foreign/refs.hpp"
#include "relay/relay.hpp"
#include <exception>
#include <memory>
#include <vector>

namespace relay::listener {

class listener_factory_c;

/*
  Relays chat events into a foreign listener object.

  Each event becomes one best-effort foreign call. The calling thread is
  attached first; if that fails the foreign runtime is gone and the
  attach_failure_exception goes back to the event source. Anything that
  fails after that is logged and dropped, so one bad event never stops
  the deliveries after it.

  No state is kept between calls besides the two references, so the same
  instance or any of its clones can be driven from many threads at once.
*/
class listener_adapter_c : public chat::chat_listener_if,
                           public chat::make_chat_listener_if {
public:
  listener_adapter_c(const listener_adapter_c &) = delete;
  listener_adapter_c &operator=(const listener_adapter_c &) = delete;
  listener_adapter_c(listener_adapter_c &&) noexcept = default;
  listener_adapter_c &operator=(listener_adapter_c &&) noexcept = default;
  ~listener_adapter_c() override = default;

  //! \brief Same VM, one more global reference to the same object.
  //!        Does not need the calling thread to be attached.
  listener_adapter_c clone() const;

  std::unique_ptr<chat::chat_listener_if> make_listener() const override;

  void received_incoming_message(const std::vector<std::uint8_t> &envelope,
                                 chat::timestamp_c timestamp,
                                 chat::server_message_ack_c ack) override;
  void received_queue_empty() override;
  void connection_interrupted(const chat::disconnect_cause_c &cause) override;

  foreign::handle_s listener() const { return listener_.get(); }
  attach_policy_e attach_policy() const { return attach_policy_; }

private:
  friend class listener_factory_c;

  listener_adapter_c(logger_t logger, attach_policy_e attach_policy,
                     foreign::vm_handle_c vm, foreign::global_ref_c listener);

  template <typename Operation>
  void attach_and_log_on_error(const char *name, Operation &&operation) const {
    foreign::attach_scope_c scope(*vm_, attach_policy_, logger_);
    try {
      operation(scope.environment());
    } catch (const foreign::attach_failure_exception &) {
      throw;
    } catch (const std::exception &e) {
      logger_->error("[{}] failed to report {}: {}", name_, name, e.what());
    } catch (...) {
      logger_->error("[{}] failed to report {}: unknown exception", name_,
                     name);
    }
  }

  logger_t logger_;
  attach_policy_e attach_policy_;
  const char *name_{"listener_adapter_c"};
  foreign::vm_handle_c vm_;
  foreign::global_ref_c listener_;
};

//! \brief Checks and wraps a foreign listener object at subscription time
class listener_factory_c {
public:
  listener_factory_c(logger_t logger, const options_s &options);

  //! \throws type_mismatch_exception when the object is not a
  //!         options.listener_class, with no reference taken
  listener_adapter_c create(foreign::environment_if &env,
                            foreign::handle_s listener) const;

  const std::string &expected_class() const { return expected_class_; }

private:
  logger_t logger_;
  std::string expected_class_;
  attach_policy_e attach_policy_;
  const char *name_{"listener_factory_c"};
};

} // namespace relay::listener
