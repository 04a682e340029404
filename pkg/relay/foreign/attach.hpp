#pragma once

#include "relay/foreign/foreign.hpp"
#include "relay/relay.hpp"

namespace relay::foreign {

/*
  Attaches the calling thread for the length of one delivery. Whether the
  thread is detached again on the way out depends on the policy, and only
  ever happens if this scope did the attaching.
*/
class attach_scope_c {
public:
  attach_scope_c(const attach_scope_c &) = delete;
  attach_scope_c(attach_scope_c &&) = delete;
  attach_scope_c &operator=(const attach_scope_c &) = delete;
  attach_scope_c &operator=(attach_scope_c &&) = delete;

  //! \throws attach_failure_exception
  attach_scope_c(vm_if &vm, attach_policy_e policy, logger_t logger);
  ~attach_scope_c();

  environment_if &environment() const { return *env_; }

private:
  vm_if &vm_;
  attach_policy_e policy_;
  logger_t logger_;
  environment_if *env_{nullptr};
  bool attached_here_{false};
};

} // namespace relay::foreign
