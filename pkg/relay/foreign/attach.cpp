#include "relay/foreign/attach.hpp"
#include <functional>
#include <thread>

namespace relay::foreign {

attach_scope_c::attach_scope_c(vm_if &vm, attach_policy_e policy,
                               logger_t logger)
    : vm_(vm), policy_(policy), logger_(logger) {
  attached_here_ = !vm_.is_current_thread_attached();
  env_ = &vm_.attach_current_thread();
  if (attached_here_) {
    logger_->debug("[attach_scope_c] Attached thread {:x} ({})",
                   std::hash<std::thread::id>{}(std::this_thread::get_id()),
                   attach_policy_name(policy_));
  }
}

attach_scope_c::~attach_scope_c() {
  if (attached_here_ && policy_ == attach_policy_e::SCOPED) {
    vm_.detach_current_thread();
    logger_->debug("[attach_scope_c] Detached thread {:x}",
                   std::hash<std::thread::id>{}(std::this_thread::get_id()));
  }
}

} // namespace relay::foreign
