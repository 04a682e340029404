/*
  References into the foreign runtime.

  The foreign runtime does the counting; all we do is pair every acquire
  with exactly one release:

  - vm_handle_c  : the un-owned VM pointer. No copy constructor. A new
                   handle can only be re-derived from a live one, and only
                   the listener adapter is allowed to do that.
  - global_ref_c : an owned global reference. One new_global_ref on
                   construction or clone, one delete_global_ref on death.
  - local_ref_c  : a local reference living for one delivery.
*/

#pragma once

#include "relay/foreign/foreign.hpp"
#include <cassert>
#include <utility>

namespace relay::listener {
class listener_adapter_c;
} // namespace relay::listener

namespace relay::foreign {

class vm_handle_c {
public:
  vm_handle_c(const vm_handle_c &) = delete;
  vm_handle_c &operator=(const vm_handle_c &) = delete;
  vm_handle_c(vm_handle_c &&other) noexcept : vm_(other.vm_) {
    other.vm_ = nullptr;
  }
  vm_handle_c &operator=(vm_handle_c &&other) noexcept {
    if (this != &other) {
      vm_ = other.vm_;
      other.vm_ = nullptr;
    }
    return *this;
  }

  //! \throws attach_failure_exception if the environment has no VM
  static vm_handle_c from_environment(environment_if &env) {
    vm_if *vm = env.get_vm();
    if (vm == nullptr) {
      throw attach_failure_exception("environment reported no foreign VM");
    }
    return vm_handle_c(vm);
  }

  vm_if &operator*() const { return *vm_; }
  vm_if *operator->() const { return vm_; }
  vm_if *get() const { return vm_; }

private:
  friend class relay::listener::listener_adapter_c;

  explicit vm_handle_c(vm_if *vm) : vm_(vm) {}

  vm_handle_c rederive() const {
    assert(vm_ != nullptr && "re-derived from a dead vm handle");
    return vm_handle_c(vm_);
  }

  vm_if *vm_{nullptr};
};

class global_ref_c {
public:
  global_ref_c(const global_ref_c &) = delete;
  global_ref_c &operator=(const global_ref_c &) = delete;
  global_ref_c(global_ref_c &&other) noexcept
      : vm_(other.vm_), object_(other.object_) {
    other.vm_ = nullptr;
    other.object_ = handle_s{};
  }
  global_ref_c &operator=(global_ref_c &&other) noexcept {
    if (this != &other) {
      release();
      vm_ = other.vm_;
      object_ = other.object_;
      other.vm_ = nullptr;
      other.object_ = handle_s{};
    }
    return *this;
  }

  ~global_ref_c() { release(); }

  static global_ref_c acquire(vm_if &vm, handle_s object) {
    return global_ref_c(&vm, vm.new_global_ref(object));
  }

  global_ref_c clone() const {
    assert(vm_ != nullptr && object_ && "cloned a released global ref");
    return acquire(*vm_, object_);
  }

  handle_s get() const { return object_; }
  operator bool() const { return static_cast<bool>(object_); }

private:
  global_ref_c(vm_if *vm, handle_s object) : vm_(vm), object_(object) {}

  void release() {
    if (vm_ != nullptr && object_) {
      vm_->delete_global_ref(object_);
    }
    vm_ = nullptr;
    object_ = handle_s{};
  }

  vm_if *vm_{nullptr};
  handle_s object_;
};

class local_ref_c {
public:
  local_ref_c(const local_ref_c &) = delete;
  local_ref_c &operator=(const local_ref_c &) = delete;
  local_ref_c(local_ref_c &&) = delete;
  local_ref_c &operator=(local_ref_c &&) = delete;

  local_ref_c(value_converter_if &env, handle_s object)
      : env_(env), object_(object) {}
  ~local_ref_c() {
    if (object_) {
      env_.delete_local_ref(object_);
    }
  }

  handle_s get() const { return object_; }

private:
  value_converter_if &env_;
  handle_s object_;
};

} // namespace relay::foreign
