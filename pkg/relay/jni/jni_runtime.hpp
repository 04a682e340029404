#pragma once

#include "relay/chat/ack.hpp"
#include "relay/foreign/foreign.hpp"
#include "relay/relay.hpp"
#include <jni.h>

namespace relay::jni {

constexpr jint REQUIRED_JNI_VERSION = JNI_VERSION_1_6;

class jni_vm_c;

//! \brief JNIEnv of one attached thread
class jni_environment_c : public foreign::environment_if {
public:
  jni_environment_c(JNIEnv *env, jni_vm_c *vm) : env_(env), vm_(vm) {}

  std::string class_name_of(foreign::handle_s object) override;
  foreign::handle_s new_byte_array(const std::vector<std::uint8_t> &bytes) override;
  std::int64_t convert_ack(chat::server_message_ack_c ack) override;
  void delete_local_ref(foreign::handle_s object) override;

  void call_void_method(foreign::handle_s target, const char *name,
                        const char *signature,
                        const std::vector<foreign::value_t> &args) override;

  foreign::handle_s to_throwable(const chat::disconnect_cause_c &cause) override;

  foreign::vm_if *get_vm() override;

private:
  // Clears a pending Java exception and returns its description
  std::string take_pending_exception();

  JNIEnv *env_;
  jni_vm_c *vm_;
};

class jni_vm_c : public foreign::vm_if {
public:
  jni_vm_c(const jni_vm_c &) = delete;
  jni_vm_c(jni_vm_c &&) = delete;
  jni_vm_c &operator=(const jni_vm_c &) = delete;
  jni_vm_c &operator=(jni_vm_c &&) = delete;

  jni_vm_c(JavaVM *vm, chat::ack_registry_c &acks, logger_t logger);
  ~jni_vm_c() = default;

  foreign::environment_if &attach_current_thread() override;
  bool is_current_thread_attached() const override;
  void detach_current_thread() override;

  foreign::handle_s new_global_ref(foreign::handle_s object) override;
  void delete_global_ref(foreign::handle_s object) override;

  //! \brief Environment for a thread the JVM is calling into right now
  jni_environment_c environment_for(JNIEnv *env) { return {env, this}; }

  chat::ack_registry_c &acks() { return acks_; }
  logger_t logger() const { return logger_; }

private:
  // Runs op with a JNIEnv, attaching only for the duration if needed
  template <typename Operation> auto with_env(Operation &&op);

  JavaVM *vm_;
  chat::ack_registry_c &acks_;
  logger_t logger_;
  const char *name_{"jni_vm_c"};
};

} // namespace relay::jni
