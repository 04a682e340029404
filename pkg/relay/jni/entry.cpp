/*
  Native methods of org.signal.libsignal.internal.Native and the JNI
  load hooks. Each native is a shim over bridge_c; failures surface as
  Java exceptions, never as C++ exceptions crossing into the JVM.
*/

#include "relay/bridge/bridge.hpp"
#include "relay/config/config.hpp"
#include "relay/jni/jni_runtime.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <utility>

namespace {

struct bridge_state_s {
  std::shared_ptr<spdlog::logger> logger;
  std::unique_ptr<relay::bridge::bridge_c> bridge;
  std::unique_ptr<relay::jni::jni_vm_c> vm;
};

std::unique_ptr<bridge_state_s> state;

relay::options_s load_options() {
  const char *path = std::getenv("RELAY_CONFIG");
  if (path == nullptr) {
    return relay::options_s{};
  }
  relay::config_c config;
  if (!relay::load_config(path, config)) {
    auto options = relay::options_s{};
    relay::create_logger(options)->warn(
        "Could not load config {}, using defaults", path);
    return options;
  }
  return config.to_options();
}

void throw_java(JNIEnv *env, const char *class_name, const char *message) {
  if (env->ExceptionCheck()) {
    return;
  }
  jclass exception_class = env->FindClass(class_name);
  if (exception_class != nullptr) {
    env->ThrowNew(exception_class, message);
    env->DeleteLocalRef(exception_class);
  }
}

const char *java_class_for(relay::bridge::failure_e failure) {
  switch (failure) {
  case relay::bridge::failure_e::INVALID_ARGUMENT:
    return "java/lang/IllegalArgumentException";
  case relay::bridge::failure_e::INTERNAL:
    break;
  }
  return "java/lang/IllegalStateException";
}

// Runs one native, raising any failure on the calling Java thread
template <typename Operation>
auto run_native(JNIEnv *env, const char *name, Operation &&operation)
    -> decltype(operation()) {
  using result_t = decltype(operation());
  if (!state) {
    throw_java(env, "java/lang/IllegalStateException", "relay is not loaded");
    return result_t();
  }
  return relay::bridge::run_at_boundary(
      state->logger.get(), name, std::forward<Operation>(operation),
      [env](relay::bridge::failure_e failure, const char *message) {
        throw_java(env, java_class_for(failure), message);
      });
}

} // namespace

extern "C" {

JNIEXPORT jint JNICALL JNI_OnLoad(JavaVM *vm, void *) {
  try {
    auto options = load_options();
    auto loaded = std::make_unique<bridge_state_s>();
    loaded->logger = relay::create_logger(options);
    loaded->bridge = std::make_unique<relay::bridge::bridge_c>(
        loaded->logger.get(), options);
    loaded->vm = std::make_unique<relay::jni::jni_vm_c>(
        vm, loaded->bridge->acks(), loaded->logger.get());
    loaded->logger->info(
        "[relay] Loaded, expecting listeners of type {} ({} attach)",
        options.listener_class,
        relay::attach_policy_name(options.attach_policy));
    state = std::move(loaded);
  } catch (const std::exception &e) {
    std::fprintf(stderr, "relay: cannot load: %s\n", e.what());
    return JNI_ERR;
  }
  return relay::jni::REQUIRED_JNI_VERSION;
}

JNIEXPORT void JNICALL JNI_OnUnload(JavaVM *, void *) {
  if (!state) {
    return;
  }
  auto live = state->bridge->live_listeners();
  if (live > 0) {
    // Those adapters still reach the VM through state->vm
    state->logger->warn(
        "[relay] Unloading with {} listeners alive, keeping bridge state",
        live);
    return;
  }
  state->logger->info("[relay] Unloading, {} acks never answered",
                      state->bridge->acks().unanswered());
  state.reset();
}

JNIEXPORT jlong JNICALL
Java_org_signal_libsignal_internal_Native_MakeChatListener_1new(
    JNIEnv *env, jclass, jobject listener) {
  return run_native(env, "MakeChatListener_new", [&]() -> jlong {
    auto environment = state->vm->environment_for(env);
    return state->bridge->new_listener(environment,
                                       relay::foreign::handle_s{listener});
  });
}

JNIEXPORT void JNICALL
Java_org_signal_libsignal_internal_Native_MakeChatListener_1Destroy(
    JNIEnv *env, jclass, jlong handle) {
  run_native(env, "MakeChatListener_Destroy",
             [&]() { state->bridge->destroy_listener(handle); });
}

JNIEXPORT jboolean JNICALL
Java_org_signal_libsignal_internal_Native_ServerMessageAck_1Send(
    JNIEnv *env, jclass, jlong handle, jint status) {
  return run_native(env, "ServerMessageAck_Send", [&]() -> jboolean {
    return state->bridge->send_ack(handle, status) ? JNI_TRUE : JNI_FALSE;
  });
}

JNIEXPORT void JNICALL
Java_org_signal_libsignal_internal_Native_ServerMessageAck_1Destroy(
    JNIEnv *env, jclass, jlong handle) {
  run_native(env, "ServerMessageAck_Destroy",
             [&]() { state->bridge->destroy_ack(handle); });
}

} // extern "C"
