#include "relay/jni/jni_runtime.hpp"
#include <fmt/core.h>
#include <optional>
#include <type_traits>

namespace relay::jni {

std::string jni_environment_c::take_pending_exception() {
  jthrowable pending = env_->ExceptionOccurred();
  if (pending == nullptr) {
    return "unknown failure, no java exception pending";
  }
  env_->ExceptionClear();

  std::string description = "java exception";
  jclass throwable_class = env_->GetObjectClass(pending);
  jmethodID to_string =
      env_->GetMethodID(throwable_class, "toString", "()Ljava/lang/String;");
  if (to_string != nullptr) {
    auto text = static_cast<jstring>(env_->CallObjectMethod(pending, to_string));
    if (!env_->ExceptionCheck() && text != nullptr) {
      const char *chars = env_->GetStringUTFChars(text, nullptr);
      if (chars != nullptr) {
        description = chars;
        env_->ReleaseStringUTFChars(text, chars);
      }
    }
    if (text != nullptr) {
      env_->DeleteLocalRef(text);
    }
  }

  // toString itself may have thrown
  env_->ExceptionClear();
  env_->DeleteLocalRef(throwable_class);
  env_->DeleteLocalRef(pending);
  return description;
}

std::string jni_environment_c::class_name_of(foreign::handle_s object) {
  auto obj = static_cast<jobject>(object.raw);
  if (obj == nullptr) {
    throw foreign::conversion_exception("cannot take the class of null");
  }

  jclass object_class = env_->GetObjectClass(obj);
  jclass class_class = env_->FindClass("java/lang/Class");
  if (class_class == nullptr) {
    env_->DeleteLocalRef(object_class);
    throw foreign::conversion_exception(take_pending_exception());
  }
  jmethodID get_name =
      env_->GetMethodID(class_class, "getName", "()Ljava/lang/String;");
  env_->DeleteLocalRef(class_class);
  if (get_name == nullptr) {
    env_->DeleteLocalRef(object_class);
    throw foreign::conversion_exception(take_pending_exception());
  }

  auto name = static_cast<jstring>(env_->CallObjectMethod(object_class, get_name));
  env_->DeleteLocalRef(object_class);
  if (env_->ExceptionCheck() || name == nullptr) {
    throw foreign::conversion_exception(take_pending_exception());
  }

  std::string result;
  const char *chars = env_->GetStringUTFChars(name, nullptr);
  if (chars != nullptr) {
    result = chars;
    env_->ReleaseStringUTFChars(name, chars);
  }
  env_->DeleteLocalRef(name);
  return result;
}

foreign::handle_s
jni_environment_c::new_byte_array(const std::vector<std::uint8_t> &bytes) {
  auto length = static_cast<jsize>(bytes.size());
  if (static_cast<std::size_t>(length) != bytes.size()) {
    throw foreign::conversion_exception(
        fmt::format("{} bytes do not fit in a java array", bytes.size()));
  }

  jbyteArray array = env_->NewByteArray(length);
  if (array == nullptr) {
    throw foreign::conversion_exception(take_pending_exception());
  }
  env_->SetByteArrayRegion(array, 0, length,
                           reinterpret_cast<const jbyte *>(bytes.data()));
  if (env_->ExceptionCheck()) {
    auto description = take_pending_exception();
    env_->DeleteLocalRef(array);
    throw foreign::conversion_exception(description);
  }
  return foreign::handle_s{array};
}

std::int64_t jni_environment_c::convert_ack(chat::server_message_ack_c ack) {
  return vm_->acks().mint(std::move(ack));
}

void jni_environment_c::delete_local_ref(foreign::handle_s object) {
  if (object) {
    env_->DeleteLocalRef(static_cast<jobject>(object.raw));
  }
}

void jni_environment_c::call_void_method(
    foreign::handle_s target, const char *name, const char *signature,
    const std::vector<foreign::value_t> &args) {
  auto obj = static_cast<jobject>(target.raw);
  if (obj == nullptr) {
    throw foreign::invocation_exception(
        fmt::format("{}{} called on null", name, signature));
  }

  std::vector<jvalue> jargs(args.size());
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::visit(
        [&](auto &&arg) {
          using arg_t = std::decay_t<decltype(arg)>;
          if constexpr (std::is_same_v<arg_t, std::int64_t>) {
            jargs[i].j = static_cast<jlong>(arg);
          } else {
            jargs[i].l = static_cast<jobject>(arg.raw);
          }
        },
        args[i]);
  }

  jclass target_class = env_->GetObjectClass(obj);
  jmethodID method = env_->GetMethodID(target_class, name, signature);
  env_->DeleteLocalRef(target_class);
  if (method == nullptr) {
    throw foreign::invocation_exception(fmt::format(
        "no method {}{}: {}", name, signature, take_pending_exception()));
  }

  env_->CallVoidMethodA(obj, method, jargs.data());
  if (env_->ExceptionCheck()) {
    throw foreign::invocation_exception(fmt::format(
        "{} threw {}", name, take_pending_exception()));
  }
}

foreign::handle_s
jni_environment_c::to_throwable(const chat::disconnect_cause_c &cause) {
  const char *class_name = chat::throwable_class_for(cause.reason());
  jclass exception_class = env_->FindClass(class_name);
  if (exception_class == nullptr) {
    throw foreign::translation_exception(fmt::format(
        "cannot load {}: {}", class_name, take_pending_exception()));
  }

  jmethodID constructor =
      env_->GetMethodID(exception_class, "<init>", "(Ljava/lang/String;)V");
  if (constructor == nullptr) {
    env_->DeleteLocalRef(exception_class);
    throw foreign::translation_exception(fmt::format(
        "{} has no (String) constructor: {}", class_name,
        take_pending_exception()));
  }

  jstring message = env_->NewStringUTF(cause.describe().c_str());
  if (message == nullptr) {
    env_->DeleteLocalRef(exception_class);
    throw foreign::translation_exception(take_pending_exception());
  }

  jobject throwable = env_->NewObject(exception_class, constructor, message);
  env_->DeleteLocalRef(message);
  env_->DeleteLocalRef(exception_class);
  if (throwable == nullptr || env_->ExceptionCheck()) {
    throw foreign::translation_exception(fmt::format(
        "constructing {} failed: {}", class_name, take_pending_exception()));
  }
  return foreign::handle_s{throwable};
}

foreign::vm_if *jni_environment_c::get_vm() { return vm_; }

jni_vm_c::jni_vm_c(JavaVM *vm, chat::ack_registry_c &acks, logger_t logger)
    : vm_(vm), acks_(acks), logger_(logger) {}

foreign::environment_if &jni_vm_c::attach_current_thread() {
  JNIEnv *env = nullptr;
  jint rc = vm_->GetEnv(reinterpret_cast<void **>(&env), REQUIRED_JNI_VERSION);
  if (rc == JNI_EDETACHED) {
    rc = vm_->AttachCurrentThread(reinterpret_cast<void **>(&env), nullptr);
  }
  if (rc != JNI_OK || env == nullptr) {
    throw foreign::attach_failure_exception(
        fmt::format("cannot attach thread to the JVM (code {})", rc));
  }

  thread_local std::optional<jni_environment_c> environment;
  environment.emplace(env, this);
  return *environment;
}

bool jni_vm_c::is_current_thread_attached() const {
  JNIEnv *env = nullptr;
  return vm_->GetEnv(reinterpret_cast<void **>(&env), REQUIRED_JNI_VERSION) == JNI_OK;
}

void jni_vm_c::detach_current_thread() {
  jint rc = vm_->DetachCurrentThread();
  if (rc != JNI_OK) {
    logger_->warn("[{}] DetachCurrentThread failed (code {})", name_, rc);
  }
}

template <typename Operation> auto jni_vm_c::with_env(Operation &&op) {
  JNIEnv *env = nullptr;
  jint rc = vm_->GetEnv(reinterpret_cast<void **>(&env), REQUIRED_JNI_VERSION);
  bool attached_here = false;
  if (rc == JNI_EDETACHED) {
    rc = vm_->AttachCurrentThread(reinterpret_cast<void **>(&env), nullptr);
    attached_here = rc == JNI_OK;
  }
  if (rc != JNI_OK || env == nullptr) {
    throw foreign::attach_failure_exception(
        fmt::format("cannot reach the JVM (code {})", rc));
  }

  struct detach_guard_s {
    jni_vm_c *vm;
    bool active;
    ~detach_guard_s() {
      if (active) {
        vm->detach_current_thread();
      }
    }
  } guard{this, attached_here};

  return op(env);
}

foreign::handle_s jni_vm_c::new_global_ref(foreign::handle_s object) {
  return with_env([&](JNIEnv *env) {
    jobject global = env->NewGlobalRef(static_cast<jobject>(object.raw));
    if (global == nullptr) {
      throw foreign::bridge_exception("NewGlobalRef failed");
    }
    return foreign::handle_s{global};
  });
}

void jni_vm_c::delete_global_ref(foreign::handle_s object) {
  try {
    with_env([&](JNIEnv *env) {
      env->DeleteGlobalRef(static_cast<jobject>(object.raw));
    });
  } catch (const foreign::attach_failure_exception &e) {
    // The VM is going away and takes the reference with it
    logger_->warn("[{}] Global ref not deleted: {}", name_, e.what());
  }
}

} // namespace relay::jni
