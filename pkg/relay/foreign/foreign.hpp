#pragma once

#include "relay/chat/chat.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace relay::foreign {

//! \brief Opaque handle into the foreign heap. Never dereferenced natively.
struct handle_s {
  void *raw{nullptr};

  explicit operator bool() const { return raw != nullptr; }
  bool operator==(const handle_s &rhs) const { return raw == rhs.raw; }
  bool operator!=(const handle_s &rhs) const { return raw != rhs.raw; }
};

// Typed views of a handle, so call sites state what they pass
struct byte_array_s {
  handle_s handle;
};

struct throwable_s {
  handle_s handle;
};

// One positional argument of a foreign call (a jvalue, restricted to what
// the listener methods take)
using value_t = std::variant<std::int64_t, handle_s>;

class bridge_exception : public std::runtime_error {
public:
  explicit bridge_exception(const std::string &msg)
      : std::runtime_error(msg) {}
};

class type_mismatch_exception : public bridge_exception {
public:
  explicit type_mismatch_exception(const std::string &msg)
      : bridge_exception(msg) {}
};

// A value handed in from the foreign side is out of range or unknown
class invalid_argument_exception : public bridge_exception {
public:
  explicit invalid_argument_exception(const std::string &msg)
      : bridge_exception(msg) {}
};

// The foreign runtime cannot be reached any more, usually it is shutting down
class attach_failure_exception : public bridge_exception {
public:
  explicit attach_failure_exception(const std::string &msg)
      : bridge_exception(msg) {}
};

class conversion_exception : public bridge_exception {
public:
  explicit conversion_exception(const std::string &msg)
      : bridge_exception(msg) {}
};

class invocation_exception : public bridge_exception {
public:
  explicit invocation_exception(const std::string &msg)
      : bridge_exception(msg) {}
};

class translation_exception : public bridge_exception {
public:
  explicit translation_exception(const std::string &msg)
      : bridge_exception(msg) {}
};

class environment_if;

/*
  The process-wide foreign runtime. Never owned by us, valid for the
  lifetime of the process.

  new_global_ref / delete_global_ref are the foreign runtime's own
  reference counting and must work from any thread, attached or not.
  delete_global_ref runs from destructors and must not throw.
*/
class vm_if {
public:
  virtual ~vm_if() = default;

  //! \brief Attach the calling thread, a no-op when already attached
  //! \throws attach_failure_exception
  virtual environment_if &attach_current_thread() = 0;
  virtual bool is_current_thread_attached() const = 0;
  //! \brief Must not throw, it runs from destructors
  virtual void detach_current_thread() = 0;

  virtual handle_s new_global_ref(handle_s object) = 0;
  virtual void delete_global_ref(handle_s object) = 0;
};

//! \brief Native values into foreign values (throws conversion_exception)
class value_converter_if {
public:
  virtual ~value_converter_if() = default;
  virtual std::string class_name_of(handle_s object) = 0;
  virtual handle_s new_byte_array(const std::vector<std::uint8_t> &bytes) = 0;
  virtual std::int64_t convert_ack(chat::server_message_ack_c ack) = 0;
  // Runs from destructors, must not throw
  virtual void delete_local_ref(handle_s object) = 0;
};

//! \brief Calls a void method on a foreign object (throws invocation_exception)
class method_invoker_if {
public:
  virtual ~method_invoker_if() = default;
  virtual void call_void_method(handle_s target, const char *name,
                                const char *signature,
                                const std::vector<value_t> &args) = 0;
};

//! \brief Native error into foreign exception (throws translation_exception)
class error_translator_if {
public:
  virtual ~error_translator_if() = default;
  virtual handle_s to_throwable(const chat::disconnect_cause_c &cause) = 0;
};

//! \brief What an attached thread can do with the foreign runtime
class environment_if : public value_converter_if,
                       public method_invoker_if,
                       public error_translator_if {
public:
  virtual ~environment_if() = default;
  virtual vm_if *get_vm() = 0;
};

} // namespace relay::foreign
