#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace relay {

using logger_t = spdlog::logger *;

constexpr const char *DEFAULT_LISTENER_CLASS =
    "org.signal.libsignal.net.internal.MakeChatListener";
constexpr const char *DEFAULT_LOGGER_NAME = "relay";

/*
  PERSISTENT leaves a thread attached once a delivery attached it, so the
  next delivery on that thread is cheap. SCOPED detaches at the end of the
  delivery that did the attach. A thread that was already attached when
  the delivery started is never detached by us in either mode.
*/
enum class attach_policy_e {
  PERSISTENT,
  SCOPED,
};

struct options_s {
  std::string listener_class{DEFAULT_LISTENER_CLASS};
  attach_policy_e attach_policy{attach_policy_e::PERSISTENT};
  std::string logger_name{DEFAULT_LOGGER_NAME};
  spdlog::level::level_enum log_level{spdlog::level::info};
};

//! \brief Fetch the logger named in the options, creating a colour stdout
//!        logger if nobody registered one yet
std::shared_ptr<spdlog::logger> create_logger(const options_s &options);

const char *attach_policy_name(attach_policy_e policy);

} // namespace relay
