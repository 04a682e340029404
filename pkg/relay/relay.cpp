#include "relay/relay.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace relay {

std::shared_ptr<spdlog::logger> create_logger(const options_s &options) {
  auto logger = spdlog::get(options.logger_name);
  if (!logger) {
    try {
      logger = spdlog::stdout_color_mt(options.logger_name);
    } catch (const spdlog::spdlog_ex &) {
      // Lost the registration race with another thread
      logger = spdlog::get(options.logger_name);
    }
  }
  logger->set_level(options.log_level);
  return logger;
}

const char *attach_policy_name(attach_policy_e policy) {
  switch (policy) {
  case attach_policy_e::PERSISTENT:
    return "persistent";
  case attach_policy_e::SCOPED:
    return "scoped";
  }
  return "unknown";
}

} // namespace relay
