#include "relay/config/config.hpp"
#include <fstream>

namespace relay {

bool load_config(const std::string &path, config_c &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  try {
    file >> config.config_;
  } catch (const json::exception &) {
    return false;
  }
  return config.config_.is_object();
}

bool parse_config(const std::string &text, config_c &config) {
  try {
    config.config_ = json::parse(text);
  } catch (const json::exception &) {
    return false;
  }
  return config.config_.is_object();
}

std::optional<std::string> config_c::get_string(const char *section,
                                                const char *field) const {
  if (!config_.is_object()) {
    return std::nullopt;
  }
  auto it_section = config_.find(section);
  if (it_section == config_.end() || !it_section->is_object()) {
    return std::nullopt;
  }
  auto it_field = it_section->find(field);
  if (it_field == it_section->end() || !it_field->is_string()) {
    return std::nullopt;
  }
  return it_field->get<std::string>();
}

std::string config_c::get_listener_class() const {
  return get_string("listener", "class").value_or(DEFAULT_LISTENER_CLASS);
}

attach_policy_e config_c::get_attach_policy() const {
  auto policy = get_string("listener", "attach_policy");
  if (policy && *policy == "scoped") {
    return attach_policy_e::SCOPED;
  }
  return attach_policy_e::PERSISTENT;
}

std::string config_c::get_logger_name() const {
  return get_string("logging", "name").value_or(DEFAULT_LOGGER_NAME);
}

spdlog::level::level_enum config_c::get_log_level() const {
  auto level = get_string("logging", "level");
  if (!level) {
    return spdlog::level::info;
  }
  // from_str maps anything it does not know to off
  auto parsed = spdlog::level::from_str(*level);
  if (parsed == spdlog::level::off && *level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

options_s config_c::to_options() const {
  options_s options;
  options.listener_class = get_listener_class();
  options.attach_policy = get_attach_policy();
  options.logger_name = get_logger_name();
  options.log_level = get_log_level();
  return options;
}

} // namespace relay
