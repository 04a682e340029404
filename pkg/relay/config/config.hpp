#pragma once

#include "relay/relay.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace relay {
using nlohmann::json;

/*
  {
    "listener": {
      "class": "org.signal.libsignal.net.internal.MakeChatListener",
      "attach_policy": "persistent" | "scoped"
    },
    "logging": { "name": "relay", "level": "info" }
  }

  Every field is optional. Missing or mistyped fields fall back to the
  defaults in options_s.
*/
class config_c {
public:
  std::string get_listener_class() const;
  attach_policy_e get_attach_policy() const;
  std::string get_logger_name() const;
  spdlog::level::level_enum get_log_level() const;

  options_s to_options() const;

  friend bool load_config(const std::string &path, config_c &config);
  friend bool parse_config(const std::string &text, config_c &config);

private:
  std::optional<std::string> get_string(const char *section,
                                        const char *field) const;

  json config_;
};

bool load_config(const std::string &path, config_c &config);
bool parse_config(const std::string &text, config_c &config);

} // namespace relay
