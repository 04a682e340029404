#include <relay/config/config.hpp>
#include <snitch/snitch.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace {
std::string get_unique_test_path(const std::string &base) {
  static std::atomic<int> counter{0};
  auto dir = std::filesystem::temp_directory_path();
  return (dir / (base + "_" + std::to_string(counter.fetch_add(1)) + "_" +
                 std::to_string(std::chrono::steady_clock::now()
                                    .time_since_epoch()
                                    .count()) +
                 ".json"))
      .string();
}

std::string write_file(const std::string &contents) {
  auto path = get_unique_test_path("relay_config_test");
  std::ofstream out(path);
  out << contents;
  return path;
}
} // namespace

TEST_CASE("config defaults", "[unit][relay][config]") {
  relay::config_c config;
  REQUIRE(relay::parse_config("{}", config));

  auto options = config.to_options();
  CHECK(options.listener_class == relay::DEFAULT_LISTENER_CLASS);
  CHECK(options.attach_policy == relay::attach_policy_e::PERSISTENT);
  CHECK(options.logger_name == relay::DEFAULT_LOGGER_NAME);
  CHECK(options.log_level == spdlog::level::info);
}

TEST_CASE("config reads every field", "[unit][relay][config]") {
  relay::config_c config;
  REQUIRE(relay::parse_config(R"({
      "listener": {
        "class": "org.example.Listener",
        "attach_policy": "scoped"
      },
      "logging": { "name": "bridge", "level": "debug" }
    })",
                              config));

  CHECK(config.get_listener_class() == "org.example.Listener");
  CHECK(config.get_attach_policy() == relay::attach_policy_e::SCOPED);
  CHECK(config.get_logger_name() == "bridge");
  CHECK(config.get_log_level() == spdlog::level::debug);
}

TEST_CASE("config falls back on bad fields", "[unit][relay][config]") {
  relay::config_c config;

  SECTION("wrong types") {
    REQUIRE(relay::parse_config(
        R"({"listener": {"class": 7, "attach_policy": true},
            "logging": "loud"})",
        config));
    CHECK(config.get_listener_class() == relay::DEFAULT_LISTENER_CLASS);
    CHECK(config.get_attach_policy() == relay::attach_policy_e::PERSISTENT);
    CHECK(config.get_logger_name() == relay::DEFAULT_LOGGER_NAME);
  }

  SECTION("unknown values") {
    REQUIRE(relay::parse_config(
        R"({"listener": {"attach_policy": "sometimes"},
            "logging": {"level": "chatty"}})",
        config));
    CHECK(config.get_attach_policy() == relay::attach_policy_e::PERSISTENT);
    CHECK(config.get_log_level() == spdlog::level::info);
  }

  SECTION("off is a real level") {
    REQUIRE(relay::parse_config(R"({"logging": {"level": "off"}})", config));
    CHECK(config.get_log_level() == spdlog::level::off);
  }
}

TEST_CASE("config loads from disk", "[unit][relay][config]") {
  relay::config_c config;

  SECTION("valid file") {
    auto path = write_file(R"({"listener": {"attach_policy": "scoped"}})");
    CHECK(relay::load_config(path, config));
    CHECK(config.get_attach_policy() == relay::attach_policy_e::SCOPED);
    std::filesystem::remove(path);
  }

  SECTION("missing file") {
    CHECK_FALSE(relay::load_config(get_unique_test_path("missing"), config));
  }

  SECTION("malformed file") {
    auto path = write_file("{ not json");
    CHECK_FALSE(relay::load_config(path, config));
    std::filesystem::remove(path);
  }

  SECTION("not an object") {
    CHECK_FALSE(relay::parse_config("[1, 2, 3]", config));
  }
}

TEST_CASE("logger creation applies the configured level",
          "[unit][relay][config]") {
  relay::options_s options;
  options.logger_name = "relay_config_test_logger";
  options.log_level = spdlog::level::warn;

  auto logger = relay::create_logger(options);
  REQUIRE(logger != nullptr);
  CHECK(logger->level() == spdlog::level::warn);
  CHECK(relay::create_logger(options) == logger);
  CHECK(std::string(relay::attach_policy_name(relay::attach_policy_e::SCOPED)) ==
        "scoped");
}
