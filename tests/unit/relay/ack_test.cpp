#include "fake_runtime.hpp"
#include <relay/chat/ack.hpp>
#include <snitch/snitch.hpp>
#include <spdlog/sinks/null_sink.h>
#include <set>
#include <thread>
#include <vector>

using relay::chat::ack_registry_c;
using relay::chat::server_message_ack_c;

namespace {
auto create_test_logger() {
  auto logger = spdlog::get("ack_test");
  if (!logger) {
    logger = spdlog::null_logger_mt("ack_test");
  }
  return logger;
}
} // namespace

TEST_CASE("server message acks answer once", "[unit][relay][chat][ack]") {
  int answers = 0;
  std::uint16_t last_status = 0;
  server_message_ack_c ack([&](std::uint16_t status) {
    ++answers;
    last_status = status;
  });

  CHECK(ack.is_pending());
  CHECK(ack.send(200));
  CHECK_FALSE(ack.is_pending());
  CHECK_FALSE(ack.send(500));
  CHECK(answers == 1);
  CHECK(last_status == 200);

  SECTION("moving transfers the pending answer") {
    server_message_ack_c first([&](std::uint16_t) { ++answers; });
    server_message_ack_c second(std::move(first));
    CHECK_FALSE(first.is_pending());
    CHECK(second.is_pending());
    CHECK(second.send(200));
    CHECK(answers == 2);
  }

  SECTION("an empty ack has nothing to send") {
    server_message_ack_c empty;
    CHECK_FALSE(empty.is_pending());
    CHECK_FALSE(empty.send(200));
  }
}

TEST_CASE("acknowledged handles are given back quietly",
          "[unit][relay][chat][ack]") {
  relay_test::capture_logger_s log("ack_lifecycle_test");
  ack_registry_c registry(log.logger.get());

  int answers = 0;
  auto handle = registry.mint(
      server_message_ack_c([&answers](std::uint16_t) { ++answers; }));

  CHECK(registry.send(handle, 200));
  CHECK(registry.destroy(handle));
  CHECK(answers == 1);
  CHECK(registry.pending() == 0);
  CHECK(log.lines().empty());

  SECTION("giving back an unknown handle is reported") {
    CHECK_FALSE(registry.destroy(handle));
    CHECK(log.count_containing("Destroy on unknown ack handle") == 1);
  }
}

TEST_CASE("ack registry hands out handles", "[unit][relay][chat][ack]") {
  auto logger = create_test_logger();
  ack_registry_c registry(logger.get());

  std::vector<std::uint16_t> answered;
  auto make_ack = [&answered]() {
    return server_message_ack_c(
        [&answered](std::uint16_t status) { answered.push_back(status); });
  };

  SECTION("handles are distinct and never zero") {
    auto a = registry.mint(make_ack());
    auto b = registry.mint(make_ack());
    CHECK(a != 0);
    CHECK(b != 0);
    CHECK(a != b);
    CHECK(registry.pending() == 2);
  }

  SECTION("send answers and keeps the handle until destroyed") {
    auto handle = registry.mint(make_ack());
    CHECK(registry.unanswered() == 1);
    CHECK(registry.send(handle, 200));
    REQUIRE(answered.size() == 1);
    CHECK(answered[0] == 200);
    CHECK(registry.pending() == 1);
    CHECK(registry.unanswered() == 0);

    CHECK_FALSE(registry.send(handle, 500));
    CHECK(answered.size() == 1);

    CHECK(registry.destroy(handle));
    CHECK(registry.pending() == 0);
    CHECK_FALSE(registry.destroy(handle));
  }

  SECTION("destroy retires the handle without answering") {
    auto handle = registry.mint(make_ack());
    CHECK(registry.destroy(handle));
    CHECK(registry.pending() == 0);
    CHECK(answered.empty());
    CHECK_FALSE(registry.send(handle, 200));
  }

  SECTION("unknown handles are rejected") {
    CHECK_FALSE(registry.send(0, 200));
    CHECK_FALSE(registry.destroy(12345));
  }

  SECTION("concurrent minting yields unique handles") {
    constexpr std::size_t threads = 4;
    constexpr std::size_t per_thread = 100;
    std::vector<std::vector<std::int64_t>> minted(threads);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < threads; ++i) {
      workers.emplace_back([&registry, &minted, i]() {
        for (std::size_t n = 0; n < per_thread; ++n) {
          minted[i].push_back(registry.mint(server_message_ack_c{}));
        }
      });
    }
    for (auto &worker : workers) {
      worker.join();
    }

    std::set<std::int64_t> unique;
    for (const auto &handles : minted) {
      unique.insert(handles.begin(), handles.end());
    }
    CHECK(unique.size() == threads * per_thread);
    CHECK(registry.pending() == threads * per_thread);
  }
}
