#include "fake_runtime.hpp"
#include <relay/listener/listener.hpp>
#include <snitch/snitch.hpp>
#include <atomic>
#include <latch>
#include <set>

using relay::chat::server_message_ack_c;
using relay::chat::timestamp_c;
using relay::listener::listener_adapter_c;
using relay::listener::listener_factory_c;

namespace {
struct concurrency_fixture_s {
  relay_test::capture_logger_s log{"listener_concurrency_test"};
  relay::chat::ack_registry_c acks{log.logger.get()};
  relay_test::fake_vm_c vm{acks};
  relay::options_s options;
};
} // namespace

TEST_CASE("deliveries from many threads stay independent",
          "[unit][relay][listener][stress]") {
  concurrency_fixture_s f;
  listener_factory_c factory(f.log.logger.get(), f.options);
  auto object = f.vm.make_object(relay::DEFAULT_LISTENER_CLASS);
  auto adapter = factory.create(f.vm.environment(), object);

  constexpr std::size_t threads = 8;
  constexpr std::size_t per_thread = 50;

  SECTION("each thread through its own clone") {
    {
      std::vector<listener_adapter_c> clones;
      for (std::size_t i = 0; i < threads; ++i) {
        clones.push_back(adapter.clone());
      }

      // Keep every worker alive at once so thread ids are distinct
      std::latch started(threads);
      std::vector<std::thread> workers;
      for (std::size_t i = 0; i < threads; ++i) {
        workers.emplace_back([&clones, &started, i]() {
          started.arrive_and_wait();
          for (std::size_t n = 0; n < per_thread; ++n) {
            clones[i].received_incoming_message(
                {static_cast<std::uint8_t>(i), static_cast<std::uint8_t>(n)},
                timestamp_c::from_epoch_millis(i * 1000 + n),
                server_message_ack_c{});
          }
        });
      }
      for (auto &worker : workers) {
        worker.join();
      }
      CHECK(f.vm.global_refs(object) == static_cast<std::int64_t>(threads + 1));
    }

    auto calls = f.vm.calls();
    REQUIRE(calls.size() == threads * per_thread);

    std::set<std::thread::id> delivering_threads;
    std::set<std::int64_t> timestamps;
    for (const auto &call : calls) {
      delivering_threads.insert(call.thread);
      timestamps.insert(std::get<std::int64_t>(call.args.at(1)));
    }
    CHECK(delivering_threads.size() == threads);
    CHECK(timestamps.size() == threads * per_thread);
    CHECK(f.acks.pending() == threads * per_thread);
    CHECK(f.vm.global_refs(object) == 1);
    CHECK(f.vm.live_local_refs() == 0);
  }

  SECTION("all threads through the same instance") {
    std::latch started(threads);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < threads; ++i) {
      workers.emplace_back([&adapter, &started]() {
        started.arrive_and_wait();
        for (std::size_t n = 0; n < per_thread; ++n) {
          adapter.received_queue_empty();
        }
      });
    }
    for (auto &worker : workers) {
      worker.join();
    }

    CHECK(f.vm.calls_to("onQueueEmpty") == threads * per_thread);
    CHECK(f.vm.attaches() == threads);
    CHECK(f.vm.global_refs(object) == 1);
  }

  SECTION("cloning and dropping races leave the count balanced") {
    std::atomic<std::size_t> delivered{0};
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < threads; ++i) {
      workers.emplace_back([&adapter, &delivered]() {
        for (std::size_t n = 0; n < per_thread; ++n) {
          auto listener = adapter.make_listener();
          listener->received_queue_empty();
          delivered.fetch_add(1);
        }
      });
    }
    for (auto &worker : workers) {
      worker.join();
    }

    CHECK(delivered.load() == threads * per_thread);
    CHECK(f.vm.calls_to("onQueueEmpty") == threads * per_thread);
    CHECK(f.vm.global_refs(object) == 1);
  }

  SECTION("a failing thread does not disturb the others") {
    f.vm.fail_method("onConnectionInterrupted");
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < threads; ++i) {
      workers.emplace_back([&adapter, i]() {
        for (std::size_t n = 0; n < per_thread; ++n) {
          if (i == 0) {
            adapter.connection_interrupted(relay::chat::disconnect_cause_c(
                relay::chat::disconnect_reason_e::TRANSPORT_FAILURE,
                "socket reset"));
          } else {
            adapter.received_queue_empty();
          }
        }
      });
    }
    for (auto &worker : workers) {
      worker.join();
    }

    CHECK(f.vm.calls_to("onQueueEmpty") == (threads - 1) * per_thread);
    CHECK(f.vm.calls_to("onConnectionInterrupted") == per_thread);
  }
}
