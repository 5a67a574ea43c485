#include <catch2/catch_test_macros.hpp>
#include <linkbench/bench/receiver.hpp>
#include <linkbench/util/crc32.hpp>
#include "../../fixtures/memory_transports.hpp"
#include <thread>

using namespace linkbench;
using namespace linkbench::bench;
using namespace std::chrono_literals;

TEST_CASE("Receiver loop", "[unit][bench][receiver]") {
    statistics stats;
    shutdown_coordinator coordinator(stats);
    auto transport = std::make_shared<test::scripted_transport>();
    REQUIRE_FALSE(transport->open(1s));
    coordinator.attach(transport);
    REQUIRE(coordinator.mark_connected());

    receiver loop(*transport, stats, coordinator, 50ms);

    SECTION("Chunks are folded until the peer closes") {
        transport->push_data("hello");
        transport->push_data("world");
        transport->push_eof();

        loop.run();

        REQUIRE(stats.rx_bytes() == 10);
        REQUIRE(stats.rx_packets() == 2);
        REQUIRE(stats.rx_crc32() == util::crc32("helloworld"));
        REQUIRE_FALSE(coordinator.connected());
        REQUIRE(coordinator.running());
        REQUIRE(stats.disconnect_time().is_set());
    }

    SECTION("A read error ends the loop") {
        transport->push_data("abc");
        transport->push_error(boost::asio::error::connection_reset);

        loop.run();

        REQUIRE(stats.rx_bytes() == 3);
        REQUIRE_FALSE(coordinator.connected());
        REQUIRE(stats.disconnect_time().is_set());
    }

    SECTION("Timeouts keep the loop alive until stop") {
        std::thread worker([&] { loop.run(); });

        std::this_thread::sleep_for(200ms);
        REQUIRE(coordinator.connected());
        REQUIRE_FALSE(stats.disconnect_time().is_set());

        transport->push_data("late");
        std::this_thread::sleep_for(100ms);

        auto stop_requested = std::chrono::steady_clock::now();
        coordinator.stop();
        worker.join();

        REQUIRE(std::chrono::steady_clock::now() - stop_requested < 1100ms);
        REQUIRE(stats.rx_bytes() == 4);
        REQUIRE(stats.disconnect_time().is_set());
    }
}

TEST_CASE("Receiver error racing stop", "[unit][bench][receiver]") {
    for (int round = 0; round < 20; ++round) {
        statistics stats;
        shutdown_coordinator coordinator(stats);
        auto transport = std::make_shared<test::scripted_transport>();
        REQUIRE_FALSE(transport->open(1s));
        coordinator.attach(transport);
        REQUIRE(coordinator.mark_connected());

        receiver loop(*transport, stats, coordinator, 50ms);
        std::thread worker([&] { loop.run(); });

        const auto before = wall_clock::now();
        std::thread injector([&] { transport->push_error(boost::asio::error::connection_reset); });
        std::thread stopper([&] { coordinator.stop(); });
        injector.join();
        stopper.join();
        worker.join();
        const auto after = wall_clock::now();

        auto disconnect = stats.disconnect_time().get();
        REQUIRE(disconnect);
        REQUIRE(*disconnect >= before);
        REQUIRE(*disconnect <= after);
        // nothing may overwrite the winner
        REQUIRE_FALSE(stats.disconnect_time().set_now());
        REQUIRE(stats.disconnect_time().get() == disconnect);
        REQUIRE_FALSE(coordinator.connected());
    }
}
