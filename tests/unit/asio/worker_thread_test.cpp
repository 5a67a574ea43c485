#include <catch2/catch_test_macros.hpp>
#include <linkbench/asio/worker_thread.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace linkbench::asio;
using namespace std::chrono_literals;

TEST_CASE("Worker thread runs its job", "[unit][asio][worker]") {
    std::atomic<bool> ran{false};
    std::thread::id job_thread;
    worker_thread worker("test", [&] {
        job_thread = std::this_thread::get_id();
        ran = true;
    });

    REQUIRE(worker.get_name() == "test");
    REQUIRE_FALSE(worker.joinable());

    auto id = worker.start();
    REQUIRE(id != std::this_thread::get_id());
    worker.join();

    REQUIRE(ran.load());
    REQUIRE(job_thread == id);
    REQUIRE_FALSE(worker.running());

    // joining twice is harmless
    worker.join();
}

TEST_CASE("Worker thread contains failures", "[unit][asio][worker]") {
    SECTION("std::exception") {
        worker_thread worker("throwing", [] { throw std::runtime_error("boom"); });
        worker.start();
        REQUIRE_NOTHROW(worker.join());
        REQUIRE_FALSE(worker.running());
    }

    SECTION("Non standard exception") {
        worker_thread worker("throwing", [] { throw 42; });
        worker.start();
        REQUIRE_NOTHROW(worker.join());
        REQUIRE_FALSE(worker.running());
    }
}

TEST_CASE("Worker thread reports running state", "[unit][asio][worker]") {
    std::atomic<bool> release{false};
    worker_thread worker("blocking", [&] {
        while (!release) std::this_thread::sleep_for(1ms);
    });
    worker.start();
    REQUIRE(worker.running());
    REQUIRE(worker.joinable());

    release = true;
    worker.join();
    REQUIRE_FALSE(worker.running());
}

TEST_CASE("Destroying an attached worker joins it", "[unit][asio][worker]") {
    std::atomic<bool> finished{false};
    {
        worker_thread worker("scoped", [&] {
            std::this_thread::sleep_for(50ms);
            finished = true;
        });
        worker.start();
    }
    REQUIRE(finished.load());
}
