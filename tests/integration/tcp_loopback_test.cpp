#include <catch2/catch_test_macros.hpp>
#include <linkbench/asio/transports/tcp_transport.hpp>
#include <linkbench/bench/session.hpp>
#include "../fixtures/echo_server_fixture.hpp"
#include "../fixtures/eventually.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstring>
#include <thread>

using namespace linkbench;
using namespace std::chrono_literals;
namespace net = boost::asio;
using net::ip::tcp;

namespace {

    // a port nobody listens on: bind an ephemeral port and release it
    uint16_t unused_port() {
        net::io_context io;
        tcp::acceptor acceptor(io, {net::ip::make_address("127.0.0.1"), 0});
        return acceptor.local_endpoint().port();
    }

}

TEST_CASE_METHOD(test::EchoServerFixture, "TCP transport basics", "[integration][tcp]") {
    asio::tcp_transport transport("test", "127.0.0.1", port_string());
    REQUIRE_FALSE(transport.open(2s));
    REQUIRE(transport.is_open());
    REQUIRE(transport.get_endpoint() == "127.0.0.1:" + port_string());
    REQUIRE(transport.get_remote_port() == port_string());

    uint8_t buffer[asio::tcp_transport::READ_CHUNK_SIZE];

    SECTION("A quiet line times out") {
        auto started = std::chrono::steady_clock::now();
        auto result = transport.read(buffer, sizeof(buffer), 100ms);
        REQUIRE(result.status == asio::read_status::timeout);
        REQUIRE(result.bytes == 0);
        REQUIRE(std::chrono::steady_clock::now() - started >= 100ms);
    }

    SECTION("Echoed data is read back") {
        const std::string ping = "ping";
        auto written = transport.write(reinterpret_cast<const uint8_t*>(ping.data()), ping.size());
        REQUIRE(written);
        REQUIRE(written.bytes == ping.size());

        std::string echoed;
        while (echoed.size() < ping.size()) {
            auto result = transport.read(buffer, sizeof(buffer), 1000ms);
            REQUIRE(result.status == asio::read_status::data);
            echoed.append(reinterpret_cast<const char*>(buffer), result.bytes);
        }
        REQUIRE(echoed == ping);
    }

    SECTION("Close unblocks a pending read") {
        std::thread closer([&] {
            std::this_thread::sleep_for(100ms);
            transport.close();
        });
        auto started = std::chrono::steady_clock::now();
        auto result = transport.read(buffer, sizeof(buffer), 5000ms);
        closer.join();

        REQUIRE(result.status == asio::read_status::error);
        REQUIRE(std::chrono::steady_clock::now() - started < 2000ms);
        REQUIRE_FALSE(transport.is_open());

        uint8_t byte = 0;
        REQUIRE_FALSE(transport.write(&byte, 1));
    }
}

TEST_CASE_METHOD(test::EchoServerFixture, "Echo server waits between listen attempts", "[integration][tcp]") {
    boost::asio::io_context other_context;
    asio::echo_server other(other_context, "127.0.0.1", port_string());

    auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(other.start());
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed >= (asio::echo_server::MAX_LISTENING_ATTEMPTS - 1) * asio::echo_server::LISTEN_RETRY_DELAY);
    REQUIRE(other.local_port() == 0);
}

TEST_CASE("TCP peer close is reported as eof", "[integration][tcp]") {
    net::io_context io;
    tcp::acceptor acceptor(io, {net::ip::make_address("127.0.0.1"), 0});
    auto port = std::to_string(acceptor.local_endpoint().port());

    asio::tcp_transport transport("test", "127.0.0.1", port);
    REQUIRE_FALSE(transport.open(2s));

    tcp::socket peer = acceptor.accept();
    peer.close();

    uint8_t buffer[64];
    auto result = transport.read(buffer, sizeof(buffer), 2000ms);
    REQUIRE(result.status == asio::read_status::eof);
}

TEST_CASE("TCP connection refused", "[integration][tcp]") {
    auto transport = std::make_shared<asio::tcp_transport>("test", "127.0.0.1", std::to_string(unused_port()));
    bench::config cfg;
    cfg.enable_send = true;
    bench::session run(transport, cfg);

    REQUIRE_THROWS_AS(run.start(), bench::connect_error);
    REQUIRE(run.state() == bench::session_state::terminated);
    REQUIRE_FALSE(run.coordinator().connected());
    REQUIRE_FALSE(run.stats().connect_time().is_set());
    REQUIRE_FALSE(transport->is_open());
}

TEST_CASE_METHOD(test::EchoServerFixture, "TCP loopback run", "[integration][tcp]") {
    auto transport = std::make_shared<asio::tcp_transport>("test", "127.0.0.1", port_string());
    bench::config cfg;
    cfg.enable_send = true;
    cfg.packet_size = 128;
    cfg.max_packets = 100;

    bench::session_options options;
    options.open_timeout = 2s;
    options.read_timeout = 100ms;
    options.grace_period = 0ms;

    bench::session run(transport, cfg, options);
    run.start();

    const uint64_t expected = 100 * 128;
    REQUIRE(test::eventually([&] { return run.stats().rx_bytes() == expected; }, 10000ms));
    REQUIRE(test::eventually([&] { return server.clients_served() == 1; }, 10000ms));

    run.stop();
    auto snapshot = run.wait();

    REQUIRE(snapshot.tx_packets == 100);
    REQUIRE(snapshot.tx_bytes == expected);
    REQUIRE(snapshot.rx_bytes == expected);
    REQUIRE(snapshot.tx_crc32 == snapshot.rx_crc32);
    REQUIRE(snapshot.stop_reason == bench::send_stop_reason::packet_limit_reached);
    REQUIRE(snapshot.connection_seconds());
    REQUIRE(test::eventually([&] { return server.total_bytes() == expected; }, 10000ms));
}
