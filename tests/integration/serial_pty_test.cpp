#include <catch2/catch_test_macros.hpp>
#include <linkbench/asio/transports/serial_transport.hpp>

#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <unistd.h>

using namespace linkbench;
using namespace std::chrono_literals;

namespace {

    // master side of a pseudo-terminal, the slave path stands in for a serial device
    struct PseudoTerminal {
        int master = -1;
        std::string slave_path;

        PseudoTerminal() {
            master = ::posix_openpt(O_RDWR | O_NOCTTY);
            REQUIRE(master >= 0);
            REQUIRE(::grantpt(master) == 0);
            REQUIRE(::unlockpt(master) == 0);
            const char* name = ::ptsname(master);
            REQUIRE(name != nullptr);
            slave_path = name;
        }

        ~PseudoTerminal() {
            if (master >= 0) ::close(master);
        }

        std::string read_master(size_t expected, int timeout_ms = 1000) {
            std::string data;
            char buffer[256];
            while (data.size() < expected) {
                pollfd descriptor{master, POLLIN, 0};
                if (::poll(&descriptor, 1, timeout_ms) <= 0) break;
                auto n = ::read(master, buffer, sizeof(buffer));
                if (n <= 0) break;
                data.append(buffer, static_cast<size_t>(n));
            }
            return data;
        }
    };

}

TEST_CASE("Serial transport over a pseudo-terminal", "[integration][serial]") {
    PseudoTerminal pty;
    asio::serial_transport transport("test", pty.slave_path, 115200);
    REQUIRE_FALSE(transport.open());
    REQUIRE(transport.is_open());
    REQUIRE(transport.get_endpoint() == pty.slave_path + "@115200");

    uint8_t buffer[asio::serial_transport::READ_CHUNK_SIZE];

    SECTION("Writes reach the line") {
        const std::string hello = "hello serial";
        auto written = transport.write(reinterpret_cast<const uint8_t*>(hello.data()), hello.size());
        REQUIRE(written);
        REQUIRE(pty.read_master(hello.size()) == hello);
    }

    SECTION("Line data is read") {
        const std::string world = "world";
        REQUIRE(::write(pty.master, world.data(), world.size()) == static_cast<ssize_t>(world.size()));

        std::string received;
        while (received.size() < world.size()) {
            auto result = transport.read(buffer, sizeof(buffer), 1000ms);
            REQUIRE(result.status == asio::read_status::data);
            received.append(reinterpret_cast<const char*>(buffer), result.bytes);
        }
        REQUIRE(received == world);
    }

    SECTION("A quiet line times out") {
        auto result = transport.read(buffer, sizeof(buffer), 100ms);
        REQUIRE(result.status == asio::read_status::timeout);
    }

    transport.close();
    REQUIRE_FALSE(transport.is_open());
}

TEST_CASE("Serial transport open failures", "[integration][serial]") {
    SECTION("Missing device") {
        asio::serial_transport transport("test", "/dev/linkbench-does-not-exist", 9600);
        REQUIRE(transport.open());
        REQUIRE_FALSE(transport.is_open());
    }

    SECTION("Zero baud rate") {
        PseudoTerminal pty;
        asio::serial_transport transport("test", pty.slave_path, 0);
        REQUIRE(transport.open() == boost::asio::error::invalid_argument);
        REQUIRE_FALSE(transport.is_open());
    }
}
