#ifndef LINKBENCH_BENCH_SENDER_HPP
#define LINKBENCH_BENCH_SENDER_HPP

#include <chrono>
#include <cstdint>
#include <random>

#include "../util/types.hpp"
#include "config.hpp"
#include "statistics.hpp"
#include "shutdown_coordinator.hpp"

namespace linkbench::asio {
    class transport;
}

namespace linkbench::bench {

/// pseudo-random packet payloads, only their length and checksum matter
class payload_generator {
public:
    payload_generator();
    explicit payload_generator(uint32_t seed);

    /// overwrite the whole buffer with fresh random bytes
    void fill(byte_buffer& buffer);

private:
    std::mt19937 engine_;
};

/**
 * Paced synthetic traffic generator. Waits for the connection, lets the peer
 * settle during a fixed grace period, then emits packet_size packets until
 * the duration or packet limit is reached, a write fails, the connection is
 * lost or the run is cancelled.
 */
class sender {
public:
    static constexpr std::chrono::seconds GRACE_PERIOD{5};
    static constexpr std::chrono::milliseconds CONNECT_POLL_INTERVAL{100};
    static constexpr std::chrono::milliseconds UNLIMITED_RATE_YIELD{1};

    // longest uninterrupted sleep, keeps cancellation latency bounded
    static constexpr std::chrono::milliseconds MAX_SLEEP_SLICE{100};

    sender(asio::transport& transport, const config& cfg, statistics& stats,
           shutdown_coordinator& coordinator,
           std::chrono::milliseconds grace_period = GRACE_PERIOD);

    /// blocking loop body, executed by the sender worker thread
    void run();

    /// time one packet takes on the wire at the target rate, zero when unlimited
    static std::chrono::nanoseconds packet_interval(unsigned packet_size, uint64_t send_rate);

private:
    bool wait_connected();
    bool sleep_while_running(mono_clock::duration duration);
    send_stop_reason emit(mono_clock::time_point start);
    send_stop_reason stop_cause() const;

    asio::transport& transport_;
    const config config_;
    statistics& stats_;
    shutdown_coordinator& coordinator_;
    std::chrono::milliseconds grace_period_;
};

}

#endif
