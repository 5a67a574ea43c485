#ifndef LINKBENCH_BENCH_CONFIG_HPP
#define LINKBENCH_BENCH_CONFIG_HPP

#include <cstdint>
#include <string>

namespace linkbench::bench {

/**
 * Run parameters of a throughput test. Built by the command line front end
 * and consumed read-only by the session; validate() must pass before any
 * connection attempt.
 */
struct config {
    static constexpr unsigned MIN_PACKET_SIZE = 32;
    static constexpr unsigned MAX_PACKET_SIZE = 1024;
    static constexpr unsigned DEFAULT_PACKET_SIZE = 100;

    /// payload bytes per emitted packet, [32, 1024]
    unsigned packet_size = DEFAULT_PACKET_SIZE;

    /// target send rate in bits per second, 0 = unlimited
    uint64_t send_rate = 0;

    /// send duration limit in seconds, 0 = unlimited
    uint64_t test_duration = 0;

    /// packet limit, 0 = unlimited
    uint64_t max_packets = 0;

    /// start the sender loop
    bool enable_send = false;

    /// throws std::invalid_argument describing the first invalid field
    void validate() const;

    /// true when validate() would not throw
    bool valid() const;
};

/// one-line human description of the configuration, used for startup logs
std::string describe(const config& cfg);

}

#endif
