#ifndef LINKBENCH_BENCH_RECEIVER_HPP
#define LINKBENCH_BENCH_RECEIVER_HPP

#include <chrono>
#include <cstddef>

#include "statistics.hpp"
#include "shutdown_coordinator.hpp"

namespace linkbench::asio {
    class transport;
}

namespace linkbench::bench {

/**
 * Drains the transport and folds every chunk into the receive counters.
 * Runs until the run is cancelled or the peer goes away; read timeouts only
 * give the loop a chance to look at the cancellation flag.
 */
class receiver {
public:
    static constexpr std::chrono::milliseconds READ_TIMEOUT{1000};
    static constexpr size_t BUFFER_SIZE = 4096;

    receiver(asio::transport& transport, statistics& stats, shutdown_coordinator& coordinator,
             std::chrono::milliseconds read_timeout = READ_TIMEOUT);

    /// blocking loop body, executed by the receiver worker thread
    void run();

private:
    asio::transport& transport_;
    statistics& stats_;
    shutdown_coordinator& coordinator_;
    std::chrono::milliseconds read_timeout_;
};

}

#endif
