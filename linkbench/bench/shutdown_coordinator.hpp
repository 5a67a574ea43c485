#ifndef LINKBENCH_BENCH_SHUTDOWN_COORDINATOR_HPP
#define LINKBENCH_BENCH_SHUTDOWN_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

#include <boost/noncopyable.hpp>

#include "statistics.hpp"

namespace linkbench::asio {
    class transport;
}

namespace linkbench::bench {

/**
 * Owns the two flags shared by the workers of a run: `running` (the
 * cancellation token) and `connected`. Passed by reference to every worker.
 *
 * stop() may be called any number of times from any thread, including a
 * signal watcher thread, and races safely with the receiver noticing a
 * disconnection: disconnect_time is stored with a single compare-and-set.
 */
class shutdown_coordinator : private boost::noncopyable {
public:
    explicit shutdown_coordinator(statistics& stats);

    /// false once stop() was called
    bool running() const { return running_.load(); }

    /// true between a successful open and the first detected termination
    bool connected() const { return connected_.load(); }

    /// transport closed by stop() to unblock an in-flight read
    void attach(std::shared_ptr<asio::transport> transport);

    /// called by the session after a successful open; false if already stopped
    bool mark_connected();

    /// connection lost (eof, read error); returns true for the call that flipped `connected`
    bool mark_disconnected();

    /// true when the peer went away before any stop() request
    bool peer_disconnected() const { return peer_disconnected_.load(); }

    /// cancel the run: clears `running`, records disconnect_time once, closes the transport
    void stop();

    /// block until the run is cancelled or the connection is lost
    void wait();

    /// same as wait() with an upper bound, returns false on timeout
    bool wait_for(std::chrono::milliseconds timeout);

private:
    bool finished() const;

    statistics& stats_;
    std::atomic<bool> running_{true};
    std::atomic<bool> connected_{false};
    std::atomic<bool> peer_disconnected_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<asio::transport> transport_;
};

}

#endif
