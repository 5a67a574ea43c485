#ifndef LINKBENCH_BENCH_SESSION_HPP
#define LINKBENCH_BENCH_SESSION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

#include <boost/noncopyable.hpp>
#include <boost/system/error_code.hpp>

#include "../asio/worker_thread.hpp"
#include "config.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include "shutdown_coordinator.hpp"
#include "statistics.hpp"

namespace linkbench::asio {
    class transport;
}

namespace linkbench::bench {

/// the transport could not be opened, no worker was started
class connect_error : public std::runtime_error {
public:
    connect_error(const std::string& endpoint, boost::system::error_code ec);

    const boost::system::error_code& code() const { return ec_; }

private:
    boost::system::error_code ec_;
};

enum class session_state {
    idle,
    connecting,
    connected,
    disconnecting,
    terminated
};

const char* to_string(session_state state);

/// internal knobs of a run, the command line exposes only open_timeout
struct session_options {
    std::chrono::seconds open_timeout{10};
    std::chrono::milliseconds read_timeout = receiver::READ_TIMEOUT;
    std::chrono::milliseconds grace_period = sender::GRACE_PERIOD;
};

/**
 * One single-shot measurement run over a transport.
 *
 * start() opens the transport and launches the receiver worker (and the
 * sender worker when enabled); wait() blocks until the run is stopped or the
 * connection is lost, joins the workers and returns the frozen statistics.
 * stop() can be called from any thread at any time.
 *
 * Usage:
 *   auto transport = std::make_shared<asio::tcp_transport>("cli", "127.0.0.1", "8888");
 *   bench::session session(transport, cfg);
 *   auto snapshot = session.run();
 */
class session : private boost::noncopyable {
public:
    session(std::shared_ptr<asio::transport> transport, const config& cfg, session_options options = {});
    ~session();

    /// open the transport and start the workers, throws connect_error
    void start();

    /// wait for the end of the run and return the final statistics
    statistics_snapshot wait();

    /// start() followed by wait()
    statistics_snapshot run();

    /// request the end of the run, idempotent
    void stop();

    session_state state() const { return state_.load(); }
    const config& get_config() const { return config_; }
    const statistics& stats() const { return stats_; }
    shutdown_coordinator& coordinator() { return coordinator_; }

private:
    void set_state(session_state state);
    void join_workers();

    std::shared_ptr<asio::transport> transport_;
    const config config_;
    const session_options options_;

    statistics stats_;
    shutdown_coordinator coordinator_;
    std::atomic<session_state> state_{session_state::idle};

    std::unique_ptr<receiver> receiver_;
    std::unique_ptr<sender> sender_;
    std::unique_ptr<asio::worker_thread> receiver_thread_;
    std::unique_ptr<asio::worker_thread> sender_thread_;
};

}

#endif
