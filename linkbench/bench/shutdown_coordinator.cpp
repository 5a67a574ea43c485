#include "shutdown_coordinator.hpp"
#include "../asio/transports/transport.hpp"
#include "../util/logger.hpp"

namespace linkbench::bench {

    shutdown_coordinator::shutdown_coordinator(statistics& stats) :
        stats_(stats) {
    }

    void shutdown_coordinator::attach(std::shared_ptr<asio::transport> transport) {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_ = std::move(transport);
    }

    bool shutdown_coordinator::mark_connected() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        connected_ = true;
        stats_.connect_time().set_now();
        return true;
    }

    bool shutdown_coordinator::mark_disconnected() {
        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            first = connected_.exchange(false);
            if (first) peer_disconnected_ = true;
        }
        stats_.disconnect_time().set_now();
        cv_.notify_all();
        return first;
    }

    void shutdown_coordinator::stop() {
        std::shared_ptr<asio::transport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) return;
            connected_ = false;
            transport = transport_;
        }
        LOG_INFO("stopping test...");
        stats_.disconnect_time().set_now();

        // closing outside the lock, close() may take the transport's own lock
        if (transport) {
            transport->close();
        }
        cv_.notify_all();
    }

    bool shutdown_coordinator::finished() const {
        return !running_ || !connected_;
    }

    void shutdown_coordinator::wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return finished(); });
    }

    bool shutdown_coordinator::wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return finished(); });
    }

}
