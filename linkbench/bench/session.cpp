#include "session.hpp"
#include "../asio/transports/transport.hpp"
#include "../util/logger.hpp"

namespace linkbench::bench {

    namespace {
        const config& validated(const config& cfg) {
            cfg.validate();
            return cfg;
        }
    }

    connect_error::connect_error(const std::string& endpoint, boost::system::error_code ec) :
        std::runtime_error("cannot connect to " + endpoint + ": " + ec.message()),
        ec_(ec) {
    }

    const char* to_string(session_state state) {
        switch (state) {
            case session_state::idle:          return "idle";
            case session_state::connecting:    return "connecting";
            case session_state::connected:     return "connected";
            case session_state::disconnecting: return "disconnecting";
            case session_state::terminated:    return "terminated";
        }
        return "unknown";
    }

    session::session(std::shared_ptr<asio::transport> transport, const config& cfg, session_options options) :
        transport_(std::move(transport)),
        config_(validated(cfg)),
        options_(options),
        coordinator_(stats_) {
        if (!transport_) {
            throw std::invalid_argument("session requires a transport");
        }
    }

    session::~session() {
        if (receiver_thread_ || sender_thread_) {
            LOG_WARNING("session destroyed while running, stopping workers");
            coordinator_.stop();
            join_workers();
        }
    }

    void session::set_state(session_state state) {
        auto previous = state_.exchange(state);
        LOG_DEBUG("session state: {} -> {}", to_string(previous), to_string(state));
    }

    void session::start() {
        if (state_ != session_state::idle) {
            throw std::logic_error("a session can only be started once");
        }

        set_state(session_state::connecting);
        LOG_INFO("connecting to {}...", transport_->get_endpoint());
        auto ec = transport_->open(options_.open_timeout);
        if (ec) {
            set_state(session_state::terminated);
            throw connect_error(transport_->get_endpoint(), ec);
        }

        coordinator_.attach(transport_);
        if (!coordinator_.mark_connected()) {
            // stopped while connecting, nothing to measure
            LOG_INFO("run cancelled while connecting");
            transport_->close();
            set_state(session_state::disconnecting);
            return;
        }
        set_state(session_state::connected);

        receiver_ = std::make_unique<receiver>(*transport_, stats_, coordinator_, options_.read_timeout);
        receiver_thread_ = std::make_unique<asio::worker_thread>("receiver", [this] {
            receiver_->run();
        });
        receiver_thread_->start();

        if (config_.enable_send) {
            sender_ = std::make_unique<sender>(*transport_, config_, stats_, coordinator_, options_.grace_period);
            sender_thread_ = std::make_unique<asio::worker_thread>("sender", [this] {
                sender_->run();
            });
            sender_thread_->start();
        }
    }

    statistics_snapshot session::wait() {
        if (state_ == session_state::idle) {
            throw std::logic_error("session was not started");
        }

        if (state_ == session_state::terminated) {
            // open failed or the run was already collected, nothing to stop
            return stats_.snapshot();
        }

        if (state_ == session_state::connected) {
            coordinator_.wait();
            set_state(session_state::disconnecting);
        }

        // after a lost connection this also cuts short a sender still in its grace period
        coordinator_.stop();
        join_workers();

        transport_->close();
        coordinator_.attach(nullptr);
        set_state(session_state::terminated);
        return stats_.snapshot();
    }

    statistics_snapshot session::run() {
        start();
        return wait();
    }

    void session::stop() {
        coordinator_.stop();
    }

    void session::join_workers() {
        if (receiver_thread_) {
            receiver_thread_->join();
            receiver_thread_.reset();
        }
        if (sender_thread_) {
            sender_thread_->join();
            sender_thread_.reset();
        }
    }

}
