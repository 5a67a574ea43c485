#include "signal_watcher.hpp"
#include "../util/logger.hpp"

namespace linkbench::asio{

    signal_watcher::signal_watcher(std::function<void(int)> handler) :
        handler_(std::move(handler)),
        signals_(io_context_){
    }

    signal_watcher::~signal_watcher()
    {
        if(running_) stop();
    }

    bool signal_watcher::start(const std::set<int>& signals) {
        if(running_) return false;
        running_ = true;

        LOG_DEBUG("registering stop signals...");
        for (auto signal: signals){
            signals_.add(signal);
        }

        work_ = std::make_unique<work_guard_type>(io_context_.get_executor());
        wait_next();

        thread_ = std::make_unique<worker_thread>("signal watcher", [this]{
            io_context_.run();
        });
        thread_->start();
        return true;
    }

    void signal_watcher::wait_next() {
        signals_.async_wait([this](const boost::system::error_code& ec, int signal_number){
            if(ec) return;
            LOG_INFO("received signal: {}", signal_number);
            if(handler_) handler_(signal_number);
            // keep listening, a second Ctrl+C must not kill the process mid-report
            if(running_) wait_next();
        });
    }

    bool signal_watcher::stop() {
        if(!running_.exchange(false)) return false;

        // cancel and clear in the io_context thread, signal_set is not thread safe
        boost::asio::post(io_context_, [this]{
            boost::system::error_code ec;
            signals_.cancel(ec);
            signals_.clear(ec);
        });
        work_.reset();
        if(thread_) thread_->join();
        thread_.reset();
        io_context_.restart();
        return true;
    }

}
