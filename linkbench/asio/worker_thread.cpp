#include "worker_thread.hpp"
#include "../util/logger.hpp"

namespace linkbench::asio{

    worker_thread::worker_thread(std::string name, std::function<void()> job) :
        name_(std::move(name)),
        job_(std::move(job)){
    }

    worker_thread::~worker_thread() {
        if(thread_.joinable()){
            LOG_WARNING("worker '{}' destroyed while still attached, joining", name_);
            join();
        }
    }

    std::thread::id worker_thread::start() {
        running_ = true;
        thread_ = std::thread(&worker_thread::run, this);
        return thread_.get_id();
    }

    void worker_thread::join() {
        if(thread_.joinable() && thread_.get_id() != std::this_thread::get_id()){
            thread_.join();
        }
    }

    void worker_thread::run() {
        LOG_DEBUG("worker '{}' started", name_);
        // the job is the unit of failure: log whatever escapes it and end the worker
        try {
            if(job_) job_();
        } catch (const std::exception &ex) {
            LOG_ERROR("worker '{}' crashed: {}", name_, ex.what());
        } catch (const std::string &ex) {
            LOG_ERROR("worker '{}' crashed: {}", name_, ex);
        } catch (...) {
            LOG_ERROR("worker '{}' crashed with an unknown error", name_);
        }
        running_ = false;
        LOG_DEBUG("worker '{}' finished", name_);
    }

}
