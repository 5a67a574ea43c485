#ifndef LINKBENCH_ASIO_WORKER_THREAD_HPP
#define LINKBENCH_ASIO_WORKER_THREAD_HPP

#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <boost/noncopyable.hpp>

namespace linkbench::asio {

    /**
     * Named thread running a single job to completion. Anything thrown out of
     * the job is logged and ends the worker, it never reaches std::terminate.
     */
    class worker_thread : private boost::noncopyable {
    public:
        worker_thread(std::string name, std::function<void()> job);
        virtual ~worker_thread();

        /// start the job in its own thread, returns the new thread id
        std::thread::id start();

        /// wait for the job to finish (no-op if not started or already joined)
        void join();

        /// true while the job body is executing
        bool running() const { return running_; }

        /// true once start() was called and the thread was not joined yet
        bool joinable() const { return thread_.joinable(); }

        const std::string& get_name() const { return name_; }

    private:
        void run();

        std::string name_;
        std::function<void()> job_;
        std::thread thread_;
        std::atomic<bool> running_{false};
    };

}

#endif
