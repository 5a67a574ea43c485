#ifndef LINKBENCH_ASIO_SIGNAL_WATCHER_HPP
#define LINKBENCH_ASIO_SIGNAL_WATCHER_HPP

#include <set>
#include <memory>
#include <functional>
#include <csignal>
#include <utility>
#include <boost/asio.hpp>
#include "worker_thread.hpp"

namespace linkbench::asio {

	/**
	 * Runs a boost::asio::signal_set in a background thread and calls the
	 * handler once per received signal. Used to route SIGINT/SIGTERM into a
	 * session stop() without touching process-wide flags.
	 */
	class signal_watcher {
	public:
		explicit signal_watcher(std::function<void(int)> handler);
		virtual ~signal_watcher();

		/// start watching the given signals
		bool start(const std::set<int>& signals = {SIGINT, SIGTERM});

		/// stop watching and release the signal handlers
		bool stop();

		bool running() const { return running_; }

	private:
		void wait_next();

		std::function<void(int)> handler_;

		// io_context used for capturing signals
		boost::asio::io_context io_context_;
		boost::asio::signal_set signals_;

		// Work guard to keep io_context_ running between signals
		using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
		std::unique_ptr<work_guard_type> work_;

		std::unique_ptr<worker_thread> thread_;
		std::atomic<bool> running_{false};
	};

}

#endif
