#ifndef LINKBENCH_ASIO_STREAM_TRANSPORT_HPP
#define LINKBENCH_ASIO_STREAM_TRANSPORT_HPP

#include <mutex>
#include <atomic>

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/logger.hpp"
#include "transport.hpp"

namespace linkbench::asio {

/**
 * Common read/write/close plumbing for transports backed by an asio stream
 * (tcp::socket, serial_port). Every transport owns a private io_context that
 * is only run by the reader thread, inside read(); writes are synchronous.
 */
template<class Stream>
class stream_transport : public transport {

public:
    stream_transport(const std::string &context)
        : transport(context), stream_(io_context_) {
    }

    ~stream_transport() override {
        release();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        LOG_DEBUG("[{}] closing transport {}", context_, get_endpoint());
        interrupt();
    }

    read_result read(uint8_t buffer[], size_t max_size, std::chrono::milliseconds timeout) override {
        read_result result;
        bool completed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || !stream_.is_open()) {
                return read_result{read_status::error, 0, boost::asio::error::operation_aborted};
            }
            stream_.async_read_some(boost::asio::buffer(buffer, max_size),
                [&result, &completed](const boost::system::error_code& ec, size_t bytes) {
                    completed = true;
                    result.bytes = bytes;
                    result.ec = ec;
                });
        }

        // run until the read completes or the timeout expires
        io_context_.restart();
        io_context_.run_for(timeout);

        bool timed_out = false;
        if (!completed) {
            // cancel the pending read and let its handler run before returning
            timed_out = true;
            boost::system::error_code ignored;
            stream_.cancel(ignored);
            io_context_.restart();
            io_context_.run();
        }

        if (closed_) {
            // any outcome after a local close is reported as aborted
            if (result.bytes > 0 && !result.ec) {
                result.status = read_status::data;
                return result;
            }
            return read_result{read_status::error, 0, boost::asio::error::operation_aborted};
        }

        if (result.ec == boost::asio::error::eof) {
            result.status = read_status::eof;
        } else if (result.ec == boost::asio::error::operation_aborted && timed_out) {
            result = read_result{read_status::timeout, 0, {}};
        } else if (result.ec) {
            result.status = read_status::error;
        } else if (result.bytes == 0) {
            result.status = read_status::timeout;
        } else {
            result.status = read_status::data;
        }
        return result;
    }

    write_result write(const uint8_t buffer[], size_t size) override {
        if (closed_) {
            return write_result{0, boost::asio::error::bad_descriptor};
        }
        write_result result;
        result.bytes = boost::asio::write(stream_, boost::asio::buffer(buffer, size), result.ec);
        if (!result.ec) {
            result.ec = flush();
        }
        return result;
    }

    bool is_open() const override {
        return !closed_ && stream_.is_open();
    }

protected:
    /// wake up a read blocked in another thread, called once by close()
    virtual void interrupt() {
        boost::asio::post(io_context_, [this] {
            boost::system::error_code ignored;
            stream_.cancel(ignored);
        });
    }

    /// make sure written data left the process, default is a no-op
    virtual boost::system::error_code flush() {
        return {};
    }

    /// release the underlying handle, only when no worker uses the transport
    void release() {
        boost::system::error_code ec;
        if (stream_.is_open()) {
            stream_.close(ec);
            LOG_TRACE("[{}] released stream handle: {}", context_, ec.message());
        }
    }

    bool closed() const {
        return closed_;
    }

    boost::asio::io_context io_context_;
    Stream stream_;

private:
    std::mutex mutex_;
    std::atomic<bool> closed_{false};
};

}

#endif
