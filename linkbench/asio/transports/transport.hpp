#ifndef LINKBENCH_ASIO_TRANSPORT_HPP
#define LINKBENCH_ASIO_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include <utility>
#include <boost/asio/error.hpp>
#include <boost/noncopyable.hpp>
#include <boost/system/error_code.hpp>

namespace linkbench::asio {

enum class read_status {
    data,       // 1..N bytes were read
    timeout,    // nothing arrived within the timeout, not an error
    eof,        // peer closed the stream
    error       // read failed, or the transport was closed locally
};

struct read_result {
    read_status status = read_status::timeout;
    size_t bytes = 0;
    boost::system::error_code ec;
};

struct write_result {
    size_t bytes = 0;
    boost::system::error_code ec;

    explicit operator bool() const { return !ec; }
};

/**
 * Byte-stream endpoint with bounded reads. A transport is used by at most one
 * reader thread and one writer thread at a time; close() may be called from
 * any thread and unblocks an in-flight read.
 */
class transport : private boost::noncopyable {

public:
    static constexpr std::chrono::seconds DEFAULT_OPEN_TIMEOUT{10};

    // constructors and destructors
    explicit transport(const std::string &context);
    virtual ~transport();

    // transport control
    virtual boost::system::error_code open(std::chrono::seconds timeout = DEFAULT_OPEN_TIMEOUT) = 0;
    virtual void close() = 0;

    // blocks up to timeout waiting for data
    virtual read_result read(uint8_t buffer[], size_t max_size, std::chrono::milliseconds timeout) = 0;

    // writes the whole buffer, returns once it is handed to the device
    virtual write_result write(const uint8_t buffer[], size_t size) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual std::string get_endpoint() const = 0;

protected:
    std::string context_;
};

}

#endif
