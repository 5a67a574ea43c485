#ifndef LINKBENCH_ASIO_SERIAL_TRANSPORT_HPP
#define LINKBENCH_ASIO_SERIAL_TRANSPORT_HPP

#include <string>

#include <utility>
#include <boost/asio/serial_port.hpp>

#include "stream_transport.hpp"

namespace linkbench::asio {

/**
 * Serial line opened as 8N1 without flow control. Writes are drained to the
 * line (tcdrain) before returning so write durations reflect the baud rate.
 */
class serial_transport : public stream_transport<boost::asio::serial_port> {

public:
    static constexpr size_t READ_CHUNK_SIZE = 4096;

    serial_transport(const std::string &context, std::string device, unsigned int baud_rate);
    ~serial_transport() override;

    // the timeout is unused, opening a device node does not block
    boost::system::error_code open(std::chrono::seconds timeout = DEFAULT_OPEN_TIMEOUT) override;

    std::string get_endpoint() const override;
    const std::string& get_device() const { return device_; }
    unsigned int get_baud_rate() const { return baud_rate_; }

protected:
    boost::system::error_code flush() override;

private:
    boost::system::error_code configure();

    std::string device_;
    unsigned int baud_rate_;
};

}

#endif
