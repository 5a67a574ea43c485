#include "serial_transport.hpp"

#include <cerrno>
#include <termios.h>

namespace linkbench::asio {

serial_transport::serial_transport(const std::string& context, std::string device, unsigned int baud_rate)
    : stream_transport(context), device_(std::move(device)), baud_rate_(baud_rate) {
}

serial_transport::~serial_transport() {
    LOG_TRACE("[{}] releasing serial port {}", context_, device_);
}

boost::system::error_code serial_transport::open(std::chrono::seconds)
{
    if (closed()) {
        return boost::asio::error::bad_descriptor;
    }

    if (baud_rate_ == 0) {
        LOG_ERROR("[{}] invalid baud rate for {}: 0", context_, device_);
        return boost::asio::error::invalid_argument;
    }

    boost::system::error_code ec;
    stream_.open(device_, ec);
    if (ec) {
        LOG_ERROR("[{}] cannot open serial port {}: {}", context_, device_, ec.message());
        return ec;
    }

    ec = configure();
    if (ec) {
        LOG_ERROR("[{}] cannot configure serial port {}: {}", context_, device_, ec.message());
        release();
        return ec;
    }

    LOG_INFO("[{}] opened serial port {}, baud rate: {}", context_, device_, baud_rate_);
    return {};
}

boost::system::error_code serial_transport::configure() {
    using boost::asio::serial_port_base;
    boost::system::error_code ec;

    stream_.set_option(serial_port_base::baud_rate(baud_rate_), ec);
    if (ec) return ec;
    stream_.set_option(serial_port_base::character_size(8), ec);
    if (ec) return ec;
    stream_.set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
    if (ec) return ec;
    stream_.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
    if (ec) return ec;
    stream_.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
    return ec;
}

boost::system::error_code serial_transport::flush() {
    if (::tcdrain(stream_.native_handle()) != 0) {
        return boost::system::error_code(errno, boost::system::system_category());
    }
    return {};
}

std::string serial_transport::get_endpoint() const {
    return device_ + "@" + std::to_string(baud_rate_);
}

}
