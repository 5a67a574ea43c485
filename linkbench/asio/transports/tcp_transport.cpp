#include "tcp_transport.hpp"

namespace linkbench::asio {

tcp_transport::tcp_transport(const std::string& context, std::string host, std::string port)
    : stream_transport(context), host_(std::move(host)), port_(std::move(port)) {
}

tcp_transport::~tcp_transport() {
    LOG_TRACE("[{}] releasing tcp connection", context_);
}

boost::system::error_code tcp_transport::open(std::chrono::seconds timeout)
{
    if (closed()) {
        return boost::asio::error::bad_descriptor;
    }

    boost::asio::ip::tcp::resolver resolver(io_context_);
    boost::system::error_code connect_ec = boost::asio::error::would_block;

    // resolve, then connect to the first endpoint that accepts
    resolver.async_resolve(host_, port_,
        [this, &connect_ec](const boost::system::error_code& ec_resolve,
                            boost::asio::ip::tcp::resolver::results_type endpoints) {
            if (ec_resolve) {
                connect_ec = ec_resolve;
                return;
            }
            boost::asio::async_connect(stream_, endpoints,
                [&connect_ec](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
                    connect_ec = ec;
                });
        });

    io_context_.restart();
    io_context_.run_for(timeout);

    if (connect_ec == boost::asio::error::would_block) {
        // timed out: abort whatever is pending and wait for the handlers
        resolver.cancel();
        boost::system::error_code ignored;
        stream_.close(ignored);
        io_context_.restart();
        io_context_.run();
        connect_ec = boost::asio::error::timed_out;
    }

    if (connect_ec) {
        boost::system::error_code ignored;
        stream_.close(ignored);
        LOG_ERROR("[{}] cannot connect to {}:{}: {}", context_, host_, port_, connect_ec.message());
        return connect_ec;
    }

    enable_tcp_no_delay();
    LOG_INFO("[{}] connected to {} (local port {})", context_, get_endpoint(), get_local_port());
    return {};
}

void tcp_transport::interrupt() {
    // a shutdown wakes the reader with eof and fails a blocked writer right away
    boost::system::error_code ec;
    stream_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    LOG_TRACE("[{}] shutdown tcp socket result: {}", context_, ec.message());
    stream_transport::interrupt();
}

std::string tcp_transport::get_endpoint() const {
    return host_ + ":" + port_;
}

std::string tcp_transport::get_local_port() const {
    boost::system::error_code ec;
    auto local_ep = stream_.local_endpoint(ec);
    if (!ec) {
        return std::to_string(local_ep.port());
    }
    return "0";
}

std::string tcp_transport::get_remote_port() const {
    boost::system::error_code ec;
    auto remote_ep = stream_.remote_endpoint(ec);
    if (!ec) {
        return std::to_string(remote_ep.port());
    }
    return "0";
}

void tcp_transport::enable_tcp_no_delay() {
    boost::system::error_code ec;
    stream_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        LOG_WARNING("[{}] cannot enable TCP_NODELAY: {}", context_, ec.message());
    }
}

}
