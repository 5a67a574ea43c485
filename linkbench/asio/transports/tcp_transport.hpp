#ifndef LINKBENCH_ASIO_TCP_TRANSPORT_HPP
#define LINKBENCH_ASIO_TCP_TRANSPORT_HPP

#include <string>

#include <utility>
#include <boost/asio.hpp>

#include "stream_transport.hpp"

namespace linkbench::asio {

class tcp_transport : public stream_transport<boost::asio::ip::tcp::socket> {

public:
    static constexpr size_t READ_CHUNK_SIZE = 4096;

    // constructors and destructors
    tcp_transport(const std::string &context, std::string host, std::string port);
    ~tcp_transport() override;

    // transport control
    boost::system::error_code open(std::chrono::seconds timeout = DEFAULT_OPEN_TIMEOUT) override;

    // some getters to check the state
    std::string get_endpoint() const override;
    std::string get_local_port() const;
    std::string get_remote_port() const;

    // other methods
    void enable_tcp_no_delay();

protected:
    void interrupt() override;

private:
    std::string host_;
    std::string port_;
};

}

#endif
