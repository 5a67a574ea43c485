#ifndef LINKBENCH_ASIO_ECHO_SERVER_HPP
#define LINKBENCH_ASIO_ECHO_SERVER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>

#include <utility>
#include <boost/asio.hpp>
#include <boost/noncopyable.hpp>

namespace linkbench::asio {

class echo_session;

/**
 * TCP server that writes every received byte back to its sender. It is the
 * peer used for loopback runs of the harness. All handlers run in the
 * io_context given at construction; the caller runs that io_context.
 */
class echo_server : private boost::noncopyable {
public:
    static constexpr int MAX_LISTENING_ATTEMPTS = 3;
    static constexpr std::chrono::seconds LISTEN_RETRY_DELAY{1};

    echo_server(boost::asio::io_context& io_context, std::string host, std::string port);
    ~echo_server();

    /// bind and start accepting, false if the endpoint cannot be listened on
    bool start();

    /// stop accepting and close every client, safe from any thread
    bool stop();

    uint16_t local_port() const;

    unsigned long clients_served() const { return clients_served_.load(); }
    unsigned long long total_bytes() const { return total_bytes_.load(); }

private:
    friend class echo_session;

    bool create_acceptor();
    void accept_connection();
    void close_all();
    void on_session_end(const std::shared_ptr<echo_session>& session);

    boost::asio::io_context& io_context_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::string host_;
    std::string port_;
    std::atomic<bool> running_{false};

    // only touched from the io_context thread
    std::set<std::shared_ptr<echo_session>> sessions_;

    std::atomic<unsigned long> clients_served_{0};
    std::atomic<unsigned long long> total_bytes_{0};
};

} // namespace linkbench::asio

#endif // LINKBENCH_ASIO_ECHO_SERVER_HPP
