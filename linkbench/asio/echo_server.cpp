#include "echo_server.hpp"
#include "../util/logger.hpp"

#include <array>
#include <thread>

namespace linkbench::asio {

using boost::asio::ip::tcp;

class echo_session : public std::enable_shared_from_this<echo_session> {
public:
    static constexpr size_t BUFFER_SIZE = 8192;

    echo_session(echo_server& server, tcp::socket socket)
        : server_(server), socket_(std::move(socket)) {
        boost::system::error_code ec;
        auto remote = socket_.remote_endpoint(ec);
        remote_ = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    void start() {
        LOG_INFO("client {} connected", remote_);
        read();
    }

    void close() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    const std::string& remote() const { return remote_; }
    unsigned long long bytes() const { return bytes_; }

private:
    void read() {
        socket_.async_read_some(boost::asio::buffer(buffer_),
            [this, self = shared_from_this()](const boost::system::error_code& ec, size_t n) {
                if (ec || n == 0) {
                    if (ec && ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                        LOG_WARNING("error handling client {}: {}", remote_, ec.message());
                    }
                    finish();
                    return;
                }
                write(n);
            });
    }

    void write(size_t n) {
        boost::asio::async_write(socket_, boost::asio::buffer(buffer_.data(), n),
            [this, self = shared_from_this()](const boost::system::error_code& ec, size_t written) {
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        LOG_WARNING("error handling client {}: {}", remote_, ec.message());
                    }
                    finish();
                    return;
                }
                bytes_ += written;
                server_.total_bytes_.fetch_add(written, std::memory_order_relaxed);
                read();
            });
    }

    void finish() {
        if (finished_) return;
        finished_ = true;
        close();
        LOG_INFO("client {} disconnected (processed {} bytes)", remote_, bytes_);
        server_.on_session_end(shared_from_this());
    }

    echo_server& server_;
    tcp::socket socket_;
    std::string remote_;
    std::array<uint8_t, BUFFER_SIZE> buffer_{};
    unsigned long long bytes_ = 0;
    bool finished_ = false;
};

echo_server::echo_server(boost::asio::io_context& io_context, std::string host, std::string port)
    : io_context_(io_context)
    , host_(std::move(host))
    , port_(std::move(port))
{
}

echo_server::~echo_server() {
    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
}

uint16_t echo_server::local_port() const {
    boost::system::error_code ec;
    if (!acceptor_) return 0;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

bool echo_server::start() {
    if (running_) return false;
    if (!create_acceptor()) return false;
    running_ = true;
    accept_connection();
    return true;
}

bool echo_server::stop() {
    if (!running_.exchange(false)) return false;
    // acceptor and sessions belong to the io_context thread
    boost::asio::post(io_context_, [this] {
        close_all();
    });
    return true;
}

void echo_server::close_all() {
    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            LOG_WARNING("error closing echo acceptor: {}", ec.message());
        }
    }
    // sessions remove themselves from the set once their handlers finish
    for (auto& session : sessions_) {
        session->close();
    }
}

bool echo_server::create_acceptor() {
    tcp::endpoint endpoint;
    try {
        tcp::resolver resolver(io_context_);
        auto results = resolver.resolve(host_, port_);
        if (results.begin() == results.end()) {
            LOG_ERROR("no endpoints found for {}:{}", host_, port_);
            return false;
        }
        endpoint = results.begin()->endpoint();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("failed to resolve {}:{} - {}", host_, port_, e.code().message());
        return false;
    }

    for (int attempt = 1; attempt <= MAX_LISTENING_ATTEMPTS; ++attempt) {
        if (attempt > 1) {
            // give a previous owner of the port time to release it
            std::this_thread::sleep_for(LISTEN_RETRY_DELAY);
        }
        try {
            acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
            acceptor_->open(endpoint.protocol());
            acceptor_->set_option(tcp::acceptor::reuse_address(true));
            acceptor_->bind(endpoint);
            acceptor_->listen();
            LOG_INFO("echo server is now listening on {}:{}", host_, local_port());
            return true;
        } catch (const boost::system::system_error& error) {
            LOG_ERROR("cannot start listening on {}:{} (attempt {}): {}",
                      host_, port_, attempt, error.code().message());
            acceptor_.reset();
        }
    }
    return false;
}

void echo_server::accept_connection() {
    acceptor_->async_accept([this](const boost::system::error_code& e, tcp::socket socket) {
        if (!e) {
            boost::system::error_code ec;
            socket.set_option(tcp::no_delay(true), ec);

            auto session = std::make_shared<echo_session>(*this, std::move(socket));
            sessions_.insert(session);
            ++clients_served_;
            session->start();

            if (running_) accept_connection();
        } else if (e != boost::asio::error::operation_aborted) {
            LOG_ERROR("cannot accept more connections: {}", e.message());
            if (running_) {
                // retry after a delay to avoid a tight loop on persistent errors
                auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, std::chrono::seconds(1));
                timer->async_wait([this, timer](const boost::system::error_code& ec) {
                    if (ec != boost::asio::error::operation_aborted && running_) {
                        accept_connection();
                    }
                });
            }
        } else {
            LOG_INFO("stop accepting connections");
        }
    });
}

void echo_server::on_session_end(const std::shared_ptr<echo_session>& session) {
    sessions_.erase(session);
}

} // namespace linkbench::asio
