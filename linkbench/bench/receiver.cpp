#include "receiver.hpp"
#include "../asio/transports/transport.hpp"
#include "../util/logger.hpp"

#include <array>

namespace linkbench::bench {

    receiver::receiver(asio::transport& transport, statistics& stats, shutdown_coordinator& coordinator,
                       std::chrono::milliseconds read_timeout) :
        transport_(transport),
        stats_(stats),
        coordinator_(coordinator),
        read_timeout_(read_timeout) {
    }

    void receiver::run() {
        std::array<uint8_t, BUFFER_SIZE> buffer{};
        LOG_INFO("receive test started on {}", transport_.get_endpoint());

        while (coordinator_.running() && coordinator_.connected()) {
            auto result = transport_.read(buffer.data(), buffer.size(), read_timeout_);

            if (result.status == asio::read_status::timeout) {
                continue;
            }

            if (result.status == asio::read_status::data) {
                stats_.record_received(buffer.data(), result.bytes);
                LOG_TRACE("received {} bytes (total: {})", result.bytes, stats_.rx_bytes());
                continue;
            }

            if (result.status == asio::read_status::eof) {
                LOG_INFO("peer closed the connection");
            } else if (coordinator_.running()) {
                // errors after our own stop() are the expected effect of closing the transport
                LOG_ERROR("error while receiving data: {}", result.ec.message());
            }
            coordinator_.mark_disconnected();
            break;
        }

        // exit through cancellation, the stop() caller may not have recorded it yet
        stats_.disconnect_time().set_now();
        LOG_INFO("receive test stopped ({} bytes, {} packets)", stats_.rx_bytes(), stats_.rx_packets());
    }

}
