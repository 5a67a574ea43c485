#include "sender.hpp"
#include "../asio/transports/transport.hpp"
#include "../util/logger.hpp"

#include <algorithm>
#include <thread>

namespace linkbench::bench {

    payload_generator::payload_generator() :
        engine_(std::random_device{}()) {
    }

    payload_generator::payload_generator(uint32_t seed) :
        engine_(seed) {
    }

    void payload_generator::fill(byte_buffer& buffer) {
        std::uniform_int_distribution<unsigned> distribution(0, 255);
        for (auto& byte : buffer) {
            byte = static_cast<uint8_t>(distribution(engine_));
        }
    }

    sender::sender(asio::transport& transport, const config& cfg, statistics& stats,
                   shutdown_coordinator& coordinator, std::chrono::milliseconds grace_period) :
        transport_(transport),
        config_(cfg),
        stats_(stats),
        coordinator_(coordinator),
        grace_period_(grace_period) {
    }

    std::chrono::nanoseconds sender::packet_interval(unsigned packet_size, uint64_t send_rate) {
        if (send_rate == 0) return std::chrono::nanoseconds::zero();
        const double seconds = static_cast<double>(packet_size) * 8 / static_cast<double>(send_rate);
        return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
    }

    bool sender::wait_connected() {
        while (coordinator_.running() && !coordinator_.connected()) {
            std::this_thread::sleep_for(CONNECT_POLL_INTERVAL);
        }
        return coordinator_.running();
    }

    bool sender::sleep_while_running(mono_clock::duration duration) {
        const auto deadline = mono_clock::now() + duration;
        while (coordinator_.running()) {
            auto now = mono_clock::now();
            if (now >= deadline) return true;
            std::this_thread::sleep_until(std::min<mono_clock::time_point>(deadline, now + MAX_SLEEP_SLICE));
        }
        return false;
    }

    send_stop_reason sender::stop_cause() const {
        // whichever of peer loss and stop() cleared `connected` first
        return coordinator_.peer_disconnected() ? send_stop_reason::disconnected
                                                : send_stop_reason::cancelled;
    }

    void sender::run() {
        if (!wait_connected()) {
            LOG_INFO("send test cancelled before the connection was established");
            return;
        }

        LOG_INFO("send test will start in {} ms...", grace_period_.count());
        if (!sleep_while_running(grace_period_)) {
            LOG_INFO("send test cancelled during the grace period");
            return;
        }

        LOG_INFO("send test started");
        stats_.send_start_time().set_now();
        const auto reason = emit(mono_clock::now());
        stats_.set_stop_reason(reason);
        stats_.send_end_time().set_now();

        LOG_INFO("send test stopped: {} ({} bytes, {} packets)",
                 to_string(reason), stats_.tx_bytes(), stats_.tx_packets());
    }

    send_stop_reason sender::emit(mono_clock::time_point start) {
        payload_generator generator;
        byte_buffer packet(config_.packet_size);
        const auto interval = packet_interval(config_.packet_size, config_.send_rate);
        const auto duration_limit = std::chrono::seconds(config_.test_duration);

        for (;;) {
            if (!coordinator_.running() || !coordinator_.connected()) {
                return stop_cause();
            }

            if (config_.test_duration > 0 && mono_clock::now() - start >= duration_limit) {
                LOG_INFO("test duration limit reached ({} s)", config_.test_duration);
                return send_stop_reason::duration_reached;
            }

            if (config_.max_packets > 0 && stats_.tx_packets() >= config_.max_packets) {
                LOG_INFO("packet limit reached ({} packets)", config_.max_packets);
                return send_stop_reason::packet_limit_reached;
            }

            generator.fill(packet);

            const auto write_start = mono_clock::now();
            auto result = transport_.write(packet.data(), packet.size());
            const auto write_duration = mono_clock::now() - write_start;

            if (!result) {
                // a write failing because the run is ending is not a write error
                if (!coordinator_.running() || !coordinator_.connected()) return stop_cause();
                LOG_ERROR("error while sending data: {}", result.ec.message());
                return send_stop_reason::write_error;
            }

            stats_.record_sent(packet.data(), packet.size());

            if (interval > std::chrono::nanoseconds::zero()) {
                // the write already used part of the packet slot
                if (write_duration < interval) {
                    sleep_while_running(interval - write_duration);
                }
            } else {
                std::this_thread::sleep_for(UNLIMITED_RATE_YIELD);
            }
        }
    }

}
