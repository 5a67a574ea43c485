#include "config.hpp"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace linkbench::bench {

    void config::validate() const {
        if (packet_size < MIN_PACKET_SIZE || packet_size > MAX_PACKET_SIZE) {
            throw std::invalid_argument(fmt::format(
                "packet size must be in the range {}-{} bytes (got {})",
                MIN_PACKET_SIZE, MAX_PACKET_SIZE, packet_size));
        }
    }

    bool config::valid() const {
        return packet_size >= MIN_PACKET_SIZE && packet_size <= MAX_PACKET_SIZE;
    }

    std::string describe(const config& cfg) {
        if (!cfg.enable_send) {
            return fmt::format("packet size: {} bytes, send test: disabled", cfg.packet_size);
        }
        return fmt::format("packet size: {} bytes, send test: enabled, rate: {}, duration: {}, packet limit: {}",
            cfg.packet_size,
            cfg.send_rate == 0 ? std::string("unlimited") : fmt::format("{} bps", cfg.send_rate),
            cfg.test_duration == 0 ? std::string("unlimited") : fmt::format("{} s", cfg.test_duration),
            cfg.max_packets == 0 ? std::string("unlimited") : fmt::format("{} packets", cfg.max_packets));
    }

}
