#include "reporter.hpp"

#include <spdlog/fmt/fmt.h>

namespace linkbench::report {

    using bench::statistics_snapshot;

    std::string format_crc32(uint32_t crc) {
        return fmt::format("0x{:08X}", crc);
    }

    std::string format_count(uint64_t value) {
        auto digits = std::to_string(value);
        std::string result;
        result.reserve(digits.size() + digits.size() / 3);
        const auto lead = digits.size() % 3;
        for (size_t i = 0; i < digits.size(); ++i) {
            if (i != 0 && (i + 3 - lead) % 3 == 0) result.push_back(',');
            result.push_back(digits[i]);
        }
        return result;
    }

    text_reporter::text_reporter(std::string title) :
        title_(std::move(title)) {
    }

    void text_reporter::report(const statistics_snapshot& snapshot, std::ostream& out) const {
        const std::string rule(50, '=');
        out << '\n' << rule << '\n' << title_ << '\n' << rule << '\n';

        if (snapshot.rx_bytes > 0) {
            out << "Receive statistics:\n";
            out << "  Total bytes received: " << format_count(snapshot.rx_bytes) << " bytes\n";
            out << "  Packets received: " << format_count(snapshot.rx_packets) << '\n';
            out << "  Receive CRC32: " << format_crc32(snapshot.rx_crc32) << '\n';
            if (auto rate = snapshot.rx_kbps()) {
                out << fmt::format("  Average receive rate: {:.2f} kbps\n", *rate);
            }
        }

        if (snapshot.tx_bytes > 0) {
            out << "Send statistics:\n";
            out << "  Total bytes sent: " << format_count(snapshot.tx_bytes) << " bytes\n";
            out << "  Packets sent: " << format_count(snapshot.tx_packets) << '\n';
            out << "  Send CRC32: " << format_crc32(snapshot.tx_crc32) << '\n';
            auto seconds = snapshot.send_seconds();
            if (seconds && *seconds > 0) {
                out << fmt::format("  Send test duration: {:.2f} s\n", *seconds);
            }
            if (auto rate = snapshot.tx_kbps()) {
                out << fmt::format("  Average send rate: {:.2f} kbps\n", *rate);
            }
            out << "  Send stopped by: " << bench::to_string(snapshot.stop_reason) << '\n';
        }

        auto total = snapshot.connection_seconds();
        if (total && *total > 0) {
            out << fmt::format("Total connection time: {:.2f} s\n", *total);
        }
        out.flush();
    }

    json_reporter::json_reporter(int indent) :
        indent_(indent) {
    }

    void json_reporter::report(const statistics_snapshot& snapshot, std::ostream& out) const {
        out << to_json(snapshot).dump(indent_) << std::endl;
    }

    std::unique_ptr<reporter> make_reporter(format kind) {
        switch (kind) {
            case format::json: return std::make_unique<json_reporter>();
            case format::text: break;
        }
        return std::make_unique<text_reporter>();
    }

    namespace {
        nlohmann::json optional_value(const std::optional<double>& value) {
            return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        }

        nlohmann::json epoch_seconds(const std::optional<wall_clock::time_point>& time) {
            if (!time) return nullptr;
            return std::chrono::duration<double>(time->time_since_epoch()).count();
        }
    }

    nlohmann::json to_json(const statistics_snapshot& snapshot) {
        return {
            {"rx", {
                {"bytes", snapshot.rx_bytes},
                {"packets", snapshot.rx_packets},
                {"crc32", format_crc32(snapshot.rx_crc32)},
                {"kbps", optional_value(snapshot.rx_kbps())}
            }},
            {"tx", {
                {"bytes", snapshot.tx_bytes},
                {"packets", snapshot.tx_packets},
                {"crc32", format_crc32(snapshot.tx_crc32)},
                {"kbps", optional_value(snapshot.tx_kbps())},
                {"duration", optional_value(snapshot.send_seconds())},
                {"stop_reason", bench::to_string(snapshot.stop_reason)}
            }},
            {"connect_time", epoch_seconds(snapshot.connect_time)},
            {"disconnect_time", epoch_seconds(snapshot.disconnect_time)},
            {"send_start_time", epoch_seconds(snapshot.send_start_time)},
            {"send_end_time", epoch_seconds(snapshot.send_end_time)},
            {"connection_duration", optional_value(snapshot.connection_seconds())}
        };
    }

}
