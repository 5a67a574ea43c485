#include "statistics.hpp"
#include "../util/crc32.hpp"

namespace linkbench::bench {

    const char* to_string(send_stop_reason reason) {
        switch (reason) {
            case send_stop_reason::none:                 return "none";
            case send_stop_reason::duration_reached:     return "duration reached";
            case send_stop_reason::packet_limit_reached: return "packet limit reached";
            case send_stop_reason::write_error:          return "write error";
            case send_stop_reason::cancelled:            return "cancelled";
            case send_stop_reason::disconnected:         return "disconnected";
        }
        return "unknown";
    }

    bool set_once_timestamp::set(wall_clock::time_point time) {
        int64_t expected = UNSET;
        return ticks_.compare_exchange_strong(expected, time.time_since_epoch().count());
    }

    bool set_once_timestamp::set_now() {
        return set(wall_clock::now());
    }

    bool set_once_timestamp::is_set() const {
        return ticks_.load() != UNSET;
    }

    std::optional<wall_clock::time_point> set_once_timestamp::get() const {
        auto ticks = ticks_.load();
        if (ticks == UNSET) return std::nullopt;
        return wall_clock::time_point(wall_clock::duration(ticks));
    }

    void statistics::record_received(const uint8_t* data, size_t size) {
        // single writer: load/fold/store cannot lose an update
        rx_crc32_.store(util::crc32_fold(rx_crc32_.load(std::memory_order_relaxed), data, size));
        rx_bytes_.fetch_add(size);
        rx_packets_.fetch_add(1);
    }

    void statistics::record_sent(const uint8_t* data, size_t size) {
        tx_crc32_.store(util::crc32_fold(tx_crc32_.load(std::memory_order_relaxed), data, size));
        tx_bytes_.fetch_add(size);
        tx_packets_.fetch_add(1);
    }

    void statistics::set_stop_reason(send_stop_reason reason) {
        stop_reason_.store(reason);
    }

    statistics_snapshot statistics::snapshot() const {
        statistics_snapshot snapshot;
        snapshot.rx_bytes = rx_bytes_.load();
        snapshot.rx_packets = rx_packets_.load();
        snapshot.rx_crc32 = rx_crc32_.load();
        snapshot.tx_bytes = tx_bytes_.load();
        snapshot.tx_packets = tx_packets_.load();
        snapshot.tx_crc32 = tx_crc32_.load();
        snapshot.connect_time = connect_time_.get();
        snapshot.disconnect_time = disconnect_time_.get();
        snapshot.send_start_time = send_start_time_.get();
        snapshot.send_end_time = send_end_time_.get();
        snapshot.stop_reason = stop_reason_.load();
        return snapshot;
    }

    namespace {
        std::optional<double> seconds_between(const std::optional<wall_clock::time_point>& from,
                                              const std::optional<wall_clock::time_point>& to) {
            if (!from || !to) return std::nullopt;
            return std::chrono::duration<double>(*to - *from).count();
        }

        std::optional<double> kbps(uint64_t bytes, const std::optional<double>& seconds) {
            if (!seconds || *seconds <= 0) return std::nullopt;
            return static_cast<double>(bytes) * 8 / *seconds / 1000;
        }
    }

    std::optional<double> statistics_snapshot::connection_seconds() const {
        return seconds_between(connect_time, disconnect_time);
    }

    std::optional<double> statistics_snapshot::send_seconds() const {
        return seconds_between(send_start_time, send_end_time);
    }

    std::optional<double> statistics_snapshot::rx_kbps() const {
        return kbps(rx_bytes, connection_seconds());
    }

    std::optional<double> statistics_snapshot::tx_kbps() const {
        return kbps(tx_bytes, send_seconds());
    }

}
