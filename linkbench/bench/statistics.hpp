#ifndef LINKBENCH_BENCH_STATISTICS_HPP
#define LINKBENCH_BENCH_STATISTICS_HPP

#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>

#include <boost/noncopyable.hpp>

#include "../util/types.hpp"

namespace linkbench::bench {

/// why the sender loop ended
enum class send_stop_reason {
    none,               // sender never started emitting
    duration_reached,
    packet_limit_reached,
    write_error,
    cancelled,
    disconnected
};

const char* to_string(send_stop_reason reason);

/**
 * Timestamp that can be written exactly once. Concurrent writers race on a
 * compare-and-set; the first one to land wins and later calls are ignored.
 */
class set_once_timestamp {
public:
    /// returns true if this call stored the value
    bool set(wall_clock::time_point time);
    bool set_now();

    bool is_set() const;
    std::optional<wall_clock::time_point> get() const;

private:
    static constexpr int64_t UNSET = std::numeric_limits<int64_t>::min();
    std::atomic<int64_t> ticks_{UNSET};
};

/// frozen copy of the run statistics handed to the reporter
struct statistics_snapshot {
    uint64_t rx_bytes = 0;
    uint64_t rx_packets = 0;
    uint32_t rx_crc32 = 0;

    uint64_t tx_bytes = 0;
    uint64_t tx_packets = 0;
    uint32_t tx_crc32 = 0;

    std::optional<wall_clock::time_point> connect_time;
    std::optional<wall_clock::time_point> disconnect_time;
    std::optional<wall_clock::time_point> send_start_time;
    std::optional<wall_clock::time_point> send_end_time;

    send_stop_reason stop_reason = send_stop_reason::none;

    /// disconnect_time - connect_time, in seconds
    std::optional<double> connection_seconds() const;

    /// send_end_time - send_start_time, in seconds
    std::optional<double> send_seconds() const;

    /// average receive rate over the connection, kbit/s; empty if the duration is not positive
    std::optional<double> rx_kbps() const;

    /// average send rate over the send window, kbit/s; empty if the duration is not positive
    std::optional<double> tx_kbps() const;
};

/**
 * Counters shared by the receiver and sender loops. The receive group is only
 * written by the receiver, the send group only by the sender, so updates need
 * no lock; every field is atomic so any thread may read it at any time.
 */
class statistics : private boost::noncopyable {
public:
    statistics() = default;

    // receive group, receiver loop only
    void record_received(const uint8_t* data, size_t size);

    // send group, sender loop only
    void record_sent(const uint8_t* data, size_t size);
    void set_stop_reason(send_stop_reason reason);

    uint64_t rx_bytes() const { return rx_bytes_.load(); }
    uint64_t rx_packets() const { return rx_packets_.load(); }
    uint32_t rx_crc32() const { return rx_crc32_.load(); }

    uint64_t tx_bytes() const { return tx_bytes_.load(); }
    uint64_t tx_packets() const { return tx_packets_.load(); }
    uint32_t tx_crc32() const { return tx_crc32_.load(); }

    send_stop_reason stop_reason() const { return stop_reason_.load(); }

    set_once_timestamp& connect_time() { return connect_time_; }
    set_once_timestamp& disconnect_time() { return disconnect_time_; }
    set_once_timestamp& send_start_time() { return send_start_time_; }
    set_once_timestamp& send_end_time() { return send_end_time_; }

    const set_once_timestamp& connect_time() const { return connect_time_; }
    const set_once_timestamp& disconnect_time() const { return disconnect_time_; }
    const set_once_timestamp& send_start_time() const { return send_start_time_; }
    const set_once_timestamp& send_end_time() const { return send_end_time_; }

    /// consistent only once both loops have stopped
    statistics_snapshot snapshot() const;

private:
    std::atomic<uint64_t> rx_bytes_{0};
    std::atomic<uint64_t> rx_packets_{0};
    std::atomic<uint32_t> rx_crc32_{0};

    std::atomic<uint64_t> tx_bytes_{0};
    std::atomic<uint64_t> tx_packets_{0};
    std::atomic<uint32_t> tx_crc32_{0};

    std::atomic<send_stop_reason> stop_reason_{send_stop_reason::none};

    set_once_timestamp connect_time_;
    set_once_timestamp disconnect_time_;
    set_once_timestamp send_start_time_;
    set_once_timestamp send_end_time_;
};

}

#endif
