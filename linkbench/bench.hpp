#ifndef LINKBENCH_BENCH_HPP
#define LINKBENCH_BENCH_HPP

// Measurement harness
#include <linkbench/bench/config.hpp>                  // run parameters and validation
#include <linkbench/bench/session.hpp>                 // session class (single-shot run)
#include <linkbench/bench/statistics.hpp>              // counters, CRCs and set-once timestamps

// Transports
#include <linkbench/asio/transports/tcp_transport.hpp>
#include <linkbench/asio/transports/serial_transport.hpp>

// Reporting
#include <linkbench/report/reporter.hpp>               // text_reporter, json_reporter

// Note: a session owns its worker threads, route signals to it with
// asio::signal_watcher (see <linkbench/asio/signal_watcher.hpp>)

#endif // LINKBENCH_BENCH_HPP
