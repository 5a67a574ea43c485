#include <linkbench/bench.hpp>
#include <linkbench/asio/signal_watcher.hpp>
#include <linkbench/cli/arguments.hpp>
#include <linkbench/util/logger.hpp>
#include <iostream>

using namespace linkbench;

namespace {

    std::shared_ptr<asio::transport> make_transport(const cli::arguments& args) {
        if (args.kind == cli::transport_kind::serial) {
            return std::make_shared<asio::serial_transport>("serial", args.device, args.baud_rate);
        }
        return std::make_shared<asio::tcp_transport>("tcp", args.host, args.port);
    }

}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "linkbench";

    auto args = cli::parse_arguments(argc, argv, std::cerr);
    if (!args) {
        cli::print_usage(program, std::cerr);
        return 1;
    }
    if (args->help) {
        cli::print_usage(program, std::cout);
        return 0;
    }

    logging::enable();
    if (args->verbose) {
        logging::set_log_level(spdlog::level::debug);
    }

    cli::print_configuration(*args, std::cout);
    LOG_DEBUG("effective configuration: {}", bench::describe(args->config));

    bench::session_options options;
    options.open_timeout = std::chrono::seconds(args->connect_timeout);
    bench::session session(make_transport(*args), args->config, options);

    // Ctrl+C ends the run, the report is still printed
    asio::signal_watcher signals([&session](int) {
        session.stop();
    });
    signals.start();

    try {
        session.start();
    } catch (const bench::connect_error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        signals.stop();
        return 2;
    }

    std::cout << "\nTest running, press Ctrl+C to stop..." << std::endl;
    auto snapshot = session.wait();
    signals.stop();

    report::make_reporter(args->output)->report(snapshot, std::cout);
    return 0;
}
