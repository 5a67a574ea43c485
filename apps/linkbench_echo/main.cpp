#include <linkbench/asio/echo_server.hpp>
#include <linkbench/asio/signal_watcher.hpp>
#include <linkbench/util/logger.hpp>
#include <linkbench/util/types.hpp>
#include <spdlog/fmt/fmt.h>
#include <iostream>

using namespace linkbench;

namespace {

    void print_usage(const std::string& program, std::ostream& out) {
        out << "usage: " << program << " [--host HOST] [--port PORT] [-v]\n\n"
            << "TCP echo server, writes every received byte back to its client\n\n"
            << "options:\n"
            << "  --host HOST   address to listen on (default: 0.0.0.0)\n"
            << "  --port PORT   port to listen on (default: 8888)\n"
            << "  -v            debug logging\n"
            << "  -h, --help    show this help\n";
    }

}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "linkbench_echo";
    std::string host = "0.0.0.0";
    std::string port = "8888";
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--host" || arg == "--port") && i + 1 < argc) {
            (arg == "--host" ? host : port) = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(program, std::cout);
            return 0;
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            print_usage(program, std::cerr);
            return 1;
        }
    }

    logging::enable();
    if (verbose) {
        logging::set_log_level(spdlog::level::debug);
    }

    boost::asio::io_context io_context;
    asio::echo_server server(io_context, host, port);
    if (!server.start()) {
        std::cerr << "error: cannot listen on " << host << ":" << port << std::endl;
        return 1;
    }

    asio::signal_watcher signals([&server](int) {
        server.stop();
    });
    signals.start();

    std::cout << "Echo server listening on " << host << ":" << server.local_port()
              << ", press Ctrl+C to stop" << std::endl;

    const auto started = mono_clock::now();
    // returns once the acceptor and every client connection are closed
    io_context.run();
    const double seconds = std::chrono::duration<double>(mono_clock::now() - started).count();
    signals.stop();

    std::cout << "\nServer statistics:\n"
              << fmt::format("  Running time: {:.2f} s\n", seconds)
              << "  Clients served: " << server.clients_served() << "\n"
              << "  Total bytes echoed: " << server.total_bytes() << " bytes\n";
    if (seconds > 0) {
        std::cout << fmt::format("  Average throughput: {:.2f} kbps\n",
                                 static_cast<double>(server.total_bytes()) * 8 / seconds / 1000);
    }
    return 0;
}
