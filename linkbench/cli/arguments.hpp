#ifndef LINKBENCH_CLI_ARGUMENTS_HPP
#define LINKBENCH_CLI_ARGUMENTS_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "../bench/config.hpp"
#include "../report/reporter.hpp"

namespace linkbench::cli {

enum class transport_kind {
    tcp,
    serial
};

struct arguments {
    transport_kind kind = transport_kind::tcp;

    // tcp endpoint
    std::string host = "127.0.0.1";
    std::string port = "8888";

    // serial endpoint
    std::string device;
    unsigned int baud_rate = 0;

    bench::config config;
    unsigned connect_timeout = 10;
    report::format output = report::format::text;
    bool verbose = false;
    bool help = false;
};

/**
 * Parses `linkbench tcp|serial ...`. Returns std::nullopt and writes a
 * message to `err` when the command line or the resulting configuration is
 * invalid, so nothing is opened with bad parameters.
 */
std::optional<arguments> parse_arguments(const std::vector<std::string>& args, std::ostream& err);

std::optional<arguments> parse_arguments(int argc, char* argv[], std::ostream& err);

void print_usage(const std::string& program, std::ostream& out);

/// startup banner with the effective parameters
void print_configuration(const arguments& args, std::ostream& out);

}

#endif
