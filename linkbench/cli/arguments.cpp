#include "arguments.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace linkbench::cli {

    namespace {

        bool parse_unsigned(const std::string& text, uint64_t& value) {
            if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) return false;
            try {
                size_t consumed = 0;
                value = std::stoull(text, &consumed, 10);
                return consumed == text.size();
            } catch (const std::invalid_argument&) {
                return false;
            } catch (const std::out_of_range&) {
                return false;
            }
        }

        bool parse_unsigned(const std::string& text, unsigned& value) {
            uint64_t wide = 0;
            if (!parse_unsigned(text, wide) || wide > std::numeric_limits<unsigned>::max()) return false;
            value = static_cast<unsigned>(wide);
            return true;
        }

    }

    std::optional<arguments> parse_arguments(const std::vector<std::string>& args, std::ostream& err) {
        arguments result;

        if (args.empty()) {
            err << "missing transport: expected 'tcp' or 'serial'\n";
            return std::nullopt;
        }

        std::vector<std::string> positional;
        size_t index = 0;
        const auto& mode = args[index++];
        if (mode == "-h" || mode == "--help") {
            result.help = true;
            return result;
        } else if (mode == "tcp") {
            result.kind = transport_kind::tcp;
        } else if (mode == "serial") {
            result.kind = transport_kind::serial;
        } else {
            err << "unknown transport: " << mode << "\n";
            return std::nullopt;
        }

        for (; index < args.size(); ++index) {
            const std::string& key = args[index];

            auto need = [&](const char* flag) -> const std::string* {
                if (++index >= args.size()) {
                    err << "missing value for " << flag << "\n";
                    return nullptr;
                }
                return &args[index];
            };

            auto need_number = [&](const char* flag, auto& target) -> bool {
                const std::string* value = need(flag);
                if (!value) return false;
                if (!parse_unsigned(*value, target)) {
                    err << "invalid value for " << flag << ": " << *value << "\n";
                    return false;
                }
                return true;
            };

            if (key == "-h" || key == "--help") {
                result.help = true;
                return result;
            } else if (key == "-S" || key == "--send") {
                result.config.enable_send = true;
            } else if (key == "-s" || key == "--packet-size") {
                if (!need_number("--packet-size", result.config.packet_size)) return std::nullopt;
            } else if (key == "-r" || key == "--rate") {
                uint64_t kbps = 0;
                if (!need_number("--rate", kbps)) return std::nullopt;
                if (kbps > std::numeric_limits<uint64_t>::max() / 1000) {
                    err << "invalid value for --rate: " << kbps << "\n";
                    return std::nullopt;
                }
                result.config.send_rate = kbps * 1000;
            } else if (key == "-d" || key == "--duration") {
                if (!need_number("--duration", result.config.test_duration)) return std::nullopt;
            } else if (key == "-c" || key == "--count") {
                if (!need_number("--count", result.config.max_packets)) return std::nullopt;
            } else if (key == "-t" || key == "--connect-timeout") {
                if (!need_number("--connect-timeout", result.connect_timeout)) return std::nullopt;
            } else if (key == "-j" || key == "--json") {
                result.output = report::format::json;
            } else if (key == "-v" || key == "--verbose") {
                result.verbose = true;
            } else if (key.size() > 1 && key.front() == '-') {
                err << "unknown option: " << key << "\n";
                return std::nullopt;
            } else {
                positional.push_back(key);
            }
        }

        if (result.kind == transport_kind::tcp) {
            if (positional.size() > 2) {
                err << "too many arguments for tcp: expected [host] [port]\n";
                return std::nullopt;
            }
            if (positional.size() > 0) result.host = positional[0];
            if (positional.size() > 1) {
                unsigned port = 0;
                if (!parse_unsigned(positional[1], port) || port == 0 || port > 65535) {
                    err << "invalid port: " << positional[1] << "\n";
                    return std::nullopt;
                }
                result.port = positional[1];
            }
        } else {
            if (positional.size() != 2) {
                err << "serial requires <device> <baud>\n";
                return std::nullopt;
            }
            result.device = positional[0];
            if (!parse_unsigned(positional[1], result.baud_rate) || result.baud_rate == 0) {
                err << "baud rate must be greater than 0\n";
                return std::nullopt;
            }
        }

        try {
            result.config.validate();
        } catch (const std::invalid_argument& e) {
            err << "error: " << e.what() << "\n";
            return std::nullopt;
        }

        return result;
    }

    std::optional<arguments> parse_arguments(int argc, char* argv[], std::ostream& err) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        return parse_arguments(args, err);
    }

    void print_usage(const std::string& program, std::ostream& out) {
        out << "usage: " << program << " tcp [host] [port] [options]\n"
            << "       " << program << " serial <device> <baud> [options]\n\n"
            << "duplex throughput test: drains and checksums incoming data, optionally sends paced random packets\n\n"
            << "options:\n"
            << "  -S, --send                enable the send test\n"
            << "  -s, --packet-size N       packet size, 32-1024 bytes (default: 100)\n"
            << "  -r, --rate KBPS           send rate in kbps, 0 = unlimited (default: 0)\n"
            << "  -d, --duration SECONDS    send test duration, 0 = unlimited (default: 0)\n"
            << "  -c, --count N             packets to send, 0 = unlimited (default: 0)\n"
            << "  -t, --connect-timeout S   tcp connect timeout (default: 10)\n"
            << "  -j, --json                print the report as JSON\n"
            << "  -v, --verbose             debug logging\n"
            << "  -h, --help                show this help\n\n"
            << "tcp defaults to 127.0.0.1:8888. Stop the test with Ctrl+C.\n";
    }

    void print_configuration(const arguments& args, std::ostream& out) {
        const auto& cfg = args.config;
        out << "Configuration:\n";
        if (args.kind == transport_kind::tcp) {
            out << "  Server address: " << args.host << ":" << args.port << "\n";
        } else {
            out << "  Serial device: " << args.device << "\n";
            out << "  Baud rate: " << args.baud_rate << "\n";
        }
        out << "  Packet size: " << cfg.packet_size << " bytes\n";
        out << "  Send test: " << (cfg.enable_send ? "enabled" : "disabled") << "\n";
        if (cfg.enable_send) {
            out << "  Send rate: " << (cfg.send_rate == 0 ? "unlimited" : std::to_string(cfg.send_rate / 1000) + " kbps") << "\n";
            out << "  Test duration: " << (cfg.test_duration == 0 ? "unlimited" : std::to_string(cfg.test_duration) + " s") << "\n";
            out << "  Packet limit: " << (cfg.max_packets == 0 ? "unlimited" : std::to_string(cfg.max_packets) + " packets") << "\n";
        }
        if (args.kind == transport_kind::serial) {
            out << "\nNote: for a send/receive test, bridge the TX and RX pins of the serial port\n";
        }
        out.flush();
    }

}
