#include "CancelToken.h"
#include "OfferListener.h"
#include "SpeedTestClient.h"
#include "speedtest_log.h"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

static CancelToken g_cancel;

static void signal_handler(int) {
    g_cancel.cancel();
}

struct ClientOptions {
    std::optional<uint64_t> size;
    std::optional<int> tcp;
    std::optional<int> udp;
    uint16_t discovery_port = kDiscoveryPort;
    int rounds = 0;                  // 0 = keep going until interrupted
};

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--size BYTES] [--tcp N] [--udp N] [--discovery-port P] [--rounds N]"
              << " [--recv-timeout-ms MS] [--max-ms MS] [--verbose]\n";
}

static std::optional<int> parse_count(const std::string& s) {
    auto v = parse_size_request(s);
    if (!v || *v > 1000000) return std::nullopt;
    return static_cast<int>(*v);
}

static bool parse_args(int argc, char** argv, ClientOptions& o, SpeedTestClientArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        if (s == "--size" && need(1)) {
            auto v = parse_size_request(argv[++i]);
            if (!v || *v == 0) { std::cerr << "--size must be a positive integer\n"; return false; }
            o.size = *v;
        } else if ((s == "--tcp" || s == "--udp") && need(1)) {
            auto v = parse_count(argv[++i]);
            if (!v) { std::cerr << s << " must be a non-negative integer\n"; return false; }
            (s == "--tcp" ? o.tcp : o.udp) = *v;
        } else if (s == "--discovery-port" && need(1)) {
            auto v = parse_port(argv[++i]);
            if (!v) { std::cerr << "--discovery-port must be in 1..65535\n"; return false; }
            o.discovery_port = *v;
        } else if (s == "--rounds" && need(1)) {
            auto v = parse_count(argv[++i]);
            if (!v) { std::cerr << "--rounds must be a non-negative integer\n"; return false; }
            o.rounds = *v;
        } else if (s == "--recv-timeout-ms" && need(1)) {
            auto v = parse_count(argv[++i]);
            if (!v || *v == 0) { std::cerr << "--recv-timeout-ms must be positive\n"; return false; }
            a.udp.recv_timeout_ms = *v;
        } else if (s == "--max-ms" && need(1)) {
            auto v = parse_count(argv[++i]);
            if (!v) { std::cerr << "--max-ms must be a non-negative integer\n"; return false; }
            a.udp.max_ms = *v;
        } else if (s == "--verbose" || s == "-v") {
            set_log_verbose(true);
        } else if (s == "-h" || s == "--help") {
            usage(argv[0]);
            return false;
        } else {
            std::cerr << "Unknown arg: " << s << "\n";
            usage(argv[0]);
            return false;
        }
    }
    return true;
}

// Ask until `parse` accepts the answer. Returns nullopt when stdin closes.
template <typename T, typename Parse>
static std::optional<T> prompt(const std::string& question, Parse parse, const char* complaint) {
    while (true) {
        std::cout << question << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) return std::nullopt;
        auto v = parse(line);
        if (v) return static_cast<T>(*v);
        std::cout << "Invalid input: " << complaint << " Try again.\n";
    }
}

static bool gather_input(ClientOptions& o) {
    if (!o.size) {
        o.size = prompt<uint64_t>("Enter file size (bytes): ", [](const std::string& s) {
            auto v = parse_size_request(s);
            return (v && *v > 0) ? v : std::nullopt;
        }, "File size must be a positive integer.");
        if (!o.size) return false;
    }
    if (!o.tcp) {
        o.tcp = prompt<int>("Enter number of TCP connections: ", parse_count,
                            "TCP connections must be a non-negative integer.");
        if (!o.tcp) return false;
    }
    if (!o.udp) {
        o.udp = prompt<int>("Enter number of UDP connections: ", parse_count,
                            "UDP connections must be a non-negative integer.");
        if (!o.udp) return false;
    }
    return true;
}

static void print_report(const RoundReport& r) {
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& t : r.results) {
        std::cout << protocol_name(t.protocol) << " transfer #" << t.id
                  << " finished, total time: " << t.elapsed_seconds << " seconds, total speed: "
                  << t.bits_per_second << " bits/second";
        if (t.protocol == TransferProtocol::UDP) {
            std::cout << ", percentage of packets received successfully: "
                      << (1.0 - t.loss_rate()) * 100.0 << "% (" << t.packets_received << "/"
                      << t.packets_expected << ")";
        } else if (t.bytes_received < t.requested_size) {
            std::cout << " (short: " << t.bytes_received << "/" << t.requested_size << " bytes)";
        }
        std::cout << "\n";
    }
    for (const auto& f : r.failures) {
        std::cout << protocol_name(f.protocol) << " transfer #" << f.id << " failed: " << f.error << "\n";
    }

    std::cout << "Summary:";
    if (r.summary.avg_tcp_bps) {
        std::cout << " TCP avg " << format_bps(*r.summary.avg_tcp_bps) << " over " << r.summary.tcp_count;
    }
    if (r.summary.avg_udp_bps) {
        std::cout << " | UDP avg " << format_bps(*r.summary.avg_udp_bps) << " over " << r.summary.udp_count
                  << ", avg loss " << *r.summary.avg_udp_loss_rate * 100.0 << "%";
    }
    if (!r.summary.avg_tcp_bps && !r.summary.avg_udp_bps) std::cout << " no successful transfers";
    std::cout << "\n";
}

int main(int argc, char** argv) {
    ClientOptions opts;
    SpeedTestClientArgs cargs;
    if (!parse_args(argc, argv, opts, cargs)) return 1;
    if (!gather_input(opts)) return 1;

    cargs.cancel = &g_cancel;
    SpeedTestClient client(cargs);
    try {
        client.validate(*opts.size, *opts.tcp, *opts.udp);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    OfferListenerArgs largs;
    largs.port = opts.discovery_port;

    for (int round = 1; opts.rounds == 0 || round <= opts.rounds; ++round) {
        // Fresh socket per round so offers queued during the last round are dropped.
        std::optional<ServerEndpoint> server;
        {
            OfferListener listener(largs);
            if (!listener.init()) return 2;
            server = listener.wait_for_offer(&g_cancel);
        }
        if (!server) break;

        RoundReport report;
        try {
            report = client.run(*server, *opts.size, *opts.tcp, *opts.udp);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Configuration error: " << e.what() << "\n";
            return 1;
        }
        print_report(report);
        if (g_cancel.cancelled()) break;
        std::cout << "[Client] All transfers complete. Waiting for new offers...\n";
    }
    return 0;
}
