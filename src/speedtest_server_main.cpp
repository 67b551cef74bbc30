#include "OfferBroadcaster.h"
#include "TransferServer.h"
#include "speedtest_log.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--udp-port P] [--tcp-port P] [--discovery-port P] [--broadcast A.B.C.D]"
              << " [--interval-ms MS] [--redundancy N] [--pps N]"
              << " [--max-workers N] [--udp-max-ms MS] [--verbose]\n";
}

// Transfer ports may be 0 (kernel picks); the discovery port may not.
static uint16_t port_arg(const std::string& text, bool allow_zero) {
    if (allow_zero && text == "0") return 0;
    auto p = parse_port(text);
    if (!p) throw std::out_of_range("port out of range: " + text);
    return *p;
}

static bool parse_args(int argc, char** argv, TransferServerArgs& s, OfferBroadcasterArgs& b) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (a == "--udp-port" && need(1)) s.udp_port = port_arg(argv[++i], true);
            else if (a == "--tcp-port" && need(1)) s.tcp_port = port_arg(argv[++i], true);
            else if (a == "--discovery-port" && need(1)) b.discovery_port = port_arg(argv[++i], false);
            else if (a == "--broadcast" && need(1)) b.broadcast_ip = argv[++i];
            else if (a == "--interval-ms" && need(1)) b.interval_ms = std::stoi(argv[++i]);
            else if (a == "--redundancy" && need(1)) s.redundancy = std::stoi(argv[++i]);
            else if (a == "--pps" && need(1)) s.pps = std::stod(argv[++i]);
            else if (a == "--max-workers" && need(1)) s.max_workers = std::stoi(argv[++i]);
            else if (a == "--udp-max-ms" && need(1)) s.udp_max_ms = std::stoi(argv[++i]);
            else if (a == "--verbose" || a == "-v") set_log_verbose(true);
            else if (a == "-h" || a == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return false; }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << a << "\n";
            return false;
        }
    }

    if (s.redundancy < 1) { std::cerr << "--redundancy must be >= 1\n"; return false; }
    if (b.interval_ms < 1) { std::cerr << "--interval-ms must be >= 1\n"; return false; }
    if (s.pps < 0) { std::cerr << "--pps must be >= 0\n"; return false; }
    if (s.max_workers < 1) { std::cerr << "--max-workers must be >= 1\n"; return false; }
    if (s.udp_max_ms < 0) { std::cerr << "--udp-max-ms must be >= 0\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    TransferServerArgs sargs;
    OfferBroadcasterArgs bargs;
    if (!parse_args(argc, argv, sargs, bargs)) return 1;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    TransferServer server(sargs);
    if (!server.init()) return 2;

    bargs.udp_port = server.udp_port();
    bargs.tcp_port = server.tcp_port();
    OfferBroadcaster broadcaster(bargs);
    if (!broadcaster.init()) return 2;

    if (!server.start()) return 3;
    if (!broadcaster.start()) return 3;

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log_line("[Server] Shutting down...");
    broadcaster.stop();
    server.stop();
    log_line("[Server] Served " + std::to_string(server.tcp_transfers_completed()) + " TCP and " +
             std::to_string(server.udp_transfers_completed()) + " UDP transfers, refused " +
             std::to_string(server.requests_refused()));
    return 0;
}
