/**
* @file
* @brief statsd_emit: send sampled metrics from the command line.
*
* @details
* Responsibilities
*  - Parse command-line options into @ref statsd::ClientConfig plus a workload.
*  - Construct a @ref statsd::Client over a real UDP socket.
*  - Record the requested number of observations, flush, and optionally print
*    the client's counters.
*
* CLI options
*  - `--server <host>`       : Destination host (default: 127.0.0.1).
*  - `--port <p>`            : Destination UDP port (default: 8125).
*  - `--endpoint <host:port>`: Both at once.
*  - `--prefix <p>`          : Metric name prefix.
*  - `--max-packet <n>`      : Maximum datagram payload in bytes (default: 1432).
*  - `--rate <r>`            : Sample rate in (0, 1] (default: 1).
*  - `--name <metric>`       : Metric name (default: statsd_emit.test).
*  - `--kind c|ms|g|gd|s`    : Counter, timer, gauge, gauge delta, set (default: c).
*  - `--value <v>`           : Value per observation (default: 1).
*  - `--iterations <n>`      : Number of recording calls (default: 1).
*  - `--predictive`          : Use countdown sampling for rates below 1/256.
*  - `--verbose`             : Print the configuration and final counters.
*  - `--help`                : Print usage and exit.
*
* Exit codes
*  - `0` on success.
*  - `1` on configuration, encoding or send error.
*/

#include "statsd/client.hpp"
#include "statsd/errors.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace statsd;

namespace {

struct Workload {
    std::string name       = "statsd_emit.test";
    std::string kind       = "c";
    int64_t     value      = 1;
    uint64_t    iterations = 1;
    double      rate       = 1.0;
    bool        predictive = false;
    bool        verbose    = false;
};

void usage() {
    std::cout << "statsd_emit [--server <host>] [--port <p>] [--endpoint <host:port>] [--prefix <p>]"
                 " [--max-packet <n>] [--rate <r>] [--name <metric>] [--kind c|ms|g|gd|s]"
                 " [--value <v>] [--iterations <n>] [--predictive] [--verbose]\n";
}

void emit_one(Client& client, const Workload& w, const SampleRate& rate, SampleChannel& ch) {
    if (w.kind == "c") {
        if (w.predictive) client.count(w.name, w.value, rate, ch);
        else client.count(w.name, w.value, rate);
    } else if (w.kind == "ms") {
        if (w.predictive) client.timing(w.name, w.value, rate, ch);
        else client.timing(w.name, w.value, rate);
    } else if (w.kind == "g" || w.kind == "gd") {
        const Gauge g = w.kind == "g" ? Gauge::set(w.value) : Gauge::adjust(w.value);
        if (w.predictive) client.gauge(w.name, g, rate, ch);
        else client.gauge(w.name, g, rate);
    } else {
        if (w.predictive) client.set(w.name, w.value, rate, ch);
        else client.set(w.name, w.value, rate);
    }
}

} // namespace

int main(int argc, char** argv) {
    ClientConfig cfg;
    Workload w;
    try {
        for (int i = 1; i < argc; i++) {
            if (!strcmp(argv[i], "--server") && i + 1 < argc) cfg.host = argv[++i];
            else if (!strcmp(argv[i], "--port") && i + 1 < argc) cfg.port = (uint16_t)atoi(argv[++i]);
            else if (!strcmp(argv[i], "--endpoint") && i + 1 < argc) {
                auto ep = parse_endpoint(argv[++i]);
                cfg.host = ep.first;
                cfg.port = ep.second;
            }
            else if (!strcmp(argv[i], "--prefix") && i + 1 < argc) cfg.prefix = argv[++i];
            else if (!strcmp(argv[i], "--max-packet") && i + 1 < argc) cfg.max_packet_size = (size_t)atoll(argv[++i]);
            else if (!strcmp(argv[i], "--rate") && i + 1 < argc) w.rate = atof(argv[++i]);
            else if (!strcmp(argv[i], "--name") && i + 1 < argc) w.name = argv[++i];
            else if (!strcmp(argv[i], "--kind") && i + 1 < argc) w.kind = argv[++i];
            else if (!strcmp(argv[i], "--value") && i + 1 < argc) w.value = atoll(argv[++i]);
            else if (!strcmp(argv[i], "--iterations") && i + 1 < argc) w.iterations = strtoull(argv[++i], nullptr, 10);
            else if (!strcmp(argv[i], "--predictive")) w.predictive = true;
            else if (!strcmp(argv[i], "--verbose")) w.verbose = true;
            else if (!strcmp(argv[i], "--help")) {
                usage();
                return 0;
            } else {
                std::cerr << "unknown option: " << argv[i] << "\n";
                usage();
                return 1;
            }
        }
        if (w.kind != "c" && w.kind != "ms" && w.kind != "g" && w.kind != "gd" && w.kind != "s")
            throw ConfigurationError("unknown metric kind '" + w.kind + "'");

        const SampleRate rate = SampleRate::from_double(w.rate);
        Client client(cfg);
        SampleChannel channel;

        if (w.verbose) {
            std::cout << "[statsd_emit] target=" << cfg.host << ":" << cfg.port
                      << " max_packet=" << cfg.max_packet_size
                      << " rate=" << rate.to_string()
                      << (w.predictive ? " predictive" : "") << "\n";
        }

        for (uint64_t n = 0; n < w.iterations; ++n) emit_one(client, w, rate, channel);
        client.flush();

        if (w.verbose) std::cout << "[statsd_emit] " << client.stats().to_string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "statsd_emit error: " << e.what() << "\n";
        return 1;
    }
}
