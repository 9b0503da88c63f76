/**
* @file
* @brief Client implementation: encode outside the lock, batch and send inside it.
*
* @details
* Responsibilities:
*  - Validate the configuration and connect the transport once, at construction.
*  - Encode accepted observations into a thread-local scratch line.
*  - Append under @ref statsd::Client::mu_ and send every packet the assembler
*    releases before the lock is dropped, so packets leave in buffer order.
*
* Failure model:
*  - Encoding errors are thrown before the lock is taken; nothing is buffered.
*  - Send errors are thrown after the triggering line is safely buffered; the
*    failed packet is dropped, never retried.
*/

#include "statsd/client.hpp"
#include "statsd/errors.hpp"
#include <optional>

namespace statsd {

namespace {

const ClientConfig& validated(const ClientConfig& cfg) {
    cfg.validate();
    return cfg;
}

} // namespace

Client::Client(ClientConfig cfg)
    : Client(std::make_unique<UdpSocket>(), std::move(cfg), std::make_unique<Pcg32Source>()) {}

Client::Client(std::unique_ptr<ISocket> sock, ClientConfig cfg)
    : Client(std::move(sock), std::move(cfg), std::make_unique<Pcg32Source>()) {}

Client::Client(std::unique_ptr<ISocket> sock, ClientConfig cfg, std::unique_ptr<IRandomSource> rng)
    : cfg_(validated(cfg)),
      prefix_(cfg_.wire_prefix()),
      sampler_(std::move(rng)),
      assembler_(cfg_.max_packet_size),
      transport_(std::move(sock), cfg_.host, cfg_.port, cfg_.sndbuf_bytes) {}

Client::~Client() {
    try {
        flush();
    } catch (const SendError&) {
        // Already counted in stats_.send_errors by the transport.
    }
}

void Client::record(const Observation& obs) {
    thread_local std::string line;
    line.clear();
    try {
        encode(obs, line, prefix_);
    } catch (const EncodingError&) {
        stats_.inc_encode_errors();
        throw;
    }
    stats_.inc_recorded();

    std::lock_guard<std::mutex> lg(mu_);
    const AppendResult res = assembler_.append(line);

    // Attempt every released packet even if an earlier one fails.
    std::optional<SendError> failure;
    for (std::size_t i = 0; i < res.count; ++i) {
        try {
            transport_.send(res.packets[i], &stats_);
        } catch (const SendError& e) {
            if (!failure) failure = e;
        }
    }
    if (failure) throw *failure;
}

void Client::flush() {
    std::lock_guard<std::mutex> lg(mu_);
    if (auto packet = assembler_.flush()) transport_.send(*packet, &stats_);
}

std::size_t Client::pending_bytes() const {
    std::lock_guard<std::mutex> lg(mu_);
    return assembler_.size();
}

} // namespace statsd
