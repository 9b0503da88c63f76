/**
* @file
* @brief Transport: connect once, then one non-blocking send per packet.
*/

#include "statsd/transport.hpp"
#include "statsd/errors.hpp"
#include <cerrno>
#include <cstring>

namespace statsd {

Transport::Transport(std::unique_ptr<ISocket> sock, const std::string& host, uint16_t port,
                     int sndbuf_bytes)
    : sock_(std::move(sock)) {
    if (!sock_) throw ConfigurationError("transport requires a socket");
    sock_->connect(host, port);
    if (sndbuf_bytes > 0) sock_->set_sndbuf(sndbuf_bytes);
}

void Transport::send(std::string_view packet, Stats* stats) {
    if (packet.empty()) return;

    const ssize_t r = sock_->send(packet.data(), packet.size());
    if (r < 0 || static_cast<std::size_t>(r) != packet.size()) {
        const int err = r < 0 ? errno : EMSGSIZE;
        if (stats) stats->inc_send_errors();
        throw SendError("statsd send failed: " + std::string(strerror(err)), err);
    }
    if (stats) {
        stats->inc_packets(1);
        stats->add_tx_bytes(packet.size());
    }
}

} // namespace statsd
