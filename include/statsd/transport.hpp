#pragma once
#include <memory>
#include <string>
#include <string_view>
#include "statsd/socket.hpp"
#include "statsd/stats.hpp"

/**
* @file
* @brief Fire-and-forget datagram transport for assembled packets.
*
* @details The transport owns the socket exclusively. A failed send is reported
* once, as a @ref statsd::SendError, and the packet is dropped: a retried stale
* sample is worse than a lost one, so there is no queue, no retry and no
* timeout.
*/

namespace statsd {

/**
* @brief Connected UDP sender owning one @ref ISocket.
*
* @details Construction resolves and connects the destination, so a bad host
* fails at startup rather than on the first send. @ref send is not internally
* synchronized; the client calls it with its own lock held.
*/
class Transport {
public:
    /**
     * @brief Take ownership of @p sock and connect it to @p host:@p port.
     *
     * @param sock         Concrete @ref ISocket (e.g., @ref UdpSocket or @ref MockSocket).
     * @param host         Destination host name or dotted IPv4 address.
     * @param port         Destination UDP port.
     * @param sndbuf_bytes Requested @c SO_SNDBUF, 0 to keep the OS default.
     *
     * @throws ConfigurationError if @p sock is null or the destination is unusable.
     */
    Transport(std::unique_ptr<ISocket> sock, const std::string& host, uint16_t port,
              int sndbuf_bytes = 0);

    /**
     * @brief Send @p packet as one datagram.
     *
     * @details Empty packets are ignored. Success and failure are both
     * recorded in @p stats when supplied.
     *
     * @throws SendError carrying @c errno when the OS does not take the datagram
     *         (including @c EAGAIN on a full socket buffer).
     */
    void send(std::string_view packet, Stats* stats = nullptr);

    /// @brief The owned socket, for diagnostics and tests.
    const ISocket& socket() const { return *sock_; }

private:
    std::unique_ptr<ISocket> sock_;
};

} // namespace statsd
