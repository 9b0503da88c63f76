#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include "statsd/common.hpp"
#include "statsd/sample_rate.hpp"

/**
* @file
* @brief Construction inputs for @ref statsd::Client.
*/

namespace statsd {

/**
* @brief Runtime configuration for @ref Client.
*
* @details
* - @ref host            : Destination host name or dotted IPv4 address.
* - @ref port            : Destination UDP port (host order).
* - @ref max_packet_size : Upper bound for one datagram payload (bytes).
* - @ref default_rate    : Rate used by recording calls that do not pass one.
* - @ref prefix          : Prepended to every metric name; a `.` is added if missing.
* - @ref sndbuf_bytes    : Requested @c SO_SNDBUF, 0 to keep the OS default.
*
* The client keeps an immutable copy; changing a config after construction has
* no effect on an existing client.
*/
struct ClientConfig {
    std::string host            = "127.0.0.1";           ///< Destination host.
    uint16_t    port            = kDefaultPort;          ///< Destination UDP port.
    std::size_t max_packet_size = kDefaultMaxPacketSize; ///< Datagram payload limit.
    SampleRate  default_rate;                            ///< Rate for rate-less calls.
    std::string prefix;                                  ///< Optional metric name prefix.
    int         sndbuf_bytes    = 0;                     ///< SO_SNDBUF hint (0 = OS default).

    /**
    * @brief Check every field that can be checked without touching the network.
    * @throws ConfigurationError on empty host, port 0, a max packet size of 0
    *         or above @ref kMaxUdpPayload, or a prefix containing a reserved
    *         delimiter.
    */
    void validate() const;

    /**
    * @brief The prefix as written on the wire: empty, or ending with exactly one `.`.
    */
    std::string wire_prefix() const;
};

/**
* @brief Split `host:port` into its parts.
* @throws ConfigurationError if the separator is missing, the host is empty or
*         the port is not an integer in [1, 65535].
*/
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint);

} // namespace statsd
