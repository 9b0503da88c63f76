/**
* @file
* @brief ClientConfig validation and endpoint parsing.
*/

#include "statsd/config.hpp"
#include "statsd/errors.hpp"
#include <charconv>
#include <string_view>

namespace statsd {

void ClientConfig::validate() const {
    if (host.empty()) throw ConfigurationError("statsd host is empty");
    if (port == 0) throw ConfigurationError("statsd port must be in [1, 65535]");
    if (max_packet_size == 0) throw ConfigurationError("max packet size must be positive");
    if (max_packet_size > kMaxUdpPayload)
        throw ConfigurationError("max packet size " + std::to_string(max_packet_size) +
                                 " exceeds the largest UDP payload (" +
                                 std::to_string(kMaxUdpPayload) + ")");
    if (prefix.find_first_of(kReservedChars) != std::string::npos)
        throw ConfigurationError("metric prefix '" + prefix + "' contains a reserved character");
}

std::string ClientConfig::wire_prefix() const {
    if (prefix.empty() || prefix.back() == '.') return prefix;
    return prefix + '.';
}

std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint) {
    const auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size())
        throw ConfigurationError("endpoint '" + endpoint + "' is not of the form host:port");

    std::string_view digits(endpoint);
    digits.remove_prefix(colon + 1);
    unsigned long port = 0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (res.ec != std::errc() || res.ptr != digits.data() + digits.size() || port == 0 || port > 65535)
        throw ConfigurationError("endpoint '" + endpoint + "' has an invalid port");
    return {endpoint.substr(0, colon), static_cast<uint16_t>(port)};
}

} // namespace statsd
