#pragma once
#include <stdexcept>
#include <string>

/**
* @file
* @brief Exception taxonomy reported by the statsd client.
*
* Sampler rejections are not errors and never surface here. Everything else is
* reported synchronously to the immediate caller; the library never retries,
* logs, or aborts on its own.
*/

namespace statsd {

/// @brief Common base so call sites can catch every library failure at once.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
* @brief A metric could not be rendered into the wire format.
*
* Thrown for names containing `:`, `|`, `@` or a newline, empty names,
* negative timers and negative absolute gauges. Nothing is written to any
* buffer when this is thrown.
*/
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& what) : Error(what) {}
};

/**
* @brief Invalid construction input (address, packet size, prefix, sample rate).
*
* Raised before any recording call is possible.
*/
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

/**
* @brief The OS refused to take a datagram.
*
* Carries the @c errno observed on the failed send. The packet is dropped,
* never queued for retry.
*/
class SendError : public Error {
public:
    SendError(const std::string& what, int code) : Error(what), code_(code) {}

    /// @brief The @c errno value reported by the failed send.
    int code() const noexcept { return code_; }

private:
    int code_;
};

} // namespace statsd
