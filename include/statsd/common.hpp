#pragma once
#include <cstdint>
#include <cstddef>
#include <chrono>

/**
* @file
* @brief Wire-level metric kinds and tiny shared utilities.
*
* This header defines:
*  - @ref statsd::MetricKind and its wire type suffix (@ref statsd::type_suffix),
*  - @ref statsd::Gauge, the absolute-or-delta gauge value,
*  - the protocol limits shared by the encoder and assembler,
*  - a monotonic nanosecond timestamp provider (@ref statsd::now_ns).
*/

namespace statsd {

/// @brief Statsd metric type; selects the `|<type>` suffix and the legal value domain.
enum class MetricKind : uint8_t {
    Counter, ///< `c`, any signed integer.
    Timer,   ///< `ms`, non-negative milliseconds.
    Gauge,   ///< `g`, non-negative absolute value or signed delta.
    Set      ///< `s`, unique-value set member.
};

/**
* @brief Wire suffix for a metric kind, without the leading `|`.
* @return One of "c", "ms", "g", "s".
*/
inline const char* type_suffix(MetricKind kind) {
    switch (kind) {
    case MetricKind::Counter: return "c";
    case MetricKind::Timer:   return "ms";
    case MetricKind::Gauge:   return "g";
    case MetricKind::Set:     return "s";
    }
    return "c";
}

/**
* @brief Gauge observation in one of the two statsd forms.
*
* An absolute gauge is written as `<value>`; a delta is always written with an
* explicit sign (`+3`, `-3`) so the server applies it relative to the current
* value. The encoder keeps whichever form the caller chose.
*/
struct Gauge {
    int64_t value = 0;  ///< Absolute value or signed delta.
    bool    delta = false; ///< True for the `+n`/`-n` form.

    /// @brief Absolute gauge; must be non-negative to be encodable.
    static Gauge set(int64_t v) { return Gauge{v, false}; }

    /// @brief Relative adjustment, rendered with an explicit sign.
    static Gauge adjust(int64_t d) { return Gauge{d, true}; }
};

/// Characters that would corrupt the line framing if they appeared in a name.
static constexpr const char kReservedChars[] = ":|@\n";

/// Conservative UDP payload that fits an Ethernet MTU after IP/UDP headers.
static constexpr std::size_t kDefaultMaxPacketSize = 1432;

/// Largest IPv4 UDP payload (65535 - 20 byte IP header - 8 byte UDP header).
static constexpr std::size_t kMaxUdpPayload = 65507;

/// Default statsd daemon port.
static constexpr uint16_t kDefaultPort = 8125;

/**
* @brief Returns a monotonic timestamp in nanoseconds.
*
* @details Uses @c std::chrono::steady_clock so it will not jump backwards if
*          the system wall clock is adjusted. Only differences are meaningful;
*          the random source also folds it into its per-thread seed.
*/
inline uint64_t now_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace statsd
