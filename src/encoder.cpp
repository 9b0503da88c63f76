/**
* @file
* @brief Statsd line encoder.
*
* @details All validation happens before the first byte is appended, so a
* failing call never leaves a partial line in the caller's buffer.
*/

#include "statsd/encoder.hpp"
#include "statsd/errors.hpp"
#include <charconv>

namespace statsd {

namespace {

void append_int(std::string& out, int64_t v) {
    char buf[24];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    out.append(buf, res.ptr);
}

} // namespace

void validate_name(std::string_view name) {
    if (name.empty()) throw EncodingError("metric name is empty");
    const auto pos = name.find_first_of(std::string_view(kReservedChars));
    if (pos != std::string_view::npos)
        throw EncodingError("metric name '" + std::string(name) +
                            "' contains reserved character at offset " + std::to_string(pos));
}

void encode(const Observation& obs, std::string& out, std::string_view prefix) {
    validate_name(obs.name);
    if (obs.kind == MetricKind::Timer && obs.value < 0)
        throw EncodingError("timer '" + std::string(obs.name) + "' has a negative duration");
    if (obs.kind == MetricKind::Gauge && !obs.gauge_delta && obs.value < 0)
        throw EncodingError("absolute gauge '" + std::string(obs.name) +
                            "' is negative; use a delta instead");

    out.append(prefix);
    out.append(obs.name);
    out.push_back(':');
    if (obs.kind == MetricKind::Gauge && obs.gauge_delta && obs.value >= 0)
        out.push_back('+');
    append_int(out, obs.value);
    out.push_back('|');
    out.append(type_suffix(obs.kind));
    if (!obs.rate.is_always()) {
        out.append("|@");
        obs.rate.append_decimal(out);
    }
}

std::string encode(const Observation& obs) {
    std::string out;
    encode(obs, out);
    return out;
}

} // namespace statsd
