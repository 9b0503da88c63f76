#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "statsd/common.hpp"
#include "statsd/sample_rate.hpp"

/**
* @file
* @brief Rendering of one observation into the statsd text format.
*
* Wire format per metric: `<name>:<value>|<type>[|@<rate>]`. The rate suffix is
* emitted only for rates below one. Values are always integers, so no float
* formatting happens; the rate is the only decimal and it is rendered by
* @ref statsd::SampleRate::append_decimal with integer arithmetic.
*/

namespace statsd {

/**
* @brief One metric call, consumed immediately by the encoder.
*
* @details The name is a view into caller storage and must outlive the
* @ref encode call. For gauges, @ref gauge_delta selects the signed-delta form.
*/
struct Observation {
    std::string_view name;
    MetricKind       kind        = MetricKind::Counter;
    int64_t          value       = 0;
    bool             gauge_delta = false;
    SampleRate       rate;
};

/**
* @brief Reject names that would corrupt the line framing.
* @throws EncodingError if @p name is empty or contains `:`, `|`, `@` or `\n`.
*/
void validate_name(std::string_view name);

/**
* @brief Append the wire form of @p obs to @p out (no trailing newline).
*
* @param obs    Observation to render.
* @param out    Destination; existing content is kept.
* @param prefix Optional name prefix written verbatim before the name
*               (already validated and `.`-terminated by the client config).
*
* @throws EncodingError for an invalid name, a negative timer or a negative
*         absolute gauge. On error @p out is left exactly as it was.
*/
void encode(const Observation& obs, std::string& out, std::string_view prefix = {});

/// @brief Convenience form returning a fresh string.
std::string encode(const Observation& obs);

} // namespace statsd
