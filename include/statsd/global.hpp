#pragma once
#include <cstdint>
#include <memory>
#include <string_view>
#include "statsd/client.hpp"

/**
* @file
* @brief Process-wide default client and call-site macros.
*
* @details
* A single @ref statsd::Client may be installed for the whole process so that
* call sites can record metrics without threading a client through their code.
* The core never depends on it: every component stays usable as an explicitly
* constructed instance.
*
* Lifecycle:
*  - @ref statsd::global::init installs a client; the first successful call wins
*    and later calls are no-ops returning @c false.
*  - @ref statsd::global::reinit replaces (or clears) the client; meant for tests.
*  - @ref statsd::global::shutdown flushes and drops the client.
*
* Before @c init, and after @c shutdown, every helper and macro is a no-op.
* The helpers never throw a @ref statsd::Error: failures are counted in the
* client's @ref statsd::Stats and reported as @c false.
*
* The helpers make the accept/reject decision with their own thread-local
* sampler before looking up the client, so a sampled-out call never touches
* the shared client pointer. Macro rate arguments must be in (0, 1].
*
* @code
* statsd::ClientConfig cfg;
* cfg.prefix = "api";
* statsd::global::init(cfg);
*
* STATSD_INCREMENT("requests", 0.01);   // 1% of calls, per-call draw
* STATSD_TIMING("latency", ms, 0.001);  // countdown sampling below 1/256
* @endcode
*/

namespace statsd {
namespace global {

/**
* @brief Install the process-wide client built from @p cfg (first call wins).
* @return true if this call installed the client, false if one already existed.
* @throws ConfigurationError if @p cfg is invalid (nothing is installed).
*/
bool init(const ClientConfig& cfg);

/**
* @brief Replace the process-wide client unconditionally.
*
* @details The previous client, if any, is released; it flushes when its last
* user lets go of it. Passing null returns the process to the no-op state.
*/
void reinit(std::shared_ptr<Client> client);

/// @brief Current client, or null if none is installed.
std::shared_ptr<Client> instance();

/**
* @brief Flush and drop the process-wide client.
* @return false if the final flush failed or no client was installed.
*/
bool shutdown();

/// @name Helpers: false when an accepted call found no client or failed.
///@{
bool count(std::string_view name, int64_t value, const SampleRate& rate);
bool count(std::string_view name, int64_t value, const SampleRate& rate, SampleChannel& ch);
bool timing(std::string_view name, int64_t millis, const SampleRate& rate);
bool timing(std::string_view name, int64_t millis, const SampleRate& rate, SampleChannel& ch);
bool gauge(std::string_view name, Gauge g, const SampleRate& rate);
bool gauge(std::string_view name, Gauge g, const SampleRate& rate, SampleChannel& ch);
bool set(std::string_view name, int64_t value, const SampleRate& rate);
bool set(std::string_view name, int64_t value, const SampleRate& rate, SampleChannel& ch);
bool flush();
///@}

/// @cond INTERNAL
namespace detail {

/// Accept/reject with the helpers' thread-local sampler; touches no client.
bool should_sample(const SampleRate& rate, SampleChannel& ch);

/// Record an already-accepted observation through the installed client.
bool deliver(const Observation& obs);

} // namespace detail
/// @endcond

} // namespace global
} // namespace statsd

/// @cond INTERNAL
// Per call site: the rate is converted from its literal once, and the
// countdown channel is keyed by call-site identity. The name and value
// expressions are evaluated only for accepted calls.
#define STATSD_DETAIL_RECORD(kind, delta, name, value, rate)                          \
    do {                                                                              \
        static const ::statsd::SampleRate statsd_site_rate_ =                         \
            ::statsd::SampleRate::from_double(rate);                                  \
        static ::statsd::SampleChannel statsd_site_channel_;                          \
        if (::statsd::global::detail::should_sample(statsd_site_rate_,               \
                                                    statsd_site_channel_))            \
            ::statsd::global::detail::deliver(::statsd::Observation{                 \
                (name), (kind), static_cast<int64_t>(value), (delta), statsd_site_rate_}); \
    } while (0)
/// @endcond

#define STATSD_COUNT(name, value, rate)   STATSD_DETAIL_RECORD(::statsd::MetricKind::Counter, false, name, value, rate)
#define STATSD_INCREMENT(name, rate)      STATSD_DETAIL_RECORD(::statsd::MetricKind::Counter, false, name, 1, rate)
#define STATSD_DECREMENT(name, rate)      STATSD_DETAIL_RECORD(::statsd::MetricKind::Counter, false, name, -1, rate)
#define STATSD_TIMING(name, ms, rate)     STATSD_DETAIL_RECORD(::statsd::MetricKind::Timer, false, name, ms, rate)
#define STATSD_GAUGE(name, value, rate)   STATSD_DETAIL_RECORD(::statsd::MetricKind::Gauge, false, name, value, rate)
#define STATSD_GAUGE_DELTA(name, d, rate) STATSD_DETAIL_RECORD(::statsd::MetricKind::Gauge, true, name, d, rate)
#define STATSD_SET(name, value, rate)     STATSD_DETAIL_RECORD(::statsd::MetricKind::Set, false, name, value, rate)
