/**
* @file
* @brief Sampler construction and countdown (predictive) sampling.
*
* @details Countdown protocol on @ref statsd::SampleChannel::remaining_:
*  - every call does one relaxed `fetch_sub(1)`;
*  - the call that takes the counter from 1 to 0 is accepted;
*  - any call that leaves the counter at or below zero tries to re-arm it with a
*    CAS from the value it left behind. Only the last decrementer can match, so
*    exactly one thread re-arms and the counter never stays stuck below zero.
*/

#include "statsd/sampler.hpp"
#include "statsd/errors.hpp"

namespace statsd {

Sampler::Sampler() : source_(std::make_unique<Pcg32Source>()) {}

Sampler::Sampler(std::unique_ptr<IRandomSource> source) : source_(std::move(source)) {
    if (!source_) throw ConfigurationError("sampler requires a random source");
}

bool Sampler::should_sample(const SampleRate& rate, SampleChannel& channel) const {
    if (rate.is_always()) return true;
    if (rate.threshold() >= kPredictiveRateFloor) return should_sample(rate);

    const int64_t prev = channel.remaining_.fetch_sub(1, std::memory_order_relaxed);
    if (prev > 1) return false;

    int64_t left = prev - 1;
    channel.remaining_.compare_exchange_strong(left, draw_distance(rate.expected_interval()),
                                               std::memory_order_relaxed);
    return prev == 1;
}

int64_t Sampler::draw_distance(uint64_t interval) const {
    const uint64_t lo = interval / 2;
    // Multiply-shift maps the 32-bit draw onto [0, interval] without a modulo.
    const uint64_t span = ((static_cast<uint64_t>(source_->next_u32()) * (interval + 1)) >> 32);
    const uint64_t d = lo + span;
    return static_cast<int64_t>(d == 0 ? 1 : d);
}

} // namespace statsd
