#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include "statsd/random.hpp"
#include "statsd/sample_rate.hpp"

/**
* @file
* @brief Accept/reject decision for sampled metric calls.
*
* @par Hot path
* @ref statsd::Sampler::should_sample is the only code a sampled-out call runs:
* one branch for the always rate, otherwise one draw and one unsigned compare.
* No allocation, no locks, no floating point.
*
* @par Predictive subsampling
* For rates below @ref statsd::kPredictiveRateFloor the per-call draw is
* replaced by a countdown kept in a caller-owned @ref statsd::SampleChannel:
* one draw picks the distance to the next accepted call (uniform in
* `[N/2, 3N/2]` for a 1-in-N rate) and every other call is a single atomic
* decrement.
*/

namespace statsd {

/// Rates strictly below 1/256 switch to countdown sampling when a channel is supplied.
static constexpr uint32_t kPredictiveRateFloor = 1u << 24;

/**
* @brief Countdown state for one logical stream of calls (typically one call site).
*
* @details A fresh channel is unarmed; its first call draws a distance and is
* rejected. Channels are independent, so a hot and a cold call site sharing
* a rate neither starve nor cluster each other. Safe to share between threads.
*/
class SampleChannel {
public:
    SampleChannel() = default;
    SampleChannel(const SampleChannel&) = delete;
    SampleChannel& operator=(const SampleChannel&) = delete;

    /// @brief Calls left before the next accepted one (<= 0 while unarmed or re-arming).
    int64_t remaining() const { return remaining_.load(std::memory_order_relaxed); }

private:
    friend class Sampler;
    std::atomic<int64_t> remaining_{0};
};

/**
* @brief Pure sampling policy over an injected @ref IRandomSource.
*
* @details Holds no mutable state of its own; thread-safety is that of the
* random source (the default @ref Pcg32Source is per-thread).
*/
class Sampler {
public:
    /// @brief Sampler over the default thread-local PCG32 source.
    Sampler();

    /**
    * @brief Sampler over an injected source (ownership transferred).
    * @throws ConfigurationError if @p source is null.
    */
    explicit Sampler(std::unique_ptr<IRandomSource> source);

    /**
    * @brief Decide whether the current call is recorded.
    *
    * @return true unconditionally (and without a draw) for the always rate;
    *         otherwise true with probability @p rate.
    */
    bool should_sample(const SampleRate& rate) const {
        if (rate.is_always()) return true;
        return source_->next_u32() < rate.threshold();
    }

    /**
    * @brief Decide using the countdown in @p channel for very low rates.
    *
    * @details Rates at or above 1/256 ignore the channel and behave like
    * @ref should_sample(const SampleRate&) const.
    */
    bool should_sample(const SampleRate& rate, SampleChannel& channel) const;

    /**
    * @brief Draw the distance to the next accepted call for a 1-in-@p interval rate.
    * @return A value in `[max(1, interval/2), interval/2 + interval]`.
    */
    int64_t draw_distance(uint64_t interval) const;

private:
    std::unique_ptr<IRandomSource> source_;
};

} // namespace statsd
