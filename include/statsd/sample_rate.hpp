#pragma once
#include <cstdint>
#include <string>

/**
* @file
* @brief Integer-only sampling rate in (0, 1].
*
* A @ref statsd::SampleRate stores a reduced fraction plus a precomputed 32-bit
* acceptance threshold, so the accept/reject decision is a single unsigned
* comparison against a random draw. Decimal text for the `|@<rate>` suffix is
* produced by integer long division and only on the already-accepted path.
*/

namespace statsd {

/**
* @brief Immutable sampling probability used to accept or reject a call.
*
* @details A call is accepted iff a uniform 32-bit draw is below
* @ref threshold. The "always" rate is recognised first and never consumes a
* draw. Values are cheap to copy and safe to share between threads.
*/
class SampleRate {
public:
    /// @brief Rate 1: every call is recorded and no random draw happens.
    SampleRate() = default;

    /**
    * @brief Fraction @p numerator / @p denominator, reduced by their gcd.
    * @throws ConfigurationError if the denominator is 0, the numerator is 0,
    *         or the fraction exceeds 1.
    */
    SampleRate(uint32_t numerator, uint32_t denominator);

    /// @brief The "always" rate.
    static SampleRate always() { return SampleRate(); }

    /**
    * @brief Accept one call out of every @p n.
    * @throws ConfigurationError if @p n is 0.
    */
    static SampleRate one_in(uint32_t n);

    /**
    * @brief Convert a floating-point rate, for configuration input only.
    *
    * @details The value is quantized to millionths and reduced, so `0.1`
    * becomes `1/10` and `0.25` becomes `1/4`.
    * @throws ConfigurationError if @p r is not finite, not positive, greater
    *         than 1, or rounds to zero.
    */
    static SampleRate from_double(double r);

    bool is_always() const { return num_ == den_; }

    uint32_t numerator() const { return num_; }
    uint32_t denominator() const { return den_; }

    /**
    * @brief Acceptance threshold over the full 32-bit draw range.
    *
    * A draw @c d is accepted iff `d < threshold()`; only meaningful when
    * @ref is_always() is false.
    */
    uint32_t threshold() const { return threshold_; }

    /// @brief N in "1-in-N": the average number of calls per accepted sample.
    uint64_t expected_interval() const { return den_ / num_; }

    /**
    * @brief Append the rate as decimal text (e.g. `0.1`, `0.333333`).
    *
    * @details At most six significant digits, trailing zeros trimmed, and
    * always a leading `0.` for rates below one; `1` for the always rate.
    */
    void append_decimal(std::string& out) const;

    /// @brief Convenience wrapper around @ref append_decimal.
    std::string to_string() const;

    bool operator==(const SampleRate& o) const { return num_ == o.num_ && den_ == o.den_; }
    bool operator!=(const SampleRate& o) const { return !(*this == o); }

private:
    uint32_t num_ = 1;
    uint32_t den_ = 1;
    uint32_t threshold_ = UINT32_MAX;
};

} // namespace statsd
