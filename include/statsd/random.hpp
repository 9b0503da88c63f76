#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

/**
* @file
* @brief Random sources for sampling decisions (strategy + PCG32 + test double).
*
* This header defines:
*  - @ref statsd::Pcg32 : a small PCG-XSH-RR generator (64-bit state, 32-bit output),
*  - @ref statsd::IRandomSource : the port the @ref Sampler depends on,
*  - @ref statsd::Pcg32Source : the default source, one generator per thread,
*  - @ref statsd::CountingRandomSource : a scripted test double that counts draws.
*
* @note Sampling decisions only need statistical uniformity, not unpredictability;
*       none of these generators are suitable for cryptographic use.
*/

namespace statsd {

/**
* @brief PCG-XSH-RR 32-bit generator.
*
* @details Not thread-safe; @ref Pcg32Source keeps one instance per thread.
*/
class Pcg32 {
public:
    static constexpr uint64_t kMultiplier = 6364136223846793005ull;
    static constexpr uint64_t kIncrement  = 1442695040888963407ull;

    /// @brief Seed deterministically (tests, reproducible benchmarks).
    explicit Pcg32(uint64_t seed) : state_(seed * kMultiplier + kIncrement) {}

    /// @brief Next 32-bit output; advances the state by one LCG step.
    uint32_t next() {
        const uint64_t old = state_;
        state_ = old * kMultiplier + kIncrement;
        const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot = static_cast<uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((32u - rot) & 31u));
    }

private:
    uint64_t state_;
};

/**
* @brief Abstract uniform 32-bit random source (strategy/port).
*
* Implementations must be safe to call from multiple threads at once.
*/
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// @brief Uniformly distributed value over the full 32-bit range.
    virtual uint32_t next_u32() = 0;
};

/**
* @brief Default source: a thread-local @ref Pcg32 per calling thread.
*
* @details Each thread's generator is seeded on first use from a fixed constant
* mixed with the monotonic clock and the thread id, so threads never share
* mutable state and no lock is taken.
*/
class Pcg32Source : public IRandomSource {
public:
    uint32_t next_u32() override;
};

/**
* @brief Scripted test double that counts how many draws were consumed.
*
* @details Returns the preloaded values in order, cycling when exhausted; with no
* script it returns 0 (always below any threshold, i.e. "accept").
* Not thread-safe; intended for single-threaded unit tests.
*/
class CountingRandomSource : public IRandomSource {
public:
    CountingRandomSource() = default;
    explicit CountingRandomSource(std::vector<uint32_t> script) : script_(std::move(script)) {}

    uint32_t next_u32() override {
        ++draws_;
        if (script_.empty()) return 0;
        const uint32_t v = script_[cursor_];
        cursor_ = (cursor_ + 1) % script_.size();
        return v;
    }

    /// @brief Number of times @ref next_u32 has been called.
    std::size_t draws() const { return draws_; }

private:
    std::vector<uint32_t> script_;
    std::size_t cursor_ = 0;
    std::size_t draws_ = 0;
};

} // namespace statsd
