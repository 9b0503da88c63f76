/**
* @file
* @brief Thread-local PCG32 source used by the default sampler.
*/

#include "statsd/random.hpp"
#include "statsd/common.hpp"
#include <functional>
#include <thread>

namespace statsd {

namespace {

uint64_t thread_seed() {
    uint64_t seed = 5573589319906701683ull;
    seed = seed * Pcg32::kMultiplier + Pcg32::kIncrement + now_ns();
    seed ^= static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id())) << 1;
    return seed * Pcg32::kMultiplier + Pcg32::kIncrement;
}

} // namespace

uint32_t Pcg32Source::next_u32() {
    thread_local Pcg32 gen(thread_seed());
    return gen.next();
}

} // namespace statsd
