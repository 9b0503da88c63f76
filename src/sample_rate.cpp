/**
* @file
* @brief SampleRate construction, reduction and decimal rendering.
*/

#include "statsd/sample_rate.hpp"
#include "statsd/errors.hpp"
#include <cmath>
#include <numeric>

namespace statsd {

namespace {

constexpr uint32_t kDoubleScale = 1'000'000;
constexpr int kSignificantDigits = 6;

} // namespace

SampleRate::SampleRate(uint32_t numerator, uint32_t denominator) {
    if (denominator == 0)
        throw ConfigurationError("sample rate denominator must be positive");
    if (numerator == 0)
        throw ConfigurationError("sample rate must be greater than zero");
    if (numerator > denominator)
        throw ConfigurationError("sample rate must not exceed 1");

    const uint32_t g = std::gcd(numerator, denominator);
    num_ = numerator / g;
    den_ = denominator / g;
    threshold_ = is_always()
        ? UINT32_MAX
        : static_cast<uint32_t>((static_cast<uint64_t>(num_) << 32) / den_);
}

SampleRate SampleRate::one_in(uint32_t n) {
    if (n == 0) throw ConfigurationError("1-in-N sample rate needs N >= 1");
    return SampleRate(1, n);
}

SampleRate SampleRate::from_double(double r) {
    if (!std::isfinite(r) || r <= 0.0 || r > 1.0)
        throw ConfigurationError("sample rate must be in (0, 1]");
    const auto scaled = static_cast<uint32_t>(std::llround(r * kDoubleScale));
    if (scaled == 0)
        throw ConfigurationError("sample rate is below the representable minimum of 1e-6");
    return SampleRate(scaled, kDoubleScale);
}

void SampleRate::append_decimal(std::string& out) const {
    if (is_always()) {
        out.push_back('1');
        return;
    }
    out.append("0.");
    const std::size_t start = out.size();

    // Long division of num_/den_; leading zeros do not count as significant.
    uint64_t rem = num_;
    int significant = 0;
    while (rem != 0 && significant < kSignificantDigits) {
        rem *= 10;
        const auto digit = static_cast<char>('0' + rem / den_);
        rem %= den_;
        out.push_back(digit);
        if (significant > 0 || digit != '0') ++significant;
    }
    while (out.size() > start && out.back() == '0') out.pop_back();
}

std::string SampleRate::to_string() const {
    std::string s;
    append_decimal(s);
    return s;
}

} // namespace statsd
