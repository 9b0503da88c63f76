/**
 * @file test_encoder.cpp
 * @brief Unit tests for the statsd line encoder
 */

#include <gtest/gtest.h>
#include <limits>
#include "statsd/encoder.hpp"
#include "statsd/errors.hpp"

namespace statsd {
namespace test {

namespace {

Observation obs(std::string_view name, MetricKind kind, int64_t value,
                SampleRate rate = SampleRate::always(), bool delta = false) {
    return Observation{name, kind, value, delta, rate};
}

} // namespace

TEST(EncoderTest, CounterWithoutRate) {
    EXPECT_EQ(encode(obs("name", MetricKind::Counter, 5)), "name:5|c");
}

TEST(EncoderTest, CounterWithRate) {
    EXPECT_EQ(encode(obs("name", MetricKind::Counter, 5, SampleRate(1, 10))), "name:5|c|@0.1");
    EXPECT_EQ(encode(obs("name", MetricKind::Counter, 5, SampleRate::from_double(0.01))),
              "name:5|c|@0.01");
}

TEST(EncoderTest, NegativeCounter) {
    EXPECT_EQ(encode(obs("queue.depth", MetricKind::Counter, -7)), "queue.depth:-7|c");
}

TEST(EncoderTest, Timer) {
    EXPECT_EQ(encode(obs("db.query", MetricKind::Timer, 250)), "db.query:250|ms");
    EXPECT_EQ(encode(obs("db.query", MetricKind::Timer, 0, SampleRate(1, 4))), "db.query:0|ms|@0.25");
}

TEST(EncoderTest, NegativeTimerIsRejected) {
    std::string out;
    EXPECT_THROW(encode(obs("t", MetricKind::Timer, -1), out), EncodingError);
    EXPECT_TRUE(out.empty());
}

TEST(EncoderTest, GaugeAbsoluteAndDelta) {
    EXPECT_EQ(encode(obs("pool.size", MetricKind::Gauge, 42)), "pool.size:42|g");
    EXPECT_EQ(encode(obs("pool.size", MetricKind::Gauge, 3, SampleRate(), true)), "pool.size:+3|g");
    EXPECT_EQ(encode(obs("pool.size", MetricKind::Gauge, -3, SampleRate(), true)), "pool.size:-3|g");
    EXPECT_EQ(encode(obs("pool.size", MetricKind::Gauge, 0, SampleRate(), true)), "pool.size:+0|g");
    EXPECT_EQ(encode(obs("pool.size", MetricKind::Gauge, 0)), "pool.size:0|g");
}

TEST(EncoderTest, NegativeAbsoluteGaugeIsRejected) {
    EXPECT_THROW(encode(obs("g", MetricKind::Gauge, -1)), EncodingError);
}

TEST(EncoderTest, Set) {
    EXPECT_EQ(encode(obs("users.unique", MetricKind::Set, 1234)), "users.unique:1234|s");
}

TEST(EncoderTest, ExtremeValuesAreIntegers) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(encode(obs("c", MetricKind::Counter, max)), "c:9223372036854775807|c");
    EXPECT_EQ(encode(obs("c", MetricKind::Counter, min)), "c:-9223372036854775808|c");
}

TEST(EncoderTest, ReservedCharactersAreRejectedWithoutPartialWrite) {
    for (const char* bad : {"bad:name", "bad|name", "bad@name", "bad\nname", ""}) {
        std::string out = "previous";
        EXPECT_THROW(encode(obs(bad, MetricKind::Counter, 1), out, "prefix."), EncodingError) << bad;
        EXPECT_EQ(out, "previous");
    }
}

TEST(EncoderTest, ValidateNameAcceptsOrdinaryNames) {
    EXPECT_NO_THROW(validate_name("api.requests.2xx"));
    EXPECT_NO_THROW(validate_name("a-b_c"));
    EXPECT_THROW(validate_name("a:b"), EncodingError);
}

TEST(EncoderTest, PrefixAndAppend) {
    std::string out = "x:1|c";
    out.push_back('\n');
    encode(obs("hits", MetricKind::Counter, 1), out, "api.");
    EXPECT_EQ(out, "x:1|c\napi.hits:1|c");
}

TEST(EncoderTest, TypeSuffixes) {
    EXPECT_STREQ(type_suffix(MetricKind::Counter), "c");
    EXPECT_STREQ(type_suffix(MetricKind::Timer), "ms");
    EXPECT_STREQ(type_suffix(MetricKind::Gauge), "g");
    EXPECT_STREQ(type_suffix(MetricKind::Set), "s");
}

} // namespace test
} // namespace statsd
