/**
 * @file test_client.cpp
 * @brief Tests for Client: sampling, encoding, batching and send failures end to end
 */

#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "statsd/client.hpp"
#include "statsd/errors.hpp"
#include "test_helpers.hpp"

namespace statsd {
namespace test {

/**
 * @brief Fixture building a client over a shared MockSocket and a scripted
 *        random source, so both stay observable.
 */
class ClientTest : public ::testing::Test {
protected:
    std::unique_ptr<Client> make(ClientConfig cfg, std::vector<uint32_t> script = {}) {
        auto rng = std::make_unique<CountingRandomSource>(std::move(script));
        rng_ = rng.get();
        return std::make_unique<Client>(std::make_unique<ForwardingSocket>(mock_), std::move(cfg),
                                        std::move(rng));
    }

    std::shared_ptr<MockSocket> mock_ = std::make_shared<MockSocket>();
    CountingRandomSource* rng_ = nullptr;
};

TEST_F(ClientTest, AlwaysRateRecordsWithoutDrawing) {
    auto client = make(ClientConfig{});
    client->count("a", 1, SampleRate::always());
    client->flush();

    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0], "a:1|c\n");
    EXPECT_EQ(rng_->draws(), 0u);
    EXPECT_EQ(client->stats().recorded(), 1u);
}

TEST_F(ClientTest, OverflowScenarioWithSmallPackets) {
    ClientConfig cfg;
    cfg.max_packet_size = 40;
    auto client = make(cfg);
    const std::string big(34, 'b');

    client->count("a", 1, SampleRate::always());
    EXPECT_EQ(mock_->sent_count(), 0u);

    client->count(big, 1, SampleRate::always());
    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0], "a:1|c\n");
    EXPECT_EQ(client->pending_bytes(), big.size() + 5);

    client->flush();
    ASSERT_EQ(mock_->sent_count(), 2u);
    EXPECT_EQ(mock_->sent()[1], big + ":1|c\n");
}

TEST_F(ClientTest, FlushWithNothingBufferedSendsNothing) {
    auto client = make(ClientConfig{});
    client->flush();
    client->flush();
    EXPECT_EQ(mock_->send_calls(), 0u);
}

TEST_F(ClientTest, SampledOutCallLeavesNoTrace) {
    auto client = make(ClientConfig{}, {UINT32_MAX});
    client->count("hits", 1, SampleRate(1, 2));
    client->timing("lat", 5, SampleRate(1, 2));

    EXPECT_EQ(client->pending_bytes(), 0u);
    EXPECT_EQ(client->stats().recorded(), 0u);
    EXPECT_EQ(rng_->draws(), 2u);
    client->flush();
    EXPECT_EQ(mock_->send_calls(), 0u);
}

TEST_F(ClientTest, AcceptedCallCarriesRate) {
    auto client = make(ClientConfig{}, {0});
    client->count("hits", 1, SampleRate::from_double(0.1));
    client->flush();
    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0], "hits:1|c|@0.1\n");
}

TEST_F(ClientTest, DefaultRateAppliesToRateLessCalls) {
    ClientConfig cfg;
    cfg.default_rate = SampleRate(1, 10);
    auto client = make(cfg, {0});
    client->increment("x");
    client->flush();
    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0], "x:1|c|@0.1\n");
    EXPECT_EQ(rng_->draws(), 1u);
}

TEST_F(ClientTest, PrefixGetsSeparator) {
    ClientConfig cfg;
    cfg.prefix = "api";
    auto client = make(cfg);
    client->increment("hits");
    cfg.prefix = "web.";
    auto other = make(cfg);
    other->increment("hits");
    client->flush();
    other->flush();

    ASSERT_EQ(mock_->sent_count(), 2u);
    EXPECT_EQ(mock_->sent()[0], "api.hits:1|c\n");
    EXPECT_EQ(mock_->sent()[1], "web.hits:1|c\n");
}

TEST_F(ClientTest, AllKindsBatchIntoOnePacket) {
    auto client = make(ClientConfig{});
    client->increment("req");
    client->decrement("conn");
    client->timing("lat", std::chrono::milliseconds(12));
    client->timing("db", 3);
    client->gauge("pool", Gauge::set(10));
    client->gauge("pool", Gauge::adjust(-2));
    client->gauge("pool", Gauge::adjust(4));
    client->set("users", 99);
    client->flush();

    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0],
              "req:1|c\nconn:-1|c\nlat:12|ms\ndb:3|ms\npool:10|g\npool:-2|g\npool:+4|g\nusers:99|s\n");
}

TEST_F(ClientTest, EncodingErrorRecordsNothing) {
    auto client = make(ClientConfig{});
    client->increment("ok");
    const std::size_t before = client->pending_bytes();

    EXPECT_THROW(client->count("bad:name", 1, SampleRate::always()), EncodingError);
    EXPECT_THROW(client->timing("neg", -5), EncodingError);
    EXPECT_THROW(client->gauge("neg", Gauge::set(-1)), EncodingError);

    EXPECT_EQ(client->pending_bytes(), before);
    EXPECT_EQ(client->stats().encode_errors(), 3u);
    EXPECT_EQ(client->stats().recorded(), 1u);
}

TEST_F(ClientTest, SendErrorKeepsTriggeringLine) {
    ClientConfig cfg;
    cfg.max_packet_size = 12;
    auto client = make(cfg);
    client->increment("a");
    client->increment("b");

    mock_->fail_next(ENOBUFS);
    try {
        client->increment("c");
        FAIL() << "expected SendError";
    } catch (const SendError& e) {
        EXPECT_EQ(e.code(), ENOBUFS);
    }
    EXPECT_EQ(client->stats().send_errors(), 1u);
    EXPECT_EQ(client->pending_bytes(), 6u);

    client->flush();
    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0], "c:1|c\n");
}

TEST_F(ClientTest, FlushReportsSendError) {
    auto client = make(ClientConfig{});
    client->increment("a");
    mock_->fail_next(ECONNREFUSED);
    EXPECT_THROW(client->flush(), SendError);
    EXPECT_EQ(client->pending_bytes(), 0u);
}

TEST_F(ClientTest, DestructorFlushes) {
    {
        auto client = make(ClientConfig{});
        client->increment("bye");
    }
    ASSERT_EQ(mock_->sent_count(), 1u);
    EXPECT_EQ(mock_->sent()[0], "bye:1|c\n");
}

TEST_F(ClientTest, DestructorDoesNotThrowOnSendFailure) {
    auto client = make(ClientConfig{});
    client->increment("bye");
    mock_->fail_next(ENETUNREACH);
    EXPECT_NO_THROW(client.reset());
}

TEST_F(ClientTest, InvalidConfigurationFailsFast) {
    ClientConfig cfg;
    cfg.port = 0;
    EXPECT_THROW(make(cfg), ConfigurationError);

    cfg = ClientConfig{};
    cfg.max_packet_size = 0;
    EXPECT_THROW(make(cfg), ConfigurationError);

    cfg = ClientConfig{};
    cfg.max_packet_size = kMaxUdpPayload + 1;
    EXPECT_THROW(make(cfg), ConfigurationError);

    cfg = ClientConfig{};
    cfg.host.clear();
    EXPECT_THROW(make(cfg), ConfigurationError);

    cfg = ClientConfig{};
    cfg.prefix = "bad|prefix";
    EXPECT_THROW(make(cfg), ConfigurationError);

    mock_->reject_connect();
    EXPECT_THROW(make(ClientConfig{}), ConfigurationError);
}

TEST_F(ClientTest, MissingRandomSourceIsAConfigurationError) {
    EXPECT_THROW(Client(std::make_unique<ForwardingSocket>(mock_), ClientConfig{},
                        std::unique_ptr<IRandomSource>{}),
                 ConfigurationError);
}

TEST_F(ClientTest, ChannelOverloadUsesCountdown) {
    auto client = make(ClientConfig{}, {0x80000000u});
    SampleChannel ch;
    for (int i = 0; i < 10000; ++i) client->count("rare", 1, SampleRate::one_in(1000), ch);
    client->flush();

    const auto lines = split_lines(mock_->sent());
    ASSERT_EQ(lines.size(), 9u);
    for (const auto& l : lines) EXPECT_EQ(l, "rare:1|c|@0.001");
    EXPECT_EQ(rng_->draws(), 10u);
}

TEST(ClientConcurrencyTest, LinesNeverInterleave) {
    auto mock = std::make_shared<MockSocket>();
    ClientConfig cfg;
    cfg.max_packet_size = 100;
    Client client(std::make_unique<ForwardingSocket>(mock), cfg);

    const int threads = 8, per_thread = 2000;
    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&client, t] {
            const std::string name = "worker." + std::to_string(t);
            for (int i = 0; i < per_thread; ++i) client.count(name, 1, SampleRate::always());
        });
    }
    for (auto& th : pool) th.join();
    client.flush();

    for (const auto& p : mock->sent()) EXPECT_LE(p.size(), cfg.max_packet_size);
    const auto lines = split_lines(mock->sent());
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(threads * per_thread));
    std::vector<int> per_worker(threads, 0);
    for (const auto& l : lines) {
        ASSERT_EQ(l.compare(0, 7, "worker."), 0) << l;
        ASSERT_EQ(l.substr(8), ":1|c") << l;
        per_worker[l[7] - '0']++;
    }
    for (int t = 0; t < threads; ++t) EXPECT_EQ(per_worker[t], per_thread);
    EXPECT_EQ(client.stats().recorded(), static_cast<uint64_t>(threads * per_thread));
}

} // namespace test
} // namespace statsd
