#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "statsd/assembler.hpp"
#include "statsd/common.hpp"
#include "statsd/config.hpp"
#include "statsd/encoder.hpp"
#include "statsd/random.hpp"
#include "statsd/sample_rate.hpp"
#include "statsd/sampler.hpp"
#include "statsd/socket.hpp"
#include "statsd/stats.hpp"
#include "statsd/transport.hpp"

/**
* @file
* @brief Statsd client: sampling, encoding, packet batching and UDP transport.
*
* This header defines @ref statsd::Client, the composition root that wires
* @ref statsd::Sampler -> @ref statsd::encode -> @ref statsd::PacketAssembler ->
* @ref statsd::Transport behind the recording API.
*
* @par Design
* The client depends only on the @ref ISocket and @ref IRandomSource interfaces.
* Concrete adapters are injected at construction time, which keeps the whole
* pipeline testable with @ref MockSocket and @ref CountingRandomSource.
*
* @par Hot path
* Recording calls are inline so the sampler's reject branch runs before any
* call into the library: a sampled-out call does not allocate, encode, lock,
* or touch the packet buffer.
*
* @note Thread-safety: all public methods may be called concurrently. Encoding
*       happens in a per-thread scratch buffer; the packet buffer and the socket
*       are guarded by one mutex, so lines from different threads never
*       interleave and no bytes are flushed twice.
*/

namespace statsd {

class Client {
public:
    /**
     * @brief Construct with a real @ref UdpSocket and the default PCG32 source.
     * @throws ConfigurationError on invalid config or unusable destination.
     */
    explicit Client(ClientConfig cfg);

    /**
     * @brief Construct with an injected socket strategy (ownership transferred).
     * @throws ConfigurationError on invalid config or unusable destination.
     */
    Client(std::unique_ptr<ISocket> sock, ClientConfig cfg);

    /**
     * @brief Construct with injected socket and random source.
     * @throws ConfigurationError on invalid config, unusable destination or a
     *         null random source.
     */
    Client(std::unique_ptr<ISocket> sock, ClientConfig cfg, std::unique_ptr<IRandomSource> rng);

    /**
     * @brief Best-effort final flush. A failing send is counted in @ref stats()
     *        and otherwise ignored.
     */
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// @name Counters (`c`)
    ///@{
    void count(std::string_view name, int64_t value, const SampleRate& rate) {
        if (!sampler_.should_sample(rate)) return;
        record(Observation{name, MetricKind::Counter, value, false, rate});
    }
    void count(std::string_view name, int64_t value, const SampleRate& rate, SampleChannel& ch) {
        if (!sampler_.should_sample(rate, ch)) return;
        record(Observation{name, MetricKind::Counter, value, false, rate});
    }
    void count(std::string_view name, int64_t value) { count(name, value, cfg_.default_rate); }

    void increment(std::string_view name, const SampleRate& rate) { count(name, 1, rate); }
    void increment(std::string_view name) { count(name, 1, cfg_.default_rate); }
    void decrement(std::string_view name, const SampleRate& rate) { count(name, -1, rate); }
    void decrement(std::string_view name) { count(name, -1, cfg_.default_rate); }
    ///@}

    /// @name Timers (`ms`); negative durations throw EncodingError
    ///@{
    void timing(std::string_view name, int64_t millis, const SampleRate& rate) {
        if (!sampler_.should_sample(rate)) return;
        record(Observation{name, MetricKind::Timer, millis, false, rate});
    }
    void timing(std::string_view name, int64_t millis, const SampleRate& rate, SampleChannel& ch) {
        if (!sampler_.should_sample(rate, ch)) return;
        record(Observation{name, MetricKind::Timer, millis, false, rate});
    }
    void timing(std::string_view name, int64_t millis) { timing(name, millis, cfg_.default_rate); }
    void timing(std::string_view name, std::chrono::milliseconds d, const SampleRate& rate) {
        timing(name, static_cast<int64_t>(d.count()), rate);
    }
    void timing(std::string_view name, std::chrono::milliseconds d) {
        timing(name, static_cast<int64_t>(d.count()), cfg_.default_rate);
    }
    ///@}

    /// @name Gauges (`g`), absolute via Gauge::set or signed via Gauge::adjust
    ///@{
    void gauge(std::string_view name, Gauge g, const SampleRate& rate) {
        if (!sampler_.should_sample(rate)) return;
        record(Observation{name, MetricKind::Gauge, g.value, g.delta, rate});
    }
    void gauge(std::string_view name, Gauge g, const SampleRate& rate, SampleChannel& ch) {
        if (!sampler_.should_sample(rate, ch)) return;
        record(Observation{name, MetricKind::Gauge, g.value, g.delta, rate});
    }
    void gauge(std::string_view name, Gauge g) { gauge(name, g, cfg_.default_rate); }
    ///@}

    /// @name Sets (`s`)
    ///@{
    void set(std::string_view name, int64_t value, const SampleRate& rate) {
        if (!sampler_.should_sample(rate)) return;
        record(Observation{name, MetricKind::Set, value, false, rate});
    }
    void set(std::string_view name, int64_t value, const SampleRate& rate, SampleChannel& ch) {
        if (!sampler_.should_sample(rate, ch)) return;
        record(Observation{name, MetricKind::Set, value, false, rate});
    }
    void set(std::string_view name, int64_t value) { set(name, value, cfg_.default_rate); }
    ///@}

    /**
     * @brief Encode @p obs and append it under the buffer lock, sending
     *        whatever packets the assembler releases.
     *
     * @details No sampling happens here: callers that already made the
     * accept decision (the process-wide helpers) use this directly.
     * @c obs.rate only annotates the line.
     *
     * @throws EncodingError before any buffer is touched; SendError after the
     *         line is buffered.
     */
    void record(const Observation& obs);

    /**
     * @brief Send any partially filled packet now.
     *
     * @details No-op (no send) when nothing is buffered. Intended for shutdown
     * and for quiet periods where batching delay would otherwise be unbounded.
     * @throws SendError if the datagram could not be handed to the OS.
     */
    void flush();

    /// @brief Bytes currently waiting in the packet buffer.
    std::size_t pending_bytes() const;

    /// @brief Read-only access to cumulative counters.
    const Stats& stats() const { return stats_; }

    const ClientConfig& config() const { return cfg_; }

private:
    const ClientConfig cfg_;      ///< Immutable client configuration copy.
    const std::string  prefix_;   ///< Wire-ready name prefix.
    Sampler            sampler_;  ///< Accept/reject policy (lock-free).
    Stats              stats_;    ///< Hot-path counters (relaxed atomics).

    mutable std::mutex mu_;       ///< Serializes @ref assembler_ and @ref transport_.
    PacketAssembler    assembler_;
    Transport          transport_;
};

} // namespace statsd
