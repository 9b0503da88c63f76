#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

/**
* @file
* @brief Lightweight, thread-safe counters describing what a client did.
*
* @note The counters use @c memory_order_relaxed because only numerical accuracy
*       matters, not cross-counter ordering. A @ref statsd::Stats::to_string line is
*       not a transactional snapshot.
*
* Sampled-out calls are not counted: the reject path must not touch shared
* cache lines.
*/

namespace statsd {

/**
* @brief Aggregated client counters.
*
* @code
* statsd::Stats s;
* s.inc_recorded();
* s.inc_packets(1);
* s.add_tx_bytes(42);
* std::string line = s.to_string();
* // "recorded=1 packets_sent=1 tx_bytes=42 send_errors=0 encode_errors=0"
* @endcode
*/
class Stats {
public:
    /// @brief One observation was accepted by the sampler and encoded.
    void inc_recorded() { recorded_.fetch_add(1, std::memory_order_relaxed); }

    /// @brief Increase the number of datagrams handed to the OS by @p n.
    void inc_packets(uint64_t n) { packets_.fetch_add(n, std::memory_order_relaxed); }

    /// @brief Increase the total transmitted payload bytes by @p n.
    void add_tx_bytes(uint64_t n) { tx_bytes_.fetch_add(n, std::memory_order_relaxed); }

    /// @brief A datagram was dropped because the send failed.
    void inc_send_errors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }

    /// @brief An accepted observation could not be encoded.
    void inc_encode_errors() { encode_errors_.fetch_add(1, std::memory_order_relaxed); }

    uint64_t recorded() const { return recorded_.load(std::memory_order_relaxed); }
    uint64_t packets_sent() const { return packets_.load(std::memory_order_relaxed); }
    uint64_t tx_bytes() const { return tx_bytes_.load(std::memory_order_relaxed); }
    uint64_t send_errors() const { return send_errors_.load(std::memory_order_relaxed); }
    uint64_t encode_errors() const { return encode_errors_.load(std::memory_order_relaxed); }

    /**
     * @brief Produce a single-line human-readable snapshot of all counters.
     *
     * @details Suitable for periodic logs and simple diagnostics.
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "recorded=" << recorded() << " packets_sent=" << packets_sent()
            << " tx_bytes=" << tx_bytes() << " send_errors=" << send_errors()
            << " encode_errors=" << encode_errors();
        return oss.str();
    }

private:
    std::atomic<uint64_t> recorded_{0};      ///< Observations accepted and encoded.
    std::atomic<uint64_t> packets_{0};       ///< Datagrams handed to the OS.
    std::atomic<uint64_t> tx_bytes_{0};      ///< Payload bytes handed to the OS.
    std::atomic<uint64_t> send_errors_{0};   ///< Datagrams dropped on send failure.
    std::atomic<uint64_t> encode_errors_{0}; ///< Accepted calls rejected by the encoder.
};

} // namespace statsd
