#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
* @file
* @brief Byte-batching policy that packs encoded lines into datagrams.
*
* @details Every line is stored followed by a `\n` terminator, so a packet is
* a run of newline-terminated statsd lines. A line too long to fit together
* with its terminator is sent alone and unterminated, so a line of exactly
* the maximum size still yields a packet of exactly the maximum size. The
* assembler knows nothing about sockets or addresses; it only decides where
* packet boundaries fall.
*
* @par Buffer reuse
* The assembler owns the fill buffer and two spare buffers. A flush swaps the
* fill buffer with a spare and hands out a view of it, so after warm-up no
* allocation happens. Returned views stay valid until the next call to
* @ref statsd::PacketAssembler::append or @ref statsd::PacketAssembler::flush.
*
* @note Not thread-safe; the client serializes access.
*/

namespace statsd {

/**
* @brief Outcome of @ref PacketAssembler::append.
*
* @details @ref count is 0 when the line was simply buffered, 1 when either the
* previous buffer was flushed first or the line went out alone, and 2 when
* both happened: the buffered lines went out, then the oversized line.
*/
struct AppendResult {
    std::size_t                     count = 0;
    std::array<std::string_view, 2> packets{};

    bool flushed() const { return count > 0; }
};

/**
* @brief Packs encoded lines into datagrams no larger than a fixed budget.
*
* @details One fill buffer is appended to until the next line would overflow
* it; the caller receives the finished packet and hands it to the transport.
* Only lines individually longer than the budget produce larger packets, and
* those are never truncated.
*/
class PacketAssembler {
public:
    /**
    * @brief Create an assembler producing packets of at most @p max_packet_size bytes.
    * @throws ConfigurationError if @p max_packet_size is 0 or above @ref kMaxUdpPayload.
    */
    explicit PacketAssembler(std::size_t max_packet_size);

    /**
    * @brief Add one encoded line (without terminator).
    *
    * @details If the line plus its terminator does not fit behind the bytes
    * already buffered, the current packet is flushed first and the line starts
    * a fresh one. A line of at least the maximum size is emitted immediately
    * as a packet of its own, without terminator and never truncated.
    */
    AppendResult append(std::string_view line);

    /**
    * @brief Hand out whatever is buffered.
    * @return The packet bytes, or nothing when the buffer is empty.
    */
    std::optional<std::string_view> flush();

    std::size_t size() const { return buf_.size(); }
    bool empty() const { return buf_.empty(); }
    std::size_t max_packet_size() const { return max_; }

private:
    std::string_view take();

    std::size_t max_;
    std::string buf_;
    std::array<std::string, 2> out_;
    std::size_t next_out_ = 0;
};

} // namespace statsd
