/**
* @file
* @brief PacketAssembler: newline-terminated line batching under a size budget.
*/

#include "statsd/assembler.hpp"
#include "statsd/common.hpp"
#include "statsd/errors.hpp"

namespace statsd {

PacketAssembler::PacketAssembler(std::size_t max_packet_size) : max_(max_packet_size) {
    if (max_ == 0) throw ConfigurationError("max packet size must be positive");
    if (max_ > kMaxUdpPayload)
        throw ConfigurationError("max packet size exceeds the largest UDP payload");
    buf_.reserve(max_);
    for (auto& o : out_) o.reserve(max_);
}

AppendResult PacketAssembler::append(std::string_view line) {
    AppendResult res;

    // No room for a terminator even in an empty packet: the line goes out
    // alone and unterminated, after whatever is already buffered.
    if (line.size() >= max_) {
        if (!buf_.empty()) res.packets[res.count++] = take();
        buf_.append(line.data(), line.size());
        res.packets[res.count++] = take();
        return res;
    }

    if (buf_.size() + line.size() + 1 > max_)
        res.packets[res.count++] = take();

    buf_.append(line.data(), line.size());
    buf_.push_back('\n');
    return res;
}

std::optional<std::string_view> PacketAssembler::flush() {
    if (buf_.empty()) return std::nullopt;
    return take();
}

std::string_view PacketAssembler::take() {
    // Alternate spares so two packets from one append() stay valid together.
    std::string& spare = out_[next_out_];
    next_out_ = (next_out_ + 1) % out_.size();
    spare.swap(buf_);
    buf_.clear();
    return spare;
}

} // namespace statsd
