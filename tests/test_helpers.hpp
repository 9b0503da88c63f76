#pragma once
#include <memory>
#include <string>
#include <vector>
#include "statsd/socket.hpp"

namespace statsd {
namespace test {

/**
 * @brief ISocket that forwards to a MockSocket the test keeps a handle on,
 *        so datagrams stay inspectable after the owning client is destroyed.
 */
class ForwardingSocket : public ISocket {
public:
    explicit ForwardingSocket(std::shared_ptr<MockSocket> target) : target_(std::move(target)) {}

    int fd() const override { return target_->fd(); }
    void connect(const std::string& host, uint16_t port) override { target_->connect(host, port); }
    ssize_t send(const void* data, std::size_t len) override { return target_->send(data, len); }
    void set_sndbuf(int bytes) override { target_->set_sndbuf(bytes); }

private:
    std::shared_ptr<MockSocket> target_;
};

/// Split newline-terminated statsd packets into their lines.
inline std::vector<std::string> split_lines(const std::vector<std::string>& packets) {
    std::vector<std::string> lines;
    for (const auto& p : packets) {
        std::size_t start = 0;
        while (start < p.size()) {
            const auto nl = p.find('\n', start);
            if (nl == std::string::npos) {
                lines.push_back(p.substr(start));
                break;
            }
            lines.push_back(p.substr(start, nl - start));
            start = nl + 1;
        }
    }
    return lines;
}

} // namespace test
} // namespace statsd
