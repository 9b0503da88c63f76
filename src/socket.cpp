/**
* @file
* @brief POSIX UDP socket implementation and in-memory MockSocket.
*
* @details
*  - `statsd::UdpSocket`: non-blocking IPv4 UDP; sends use @c MSG_DONTWAIT so a
*    full socket buffer surfaces as @c EAGAIN instead of stalling the caller.
*  - `statsd::MockSocket`: captures sent buffers for assertions and can inject
*    failures.
*/

#include "statsd/socket.hpp"
#include "statsd/errors.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <unistd.h>

namespace statsd {

/// \copydoc statsd::ISocket::set_sndbuf
void ISocket::set_sndbuf(int bytes) {
    (void)bytes; // default no-op; concrete implementations may override
}

/// \cond INTERNAL
/**
* @brief Create a non-blocking, close-on-exec UDP socket (IPv4).
* @throws ConfigurationError if `socket()` fails.
*/
static int make_socket() {
    int s = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (s < 0) throw ConfigurationError("socket() failed: " + std::string(strerror(errno)));
    int flags = fcntl(s, F_GETFL, 0);
    fcntl(s, F_SETFL, flags | O_NONBLOCK);
    return s;
}

/**
* @brief Resolve @p host to an IPv4 address: dotted quad first, then getaddrinfo.
* @throws ConfigurationError if neither succeeds.
*/
static in_addr resolve_ipv4(const std::string& host) {
    in_addr out{};
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) return out;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr)
        throw ConfigurationError("cannot resolve statsd host '" + host + "': " + gai_strerror(rc));
    out = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return out;
}
/// \endcond

UdpSocket::UdpSocket() : sockfd_(make_socket()) {}

UdpSocket::~UdpSocket() {
    if (sockfd_ >= 0) ::close(sockfd_);
}

/**
* \copydoc statsd::ISocket::connect
*
* @details Resolves the host, then calls `::connect()` so every later send goes
* to the same peer without a per-send address.
*/
void UdpSocket::connect(const std::string& host, uint16_t port) {
    std::memset(&peer_, 0, sizeof(peer_));
    peer_.sin_family = AF_INET;
    peer_.sin_addr = resolve_ipv4(host);
    peer_.sin_port = htons(port);
    if (::connect(sockfd_, reinterpret_cast<sockaddr*>(&peer_), sizeof(peer_)) < 0)
        throw ConfigurationError("connect() failed: " + std::string(strerror(errno)));
}

/// \copydoc statsd::ISocket::send
ssize_t UdpSocket::send(const void* data, std::size_t len) {
    return ::send(sockfd_, data, len, MSG_DONTWAIT | MSG_NOSIGNAL);
}

/// \copydoc statsd::ISocket::set_sndbuf
void UdpSocket::set_sndbuf(int bytes) {
    setsockopt(sockfd_, SOL_SOCKET, SO_SNDBUF, &bytes, sizeof(bytes));
}

void MockSocket::connect(const std::string& host, uint16_t port) {
    if (reject_connect_) throw ConfigurationError("mock connect rejected: " + host);
    host_ = host;
    port_ = port;
}

/**
* @brief Record @p data as one datagram, unless a failure was injected.
*
* @return @p len on success; -1 with @c errno set while injected failures remain.
*/
ssize_t MockSocket::send(const void* data, std::size_t len) {
    ++send_calls_;
    if (fail_left_ > 0) {
        --fail_left_;
        errno = fail_errno_;
        return -1;
    }
    tx_store_.emplace_back(static_cast<const char*>(data), len);
    return static_cast<ssize_t>(len);
}

} // namespace statsd
