#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

/**
* @file
* @brief Datagram socket abstraction for the statsd transport plus a test double.
*
* This header defines:
*  - @ref statsd::ISocket : the strategy/port interface the transport depends on,
*  - @ref statsd::UdpSocket : a concrete non-blocking POSIX UDP socket,
*  - @ref statsd::MockSocket : an in-memory test double that records datagrams.
*
* The transport never touches OS calls directly, which keeps the client testable
* (via dependency injection) without a network.
*
* @note Thread-safety: a single @c send on a connected UDP socket is atomic at the
*       kernel level, but instances are not designed for concurrent calls; the
*       client serializes them.
*/

namespace statsd {

/**
* @brief Abstract connected datagram socket (strategy/port).
*/
class ISocket {
public:
    virtual ~ISocket() = default;

    /**
     * @brief File descriptor for low-level integration.
     * @return Underlying descriptor, or -1 if not applicable (e.g., @ref MockSocket).
     */
    virtual int fd() const = 0;

    /**
     * @brief Fix the remote endpoint for all subsequent sends.
     *
     * @param host Dotted IPv4 address or resolvable host name.
     * @param port Remote UDP port in host byte order.
     *
     * @throws ConfigurationError if the host cannot be resolved or connect() fails.
     */
    virtual void connect(const std::string& host, uint16_t port) = 0;

    /**
     * @brief Send one datagram to the connected peer without blocking.
     *
     * @return Bytes handed to the OS, or -1 on error with @c errno set.
     *         Would-block is an error here: the datagram is not queued.
     */
    virtual ssize_t send(const void* data, std::size_t len) = 0;

    /**
     * @brief Hint the desired send buffer size (bytes) for @c SO_SNDBUF.
     *
     * @note Implementations may clamp or ignore values depending on OS limits.
     */
    virtual void set_sndbuf(int bytes);
};

/**
* @brief Non-blocking IPv4 UDP socket.
*
* @details The descriptor is created with @c O_NONBLOCK and @c SOCK_CLOEXEC at
* construction and closed by the destructor. No reconnection logic exists; UDP
* is connectionless and @c connect() only pins the destination.
*/
class UdpSocket : public ISocket {
public:
    /// @throws ConfigurationError if @c socket() fails.
    UdpSocket();

    /// @brief Close the socket and release resources.
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /// @copydoc ISocket::fd()
    int fd() const override { return sockfd_; }

    /// @copydoc ISocket::connect(const std::string&,uint16_t)
    void connect(const std::string& host, uint16_t port) override;

    /// @copydoc ISocket::send(const void*,std::size_t)
    ssize_t send(const void* data, std::size_t len) override;

    /// @copydoc ISocket::set_sndbuf(int)
    void set_sndbuf(int bytes) override;

private:
    int sockfd_;          ///< Underlying socket file descriptor.
    sockaddr_in peer_{};  ///< Connected peer (valid after @ref connect).
};

/**
* @brief In-memory test double for @ref ISocket (no real network I/O).
*
* @details
* - @ref send copies each datagram into an internal store for later inspection.
* - @ref fail_next makes the next sends fail with a chosen @c errno.
* - @ref connect records the endpoint and can be told to reject it.
*/
class MockSocket : public ISocket {
public:
    MockSocket() = default;

    /// @copydoc ISocket::fd()
    int fd() const override { return -1; }

    /// @copydoc ISocket::connect(const std::string&,uint16_t)
    void connect(const std::string& host, uint16_t port) override;

    /// @copydoc ISocket::send(const void*,std::size_t)
    ssize_t send(const void* data, std::size_t len) override;

    /// @copydoc ISocket::set_sndbuf(int)
    void set_sndbuf(int bytes) override { sndbuf_ = bytes; }

    // ---------------------- Test hooks ----------------------

    /// @brief Make the next @p times sends fail with @p err.
    void fail_next(int err, std::size_t times = 1) { fail_errno_ = err; fail_left_ = times; }

    /// @brief Make @ref connect throw ConfigurationError.
    void reject_connect() { reject_connect_ = true; }

    /// @brief Number of datagrams accepted so far.
    std::size_t sent_count() const { return tx_store_.size(); }

    /// @brief Number of @ref send calls, failed ones included.
    std::size_t send_calls() const { return send_calls_; }

    /// @brief Captured datagrams, in send order.
    const std::vector<std::string>& sent() const { return tx_store_; }

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    int sndbuf() const { return sndbuf_; }

private:
    std::vector<std::string> tx_store_;  ///< Captured outgoing datagrams.
    std::size_t send_calls_ = 0;
    int         fail_errno_ = 0;
    std::size_t fail_left_ = 0;
    bool        reject_connect_ = false;
    std::string host_;
    uint16_t    port_ = 0;
    int         sndbuf_ = 0;
};

} // namespace statsd
