/**
 * @file Socket.hpp
 * @brief RAII wrapper over a POSIX socket descriptor
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#pragma once

#ifndef LECTERN_CORE_SOCKET_HPP
#define LECTERN_CORE_SOCKET_HPP

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>

#include <string>

namespace Lectern::Network {

/**
 * @brief Outcome of one read or write
 */
enum class IoStatus : uint8_t {
    Ok,         ///< Bytes transferred
    Timeout,    ///< Nothing happened before the deadline
    Closed,     ///< Orderly shutdown or reset by peer
    Error       ///< Any other failure
};

/**
 * @brief Bytes transferred plus status
 */
struct IoResult {
    size_t bytes = 0;
    IoStatus status = IoStatus::Ok;
};

/**
 * @brief Connection handed out by accept()
 */
struct AcceptedConnection;

/**
 * @brief One received datagram
 */
struct Datagram {
    size_t size = 0;
    std::string address;
    uint16_t port = 0;
};

/**
 * @brief Move-only owner of one descriptor
 *
 * Every call on an invalid socket fails with InvalidHandle. Sends never
 * raise SIGPIPE.
 */
class Socket {
public:
    Socket() noexcept = default;
    explicit Socket(SocketHandle handle) noexcept;
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // ------------------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------------------

    /**
     * @brief Bound, listening TCP socket with SO_REUSEADDR
     * @param port 0 picks an ephemeral port (see localPort())
     */
    [[nodiscard]] static Result<Socket> listenTcp(const std::string& address,
                                                  uint16_t port,
                                                  int backlog);

    /**
     * @brief Connect to a TCP peer, giving up after timeout
     */
    [[nodiscard]] static Result<Socket> connectTcp(const std::string& address,
                                                   uint16_t port,
                                                   Milliseconds timeout);

    /**
     * @brief UDP socket bound to address:port
     * @param reuse Set SO_REUSEADDR (and SO_REUSEPORT) so several
     *              receivers on one host can share the port
     */
    [[nodiscard]] static Result<Socket> bindUdp(const std::string& address,
                                                uint16_t port,
                                                bool reuse);

    /**
     * @brief Unbound UDP socket for sending
     */
    [[nodiscard]] static Result<Socket> createUdp();

    // ------------------------------------------------------------------------
    // Stream I/O
    // ------------------------------------------------------------------------

    /**
     * @brief Wait for a pending connection
     * @return Connection, or Timeout when none arrived
     */
    [[nodiscard]] Result<AcceptedConnection> accept(Milliseconds timeout);

    /**
     * @brief Single send() call; may transfer fewer bytes than given
     */
    [[nodiscard]] IoResult send(ByteSpan data);

    /**
     * @brief Single recv() after waiting up to timeout for readability
     */
    [[nodiscard]] IoResult receive(MutableByteSpan buffer, Milliseconds timeout);

    // ------------------------------------------------------------------------
    // Datagram I/O
    // ------------------------------------------------------------------------

    [[nodiscard]] VoidResult sendTo(ByteSpan data, const std::string& address, uint16_t port);

    /**
     * @brief Receive one datagram
     * @return Sender and size, or Timeout
     */
    [[nodiscard]] Result<Datagram> receiveFrom(MutableByteSpan buffer, Milliseconds timeout);

    // ------------------------------------------------------------------------
    // Options
    // ------------------------------------------------------------------------

    VoidResult setNoDelay(bool enable);
    VoidResult setBroadcast(bool enable);
    VoidResult setReceiveBufferSize(int size);
    VoidResult setSendBufferSize(int size);
    VoidResult setMulticastTtl(int ttl);
    VoidResult setMulticastLoopback(bool enable);

    /**
     * @brief IP_ADD_MEMBERSHIP on the given interface (INADDR_ANY when empty)
     */
    VoidResult joinMulticastGroup(const std::string& group, const std::string& interfaceAddress = {});
    VoidResult leaveMulticastGroup(const std::string& group, const std::string& interfaceAddress = {});

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------

    /**
     * @brief Shut down both directions; wakes threads blocked on the socket
     *
     * The descriptor stays owned until close() or destruction.
     */
    void shutdown() noexcept;

    /**
     * @brief Release the descriptor
     */
    void close() noexcept;

    [[nodiscard]] bool isValid() const noexcept { return m_handle != INVALID_SOCKET_HANDLE; }
    [[nodiscard]] SocketHandle handle() const noexcept { return m_handle; }

    /**
     * @brief Port the socket is bound to, 0 when unknown
     */
    [[nodiscard]] uint16_t localPort() const noexcept;

private:
    SocketHandle m_handle = INVALID_SOCKET_HANDLE;
};

struct AcceptedConnection {
    Socket socket;
    std::string address;
    uint16_t port = 0;
};

} // namespace Lectern::Network

#endif // LECTERN_CORE_SOCKET_HPP
