/**
 * @file Socket.cpp
 * @brief POSIX socket wrapper implementation
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <Lectern/Core/Socket.hpp>
#include <Lectern/Core/Logger.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace Lectern::Network {

namespace {

Result<sockaddr_in> makeAddress(const std::string& address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LECTERN_LOG_ERROR_F("Invalid IPv4 address: %s", address.c_str());
        return ErrorCode::AddressInvalid;
    }
    return addr;
}

std::string addressToString(const sockaddr_in& addr) {
    char text[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text)) == nullptr) {
        return "";
    }
    return text;
}

/**
 * @brief poll() a single descriptor
 * @return 1 ready, 0 timeout, -1 error
 */
int waitFor(SocketHandle handle, short events, Milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = handle;
    pfd.events = events;

    for (;;) {
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc > 0 && (pfd.revents & POLLNVAL)) {
            return -1;
        }
        return rc > 0 ? 1 : rc;
    }
}

template<typename T>
VoidResult setOption(SocketHandle handle, int level, int name, const T& value) {
    if (handle == INVALID_SOCKET_HANDLE) {
        return ErrorCode::InvalidHandle;
    }
    if (::setsockopt(handle, level, name, &value, sizeof(value)) != 0) {
        LECTERN_LOG_WARNING_F("setsockopt(%d, %d) failed: %s", level, name, std::strerror(errno));
        return ErrorCode::SocketOptionFailed;
    }
    return VoidResult::Success();
}

VoidResult changeMembership(SocketHandle handle, int option,
                            const std::string& group, const std::string& interfaceAddress) {
    ip_mreq mreq{};
    if (inet_pton(AF_INET, group.c_str(), &mreq.imr_multiaddr) != 1) {
        return ErrorCode::AddressInvalid;
    }
    if (interfaceAddress.empty()) {
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, interfaceAddress.c_str(), &mreq.imr_interface) != 1) {
        return ErrorCode::AddressInvalid;
    }

    if (handle == INVALID_SOCKET_HANDLE) {
        return ErrorCode::InvalidHandle;
    }
    if (::setsockopt(handle, IPPROTO_IP, option, &mreq, sizeof(mreq)) != 0) {
        LECTERN_LOG_WARNING_F("Multicast membership change for %s failed: %s",
                              group.c_str(), std::strerror(errno));
        return ErrorCode::MulticastJoinFailed;
    }
    return VoidResult::Success();
}

} // namespace

// ============================================================================
// Lifetime
// ============================================================================

Socket::Socket(SocketHandle handle) noexcept
    : m_handle(handle) {
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : m_handle(std::exchange(other.m_handle, INVALID_SOCKET_HANDLE)) {
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        m_handle = std::exchange(other.m_handle, INVALID_SOCKET_HANDLE);
    }
    return *this;
}

void Socket::shutdown() noexcept {
    if (m_handle != INVALID_SOCKET_HANDLE) {
        ::shutdown(m_handle, SHUT_RDWR);
    }
}

void Socket::close() noexcept {
    if (m_handle != INVALID_SOCKET_HANDLE) {
        ::close(m_handle);
        m_handle = INVALID_SOCKET_HANDLE;
    }
}

uint16_t Socket::localPort() const noexcept {
    if (m_handle == INVALID_SOCKET_HANDLE) {
        return 0;
    }
    sockaddr_in addr{};
    socklen_t length = sizeof(addr);
    if (::getsockname(m_handle, reinterpret_cast<sockaddr*>(&addr), &length) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

// ============================================================================
// Factories
// ============================================================================

Result<Socket> Socket::listenTcp(const std::string& address, uint16_t port, int backlog) {
    Result<sockaddr_in> addr = makeAddress(address, port);
    if (addr.isFailure()) {
        return addr.error();
    }

    Socket socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!socket.isValid()) {
        LECTERN_LOG_ERROR_F("socket() failed: %s", std::strerror(errno));
        return ErrorCode::SocketCreateFailed;
    }

    LECTERN_TRY(setOption(socket.handle(), SOL_SOCKET, SO_REUSEADDR, 1));

    if (::bind(socket.handle(), reinterpret_cast<const sockaddr*>(&addr.value()),
               sizeof(sockaddr_in)) != 0) {
        LECTERN_LOG_ERROR_F("bind(%s:%u) failed: %s", address.c_str(),
                            static_cast<unsigned>(port), std::strerror(errno));
        return ErrorCode::BindFailed;
    }

    if (::listen(socket.handle(), backlog) != 0) {
        LECTERN_LOG_ERROR_F("listen() failed: %s", std::strerror(errno));
        return ErrorCode::ListenFailed;
    }

    return socket;
}

Result<Socket> Socket::connectTcp(const std::string& address, uint16_t port, Milliseconds timeout) {
    Result<sockaddr_in> addr = makeAddress(address, port);
    if (addr.isFailure()) {
        return addr.error();
    }

    Socket socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!socket.isValid()) {
        return ErrorCode::SocketCreateFailed;
    }

    int flags = ::fcntl(socket.handle(), F_GETFL, 0);
    if (flags == -1 || ::fcntl(socket.handle(), F_SETFL, flags | O_NONBLOCK) != 0) {
        return ErrorCode::SocketOptionFailed;
    }

    int rc = ::connect(socket.handle(), reinterpret_cast<const sockaddr*>(&addr.value()),
                       sizeof(sockaddr_in));
    if (rc != 0) {
        int error = errno;
        if (error != EINPROGRESS) {
            LECTERN_LOG_WARNING_F("connect(%s:%u) failed: %s", address.c_str(),
                                  static_cast<unsigned>(port), std::strerror(error));
            return error == ENETUNREACH ? ErrorCode::NetworkUnreachable : ErrorCode::ConnectionFailed;
        }

        int ready = waitFor(socket.handle(), POLLOUT, timeout);
        if (ready == 0) {
            LECTERN_LOG_WARNING_F("connect(%s:%u) timed out", address.c_str(), static_cast<unsigned>(port));
            return ErrorCode::Timeout;
        }
        if (ready < 0) {
            return ErrorCode::ConnectionFailed;
        }

        int pending = 0;
        socklen_t length = sizeof(pending);
        if (::getsockopt(socket.handle(), SOL_SOCKET, SO_ERROR, &pending, &length) != 0 || pending != 0) {
            LECTERN_LOG_WARNING_F("connect(%s:%u) failed: %s", address.c_str(),
                                  static_cast<unsigned>(port), std::strerror(pending));
            return ErrorCode::ConnectionFailed;
        }
    }

    if (::fcntl(socket.handle(), F_SETFL, flags) != 0) {
        return ErrorCode::SocketOptionFailed;
    }

    return socket;
}

Result<Socket> Socket::bindUdp(const std::string& address, uint16_t port, bool reuse) {
    Result<sockaddr_in> addr = makeAddress(address, port);
    if (addr.isFailure()) {
        return addr.error();
    }

    Socket socket(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!socket.isValid()) {
        LECTERN_LOG_ERROR_F("socket() failed: %s", std::strerror(errno));
        return ErrorCode::SocketCreateFailed;
    }

    if (reuse) {
        LECTERN_TRY(setOption(socket.handle(), SOL_SOCKET, SO_REUSEADDR, 1));
#ifdef SO_REUSEPORT
        LECTERN_TRY(setOption(socket.handle(), SOL_SOCKET, SO_REUSEPORT, 1));
#endif
    }

    if (::bind(socket.handle(), reinterpret_cast<const sockaddr*>(&addr.value()),
               sizeof(sockaddr_in)) != 0) {
        LECTERN_LOG_ERROR_F("bind(udp %s:%u) failed: %s", address.c_str(),
                            static_cast<unsigned>(port), std::strerror(errno));
        return ErrorCode::BindFailed;
    }

    return socket;
}

Result<Socket> Socket::createUdp() {
    Socket socket(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!socket.isValid()) {
        LECTERN_LOG_ERROR_F("socket() failed: %s", std::strerror(errno));
        return ErrorCode::SocketCreateFailed;
    }
    return socket;
}

// ============================================================================
// Stream I/O
// ============================================================================

Result<AcceptedConnection> Socket::accept(Milliseconds timeout) {
    if (!isValid()) {
        return ErrorCode::InvalidHandle;
    }

    int ready = waitFor(m_handle, POLLIN, timeout);
    if (ready == 0) {
        return ErrorCode::Timeout;
    }
    if (ready < 0) {
        return ErrorCode::AcceptFailed;
    }

    sockaddr_in peer{};
    socklen_t length = sizeof(peer);
    SocketHandle client = ::accept4(m_handle, reinterpret_cast<sockaddr*>(&peer), &length, SOCK_CLOEXEC);
    if (client < 0) {
        // Connection vanished between poll() and accept()
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR) {
            return ErrorCode::Timeout;
        }
        return ErrorCode::AcceptFailed;
    }

    AcceptedConnection connection;
    connection.socket = Socket(client);
    connection.address = addressToString(peer);
    connection.port = ntohs(peer.sin_port);
    return connection;
}

IoResult Socket::send(ByteSpan data) {
    if (!isValid()) {
        return {0, IoStatus::Error};
    }

    ssize_t sent = ::send(m_handle, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return {0, IoStatus::Timeout};
        }
        if (errno == EPIPE || errno == ECONNRESET || errno == ENOTCONN) {
            return {0, IoStatus::Closed};
        }
        return {0, IoStatus::Error};
    }
    return {static_cast<size_t>(sent), IoStatus::Ok};
}

IoResult Socket::receive(MutableByteSpan buffer, Milliseconds timeout) {
    if (!isValid()) {
        return {0, IoStatus::Error};
    }

    int ready = waitFor(m_handle, POLLIN, timeout);
    if (ready == 0) {
        return {0, IoStatus::Timeout};
    }
    if (ready < 0) {
        return {0, IoStatus::Error};
    }

    ssize_t received = ::recv(m_handle, buffer.data(), buffer.size(), 0);
    if (received > 0) {
        return {static_cast<size_t>(received), IoStatus::Ok};
    }
    if (received == 0) {
        return {0, IoStatus::Closed};
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return {0, IoStatus::Timeout};
    }
    if (errno == ECONNRESET || errno == ENOTCONN) {
        return {0, IoStatus::Closed};
    }
    return {0, IoStatus::Error};
}

// ============================================================================
// Datagram I/O
// ============================================================================

VoidResult Socket::sendTo(ByteSpan data, const std::string& address, uint16_t port) {
    if (!isValid()) {
        return ErrorCode::InvalidHandle;
    }

    Result<sockaddr_in> addr = makeAddress(address, port);
    if (addr.isFailure()) {
        return addr.error();
    }

    ssize_t sent = ::sendto(m_handle, data.data(), data.size(), MSG_NOSIGNAL,
                            reinterpret_cast<const sockaddr*>(&addr.value()), sizeof(sockaddr_in));
    if (sent < 0 || static_cast<size_t>(sent) != data.size()) {
        int error = sent < 0 ? errno : EMSGSIZE;
        LECTERN_LOG_DEBUG_F("sendto(%s:%u) failed: %s", address.c_str(),
                            static_cast<unsigned>(port), std::strerror(error));
        return error == ENETUNREACH ? ErrorCode::NetworkUnreachable : ErrorCode::SendFailed;
    }
    return VoidResult::Success();
}

Result<Datagram> Socket::receiveFrom(MutableByteSpan buffer, Milliseconds timeout) {
    if (!isValid()) {
        return ErrorCode::InvalidHandle;
    }

    int ready = waitFor(m_handle, POLLIN, timeout);
    if (ready == 0) {
        return ErrorCode::Timeout;
    }
    if (ready < 0) {
        return ErrorCode::ReceiveFailed;
    }

    sockaddr_in peer{};
    socklen_t length = sizeof(peer);
    ssize_t received = ::recvfrom(m_handle, buffer.data(), buffer.size(), 0,
                                  reinterpret_cast<sockaddr*>(&peer), &length);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return ErrorCode::Timeout;
        }
        return ErrorCode::ReceiveFailed;
    }

    Datagram datagram;
    datagram.size = static_cast<size_t>(received);
    datagram.address = addressToString(peer);
    datagram.port = ntohs(peer.sin_port);
    return datagram;
}

// ============================================================================
// Options
// ============================================================================

VoidResult Socket::setNoDelay(bool enable) {
    return setOption(m_handle, IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
}

VoidResult Socket::setBroadcast(bool enable) {
    return setOption(m_handle, SOL_SOCKET, SO_BROADCAST, enable ? 1 : 0);
}

VoidResult Socket::setReceiveBufferSize(int size) {
    return setOption(m_handle, SOL_SOCKET, SO_RCVBUF, size);
}

VoidResult Socket::setSendBufferSize(int size) {
    return setOption(m_handle, SOL_SOCKET, SO_SNDBUF, size);
}

VoidResult Socket::setMulticastTtl(int ttl) {
    return setOption(m_handle, IPPROTO_IP, IP_MULTICAST_TTL, static_cast<unsigned char>(ttl));
}

VoidResult Socket::setMulticastLoopback(bool enable) {
    return setOption(m_handle, IPPROTO_IP, IP_MULTICAST_LOOP, static_cast<unsigned char>(enable ? 1 : 0));
}

VoidResult Socket::joinMulticastGroup(const std::string& group, const std::string& interfaceAddress) {
    return changeMembership(m_handle, IP_ADD_MEMBERSHIP, group, interfaceAddress);
}

VoidResult Socket::leaveMulticastGroup(const std::string& group, const std::string& interfaceAddress) {
    return changeMembership(m_handle, IP_DROP_MEMBERSHIP, group, interfaceAddress);
}

} // namespace Lectern::Network
