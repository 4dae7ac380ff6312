/**
 * @file TcpSocket.cpp
 * @brief POSIX TCP socket implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/net/TcpSocket.hpp>
#include <gpo/core/Log.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace gpo::net {

namespace {

constexpr const char *kTag = "NET";

std::string lastError()
{
    return std::strerror(errno);
}

} // anonymous namespace

// ========================================================================== //
//  TcpStream                                                                 //
// ========================================================================== //

TcpStream::TcpStream(int fd, std::string peer) noexcept
    : _fd{fd}, _peer{std::move(peer)}
{}

TcpStream::TcpStream(TcpStream &&other) noexcept
    : _fd{std::exchange(other._fd, -1)}, _peer{std::move(other._peer)}
{}

TcpStream &TcpStream::operator=(TcpStream &&other) noexcept
{
    if (this != &other)
    {
        close();
        _fd   = std::exchange(other._fd, -1);
        _peer = std::move(other._peer);
    }
    return *this;
}

TcpStream::~TcpStream()
{
    close();
}

core::Expected<void> TcpStream::setTimeout(std::chrono::milliseconds timeout)
{
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "setsockopt() failed: " + lastError());
    }
    return {};
}

core::Expected<core::usize> TcpStream::receive(std::span<char> buffer)
{
    if (_fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "stream not open");
    }

    for (;;)
    {
        const auto received = ::recv(_fd, buffer.data(), buffer.size(), 0);
        if (received >= 0)
            return static_cast<core::usize>(received);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return core::makeError(core::ErrorCode::kTimeout, "receive timed out");
        }
        return core::makeError(core::ErrorCode::kNetworkReceiveFailed, "recv() failed: " + lastError());
    }
}

core::Expected<void> TcpStream::sendAll(std::string_view data)
{
    if (_fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "stream not open");
    }

    core::usize offset = 0;
    while (offset < data.size())
    {
        const auto sent = ::send(_fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0)
        {
            if (errno == EINTR)
                continue;
            return core::makeError(core::ErrorCode::kNetworkSendFailed, "send() failed: " + lastError());
        }
        offset += static_cast<core::usize>(sent);
    }
    return {};
}

void TcpStream::shutdown() noexcept
{
    if (_fd >= 0)
        ::shutdown(_fd, SHUT_RDWR);
}

void TcpStream::close() noexcept
{
    if (_fd >= 0)
    {
        ::close(_fd);
        _fd = -1;
    }
}

// ========================================================================== //
//  TcpListener                                                               //
// ========================================================================== //

TcpListener::~TcpListener()
{
    close();
}

core::Expected<void> TcpListener::open(const std::string &host, core::u16 port, core::u32 backlog)
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "not an IPv4 address: " + host);
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return core::makeError(core::ErrorCode::kNetworkBindFailed, "socket() failed: " + lastError());
    }

    const int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
        core::Log::warn(kTag, "SO_REUSEADDR not applied: " + lastError());

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, static_cast<int>(backlog)) < 0)
    {
        const std::string reason = lastError();
        ::close(fd);
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               "cannot listen on " + host + ":" + std::to_string(port) + ": " + reason);
    }

    socklen_t length = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &length) == 0)
        _port = ntohs(addr.sin_port);
    else
        _port = port;

    _fd.store(fd);
    core::Log::info(kTag, "listening on " + host + ":" + std::to_string(_port));
    return {};
}

core::Expected<TcpStream> TcpListener::accept()
{
    for (;;)
    {
        const int listenFd = _fd.load();
        if (listenFd < 0)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "listener closed");
        }

        sockaddr_in peer{};
        socklen_t   length = sizeof(peer);
        const int fd = ::accept4(listenFd, reinterpret_cast<sockaddr *>(&peer), &length, SOCK_CLOEXEC);
        if (fd >= 0)
        {
            char text[INET_ADDRSTRLEN] = {};
            ::inet_ntop(AF_INET, &peer.sin_addr, text, sizeof(text));
            return TcpStream{fd, std::string{text} + ":" + std::to_string(ntohs(peer.sin_port))};
        }
        if (errno == EINTR || errno == ECONNABORTED)
            continue;
        if (_fd.load() < 0)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "listener closed");
        }
        return core::makeError(core::ErrorCode::kNetworkReceiveFailed, "accept() failed: " + lastError());
    }
}

void TcpListener::close() noexcept
{
    const int fd = _fd.exchange(-1);
    if (fd >= 0)
    {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

} // namespace gpo::net
