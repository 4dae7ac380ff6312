/**
 * @file TcpSocket.hpp
 * @brief Blocking POSIX TCP listener and connected stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_NET_TCPSOCKET_HPP
    #define GPO_NET_TCPSOCKET_HPP

#include <gpo/core/Expected.hpp>
#include <gpo/core/NonCopyable.hpp>
#include <gpo/core/Types.hpp>

#include <atomic>
#include <chrono>
#include <span>
#include <string>

namespace gpo::net {

/**
 * @class TcpStream
 * @brief Owns one connected socket; closed on destruction.
 */
class TcpStream final : public core::NonCopyable<TcpStream>
{
public:
    TcpStream() noexcept = default;
    explicit TcpStream(int fd, std::string peer = {}) noexcept;

    TcpStream(TcpStream &&other) noexcept;
    TcpStream &operator=(TcpStream &&other) noexcept;
    ~TcpStream();

    /** @brief Applies @p timeout to both receive and send. */
    [[nodiscard]] core::Expected<void> setTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Reads at most @p buffer.size() bytes.
     * @return Bytes read (0 when the peer closed), or NetworkReceiveFailed
     *         (Timeout when the receive timeout expired).
     */
    [[nodiscard]] core::Expected<core::usize> receive(std::span<char> buffer);

    /** @brief Writes the whole of @p data. */
    [[nodiscard]] core::Expected<void> sendAll(std::string_view data);

    /** @brief Unblocks pending I/O from another thread without releasing the fd. */
    void shutdown() noexcept;

    void close() noexcept;

    [[nodiscard]] int                fd() const noexcept { return _fd; }
    [[nodiscard]] bool               isOpen() const noexcept { return _fd >= 0; }
    [[nodiscard]] const std::string &peer() const noexcept { return _peer; }

private:
    int         _fd{-1};
    std::string _peer;
};

/**
 * @class TcpListener
 * @brief Listening IPv4 socket.
 *
 * @ref close may be called from another thread to unblock @ref accept.
 */
class TcpListener final : public core::NonCopyable<TcpListener>
{
public:
    TcpListener() noexcept = default;
    ~TcpListener();

    /**
     * @brief Binds @p host:@p port (port 0 picks an ephemeral port).
     * @return NetworkBindFailed or InvalidArgument on failure.
     */
    [[nodiscard]] core::Expected<void> open(const std::string &host, core::u16 port, core::u32 backlog);

    /** @brief Blocks for the next connection; InvalidState once closed. */
    [[nodiscard]] core::Expected<TcpStream> accept();

    void close() noexcept;

    /** @brief The bound port (resolved when 0 was requested). */
    [[nodiscard]] core::u16 port() const noexcept { return _port; }
    [[nodiscard]] bool      isOpen() const noexcept { return _fd.load() >= 0; }

private:
    std::atomic<int> _fd{-1};
    core::u16        _port{0};
};

} // namespace gpo::net

#endif // GPO_NET_TCPSOCKET_HPP
