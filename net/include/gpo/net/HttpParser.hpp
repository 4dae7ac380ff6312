/**
 * @file HttpParser.hpp
 * @brief Incremental HTTP/1.1 request parser.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_NET_HTTPPARSER_HPP
    #define GPO_NET_HTTPPARSER_HPP

#include <gpo/net/HttpMessage.hpp>
#include <gpo/core/Constants.hpp>
#include <gpo/core/Expected.hpp>

#include <string>
#include <string_view>

namespace gpo::net {

/**
 * @class HttpParser
 * @brief Accumulates bytes until one full request (head + Content-Length body) is available.
 *
 * Bytes past the end of a complete request are kept for the next one
 * (pipelining).  Chunked transfer encoding is rejected.
 */
class HttpParser final
{
public:
    explicit HttpParser(core::usize maxHeaderBytes = core::kMaxHeaderBytes,
                        core::usize maxBodyBytes   = core::kMaxBodyBytes) noexcept;

    /**
     * @brief Appends @p data.
     * @return true once a request is complete, false if more bytes are
     *         needed; ProtocolViolation on malformed input, PayloadTooLarge
     *         when a limit is exceeded.
     */
    [[nodiscard]] core::Expected<bool> feed(std::string_view data);

    /** @brief Moves out the completed request and starts on the next one. */
    [[nodiscard]] HttpRequest take();

    /** @brief Whether unconsumed bytes are buffered. */
    [[nodiscard]] bool hasBufferedData() const noexcept { return !_buffer.empty(); }

private:
    [[nodiscard]] core::Expected<bool> advance();
    [[nodiscard]] core::Expected<void> parseHead(std::string_view head);

    core::usize _maxHeaderBytes;
    core::usize _maxBodyBytes;
    std::string _buffer;
    HttpRequest _request;
    bool        _headParsed{false};
    bool        _complete{false};
    core::usize _bodyOffset{0};
    core::usize _contentLength{0};
};

} // namespace gpo::net

#endif // GPO_NET_HTTPPARSER_HPP
