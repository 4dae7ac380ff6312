/**
 * @file HttpMessage.hpp
 * @brief HTTP/1.1 request and response value types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_NET_HTTPMESSAGE_HPP
    #define GPO_NET_HTTPMESSAGE_HPP

#include <gpo/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gpo::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest
{
    std::string method;
    /// Request target as received (path and query).
    std::string target;
    /// Target without the query string.
    std::string path;
    std::string version;
    HeaderList  headers;
    std::string body;

    /** @brief First header named @p name (case-insensitive). */
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    /** @brief HTTP/1.1 defaults to keep-alive; "Connection: close" disables it. */
    [[nodiscard]] bool keepAlive() const;
};

struct HttpResponse
{
    core::u16   status{200};
    HeaderList  headers;
    std::string body;

    [[nodiscard]] static HttpResponse json(core::u16 status, std::string body);

    void setHeader(std::string name, std::string value);

    /** @brief Status line, headers (Content-Length added) and body. */
    [[nodiscard]] std::string serialize(bool keepAlive) const;
};

/** @brief Standard reason phrase of @p status ("Not Found", ...). */
[[nodiscard]] const char *reasonPhrase(core::u16 status) noexcept;

/** @brief ASCII case-insensitive equality. */
[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

} // namespace gpo::net

#endif // GPO_NET_HTTPMESSAGE_HPP
