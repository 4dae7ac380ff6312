/**
 * @file HttpMessage.cpp
 * @brief HTTP message helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/net/HttpMessage.hpp>

#include <cctype>

namespace gpo::net {

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (core::usize i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::optional<std::string_view> HttpRequest::header(std::string_view name) const
{
    for (const auto &[key, value] : headers)
    {
        if (equalsIgnoreCase(key, name))
            return std::string_view{value};
    }
    return std::nullopt;
}

bool HttpRequest::keepAlive() const
{
    const auto connection = header("Connection");
    if (version == "HTTP/1.0")
        return connection && equalsIgnoreCase(*connection, "keep-alive");
    return !connection || !equalsIgnoreCase(*connection, "close");
}

HttpResponse HttpResponse::json(core::u16 status, std::string body)
{
    HttpResponse response;
    response.status = status;
    response.body   = std::move(body);
    response.setHeader("Content-Type", "application/json");
    return response;
}

void HttpResponse::setHeader(std::string name, std::string value)
{
    for (auto &[key, current] : headers)
    {
        if (equalsIgnoreCase(key, name))
        {
            current = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::string HttpResponse::serialize(bool keepAlive) const
{
    std::string out;
    out.reserve(128 + body.size());
    out += "HTTP/1.1 ";
    out += std::to_string(status);
    out += ' ';
    out += reasonPhrase(status);
    out += "\r\n";

    for (const auto &[key, value] : headers)
    {
        if (equalsIgnoreCase(key, "Content-Length") || equalsIgnoreCase(key, "Connection"))
            continue;
        out += key;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    out += body;
    return out;
}

const char *reasonPhrase(core::u16 status) noexcept
{
    switch (status)
    {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

} // namespace gpo::net
