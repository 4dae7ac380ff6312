/**
 * @file HttpParser.cpp
 * @brief Incremental HTTP/1.1 request parser implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/net/HttpParser.hpp>

#include <charconv>

namespace gpo::net {

namespace {

constexpr std::string_view kCrlf        = "\r\n";
constexpr std::string_view kHeadEnd     = "\r\n\r\n";

std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

bool isToken(std::string_view text) noexcept
{
    if (text.empty())
        return false;
    for (const char c : text)
    {
        if (c <= ' ' || c >= 127 || c == ':' || c == '(' || c == ')' || c == ',' || c == '/' ||
            c == ';' || c == '<' || c == '>' || c == '=' || c == '?' || c == '@' || c == '[' ||
            c == ']' || c == '{' || c == '}' || c == '"' || c == '\\')
            return false;
    }
    return true;
}

core::Unexpected violation(std::string message)
{
    return core::makeError(core::ErrorCode::kProtocolViolation, std::move(message));
}

} // anonymous namespace

HttpParser::HttpParser(core::usize maxHeaderBytes, core::usize maxBodyBytes) noexcept
    : _maxHeaderBytes{maxHeaderBytes}
    , _maxBodyBytes{maxBodyBytes}
{}

core::Expected<bool> HttpParser::feed(std::string_view data)
{
    _buffer.append(data);
    if (_complete)
        return true;
    return advance();
}

HttpRequest HttpParser::take()
{
    HttpRequest request = std::move(_request);
    _request       = HttpRequest{};
    _headParsed    = false;
    _complete      = false;
    _bodyOffset    = 0;
    _contentLength = 0;
    return request;
}

core::Expected<bool> HttpParser::advance()
{
    if (!_headParsed)
    {
        // Empty lines before a request line are ignored.
        while (_buffer.starts_with(kCrlf))
            _buffer.erase(0, kCrlf.size());

        const auto end = _buffer.find(kHeadEnd);
        if (end == std::string::npos)
        {
            if (_buffer.size() > _maxHeaderBytes)
            {
                return core::makeError(core::ErrorCode::kPayloadTooLarge, "request head too large");
            }
            return false;
        }
        if (end + kHeadEnd.size() > _maxHeaderBytes)
        {
            return core::makeError(core::ErrorCode::kPayloadTooLarge, "request head too large");
        }

        GPO_TRY_VOID(parseHead(std::string_view{_buffer}.substr(0, end)));
        _bodyOffset = end + kHeadEnd.size();
        _headParsed = true;
    }

    if (_buffer.size() - _bodyOffset < _contentLength)
        return false;

    _request.body = _buffer.substr(_bodyOffset, _contentLength);
    _buffer.erase(0, _bodyOffset + _contentLength);
    _complete = true;
    return true;
}

core::Expected<void> HttpParser::parseHead(std::string_view head)
{
    auto lineEnd = head.find(kCrlf);
    const std::string_view requestLine = head.substr(0, lineEnd);
    head = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + kCrlf.size());

    const auto firstSpace  = requestLine.find(' ');
    const auto secondSpace = firstSpace == std::string_view::npos ? firstSpace : requestLine.find(' ', firstSpace + 1);
    if (secondSpace == std::string_view::npos || requestLine.find(' ', secondSpace + 1) != std::string_view::npos)
    {
        return violation("malformed request line");
    }

    const auto method  = requestLine.substr(0, firstSpace);
    const auto target  = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
    const auto version = requestLine.substr(secondSpace + 1);

    if (!isToken(method))
        return violation("malformed method");
    if (target.empty() || target.front() != '/')
        return violation("request target must be an absolute path");
    if (version != "HTTP/1.1" && version != "HTTP/1.0")
        return violation("unsupported protocol version");

    _request.method  = std::string{method};
    _request.target  = std::string{target};
    _request.path    = std::string{target.substr(0, target.find('?'))};
    _request.version = std::string{version};

    bool haveLength = false;
    while (!head.empty())
    {
        lineEnd = head.find(kCrlf);
        const std::string_view line = head.substr(0, lineEnd);
        head = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + kCrlf.size());

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || !isToken(line.substr(0, colon)))
            return violation("malformed header line");

        const auto name  = line.substr(0, colon);
        const auto value = trim(line.substr(colon + 1));

        if (equalsIgnoreCase(name, "Transfer-Encoding"))
            return violation("Transfer-Encoding is not supported");

        if (equalsIgnoreCase(name, "Content-Length"))
        {
            core::u64 length = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty())
                return violation("invalid Content-Length");
            if (haveLength && length != _contentLength)
                return violation("conflicting Content-Length headers");
            if (length > _maxBodyBytes)
            {
                return core::makeError(core::ErrorCode::kPayloadTooLarge,
                                       "body of " + std::to_string(length) + " bytes exceeds the limit of " +
                                       std::to_string(_maxBodyBytes));
            }
            _contentLength = static_cast<core::usize>(length);
            haveLength     = true;
        }

        _request.headers.emplace_back(std::string{name}, std::string{value});
    }
    return {};
}

} // namespace gpo::net
