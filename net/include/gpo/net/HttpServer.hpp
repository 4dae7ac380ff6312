/**
 * @file HttpServer.hpp
 * @brief Minimal HTTP/1.1 server with a (method, path) router.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_NET_HTTPSERVER_HPP
    #define GPO_NET_HTTPSERVER_HPP

#include <gpo/net/HttpMessage.hpp>
#include <gpo/core/Constants.hpp>
#include <gpo/core/Expected.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace gpo::net {

using Handler = std::function<HttpResponse(const HttpRequest &)>;

/// Builds the response for a request the router or parser rejected.
using ErrorResponder = std::function<HttpResponse(core::u16 status, std::string_view message)>;

struct ServerOptions
{
    std::string               host{"127.0.0.1"};
    /// 0 binds an ephemeral port (see HttpServer::port()).
    core::u16                 port{core::kDefaultPort};
    core::u32                 workers{core::kDefaultWorkers};
    core::usize               maxHeaderBytes{core::kMaxHeaderBytes};
    core::usize               maxBodyBytes{core::kMaxBodyBytes};
    std::chrono::milliseconds socketTimeout{core::kSocketTimeoutMs};
};

/**
 * @class HttpServer
 * @brief Accept loop on a dedicated thread, one pool task per connection.
 *
 * Unknown paths get 404, known paths with another method 405, malformed
 * requests 400 and oversized ones 413.  A handler that throws produces a
 * 500 and the server keeps serving.
 */
class HttpServer final : public core::NonMovable<HttpServer>
{
public:
    explicit HttpServer(ServerOptions options);
    ~HttpServer();

    /** @brief Registers @p handler; must be called before @ref start. */
    void route(std::string method, std::string path, Handler handler);

    /** @brief Replaces the plain-text body used for 400/404/405/413/500. */
    void setErrorResponder(ErrorResponder responder);

    /** @brief Binds, listens and starts accepting; NetworkBindFailed on error. */
    [[nodiscard]] core::Expected<void> start();

    /** @brief Stops accepting, interrupts open connections and joins the workers. */
    void stop();

    /** @brief Blocks until @ref stop is called from another thread. */
    void wait();

    /** @brief Routes @p request without any socket involved. */
    [[nodiscard]] HttpResponse dispatch(const HttpRequest &request) const;

    [[nodiscard]] core::u16 port() const noexcept;
    [[nodiscard]] bool      running() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gpo::net

#endif // GPO_NET_HTTPSERVER_HPP
