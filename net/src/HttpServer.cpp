/**
 * @file HttpServer.cpp
 * @brief HttpServer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/net/HttpServer.hpp>
#include <gpo/net/HttpParser.hpp>
#include <gpo/net/TcpSocket.hpp>
#include <gpo/concurrency/ThreadPool.hpp>
#include <gpo/core/Log.hpp>

#include <array>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace gpo::net {

namespace {

constexpr const char *kTag         = "NET";
constexpr core::usize kReadChunk   = 8 * 1024;

struct Route
{
    std::string method;
    std::string path;
    Handler     handler;
};

HttpResponse plainError(core::u16 status, std::string_view message)
{
    HttpResponse response;
    response.status = status;
    response.body   = std::string{message} + "\n";
    response.setHeader("Content-Type", "text/plain; charset=utf-8");
    return response;
}

core::u16 statusFor(const core::Error &error) noexcept
{
    return error.code() == core::ErrorCode::kPayloadTooLarge ? 413 : 400;
}

} // anonymous namespace

struct HttpServer::Impl
{
    ServerOptions                             options;
    std::vector<Route>                        routes;
    ErrorResponder                            onError{&plainError};

    TcpListener                               listener;
    std::unique_ptr<concurrency::ThreadPool>  pool;
    std::thread                               acceptor;
    std::atomic<bool>                         running{false};

    std::mutex                                connectionsMutex;
    std::unordered_set<TcpStream *>           connections;

    std::mutex                                stateMutex;
    std::condition_variable                   stateChanged;

    explicit Impl(ServerOptions opts) : options{std::move(opts)} {}

    HttpResponse dispatch(const HttpRequest &request) const
    {
        std::string allowed;
        for (const auto &route : routes)
        {
            if (route.path != request.path)
                continue;
            if (route.method == request.method)
            {
                try
                {
                    return route.handler(request);
                }
                catch (const std::exception &e)
                {
                    core::Log::error(kTag, request.method + " " + request.path + " failed: " + e.what());
                    return onError(500, "internal error");
                }
            }
            if (!allowed.empty())
                allowed += ", ";
            allowed += route.method;
        }

        if (allowed.empty())
            return onError(404, "no route for " + request.path);

        HttpResponse response = onError(405, request.method + " is not allowed on " + request.path);
        response.setHeader("Allow", allowed);
        return response;
    }

    void acceptLoop()
    {
        while (running.load())
        {
            auto stream = listener.accept();
            if (!stream)
            {
                if (running.load())
                    core::Log::warn(kTag, stream.error().describe());
                if (!listener.isOpen())
                    break;
                continue;
            }

            auto connection = std::make_shared<TcpStream>(std::move(*stream));
            pool->post([this, connection] { serve(*connection); });
        }
    }

    void serve(TcpStream &stream)
    {
        {
            std::lock_guard<std::mutex> lock{connectionsMutex};
            connections.insert(&stream);
        }
        if (!running.load())
            stream.shutdown();

        if (auto timeout = stream.setTimeout(options.socketTimeout); !timeout)
            core::Log::warn(kTag, timeout.error().describe());

        HttpParser parser{options.maxHeaderBytes, options.maxBodyBytes};
        std::array<char, kReadChunk> chunk{};
        bool keepAlive = true;

        while (keepAlive)
        {
            auto ready = parser.feed({});
            while (ready && !*ready)
            {
                auto received = stream.receive(chunk);
                if (!received || *received == 0)
                {
                    if (!received && received.error().code() != core::ErrorCode::kTimeout)
                        core::Log::debug(kTag, stream.peer() + ": " + received.error().describe());
                    keepAlive = false;
                    break;
                }
                ready = parser.feed(std::string_view{chunk.data(), *received});
            }
            if (!keepAlive)
                break;

            if (!ready)
            {
                core::Log::warn(kTag, stream.peer() + ": " + ready.error().describe());
                const HttpResponse response = onError(statusFor(ready.error()), ready.error().message());
                if (auto sent = stream.sendAll(response.serialize(false)); !sent)
                    core::Log::debug(kTag, sent.error().describe());
                break;
            }

            const HttpRequest request  = parser.take();
            const HttpResponse response = dispatch(request);
            keepAlive = request.keepAlive() && running.load();

            if (core::Log::enabled(core::LogLevel::kDebug))
                core::Log::debug(kTag, request.method + " " + request.target + " -> " + std::to_string(response.status));

            if (auto sent = stream.sendAll(response.serialize(keepAlive)); !sent)
            {
                core::Log::debug(kTag, stream.peer() + ": " + sent.error().describe());
                break;
            }
        }

        std::lock_guard<std::mutex> lock{connectionsMutex};
        connections.erase(&stream);
    }
};

HttpServer::HttpServer(ServerOptions options)
    : _impl{std::make_unique<Impl>(std::move(options))}
{}

HttpServer::~HttpServer()
{
    stop();
}

void HttpServer::route(std::string method, std::string path, Handler handler)
{
    _impl->routes.push_back(Route{std::move(method), std::move(path), std::move(handler)});
}

void HttpServer::setErrorResponder(ErrorResponder responder)
{
    _impl->onError = std::move(responder);
}

core::Expected<void> HttpServer::start()
{
    if (_impl->running.load())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "server already running");
    }

    GPO_TRY_VOID(_impl->listener.open(_impl->options.host, _impl->options.port, core::kListenBacklog));

    _impl->pool = std::make_unique<concurrency::ThreadPool>(kTag, _impl->options.workers);
    _impl->running.store(true);
    _impl->acceptor = std::thread{[impl = _impl.get()] { impl->acceptLoop(); }};

    core::Log::info(kTag, "serving with " + std::to_string(_impl->pool->threadCount()) + " workers");
    return {};
}

void HttpServer::stop()
{
    if (!_impl->running.exchange(false))
        return;

    _impl->listener.close();
    if (_impl->acceptor.joinable())
        _impl->acceptor.join();

    {
        std::lock_guard<std::mutex> lock{_impl->connectionsMutex};
        for (auto *connection : _impl->connections)
            connection->shutdown();
    }
    _impl->pool->shutdown();
    _impl->pool.reset();

    {
        std::lock_guard<std::mutex> lock{_impl->stateMutex};
        _impl->stateChanged.notify_all();
    }
    core::Log::info(kTag, "server stopped");
}

void HttpServer::wait()
{
    std::unique_lock<std::mutex> lock{_impl->stateMutex};
    _impl->stateChanged.wait(lock, [this] { return !_impl->running.load(); });
}

HttpResponse HttpServer::dispatch(const HttpRequest &request) const
{
    return _impl->dispatch(request);
}

core::u16 HttpServer::port() const noexcept
{
    return _impl->listener.port();
}

bool HttpServer::running() const noexcept
{
    return _impl->running.load();
}

} // namespace gpo::net
