/**
 * @file Server.cpp
 * @brief Server implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/service/Server.hpp>
#include <gpo/service/ShortestPathService.hpp>
#include <gpo/pathfinding/GridPathFinder.hpp>
#include <gpo/pathfinding/NativeKernels.hpp>
#include <gpo/gpu/OpenCLBackend.hpp>
#include <gpo/gpu/ProgramCache.hpp>
#include <gpo/gpu/SoftwareBackend.hpp>
#include <gpo/net/HttpServer.hpp>
#include <gpo/core/Log.hpp>

namespace gpo::service {

namespace {

constexpr const char *kTag = "SVC";

gpu::SelectionPolicy policyFrom(const Config &config)
{
    gpu::SelectionPolicy policy;
    policy.allowSoftware = config.allowSoftware();
    policy.nameFilter    = config.deviceFilter();
    return policy;
}

net::ServerOptions serverOptionsFrom(const Config &config)
{
    net::ServerOptions options;
    options.host         = config.host();
    options.port         = config.port();
    options.workers      = config.workers();
    options.maxBodyBytes = config.maxBodyBytes();
    return options;
}

std::vector<std::unique_ptr<gpu::IComputeBackend>> defaultBackends()
{
    std::vector<std::unique_ptr<gpu::IComputeBackend>> backends;
    backends.push_back(std::make_unique<gpu::OpenCLBackend>());

    auto software = std::make_unique<gpu::SoftwareBackend>();
    pathfinding::registerNativeKernels(*software);
    backends.push_back(std::move(software));
    return backends;
}

} // anonymous namespace

struct Server::Impl
{
    Config                       config;
    gpu::DeviceRegistry          registry;
    gpu::ProgramCache            cache;
    pathfinding::GridPathFinder  finder;
    ShortestPathService          service;
    net::HttpServer              http;
    bool                         ready{false};

    Impl(Config cfg, std::vector<std::unique_ptr<gpu::IComputeBackend>> backends)
        : config{std::move(cfg)}
        , registry{policyFrom(config)}
        , cache{config.buildTimeout()}
        , finder{registry, cache, pathfinding::FinderOptions{config.requestTimeout()}}
        , service{finder, registry, cache, config.maxCells()}
        , http{serverOptionsFrom(config)}
    {
        for (auto &backend : backends)
            registry.addBackend(std::move(backend));
        service.registerRoutes(http);
    }
};

Server::Server(Config config)
    : Server{std::move(config), defaultBackends()}
{}

Server::Server(Config config, std::vector<std::unique_ptr<gpu::IComputeBackend>> backends)
    : _impl{std::make_unique<Impl>(std::move(config), std::move(backends))}
{}

Server::~Server()
{
    stop();
}

core::Expected<gpu::DeviceDescriptor> Server::init()
{
    auto device = _impl->finder.warmUp();
    if (!device)
    {
        core::Log::fatal(kTag, "warm-up failed: " + device.error().describe());
        return std::unexpected(device.error());
    }

    core::Log::info(kTag, "using " + device->summary());
    _impl->ready = true;
    return device;
}

core::Expected<void> Server::start()
{
    if (!_impl->ready)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "server started before a successful init()");
    }

    GPO_TRY_VOID(_impl->http.start());
    core::Log::info(kTag, "listening on " + _impl->config.host() + ":" + std::to_string(_impl->http.port()));
    return {};
}

void Server::stop()
{
    _impl->http.stop();
}

void Server::wait()
{
    _impl->http.wait();
}

core::Expected<std::vector<gpu::DeviceDescriptor>> Server::rankedDevices()
{
    auto devices = GPO_TRY(_impl->registry.listDevices());
    return gpu::DeviceRegistry::rank(std::move(devices), _impl->registry.policy());
}

const Config &Server::config() const noexcept
{
    return _impl->config;
}

core::u16 Server::port() const noexcept
{
    return _impl->http.port();
}

} // namespace gpo::service
