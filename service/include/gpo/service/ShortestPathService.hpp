/**
 * @file ShortestPathService.hpp
 * @brief JSON request handler for POST /shortest and GET /health.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_SERVICE_SHORTESTPATHSERVICE_HPP
    #define GPO_SERVICE_SHORTESTPATHSERVICE_HPP

#include <gpo/pathfinding/GridPathFinder.hpp>
#include <gpo/net/HttpServer.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <string>
#include <string_view>

namespace gpo::service {

/** @brief A decoded, validated POST /shortest body. */
struct ShortestPathRequest
{
    pathfinding::Grid grid;
    pathfinding::Node start;
    pathfinding::Node goal;
};

/**
 * @class ShortestPathService
 * @brief Decodes requests, calls the finder once per request, encodes the result.
 *
 * Responses are @c {"path":[[x,y],...],"status":"ok","cost":N},
 * @c {"path":[],"status":"no_path"} or
 * @c {"path":[],"status":"error","message":"..."}.
 */
class ShortestPathService final : public core::NonCopyable<ShortestPathService>
{
public:
    ShortestPathService(pathfinding::GridPathFinder &finder,
                        gpu::DeviceRegistry         &registry,
                        gpu::ProgramCache           &cache,
                        core::u32                    maxCells = core::kMaxCells);

    /**
     * @brief Parses and validates @p body.
     *
     * Checks run in a fixed order: empty data, non-positive dimensions, grid
     * larger than the configured cell limit, value count, value types and
     * range, start/goal bounds, distance overflow.  Every failure is
     * InvalidArgument.
     */
    [[nodiscard]] core::Expected<ShortestPathRequest> decode(std::string_view body) const;

    /** @brief Encodes a finder result. */
    [[nodiscard]] static std::string encode(const pathfinding::PathResult &result);

    /** @brief HTTP status for a failed request. */
    [[nodiscard]] static core::u16 statusFor(core::ErrorCode code) noexcept;

    /** @brief JSON error body, also used for router and parser rejections. */
    [[nodiscard]] static net::HttpResponse errorResponse(core::u16 status, std::string_view message);

    [[nodiscard]] net::HttpResponse handleShortest(const net::HttpRequest &request);
    [[nodiscard]] net::HttpResponse handleHealth(const net::HttpRequest &request);

    /** @brief Installs both routes and the JSON error responder on @p server. */
    void registerRoutes(net::HttpServer &server);

private:
    void recoverFromDeviceLoss();

    pathfinding::GridPathFinder &_finder;
    gpu::DeviceRegistry         &_registry;
    gpu::ProgramCache           &_cache;
    core::u32                    _maxCells;
};

} // namespace gpo::service

#endif // GPO_SERVICE_SHORTESTPATHSERVICE_HPP
