/**
 * @file ShortestPathService.cpp
 * @brief ShortestPathService implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/service/ShortestPathService.hpp>
#include <gpo/core/Log.hpp>

#include <nlohmann/json.hpp>

#include <limits>
#include <optional>

namespace gpo::service {

namespace {

using nlohmann::json;
using nlohmann::ordered_json;

constexpr const char *kTag = "SVC";

core::Unexpected rejected(std::string message)
{
    return core::makeError(core::ErrorCode::kInvalidArgument, std::move(message));
}

/// Reads a positive integer dimension; absent, negative, zero and non-integers are rejected.
core::Expected<core::u32> readDimension(const json &body, const char *field)
{
    const auto it = body.find(field);
    if (it == body.end())
        return rejected(std::string{"missing field '"} + field + "'");
    if (!it->is_number_integer())
        return rejected(std::string{"'"} + field + "' must be an integer");
    if (!it->is_number_unsigned() || it->get<core::u64>() == 0)
        return rejected(std::string{"'"} + field + "' must be positive");
    if (it->get<core::u64>() > std::numeric_limits<core::u32>::max())
        return rejected(std::string{"'"} + field + "' is too large");
    return static_cast<core::u32>(it->get<core::u64>());
}

/// Reads an optional @c [x, y] pair and checks it against the grid bounds.
core::Expected<std::optional<pathfinding::Node>> readNode(const json &body, const char *field,
                                                          core::u32 width, core::u32 height)
{
    const auto it = body.find(field);
    if (it == body.end() || it->is_null())
        return std::optional<pathfinding::Node>{};

    if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number_unsigned() || !(*it)[1].is_number_unsigned())
        return rejected(std::string{"'"} + field + "' must be an [x, y] pair of non-negative integers");

    const core::u64 x = (*it)[0].get<core::u64>();
    const core::u64 y = (*it)[1].get<core::u64>();
    if (x >= width || y >= height)
    {
        return rejected(std::string{"'"} + field + "' [" + std::to_string(x) + ", " + std::to_string(y) +
                        "] is outside the " + std::to_string(width) + "x" + std::to_string(height) + " grid");
    }
    return pathfinding::Node{static_cast<core::u32>(x), static_cast<core::u32>(y)};
}

bool isDeviceLoss(core::ErrorCode code) noexcept
{
    return code == core::ErrorCode::kDeviceError;
}

} // anonymous namespace

ShortestPathService::ShortestPathService(pathfinding::GridPathFinder &finder,
                                         gpu::DeviceRegistry         &registry,
                                         gpu::ProgramCache           &cache,
                                         core::u32                    maxCells)
    : _finder{finder}
    , _registry{registry}
    , _cache{cache}
    , _maxCells{maxCells}
{}

core::Expected<ShortestPathRequest> ShortestPathService::decode(std::string_view body) const
{
    const json document = json::parse(body.begin(), body.end(), nullptr, false);
    if (document.is_discarded())
        return rejected("request body is not valid JSON");
    if (!document.is_object())
        return rejected("request body must be a JSON object");

    const auto data = document.find("data");
    if (data == document.end() || !data->is_array())
        return rejected("'data' must be an array");
    if (data->empty())
        return rejected("'data' must not be empty");

    const core::u32 width  = GPO_TRY(readDimension(document, "width"));
    const core::u32 height = GPO_TRY(readDimension(document, "height"));

    const core::u64 cells = static_cast<core::u64>(width) * height;
    if (cells > _maxCells)
    {
        return rejected("grid of " + std::to_string(cells) + " cells exceeds the limit of " +
                        std::to_string(_maxCells));
    }
    if (data->size() != cells)
    {
        return rejected("'data' has " + std::to_string(data->size()) + " values, width*height is " +
                        std::to_string(cells));
    }

    std::vector<core::u32> values;
    values.reserve(data->size());
    for (core::usize i = 0; i < data->size(); ++i)
    {
        const json &value = (*data)[i];
        if (!value.is_number_integer())
            return rejected("data[" + std::to_string(i) + "] is not an integer");
        if (!value.is_number_unsigned() || value.get<core::u64>() > std::numeric_limits<core::u32>::max())
            return rejected("data[" + std::to_string(i) + "] is outside [0, 4294967295]");
        values.push_back(static_cast<core::u32>(value.get<core::u64>()));
    }

    const auto start = GPO_TRY(readNode(document, "start", width, height));
    const auto goal  = GPO_TRY(readNode(document, "goal", width, height));

    auto grid = GPO_TRY(pathfinding::Grid::create(width, height, std::move(values)));
    GPO_TRY_VOID(grid.unreachedSentinel());

    const pathfinding::Node from = start.value_or(pathfinding::Node{0, 0});
    const pathfinding::Node to   = goal ? *goal : grid.minimumNode();
    return ShortestPathRequest{std::move(grid), from, to};
}

std::string ShortestPathService::encode(const pathfinding::PathResult &result)
{
    ordered_json out;
    out["path"] = ordered_json::array();
    for (const auto &node : result.nodes)
        out["path"].push_back(ordered_json::array({node.x, node.y}));
    out["status"] = std::string{pathfinding::toString(result.status)};
    if (result.status == pathfinding::PathStatus::kOk)
        out["cost"] = result.cost;
    return out.dump();
}

core::u16 ShortestPathService::statusFor(core::ErrorCode code) noexcept
{
    switch (code)
    {
        case core::ErrorCode::kPayloadTooLarge:
            return 413;
        case core::ErrorCode::kTimeout:
            return 504;
        default:
            break;
    }

    switch (core::categoryOf(code))
    {
        case core::ErrorCategory::kInput:
        case core::ErrorCategory::kProtocol:
            return 400;
        case core::ErrorCategory::kPlatform:
        case core::ErrorCategory::kBuild:
        case core::ErrorCategory::kCompute:
            return 502;
        default:
            return 500;
    }
}

net::HttpResponse ShortestPathService::errorResponse(core::u16 status, std::string_view message)
{
    ordered_json out;
    out["path"]    = ordered_json::array();
    out["status"]  = "error";
    out["message"] = std::string{message};
    return net::HttpResponse::json(status, out.dump(-1, ' ', false, json::error_handler_t::replace));
}

net::HttpResponse ShortestPathService::handleShortest(const net::HttpRequest &request)
{
    auto decoded = decode(request.body);
    if (!decoded)
    {
        core::Log::debug(kTag, "rejected request: " + decoded.error().message());
        return errorResponse(400, decoded.error().message());
    }

    auto result = _finder.findPath(decoded->grid, decoded->start, decoded->goal);
    if (!result)
    {
        const core::u16 status = statusFor(result.error().code());
        if (status >= 500)
            core::Log::error(kTag, result.error().describe());
        else
            core::Log::debug(kTag, result.error().describe());

        if (isDeviceLoss(result.error().code()))
            recoverFromDeviceLoss();
        return errorResponse(status, result.error().describe());
    }

    return net::HttpResponse::json(200, encode(*result));
}

net::HttpResponse ShortestPathService::handleHealth(const net::HttpRequest &)
{
    auto device = _registry.selected();
    if (!device)
        return errorResponse(503, device.error().describe());

    ordered_json out;
    out["status"] = "ok";
    out["device"] = device->name;
    out["backend"] = gpu::toString(device->backend);
    return net::HttpResponse::json(200, out.dump(-1, ' ', false, json::error_handler_t::replace));
}

void ShortestPathService::registerRoutes(net::HttpServer &server)
{
    server.route("POST", "/shortest", [this](const net::HttpRequest &request) { return handleShortest(request); });
    server.route("GET", "/health", [this](const net::HttpRequest &request) { return handleHealth(request); });
    server.setErrorResponder(&ShortestPathService::errorResponse);
}

void ShortestPathService::recoverFromDeviceLoss()
{
    // Programs are tied to the lost context; the next request re-selects.
    if (auto device = _registry.selected())
        _cache.invalidate(device->identity());
    _registry.reset();
    core::Log::warn(kTag, "device lost, selection reset");
}

} // namespace gpo::service
