/**
 * @file DeviceDescriptor.cpp
 * @brief DeviceDescriptor helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/DeviceDescriptor.hpp>

#include <algorithm>

namespace gpo::gpu {

const char *toString(BackendKind kind) noexcept
{
    switch (kind)
    {
    case BackendKind::kOpenCL:   return "opencl";
    case BackendKind::kSoftware: return "software";
    }
    return "unknown";
}

const char *toString(DeviceType type) noexcept
{
    switch (type)
    {
    case DeviceType::kGpu:         return "gpu";
    case DeviceType::kCpu:         return "cpu";
    case DeviceType::kAccelerator: return "accelerator";
    case DeviceType::kSoftware:    return "software";
    case DeviceType::kOther:       return "other";
    }
    return "unknown";
}

std::string DeviceDescriptor::identity() const
{
    std::string id{toString(backend)};
    id += '|';
    id += platformName;
    id += '|';
    id += deviceId;
    id += '|';
    id += name;
    id += '|';
    id += driverVersion;
    return id;
}

bool DeviceDescriptor::hasExtension(std::string_view extension) const noexcept
{
    return std::any_of(extensions.begin(), extensions.end(),
                       [extension](const std::string& e) { return e == extension; });
}

std::string DeviceDescriptor::summary() const
{
    std::string out = name.empty() ? deviceId : name;
    out += " [";
    out += toString(backend);
    out += '/';
    out += toString(type);
    out += hardware ? ", hardware" : ", emulated";
    out += ", ";
    out += std::to_string(computeUnits);
    out += " CU";
    if (!driverVersion.empty())
    {
        out += ", driver ";
        out += driverVersion;
    }
    out += ']';
    return out;
}

std::vector<std::string> splitExtensions(std::string_view list)
{
    std::vector<std::string> out;
    core::usize pos = 0;
    while (pos < list.size())
    {
        const core::usize start = list.find_first_not_of(' ', pos);
        if (start == std::string_view::npos)
            break;
        core::usize end = list.find(' ', start);
        if (end == std::string_view::npos)
            end = list.size();
        out.emplace_back(list.substr(start, end - start));
        pos = end;
    }
    return out;
}

} // namespace gpo::gpu
