/**
 * @file DeviceRegistry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/DeviceRegistry.hpp>
#include <gpo/core/Log.hpp>

#include <algorithm>
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace gpo::gpu {

namespace {

constexpr const char *kTag = "GPU";

bool accepts(const DeviceDescriptor &desc, const SelectionPolicy &policy)
{
    if (!policy.allowSoftware && desc.type == DeviceType::kSoftware)
        return false;
    if (!policy.nameFilter.empty() && desc.name.find(policy.nameFilter) == std::string::npos)
        return false;
    return std::all_of(policy.requiredExtensions.begin(), policy.requiredExtensions.end(),
                       [&desc](const std::string &ext) { return desc.hasExtension(ext); });
}

} // anonymous namespace

struct DeviceRegistry::Impl
{
    struct Enumerated
    {
        DeviceDescriptor  descriptor;
        IComputeBackend  *backend;
    };

    SelectionPolicy                                policy;
    std::vector<std::unique_ptr<IComputeBackend>>  backends;

    mutable std::shared_mutex                      mutex;
    std::optional<Enumerated>                      selection;
    std::shared_ptr<IDevice>                       device;

    // Caller holds the registry lock (shared or exclusive).
    core::Expected<std::vector<Enumerated>> enumerateAll()
    {
        std::vector<Enumerated> result;
        core::usize failures = 0;
        std::string lastFailure;

        for (auto &backend : backends)
        {
            auto devices = backend->enumerate();
            if (!devices)
            {
                ++failures;
                lastFailure = devices.error().describe();
                core::Log::warn(kTag, std::string{backend->name()} + " unavailable: " + lastFailure);
                continue;
            }
            for (auto &desc : *devices)
                result.push_back(Enumerated{std::move(desc), backend.get()});
        }

        if (backends.empty())
        {
            return core::makeError(core::ErrorCode::kPlatformUnavailable, "no compute backend registered");
        }
        if (failures == backends.size())
        {
            return core::makeError(core::ErrorCode::kPlatformUnavailable,
                                   "every compute backend failed; last: " + lastFailure);
        }
        return result;
    }

    core::Expected<Enumerated> choose(const SelectionPolicy &filter)
    {
        auto all = GPO_TRY(enumerateAll());

        std::vector<DeviceDescriptor> descriptors;
        descriptors.reserve(all.size());
        for (const auto &entry : all)
            descriptors.push_back(entry.descriptor);

        auto ranked = DeviceRegistry::rank(std::move(descriptors), filter);
        if (ranked.empty())
        {
            return core::makeError(core::ErrorCode::kNoDeviceAvailable,
                                   std::to_string(all.size()) + " device(s) enumerated, none matches the policy");
        }

        const std::string best = ranked.front().identity();
        for (auto &entry : all)
        {
            if (entry.descriptor.identity() == best)
                return entry;
        }
        return core::makeError(core::ErrorCode::kInternalError, "ranked device vanished from enumeration");
    }
};

DeviceRegistry::DeviceRegistry(SelectionPolicy policy)
    : _impl{std::make_unique<Impl>()}
{
    _impl->policy = std::move(policy);
}

DeviceRegistry::~DeviceRegistry() = default;

void DeviceRegistry::addBackend(std::unique_ptr<IComputeBackend> backend)
{
    std::unique_lock lock{_impl->mutex};
    _impl->backends.push_back(std::move(backend));
}

core::Expected<std::vector<DeviceDescriptor>> DeviceRegistry::listDevices()
{
    std::shared_lock lock{_impl->mutex};
    auto all = GPO_TRY(_impl->enumerateAll());

    std::vector<DeviceDescriptor> result;
    result.reserve(all.size());
    for (auto &entry : all)
        result.push_back(std::move(entry.descriptor));
    return result;
}

core::Expected<DeviceDescriptor> DeviceRegistry::selectDevice(const SelectionPolicy &policy)
{
    std::shared_lock lock{_impl->mutex};
    auto chosen = GPO_TRY(_impl->choose(policy));
    return chosen.descriptor;
}

std::vector<DeviceDescriptor> DeviceRegistry::rank(
    std::vector<DeviceDescriptor> devices, const SelectionPolicy &policy)
{
    std::erase_if(devices, [&policy](const DeviceDescriptor &desc) { return !accepts(desc, policy); });

    std::stable_sort(devices.begin(), devices.end(),
                     [](const DeviceDescriptor &a, const DeviceDescriptor &b) {
                         if (a.hardware != b.hardware)
                             return a.hardware;
                         return a.computeUnits > b.computeUnits;
                     });
    return devices;
}

core::Expected<DeviceDescriptor> DeviceRegistry::selected()
{
    {
        std::shared_lock lock{_impl->mutex};
        if (_impl->selection)
            return _impl->selection->descriptor;
    }

    std::unique_lock lock{_impl->mutex};
    if (!_impl->selection)
    {
        auto chosen = GPO_TRY(_impl->choose(_impl->policy));
        core::Log::info(kTag, "selected " + chosen.descriptor.summary());
        _impl->selection = std::move(chosen);
    }
    return _impl->selection->descriptor;
}

core::Expected<std::shared_ptr<IDevice>> DeviceRegistry::acquire()
{
    {
        std::shared_lock lock{_impl->mutex};
        if (_impl->device)
            return _impl->device;
    }

    std::unique_lock lock{_impl->mutex};
    if (_impl->device)
        return _impl->device;

    if (!_impl->selection)
    {
        auto chosen = GPO_TRY(_impl->choose(_impl->policy));
        core::Log::info(kTag, "selected " + chosen.descriptor.summary());
        _impl->selection = std::move(chosen);
    }

    _impl->device = GPO_TRY(_impl->selection->backend->open(_impl->selection->descriptor));
    return _impl->device;
}

void DeviceRegistry::reset()
{
    std::unique_lock lock{_impl->mutex};
    if (_impl->selection)
        core::Log::warn(kTag, "dropping device " + _impl->selection->descriptor.name);
    _impl->selection.reset();
    _impl->device.reset();
}

const SelectionPolicy &DeviceRegistry::policy() const noexcept
{
    return _impl->policy;
}

} // namespace gpo::gpu
