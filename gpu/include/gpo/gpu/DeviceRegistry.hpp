/**
 * @file DeviceRegistry.hpp
 * @brief Device discovery, selection policy and cached device handle.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_DEVICEREGISTRY_HPP
    #define GPO_GPU_DEVICEREGISTRY_HPP

#include <gpo/gpu/IComputeBackend.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <memory>
#include <string>
#include <vector>

namespace gpo::gpu {

/**
 * @struct SelectionPolicy
 * @brief Filters applied before ranking enumerated devices.
 */
struct SelectionPolicy
{
    /// Whether the software device may be selected.
    bool                     allowSoftware{true};
    /// Case-sensitive substring the device name must contain (empty = any).
    std::string              nameFilter;
    /// Extensions the device must report.
    std::vector<std::string> requiredExtensions;
};

/**
 * @class DeviceRegistry
 * @brief Aggregates backends and caches the selected, opened device.
 *
 * Ranking is a total order: hardware devices first, then by compute units
 * (descending), then by enumeration order (backend registration order, then
 * the backend's own order).
 *
 * @ref acquire initialises the selection once; concurrent callers after that
 * only take a shared lock.  @ref reset is the serialized re-initialization
 * path used after a device loss.
 */
class DeviceRegistry final : public core::NonMovable<DeviceRegistry>
{
public:
    explicit DeviceRegistry(SelectionPolicy policy = {});
    ~DeviceRegistry();

    /** @brief Registers a backend; enumeration follows registration order. */
    void addBackend(std::unique_ptr<IComputeBackend> backend);

    /**
     * @brief Enumerates every registered backend.
     *
     * Backends that fail are logged and skipped; PlatformUnavailable is
     * returned only when all of them fail.
     */
    [[nodiscard]] core::Expected<std::vector<DeviceDescriptor>> listDevices();

    /** @brief Enumerates and returns the best device under @p policy. */
    [[nodiscard]] core::Expected<DeviceDescriptor> selectDevice(const SelectionPolicy &policy);

    /** @brief Applies @p policy to @p devices and sorts them best-first. */
    [[nodiscard]] static std::vector<DeviceDescriptor> rank(
        std::vector<DeviceDescriptor> devices, const SelectionPolicy &policy);

    /** @brief The cached selection (selects on first call). */
    [[nodiscard]] core::Expected<DeviceDescriptor> selected();

    /** @brief The opened handle of the cached selection (opens on first call). */
    [[nodiscard]] core::Expected<std::shared_ptr<IDevice>> acquire();

    /** @brief Drops the cached selection; the next acquire re-enumerates. */
    void reset();

    [[nodiscard]] const SelectionPolicy &policy() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gpo::gpu

#endif // GPO_GPU_DEVICEREGISTRY_HPP
