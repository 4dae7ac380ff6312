/**
 * @file DeviceDescriptor.hpp
 * @brief Immutable description of one enumerated compute device.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_DEVICEDESCRIPTOR_HPP
    #define GPO_GPU_DEVICEDESCRIPTOR_HPP

#include <gpo/core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gpo::gpu {

/** @brief Compute API that enumerated the device. */
enum class BackendKind : core::u8 {
    kOpenCL,
    kSoftware
};

/** @brief Device class as reported by the platform layer. */
enum class DeviceType : core::u8 {
    kGpu,
    kCpu,
    kAccelerator,
    kSoftware,
    kOther
};

[[nodiscard]] const char *toString(BackendKind kind) noexcept;
[[nodiscard]] const char *toString(DeviceType type) noexcept;

/**
 * @struct DeviceDescriptor
 * @brief Platform/device identifiers and capability flags.
 *
 * Filled once by IComputeBackend::enumerate() and never mutated afterwards.
 * @ref identity keys the program cache: a driver reset that changes the
 * driver version or the enumeration order yields a different identity.
 */
struct DeviceDescriptor
{
    BackendKind              backend{BackendKind::kSoftware};
    std::string              platformId;
    std::string              platformName;
    std::string              deviceId;
    std::string              name;
    std::string              vendor;
    std::string              driverVersion;
    DeviceType               type{DeviceType::kOther};
    bool                     hardware{false};
    core::u32                computeUnits{0};
    core::usize              maxWorkGroupSize{0};
    core::u64                globalMemBytes{0};
    std::vector<std::string> extensions;
    core::u32                ordinal{0};

    [[nodiscard]] std::string identity() const;
    [[nodiscard]] bool        hasExtension(std::string_view extension) const noexcept;

    /** @brief One-line human-readable description for logs. */
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Splits a space-separated extension string (CL_DEVICE_EXTENSIONS).
 */
[[nodiscard]] std::vector<std::string> splitExtensions(std::string_view list);

} // namespace gpo::gpu

#endif // GPO_GPU_DEVICEDESCRIPTOR_HPP
