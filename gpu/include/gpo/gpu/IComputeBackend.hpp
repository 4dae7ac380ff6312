/**
 * @file IComputeBackend.hpp
 * @brief Abstract heterogeneous-compute interfaces (Strategy pattern).
 *
 * A backend enumerates devices and opens them.  An opened device lives for
 * the process lifetime: it builds programs and hands out command queues.
 * A command queue is the per-session execution stream: it owns device
 * allocations and executes writes, kernel launches and reads in order.
 *
 * Concrete implementations:
 *   - @c OpenCLBackend   : any OpenCL 1.2 platform (GPU, CPU, accelerator).
 *   - @c SoftwareBackend : built-in CPU device running native kernels.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_ICOMPUTEBACKEND_HPP
    #define GPO_GPU_ICOMPUTEBACKEND_HPP

#include <gpo/gpu/DeviceDescriptor.hpp>
#include <gpo/core/Expected.hpp>
#include <gpo/core/Types.hpp>

#include <chrono>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gpo::gpu {

using Clock    = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/** @brief Access pattern of a device buffer, from the kernel's view. */
enum class BufferRole : core::u8 {
    kReadOnly,
    kWriteOnly,
    kReadWrite
};

/**
 * @struct KernelArg
 * @brief One kernel argument: a device buffer handle or a 32-bit scalar.
 */
struct KernelArg
{
    enum class Kind : core::u8 { kBuffer, kU32 };

    Kind      kind{Kind::kU32};
    void     *handle{nullptr};
    core::u32 value{0};

    [[nodiscard]] static KernelArg buffer(void *h) noexcept { return {Kind::kBuffer, h, 0}; }
    [[nodiscard]] static KernelArg scalar(core::u32 v) noexcept { return {Kind::kU32, nullptr, v}; }
};

/**
 * @class IProgram
 * @brief A kernel program compiled for one device.
 */
class IProgram
{
public:
    virtual ~IProgram() = default;

    [[nodiscard]] virtual const DeviceDescriptor &device() const noexcept = 0;
    [[nodiscard]] virtual bool hasKernel(std::string_view entryPoint) const noexcept = 0;

    /// @brief Compiler output of the successful build (may be empty).
    [[nodiscard]] virtual const std::string &buildLog() const noexcept = 0;
};

/**
 * @class ICommandQueue
 * @brief In-order command stream owning its device allocations.
 *
 * Host data handed to @ref write is copied at enqueue time.  @ref read and
 * @ref finish block until the device catches up or @p deadline passes; on
 * expiry they return Timeout without waiting for the device.
 */
class ICommandQueue
{
public:
    virtual ~ICommandQueue() = default;

    /// @brief Allocates @p bytes of device memory.
    [[nodiscard]] virtual core::Expected<void *> allocate(core::usize bytes, BufferRole role) = 0;

    /// @brief Releases an allocation made by this queue.
    virtual void release(void *handle) noexcept = 0;

    /// @brief Enqueues a host-to-device copy.
    [[nodiscard]] virtual core::Expected<void> write(
        void *dst, const void *src, core::usize bytes) = 0;

    /// @brief Enqueues a device-to-host copy and waits for it.
    [[nodiscard]] virtual core::Expected<void> read(
        const void *src, void *dst, core::usize bytes, Deadline deadline) = 0;

    /// @brief Enqueues one work-item per index of [0, globalWorkSize).
    [[nodiscard]] virtual core::Expected<void> launch(
        const IProgram &program,
        std::string_view entryPoint,
        core::usize globalWorkSize,
        std::span<const KernelArg> args) = 0;

    /// @brief Waits for every enqueued command.
    [[nodiscard]] virtual core::Expected<void> finish(Deadline deadline) = 0;
};

/**
 * @class IDevice
 * @brief An opened device (context); shared by every session targeting it.
 */
class IDevice
{
public:
    virtual ~IDevice() = default;

    [[nodiscard]] virtual const DeviceDescriptor &descriptor() const noexcept = 0;

    /// @brief Compiles @p source; fails with BuildError carrying the log.
    [[nodiscard]] virtual core::Expected<std::shared_ptr<IProgram>> build(
        std::string_view source,
        std::string_view options,
        std::chrono::milliseconds timeout) = 0;

    /// @brief Creates a fresh in-order queue; fails with DeviceBusy.
    [[nodiscard]] virtual core::Expected<std::unique_ptr<ICommandQueue>> createQueue() = 0;

    /// @brief Number of device allocations currently alive.
    [[nodiscard]] virtual core::usize liveAllocations() const noexcept = 0;
};

/**
 * @class IComputeBackend
 * @brief Strategy interface for one compute API.
 */
class IComputeBackend
{
public:
    virtual ~IComputeBackend() = default;

    /// @brief Queries the platform layer; fails with PlatformUnavailable.
    [[nodiscard]] virtual core::Expected<std::vector<DeviceDescriptor>> enumerate() = 0;

    /**
     * @brief Opens a device previously returned by @ref enumerate.
     *
     * Every call yields a new handle with its own context; the caller
     * (DeviceRegistry) keeps it for as long as the device is healthy.
     */
    [[nodiscard]] virtual core::Expected<std::shared_ptr<IDevice>> open(
        const DeviceDescriptor &descriptor) = 0;

    /// @brief Returns a human-readable name.
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

} // namespace gpo::gpu

#endif // GPO_GPU_ICOMPUTEBACKEND_HPP
