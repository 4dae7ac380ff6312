/**
 * @file SoftwareBackend.hpp
 * @brief CPU-backed implementation of the compute device abstraction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_SOFTWAREBACKEND_HPP
    #define GPO_GPU_SOFTWAREBACKEND_HPP

#include <gpo/gpu/IComputeBackend.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gpo::gpu {

/**
 * @class SoftwareBackend
 * @brief IComputeBackend exposing one emulated device that runs on host threads.
 *
 * Kernel source is not compiled: every @c __kernel declared in the source
 * must have a native implementation registered with @ref registerKernel,
 * otherwise the build fails with the missing entry points in its log.
 * Native kernels receive the launch arguments with buffer handles resolved
 * to host pointers and a [begin, end) slice of the global range; slices run
 * concurrently on the device thread pool, so kernels must use atomics for
 * cross-work-item updates exactly as they would on a GPU.
 *
 * Queues are in-order and asynchronous (one worker thread per queue).  A
 * queue destroyed while a command is running is abandoned: the running
 * command completes in the background and its buffers are freed afterwards.
 *
 * @ref FaultInjection makes failure paths reproducible in tests.
 */
class SoftwareBackend final : public IComputeBackend,
                              public core::NonCopyable<SoftwareBackend>
{
public:
    using NativeKernel = std::function<void(std::span<const KernelArg> args,
                                            core::usize begin,
                                            core::usize end)>;

    struct FaultInjection
    {
        /// 1-based index (device lifetime) of the allocation that fails.
        std::optional<core::u32>  failAllocationAt;
        /// 1-based index (device lifetime) of the launch that fails.
        std::optional<core::u32>  failLaunchAt;
        /// When set, every build fails with this compiler log.
        std::optional<std::string> failBuild;
        /// Sleep before each kernel executes.
        std::chrono::milliseconds launchLatency{0};
        /// Concurrent queue limit; exceeding it yields DeviceBusy.
        std::optional<core::u32>  maxQueues;
    };

    struct Options
    {
        /// Worker threads (and reported compute units); zero = hardware threads.
        core::u32      threads{0};
        FaultInjection faults{};
    };

    SoftwareBackend();
    explicit SoftwareBackend(Options options);
    ~SoftwareBackend() override;

    /** @brief Registers the native implementation of kernel @p entryPoint. */
    void registerKernel(std::string entryPoint, NativeKernel kernel);

    [[nodiscard]] core::Expected<std::vector<DeviceDescriptor>> enumerate() override;

    [[nodiscard]] core::Expected<std::shared_ptr<IDevice>> open(
        const DeviceDescriptor &descriptor) override;

    [[nodiscard]] const char *name() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gpo::gpu

#endif // GPO_GPU_SOFTWAREBACKEND_HPP
