/**
 * @file ComputeSession.hpp
 * @brief Per-request command queue with exclusively-owned device buffers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_COMPUTESESSION_HPP
    #define GPO_GPU_COMPUTESESSION_HPP

#include <gpo/gpu/DeviceBuffer.hpp>
#include <gpo/gpu/IComputeBackend.hpp>
#include <gpo/core/Constants.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <span>
#include <vector>

namespace gpo::gpu {

struct SessionOptions
{
    /// Wall-clock budget for every wait issued by the session.
    std::chrono::milliseconds timeout{core::kRequestTimeoutMs};
};

/**
 * @class ComputeSession
 * @brief Scoped ownership of one queue and the buffers allocated on it.
 *
 * The deadline is fixed when the session opens.  Once it has passed every
 * call fails with Timeout without touching the device.  Destruction
 * releases all buffers and then the queue, whether or not the device has
 * finished; a device that is still running keeps the released memory alive
 * until its commands end.
 */
class ComputeSession final : public core::NonCopyable<ComputeSession>
{
public:
    /**
     * @brief Creates a fresh in-order queue on @p device.
     * @return The session, or DeviceBusy / DeviceError.
     */
    [[nodiscard]] static core::Expected<ComputeSession> open(
        std::shared_ptr<IDevice> device, SessionOptions options = {});

    ComputeSession(ComputeSession &&other) noexcept;
    ComputeSession &operator=(ComputeSession &&other) noexcept;
    ~ComputeSession();

    /**
     * @brief Allocates a buffer owned by this session.
     * @return Non-owning pointer valid for the session lifetime, or AllocationFailed.
     */
    [[nodiscard]] core::Expected<DeviceBuffer *> allocate(
        core::usize elements, core::usize elementSize, BufferRole role);

    /** @brief Enqueues a copy of @p host into @p buffer (host data copied now). */
    template <typename T>
    [[nodiscard]] core::Expected<void> enqueueWrite(DeviceBuffer &buffer, std::span<const T> host)
    {
        return writeBytes(buffer, host.data(), host.size_bytes());
    }

    /** @brief Copies @p buffer into @p host; returns once the data is on the host. */
    template <typename T>
    [[nodiscard]] core::Expected<void> enqueueRead(const DeviceBuffer &buffer, std::span<T> host)
    {
        return readBytes(buffer, host.data(), host.size_bytes());
    }

    /** @brief Enqueues @p entryPoint over [0, globalWorkSize); fails with KernelLaunchError. */
    [[nodiscard]] core::Expected<void> enqueueKernel(
        const IProgram &program,
        std::string_view entryPoint,
        core::usize globalWorkSize,
        std::initializer_list<KernelArg> args);

    /** @brief Waits for every enqueued command; fails with DeviceError or Timeout. */
    [[nodiscard]] core::Expected<void> awaitCompletion();

    [[nodiscard]] const DeviceDescriptor &device() const noexcept;
    [[nodiscard]] Deadline                deadline() const noexcept { return _deadline; }
    [[nodiscard]] bool                    expired() const noexcept { return Clock::now() >= _deadline; }
    [[nodiscard]] core::usize             bufferCount() const noexcept { return _buffers.size(); }

private:
    ComputeSession(std::shared_ptr<IDevice> device, std::unique_ptr<ICommandQueue> queue,
                   Deadline deadline) noexcept;

    [[nodiscard]] core::Expected<void> checkDeadline(const char *operation) const;
    [[nodiscard]] core::Expected<void> writeBytes(DeviceBuffer &buffer, const void *src, core::usize bytes);
    [[nodiscard]] core::Expected<void> readBytes(const DeviceBuffer &buffer, void *dst, core::usize bytes);

    void releaseAll() noexcept;

    std::shared_ptr<IDevice>                    _device;
    std::unique_ptr<ICommandQueue>              _queue;
    std::vector<std::unique_ptr<DeviceBuffer>>  _buffers;
    Deadline                                    _deadline{};
};

} // namespace gpo::gpu

#endif // GPO_GPU_COMPUTESESSION_HPP
