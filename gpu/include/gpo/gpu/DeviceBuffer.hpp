/**
 * @file DeviceBuffer.hpp
 * @brief RAII wrapper for a device memory allocation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_DEVICEBUFFER_HPP
    #define GPO_GPU_DEVICEBUFFER_HPP

#include <gpo/gpu/IComputeBackend.hpp>
#include <gpo/core/NonCopyable.hpp>
#include <gpo/core/Expected.hpp>
#include <gpo/core/Types.hpp>

namespace gpo::gpu {

/**
 * @class DeviceBuffer
 * @brief Owns a device allocation via an ICommandQueue reference.
 *
 * The allocation is released automatically on destruction, so the buffer
 * must not outlive the queue that created it (ComputeSession guarantees
 * this ordering).
 */
class DeviceBuffer final : public core::NonCopyable<DeviceBuffer>
{
public:
    /** @brief Constructs an empty (null) buffer. */
    DeviceBuffer() noexcept = default;

    /**
     * @brief Allocates @p elements * @p elementSize bytes on @p queue.
     * @return The buffer, or AllocationFailed.
     */
    [[nodiscard]] static core::Expected<DeviceBuffer> create(
        ICommandQueue &queue, core::usize elements, core::usize elementSize, BufferRole role);

    DeviceBuffer(DeviceBuffer &&other) noexcept;
    DeviceBuffer &operator=(DeviceBuffer &&other) noexcept;

    /** @brief Releases the device allocation. */
    ~DeviceBuffer();

    /** @brief Opaque device handle (null for an empty buffer). */
    [[nodiscard]] void       *handle() const noexcept { return _handle; }
    [[nodiscard]] core::usize size() const noexcept { return _size; }
    [[nodiscard]] core::usize elements() const noexcept { return _elements; }
    [[nodiscard]] BufferRole  role() const noexcept { return _role; }

    /** @brief Kernel argument referring to this buffer. */
    [[nodiscard]] KernelArg arg() const noexcept { return KernelArg::buffer(_handle); }

    /** @brief Enqueues a copy of @p bytes from host memory into this buffer. */
    [[nodiscard]] core::Expected<void> upload(const void *hostSrc, core::usize bytes);

    /** @brief Copies @p bytes of this buffer to host memory (blocking). */
    [[nodiscard]] core::Expected<void> download(void *hostDst, core::usize bytes, Deadline deadline) const;

private:
    DeviceBuffer(ICommandQueue &queue, void *handle, core::usize elements,
                 core::usize elementSize, BufferRole role) noexcept;

    void reset() noexcept;

    ICommandQueue *_queue{nullptr};
    void          *_handle{nullptr};
    core::usize    _size{0};
    core::usize    _elements{0};
    BufferRole     _role{BufferRole::kReadWrite};
};

} // namespace gpo::gpu

#endif // GPO_GPU_DEVICEBUFFER_HPP
