/**
 * @file DeviceBuffer.cpp
 * @brief DeviceBuffer RAII implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/DeviceBuffer.hpp>
#include <gpo/core/Assert.hpp>

#include <utility>

namespace gpo::gpu {

DeviceBuffer::DeviceBuffer(ICommandQueue &queue, void *handle, core::usize elements,
                           core::usize elementSize, BufferRole role) noexcept
    : _queue{&queue}
    , _handle{handle}
    , _size{elements * elementSize}
    , _elements{elements}
    , _role{role}
{}

core::Expected<DeviceBuffer> DeviceBuffer::create(
    ICommandQueue &queue, core::usize elements, core::usize elementSize, BufferRole role)
{
    if (elements == 0 || elementSize == 0)
    {
        return core::makeError(core::ErrorCode::kAllocationFailed, "zero-sized device buffer");
    }

    void *handle = GPO_TRY(queue.allocate(elements * elementSize, role));
    return DeviceBuffer{queue, handle, elements, elementSize, role};
}

DeviceBuffer::DeviceBuffer(DeviceBuffer &&other) noexcept
    : _queue{std::exchange(other._queue, nullptr)}
    , _handle{std::exchange(other._handle, nullptr)}
    , _size{std::exchange(other._size, 0)}
    , _elements{std::exchange(other._elements, 0)}
    , _role{other._role}
{}

DeviceBuffer &DeviceBuffer::operator=(DeviceBuffer &&other) noexcept
{
    if (this != &other)
    {
        reset();
        _queue    = std::exchange(other._queue, nullptr);
        _handle   = std::exchange(other._handle, nullptr);
        _size     = std::exchange(other._size, 0);
        _elements = std::exchange(other._elements, 0);
        _role     = other._role;
    }
    return *this;
}

DeviceBuffer::~DeviceBuffer()
{
    reset();
}

void DeviceBuffer::reset() noexcept
{
    if (_handle && _queue)
    {
        _queue->release(_handle);
    }
    _handle = nullptr;
    _queue  = nullptr;
}

core::Expected<void> DeviceBuffer::upload(const void *hostSrc, core::usize bytes)
{
    GPO_ASSERT(_queue && _handle);
    if (bytes > _size)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "upload larger than device buffer");
    }
    return _queue->write(_handle, hostSrc, bytes);
}

core::Expected<void> DeviceBuffer::download(void *hostDst, core::usize bytes, Deadline deadline) const
{
    GPO_ASSERT(_queue && _handle);
    if (bytes > _size)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "download larger than device buffer");
    }
    return _queue->read(_handle, hostDst, bytes, deadline);
}

} // namespace gpo::gpu
