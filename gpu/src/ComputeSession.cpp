/**
 * @file ComputeSession.cpp
 * @brief ComputeSession implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/ComputeSession.hpp>

#include <utility>

namespace gpo::gpu {

ComputeSession::ComputeSession(std::shared_ptr<IDevice> device, std::unique_ptr<ICommandQueue> queue,
                               Deadline deadline) noexcept
    : _device{std::move(device)}
    , _queue{std::move(queue)}
    , _deadline{deadline}
{}

core::Expected<ComputeSession> ComputeSession::open(std::shared_ptr<IDevice> device, SessionOptions options)
{
    if (!device)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "session opened without a device");
    }

    const Deadline deadline = Clock::now() + options.timeout;
    auto queue = GPO_TRY(device->createQueue());
    return ComputeSession{std::move(device), std::move(queue), deadline};
}

ComputeSession::ComputeSession(ComputeSession &&other) noexcept
    : _device{std::move(other._device)}
    , _queue{std::move(other._queue)}
    , _buffers{std::move(other._buffers)}
    , _deadline{other._deadline}
{}

ComputeSession &ComputeSession::operator=(ComputeSession &&other) noexcept
{
    if (this != &other)
    {
        releaseAll();
        _device   = std::move(other._device);
        _queue    = std::move(other._queue);
        _buffers  = std::move(other._buffers);
        _deadline = other._deadline;
    }
    return *this;
}

ComputeSession::~ComputeSession()
{
    releaseAll();
}

void ComputeSession::releaseAll() noexcept
{
    // Buffers hold a raw pointer to the queue: release them first.
    _buffers.clear();
    _queue.reset();
    _device.reset();
}

core::Expected<void> ComputeSession::checkDeadline(const char *operation) const
{
    if (!_queue)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "session has been moved from");
    }
    if (expired())
    {
        return core::makeError(core::ErrorCode::kTimeout,
                               std::string{"request budget exhausted before "} + operation);
    }
    return {};
}

core::Expected<DeviceBuffer *> ComputeSession::allocate(
    core::usize elements, core::usize elementSize, BufferRole role)
{
    GPO_TRY_VOID(checkDeadline("allocate"));

    auto buffer = GPO_TRY(DeviceBuffer::create(*_queue, elements, elementSize, role));
    _buffers.push_back(std::make_unique<DeviceBuffer>(std::move(buffer)));
    return _buffers.back().get();
}

core::Expected<void> ComputeSession::writeBytes(DeviceBuffer &buffer, const void *src, core::usize bytes)
{
    GPO_TRY_VOID(checkDeadline("write"));
    return buffer.upload(src, bytes);
}

core::Expected<void> ComputeSession::readBytes(const DeviceBuffer &buffer, void *dst, core::usize bytes)
{
    GPO_TRY_VOID(checkDeadline("read"));
    return buffer.download(dst, bytes, _deadline);
}

core::Expected<void> ComputeSession::enqueueKernel(
    const IProgram &program,
    std::string_view entryPoint,
    core::usize globalWorkSize,
    std::initializer_list<KernelArg> args)
{
    GPO_TRY_VOID(checkDeadline("launch"));
    return _queue->launch(program, entryPoint, globalWorkSize,
                          std::span<const KernelArg>{args.begin(), args.size()});
}

core::Expected<void> ComputeSession::awaitCompletion()
{
    GPO_TRY_VOID(checkDeadline("wait"));
    return _queue->finish(_deadline);
}

const DeviceDescriptor &ComputeSession::device() const noexcept
{
    return _device->descriptor();
}

} // namespace gpo::gpu
