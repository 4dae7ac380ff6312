/**
 * @file OpenCLBackend.hpp
 * @brief OpenCL 1.2 implementation of the compute device abstraction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_OPENCLBACKEND_HPP
    #define GPO_GPU_OPENCLBACKEND_HPP

#include <gpo/gpu/IComputeBackend.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <memory>

namespace gpo::gpu {

/**
 * @brief Symbolic name of an OpenCL status code (e.g. "CL_OUT_OF_RESOURCES").
 */
[[nodiscard]] const char *clErrorName(core::i32 status) noexcept;

/**
 * @class OpenCLBackend
 * @brief IComputeBackend over every installed OpenCL platform.
 *
 * Each opened device owns one @c cl_context, shared by all sessions on that
 * device; each command queue is an in-order @c cl_command_queue.  Host
 * transfers go through queue-owned staging copies released from event
 * callbacks, so an abandoned (timed-out) read never writes into freed host
 * memory.
 *
 * @c cl_int codes never leave this translation unit: they are mapped to the
 * service error taxonomy with the symbolic name in the message.
 */
class OpenCLBackend final : public IComputeBackend,
                            public core::NonCopyable<OpenCLBackend>
{
public:
    OpenCLBackend();
    ~OpenCLBackend() override;

    [[nodiscard]] core::Expected<std::vector<DeviceDescriptor>> enumerate() override;

    [[nodiscard]] core::Expected<std::shared_ptr<IDevice>> open(
        const DeviceDescriptor &descriptor) override;

    [[nodiscard]] const char *name() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gpo::gpu

#endif // GPO_GPU_OPENCLBACKEND_HPP
