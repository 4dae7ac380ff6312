/**
 * @file Server.hpp
 * @brief Wires device registry, program cache, finder and HTTP server.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_SERVICE_SERVER_HPP
    #define GPO_SERVICE_SERVER_HPP

#include <gpo/service/Config.hpp>
#include <gpo/gpu/DeviceRegistry.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <memory>
#include <vector>

namespace gpo::gpu { class IComputeBackend; }

namespace gpo::service {

/**
 * @class Server
 * @brief Owns the whole service for the process lifetime.
 *
 * Lifecycle: construct → @ref init (warm-up: device selection and kernel
 * build, fatal on failure) → @ref start → @ref wait → @ref stop.
 */
class Server final : public core::NonCopyable<Server>
{
public:
    /** @brief Registers the OpenCL backend and the software device. */
    explicit Server(Config config);

    /** @brief Uses exactly @p backends, in order (tests). */
    Server(Config config, std::vector<std::unique_ptr<gpu::IComputeBackend>> backends);

    ~Server();

    /** @brief Selects the device and compiles the kernels. */
    [[nodiscard]] core::Expected<gpu::DeviceDescriptor> init();

    /** @brief Binds the listener; requires a successful @ref init. */
    [[nodiscard]] core::Expected<void> start();

    void stop();
    void wait();

    /** @brief Enumerated devices in selection order under the configured policy. */
    [[nodiscard]] core::Expected<std::vector<gpu::DeviceDescriptor>> rankedDevices();

    [[nodiscard]] const Config &config() const noexcept;
    [[nodiscard]] core::u16 port() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gpo::service

#endif // GPO_SERVICE_SERVER_HPP
