/**
 * @file Error.hpp
 * @brief Error codes, their categories and the Error value.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_ERROR_HPP
    #define GPO_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace gpo::core {

/**
 * @brief Every failure the service can report.
 *
 * Grouped as in @ref ErrorCategory; keep @ref categoryOf in sync when a
 * code is added.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    // Input
    kInvalidArgument,
    kOutOfRange,

    // Platform (startup)
    kPlatformUnavailable,
    kNoDeviceAvailable,

    // Build (startup / first use)
    kBuildError,

    // Per-request device failures
    kDeviceBusy,
    kAllocationFailed,
    kKernelLaunchError,
    kDeviceError,
    kConvergenceError,
    kPathReconstructionError,
    kTimeout,

    // Transport
    kNetworkBindFailed,
    kNetworkSendFailed,
    kNetworkReceiveFailed,
    kProtocolViolation,
    kPayloadTooLarge,

    kInvalidState,
    kNotFound,
    kNotSupported,
    kInternalError,
};

/**
 * @brief Where a failure originates, which decides who sees it.
 *
 * Input and protocol errors are the client's and never touch a device.
 * Platform and build errors are fatal during warm-up. Compute errors fail
 * only the request that raised them.
 */
enum class ErrorCategory : u8 {
    kNone,
    kInput,
    kPlatform,
    kBuild,
    kCompute,
    kTransport,
    kProtocol,
    kInternal,
};

[[nodiscard]] ErrorCategory categoryOf(ErrorCode code) noexcept;

/// Stable identifier of @p code, e.g. "BuildError".
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

/**
 * @brief Code, message and the source location that raised it.
 */
class Error final {
public:
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] ErrorCategory        category() const { return categoryOf(_code); }
    [[nodiscard]] const std::string   &message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /** @brief "Code: message" form used in logs and responses. */
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

using Unexpected = std::unexpected<Error>;

/// Builds the error branch of an Expected<T> at the caller's location.
[[nodiscard]] inline Unexpected makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return Unexpected{Error{code, std::move(message), loc}};
}

} // namespace gpo::core

#endif // GPO_CORE_ERROR_HPP
