/**
 * @file Error.cpp
 * @brief ErrorCode names and Error formatting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "gpo/core/Error.hpp"

namespace gpo::core {

ErrorCategory categoryOf(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:
        return ErrorCategory::kNone;
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kOutOfRange:
        return ErrorCategory::kInput;
    case ErrorCode::kPlatformUnavailable:
    case ErrorCode::kNoDeviceAvailable:
        return ErrorCategory::kPlatform;
    case ErrorCode::kBuildError:
        return ErrorCategory::kBuild;
    case ErrorCode::kDeviceBusy:
    case ErrorCode::kAllocationFailed:
    case ErrorCode::kKernelLaunchError:
    case ErrorCode::kDeviceError:
    case ErrorCode::kConvergenceError:
    case ErrorCode::kPathReconstructionError:
    case ErrorCode::kTimeout:
        return ErrorCategory::kCompute;
    case ErrorCode::kNetworkBindFailed:
    case ErrorCode::kNetworkSendFailed:
    case ErrorCode::kNetworkReceiveFailed:
        return ErrorCategory::kTransport;
    case ErrorCode::kProtocolViolation:
    case ErrorCode::kPayloadTooLarge:
        return ErrorCategory::kProtocol;
    case ErrorCode::kInvalidState:
    case ErrorCode::kNotFound:
    case ErrorCode::kNotSupported:
    case ErrorCode::kInternalError:
        return ErrorCategory::kInternal;
    }
    return ErrorCategory::kInternal;
}

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:                    return "None";
    case ErrorCode::kInvalidArgument:         return "InvalidArgument";
    case ErrorCode::kOutOfRange:              return "OutOfRange";
    case ErrorCode::kPlatformUnavailable:     return "PlatformUnavailable";
    case ErrorCode::kNoDeviceAvailable:       return "NoDeviceAvailable";
    case ErrorCode::kBuildError:              return "BuildError";
    case ErrorCode::kDeviceBusy:              return "DeviceBusy";
    case ErrorCode::kAllocationFailed:        return "AllocationFailed";
    case ErrorCode::kKernelLaunchError:       return "KernelLaunchError";
    case ErrorCode::kDeviceError:             return "DeviceError";
    case ErrorCode::kConvergenceError:        return "ConvergenceError";
    case ErrorCode::kPathReconstructionError: return "PathReconstructionError";
    case ErrorCode::kTimeout:                 return "Timeout";
    case ErrorCode::kNetworkBindFailed:       return "NetworkBindFailed";
    case ErrorCode::kNetworkSendFailed:       return "NetworkSendFailed";
    case ErrorCode::kNetworkReceiveFailed:    return "NetworkReceiveFailed";
    case ErrorCode::kProtocolViolation:       return "ProtocolViolation";
    case ErrorCode::kPayloadTooLarge:         return "PayloadTooLarge";
    case ErrorCode::kInvalidState:            return "InvalidState";
    case ErrorCode::kNotFound:                return "NotFound";
    case ErrorCode::kNotSupported:            return "NotSupported";
    case ErrorCode::kInternalError:           return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    std::string out{toString(_code)};
    if (!_message.empty())
    {
        out += ": ";
        out += _message;
    }
    return out;
}

} // namespace gpo::core
