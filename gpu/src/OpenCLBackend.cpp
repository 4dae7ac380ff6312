/**
 * @file OpenCLBackend.cpp
 * @brief OpenCL 1.2 backend: platform enumeration, contexts, programs, queues.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/OpenCLBackend.hpp>
#include <gpo/core/Constants.hpp>
#include <gpo/core/Log.hpp>

#define CL_TARGET_OPENCL_VERSION 120
#include <CL/cl.h>

#include <atomic>
#include <cstring>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace gpo::gpu {

const char *clErrorName(core::i32 status) noexcept
{
    switch (status)
    {
        case CL_SUCCESS:                                   return "CL_SUCCESS";
        case CL_DEVICE_NOT_FOUND:                          return "CL_DEVICE_NOT_FOUND";
        case CL_DEVICE_NOT_AVAILABLE:                      return "CL_DEVICE_NOT_AVAILABLE";
        case CL_COMPILER_NOT_AVAILABLE:                    return "CL_COMPILER_NOT_AVAILABLE";
        case CL_MEM_OBJECT_ALLOCATION_FAILURE:             return "CL_MEM_OBJECT_ALLOCATION_FAILURE";
        case CL_OUT_OF_RESOURCES:                          return "CL_OUT_OF_RESOURCES";
        case CL_OUT_OF_HOST_MEMORY:                        return "CL_OUT_OF_HOST_MEMORY";
        case CL_BUILD_PROGRAM_FAILURE:                     return "CL_BUILD_PROGRAM_FAILURE";
        case CL_EXEC_STATUS_ERROR_FOR_EVENTS_IN_WAIT_LIST: return "CL_EXEC_STATUS_ERROR_FOR_EVENTS_IN_WAIT_LIST";
        case CL_INVALID_VALUE:                             return "CL_INVALID_VALUE";
        case CL_INVALID_PLATFORM:                          return "CL_INVALID_PLATFORM";
        case CL_INVALID_DEVICE:                            return "CL_INVALID_DEVICE";
        case CL_INVALID_CONTEXT:                           return "CL_INVALID_CONTEXT";
        case CL_INVALID_COMMAND_QUEUE:                     return "CL_INVALID_COMMAND_QUEUE";
        case CL_INVALID_MEM_OBJECT:                        return "CL_INVALID_MEM_OBJECT";
        case CL_INVALID_BUILD_OPTIONS:                     return "CL_INVALID_BUILD_OPTIONS";
        case CL_INVALID_PROGRAM:                           return "CL_INVALID_PROGRAM";
        case CL_INVALID_PROGRAM_EXECUTABLE:                return "CL_INVALID_PROGRAM_EXECUTABLE";
        case CL_INVALID_KERNEL_NAME:                       return "CL_INVALID_KERNEL_NAME";
        case CL_INVALID_KERNEL:                            return "CL_INVALID_KERNEL";
        case CL_INVALID_ARG_INDEX:                         return "CL_INVALID_ARG_INDEX";
        case CL_INVALID_ARG_VALUE:                         return "CL_INVALID_ARG_VALUE";
        case CL_INVALID_ARG_SIZE:                          return "CL_INVALID_ARG_SIZE";
        case CL_INVALID_KERNEL_ARGS:                       return "CL_INVALID_KERNEL_ARGS";
        case CL_INVALID_WORK_DIMENSION:                    return "CL_INVALID_WORK_DIMENSION";
        case CL_INVALID_WORK_GROUP_SIZE:                   return "CL_INVALID_WORK_GROUP_SIZE";
        case CL_INVALID_GLOBAL_WORK_SIZE:                  return "CL_INVALID_GLOBAL_WORK_SIZE";
        case CL_INVALID_EVENT:                             return "CL_INVALID_EVENT";
        case CL_INVALID_OPERATION:                         return "CL_INVALID_OPERATION";
        case CL_INVALID_BUFFER_SIZE:                       return "CL_INVALID_BUFFER_SIZE";
        case -1001:                                        return "CL_PLATFORM_NOT_FOUND_KHR";
        default:                                           return "CL_UNKNOWN_ERROR";
    }
}

namespace {

constexpr const char *kTag                  = "GPU";
constexpr cl_int      kPlatformNotFoundKhr  = -1001;

using Staging = std::shared_ptr<std::vector<core::byte>>;

std::string describeStatus(const char *call, cl_int status)
{
    return std::string{call} + " failed: " + clErrorName(status) + " (" + std::to_string(status) + ")";
}

std::string trimNulls(std::string value)
{
    while (!value.empty() && value.back() == '\0')
        value.pop_back();
    return value;
}

std::string platformString(cl_platform_id platform, cl_platform_info param)
{
    size_t size = 0;
    if (clGetPlatformInfo(platform, param, 0, nullptr, &size) != CL_SUCCESS || size == 0)
        return {};
    std::string value(size, '\0');
    if (clGetPlatformInfo(platform, param, size, value.data(), nullptr) != CL_SUCCESS)
        return {};
    return trimNulls(std::move(value));
}

std::string deviceString(cl_device_id device, cl_device_info param)
{
    size_t size = 0;
    if (clGetDeviceInfo(device, param, 0, nullptr, &size) != CL_SUCCESS || size == 0)
        return {};
    std::string value(size, '\0');
    if (clGetDeviceInfo(device, param, size, value.data(), nullptr) != CL_SUCCESS)
        return {};
    return trimNulls(std::move(value));
}

template <typename T>
T deviceValue(cl_device_id device, cl_device_info param, T fallback)
{
    T value{};
    if (clGetDeviceInfo(device, param, sizeof(T), &value, nullptr) != CL_SUCCESS)
        return fallback;
    return value;
}

void CL_CALLBACK releaseStaging(cl_event /*event*/, cl_int /*status*/, void *user)
{
    delete static_cast<Staging *>(user);
}

/**
 * @brief Keeps @p staging alive until @p event completes.
 *
 * Falls back to a blocking wait when the runtime refuses the callback.
 */
void attachStaging(cl_event event, Staging staging)
{
    auto *holder = new Staging{std::move(staging)};
    if (clSetEventCallback(event, CL_COMPLETE, &releaseStaging, holder) != CL_SUCCESS)
    {
        clWaitForEvents(1, &event);
        delete holder;
    }
}

struct EventGuard
{
    cl_event event{nullptr};
    ~EventGuard()
    {
        if (event)
            clReleaseEvent(event);
    }
};

core::Expected<void> waitForEvent(cl_command_queue queue, cl_event event,
                                  Deadline deadline, const char *what)
{
    clFlush(queue);
    for (;;)
    {
        cl_int status = CL_QUEUED;
        const cl_int err = clGetEventInfo(event, CL_EVENT_COMMAND_EXECUTION_STATUS,
                                          sizeof(status), &status, nullptr);
        if (err != CL_SUCCESS)
        {
            return core::makeError(core::ErrorCode::kDeviceError,
                                   describeStatus("clGetEventInfo", err));
        }
        if (status < 0)
        {
            return core::makeError(core::ErrorCode::kDeviceError,
                                   std::string{what} + " terminated abnormally: " + clErrorName(status));
        }
        if (status == CL_COMPLETE)
            return {};
        if (Clock::now() >= deadline)
        {
            return core::makeError(core::ErrorCode::kTimeout,
                                   std::string{what} + " did not complete before the deadline");
        }
        std::this_thread::sleep_for(std::chrono::microseconds{core::kWaitPollMicros});
    }
}

// -------------------------------------------------------------------------- //
//  Shared device state                                                       //
// -------------------------------------------------------------------------- //

struct ContextState
{
    DeviceDescriptor          descriptor;
    cl_device_id              device{nullptr};
    cl_context                context{nullptr};
    std::atomic<core::usize>  live{0};

    ~ContextState()
    {
        if (context)
            clReleaseContext(context);
    }
};

// -------------------------------------------------------------------------- //
//  Program                                                                   //
// -------------------------------------------------------------------------- //

class OpenCLProgram final : public IProgram
{
public:
    OpenCLProgram(std::shared_ptr<ContextState> state, cl_program program, std::string log)
        : _state{std::move(state)}, _program{program}, _log{std::move(log)}
    {
        size_t size = 0;
        if (clGetProgramInfo(_program, CL_PROGRAM_KERNEL_NAMES, 0, nullptr, &size) == CL_SUCCESS && size > 0)
        {
            std::string names(size, '\0');
            if (clGetProgramInfo(_program, CL_PROGRAM_KERNEL_NAMES, size, names.data(), nullptr) == CL_SUCCESS)
            {
                names = trimNulls(std::move(names));
                splitKernelNames(names);
            }
        }
    }

    ~OpenCLProgram() override { clReleaseProgram(_program); }

    OpenCLProgram(const OpenCLProgram &)            = delete;
    OpenCLProgram &operator=(const OpenCLProgram &) = delete;

    [[nodiscard]] const DeviceDescriptor &device() const noexcept override { return _state->descriptor; }

    [[nodiscard]] bool hasKernel(std::string_view entryPoint) const noexcept override
    {
        for (const auto &kernel : _kernels)
        {
            if (kernel == entryPoint)
                return true;
        }
        return false;
    }

    [[nodiscard]] const std::string &buildLog() const noexcept override { return _log; }

    [[nodiscard]] cl_program handle() const noexcept { return _program; }

private:
    void splitKernelNames(const std::string &names)
    {
        std::string::size_type begin = 0;
        while (begin <= names.size())
        {
            const auto end = names.find(';', begin);
            const auto piece = names.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
            if (!piece.empty())
                _kernels.push_back(piece);
            if (end == std::string::npos)
                break;
            begin = end + 1;
        }
    }

    std::shared_ptr<ContextState> _state;
    cl_program                    _program;
    std::string                   _log;
    std::vector<std::string>      _kernels;
};

// -------------------------------------------------------------------------- //
//  Queue                                                                     //
// -------------------------------------------------------------------------- //

class OpenCLQueue final : public ICommandQueue
{
public:
    OpenCLQueue(std::shared_ptr<ContextState> state, cl_command_queue queue)
        : _state{std::move(state)}, _queue{queue}
    {}

    ~OpenCLQueue() override
    {
        for (auto &[key, kernel] : _kernels)
            clReleaseKernel(kernel);
        for (auto *handle : _allocations)
        {
            clReleaseMemObject(static_cast<cl_mem>(handle));
            _state->live.fetch_sub(1, std::memory_order_relaxed);
        }
        // No clFinish: an abandoned queue must not block; the runtime keeps
        // released objects alive until their commands end.
        clReleaseCommandQueue(_queue);
    }

    OpenCLQueue(const OpenCLQueue &)            = delete;
    OpenCLQueue &operator=(const OpenCLQueue &) = delete;

    [[nodiscard]] core::Expected<void *> allocate(core::usize bytes, BufferRole role) override
    {
        cl_mem_flags flags = CL_MEM_READ_WRITE;
        if (role == BufferRole::kReadOnly)
            flags = CL_MEM_READ_ONLY;
        else if (role == BufferRole::kWriteOnly)
            flags = CL_MEM_WRITE_ONLY;

        cl_int err = CL_SUCCESS;
        cl_mem mem = clCreateBuffer(_state->context, flags, bytes, nullptr, &err);
        if (err != CL_SUCCESS || !mem)
        {
            return core::makeError(core::ErrorCode::kAllocationFailed,
                                   describeStatus("clCreateBuffer", err));
        }

        _allocations.push_back(mem);
        _state->live.fetch_add(1, std::memory_order_relaxed);
        return static_cast<void *>(mem);
    }

    void release(void *handle) noexcept override
    {
        for (auto it = _allocations.begin(); it != _allocations.end(); ++it)
        {
            if (*it == handle)
            {
                clReleaseMemObject(static_cast<cl_mem>(handle));
                _state->live.fetch_sub(1, std::memory_order_relaxed);
                _allocations.erase(it);
                return;
            }
        }
    }

    [[nodiscard]] core::Expected<void> write(void *dst, const void *src, core::usize bytes) override
    {
        auto staging = std::make_shared<std::vector<core::byte>>(bytes);
        std::memcpy(staging->data(), src, bytes);

        EventGuard done;
        const cl_int err = clEnqueueWriteBuffer(_queue, static_cast<cl_mem>(dst), CL_FALSE, 0, bytes,
                                                staging->data(), 0, nullptr, &done.event);
        if (err != CL_SUCCESS)
        {
            return core::makeError(core::ErrorCode::kDeviceError,
                                   describeStatus("clEnqueueWriteBuffer", err));
        }
        attachStaging(done.event, std::move(staging));
        return {};
    }

    [[nodiscard]] core::Expected<void> read(
        const void *src, void *dst, core::usize bytes, Deadline deadline) override
    {
        auto staging = std::make_shared<std::vector<core::byte>>(bytes);

        EventGuard done;
        const cl_int err = clEnqueueReadBuffer(_queue, static_cast<cl_mem>(const_cast<void *>(src)), CL_FALSE,
                                               0, bytes, staging->data(), 0, nullptr, &done.event);
        if (err != CL_SUCCESS)
        {
            return core::makeError(core::ErrorCode::kDeviceError,
                                   describeStatus("clEnqueueReadBuffer", err));
        }
        attachStaging(done.event, staging);

        GPO_TRY_VOID(waitForEvent(_queue, done.event, deadline, "read"));
        std::memcpy(dst, staging->data(), bytes);
        return {};
    }

    [[nodiscard]] core::Expected<void> launch(
        const IProgram &program,
        std::string_view entryPoint,
        core::usize globalWorkSize,
        std::span<const KernelArg> args) override
    {
        const auto *native = dynamic_cast<const OpenCLProgram *>(&program);
        if (!native || program.device().identity() != _state->descriptor.identity())
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError,
                                   "program was not built for " + _state->descriptor.name);
        }

        cl_kernel kernel = GPO_TRY(kernelFor(*native, entryPoint));

        for (cl_uint index = 0; index < args.size(); ++index)
        {
            const KernelArg &arg = args[index];
            cl_int err = CL_SUCCESS;
            if (arg.kind == KernelArg::Kind::kBuffer)
            {
                cl_mem mem = static_cast<cl_mem>(arg.handle);
                err = clSetKernelArg(kernel, index, sizeof(cl_mem), &mem);
            }
            else
            {
                const cl_uint value = arg.value;
                err = clSetKernelArg(kernel, index, sizeof(cl_uint), &value);
            }
            if (err != CL_SUCCESS)
            {
                return core::makeError(core::ErrorCode::kKernelLaunchError,
                                       describeStatus("clSetKernelArg", err) + " for argument " +
                                       std::to_string(index) + " of " + std::string{entryPoint});
            }
        }

        const size_t global = globalWorkSize;
        const cl_int err = clEnqueueNDRangeKernel(_queue, kernel, 1, nullptr, &global, nullptr,
                                                  0, nullptr, nullptr);
        if (err != CL_SUCCESS)
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError,
                                   describeStatus("clEnqueueNDRangeKernel", err) + " for " +
                                   std::string{entryPoint});
        }
        return {};
    }

    [[nodiscard]] core::Expected<void> finish(Deadline deadline) override
    {
        EventGuard marker;
        const cl_int err = clEnqueueMarkerWithWaitList(_queue, 0, nullptr, &marker.event);
        if (err != CL_SUCCESS)
        {
            return core::makeError(core::ErrorCode::kDeviceError,
                                   describeStatus("clEnqueueMarkerWithWaitList", err));
        }
        return waitForEvent(_queue, marker.event, deadline, "queue");
    }

private:
    core::Expected<cl_kernel> kernelFor(const OpenCLProgram &program, std::string_view entryPoint)
    {
        auto key = std::make_pair(program.handle(), std::string{entryPoint});
        auto it = _kernels.find(key);
        if (it != _kernels.end())
            return it->second;

        cl_int err = CL_SUCCESS;
        cl_kernel kernel = clCreateKernel(program.handle(), key.second.c_str(), &err);
        if (err != CL_SUCCESS || !kernel)
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError,
                                   describeStatus("clCreateKernel", err) + " for " + key.second);
        }
        _kernels.emplace(std::move(key), kernel);
        return kernel;
    }

    std::shared_ptr<ContextState>                         _state;
    cl_command_queue                                      _queue;
    std::vector<void *>                                   _allocations;
    std::map<std::pair<cl_program, std::string>, cl_kernel> _kernels;
};

// -------------------------------------------------------------------------- //
//  Device                                                                    //
// -------------------------------------------------------------------------- //

class OpenCLDevice final : public IDevice
{
public:
    explicit OpenCLDevice(std::shared_ptr<ContextState> state) : _state{std::move(state)} {}

    [[nodiscard]] const DeviceDescriptor &descriptor() const noexcept override
    {
        return _state->descriptor;
    }

    [[nodiscard]] core::Expected<std::shared_ptr<IProgram>> build(
        std::string_view source,
        std::string_view options,
        std::chrono::milliseconds timeout) override
    {
        const char *text   = source.data();
        const size_t length = source.size();

        cl_int err = CL_SUCCESS;
        cl_program program = clCreateProgramWithSource(_state->context, 1, &text, &length, &err);
        if (err != CL_SUCCESS || !program)
        {
            return core::makeError(core::ErrorCode::kBuildError,
                                   describeStatus("clCreateProgramWithSource", err));
        }

        // clBuildProgram has no timeout of its own: run it on a detached
        // thread holding its own program reference.
        auto outcome = std::make_shared<std::promise<cl_int>>();
        std::future<cl_int> result = outcome->get_future();
        clRetainProgram(program);
        std::thread{[program, device = _state->device, opts = std::string{options}, outcome] {
            const cl_int status = clBuildProgram(program, 1, &device, opts.c_str(), nullptr, nullptr);
            outcome->set_value(status);
            clReleaseProgram(program);
        }}.detach();

        if (result.wait_for(timeout) == std::future_status::timeout)
        {
            clReleaseProgram(program);
            return core::makeError(core::ErrorCode::kBuildError,
                                   "build on " + _state->descriptor.name + " exceeded " +
                                   std::to_string(timeout.count()) + " ms");
        }

        const cl_int status = result.get();
        std::string log = buildLog(program);
        if (status != CL_SUCCESS)
        {
            clReleaseProgram(program);
            return core::makeError(core::ErrorCode::kBuildError,
                                   describeStatus("clBuildProgram", status) + " on " +
                                   _state->descriptor.name + ":\n" + log);
        }

        return std::make_shared<OpenCLProgram>(_state, program, std::move(log));
    }

    [[nodiscard]] core::Expected<std::unique_ptr<ICommandQueue>> createQueue() override
    {
        cl_int err = CL_SUCCESS;
        cl_command_queue queue = clCreateCommandQueue(_state->context, _state->device, 0, &err);
        if (err != CL_SUCCESS || !queue)
        {
            const auto code = (err == CL_OUT_OF_RESOURCES || err == CL_OUT_OF_HOST_MEMORY)
                                  ? core::ErrorCode::kDeviceBusy
                                  : core::ErrorCode::kDeviceError;
            return core::makeError(code, describeStatus("clCreateCommandQueue", err));
        }
        return std::make_unique<OpenCLQueue>(_state, queue);
    }

    [[nodiscard]] core::usize liveAllocations() const noexcept override
    {
        return _state->live.load(std::memory_order_relaxed);
    }

private:
    std::string buildLog(cl_program program) const
    {
        size_t size = 0;
        if (clGetProgramBuildInfo(program, _state->device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &size) != CL_SUCCESS ||
            size == 0)
            return {};
        std::string log(size, '\0');
        if (clGetProgramBuildInfo(program, _state->device, CL_PROGRAM_BUILD_LOG, size, log.data(), nullptr) !=
            CL_SUCCESS)
            return {};
        return trimNulls(std::move(log));
    }

    std::shared_ptr<ContextState> _state;
};

DeviceType classify(cl_device_type type) noexcept
{
    if (type & CL_DEVICE_TYPE_GPU)
        return DeviceType::kGpu;
    if (type & CL_DEVICE_TYPE_ACCELERATOR)
        return DeviceType::kAccelerator;
    if (type & CL_DEVICE_TYPE_CPU)
        return DeviceType::kCpu;
    return DeviceType::kOther;
}

} // anonymous namespace

// ========================================================================== //
//  OpenCLBackend                                                             //
// ========================================================================== //

struct OpenCLBackend::Impl
{
    struct Handles
    {
        cl_platform_id   platform{nullptr};
        cl_device_id     device{nullptr};
        DeviceDescriptor descriptor;
    };

    std::mutex                                            mutex;
    std::unordered_map<std::string, Handles> handles;
};

OpenCLBackend::OpenCLBackend()
    : _impl{std::make_unique<Impl>()}
{}

OpenCLBackend::~OpenCLBackend() = default;

core::Expected<std::vector<DeviceDescriptor>> OpenCLBackend::enumerate()
{
    cl_uint platformCount = 0;
    cl_int err = clGetPlatformIDs(0, nullptr, &platformCount);
    if (err == kPlatformNotFoundKhr || (err == CL_SUCCESS && platformCount == 0))
    {
        return core::makeError(core::ErrorCode::kPlatformUnavailable, "no OpenCL platform installed");
    }
    if (err != CL_SUCCESS)
    {
        return core::makeError(core::ErrorCode::kPlatformUnavailable, describeStatus("clGetPlatformIDs", err));
    }

    std::vector<cl_platform_id> platforms(platformCount);
    err = clGetPlatformIDs(platformCount, platforms.data(), nullptr);
    if (err != CL_SUCCESS)
    {
        return core::makeError(core::ErrorCode::kPlatformUnavailable, describeStatus("clGetPlatformIDs", err));
    }

    std::vector<DeviceDescriptor> result;
    std::unordered_map<std::string, Impl::Handles> handles;
    core::u32 ordinal = 0;

    for (cl_uint p = 0; p < platformCount; ++p)
    {
        const std::string platformName = platformString(platforms[p], CL_PLATFORM_NAME);

        cl_uint deviceCount = 0;
        err = clGetDeviceIDs(platforms[p], CL_DEVICE_TYPE_ALL, 0, nullptr, &deviceCount);
        if (err == CL_DEVICE_NOT_FOUND || deviceCount == 0)
            continue;
        if (err != CL_SUCCESS)
        {
            core::Log::warn(kTag, "skipping platform '" + platformName + "': " +
                                  describeStatus("clGetDeviceIDs", err));
            continue;
        }

        std::vector<cl_device_id> devices(deviceCount);
        err = clGetDeviceIDs(platforms[p], CL_DEVICE_TYPE_ALL, deviceCount, devices.data(), nullptr);
        if (err != CL_SUCCESS)
        {
            core::Log::warn(kTag, "skipping platform '" + platformName + "': " +
                                  describeStatus("clGetDeviceIDs", err));
            continue;
        }

        for (cl_uint d = 0; d < deviceCount; ++d)
        {
            const cl_device_id device = devices[d];
            if (!deviceValue<cl_bool>(device, CL_DEVICE_AVAILABLE, CL_FALSE) ||
                !deviceValue<cl_bool>(device, CL_DEVICE_COMPILER_AVAILABLE, CL_FALSE))
            {
                core::Log::debug(kTag, "skipping unavailable device " + deviceString(device, CL_DEVICE_NAME));
                continue;
            }

            DeviceDescriptor desc;
            desc.backend          = BackendKind::kOpenCL;
            desc.platformId       = "opencl:" + std::to_string(p);
            desc.platformName     = platformName;
            desc.deviceId         = desc.platformId + ":" + std::to_string(d);
            desc.name             = deviceString(device, CL_DEVICE_NAME);
            desc.vendor           = deviceString(device, CL_DEVICE_VENDOR);
            desc.driverVersion    = deviceString(device, CL_DRIVER_VERSION);
            desc.type             = classify(deviceValue<cl_device_type>(device, CL_DEVICE_TYPE, 0));
            desc.hardware         = desc.type == DeviceType::kGpu || desc.type == DeviceType::kAccelerator;
            desc.computeUnits     = deviceValue<cl_uint>(device, CL_DEVICE_MAX_COMPUTE_UNITS, 0);
            desc.maxWorkGroupSize = deviceValue<size_t>(device, CL_DEVICE_MAX_WORK_GROUP_SIZE, 0);
            desc.globalMemBytes   = deviceValue<cl_ulong>(device, CL_DEVICE_GLOBAL_MEM_SIZE, 0);
            desc.extensions       = splitExtensions(deviceString(device, CL_DEVICE_EXTENSIONS));
            desc.ordinal          = ordinal++;

            handles[desc.deviceId] = Impl::Handles{platforms[p], device, desc};
            result.push_back(std::move(desc));
        }
    }

    std::lock_guard<std::mutex> lock{_impl->mutex};
    _impl->handles = std::move(handles);
    return result;
}

core::Expected<std::shared_ptr<IDevice>> OpenCLBackend::open(const DeviceDescriptor &descriptor)
{
    std::lock_guard<std::mutex> lock{_impl->mutex};

    auto found = _impl->handles.find(descriptor.deviceId);
    if (descriptor.backend != BackendKind::kOpenCL || found == _impl->handles.end() ||
        found->second.descriptor.identity() != descriptor.identity())
    {
        return core::makeError(core::ErrorCode::kNoDeviceAvailable,
                               "OpenCL device " + descriptor.deviceId + " is not enumerated");
    }

    // Always a new context: after a device loss the registry reopens here
    // and must not get the dead one back.
    const cl_context_properties properties[] = {
        CL_CONTEXT_PLATFORM, reinterpret_cast<cl_context_properties>(found->second.platform), 0};

    cl_int err = CL_SUCCESS;
    cl_device_id device = found->second.device;
    cl_context context = clCreateContext(properties, 1, &device, nullptr, nullptr, &err);
    if (err != CL_SUCCESS || !context)
    {
        return core::makeError(core::ErrorCode::kNoDeviceAvailable, describeStatus("clCreateContext", err));
    }

    auto state = std::make_shared<ContextState>();
    state->descriptor = found->second.descriptor;
    state->device     = device;
    state->context    = context;

    core::Log::info(kTag, "opened " + descriptor.summary());
    return std::shared_ptr<IDevice>{std::make_shared<OpenCLDevice>(std::move(state))};
}

const char *OpenCLBackend::name() const noexcept
{
    return "OpenCLBackend";
}

} // namespace gpo::gpu
