/**
 * @file SoftwareBackend.cpp
 * @brief Emulated compute device executing native kernels on a thread pool.
 *
 * Object graph:
 *   SoftwareBackend ─ KernelTable (shared with every built program)
 *                   └ SoftwareDevice ─ DeviceState (shared with queues and
 *                                      in-flight commands)
 *   SoftwareQueue ─ Worker (shared with its detached worker thread)
 *                 └ Allocation (shared with the commands that use it)
 *
 * Shared ownership lets an abandoned queue's running command finish after
 * the session has been torn down without touching freed memory.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/SoftwareBackend.hpp>
#include <gpo/concurrency/ThreadPool.hpp>
#include <gpo/core/Log.hpp>

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <new>
#include <regex>
#include <thread>
#include <unordered_map>
#include <unistd.h>

namespace gpo::gpu {

namespace {

constexpr const char *kTag          = "GPU";
constexpr const char *kDeviceId     = "software:0:0";
constexpr const char *kDeviceName   = "gpo-software";

using NativeKernel = SoftwareBackend::NativeKernel;
using KernelMap    = std::unordered_map<std::string, NativeKernel>;

struct KernelTable
{
    std::mutex mutex;
    KernelMap  kernels;
};

struct DeviceState
{
    DeviceDescriptor                    descriptor;
    SoftwareBackend::FaultInjection     faults;
    std::shared_ptr<KernelTable>        kernels;
    concurrency::ThreadPool             pool;
    std::shared_ptr<std::atomic<core::usize>> live{std::make_shared<std::atomic<core::usize>>(0)};
    std::atomic<core::u32>              allocationCount{0};
    std::atomic<core::u32>              launchCount{0};
    std::atomic<core::u32>              openQueues{0};

    DeviceState(DeviceDescriptor desc, SoftwareBackend::FaultInjection f,
                std::shared_ptr<KernelTable> table, core::u32 threads)
        : descriptor{std::move(desc)}
        , faults{std::move(f)}
        , kernels{std::move(table)}
        , pool{"GPU", threads}
    {}
};

// -------------------------------------------------------------------------- //
//  Allocation                                                                //
// -------------------------------------------------------------------------- //

class Allocation final
{
public:
    Allocation(core::usize bytes, std::shared_ptr<std::atomic<core::usize>> live)
        : _data{new core::byte[bytes]()}
        , _bytes{bytes}
        , _live{std::move(live)}
    {
        _live->fetch_add(1, std::memory_order_relaxed);
    }

    ~Allocation() { _live->fetch_sub(1, std::memory_order_relaxed); }

    Allocation(const Allocation &)            = delete;
    Allocation &operator=(const Allocation &) = delete;

    [[nodiscard]] core::byte *data() noexcept { return _data.get(); }
    [[nodiscard]] core::usize bytes() const noexcept { return _bytes; }

private:
    std::unique_ptr<core::byte[]>             _data;
    core::usize                               _bytes;
    std::shared_ptr<std::atomic<core::usize>> _live;
};

// -------------------------------------------------------------------------- //
//  Program                                                                   //
// -------------------------------------------------------------------------- //

class SoftwareProgram final : public IProgram
{
public:
    SoftwareProgram(DeviceDescriptor device, KernelMap kernels, std::string log)
        : _device{std::move(device)}, _kernels{std::move(kernels)}, _log{std::move(log)}
    {}

    [[nodiscard]] const DeviceDescriptor &device() const noexcept override { return _device; }

    [[nodiscard]] bool hasKernel(std::string_view entryPoint) const noexcept override
    {
        return _kernels.find(std::string{entryPoint}) != _kernels.end();
    }

    [[nodiscard]] const std::string &buildLog() const noexcept override { return _log; }

    [[nodiscard]] const NativeKernel *find(std::string_view entryPoint) const
    {
        auto it = _kernels.find(std::string{entryPoint});
        return it == _kernels.end() ? nullptr : &it->second;
    }

private:
    DeviceDescriptor _device;
    KernelMap        _kernels;
    std::string      _log;
};

// -------------------------------------------------------------------------- //
//  Queue                                                                     //
// -------------------------------------------------------------------------- //

class SoftwareQueue final : public ICommandQueue
{
public:
    explicit SoftwareQueue(std::shared_ptr<DeviceState> device)
        : _device{std::move(device)}
        , _worker{std::make_shared<Worker>()}
    {
        std::thread{&SoftwareQueue::workerLoop, _worker}.detach();
    }

    ~SoftwareQueue() override
    {
        {
            std::lock_guard<std::mutex> lock{_worker->mutex};
            _worker->abandoned = true;
            _worker->commands.clear();
        }
        _worker->cv.notify_one();
        _allocations.clear();
        _device->openQueues.fetch_sub(1, std::memory_order_acq_rel);
    }

    [[nodiscard]] core::Expected<void *> allocate(core::usize bytes, BufferRole /*role*/) override
    {
        const core::u32 index = _device->allocationCount.fetch_add(1) + 1;
        if (_device->faults.failAllocationAt && *_device->faults.failAllocationAt == index)
        {
            return core::makeError(core::ErrorCode::kAllocationFailed,
                                   "injected allocation failure #" + std::to_string(index));
        }

        std::shared_ptr<Allocation> allocation;
        try
        {
            allocation = std::make_shared<Allocation>(bytes, _device->live);
        }
        catch (const std::bad_alloc &)
        {
            return core::makeError(core::ErrorCode::kAllocationFailed,
                                   "out of host memory for " + std::to_string(bytes) + " bytes");
        }

        void *handle = allocation->data();
        _allocations.emplace(handle, std::move(allocation));
        return handle;
    }

    void release(void *handle) noexcept override
    {
        _allocations.erase(handle);
    }

    [[nodiscard]] core::Expected<void> write(void *dst, const void *src, core::usize bytes) override
    {
        auto target = GPO_TRY(lookup(dst, bytes));
        auto staging = std::make_shared<std::vector<core::byte>>(bytes);
        std::memcpy(staging->data(), src, bytes);

        submit([target, staging]() -> core::Expected<void> {
            std::memcpy(target->data(), staging->data(), staging->size());
            return {};
        });
        return {};
    }

    [[nodiscard]] core::Expected<void> read(
        const void *src, void *dst, core::usize bytes, Deadline deadline) override
    {
        auto source = GPO_TRY(lookup(src, bytes));
        auto staging = std::make_shared<std::vector<core::byte>>(bytes);

        auto done = submit([source, staging]() -> core::Expected<void> {
            std::memcpy(staging->data(), source->data(), staging->size());
            return {};
        });
        GPO_TRY_VOID(wait(done, deadline));

        std::memcpy(dst, staging->data(), bytes);
        return {};
    }

    [[nodiscard]] core::Expected<void> launch(
        const IProgram &program,
        std::string_view entryPoint,
        core::usize globalWorkSize,
        std::span<const KernelArg> args) override
    {
        const auto *native = dynamic_cast<const SoftwareProgram *>(&program);
        if (!native || program.device().identity() != _device->descriptor.identity())
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError,
                                   "program was not built for " + _device->descriptor.name);
        }

        const NativeKernel *kernel = native->find(entryPoint);
        if (!kernel)
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError,
                                   "unknown kernel '" + std::string{entryPoint} + "'");
        }
        if (globalWorkSize == 0)
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError, "empty global work size");
        }

        const core::u32 index = _device->launchCount.fetch_add(1) + 1;
        if (_device->faults.failLaunchAt && *_device->faults.failLaunchAt == index)
        {
            return core::makeError(core::ErrorCode::kKernelLaunchError,
                                   "injected launch failure #" + std::to_string(index));
        }

        std::vector<std::shared_ptr<Allocation>> held;
        for (const auto &arg : args)
        {
            if (arg.kind != KernelArg::Kind::kBuffer)
                continue;
            auto it = _allocations.find(arg.handle);
            if (it == _allocations.end())
            {
                return core::makeError(core::ErrorCode::kKernelLaunchError,
                                       "kernel argument is not a live buffer of this queue");
            }
            held.push_back(it->second);
        }

        submit([device = _device, fn = *kernel, argv = std::vector<KernelArg>(args.begin(), args.end()),
                held = std::move(held), globalWorkSize]() -> core::Expected<void> {
            if (device->faults.launchLatency.count() > 0)
                std::this_thread::sleep_for(device->faults.launchLatency);

            const std::span<const KernelArg> view{argv};
            device->pool.parallelFor(globalWorkSize, [&fn, view](core::usize begin, core::usize end) {
                fn(view, begin, end);
            });
            return {};
        });
        return {};
    }

    [[nodiscard]] core::Expected<void> finish(Deadline deadline) override
    {
        if (!_tail.valid())
            return {};
        return wait(_tail, deadline);
    }

private:
    struct Worker
    {
        std::mutex                         mutex;
        std::condition_variable            cv;
        std::deque<std::function<void()>>  commands;
        std::optional<core::Error>         failure;
        bool                               abandoned{false};
    };

    static void workerLoop(std::shared_ptr<Worker> worker)
    {
        for (;;)
        {
            std::function<void()> command;
            {
                std::unique_lock<std::mutex> lock{worker->mutex};
                worker->cv.wait(lock, [&worker] {
                    return worker->abandoned || !worker->commands.empty();
                });
                if (worker->commands.empty())
                    return;
                command = std::move(worker->commands.front());
                worker->commands.pop_front();
            }
            command();
        }
    }

    std::shared_future<void> submit(std::function<core::Expected<void>()> body)
    {
        auto promise = std::make_shared<std::promise<void>>();
        std::shared_future<void> done = promise->get_future().share();

        {
            std::lock_guard<std::mutex> lock{_worker->mutex};
            _worker->commands.emplace_back([worker = _worker, promise, body = std::move(body)] {
                bool skip = false;
                {
                    std::lock_guard<std::mutex> guard{worker->mutex};
                    skip = worker->failure.has_value();
                }
                if (!skip)
                {
                    auto result = body();
                    if (!result)
                    {
                        std::lock_guard<std::mutex> guard{worker->mutex};
                        worker->failure.emplace(result.error());
                    }
                }
                promise->set_value();
            });
        }
        _worker->cv.notify_one();

        _tail = done;
        return done;
    }

    core::Expected<void> wait(const std::shared_future<void> &done, Deadline deadline)
    {
        if (done.wait_until(deadline) == std::future_status::timeout)
        {
            return core::makeError(core::ErrorCode::kTimeout,
                                   "device did not complete before the deadline");
        }

        std::lock_guard<std::mutex> lock{_worker->mutex};
        if (_worker->failure)
        {
            return core::makeError(core::ErrorCode::kDeviceError, _worker->failure->describe());
        }
        return {};
    }

    core::Expected<std::shared_ptr<Allocation>> lookup(const void *handle, core::usize bytes) const
    {
        auto it = _allocations.find(const_cast<void *>(handle));
        if (it == _allocations.end())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, "unknown buffer handle");
        }
        if (bytes > it->second->bytes())
        {
            return core::makeError(core::ErrorCode::kOutOfRange, "transfer exceeds buffer size");
        }
        return it->second;
    }

    std::shared_ptr<DeviceState>                             _device;
    std::shared_ptr<Worker>                                  _worker;
    std::unordered_map<void *, std::shared_ptr<Allocation>>  _allocations;
    std::shared_future<void>                                 _tail;
};

// -------------------------------------------------------------------------- //
//  Device                                                                    //
// -------------------------------------------------------------------------- //

class SoftwareDevice final : public IDevice
{
public:
    explicit SoftwareDevice(std::shared_ptr<DeviceState> state) : _state{std::move(state)} {}

    [[nodiscard]] const DeviceDescriptor &descriptor() const noexcept override
    {
        return _state->descriptor;
    }

    [[nodiscard]] core::Expected<std::shared_ptr<IProgram>> build(
        std::string_view source,
        std::string_view /*options*/,
        std::chrono::milliseconds /*timeout*/) override
    {
        if (_state->faults.failBuild)
        {
            return core::makeError(core::ErrorCode::kBuildError,
                                   "build failed on " + _state->descriptor.name + ":\n" +
                                   *_state->faults.failBuild);
        }

        KernelMap   resolved;
        std::string log;
        {
            static const std::regex kEntry{R"(__kernel\s+void\s+([A-Za-z_][A-Za-z0-9_]*)\s*\()"};
            const std::string text{source};

            std::lock_guard<std::mutex> lock{_state->kernels->mutex};
            for (auto it = std::sregex_iterator(text.begin(), text.end(), kEntry);
                 it != std::sregex_iterator(); ++it)
            {
                const std::string entry = (*it)[1].str();
                auto found = _state->kernels->kernels.find(entry);
                if (found == _state->kernels->kernels.end())
                {
                    log += "error: no native implementation for kernel '" + entry + "'\n";
                    continue;
                }
                resolved.emplace(entry, found->second);
            }
        }

        if (resolved.empty() && log.empty())
        {
            log = "error: source declares no __kernel entry point\n";
        }
        if (!log.empty())
        {
            return core::makeError(core::ErrorCode::kBuildError,
                                   "build failed on " + _state->descriptor.name + ":\n" + log);
        }

        return std::make_shared<SoftwareProgram>(_state->descriptor, std::move(resolved), std::string{});
    }

    [[nodiscard]] core::Expected<std::unique_ptr<ICommandQueue>> createQueue() override
    {
        const core::u32 open = _state->openQueues.fetch_add(1, std::memory_order_acq_rel);
        if (_state->faults.maxQueues && open >= *_state->faults.maxQueues)
        {
            _state->openQueues.fetch_sub(1, std::memory_order_acq_rel);
            return core::makeError(core::ErrorCode::kDeviceBusy,
                                   _state->descriptor.name + " has " + std::to_string(open) +
                                   " open queues");
        }
        return std::make_unique<SoftwareQueue>(_state);
    }

    [[nodiscard]] core::usize liveAllocations() const noexcept override
    {
        return _state->live->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<DeviceState> _state;
};

core::u64 physicalMemoryBytes() noexcept
{
    const long pages    = ::sysconf(_SC_PHYS_PAGES);
    const long pageSize = ::sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || pageSize <= 0)
        return 0;
    return static_cast<core::u64>(pages) * static_cast<core::u64>(pageSize);
}

} // anonymous namespace

// ========================================================================== //
//  SoftwareBackend                                                           //
// ========================================================================== //

struct SoftwareBackend::Impl
{
    Options                          options;
    core::u32                        threads;
    std::shared_ptr<KernelTable>     kernels{std::make_shared<KernelTable>()};

    explicit Impl(Options opts)
        : options{std::move(opts)}
        , threads{options.threads != 0 ? options.threads
                                       : std::max(1u, std::thread::hardware_concurrency())}
    {}

    [[nodiscard]] DeviceDescriptor describe() const
    {
        DeviceDescriptor desc;
        desc.backend          = BackendKind::kSoftware;
        desc.platformId       = "software:0";
        desc.platformName     = "GPO Software Device";
        desc.deviceId         = kDeviceId;
        desc.name             = kDeviceName;
        desc.vendor           = "gpo";
        desc.driverVersion    = "1.0";
        desc.type             = DeviceType::kSoftware;
        desc.hardware         = false;
        desc.computeUnits     = threads;
        desc.maxWorkGroupSize = 1024;
        desc.globalMemBytes   = physicalMemoryBytes();
        desc.extensions       = {"cl_khr_global_int32_base_atomics",
                                 "cl_khr_global_int32_extended_atomics"};
        desc.ordinal          = 0;
        return desc;
    }
};

SoftwareBackend::SoftwareBackend()
    : SoftwareBackend(Options{})
{}

SoftwareBackend::SoftwareBackend(Options options)
    : _impl{std::make_unique<Impl>(std::move(options))}
{}

SoftwareBackend::~SoftwareBackend() = default;

void SoftwareBackend::registerKernel(std::string entryPoint, NativeKernel kernel)
{
    std::lock_guard<std::mutex> lock{_impl->kernels->mutex};
    _impl->kernels->kernels[std::move(entryPoint)] = std::move(kernel);
}

core::Expected<std::vector<DeviceDescriptor>> SoftwareBackend::enumerate()
{
    return std::vector<DeviceDescriptor>{_impl->describe()};
}

core::Expected<std::shared_ptr<IDevice>> SoftwareBackend::open(const DeviceDescriptor &descriptor)
{
    if (descriptor.backend != BackendKind::kSoftware || descriptor.deviceId != kDeviceId)
    {
        return core::makeError(core::ErrorCode::kNoDeviceAvailable,
                               "software backend does not own device " + descriptor.deviceId);
    }

    auto state = std::make_shared<DeviceState>(
        _impl->describe(), _impl->options.faults, _impl->kernels, _impl->threads);
    core::Log::info(kTag, "opened " + state->descriptor.summary());
    return std::shared_ptr<IDevice>{std::make_shared<SoftwareDevice>(std::move(state))};
}

const char *SoftwareBackend::name() const noexcept
{
    return "SoftwareBackend";
}

} // namespace gpo::gpu
