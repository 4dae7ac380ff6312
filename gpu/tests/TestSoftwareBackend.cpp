/**
 * @file TestSoftwareBackend.cpp
 * @brief Unit tests for gpu::SoftwareBackend and its fault injection.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/gpu/SoftwareBackend.hpp"

#include <array>
#include <thread>

namespace gpo::gpu {

namespace {

constexpr std::string_view kFillSource =
    "__kernel void fill(__global uint *out, uint value) { out[get_global_id(0)] = value; }\n";

void registerFill(SoftwareBackend &backend)
{
    backend.registerKernel("fill", [](std::span<const KernelArg> args, core::usize begin, core::usize end) {
        auto *out = static_cast<core::u32 *>(args[0].handle);
        for (core::usize i = begin; i < end; ++i)
            out[i] = args[1].value;
    });
}

std::shared_ptr<IDevice> openOnly(SoftwareBackend &backend)
{
    auto devices = backend.enumerate();
    REQUIRE(devices.has_value());
    REQUIRE(devices->size() == 1);
    auto device = backend.open(devices->front());
    REQUIRE(device.has_value());
    return *device;
}

Deadline soon()
{
    return Clock::now() + std::chrono::seconds{5};
}

} // anonymous namespace

TEST_CASE("SoftwareBackend describes one software device", "[gpu][software]")
{
    SoftwareBackend backend{SoftwareBackend::Options{.threads = 3}};
    auto devices = backend.enumerate();
    REQUIRE(devices.has_value());
    REQUIRE(devices->size() == 1);

    const DeviceDescriptor &device = devices->front();
    REQUIRE(device.backend == BackendKind::kSoftware);
    REQUIRE(device.type == DeviceType::kSoftware);
    REQUIRE_FALSE(device.hardware);
    REQUIRE(device.computeUnits == 3);
    REQUIRE(device.hasExtension("cl_khr_global_int32_base_atomics"));
}

TEST_CASE("SoftwareBackend opens a fresh handle on every call", "[gpu][software]")
{
    SoftwareBackend backend;
    auto first  = openOnly(backend);
    auto second = openOnly(backend);
    REQUIRE(first.get() != second.get());
    REQUIRE(first->descriptor().identity() == second->descriptor().identity());

    DeviceDescriptor foreign = first->descriptor();
    foreign.deviceId = "opencl:0:0";
    auto rejected = backend.open(foreign);
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().code() == core::ErrorCode::kNoDeviceAvailable);
}

TEST_CASE("SoftwareBackend runs a registered kernel", "[gpu][software]")
{
    SoftwareBackend backend{SoftwareBackend::Options{.threads = 2}};
    registerFill(backend);
    auto device = openOnly(backend);

    auto program = device->build(kFillSource, {}, std::chrono::seconds{1});
    REQUIRE(program.has_value());
    REQUIRE((*program)->hasKernel("fill"));
    REQUIRE_FALSE((*program)->hasKernel("relax_grid"));

    auto queue = device->createQueue();
    REQUIRE(queue.has_value());

    auto handle = (*queue)->allocate(64 * sizeof(core::u32), BufferRole::kReadWrite);
    REQUIRE(handle.has_value());
    REQUIRE(device->liveAllocations() == 1);

    const std::array<KernelArg, 2> args{KernelArg::buffer(*handle), KernelArg::scalar(7)};
    REQUIRE((*queue)->launch(**program, "fill", 64, args).has_value());

    std::array<core::u32, 64> host{};
    REQUIRE((*queue)->read(*handle, host.data(), sizeof(host), soon()).has_value());
    for (const core::u32 value : host)
        REQUIRE(value == 7);

    (*queue)->release(*handle);
    REQUIRE(device->liveAllocations() == 0);
}

TEST_CASE("SoftwareBackend build fails without a native kernel", "[gpu][software]")
{
    SoftwareBackend backend;
    auto device = openOnly(backend);

    auto program = device->build(kFillSource, {}, std::chrono::seconds{1});
    REQUIRE_FALSE(program.has_value());
    REQUIRE(program.error().code() == core::ErrorCode::kBuildError);
    REQUIRE(program.error().message().find("fill") != std::string::npos);
}

TEST_CASE("SoftwareBackend injected failures", "[gpu][software][faults]")
{
    SECTION("allocation")
    {
        SoftwareBackend::Options options;
        options.faults.failAllocationAt = 2;
        SoftwareBackend backend{options};
        auto device = openOnly(backend);
        auto queue  = device->createQueue();
        REQUIRE(queue.has_value());

        auto first = (*queue)->allocate(16, BufferRole::kReadWrite);
        REQUIRE(first.has_value());
        auto second = (*queue)->allocate(16, BufferRole::kReadWrite);
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().code() == core::ErrorCode::kAllocationFailed);
    }

    SECTION("launch")
    {
        SoftwareBackend::Options options;
        options.faults.failLaunchAt = 1;
        SoftwareBackend backend{options};
        registerFill(backend);
        auto device  = openOnly(backend);
        auto program = device->build(kFillSource, {}, std::chrono::seconds{1});
        REQUIRE(program.has_value());
        auto queue = device->createQueue();
        REQUIRE(queue.has_value());
        auto handle = (*queue)->allocate(4 * sizeof(core::u32), BufferRole::kReadWrite);
        REQUIRE(handle.has_value());

        const std::array<KernelArg, 2> args{KernelArg::buffer(*handle), KernelArg::scalar(1)};
        auto launched = (*queue)->launch(**program, "fill", 4, args);
        REQUIRE_FALSE(launched.has_value());
        REQUIRE(launched.error().code() == core::ErrorCode::kKernelLaunchError);

        queue->reset();
        REQUIRE(device->liveAllocations() == 0);
    }

    SECTION("build")
    {
        SoftwareBackend::Options options;
        options.faults.failBuild = "error: injected";
        SoftwareBackend backend{options};
        registerFill(backend);
        auto device  = openOnly(backend);
        auto program = device->build(kFillSource, {}, std::chrono::seconds{1});
        REQUIRE_FALSE(program.has_value());
        REQUIRE(program.error().code() == core::ErrorCode::kBuildError);
        REQUIRE(program.error().message().find("error: injected") != std::string::npos);
    }

    SECTION("queue limit")
    {
        SoftwareBackend::Options options;
        options.faults.maxQueues = 1;
        SoftwareBackend backend{options};
        auto device = openOnly(backend);

        auto first = device->createQueue();
        REQUIRE(first.has_value());
        auto second = device->createQueue();
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().code() == core::ErrorCode::kDeviceBusy);

        first->reset();
        REQUIRE(device->createQueue().has_value());
    }
}

TEST_CASE("SoftwareBackend wait honours the deadline", "[gpu][software][faults]")
{
    SoftwareBackend::Options options;
    options.faults.launchLatency = std::chrono::milliseconds{300};
    SoftwareBackend backend{options};
    registerFill(backend);
    auto device  = openOnly(backend);
    auto program = device->build(kFillSource, {}, std::chrono::seconds{1});
    REQUIRE(program.has_value());
    auto queue = device->createQueue();
    REQUIRE(queue.has_value());
    auto handle = (*queue)->allocate(sizeof(core::u32), BufferRole::kReadWrite);
    REQUIRE(handle.has_value());

    const std::array<KernelArg, 2> args{KernelArg::buffer(*handle), KernelArg::scalar(3)};
    REQUIRE((*queue)->launch(**program, "fill", 1, args).has_value());

    auto finished = (*queue)->finish(Clock::now() + std::chrono::milliseconds{20});
    REQUIRE_FALSE(finished.has_value());
    REQUIRE(finished.error().code() == core::ErrorCode::kTimeout);

    REQUIRE((*queue)->finish(soon()).has_value());
}

} // namespace gpo::gpu
