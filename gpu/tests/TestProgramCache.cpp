/**
 * @file TestProgramCache.cpp
 * @brief Unit tests for gpu::ProgramCache.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/gpu/ProgramCache.hpp"
#include "gpo/gpu/SoftwareBackend.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <new>
#include <thread>
#include <vector>

namespace gpo::gpu {

namespace {

constexpr std::string_view kNoopSource = "__kernel void noop(__global uint *out) { }\n";

std::shared_ptr<IDevice> openSoftware(SoftwareBackend &backend)
{
    backend.registerKernel("noop", [](std::span<const KernelArg>, core::usize, core::usize) {});
    auto devices = backend.enumerate();
    REQUIRE(devices.has_value());
    auto device = backend.open(devices->front());
    REQUIRE(device.has_value());
    return *device;
}

/// Forwards to a real device but lets a test decide what each build does.
class ScriptedDevice final : public IDevice
{
public:
    using Script = std::function<core::Expected<std::shared_ptr<IProgram>>(int call, IDevice &inner)>;

    ScriptedDevice(std::shared_ptr<IDevice> inner, Script script)
        : _inner{std::move(inner)}
        , _script{std::move(script)}
    {}

    const DeviceDescriptor &descriptor() const noexcept override { return _inner->descriptor(); }

    core::Expected<std::shared_ptr<IProgram>> build(
        std::string_view, std::string_view, std::chrono::milliseconds) override
    {
        return _script(_calls.fetch_add(1) + 1, *_inner);
    }

    core::Expected<std::unique_ptr<ICommandQueue>> createQueue() override { return _inner->createQueue(); }
    core::usize liveAllocations() const noexcept override { return _inner->liveAllocations(); }

private:
    std::shared_ptr<IDevice> _inner;
    Script                   _script;
    std::atomic<int>         _calls{0};
};

core::Expected<std::shared_ptr<IProgram>> buildNoop(IDevice &device)
{
    return device.build(kNoopSource, {}, std::chrono::seconds{5});
}

} // anonymous namespace

TEST_CASE("ProgramCache builds once per device and source", "[gpu][cache]")
{
    SoftwareBackend backend;
    auto device = openSoftware(backend);
    ProgramCache cache;

    auto first  = cache.getProgram(*device, kNoopSource);
    auto second = cache.getProgram(*device, kNoopSource);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->get() == second->get());
    REQUIRE(cache.buildCount() == 1);
    REQUIRE(cache.contains(device->descriptor(), kNoopSource));

    auto withOptions = cache.getProgram(*device, kNoopSource, "-cl-fast-relaxed-math");
    REQUIRE(withOptions.has_value());
    REQUIRE(cache.buildCount() == 2);
    REQUIRE(cache.size() == 2);
}

TEST_CASE("ProgramCache concurrent callers share one build", "[gpu][cache]")
{
    SoftwareBackend backend;
    auto device = openSoftware(backend);
    ProgramCache cache;

    std::vector<std::shared_ptr<IProgram>> programs(8);
    std::vector<std::thread> callers;
    for (core::usize i = 0; i < programs.size(); ++i)
    {
        callers.emplace_back([&, i] {
            auto program = cache.getProgram(*device, kNoopSource);
            if (program)
                programs[i] = *program;
        });
    }
    for (auto &caller : callers)
        caller.join();

    REQUIRE(cache.buildCount() == 1);
    for (const auto &program : programs)
        REQUIRE(program.get() == programs.front().get());
    REQUIRE(programs.front() != nullptr);
}

TEST_CASE("ProgramCache does not cache failed builds", "[gpu][cache]")
{
    SoftwareBackend::Options options;
    options.faults.failBuild = "kernel.cl:1:1: error: use of undeclared identifier 'x'";
    SoftwareBackend backend{options};
    auto device = openSoftware(backend);
    ProgramCache cache;

    auto first = cache.getProgram(*device, kNoopSource);
    REQUIRE_FALSE(first.has_value());
    REQUIRE(first.error().code() == core::ErrorCode::kBuildError);
    REQUIRE(first.error().message().find("undeclared identifier") != std::string::npos);
    REQUIRE(cache.size() == 0);

    auto second = cache.getProgram(*device, kNoopSource);
    REQUIRE_FALSE(second.has_value());
    REQUIRE(cache.buildCount() == 2);
}

TEST_CASE("ProgramCache invalidate drops the device's programs", "[gpu][cache]")
{
    SoftwareBackend backend;
    auto device = openSoftware(backend);
    ProgramCache cache;

    REQUIRE(cache.getProgram(*device, kNoopSource).has_value());
    cache.invalidate("opencl|other|opencl:0:0|gpu|1.0");
    REQUIRE(cache.size() == 1);

    cache.invalidate(device->descriptor().identity());
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.getProgram(*device, kNoopSource).has_value());
    REQUIRE(cache.buildCount() == 2);
}

TEST_CASE("ProgramCache turns a throwing build into BuildError and retries", "[gpu][cache]")
{
    SoftwareBackend backend;
    ScriptedDevice device{openSoftware(backend), [](int call, IDevice &inner) {
        if (call == 1)
            throw std::bad_alloc{};
        return buildNoop(inner);
    }};
    ProgramCache cache;

    auto first = cache.getProgram(device, kNoopSource);
    REQUIRE_FALSE(first.has_value());
    REQUIRE(first.error().code() == core::ErrorCode::kBuildError);
    REQUIRE(cache.size() == 0);

    auto second = cache.getProgram(device, kNoopSource);
    REQUIRE(second.has_value());
    REQUIRE(cache.buildCount() == 2);
}

TEST_CASE("ProgramCache keeps a newer build when an older one fails", "[gpu][cache]")
{
    std::promise<void> started;
    std::promise<void> release;
    auto releaseSignal = release.get_future().share();

    SoftwareBackend backend;
    ScriptedDevice device{openSoftware(backend),
                          [&started, releaseSignal](int call, IDevice &inner)
                              -> core::Expected<std::shared_ptr<IProgram>> {
                              if (call == 1)
                              {
                                  started.set_value();
                                  releaseSignal.wait();
                                  return core::makeError(core::ErrorCode::kBuildError, "context lost mid-build");
                              }
                              return buildNoop(inner);
                          }};
    ProgramCache cache;

    std::atomic<bool> staleFailed{false};
    std::thread stale{[&] { staleFailed.store(!cache.getProgram(device, kNoopSource).has_value()); }};
    started.get_future().wait();

    cache.invalidate(device.descriptor().identity());
    auto fresh = cache.getProgram(device, kNoopSource);
    REQUIRE(fresh.has_value());

    release.set_value();
    stale.join();
    REQUIRE(staleFailed.load());

    REQUIRE(cache.contains(device.descriptor(), kNoopSource));
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.buildCount() == 2);
}

} // namespace gpo::gpu
