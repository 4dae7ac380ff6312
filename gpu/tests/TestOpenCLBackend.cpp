/**
 * @file TestOpenCLBackend.cpp
 * @brief Tests for gpu::OpenCLBackend; skipped on hosts without an OpenCL platform.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/gpu/ComputeSession.hpp"
#include "gpo/gpu/OpenCLBackend.hpp"
#include "gpo/gpu/ProgramCache.hpp"

#include <vector>

namespace gpo::gpu {

namespace {

constexpr std::string_view kAddSource =
    "__kernel void add_one(__global uint *data) { data[get_global_id(0)] += 1u; }\n";

constexpr std::string_view kBrokenSource =
    "__kernel void broken(__global uint *data) { data[get_global_id(0)] = undeclared; }\n";

} // anonymous namespace

TEST_CASE("clErrorName maps status codes to their symbols", "[gpu][opencl]")
{
    REQUIRE(std::string_view{clErrorName(0)} == "CL_SUCCESS");
    REQUIRE(std::string_view{clErrorName(-5)} == "CL_OUT_OF_RESOURCES");
    REQUIRE(std::string_view{clErrorName(-11)} == "CL_BUILD_PROGRAM_FAILURE");
}

TEST_CASE("OpenCLBackend runs a kernel on the first device", "[gpu][opencl]")
{
    OpenCLBackend backend;
    auto devices = backend.enumerate();
    if (!devices || devices->empty())
        SKIP("no OpenCL platform available");

    auto device = backend.open(devices->front());
    REQUIRE(device.has_value());

    ProgramCache cache;
    auto program = cache.getProgram(**device, kAddSource);
    REQUIRE(program.has_value());
    REQUIRE((*program)->hasKernel("add_one"));

    auto session = ComputeSession::open(*device);
    REQUIRE(session.has_value());

    std::vector<core::u32> host{10, 20, 30};
    auto buffer = session->allocate(host.size(), sizeof(core::u32), BufferRole::kReadWrite);
    REQUIRE(buffer.has_value());
    REQUIRE(session->enqueueWrite(**buffer, std::span<const core::u32>{host}).has_value());
    REQUIRE(session->enqueueKernel(**program, "add_one", host.size(), {(*buffer)->arg()}).has_value());
    REQUIRE(session->enqueueRead(**buffer, std::span<core::u32>{host}).has_value());
    REQUIRE(host == std::vector<core::u32>{11, 21, 31});
}

TEST_CASE("OpenCLBackend reports the compiler log on a failed build", "[gpu][opencl]")
{
    OpenCLBackend backend;
    auto devices = backend.enumerate();
    if (!devices || devices->empty())
        SKIP("no OpenCL platform available");

    auto device = backend.open(devices->front());
    REQUIRE(device.has_value());

    auto program = (*device)->build(kBrokenSource, {}, std::chrono::seconds{30});
    REQUIRE_FALSE(program.has_value());
    REQUIRE(program.error().code() == core::ErrorCode::kBuildError);
    REQUIRE_FALSE(program.error().message().empty());
}

} // namespace gpo::gpu
