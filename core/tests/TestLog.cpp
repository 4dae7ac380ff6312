/**
 * @file TestLog.cpp
 * @brief Unit tests for the Log façade and level parsing.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/core/Log.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace gpo::core {

namespace {

struct Entry
{
    LogLevel    level;
    std::string tag;
    std::string message;
};

class CapturingLogger final : public ILogger
{
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        std::lock_guard<std::mutex> lock{_mutex};
        entries.push_back(Entry{level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;

private:
    std::mutex _mutex;
};

} // anonymous namespace

TEST_CASE("parseLogLevel accepts names case-insensitively", "[core][log]")
{
    REQUIRE(parseLogLevel("debug").value() == LogLevel::kDebug);
    REQUIRE(parseLogLevel("INFO").value() == LogLevel::kInfo);
    REQUIRE(parseLogLevel("Warning").value() == LogLevel::kWarn);
    REQUIRE(parseLogLevel("error").value() == LogLevel::kError);
    REQUIRE(parseLogLevel("fatal").value() == LogLevel::kFatal);

    auto bad = parseLogLevel("loud");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Log routes tagged messages to the installed logger", "[core][log]")
{
    CapturingLogger logger;
    const LogLevel previous = Log::minLevel();
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("GPU", "dropped");
    Log::info("NET", "dropped too");
    Log::warn("PATH", "slow convergence");
    Log::error("SVC", "request failed");

    Log::setLogger(nullptr);
    Log::setMinLevel(previous);

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].level == LogLevel::kWarn);
    REQUIRE(logger.entries[0].tag == "PATH");
    REQUIRE(logger.entries[0].message == "slow convergence");
    REQUIRE(logger.entries[1].level == LogLevel::kError);
    REQUIRE(logger.entries[1].tag == "SVC");
}

TEST_CASE("Log::enabled follows the minimum level", "[core][log]")
{
    const LogLevel previous = Log::minLevel();

    Log::setMinLevel(LogLevel::kError);
    REQUIRE_FALSE(Log::enabled(LogLevel::kDebug));
    REQUIRE_FALSE(Log::enabled(LogLevel::kWarn));
    REQUIRE(Log::enabled(LogLevel::kError));
    REQUIRE(Log::enabled(LogLevel::kFatal));

    Log::setMinLevel(LogLevel::kDebug);
    REQUIRE(Log::enabled(LogLevel::kDebug));

    Log::setMinLevel(previous);
}

TEST_CASE("toString names every level", "[core][log]")
{
    REQUIRE(toString(LogLevel::kDebug) == "DEBUG");
    REQUIRE(toString(LogLevel::kInfo) == "INFO");
    REQUIRE(toString(LogLevel::kWarn) == "WARN");
    REQUIRE(toString(LogLevel::kError) == "ERROR");
    REQUIRE(toString(LogLevel::kFatal) == "FATAL");
}

} // namespace gpo::core
