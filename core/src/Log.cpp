/**
 * @file Log.cpp
 * @brief Log dispatch and the stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "gpo/core/Log.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace gpo::core {

namespace {

/// Lines look like `2026-10-19T08:15:02.431Z WARN  [GPU] message`.
class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        using namespace std::chrono;

        const auto now    = system_clock::now();
        const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        const std::time_t seconds = system_clock::to_time_t(now);

        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::array<char, 24> stamp{};
        std::strftime(stamp.data(), stamp.size(), "%Y-%m-%dT%H:%M:%S", &utc);

        const std::string_view name = toString(level);

        std::lock_guard<std::mutex> lock{_mutex};
        std::fprintf(stderr, "%s.%03lldZ %-5.*s [%.*s] %.*s\n",
                     stamp.data(), static_cast<long long>(millis),
                     static_cast<int>(name.size()), name.data(),
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }

private:
    std::mutex _mutex;
};

StderrLogger           gStderrLogger;
std::atomic<ILogger *> gSink{&gStderrLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

} // anonymous namespace

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO";
        case LogLevel::kWarn:  return "WARN";
        case LogLevel::kError: return "ERROR";
        case LogLevel::kFatal: return "FATAL";
    }
    return "?";
}

Expected<LogLevel> parseLogLevel(std::string_view name)
{
    std::string lower{name};
    for (char &c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug" || lower == "trace")  return LogLevel::kDebug;
    if (lower == "info")                       return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error")                      return LogLevel::kError;
    if (lower == "fatal")                      return LogLevel::kFatal;

    return makeError(ErrorCode::kInvalidArgument, "unknown log level '" + std::string{name} + "'");
}

void Log::setLogger(ILogger *logger)  { gSink.store(logger ? logger : &gStderrLogger); }
void Log::setMinLevel(LogLevel level) { gMinLevel.store(level); }
LogLevel Log::minLevel()              { return gMinLevel.load(); }

bool Log::enabled(LogLevel level)
{
    return level >= gMinLevel.load(std::memory_order_relaxed);
}

void Log::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!enabled(level))
        return;
    gSink.load()->write(level, tag, msg);
}

} // namespace gpo::core
