/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/service/Config.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace gpo::service {

namespace {

struct EnvBinding
{
    const char *variable;
    const char *key;
};

constexpr std::array<EnvBinding, 10> kEnvBindings{{
    {"GPO_HOST",               "host"},
    {"GPO_PORT",               "port"},
    {"GPO_WORKERS",            "workers"},
    {"GPO_DEVICE",             "device"},
    {"GPO_ALLOW_SOFTWARE",     "allow-software"},
    {"GPO_REQUEST_TIMEOUT_MS", "request-timeout-ms"},
    {"GPO_BUILD_TIMEOUT_MS",   "build-timeout-ms"},
    {"GPO_MAX_CELLS",          "max-cells"},
    {"GPO_MAX_BODY_BYTES",     "max-body-bytes"},
    {"GPO_LOG_LEVEL",          "log-level"},
}};

core::Unexpected invalid(std::string_view origin, std::string_view value, std::string_view expected)
{
    return core::makeError(core::ErrorCode::kInvalidArgument,
                           std::string{origin} + ": '" + std::string{value} + "' is not " +
                           std::string{expected});
}

core::Expected<core::u64> parseUnsigned(std::string_view text, core::u64 min, core::u64 max,
                                        std::string_view origin)
{
    core::u64 value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value < min || value > max)
    {
        return invalid(origin, text,
                       "an integer in [" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return value;
}

core::Expected<bool> parseBool(std::string_view text, std::string_view origin)
{
    std::string lower;
    for (const char c : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    return invalid(origin, text, "a boolean");
}

bool takesValue(std::string_view key) noexcept
{
    return key != "no-software" && key != "list-devices" && key != "help";
}

} // anonymous namespace

Environment systemEnvironment()
{
    return [](std::string_view name) -> std::optional<std::string> {
        const char *value = std::getenv(std::string{name}.c_str());
        if (value == nullptr)
            return std::nullopt;
        return std::string{value};
    };
}

Config::Builder& Config::Builder::host(std::string address)
{
    _host = std::move(address);
    return *this;
}

Config::Builder& Config::Builder::port(core::u16 value) noexcept
{
    _port = value;
    return *this;
}

Config::Builder& Config::Builder::workers(core::u32 count) noexcept
{
    _workers = count;
    return *this;
}

Config::Builder& Config::Builder::deviceFilter(std::string filter)
{
    _deviceFilter = std::move(filter);
    return *this;
}

Config::Builder& Config::Builder::allowSoftware(bool enabled) noexcept
{
    _allowSoftware = enabled;
    return *this;
}

Config::Builder& Config::Builder::requestTimeout(std::chrono::milliseconds timeout) noexcept
{
    _requestTimeout = timeout;
    return *this;
}

Config::Builder& Config::Builder::buildTimeout(std::chrono::milliseconds timeout) noexcept
{
    _buildTimeout = timeout;
    return *this;
}

Config::Builder& Config::Builder::maxCells(core::u32 cells) noexcept
{
    _maxCells = cells;
    return *this;
}

Config::Builder& Config::Builder::maxBodyBytes(core::usize bytes) noexcept
{
    _maxBodyBytes = bytes;
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config::Builder& Config::Builder::listDevices(bool enabled) noexcept
{
    _listDevices = enabled;
    return *this;
}

Config::Builder& Config::Builder::showHelp(bool enabled) noexcept
{
    _showHelp = enabled;
    return *this;
}

core::Expected<void> Config::Builder::apply(std::string_view key, std::string_view value, std::string_view origin)
{
    constexpr core::u64 kMaxMillis = 24ull * 60 * 60 * 1000;

    if (key == "host")
    {
        if (value.empty())
            return invalid(origin, value, "a host address");
        _host = std::string{value};
    }
    else if (key == "port")
    {
        _port = static_cast<core::u16>(GPO_TRY(parseUnsigned(value, 0, 65535, origin)));
    }
    else if (key == "workers")
    {
        _workers = static_cast<core::u32>(GPO_TRY(parseUnsigned(value, 1, 1024, origin)));
    }
    else if (key == "device")
    {
        _deviceFilter = std::string{value};
    }
    else if (key == "allow-software")
    {
        _allowSoftware = GPO_TRY(parseBool(value, origin));
    }
    else if (key == "no-software")
    {
        _allowSoftware = false;
    }
    else if (key == "request-timeout-ms")
    {
        _requestTimeout = std::chrono::milliseconds{GPO_TRY(parseUnsigned(value, 1, kMaxMillis, origin))};
    }
    else if (key == "build-timeout-ms")
    {
        _buildTimeout = std::chrono::milliseconds{GPO_TRY(parseUnsigned(value, 1, kMaxMillis, origin))};
    }
    else if (key == "max-cells")
    {
        _maxCells = static_cast<core::u32>(
            GPO_TRY(parseUnsigned(value, 1, std::numeric_limits<core::u32>::max(), origin)));
    }
    else if (key == "max-body-bytes")
    {
        _maxBodyBytes = static_cast<core::usize>(
            GPO_TRY(parseUnsigned(value, 1, std::numeric_limits<core::u32>::max(), origin)));
    }
    else if (key == "log-level")
    {
        auto level = core::parseLogLevel(value);
        if (!level)
            return invalid(origin, value, "a log level (debug, info, warn, error, fatal)");
        _logLevel = *level;
    }
    else if (key == "list-devices")
    {
        _listDevices = true;
    }
    else if (key == "help")
    {
        _showHelp = true;
    }
    else
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "unknown option '" + std::string{origin} + "'");
    }
    return {};
}

core::Expected<void> Config::Builder::applyEnvironment(const Environment &env)
{
    for (const auto &binding : kEnvBindings)
    {
        if (const auto value = env(binding.variable))
            GPO_TRY_VOID(apply(binding.key, *value, binding.variable));
    }
    return {};
}

core::Expected<void> Config::Builder::applyArguments(std::span<const std::string> args)
{
    for (core::usize i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];
        if (arg == "-h")
        {
            _showHelp = true;
            continue;
        }
        if (!arg.starts_with("--"))
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "unexpected argument '" + std::string{arg} + "'");
        }

        std::string_view key = arg.substr(2);
        std::optional<std::string_view> value;
        if (const auto eq = key.find('='); eq != std::string_view::npos)
        {
            value = key.substr(eq + 1);
            key   = key.substr(0, eq);
        }

        if (!takesValue(key))
        {
            if (value)
            {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "--" + std::string{key} + " takes no value");
            }
            GPO_TRY_VOID(apply(key, {}, arg));
            continue;
        }

        if (!value)
        {
            if (i + 1 >= args.size())
            {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "--" + std::string{key} + " expects a value");
            }
            value = std::string_view{args[++i]};
        }
        GPO_TRY_VOID(apply(key, *value, "--" + std::string{key}));
    }
    return {};
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._host           = _host;
    cfg._port           = _port;
    cfg._workers        = _workers;
    cfg._deviceFilter   = _deviceFilter;
    cfg._allowSoftware  = _allowSoftware;
    cfg._requestTimeout = _requestTimeout;
    cfg._buildTimeout   = _buildTimeout;
    cfg._maxCells       = _maxCells;
    cfg._maxBodyBytes   = _maxBodyBytes;
    cfg._logLevel       = _logLevel;
    cfg._listDevices    = _listDevices;
    cfg._showHelp       = _showHelp;
    return cfg;
}

core::Expected<Config> Config::load(std::span<const std::string> args, const Environment &env)
{
    Builder builder;
    GPO_TRY_VOID(builder.applyEnvironment(env));
    GPO_TRY_VOID(builder.applyArguments(args));
    return builder.build();
}

std::string Config::usage(std::string_view program)
{
    std::string text = "usage: " + std::string{program} + " [options]\n\n";
    text +=
        "  --host ADDR               listen address (GPO_HOST, default 127.0.0.1)\n"
        "  --port N                  listen port, 0 for ephemeral (GPO_PORT, default 8080)\n"
        "  --workers N               connection workers (GPO_WORKERS, default 8)\n"
        "  --device NAME             only devices whose name contains NAME (GPO_DEVICE)\n"
        "  --no-software             never fall back to the software device (GPO_ALLOW_SOFTWARE=0)\n"
        "  --request-timeout-ms N    device budget per request (GPO_REQUEST_TIMEOUT_MS)\n"
        "  --build-timeout-ms N      kernel compilation budget (GPO_BUILD_TIMEOUT_MS)\n"
        "  --max-cells N             largest accepted width*height (GPO_MAX_CELLS)\n"
        "  --max-body-bytes N        largest accepted request body (GPO_MAX_BODY_BYTES)\n"
        "  --log-level LEVEL         debug, info, warn, error or fatal (GPO_LOG_LEVEL)\n"
        "  --list-devices            print the ranked devices and exit\n"
        "  -h, --help                print this help and exit\n";
    return text;
}

} // namespace gpo::service
