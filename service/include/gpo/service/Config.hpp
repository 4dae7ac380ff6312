/**
 * @file Config.hpp
 * @brief Service configuration (Builder pattern, environment and CLI overlays).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_SERVICE_CONFIG_HPP
    #define GPO_SERVICE_CONFIG_HPP

#include <gpo/core/Constants.hpp>
#include <gpo/core/Expected.hpp>
#include <gpo/core/Log.hpp>
#include <gpo/core/Types.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gpo::service {

/** @brief Looks up one environment variable; nullopt when unset. */
using Environment = std::function<std::optional<std::string>(std::string_view name)>;

/** @brief Reads the process environment. */
[[nodiscard]] Environment systemEnvironment();

/** @brief Immutable service configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& host(std::string address);
        Builder& port(core::u16 value) noexcept;
        Builder& workers(core::u32 count) noexcept;
        Builder& deviceFilter(std::string filter);
        Builder& allowSoftware(bool enabled) noexcept;
        Builder& requestTimeout(std::chrono::milliseconds timeout) noexcept;
        Builder& buildTimeout(std::chrono::milliseconds timeout) noexcept;
        Builder& maxCells(core::u32 cells) noexcept;
        Builder& maxBodyBytes(core::usize bytes) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;
        Builder& listDevices(bool enabled) noexcept;
        Builder& showHelp(bool enabled) noexcept;

        /**
         * @brief Overlays the @c GPO_* variables found in @p env.
         * @return InvalidArgument naming the variable on a malformed value.
         */
        [[nodiscard]] core::Expected<void> applyEnvironment(const Environment &env);

        /**
         * @brief Overlays command-line flags (program name excluded).
         * @return InvalidArgument on an unknown flag, a missing or malformed value.
         */
        [[nodiscard]] core::Expected<void> applyArguments(std::span<const std::string> args);

        [[nodiscard]] Config build() const;

    private:
        [[nodiscard]] core::Expected<void> apply(std::string_view key, std::string_view value,
                                                 std::string_view origin);

        std::string               _host{"127.0.0.1"};
        core::u16                 _port{core::kDefaultPort};
        core::u32                 _workers{core::kDefaultWorkers};
        std::string               _deviceFilter;
        bool                      _allowSoftware{true};
        std::chrono::milliseconds _requestTimeout{core::kRequestTimeoutMs};
        std::chrono::milliseconds _buildTimeout{core::kBuildTimeoutMs};
        core::u32                 _maxCells{core::kMaxCells};
        core::usize               _maxBodyBytes{core::kMaxBodyBytes};
        core::LogLevel            _logLevel{core::LogLevel::kInfo};
        bool                      _listDevices{false};
        bool                      _showHelp{false};
    };

    /** @brief Defaults, then @p env, then @p args. */
    [[nodiscard]] static core::Expected<Config> load(std::span<const std::string> args,
                                                     const Environment &env = systemEnvironment());

    /** @brief Flag reference printed by --help. */
    [[nodiscard]] static std::string usage(std::string_view program);

    [[nodiscard]] const std::string &host() const noexcept { return _host; }
    [[nodiscard]] core::u16 port() const noexcept { return _port; }
    [[nodiscard]] core::u32 workers() const noexcept { return _workers; }
    [[nodiscard]] const std::string &deviceFilter() const noexcept { return _deviceFilter; }
    [[nodiscard]] bool allowSoftware() const noexcept { return _allowSoftware; }
    [[nodiscard]] std::chrono::milliseconds requestTimeout() const noexcept { return _requestTimeout; }
    [[nodiscard]] std::chrono::milliseconds buildTimeout() const noexcept { return _buildTimeout; }
    [[nodiscard]] core::u32 maxCells() const noexcept { return _maxCells; }
    [[nodiscard]] core::usize maxBodyBytes() const noexcept { return _maxBodyBytes; }
    [[nodiscard]] core::LogLevel logLevel() const noexcept { return _logLevel; }
    [[nodiscard]] bool listDevices() const noexcept { return _listDevices; }
    [[nodiscard]] bool showHelp() const noexcept { return _showHelp; }

private:
    friend class Builder;

    std::string               _host{"127.0.0.1"};
    core::u16                 _port{core::kDefaultPort};
    core::u32                 _workers{core::kDefaultWorkers};
    std::string               _deviceFilter;
    bool                      _allowSoftware{true};
    std::chrono::milliseconds _requestTimeout{core::kRequestTimeoutMs};
    std::chrono::milliseconds _buildTimeout{core::kBuildTimeoutMs};
    core::u32                 _maxCells{core::kMaxCells};
    core::usize               _maxBodyBytes{core::kMaxBodyBytes};
    core::LogLevel            _logLevel{core::LogLevel::kInfo};
    bool                      _listDevices{false};
    bool                      _showHelp{false};
};

} // namespace gpo::service

#endif // GPO_SERVICE_CONFIG_HPP
