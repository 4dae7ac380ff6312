/**
 * @file ProgramCache.cpp
 * @brief ProgramCache implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/gpu/ProgramCache.hpp>
#include <gpo/core/Log.hpp>

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>

namespace gpo::gpu {

namespace {

constexpr const char *kTag = "GPU";

using BuildResult = core::Expected<std::shared_ptr<IProgram>>;

std::string makeKey(std::string_view identity, std::string_view source, std::string_view options)
{
    std::string key;
    key.reserve(identity.size() + options.size() + source.size() + 2);
    key.append(identity).append(1, '\n').append(options).append(1, '\n').append(source);
    return key;
}

} // anonymous namespace

struct ProgramCache::Impl
{
    struct Entry
    {
        std::string                      identity;
        std::shared_future<BuildResult>  result;
        core::u64                        generation{0};
    };

    std::chrono::milliseconds                buildTimeout;
    mutable std::mutex                       mutex;
    std::unordered_map<std::string, Entry>   entries;
    core::u64                                nextGeneration{0};
    std::atomic<core::usize>                 builds{0};

    /// Erases @p key only if it still holds the build @p generation started.
    void forget(const std::string &key, core::u64 generation)
    {
        std::lock_guard<std::mutex> lock{mutex};
        auto it = entries.find(key);
        if (it != entries.end() && it->second.generation == generation)
            entries.erase(it);
    }
};

ProgramCache::ProgramCache(std::chrono::milliseconds buildTimeout)
    : _impl{std::make_unique<Impl>()}
{
    _impl->buildTimeout = buildTimeout;
}

ProgramCache::~ProgramCache() = default;

core::Expected<std::shared_ptr<IProgram>> ProgramCache::getProgram(
    IDevice &device, std::string_view source, std::string_view options)
{
    const std::string identity = device.descriptor().identity();
    const std::string key      = makeKey(identity, source, options);

    std::promise<BuildResult>       promise;
    std::shared_future<BuildResult> pending;
    core::u64                       generation = 0;
    bool                            owner = false;
    {
        std::lock_guard<std::mutex> lock{_impl->mutex};
        auto it = _impl->entries.find(key);
        if (it != _impl->entries.end())
        {
            pending = it->second.result;
        }
        else
        {
            pending    = promise.get_future().share();
            generation = ++_impl->nextGeneration;
            _impl->entries.emplace(key, Impl::Entry{identity, pending, generation});
            owner = true;
        }
    }

    if (!owner)
        return pending.get();

    _impl->builds.fetch_add(1, std::memory_order_relaxed);
    core::Log::info(kTag, "building program for " + device.descriptor().name);

    // Waiters block on the promise, so it is fulfilled on every path.
    BuildResult result = core::makeError(core::ErrorCode::kBuildError, "build did not run");
    try
    {
        result = device.build(source, options, _impl->buildTimeout);
    }
    catch (const std::exception &e)
    {
        result = core::makeError(core::ErrorCode::kBuildError,
                                 "build on " + device.descriptor().name + " threw: " + e.what());
    }

    if (!result)
    {
        core::Log::error(kTag, result.error().describe());
        _impl->forget(key, generation);
    }
    else if (!(*result)->buildLog().empty())
    {
        core::Log::debug(kTag, "build log:\n" + (*result)->buildLog());
    }

    promise.set_value(result);
    return result;
}

void ProgramCache::invalidate(std::string_view deviceIdentity)
{
    std::lock_guard<std::mutex> lock{_impl->mutex};
    std::erase_if(_impl->entries, [deviceIdentity](const auto &item) {
        return item.second.identity == deviceIdentity;
    });
}

void ProgramCache::clear()
{
    std::lock_guard<std::mutex> lock{_impl->mutex};
    _impl->entries.clear();
}

bool ProgramCache::contains(const DeviceDescriptor &device, std::string_view source, std::string_view options) const
{
    std::lock_guard<std::mutex> lock{_impl->mutex};
    return _impl->entries.contains(makeKey(device.identity(), source, options));
}

core::usize ProgramCache::size() const
{
    std::lock_guard<std::mutex> lock{_impl->mutex};
    return _impl->entries.size();
}

core::usize ProgramCache::buildCount() const noexcept
{
    return _impl->builds.load(std::memory_order_relaxed);
}

} // namespace gpo::gpu
