/**
 * @file NativeKernels.cpp
 * @brief relax_grid / count_hops / settle_predecessors on host threads.
 *
 * Work-items of one launch run concurrently on the device pool, so every
 * access to a buffer another work-item may write goes through
 * std::atomic_ref, mirroring the OpenCL atomics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/pathfinding/NativeKernels.hpp>
#include <gpo/pathfinding/RelaxationKernel.hpp>
#include <gpo/core/Assert.hpp>
#include <gpo/core/Constants.hpp>

#include <atomic>
#include <string>

namespace gpo::pathfinding {

namespace {

using gpu::KernelArg;
using Args = std::span<const KernelArg>;

constexpr core::u32 kNoHops = 0xFFFFFFFFu;

template <typename T>
T *buffer(Args args, core::usize index) noexcept
{
    return static_cast<T *>(args[index].handle);
}

core::u32 scalar(Args args, core::usize index) noexcept
{
    return args[index].value;
}

core::u32 load(core::u32 *slot) noexcept
{
    return std::atomic_ref<core::u32>{*slot}.load(std::memory_order_relaxed);
}

/// @return true when @p value lowered @p slot.
bool atomicMin(core::u32 *slot, core::u32 value) noexcept
{
    std::atomic_ref<core::u32> ref{*slot};
    core::u32 current = ref.load(std::memory_order_relaxed);
    while (value < current)
    {
        if (ref.compare_exchange_weak(current, value, std::memory_order_relaxed))
            return true;
    }
    return false;
}

void raise(core::u32 *changed) noexcept
{
    std::atomic_ref<core::u32>{*changed}.store(1u, std::memory_order_relaxed);
}

/// Calls @p visit for each in-bounds neighbour of @p self: up, down, left, right.
template <typename Visit>
void forEachNeighbour(core::u32 self, core::u32 width, core::u32 height, Visit &&visit)
{
    const core::u32 x = self % width;
    const core::u32 y = self / width;
    if (y > 0 && visit(self - width))
        return;
    if (y + 1 < height && visit(self + width))
        return;
    if (x > 0 && visit(self - 1))
        return;
    if (x + 1 < width)
        visit(self + 1);
}

bool tight(const core::u32 *cost, core::u32 *dist, core::u32 unreached, core::u32 from, core::u32 to) noexcept
{
    if (cost[to] == core::kImpassableCost)
        return false;
    const core::u32 target = load(dist + to);
    return target < unreached && load(dist + from) + cost[to] == target;
}

void relaxGrid(Args args, core::usize begin, core::usize end)
{
    GPO_ASSERT(args.size() == 7);
    const auto *cost     = buffer<const core::u32>(args, 0);
    auto       *dist     = buffer<core::u32>(args, 1);
    auto       *pred     = buffer<core::i32>(args, 2);
    auto       *changed  = buffer<core::u32>(args, 3);
    const core::u32 width     = scalar(args, 4);
    const core::u32 height    = scalar(args, 5);
    const core::u32 unreached = scalar(args, 6);

    for (core::usize i = begin; i < end; ++i)
    {
        const auto self = static_cast<core::u32>(i);
        if (cost[self] == core::kImpassableCost)
            continue;
        const core::u32 base = load(dist + self);
        if (base >= unreached)
            continue;

        forEachNeighbour(self, width, height, [&](core::u32 next) {
            const core::u32 step = cost[next];
            if (step != core::kImpassableCost && atomicMin(dist + next, base + step))
            {
                std::atomic_ref<core::i32>{pred[next]}.store(static_cast<core::i32>(self),
                                                              std::memory_order_relaxed);
                raise(changed);
            }
            return false;
        });
    }
}

void countHops(Args args, core::usize begin, core::usize end)
{
    GPO_ASSERT(args.size() == 7);
    const auto *cost     = buffer<const core::u32>(args, 0);
    auto       *dist     = buffer<core::u32>(args, 1);
    auto       *hops     = buffer<core::u32>(args, 2);
    auto       *changed  = buffer<core::u32>(args, 3);
    const core::u32 width     = scalar(args, 4);
    const core::u32 height    = scalar(args, 5);
    const core::u32 unreached = scalar(args, 6);

    for (core::usize i = begin; i < end; ++i)
    {
        const auto self = static_cast<core::u32>(i);
        if (cost[self] == core::kImpassableCost || dist[self] >= unreached)
            continue;
        const core::u32 own = load(hops + self);
        if (own == kNoHops)
            continue;

        forEachNeighbour(self, width, height, [&](core::u32 next) {
            if (tight(cost, dist, unreached, self, next) && atomicMin(hops + next, own + 1))
                raise(changed);
            return false;
        });
    }
}

void settlePredecessors(Args args, core::usize begin, core::usize end)
{
    GPO_ASSERT(args.size() == 8);
    const auto *cost     = buffer<const core::u32>(args, 0);
    auto       *dist     = buffer<core::u32>(args, 1);
    const auto *hops     = buffer<const core::u32>(args, 2);
    auto       *pred     = buffer<core::i32>(args, 3);
    const core::u32 width     = scalar(args, 4);
    const core::u32 height    = scalar(args, 5);
    const core::u32 unreached = scalar(args, 6);
    const core::u32 start     = scalar(args, 7);

    for (core::usize i = begin; i < end; ++i)
    {
        const auto self = static_cast<core::u32>(i);
        core::i32 chosen = core::kNoPredecessor;

        if (self != start && cost[self] != core::kImpassableCost && dist[self] < unreached &&
            hops[self] != kNoHops)
        {
            forEachNeighbour(self, width, height, [&](core::u32 from) {
                if (dist[from] < unreached && tight(cost, dist, unreached, from, self) &&
                    hops[from] + 1 == hops[self])
                {
                    chosen = static_cast<core::i32>(from);
                    return true;
                }
                return false;
            });
        }
        pred[self] = chosen;
    }
}

} // anonymous namespace

void registerNativeKernels(gpu::SoftwareBackend &backend)
{
    backend.registerKernel(std::string{kRelaxEntry}, &relaxGrid);
    backend.registerKernel(std::string{kHopsEntry}, &countHops);
    backend.registerKernel(std::string{kSettleEntry}, &settlePredecessors);
}

} // namespace gpo::pathfinding
