/**
 * @file RelaxationKernel.cpp
 * @brief OpenCL C source of the relaxation kernels.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/pathfinding/RelaxationKernel.hpp>

namespace gpo::pathfinding {

namespace {

constexpr std::string_view kSource = R"CLC(
#define IMPASSABLE 0xFFFFFFFFu
#define NO_HOPS    0xFFFFFFFFu

/* Lowers dist[next] to dist[self] + cost[next]; records the winner. */
void relax_into(__global const uint *cost,
                __global uint *dist,
                __global int *pred,
                __global uint *changed,
                uint self,
                uint base,
                uint next)
{
    const uint step = cost[next];
    if (step == IMPASSABLE)
        return;
    const uint candidate = base + step;
    if (atomic_min(&dist[next], candidate) > candidate) {
        pred[next] = (int)self;
        *changed = 1u;
    }
}

__kernel void relax_grid(__global const uint *cost,
                         __global uint *dist,
                         __global int *pred,
                         __global uint *changed,
                         const uint width,
                         const uint height,
                         const uint unreached)
{
    const uint self = (uint)get_global_id(0);
    if (self >= width * height || cost[self] == IMPASSABLE)
        return;

    const uint base = dist[self];
    if (base >= unreached)
        return;

    const uint x = self % width;
    const uint y = self / width;
    if (y > 0)          relax_into(cost, dist, pred, changed, self, base, self - width);
    if (y + 1 < height) relax_into(cost, dist, pred, changed, self, base, self + width);
    if (x > 0)          relax_into(cost, dist, pred, changed, self, base, self - 1);
    if (x + 1 < width)  relax_into(cost, dist, pred, changed, self, base, self + 1);
}

/* Edge self->next is tight when it lies on a shortest path. */
int tight(__global const uint *cost, __global const uint *dist, uint unreached, uint self, uint next)
{
    return cost[next] != IMPASSABLE && dist[next] < unreached && dist[self] + cost[next] == dist[next];
}

void hop_into(__global const uint *cost,
              __global const uint *dist,
              __global uint *hops,
              __global uint *changed,
              uint unreached,
              uint self,
              uint next)
{
    if (!tight(cost, dist, unreached, self, next))
        return;
    const uint candidate = hops[self] + 1u;
    if (atomic_min(&hops[next], candidate) > candidate)
        *changed = 1u;
}

__kernel void count_hops(__global const uint *cost,
                         __global const uint *dist,
                         __global uint *hops,
                         __global uint *changed,
                         const uint width,
                         const uint height,
                         const uint unreached)
{
    const uint self = (uint)get_global_id(0);
    if (self >= width * height || cost[self] == IMPASSABLE || dist[self] >= unreached)
        return;
    if (hops[self] == NO_HOPS)
        return;

    const uint x = self % width;
    const uint y = self / width;
    if (y > 0)          hop_into(cost, dist, hops, changed, unreached, self, self - width);
    if (y + 1 < height) hop_into(cost, dist, hops, changed, unreached, self, self + width);
    if (x > 0)          hop_into(cost, dist, hops, changed, unreached, self, self - 1);
    if (x + 1 < width)  hop_into(cost, dist, hops, changed, unreached, self, self + 1);
}

int settles(__global const uint *cost,
            __global const uint *dist,
            __global const uint *hops,
            uint unreached,
            uint from,
            uint self)
{
    return dist[from] < unreached && tight(cost, dist, unreached, from, self) && hops[from] + 1u == hops[self];
}

__kernel void settle_predecessors(__global const uint *cost,
                                  __global const uint *dist,
                                  __global const uint *hops,
                                  __global int *pred,
                                  const uint width,
                                  const uint height,
                                  const uint unreached,
                                  const uint start)
{
    const uint self = (uint)get_global_id(0);
    if (self >= width * height)
        return;

    int chosen = -1;
    if (self != start && cost[self] != IMPASSABLE && dist[self] < unreached && hops[self] != NO_HOPS) {
        const uint x = self % width;
        const uint y = self / width;
        if (chosen < 0 && y > 0          && settles(cost, dist, hops, unreached, self - width, self)) chosen = (int)(self - width);
        if (chosen < 0 && y + 1 < height && settles(cost, dist, hops, unreached, self + width, self)) chosen = (int)(self + width);
        if (chosen < 0 && x > 0          && settles(cost, dist, hops, unreached, self - 1, self))     chosen = (int)(self - 1);
        if (chosen < 0 && x + 1 < width  && settles(cost, dist, hops, unreached, self + 1, self))     chosen = (int)(self + 1);
    }
    pred[self] = chosen;
}
)CLC";

} // anonymous namespace

std::string_view relaxationKernelSource() noexcept
{
    return kSource;
}

} // namespace gpo::pathfinding
