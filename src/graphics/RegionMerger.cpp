#include "RegionMerger.h"
#include "configuration.h"
#include <algorithm>

namespace graphics
{

namespace
{

bool byLeftEdge(const Region &a, const Region &b)
{
    if (a.x0 != b.x0)
        return a.x0 < b.x0;
    if (a.y0 != b.y0)
        return a.y0 < b.y0;
    if (a.x1 != b.x1)
        return a.x1 < b.x1;
    return a.y1 < b.y1;
}

bool byPriority(const Region &a, const Region &b)
{
    if (a.area() != b.area())
        return a.area() > b.area();
    if (a.y0 != b.y0)
        return a.y0 < b.y0;
    if (a.x0 != b.x0)
        return a.x0 < b.x0;
    if (a.y1 != b.y1)
        return a.y1 < b.y1;
    return a.x1 < b.x1;
}

int32_t gap(int32_t aStart, int32_t aEnd, int32_t bStart, int32_t bEnd)
{
    return std::max<int32_t>(0, std::max(aStart, bStart) - std::min(aEnd, bEnd));
}

} // namespace

RegionMerger::RegionMerger(const PlannerConfig &config) : config(config) {}

bool RegionMerger::isNear(const Region &a, const Region &b, int32_t distancePx)
{
    return gap(a.x0, a.x1, b.x0, b.x1) <= distancePx && gap(a.y0, a.y1, b.y0, b.y1) <= distancePx;
}

std::vector<Region> RegionMerger::filterBySize(const std::vector<Region> &regions) const
{
    std::vector<Region> kept;
    kept.reserve(regions.size());
    for (const Region &r : regions) {
        if (r.width() >= config.minRegionPx && r.height() >= config.minRegionPx && !r.empty())
            kept.push_back(r);
    }
    return kept;
}

uint32_t RegionMerger::mergeNearby(std::vector<Region> &regions, int32_t distancePx)
{
    uint32_t merges = 0;
    std::sort(regions.begin(), regions.end(), byLeftEdge);

    // Merging only ever grows boxes, so repeat whole passes until one finds nothing to join
    bool merged = true;
    while (merged) {
        merged = false;
        for (size_t i = 0; i < regions.size(); i++) {
            size_t j = i + 1;
            while (j < regions.size()) {
                // Sorted by x0, and x0 of regions[i] never moves: nothing further right can be near
                if (regions[j].x0 - regions[i].x1 > distancePx)
                    break;
                if (isNear(regions[i], regions[j], distancePx)) {
                    regions[i] = regions[i].unite(regions[j]);
                    regions.erase(regions.begin() + j);
                    merges++;
                    merged = true;
                    j = i + 1; // regions[i] grew, look again from the start
                } else
                    j++;
            }
        }
    }
    return merges;
}

void RegionMerger::prioritize(std::vector<Region> &regions)
{
    std::sort(regions.begin(), regions.end(), byPriority);
}

RegionMerger::Result RegionMerger::refine(const std::vector<Region> &candidates) const
{
    Result result;

    result.regions = filterBySize(candidates);
    result.filtered = (uint32_t)(candidates.size() - result.regions.size());

    if (result.regions.empty() && !candidates.empty()) {
        if (config.emptyPolicy == EmptyRegionPolicy::KEEP_LARGEST) {
            std::vector<Region> all = candidates;
            prioritize(all);
            result.regions.push_back(all.front());
            result.keptLargest = true;
            LOG_INFO("All %u regions below %dpx, keeping largest (%d,%d)-(%d,%d)", (unsigned)candidates.size(),
                     config.minRegionPx, all.front().x0, all.front().y0, all.front().x1, all.front().y1);
        } else {
            result.emptiedByFilter = true;
            LOG_INFO("All %u regions below %dpx, escalating", (unsigned)candidates.size(), config.minRegionPx);
            return result;
        }
    }

    result.merged = mergeNearby(result.regions, config.mergeDistancePx);
    prioritize(result.regions);

    if (config.maxRegionsPerCycle > 0 && result.regions.size() > (size_t)config.maxRegionsPerCycle) {
        result.capped = (uint32_t)(result.regions.size() - config.maxRegionsPerCycle);
        result.regions.resize(config.maxRegionsPerCycle);
    }

    LOG_DEBUG("refine: %u candidates, %u filtered, %u merges, %u capped, %u kept", (unsigned)candidates.size(),
              result.filtered, result.merged, result.capped, (unsigned)result.regions.size());
    return result;
}

} // namespace graphics
