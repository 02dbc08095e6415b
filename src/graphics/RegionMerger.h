#pragma once

#include "PlannerConfig.h"
#include "Region.h"
#include <stdint.h>
#include <vector>

namespace graphics
{

/*
    Turns the raw component boxes into the list of regions worth refreshing this cycle.
    1. Drop boxes narrower or shorter than the minimum size
    2. Merge boxes that overlap or lie within the merge distance of each other, until nothing more merges
    3. Order by area (largest first) and keep at most maxRegionsPerCycle
    The input order does not matter, output is deterministic for a given configuration.
*/

class RegionMerger
{
  public:
    explicit RegionMerger(const PlannerConfig &config);

    struct Result {
        std::vector<Region> regions;
        bool emptiedByFilter = false; // every candidate was too small, caller must escalate
        bool keptLargest = false;     // every candidate was too small, the largest one was kept instead
        uint32_t filtered = 0;        // dropped by the size floor
        uint32_t merged = 0;          // merges performed
        uint32_t capped = 0;          // dropped by the region cap
    };

    Result refine(const std::vector<Region> &candidates) const;

    std::vector<Region> filterBySize(const std::vector<Region> &regions) const;

    /// Merge to a fixpoint, returns the number of merges done
    static uint32_t mergeNearby(std::vector<Region> &regions, int32_t distancePx);

    /// Largest area first, ties broken top to bottom, then left to right
    static void prioritize(std::vector<Region> &regions);

    /// Boxes overlap, or the gap between them is at most distancePx along both axes
    static bool isNear(const Region &a, const Region &b, int32_t distancePx);

  private:
    PlannerConfig config;
};

} // namespace graphics
