#pragma once

#include "ChangeDetector.h"
#include "Region.h"
#include "configuration.h"
#include <stdint.h>
#include <vector>

namespace graphics
{

/**
 * Groups changed pixels into connected components and returns one bounding box per component.
 *
 * Labelling works on horizontal runs of changed pixels rather than on single pixels: runs on neighbouring rows
 * that touch are joined with a union-find. Memory grows with the number of runs, not with the panel area.
 */
class RegionClusterer
{
  public:
    /**
     * @param connectivity 4 (edge neighbours only) or 8 (diagonals too), anything else is treated as 4
     * @param paddingPx margin added on every side of each component's box, clamped to the panel
     */
    explicit RegionClusterer(uint8_t connectivity = 4, int32_t paddingPx = EINK_DEFAULT_PADDING_PX);

    /// Padded and clamped bounding boxes, in raster order of each component's first pixel
    std::vector<Region> cluster(const DiffMask &mask) const;

    /// Tight bounding boxes, same order as cluster()
    std::vector<Region> components(const DiffMask &mask) const;

  private:
    struct Run {
        int16_t y;
        int16_t xs; // first changed column
        int16_t xe; // one past the last changed column
    };

    uint8_t connectivity;
    int32_t paddingPx;

    static void collectRuns(const DiffMask &mask, uint16_t y, std::vector<Run> &runs);
    static uint32_t findRoot(std::vector<uint32_t> &parent, uint32_t i);
    static void join(std::vector<uint32_t> &parent, uint32_t a, uint32_t b);
};

} // namespace graphics
