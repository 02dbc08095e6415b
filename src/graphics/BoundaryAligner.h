#pragma once

#include "InkTypes.h"
#include "Region.h"
#include "configuration.h"
#include <stdint.h>

namespace graphics
{

/**
 * Snaps a region's horizontal bounds onto the panel's byte grid, so a partial window never starts or ends inside
 * a byte of panel RAM. Rows are addressed one by one, y0 and y1 pass through untouched.
 */
class BoundaryAligner
{
  public:
    BoundaryAligner(uint16_t panelWidth, uint16_t panelHeight, uint8_t granularity = EINK_BYTE_ALIGNMENT);

    /**
     * Align one region. The result always covers the region and never extends past the panel.
     * @return ERRNO_OK, or ERRNO_BAD_REGION if the region is empty or outside the panel (out is left untouched)
     */
    ErrorCode align(const Region &region, AlignedRegion &out) const;

    /**
     * The controller's window rule, on its own.
     * With a = x0 mod g and b = x1 mod g: if (a + b == g and a > b), or a + b == 0, or the width is a multiple of
     * g, both edges snap down. Otherwise x0 snaps down and x1 snaps up when b != 0.
     */
    static void hardwareWindow(int32_t x0, int32_t x1, uint8_t granularity, int32_t &outX0, int32_t &outX1);

  private:
    uint16_t panelWidth;
    uint16_t panelHeight;
    uint8_t granularity;
};

} // namespace graphics
