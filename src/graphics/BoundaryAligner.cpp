#include "BoundaryAligner.h"

namespace graphics
{

namespace
{

int32_t snapDown(int32_t v, int32_t g)
{
    return (v / g) * g;
}

int32_t snapUp(int32_t v, int32_t g)
{
    return ((v + g - 1) / g) * g;
}

} // namespace

BoundaryAligner::BoundaryAligner(uint16_t panelWidth, uint16_t panelHeight, uint8_t granularity)
    : panelWidth(panelWidth), panelHeight(panelHeight), granularity(granularity ? granularity : EINK_BYTE_ALIGNMENT)
{
}

void BoundaryAligner::hardwareWindow(int32_t x0, int32_t x1, uint8_t granularity, int32_t &outX0, int32_t &outX1)
{
    const int32_t g = granularity;
    const int32_t a = x0 % g;
    const int32_t b = x1 % g;

    outX0 = snapDown(x0, g);
    if ((a + b == g && a > b) || (a + b == 0) || ((x1 - x0) % g == 0))
        outX1 = snapDown(x1, g);
    else
        outX1 = b != 0 ? snapUp(x1, g) : snapDown(x1, g);
}

ErrorCode BoundaryAligner::align(const Region &region, AlignedRegion &out) const
{
    if (!region.fitsPanel(panelWidth, panelHeight)) {
        LOG_WARN("Region (%d,%d)-(%d,%d) not inside %ux%u panel", region.x0, region.y0, region.x1, region.y1, panelWidth,
                 panelHeight);
        return ERRNO_BAD_REGION;
    }

    int32_t x0, x1;
    hardwareWindow(region.x0, region.x1, granularity, x0, x1);

    // Snapping both edges down can cut off the last columns of the region, widen to the next byte
    if (x1 < region.x1) {
        LOG_TRACE("Window x1 %d < region x1 %d, widening", x1, region.x1);
        x1 = snapUp(region.x1, granularity);
    }
    if (x1 > panelWidth)
        x1 = panelWidth;

    if (x1 <= x0 || x0 % granularity != 0 || x1 % granularity != 0) {
        LOG_WARN("Region (%d,%d)-(%d,%d) cannot be aligned on a %ux%u panel", region.x0, region.y0, region.x1, region.y1,
                 panelWidth, panelHeight);
        return ERRNO_BAD_REGION;
    }

    out = AlignedRegion(Region((int16_t)x0, region.y0, (int16_t)x1, region.y1), region);
    return ERRNO_OK;
}

} // namespace graphics
