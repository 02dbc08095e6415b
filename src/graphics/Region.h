#pragma once

#include <algorithm>
#include <stdint.h>

namespace graphics
{

/**
 * Axis-aligned rectangle on the panel, half-open: [x0, x1) x [y0, y1).
 * Plain value, compared by coordinates only.
 */
struct Region {
    int16_t x0 = 0;
    int16_t y0 = 0;
    int16_t x1 = 0;
    int16_t y1 = 0;

    Region() {}
    Region(int16_t x0, int16_t y0, int16_t x1, int16_t y1) : x0(x0), y0(y0), x1(x1), y1(y1) {}

    int32_t width() const { return x1 - x0; }
    int32_t height() const { return y1 - y0; }
    int32_t area() const { return empty() ? 0 : width() * height(); }
    bool empty() const { return x1 <= x0 || y1 <= y0; }

    bool contains(int32_t x, int32_t y) const { return x >= x0 && x < x1 && y >= y0 && y < y1; }

    bool containsRegion(const Region &other) const
    {
        return other.x0 >= x0 && other.x1 <= x1 && other.y0 >= y0 && other.y1 <= y1;
    }

    // Smallest region covering both
    Region unite(const Region &other) const
    {
        return Region(std::min(x0, other.x0), std::min(y0, other.y0), std::max(x1, other.x1), std::max(y1, other.y1));
    }

    // True if the region lies inside a width x height panel
    bool fitsPanel(int32_t panelWidth, int32_t panelHeight) const
    {
        return !empty() && x0 >= 0 && y0 >= 0 && x1 <= panelWidth && y1 <= panelHeight;
    }

    bool operator==(const Region &other) const
    {
        return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
    }
    bool operator!=(const Region &other) const { return !(*this == other); }
};

/**
 * A Region whose horizontal bounds sit on the panel's byte grid.
 * Only BoundaryAligner hands these out, source keeps the region it was widened from.
 */
struct AlignedRegion : public Region {
    Region source;

    AlignedRegion() {}
    AlignedRegion(const Region &window, const Region &source) : Region(window), source(source) {}

    // Bytes per row of the packed window
    int32_t rowBytes() const { return width() / 8; }
};

} // namespace graphics
