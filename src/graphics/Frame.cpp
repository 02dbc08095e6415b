#include "Frame.h"
#include "configuration.h"
#include <algorithm>

namespace graphics
{

namespace
{

uint16_t clampEdge(uint16_t edge, const char *name)
{
    if (edge == 0 || edge > EINK_MAX_PANEL_EDGE) {
        uint16_t clamped = edge == 0 ? 1 : EINK_MAX_PANEL_EDGE;
        LOG_WARN("Frame %s %u out of range, using %u", name, edge, clamped);
        return clamped;
    }
    return edge;
}

} // namespace

Frame::Frame(uint16_t width, uint16_t height)
    : w(clampEdge(width, "width")), h(clampEdge(height, "height")), stride((w + 7) / 8), pixels((size_t)stride * h, 0)
{
}

bool Frame::getPixel(int32_t x, int32_t y) const
{
    if (x < 0 || y < 0 || x >= w || y >= h)
        return false;
    return (pixels[(size_t)y * stride + (x >> 3)] >> (7 - (x & 7))) & 1;
}

void Frame::setPixel(int32_t x, int32_t y, bool black)
{
    if (x < 0 || y < 0 || x >= w || y >= h)
        return;
    uint8_t &b = pixels[(size_t)y * stride + (x >> 3)];
    const uint8_t mask = 0x80 >> (x & 7);
    if (black)
        b |= mask;
    else
        b &= ~mask;
}

void Frame::fill(bool black)
{
    std::fill(pixels.begin(), pixels.end(), black ? 0xFF : 0x00);
    if (black)
        clearPadding();
}

void Frame::fillRect(const Region &r, bool black)
{
    const int32_t xs = std::max<int32_t>(r.x0, 0), xe = std::min<int32_t>(r.x1, w);
    const int32_t ys = std::max<int32_t>(r.y0, 0), ye = std::min<int32_t>(r.y1, h);
    for (int32_t y = ys; y < ye; y++)
        for (int32_t x = xs; x < xe; x++)
            setPixel(x, y, black);
}

void Frame::copyRect(const Frame &src, const Region &r)
{
    const int32_t xs = std::max<int32_t>(r.x0, 0);
    const int32_t xe = std::min<int32_t>(std::min<int32_t>(r.x1, w), src.w);
    const int32_t ys = std::max<int32_t>(r.y0, 0);
    const int32_t ye = std::min<int32_t>(std::min<int32_t>(r.y1, h), src.h);
    if (xs >= xe || ys >= ye)
        return;

    // Same stride and a byte aligned span: whole bytes can be copied
    const bool byteSpan = stride == src.stride && (xs & 7) == 0 && ((xe & 7) == 0 || xe == w);
    for (int32_t y = ys; y < ye; y++) {
        if (byteSpan) {
            const uint8_t *from = src.row(y) + (xs >> 3);
            std::copy(from, from + ((xe + 7) >> 3) - (xs >> 3), row(y) + (xs >> 3));
        } else {
            for (int32_t x = xs; x < xe; x++)
                setPixel(x, y, src.getPixel(x, y));
        }
    }
}

uint32_t Frame::countSet() const
{
    uint32_t n = 0;
    for (uint8_t b : pixels)
        n += __builtin_popcount(b);
    return n;
}

void Frame::clearPadding()
{
    const uint8_t used = w & 7;
    if (used == 0)
        return;
    const uint8_t keep = (uint8_t)(0xFF << (8 - used));
    for (uint16_t y = 0; y < h; y++)
        row(y)[stride - 1] &= keep;
}

} // namespace graphics
