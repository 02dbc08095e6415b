#include "ChangeDetector.h"
#include "configuration.h"

namespace graphics
{

DiffMask::DiffMask(uint16_t width, uint16_t height)
    : w(width), h(height), stride((width + 7) / 8), bits((size_t)stride * height, 0)
{
}

bool DiffMask::get(int32_t x, int32_t y) const
{
    if (x < 0 || y < 0 || x >= w || y >= h)
        return false;
    return (bits[(size_t)y * stride + (x >> 3)] >> (7 - (x & 7))) & 1;
}

void DiffMask::set(int32_t x, int32_t y)
{
    if (x < 0 || y < 0 || x >= w || y >= h)
        return;
    bits[(size_t)y * stride + (x >> 3)] |= 0x80 >> (x & 7);
}

uint32_t DiffMask::count() const
{
    uint32_t n = 0;
    for (uint8_t b : bits)
        n += __builtin_popcount(b);
    return n;
}

bool DiffMask::any() const
{
    for (uint8_t b : bits)
        if (b)
            return true;
    return false;
}

ChangeDetector::Result ChangeDetector::diff(const Frame *prev, const Frame &next)
{
    Result result;

    if (!prev) {
        result.outcome = FULL_REPAINT;
        return result;
    }
    if (!prev->sameGeometry(next)) {
        LOG_DEBUG("Geometry %ux%u -> %ux%u, full repaint", prev->width(), prev->height(), next.width(), next.height());
        result.outcome = FULL_REPAINT;
        return result;
    }

    // Padding bits are zero in both frames, so the XOR never marks a pixel outside the panel
    const size_t n = next.sizeBytes();
    const uint8_t *a = prev->data();
    const uint8_t *b = next.data();
    size_t first = 0;
    while (first < n && a[first] == b[first])
        first++;
    if (first == n) {
        result.outcome = NO_CHANGE;
        return result;
    }

    result.mask = DiffMask(next.width(), next.height());
    uint8_t *out = result.mask.row(0);
    uint32_t changed = 0;
    for (size_t i = first; i < n; i++) {
        out[i] = a[i] ^ b[i];
        changed += __builtin_popcount(out[i]);
    }
    result.outcome = CHANGED;
    result.changedPixels = changed;
    return result;
}

const char *ChangeDetector::outcomeName(outcomeTypes outcome)
{
    switch (outcome) {
    case NO_CHANGE:
        return "NO_CHANGE";
    case FULL_REPAINT:
        return "FULL_REPAINT";
    case CHANGED:
        return "CHANGED";
    }
    return "?";
}

} // namespace graphics
