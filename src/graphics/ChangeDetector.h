#pragma once

#include "Frame.h"
#include <stdint.h>
#include <vector>

namespace graphics
{

/**
 * Which pixels differ between two frames of the same geometry.
 * Same packed layout as Frame: a set bit marks a changed pixel.
 */
class DiffMask
{
  public:
    DiffMask() {}
    DiffMask(uint16_t width, uint16_t height);

    uint16_t width() const { return w; }
    uint16_t height() const { return h; }
    uint32_t strideBytes() const { return stride; }

    bool get(int32_t x, int32_t y) const;
    void set(int32_t x, int32_t y);

    const uint8_t *row(uint16_t y) const { return bits.data() + (size_t)y * stride; }
    uint8_t *row(uint16_t y) { return bits.data() + (size_t)y * stride; }

    /// Number of changed pixels
    uint32_t count() const;
    bool any() const;

  private:
    uint16_t w = 0;
    uint16_t h = 0;
    uint32_t stride = 0;
    std::vector<uint8_t> bits;
};

class ChangeDetector
{
  public:
    enum outcomeTypes : uint8_t {
        NO_CHANGE,    // frames are identical, nothing to send
        FULL_REPAINT, // no previous frame, or the geometry changed
        CHANGED,      // mask holds the changed pixels
    };

    struct Result {
        outcomeTypes outcome = NO_CHANGE;
        DiffMask mask;              // only filled for CHANGED
        uint32_t changedPixels = 0; // only counted for CHANGED
    };

    /**
     * Compare the previously displayed frame with the next one.
     * @param prev nullptr if nothing is known about the panel content
     */
    static Result diff(const Frame *prev, const Frame &next);

    static const char *outcomeName(outcomeTypes outcome);
};

} // namespace graphics
