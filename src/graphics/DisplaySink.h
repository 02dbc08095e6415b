#pragma once

#include "InkTypes.h"
#include <stddef.h>
#include <stdint.h>

namespace graphics
{

/**
 * What the planner's commands are sent to: a panel driver, or a simulated panel.
 * Buffers are row-major, one byte per 8 horizontal pixels, MSB first, in the panel's own polarity.
 * Only one apply may be in flight at a time, callers serialize.
 */
class DisplaySink
{
  public:
    virtual ~DisplaySink() {}

    /// Full refresh. The sink adopts width x height if they differ from its current geometry.
    virtual ErrorCode applyFull(uint16_t width, uint16_t height, const uint8_t *buf, size_t len) = 0;

    /// Partial refresh of the half-open window [x0, x1) x [y0, y1). x0 and x1 are multiples of 8.
    virtual ErrorCode applyPartial(int16_t x0, int16_t y0, int16_t x1, int16_t y1, const uint8_t *buf, size_t len) = 0;

    virtual uint16_t width() const = 0;
    virtual uint16_t height() const = 0;
};

} // namespace graphics
