#pragma once

#include "Frame.h"
#include "InkTypes.h"
#include "PlannerConfig.h"
#include "Region.h"
#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace graphics
{

/*
    Crops a frame to a window and lays it out the way the panel wants it:
    row-major, one byte per 8 horizontal pixels, most significant bit = leftmost pixel.
    Polarity conversion happens in applyPolarity() only, exactly once per byte, on the way out and on the way back.
*/

class BufferPacker
{
  public:
    explicit BufferPacker(BitPolarity polarity);

    /**
     * Pack the pixels of frame inside a byte aligned window
     * @return ERRNO_OK, or ERRNO_BAD_REGION if the window is not byte aligned or not inside the frame
     */
    ErrorCode pack(const Frame &frame, const AlignedRegion &window, std::vector<uint8_t> &out) const;

    /// Pack the whole frame, rows padded to whole bytes (the padding is white)
    ErrorCode packFull(const Frame &frame, std::vector<uint8_t> &out) const;

    /**
     * Write a packed buffer back into frame over window. Columns past window.x1 in the last byte are ignored.
     * @return ERRNO_BUFFER_SIZE if len does not match the window, ERRNO_BAD_REGION if the window is not inside frame
     */
    ErrorCode unpack(const uint8_t *buf, size_t len, const Region &window, Frame &frame) const;

    /// Bytes needed for window, each row rounded up to whole bytes
    static size_t packedSize(const Region &window);

    BitPolarity getPolarity() const { return polarity; }

  private:
    BitPolarity polarity;

    // Frame byte <-> wire byte. Inversion is its own inverse, so this serves both directions
    uint8_t applyPolarity(uint8_t b) const { return polarity == BitPolarity::INVERTED ? (uint8_t)(b ^ 0xFF) : b; }
};

} // namespace graphics
