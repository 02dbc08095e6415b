#pragma once

#include "Region.h"
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace graphics
{

/**
 * One full monochrome picture, sized to the panel.
 *
 * Pixels are stored as packed rows, 8 pixels per byte, most significant bit first, each row starting on a byte
 * boundary. A set bit (1) is a black pixel. Trailing bits past the right edge are always zero, so two frames of
 * the same geometry can be compared or XORed byte by byte.
 *
 * A renderer draws into a Frame it owns, then hands it over as a FramePtr. From then on nobody writes to it.
 */
class Frame
{
  public:
    /// Blank (all white) frame. Edges outside 1..EINK_MAX_PANEL_EDGE are clamped, with a warning.
    Frame(uint16_t width, uint16_t height);

    uint16_t width() const { return w; }
    uint16_t height() const { return h; }
    uint32_t strideBytes() const { return stride; }
    uint32_t pixelCount() const { return (uint32_t)w * h; }
    size_t sizeBytes() const { return pixels.size(); }

    bool sameGeometry(const Frame &other) const { return w == other.w && h == other.h; }

    /// Pixel value, false (white) for coordinates outside the frame
    bool getPixel(int32_t x, int32_t y) const;
    void setPixel(int32_t x, int32_t y, bool black);

    void fill(bool black);

    /// Fill the part of the rectangle that lies inside the frame
    void fillRect(const Region &r, bool black);

    /// Copy the pixels of src inside r (clipped to both frames) into this frame
    void copyRect(const Frame &src, const Region &r);

    /// Count of black pixels
    uint32_t countSet() const;

    const uint8_t *row(uint16_t y) const { return pixels.data() + (size_t)y * stride; }
    uint8_t *row(uint16_t y) { return pixels.data() + (size_t)y * stride; }
    const uint8_t *data() const { return pixels.data(); }

    bool operator==(const Frame &other) const { return sameGeometry(other) && pixels == other.pixels; }
    bool operator!=(const Frame &other) const { return !(*this == other); }

  private:
    uint16_t w;
    uint16_t h;
    uint32_t stride;
    std::vector<uint8_t> pixels;

    // Zero the bits past the right edge of every row
    void clearPadding();
};

typedef std::shared_ptr<const Frame> FramePtr;

} // namespace graphics
