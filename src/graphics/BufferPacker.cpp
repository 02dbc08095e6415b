#include "BufferPacker.h"
#include "configuration.h"

namespace graphics
{

BufferPacker::BufferPacker(BitPolarity polarity) : polarity(polarity) {}

size_t BufferPacker::packedSize(const Region &window)
{
    if (window.empty())
        return 0;
    return (size_t)((window.width() + 7) / 8) * window.height();
}

ErrorCode BufferPacker::pack(const Frame &frame, const AlignedRegion &window, std::vector<uint8_t> &out) const
{
    if (!window.fitsPanel(frame.width(), frame.height()) || window.x0 % 8 != 0 || window.x1 % 8 != 0) {
        LOG_WARN("Cannot pack window (%d,%d)-(%d,%d) of %ux%u frame", window.x0, window.y0, window.x1, window.y1,
                 frame.width(), frame.height());
        return ERRNO_BAD_REGION;
    }

    const int32_t firstByte = window.x0 / 8;
    const int32_t rowBytes = window.rowBytes();
    out.resize(packedSize(window));

    uint8_t *dst = out.data();
    for (int32_t y = window.y0; y < window.y1; y++) {
        const uint8_t *src = frame.row(y) + firstByte;
        for (int32_t i = 0; i < rowBytes; i++)
            *dst++ = applyPolarity(src[i]);
    }
    return ERRNO_OK;
}

ErrorCode BufferPacker::packFull(const Frame &frame, std::vector<uint8_t> &out) const
{
    out.resize(frame.sizeBytes());
    const uint8_t *src = frame.data();
    for (size_t i = 0; i < out.size(); i++)
        out[i] = applyPolarity(src[i]);
    return ERRNO_OK;
}

ErrorCode BufferPacker::unpack(const uint8_t *buf, size_t len, const Region &window, Frame &frame) const
{
    if (!window.fitsPanel(frame.width(), frame.height()))
        return ERRNO_BAD_REGION;
    if (len != packedSize(window) || !buf)
        return ERRNO_BUFFER_SIZE;

    const int32_t rowBytes = (window.width() + 7) / 8;
    for (int32_t y = window.y0; y < window.y1; y++) {
        for (int32_t i = 0; i < rowBytes; i++) {
            const uint8_t b = applyPolarity(*buf++);
            for (int32_t bit = 0; bit < 8; bit++) {
                const int32_t x = window.x0 + i * 8 + bit;
                if (x >= window.x1)
                    break;
                frame.setPixel(x, y, (b >> (7 - bit)) & 1);
            }
        }
    }
    return ERRNO_OK;
}

} // namespace graphics
