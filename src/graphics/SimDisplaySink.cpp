#include "SimDisplaySink.h"
#include "concurrency/Lock.h"
#include "configuration.h"
#include <algorithm>

namespace graphics
{

SimDisplaySink::SimDisplaySink(uint16_t width, uint16_t height, BitPolarity polarity)
    : packer(polarity), w(width), h(height), stride((width + 7) / 8)
{
    // A blank panel: all white, whatever white is on the wire
    packer.packFull(Frame(width, height), ram);
}

ErrorCode SimDisplaySink::applyFull(uint16_t width, uint16_t height, const uint8_t *buf, size_t len)
{
    concurrency::LockGuard guard(lock);

    if (!enabled)
        return ERRNO_DISABLED;

    const uint32_t newStride = (width + 7) / 8;
    if (!buf || width == 0 || height == 0 || len != (size_t)newStride * height) {
        LOG_ERROR("applyFull: %u bytes do not fit %ux%u", (unsigned)len, width, height);
        rejectedCount++;
        return ERRNO_BUFFER_SIZE;
    }

    if (width != w || height != h) {
        LOG_INFO("Panel geometry %ux%u -> %ux%u", w, h, width, height);
        w = width;
        h = height;
        stride = newStride;
    }
    ram.assign(buf, buf + len);
    fullCount++;
    bytesWritten += len;
    return ERRNO_OK;
}

ErrorCode SimDisplaySink::applyPartial(int16_t x0, int16_t y0, int16_t x1, int16_t y1, const uint8_t *buf, size_t len)
{
    concurrency::LockGuard guard(lock);

    if (!enabled)
        return ERRNO_DISABLED;

    const Region window(x0, y0, x1, y1);
    if (!window.fitsPanel(w, h) || x0 % 8 != 0 || x1 % 8 != 0) {
        LOG_ERROR("applyPartial: window (%d,%d)-(%d,%d) not valid on %ux%u panel", x0, y0, x1, y1, w, h);
        rejectedCount++;
        return ERRNO_BAD_REGION;
    }

    const size_t rowBytes = (size_t)(x1 - x0) / 8;
    if (!buf || len != rowBytes * (size_t)(y1 - y0)) {
        LOG_ERROR("applyPartial: %u bytes for a %dx%d window", (unsigned)len, x1 - x0, y1 - y0);
        rejectedCount++;
        return ERRNO_BUFFER_SIZE;
    }

    partialAttempts++;
    if (failEvery > 0 && partialAttempts % failEvery == 0) {
        LOG_WARN("applyPartial: simulated rejection of (%d,%d)-(%d,%d)", x0, y0, x1, y1);
        if (console)
            console->hexDump(INKDELTA_LOG_LEVEL_TRACE, buf, (uint16_t)std::min<size_t>(len, 64));
        rejectedCount++;
        return ERRNO_SINK_REJECTED;
    }

    for (int32_t y = y0; y < y1; y++)
        std::copy(buf + (y - y0) * rowBytes, buf + (y - y0 + 1) * rowBytes, ram.begin() + (size_t)y * stride + x0 / 8);
    partialCount++;
    bytesWritten += len;
    return ERRNO_OK;
}

uint16_t SimDisplaySink::width() const
{
    concurrency::LockGuard guard(lock);
    return w;
}

uint16_t SimDisplaySink::height() const
{
    concurrency::LockGuard guard(lock);
    return h;
}

void SimDisplaySink::setFailEvery(uint32_t n)
{
    concurrency::LockGuard guard(lock);
    failEvery = n;
    partialAttempts = 0;
}

void SimDisplaySink::setEnabled(bool on)
{
    concurrency::LockGuard guard(lock);
    enabled = on;
}

Frame SimDisplaySink::snapshot() const
{
    concurrency::LockGuard guard(lock);
    Frame frame(w, h);
    ErrorCode err = packer.unpack(ram.data(), ram.size(), Region(0, 0, (int16_t)w, (int16_t)h), frame);
    if (err != ERRNO_OK)
        LOG_ERROR("snapshot: %s", errnoName(err));
    return frame;
}

uint32_t SimDisplaySink::getFullCount() const
{
    concurrency::LockGuard guard(lock);
    return fullCount;
}

uint32_t SimDisplaySink::getPartialCount() const
{
    concurrency::LockGuard guard(lock);
    return partialCount;
}

uint32_t SimDisplaySink::getRejectedCount() const
{
    concurrency::LockGuard guard(lock);
    return rejectedCount;
}

uint64_t SimDisplaySink::getBytesWritten() const
{
    concurrency::LockGuard guard(lock);
    return bytesWritten;
}

} // namespace graphics
