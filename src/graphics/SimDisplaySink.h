#pragma once

#include "BufferPacker.h"
#include "DisplaySink.h"
#include "Frame.h"
#include "PlannerConfig.h"
#include "concurrency/Lock.h"
#include <stdint.h>
#include <vector>

namespace graphics
{

/**
 * A panel in memory. Keeps the panel RAM in wire polarity, exactly as a controller would, and checks every
 * command the way the controller would refuse it. Used by the simulator daemon, the tests and the fuzzer.
 */
class SimDisplaySink : public DisplaySink
{
  public:
    SimDisplaySink(uint16_t width, uint16_t height, BitPolarity polarity = BitPolarity::INVERTED);

    ErrorCode applyFull(uint16_t width, uint16_t height, const uint8_t *buf, size_t len) override;
    ErrorCode applyPartial(int16_t x0, int16_t y0, int16_t x1, int16_t y1, const uint8_t *buf, size_t len) override;

    uint16_t width() const override;
    uint16_t height() const override;

    /// Reject every nth partial apply with ERRNO_SINK_REJECTED, 0 never rejects
    void setFailEvery(uint32_t n);

    /// Refuse everything with ERRNO_DISABLED, like a panel that has been put to sleep
    void setEnabled(bool on);

    /// Panel content converted back to a Frame
    Frame snapshot() const;

    uint32_t getFullCount() const;
    uint32_t getPartialCount() const;
    uint32_t getRejectedCount() const;
    uint64_t getBytesWritten() const;

  private:
    BufferPacker packer;

    mutable concurrency::Lock lock; // guards everything below
    uint16_t w;
    uint16_t h;
    uint32_t stride;
    std::vector<uint8_t> ram; // wire polarity

    bool enabled = true;
    uint32_t failEvery = 0;
    uint32_t partialAttempts = 0;
    uint32_t fullCount = 0;
    uint32_t partialCount = 0;
    uint32_t rejectedCount = 0;
    uint64_t bytesWritten = 0;
};

} // namespace graphics
