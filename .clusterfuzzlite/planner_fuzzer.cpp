// Fuzzer that pushes arbitrary frame pairs through the planner into a simulated panel.
#include <cstdlib>
#include <memory>

#include "configuration.h"
#include "graphics/DisplayUpdater.h"
#include "graphics/SimDisplaySink.h"

using namespace graphics;

namespace
{

// Input layout:
//   [0] width / 8 - 1 (low 4 bits), [1] height - 1 (low 6 bits)
//   [2] options: bit 0 connectivity 8, bit 1 keep largest, bit 2 normal polarity, bits 3-5 padding, bits 6-7 merge
//   [3] min region size (low 5 bits), [4] max regions (low 4 bits) + 1, [5] sink fails every Nth partial (low 2 bits)
//   rest: pixels of the two frames, repeated as needed
constexpr size_t headerSize = 6;

FramePtr makeFrame(uint16_t w, uint16_t h, const uint8_t *bits, size_t len, size_t offset)
{
    std::shared_ptr<Frame> frame = std::make_shared<Frame>(w, h);
    if (len == 0)
        return frame;
    for (uint16_t y = 0; y < h; y++) {
        for (uint32_t i = 0; i < frame->strideBytes(); i++) {
            uint8_t b = bits[(offset + (size_t)y * frame->strideBytes() + i) % len];
            for (int bit = 0; bit < 8; bit++)
                frame->setPixel(i * 8 + bit, y, (b >> (7 - bit)) & 1);
        }
    }
    return frame;
}

void check(bool ok, const char *what)
{
    if (!ok) {
        LOG_CRIT("Check failed: %s", what);
        abort();
    }
}

// Every planned command must be well formed
class CycleChecker
{
  public:
    explicit CycleChecker(const PlannerConfig *config) : config(config) {}

    int onPlanned(const UpdatePlan *plan)
    {
        if (plan->kind == UpdatePlan::PARTIAL) {
            check(plan->commands.size() <= (size_t)config->maxRegionsPerCycle, "region cap");
            for (const UpdateCommand &c : plan->commands) {
                check(c.region.x0 % 8 == 0 && c.region.width() % 8 == 0, "byte alignment");
                check(c.region.fitsPanel(plan->frame->width(), plan->frame->height()), "window inside panel");
                check(c.region.containsRegion(c.region.source), "window covers region");
                check(c.buffer.size() == BufferPacker::packedSize(c.region), "buffer length");
            }
        }
        return 0;
    }

  private:
    const PlannerConfig *config;
};

} // namespace

extern "C" int LLVMFuzzerInitialize(int *argc, char ***argv)
{
    consoleInit();
    console->setLogLevel(level_error);
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t length)
{
    if (length < headerSize)
        return -1; // Reject: The input will not be added to the corpus.

    const uint16_t w = (uint16_t)(8 * ((data[0] & 0x0F) + 1));
    const uint16_t h = (uint16_t)((data[1] & 0x3F) + 1);

    PlannerConfig config;
    config.connectivity = (data[2] & 0x01) ? 8 : 4;
    config.emptyPolicy = (data[2] & 0x02) ? EmptyRegionPolicy::KEEP_LARGEST : EmptyRegionPolicy::FULL_REPAINT;
    config.polarity = (data[2] & 0x04) ? BitPolarity::NORMAL : BitPolarity::INVERTED;
    config.regionPaddingPx = (data[2] >> 3) & 0x07;
    config.mergeDistancePx = ((data[2] >> 6) & 0x03) * 8;
    config.minRegionPx = data[3] & 0x1F;
    config.maxRegionsPerCycle = (data[4] & 0x0F) + 1;

    const uint8_t *bits = data + headerSize;
    const size_t bitsLen = length - headerSize;
    const size_t half = bitsLen / 2;

    SimDisplaySink sink(w, h, config.polarity);
    sink.setFailEvery(data[5] & 0x03);
    DisplayUpdater updater(sink, config);
    CycleChecker checker(&config);
    CallbackObserver<CycleChecker, const UpdatePlan *> observer(&checker, &CycleChecker::onPlanned);
    observer.observe(&updater.onPlanned);

    FramePtr prev = makeFrame(w, h, bits, bitsLen, 0);
    FramePtr next = makeFrame(w, h, bits, bitsLen, half);

    // Show prev, then keep pushing next until it is on the panel. A clean partial cycle shows at least one pixel
    updater.submit(prev);
    updater.runOnce();
    const uint32_t maxCycles = (uint32_t)w * h + 2;
    for (uint32_t cycle = 0; cycle < maxCycles; cycle++) {
        updater.submit(next);
        updater.runOnce();

        FramePtr retained = updater.getPlanner().retainedFrame();
        check(!retained || *retained == sink.snapshot(), "panel matches retained frame");
        if (retained && *retained == *next)
            break;
    }

    // Without sink failures every change is eventually shown
    if ((data[5] & 0x03) == 0) {
        FramePtr retained = updater.getPlanner().retainedFrame();
        check(retained && *retained == *next, "next frame reached the panel");
    }
    return 0;
}
