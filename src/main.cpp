#include "Observer.h"
#include "configuration.h"
#include "graphics/DisplayUpdater.h"
#include "graphics/SimDisplaySink.h"
#include "platform/linux/LinuxGlue.h"
#include <memory>
#include <stdlib.h>
#include <unistd.h>

using namespace graphics;

namespace
{

// Segments a..g of a seven segment digit, bit 0 = a
const uint8_t digitSegments[10] = {0x3F, 0x06, 0x5B, 0x4F, 0x66, 0x6D, 0x7D, 0x07, 0x7F, 0x6F};

const int16_t DIGIT_W = 40;
const int16_t DIGIT_H = 72;
const int16_t SEG = 8; // segment thickness
const int16_t BOX = 48;

void drawDigit(Frame &frame, int16_t x, int16_t y, uint8_t digit)
{
    const uint8_t s = digitSegments[digit % 10];
    const int16_t mid = y + (DIGIT_H - SEG) / 2;
    if (s & 0x01)
        frame.fillRect(Region(x, y, x + DIGIT_W, y + SEG), true); // a
    if (s & 0x02)
        frame.fillRect(Region(x + DIGIT_W - SEG, y, x + DIGIT_W, mid + SEG), true); // b
    if (s & 0x04)
        frame.fillRect(Region(x + DIGIT_W - SEG, mid, x + DIGIT_W, y + DIGIT_H), true); // c
    if (s & 0x08)
        frame.fillRect(Region(x, y + DIGIT_H - SEG, x + DIGIT_W, y + DIGIT_H), true); // d
    if (s & 0x10)
        frame.fillRect(Region(x, mid, x + SEG, y + DIGIT_H), true); // e
    if (s & 0x20)
        frame.fillRect(Region(x, y, x + SEG, mid + SEG), true); // f
    if (s & 0x40)
        frame.fillRect(Region(x, mid, x + DIGIT_W, mid + SEG), true); // g
}

/*
    The demo scene: a border, a counter in the top left corner and a box sliding along the bottom.
    Most cycles only touch a few digits and the box, so they should go out as small partial windows.
*/
FramePtr renderFrame(uint16_t width, uint16_t height, uint32_t cycle)
{
    std::shared_ptr<Frame> frame = std::make_shared<Frame>(width, height);

    // Border
    frame->fillRect(Region(0, 0, (int16_t)width, 4), true);
    frame->fillRect(Region(0, (int16_t)(height - 4), (int16_t)width, (int16_t)height), true);
    frame->fillRect(Region(0, 0, 4, (int16_t)height), true);
    frame->fillRect(Region((int16_t)(width - 4), 0, (int16_t)width, (int16_t)height), true);

    // Counter, four digits
    uint32_t value = cycle;
    for (int i = 3; i >= 0; i--) {
        drawDigit(*frame, (int16_t)(24 + i * (DIGIT_W + 16)), 24, (uint8_t)(value % 10));
        value /= 10;
    }

    // Box moving right, wrapping at the edge
    const int32_t travel = width > BOX + 32 ? width - BOX - 32 : 1;
    const int16_t bx = (int16_t)(16 + (cycle * 37) % travel);
    const int16_t by = (int16_t)(height > BOX + 24 ? height - BOX - 24 : 0);
    frame->fillRect(Region(bx, by, bx + BOX, by + BOX), true);

    return frame;
}

// Logs a one line summary of each cycle
class CycleLog
{
  public:
    int onReport(const UpdateReport *r)
    {
        LOG_INFO("cycle %u: %s (%s), commands=%u, applied=%u, failed=%u, changedPx=%u", r->cycle,
                 UpdatePlanner::kindName(r->kind), UpdatePlanner::reasonName(r->reason), (unsigned)r->commands.size(),
                 r->applied, r->failed, r->changedPixels);
        if (r->kind == UpdatePlan::FULL)
            fullCycles++;
        else if (r->kind == UpdatePlan::PARTIAL)
            partialCycles++;
        return 0;
    }

    uint32_t fullCycles = 0;
    uint32_t partialCycles = 0;
};

bool loadDefaultConfig(inkdelta_config_struct &config)
{
    if (access("config.yaml", R_OK) == 0) {
        LOG_INFO("Using config.yaml");
        return loadConfig("config.yaml", config);
    }
    if (access("/etc/inkdelta/config.yaml", R_OK) == 0) {
        LOG_INFO("Using /etc/inkdelta/config.yaml");
        return loadConfig("/etc/inkdelta/config.yaml", config);
    }
    LOG_INFO("No config.yaml found, using defaults");
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    inkdelta_cli_struct cli;
    if (!parseArguments(argc, argv, cli))
        return EXIT_FAILURE;

    consoleInit();
    RedirectablePrint::setThreadName("main");

    inkdelta_config_struct config;
    bool loaded = cli.configPath ? loadConfig(cli.configPath, config) : loadDefaultConfig(config);
    if (!loaded) {
        LOG_CRIT("Config could not be loaded, exiting");
        return EXIT_FAILURE;
    }
    if (cli.verbose)
        config.logoutputlevel = level_debug;
    applyLoggingConfig(config);

    LOG_INFO("inkdeltad %s, panel %ux%u, polarity=%s, cycles=%u", optstr(APP_VERSION), config.panelWidth,
             config.panelHeight, polarityName(config.planner.polarity), cli.cycles);

    SimDisplaySink sink(config.panelWidth, config.panelHeight, config.planner.polarity);
    sink.setFailEvery(cli.failEvery);

    DisplayUpdater updater(sink, config.planner);
    CycleLog cycleLog;
    CallbackObserver<CycleLog, const UpdateReport *> reportObserver(&cycleLog, &CycleLog::onReport);
    reportObserver.observe(&updater.onUpdate);

    for (uint32_t cycle = 0; cycle < cli.cycles; cycle++) {
        updater.submit(renderFrame(config.panelWidth, config.panelHeight, cycle));
        updater.runOnce();
    }

    // The panel must show exactly what the planner believes it shows
    FramePtr retained = updater.getPlanner().retainedFrame();
    Frame panel = sink.snapshot();
    bool consistent = cli.cycles == 0 || (retained && *retained == panel);

    LOG_INFO("done: full=%u, partial=%u, sink full=%u partial=%u rejected=%u, %llu bytes", cycleLog.fullCycles,
             cycleLog.partialCycles, sink.getFullCount(), sink.getPartialCount(), sink.getRejectedCount(),
             (unsigned long long)sink.getBytesWritten());
    if (!consistent) {
        LOG_ERROR("Panel content differs from the retained frame");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
