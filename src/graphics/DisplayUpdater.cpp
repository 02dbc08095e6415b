#include "DisplayUpdater.h"
#include "concurrency/Lock.h"

namespace graphics
{

DisplayUpdater::DisplayUpdater(DisplaySink &sink, const PlannerConfig &config, size_t queueDepth)
    : sink(sink), planner(config), queue(queueDepth)
{
}

DisplayUpdater::~DisplayUpdater()
{
    stop();
}

bool DisplayUpdater::submit(FramePtr frame)
{
    if (!frame)
        return false;
    return queue.push(std::move(frame));
}

uint32_t DisplayUpdater::cancelPending()
{
    uint32_t n = queue.clear();
    if (n)
        LOG_DEBUG("Dropped %u pending frames", n);
    return n;
}

void DisplayUpdater::requestCancel()
{
    cancelRequested = true;
}

ErrorCode DisplayUpdater::applyCommand(const UpdateCommand &cmd)
{
    const AlignedRegion &r = cmd.region;
    if (cmd.kind == UpdateCommand::FULL)
        return sink.applyFull((uint16_t)r.width(), (uint16_t)r.height(), cmd.buffer.data(), cmd.buffer.size());
    return sink.applyPartial(r.x0, r.y0, r.x1, r.y1, cmd.buffer.data(), cmd.buffer.size());
}

bool DisplayUpdater::runOnce(UpdateReport *report)
{
    concurrency::LockGuard guard(cycleLock);

    uint32_t skipped = 0;
    FramePtr frame = queue.takeLatest(&skipped);
    if (!frame)
        return false;

    cancelRequested = false;

    UpdateReport local;
    UpdateReport &rep = report ? *report : local;
    rep = UpdateReport();
    rep.cycle = ++cycleCount;
    rep.skippedFrames = skipped;

    UpdatePlan plan = planner.plan(frame);
    rep.kind = plan.kind;
    rep.reason = plan.reason;
    rep.changedPixels = plan.changedPixels;
    rep.planFailures = plan.failures;

    onPlanned.notifyObservers(&plan);

    std::vector<ErrorCode> results(plan.commands.size(), ERRNO_DISABLED);
    for (size_t i = 0; i < plan.commands.size(); i++) {
        const UpdateCommand &cmd = plan.commands[i];
        CommandResult outcome;
        outcome.kind = cmd.kind;
        outcome.region = cmd.region;

        if (cancelRequested) {
            rep.cancelled = true;
        } else {
            results[i] = applyCommand(cmd);
            if (results[i] == ERRNO_OK)
                rep.applied++;
            else {
                rep.failed++;
                LOG_WARN("Apply (%d,%d)-(%d,%d) failed: %s", cmd.region.x0, cmd.region.y0, cmd.region.x1, cmd.region.y1,
                         errnoName(results[i]));
            }
        }
        outcome.result = results[i];
        rep.commands.push_back(outcome);
    }

    if (rep.cancelled)
        LOG_INFO("Cycle %u cancelled after %u of %u commands", rep.cycle, rep.applied, (unsigned)plan.commands.size());

    // A cancelled cycle that reached the sink still commits what the panel took
    if (rep.applied > 0)
        rep.commitResult = planner.commit(plan, results);
    if (rep.commitResult != ERRNO_OK)
        LOG_ERROR("Cycle %u commit failed: %s", rep.cycle, errnoName(rep.commitResult));

    LOG_DEBUG("Cycle %u: %s (%s), applied=%u, failed=%u, skippedFrames=%u", rep.cycle, UpdatePlanner::kindName(rep.kind),
              UpdatePlanner::reasonName(rep.reason), rep.applied, rep.failed, rep.skippedFrames);

    onUpdate.notifyObservers(&rep);
    return true;
}

void DisplayUpdater::threadMain()
{
    RedirectablePrint::setThreadName("updater");
    LOG_DEBUG("Updater thread started");

    while (running) {
        if (!queue.waitForItem())
            break;
        // stop() may have come in while frames were still pending
        if (!running)
            break;
        runOnce();
    }

    LOG_DEBUG("Updater thread stopped");
}

void DisplayUpdater::start()
{
    if (running)
        return;
    queue.reopen();
    running = true;
    worker = std::thread(&DisplayUpdater::threadMain, this);
}

void DisplayUpdater::stop()
{
    if (!running && !worker.joinable())
        return;
    running = false;
    queue.close();
    if (worker.joinable())
        worker.join();
    queue.reopen();
}

} // namespace graphics
