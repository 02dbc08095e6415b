#pragma once

#include "DisplaySink.h"
#include "Frame.h"
#include "Observer.h"
#include "UpdatePlanner.h"
#include "concurrency/FrameQueue.h"
#include "concurrency/Lock.h"
#include "configuration.h"
#include <atomic>
#include <stdint.h>
#include <thread>
#include <vector>

namespace graphics
{

// Outcome of one command of a cycle
struct CommandResult {
    UpdateCommand::kindTypes kind = UpdateCommand::PARTIAL;
    AlignedRegion region;
    ErrorCode result = ERRNO_DISABLED;
};

// What one update cycle did, handed to observers after the cycle committed
struct UpdateReport {
    uint32_t cycle = 0;
    UpdatePlan::kindTypes kind = UpdatePlan::NO_CHANGE;
    UpdatePlan::reasonTypes reason = UpdatePlan::NO_FRAME;
    uint32_t skippedFrames = 0; // older pending frames replaced by this one
    uint32_t changedPixels = 0;
    uint32_t applied = 0;
    uint32_t failed = 0;
    bool cancelled = false;
    ErrorCode commitResult = ERRNO_OK;
    std::vector<CommandResult> commands;
    std::vector<RegionFailure> planFailures; // regions that never became a command
};

/**
 * Drives a sink from a stream of frames. Frames are queued by submit(), a cycle takes the newest one, plans it,
 * applies the commands one after the other and commits whatever the sink accepted.
 *
 * Cycles run either on the caller's thread (runOnce) or on a worker thread (start/stop), never two at once.
 */
class DisplayUpdater
{
  public:
    DisplayUpdater(DisplaySink &sink, const PlannerConfig &config, size_t queueDepth = EINK_UPDATE_QUEUE_DEPTH);
    ~DisplayUpdater();

    DisplayUpdater(const DisplayUpdater &) = delete;
    DisplayUpdater &operator=(const DisplayUpdater &) = delete;

    /// Queue a frame for display. Returns false if the updater is shutting down.
    bool submit(FramePtr frame);

    /**
     * Run one cycle on the calling thread with the newest pending frame.
     * @return false if no frame was pending
     */
    bool runOnce(UpdateReport *report = nullptr);

    void start();
    void stop();
    bool isRunning() const { return running; }

    /// Drop every queued frame, returns how many
    uint32_t cancelPending();

    /// Stop the cycle in progress before its next apply. Commands already applied are still committed.
    void requestCancel();

    /// The sink was cleared or re-initialised behind our back
    void invalidate() { planner.invalidate(); }

    UpdatePlanner &getPlanner() { return planner; }
    uint32_t pendingFrames() const { return queue.size(); }

    /// Notified with each plan before anything is applied
    Observable<const UpdatePlan *> onPlanned;

    /// Notified with the report at the end of each cycle
    Observable<const UpdateReport *> onUpdate;

  private:
    DisplaySink &sink;
    UpdatePlanner planner;
    concurrency::FrameQueue<Frame> queue;

    concurrency::Lock cycleLock; // one cycle, so one apply in flight, at a time
    std::atomic<bool> cancelRequested{false};
    std::atomic<bool> running{false};
    std::thread worker;
    uint32_t cycleCount = 0;

    ErrorCode applyCommand(const UpdateCommand &cmd);
    void threadMain();
};

} // namespace graphics
