#pragma once

#include "BoundaryAligner.h"
#include "BufferPacker.h"
#include "ChangeDetector.h"
#include "Frame.h"
#include "InkTypes.h"
#include "PlannerConfig.h"
#include "Region.h"
#include "RegionClusterer.h"
#include "RegionMerger.h"
#include "concurrency/Lock.h"
#include <stdint.h>
#include <vector>

namespace graphics
{

// One refresh to send to the panel, consumed once by the sink
struct UpdateCommand {
    enum kindTypes : uint8_t {
        FULL,    // whole panel, full refresh waveform
        PARTIAL, // byte aligned window
    };

    kindTypes kind = PARTIAL;
    AlignedRegion region;        // for FULL, the whole frame
    std::vector<uint8_t> buffer; // packed, in wire polarity
};

// A region that could not be turned into a command this cycle
struct RegionFailure {
    Region region;
    ErrorCode error = ERRNO_UNKNOWN;
};

/**
 * Output of UpdatePlanner::plan(): what to send, and what it was computed against.
 * Commands are independent of each other, a sink may accept some and refuse others.
 */
struct UpdatePlan {
    enum kindTypes : uint8_t { // Which refresh operation will be used
        NO_CHANGE,
        FULL,
        PARTIAL,
    };
    enum reasonTypes : uint8_t { // How was the decision reached
        NO_FRAME,
        FIRST_FRAME,
        GEOMETRY_CHANGED,
        UNALIGNED_WIDTH,
        EXCEEDED_LIMIT_PARTIAL,
        EMPTY_AFTER_FILTER,
        ALL_REGIONS_FAILED,
        FRAME_MATCHED_PREVIOUS,
        REGIONS_CHANGED,
    };

    kindTypes kind = NO_CHANGE;
    reasonTypes reason = NO_FRAME;
    FramePtr frame;              // the frame being displayed
    uint32_t baseGeneration = 0; // retained frame generation this plan was diffed against
    uint32_t changedPixels = 0;
    uint32_t droppedRegions = 0; // filtered or capped, their pixels stay pending for the next cycle
    std::vector<UpdateCommand> commands;
    std::vector<RegionFailure> failures;

    bool empty() const { return commands.empty(); }
};

/*
    Decides, per frame, between no refresh, a full refresh, and a set of partial refreshes.
    Owns the one retained frame: the last picture known to be on the panel.

    plan() never touches the retained frame. Only commit(), called once the sink has taken the commands, replaces
    it. A cycle that is cancelled before it reaches the sink therefore leaves the planner as it was.

    States: UNINITIALIZED (nothing retained) -> FIRST_FRAME (after a committed full refresh)
    -> STEADY (after a committed partial refresh).
*/

class UpdatePlanner
{
  public:
    enum stateTypes : uint8_t {
        UNINITIALIZED,
        FIRST_FRAME,
        STEADY,
    };

    explicit UpdatePlanner(const PlannerConfig &config = PlannerConfig());

    UpdatePlanner(const UpdatePlanner &) = delete;
    UpdatePlanner &operator=(const UpdatePlanner &) = delete;

    /// Work out the commands that bring the panel from the retained frame to next
    UpdatePlan plan(FramePtr next);

    /// Commit a plan whose commands were all applied successfully
    ErrorCode commit(const UpdatePlan &plan);

    /**
     * Commit the commands of plan that the sink accepted.
     * Only accepted partial windows are copied into the new retained frame, a full plan is committed only if its
     * command was accepted. Missing entries in results count as not applied.
     * @return ERRNO_OK, or ERRNO_STALE_PLAN if the retained frame changed since the plan was made
     */
    ErrorCode commit(const UpdatePlan &plan, const std::vector<ErrorCode> &results);

    /// Forget the panel content (cleared, slept, re-initialised). The next plan is a full refresh.
    void invalidate();

    stateTypes getState() const;
    FramePtr retainedFrame() const;
    uint32_t getGeneration() const;
    uint32_t getPartialCount() const; // committed partial cycles since the last full refresh

    const PlannerConfig &getConfig() const { return config; }

    static const char *kindName(UpdatePlan::kindTypes kind);
    static const char *reasonName(UpdatePlan::reasonTypes reason);
    static const char *stateName(stateTypes state);

  private:
    PlannerConfig config;
    BufferPacker packer;
    RegionClusterer clusterer;
    RegionMerger merger;

    mutable concurrency::Lock lock; // guards everything below
    FramePtr retained;
    uint32_t generation = 0;
    stateTypes state = UNINITIALIZED;
    uint32_t partialCount = 0;

    void planFull(UpdatePlan &plan, UpdatePlan::reasonTypes reason);
    void planPartial(UpdatePlan &plan, const DiffMask &mask, uint32_t partialsSoFar);
};

} // namespace graphics
