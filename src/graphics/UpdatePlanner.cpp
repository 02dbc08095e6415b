#include "UpdatePlanner.h"
#include "concurrency/Lock.h"
#include "configuration.h"
#include <memory>

namespace graphics
{

namespace
{

PlannerConfig sanitized(PlannerConfig config)
{
    config.sanitize();
    return config;
}

} // namespace

UpdatePlanner::UpdatePlanner(const PlannerConfig &cfg)
    : config(sanitized(cfg)), packer(config.polarity), clusterer(config.connectivity, config.regionPaddingPx), merger(config)
{
    LOG_DEBUG("UpdatePlanner: merge=%dpx, min=%dpx, max=%d, padding=%dpx, polarity=%s, connectivity=%u, empty=%s, "
              "fullEvery=%u",
              config.mergeDistancePx, config.minRegionPx, config.maxRegionsPerCycle, config.regionPaddingPx,
              polarityName(config.polarity), config.connectivity, emptyPolicyName(config.emptyPolicy),
              config.maxConsecutivePartials);
}

UpdatePlan UpdatePlanner::plan(FramePtr next)
{
    UpdatePlan plan;

    if (!next) {
        LOG_WARN("plan() called without a frame");
        plan.kind = UpdatePlan::NO_CHANGE;
        plan.reason = UpdatePlan::NO_FRAME;
        return plan;
    }

    // Take our own reference to the retained frame, a commit on another thread cannot pull it from under us
    FramePtr prev;
    uint32_t partialsSoFar;
    {
        concurrency::LockGuard guard(lock);
        prev = retained;
        plan.baseGeneration = generation;
        partialsSoFar = partialCount;
    }
    plan.frame = next;

    ChangeDetector::Result change = ChangeDetector::diff(prev.get(), *next);

    if (change.outcome == ChangeDetector::FULL_REPAINT) {
        planFull(plan, prev ? UpdatePlan::GEOMETRY_CHANGED : UpdatePlan::FIRST_FRAME);
        return plan;
    }

    if (change.outcome == ChangeDetector::NO_CHANGE) {
        plan.kind = UpdatePlan::NO_CHANGE;
        plan.reason = UpdatePlan::FRAME_MATCHED_PREVIOUS;
        LOG_DEBUG("refresh=SKIPPED, reason=FRAME_MATCHED_PREVIOUS");
        return plan;
    }

    plan.changedPixels = change.changedPixels;

    // Windows are addressed in whole bytes, a ragged right edge could not be reached without clipping
    if (next->width() % config.byteAlignment != 0) {
        planFull(plan, UpdatePlan::UNALIGNED_WIDTH);
        return plan;
    }

    // Too many partial refreshes consecutively: clear the ghosting with a full one
    if (config.maxConsecutivePartials > 0 && partialsSoFar >= config.maxConsecutivePartials) {
        planFull(plan, UpdatePlan::EXCEEDED_LIMIT_PARTIAL);
        return plan;
    }

    planPartial(plan, change.mask, partialsSoFar);
    return plan;
}

void UpdatePlanner::planFull(UpdatePlan &plan, UpdatePlan::reasonTypes reason)
{
    const Frame &frame = *plan.frame;
    const Region whole(0, 0, (int16_t)frame.width(), (int16_t)frame.height());

    UpdateCommand cmd;
    cmd.kind = UpdateCommand::FULL;
    cmd.region = AlignedRegion(whole, whole);
    packer.packFull(frame, cmd.buffer);

    plan.kind = UpdatePlan::FULL;
    plan.reason = reason;
    plan.commands.clear();
    plan.commands.push_back(std::move(cmd));

    LOG_DEBUG("refresh=FULL, reason=%s, frame=%ux%u, changedPx=%u", reasonName(reason), frame.width(), frame.height(),
              plan.changedPixels);
}

void UpdatePlanner::planPartial(UpdatePlan &plan, const DiffMask &mask, uint32_t partialsSoFar)
{
    const Frame &frame = *plan.frame;

    std::vector<Region> candidates = clusterer.cluster(mask);
    RegionMerger::Result refined = merger.refine(candidates);
    if (refined.emptiedByFilter) {
        planFull(plan, UpdatePlan::EMPTY_AFTER_FILTER);
        return;
    }
    plan.droppedRegions = refined.filtered + refined.capped;

    BoundaryAligner aligner(frame.width(), frame.height(), (uint8_t)config.byteAlignment);
    for (const Region &r : refined.regions) {
        UpdateCommand cmd;
        cmd.kind = UpdateCommand::PARTIAL;

        // A region that fails here is reported and skipped, the others still go out
        ErrorCode err = aligner.align(r, cmd.region);
        if (err == ERRNO_OK)
            err = packer.pack(frame, cmd.region, cmd.buffer);
        if (err != ERRNO_OK) {
            LOG_WARN("Region (%d,%d)-(%d,%d) skipped: %s", r.x0, r.y0, r.x1, r.y1, errnoName(err));
            plan.failures.push_back({r, err});
            continue;
        }

        LOG_DEBUG("region (%d,%d)-(%d,%d) -> window (%d,%d)-(%d,%d), %u bytes", r.x0, r.y0, r.x1, r.y1, cmd.region.x0,
                  cmd.region.y0, cmd.region.x1, cmd.region.y1, (unsigned)cmd.buffer.size());
        plan.commands.push_back(std::move(cmd));
    }

    if (plan.commands.empty()) {
        planFull(plan, UpdatePlan::ALL_REGIONS_FAILED);
        return;
    }

    plan.kind = UpdatePlan::PARTIAL;
    plan.reason = UpdatePlan::REGIONS_CHANGED;
    LOG_DEBUG("refresh=PARTIAL, reason=REGIONS_CHANGED, regions=%u, dropped=%u, changedPx=%u, partialCount=%u",
              (unsigned)plan.commands.size(), plan.droppedRegions, plan.changedPixels, partialsSoFar);
}

ErrorCode UpdatePlanner::commit(const UpdatePlan &plan)
{
    return commit(plan, std::vector<ErrorCode>(plan.commands.size(), ERRNO_OK));
}

ErrorCode UpdatePlanner::commit(const UpdatePlan &plan, const std::vector<ErrorCode> &results)
{
    if (plan.kind == UpdatePlan::NO_CHANGE || plan.commands.empty())
        return ERRNO_OK;

    concurrency::LockGuard guard(lock);

    if (plan.baseGeneration != generation) {
        LOG_WARN("Refusing stale plan: generation %u, retained %u", plan.baseGeneration, generation);
        return ERRNO_STALE_PLAN;
    }

    if (plan.kind == UpdatePlan::FULL) {
        const ErrorCode result = results.empty() ? ERRNO_DISABLED : results[0];
        if (result != ERRNO_OK) {
            LOG_WARN("Full refresh not applied (%s), retained frame kept", errnoName(result));
            return ERRNO_OK;
        }
        retained = plan.frame;
        generation++;
        state = FIRST_FRAME;
        partialCount = 0;
        LOG_DEBUG("commit: FULL, generation=%u", generation);
        return ERRNO_OK;
    }

    uint32_t applied = 0;
    for (size_t i = 0; i < plan.commands.size(); i++)
        if (i < results.size() && results[i] == ERRNO_OK)
            applied++;

    if (applied == 0) {
        LOG_WARN("No partial window applied, retained frame kept");
        return ERRNO_OK;
    }

    // Nothing left out: the windows cover every changed pixel, so the panel now shows exactly plan.frame
    if (applied == plan.commands.size() && plan.droppedRegions == 0 && plan.failures.empty()) {
        retained = plan.frame;
    } else {
        std::shared_ptr<Frame> patched = std::make_shared<Frame>(*retained);
        for (size_t i = 0; i < plan.commands.size(); i++) {
            if (i < results.size() && results[i] == ERRNO_OK)
                patched->copyRect(*plan.frame, plan.commands[i].region);
        }
        retained = patched;
    }

    generation++;
    state = STEADY;
    partialCount++;
    LOG_DEBUG("commit: PARTIAL, applied=%u/%u, generation=%u, partialCount=%u", applied, (unsigned)plan.commands.size(),
              generation, partialCount);
    return ERRNO_OK;
}

void UpdatePlanner::invalidate()
{
    concurrency::LockGuard guard(lock);
    retained.reset();
    generation++;
    state = UNINITIALIZED;
    partialCount = 0;
    LOG_DEBUG("Retained frame invalidated");
}

UpdatePlanner::stateTypes UpdatePlanner::getState() const
{
    concurrency::LockGuard guard(lock);
    return state;
}

FramePtr UpdatePlanner::retainedFrame() const
{
    concurrency::LockGuard guard(lock);
    return retained;
}

uint32_t UpdatePlanner::getGeneration() const
{
    concurrency::LockGuard guard(lock);
    return generation;
}

uint32_t UpdatePlanner::getPartialCount() const
{
    concurrency::LockGuard guard(lock);
    return partialCount;
}

const char *UpdatePlanner::kindName(UpdatePlan::kindTypes kind)
{
    switch (kind) {
    case UpdatePlan::NO_CHANGE:
        return "NO_CHANGE";
    case UpdatePlan::FULL:
        return "FULL";
    case UpdatePlan::PARTIAL:
        return "PARTIAL";
    }
    return "?";
}

const char *UpdatePlanner::reasonName(UpdatePlan::reasonTypes reason)
{
    switch (reason) {
    case UpdatePlan::NO_FRAME:
        return "NO_FRAME";
    case UpdatePlan::FIRST_FRAME:
        return "FIRST_FRAME";
    case UpdatePlan::GEOMETRY_CHANGED:
        return "GEOMETRY_CHANGED";
    case UpdatePlan::UNALIGNED_WIDTH:
        return "UNALIGNED_WIDTH";
    case UpdatePlan::EXCEEDED_LIMIT_PARTIAL:
        return "EXCEEDED_LIMIT_PARTIAL";
    case UpdatePlan::EMPTY_AFTER_FILTER:
        return "EMPTY_AFTER_FILTER";
    case UpdatePlan::ALL_REGIONS_FAILED:
        return "ALL_REGIONS_FAILED";
    case UpdatePlan::FRAME_MATCHED_PREVIOUS:
        return "FRAME_MATCHED_PREVIOUS";
    case UpdatePlan::REGIONS_CHANGED:
        return "REGIONS_CHANGED";
    }
    return "?";
}

const char *UpdatePlanner::stateName(stateTypes state)
{
    switch (state) {
    case UNINITIALIZED:
        return "UNINITIALIZED";
    case FIRST_FRAME:
        return "FIRST_FRAME";
    case STEADY:
        return "STEADY";
    }
    return "?";
}

} // namespace graphics
