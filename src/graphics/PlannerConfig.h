#pragma once

#include "configuration.h"
#include <stdint.h>

namespace graphics
{

// Bit meaning on the wire to the panel
enum class BitPolarity : uint8_t {
    NORMAL,   // 1 = black, same as Frame
    INVERTED, // 1 = white, every packed byte is inverted once
};

// What to do when the size filter removes every candidate while pixels did change
enum class EmptyRegionPolicy : uint8_t {
    FULL_REPAINT, // escalate to a full refresh
    KEEP_LARGEST, // keep the single largest candidate from before the filter
};

/**
 * Tunables of the partial update planner. Plain struct, defaults from configuration.h.
 */
struct PlannerConfig {
    int32_t mergeDistancePx = EINK_DEFAULT_MERGE_DISTANCE_PX;
    int32_t minRegionPx = EINK_DEFAULT_MIN_REGION_PX;
    int32_t maxRegionsPerCycle = EINK_DEFAULT_MAX_REGIONS;
    int32_t regionPaddingPx = EINK_DEFAULT_PADDING_PX;
    int32_t byteAlignment = EINK_BYTE_ALIGNMENT;
    BitPolarity polarity = BitPolarity::INVERTED;
    uint8_t connectivity = 4;
    EmptyRegionPolicy emptyPolicy = EmptyRegionPolicy::FULL_REPAINT;
    uint32_t maxConsecutivePartials = EINK_LIMIT_PARTIALREFRESH; // 0 = never force a full refresh

    /**
     * Clamp every field to a legal value, logging a warning for each one changed.
     * @return true if nothing needed changing
     */
    bool sanitize();
};

const char *polarityName(BitPolarity p);
const char *emptyPolicyName(EmptyRegionPolicy p);

/// Parse "normal" / "inverted". Returns false and leaves out untouched for anything else.
bool parsePolarity(const char *s, BitPolarity &out);

/// Parse "full" / "largest". Returns false and leaves out untouched for anything else.
bool parseEmptyPolicy(const char *s, EmptyRegionPolicy &out);

} // namespace graphics
