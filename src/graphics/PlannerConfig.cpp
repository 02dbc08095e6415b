#include "PlannerConfig.h"
#include <strings.h>

namespace graphics
{

bool PlannerConfig::sanitize()
{
    bool clean = true;

    if (mergeDistancePx < 0) {
        LOG_WARN("MergeDistance %d < 0, using 0", mergeDistancePx);
        mergeDistancePx = 0;
        clean = false;
    }
    if (minRegionPx < 0) {
        LOG_WARN("MinRegionSize %d < 0, using 0", minRegionPx);
        minRegionPx = 0;
        clean = false;
    }
    if (maxRegionsPerCycle < 1) {
        LOG_WARN("MaxRegions %d < 1, using 1", maxRegionsPerCycle);
        maxRegionsPerCycle = 1;
        clean = false;
    }
    if (regionPaddingPx < 0) {
        LOG_WARN("Padding %d < 0, using 0", regionPaddingPx);
        regionPaddingPx = 0;
        clean = false;
    }
    if (regionPaddingPx > EINK_MAX_PANEL_EDGE) {
        LOG_WARN("Padding %d too large, using %d", regionPaddingPx, EINK_MAX_PANEL_EDGE);
        regionPaddingPx = EINK_MAX_PANEL_EDGE;
        clean = false;
    }
    // Panel columns are addressed a byte at a time, nothing else is supported
    if (byteAlignment != EINK_BYTE_ALIGNMENT) {
        LOG_WARN("ByteAlignment %d not supported, using %d", byteAlignment, EINK_BYTE_ALIGNMENT);
        byteAlignment = EINK_BYTE_ALIGNMENT;
        clean = false;
    }
    if (connectivity != 4 && connectivity != 8) {
        LOG_WARN("Connectivity %u not supported, using 4", connectivity);
        connectivity = 4;
        clean = false;
    }

    return clean;
}

const char *polarityName(BitPolarity p)
{
    switch (p) {
    case BitPolarity::NORMAL:
        return "normal";
    case BitPolarity::INVERTED:
        return "inverted";
    }
    return "?";
}

const char *emptyPolicyName(EmptyRegionPolicy p)
{
    switch (p) {
    case EmptyRegionPolicy::FULL_REPAINT:
        return "full";
    case EmptyRegionPolicy::KEEP_LARGEST:
        return "largest";
    }
    return "?";
}

bool parsePolarity(const char *s, BitPolarity &out)
{
    if (!s)
        return false;
    if (strcasecmp(s, "normal") == 0) {
        out = BitPolarity::NORMAL;
        return true;
    }
    if (strcasecmp(s, "inverted") == 0) {
        out = BitPolarity::INVERTED;
        return true;
    }
    return false;
}

bool parseEmptyPolicy(const char *s, EmptyRegionPolicy &out)
{
    if (!s)
        return false;
    if (strcasecmp(s, "full") == 0) {
        out = EmptyRegionPolicy::FULL_REPAINT;
        return true;
    }
    if (strcasecmp(s, "largest") == 0) {
        out = EmptyRegionPolicy::KEEP_LARGEST;
        return true;
    }
    return false;
}

} // namespace graphics
