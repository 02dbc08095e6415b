#pragma once

// -----------------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------------

// If app version is not specified we assume we are not being invoked by the build script
#ifndef APP_VERSION
#define APP_VERSION 0.0.0-dev
#endif

// -----------------------------------------------------------------------------
// Configuration
// -----------------------------------------------------------------------------

/// Convert a preprocessor name into a quoted string
#define xstr(s) ystr(s)
#define ystr(s) #s

/// Convert a preprocessor name into a quoted string and if that string is empty use "unset"
#define optstr(s) (xstr(s)[0] ? xstr(s) : "unset")

// -----------------------------------------------------------------------------
// Panel
// -----------------------------------------------------------------------------

// 7.5" bistable panel, landscape
#ifndef EINK_PANEL_WIDTH
#define EINK_PANEL_WIDTH 800
#endif
#ifndef EINK_PANEL_HEIGHT
#define EINK_PANEL_HEIGHT 480
#endif

// Columns are addressed one byte (8 pixels) at a time in partial-update windows
#define EINK_BYTE_ALIGNMENT 8

// Largest panel edge we accept, region coordinates are int16_t
#define EINK_MAX_PANEL_EDGE 4096

// -----------------------------------------------------------------------------
// Partial update planner defaults
// -----------------------------------------------------------------------------

#ifndef EINK_DEFAULT_MERGE_DISTANCE_PX
#define EINK_DEFAULT_MERGE_DISTANCE_PX 32
#endif
#ifndef EINK_DEFAULT_MIN_REGION_PX
#define EINK_DEFAULT_MIN_REGION_PX 16
#endif
#ifndef EINK_DEFAULT_MAX_REGIONS
#define EINK_DEFAULT_MAX_REGIONS 10
#endif
#ifndef EINK_DEFAULT_PADDING_PX
#define EINK_DEFAULT_PADDING_PX 8
#endif

// Consecutive partial cycles before a full refresh is forced to clear ghosting. 0 disables the limit
#ifndef EINK_LIMIT_PARTIALREFRESH
#define EINK_LIMIT_PARTIALREFRESH 0
#endif

// Pending frames kept by the updater before the oldest is dropped
#ifndef EINK_UPDATE_QUEUE_DEPTH
#define EINK_UPDATE_QUEUE_DEPTH 4
#endif

#include "DebugConfiguration.h"
