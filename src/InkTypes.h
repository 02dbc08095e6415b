#pragma once

// low level types

#include <stdint.h>

typedef int ErrorCode;

#define ERRNO_OK 0
#define ERRNO_UNKNOWN 32
#define ERRNO_DISABLED 34      // the command was not sent, the cycle was cancelled or the sink is off
#define ERRNO_BAD_REGION 40    // region is empty, not byte aligned or outside the panel
#define ERRNO_BUFFER_SIZE 41   // packed buffer length does not match the window
#define ERRNO_SINK_REJECTED 42 // the panel driver refused the command
#define ERRNO_STALE_PLAN 43    // the plan was computed against a retained frame that has since been replaced

/// Human readable name for an ErrorCode, for logs
const char *errnoName(ErrorCode err);
