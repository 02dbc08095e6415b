#include "InkTypes.h"

const char *errnoName(ErrorCode err)
{
    switch (err) {
    case ERRNO_OK:
        return "OK";
    case ERRNO_DISABLED:
        return "DISABLED";
    case ERRNO_BAD_REGION:
        return "BAD_REGION";
    case ERRNO_BUFFER_SIZE:
        return "BUFFER_SIZE";
    case ERRNO_SINK_REJECTED:
        return "SINK_REJECTED";
    case ERRNO_STALE_PLAN:
        return "STALE_PLAN";
    default:
        return "UNKNOWN";
    }
}
