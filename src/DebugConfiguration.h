#pragma once

// -----------------------------------------------------------------------------
// DEBUG
// -----------------------------------------------------------------------------

#define INKDELTA_LOG_LEVEL_DEBUG "DEBUG"
#define INKDELTA_LOG_LEVEL_INFO "INFO "
#define INKDELTA_LOG_LEVEL_WARN "WARN "
#define INKDELTA_LOG_LEVEL_ERROR "ERROR"
#define INKDELTA_LOG_LEVEL_CRIT "CRIT "
#define INKDELTA_LOG_LEVEL_TRACE "TRACE"

#include "Console.h"

#define DEBUG_PORT (*console) // Debug console

// Messages logged before consoleInit() are dropped
#if !defined(DEBUG_MUTE)
#define LOG_DEBUG(...)                                                                                                           \
    do {                                                                                                                         \
        if (console)                                                                                                             \
            DEBUG_PORT.log(INKDELTA_LOG_LEVEL_DEBUG, __VA_ARGS__);                                                               \
    } while (0)
#define LOG_INFO(...)                                                                                                            \
    do {                                                                                                                         \
        if (console)                                                                                                             \
            DEBUG_PORT.log(INKDELTA_LOG_LEVEL_INFO, __VA_ARGS__);                                                                \
    } while (0)
#define LOG_WARN(...)                                                                                                            \
    do {                                                                                                                         \
        if (console)                                                                                                             \
            DEBUG_PORT.log(INKDELTA_LOG_LEVEL_WARN, __VA_ARGS__);                                                                \
    } while (0)
#define LOG_ERROR(...)                                                                                                           \
    do {                                                                                                                         \
        if (console)                                                                                                             \
            DEBUG_PORT.log(INKDELTA_LOG_LEVEL_ERROR, __VA_ARGS__);                                                               \
    } while (0)
#define LOG_CRIT(...)                                                                                                            \
    do {                                                                                                                         \
        if (console)                                                                                                             \
            DEBUG_PORT.log(INKDELTA_LOG_LEVEL_CRIT, __VA_ARGS__);                                                                \
    } while (0)
#define LOG_TRACE(...)                                                                                                           \
    do {                                                                                                                         \
        if (console)                                                                                                             \
            DEBUG_PORT.log(INKDELTA_LOG_LEVEL_TRACE, __VA_ARGS__);                                                               \
    } while (0)
#else
#define LOG_DEBUG(...)
#define LOG_INFO(...)
#define LOG_WARN(...)
#define LOG_ERROR(...)
#define LOG_CRIT(...)
#define LOG_TRACE(...)
#endif
