#pragma once

#include <fstream>
#include <mutex>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string>

enum log_output_level { level_error, level_warn, level_info, level_debug, level_trace };

/**
 * A log printer that can be switched to squirt its bytes to a different stream.
 * Tests use this to move debug output away from stdout, the daemon to keep stdout for its own reports.
 */
class RedirectablePrint
{
    FILE *dest;

    log_output_level logOutputLevel = level_info;

    bool color = true;

    std::ofstream traceFile;

    /// Serializes whole log lines between threads
    std::mutex inDebugPrint;

  public:
    explicit RedirectablePrint(FILE *_dest) : dest(_dest) {}
    virtual ~RedirectablePrint() {}

    /**
     * Set a new destination
     */
    void setDestination(FILE *_dest);

    void setLogLevel(log_output_level level) { logOutputLevel = level; }
    log_output_level getLogLevel() const { return logOutputLevel; }

    // ANSI colour per level, disabled for ASCII logs
    void setColor(bool enabled) { color = enabled; }

    /**
     * Send TRACE lines to a file as well, whatever the console level is. An empty name closes the file.
     * @return false if the file could not be opened
     */
    bool setTraceFile(const std::string &filename);

    /**
     * Log a single line at the given level. A newline is appended to the format.
     */
    void log(const char *logLevel, const char *format, ...) __attribute__((format(printf, 3, 4)));

    void hexDump(const char *logLevel, const uint8_t *buf, uint16_t len);

    /// Name shown between brackets on lines logged from the calling thread
    static void setThreadName(const char *name);

  protected:
    /// like printf but va_list based, callers hold inDebugPrint
    size_t vprintf(const char *logLevel, const char *format, va_list arg);

    /// Returns true if messages at logLevel pass the current threshold
    bool isLevelEnabled(const char *logLevel) const;

    virtual void log_to_console(const char *logLevel, const char *format, va_list arg);

    void log_to_trace_file(const char *format, va_list arg);
};
