#include "RedirectablePrint.h"
#include "configuration.h"
#include <cctype>
#include <chrono>
#include <cstring>
#include <memory>
#include <time.h>

namespace
{

const auto bootTime = std::chrono::steady_clock::now();

thread_local const char *currentThreadName = nullptr;

uint32_t uptimeSecs()
{
    return (uint32_t)std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - bootTime).count();
}

} // namespace

void RedirectablePrint::setDestination(FILE *_dest)
{
    if (_dest)
        dest = _dest;
}

void RedirectablePrint::setThreadName(const char *name)
{
    currentThreadName = name;
}

bool RedirectablePrint::setTraceFile(const std::string &filename)
{
    std::lock_guard<std::mutex> guard(inDebugPrint);
    if (traceFile.is_open())
        traceFile.close();
    if (filename.empty())
        return true;

    traceFile.open(filename, std::ios::out | std::ios::app);
    return traceFile.is_open();
}

bool RedirectablePrint::isLevelEnabled(const char *logLevel) const
{
    if (strcmp(logLevel, INKDELTA_LOG_LEVEL_TRACE) == 0)
        return logOutputLevel >= level_trace;
    if (strcmp(logLevel, INKDELTA_LOG_LEVEL_DEBUG) == 0)
        return logOutputLevel >= level_debug;
    if (strcmp(logLevel, INKDELTA_LOG_LEVEL_INFO) == 0)
        return logOutputLevel >= level_info;
    if (strcmp(logLevel, INKDELTA_LOG_LEVEL_WARN) == 0)
        return logOutputLevel >= level_warn;
    return true; // ERROR and CRIT always go out
}

size_t RedirectablePrint::vprintf(const char *logLevel, const char *format, va_list arg)
{
    va_list copy;
    static char printBuf[512];

    va_copy(copy, arg);
    int n = vsnprintf(printBuf, sizeof(printBuf), format, copy);
    va_end(copy);
    if (n < 0)
        return 0;

    // If the resulting string is longer than sizeof(printBuf)-1 characters, the remaining characters are still counted for the
    // return value
    size_t len = (size_t)n;
    if (len > sizeof(printBuf) - 1) {
        len = sizeof(printBuf) - 1;
        printBuf[sizeof(printBuf) - 2] = '\n';
    }
    for (size_t f = 0; f < len; f++) {
        if (!std::isprint(static_cast<unsigned char>(printBuf[f])) && printBuf[f] != '\n')
            printBuf[f] = '#';
    }
    if (color && logLevel != nullptr) {
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_DEBUG) == 0)
            fputs("\u001b[34m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_INFO) == 0)
            fputs("\u001b[32m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_WARN) == 0)
            fputs("\u001b[33m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_ERROR) == 0)
            fputs("\u001b[31m", dest);
    }
    len = fwrite(printBuf, 1, len, dest);
    if (color && logLevel != nullptr) {
        fputs("\u001b[0m", dest);
    }
    return len;
}

void RedirectablePrint::log_to_console(const char *logLevel, const char *format, va_list arg)
{
    // include the header
    if (color) {
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_DEBUG) == 0)
            fputs("\u001b[34m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_INFO) == 0)
            fputs("\u001b[32m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_WARN) == 0)
            fputs("\u001b[33m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_ERROR) == 0 || strcmp(logLevel, INKDELTA_LOG_LEVEL_CRIT) == 0)
            fputs("\u001b[31m", dest);
        if (strcmp(logLevel, INKDELTA_LOG_LEVEL_TRACE) == 0)
            fputs("\u001b[35m", dest);
    }

    fprintf(dest, "%s ", logLevel);
    if (color) {
        fputs("\u001b[0m", dest);
    }

    time_t now = time(nullptr);
    struct tm local;
    if (now > 0 && localtime_r(&now, &local) != nullptr)
        fprintf(dest, "| %02d:%02d:%02d %u ", local.tm_hour, local.tm_min, local.tm_sec, uptimeSecs());
    else
        fprintf(dest, "| ??:??:?? %u ", uptimeSecs());

    if (currentThreadName)
        fprintf(dest, "[%s] ", currentThreadName);

    vprintf(logLevel, format, arg);
}

void RedirectablePrint::log_to_trace_file(const char *format, va_list arg)
{
    if (!traceFile.is_open())
        return;

    char line[512];
    int n = vsnprintf(line, sizeof(line), format, arg);
    if (n < 0)
        return;

    // format already carries the newline
    traceFile << line;
    traceFile.flush();
}

void RedirectablePrint::log(const char *logLevel, const char *format, ...)
{
    bool isTrace = strcmp(logLevel, INKDELTA_LOG_LEVEL_TRACE) == 0;
    bool toConsole = isLevelEnabled(logLevel);
    if (!toConsole && !isTrace)
        return;

    // append \n to format
    size_t len = strlen(format);
    std::unique_ptr<char[]> newFormat(new char[len + 2]);
    memcpy(newFormat.get(), format, len);
    newFormat[len] = '\n';
    newFormat[len + 1] = '\0';

    std::lock_guard<std::mutex> guard(inDebugPrint);

    va_list arg;
    if (isTrace) {
        va_start(arg, format);
        log_to_trace_file(newFormat.get(), arg);
        va_end(arg);
    }
    if (toConsole) {
        va_start(arg, format);
        log_to_console(logLevel, newFormat.get(), arg);
        va_end(arg);
        fflush(dest);
    }
}

void RedirectablePrint::hexDump(const char *logLevel, const uint8_t *buf, uint16_t len)
{
    const char alphabet[17] = "0123456789abcdef";
    log(logLevel, "    +------------------------------------------------+ +----------------+");
    log(logLevel, "    |.0 .1 .2 .3 .4 .5 .6 .7 .8 .9 .a .b .c .d .e .f | |      ASCII     |");
    for (uint16_t i = 0; i < len; i += 16) {
        if (i % 128 == 0)
            log(logLevel, "    +------------------------------------------------+ +----------------+");
        char s[] = "|                                                | |                |";
        uint8_t ix = 1, iy = 52;
        for (uint8_t j = 0; j < 16; j++) {
            if (i + j < len) {
                uint8_t c = buf[i + j];
                s[ix++] = alphabet[(c >> 4) & 0x0F];
                s[ix++] = alphabet[c & 0x0F];
                ix++;
                if (c > 31 && c < 128)
                    s[iy++] = c;
                else
                    s[iy++] = '.';
            }
        }
        log(logLevel, "%03x. %s", i / 16, s);
    }
    log(logLevel, "    +------------------------------------------------+ +----------------+");
}
