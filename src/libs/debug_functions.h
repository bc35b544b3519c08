#ifndef DEBUG_FUNCTIONS_H
#define DEBUG_FUNCTIONS_H

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <string>

// Log levels
#define LITIME_LOG_LEVEL_NONE  0
#define LITIME_LOG_LEVEL_ERROR 1
#define LITIME_LOG_LEVEL_WARN  2
#define LITIME_LOG_LEVEL_INFO  3
#define LITIME_LOG_LEVEL_DEBUG 4

// Default log level (can be overridden by build flags)
#ifndef LITIME_LOG_LEVEL
#define LITIME_LOG_LEVEL LITIME_LOG_LEVEL_INFO
#endif

// Log output function type
typedef void (*LogPrintFunc)(int level, const char* format, va_list args);

// External log sink that will be set by main.cpp (or by a test)
extern LogPrintFunc logPrintFunc;

void logPrintf(int level, const char* format, ...);

// Returns "AA BB CC ..." for the given bytes
std::string hexDump(const uint8_t* data, size_t length);

// Placeholder sink that does nothing (for disabling output at runtime)
void logPrintPlaceholder(int level, const char* format, va_list args);

const char* logLevelName(int level);

// Logging macros (compile out completely below LITIME_LOG_LEVEL)
#if LITIME_LOG_LEVEL >= LITIME_LOG_LEVEL_ERROR
#define LITIME_LOG_ERROR(...) logPrintf(LITIME_LOG_LEVEL_ERROR, __VA_ARGS__)
#else
#define LITIME_LOG_ERROR(...) ((void)0)
#endif

#if LITIME_LOG_LEVEL >= LITIME_LOG_LEVEL_WARN
#define LITIME_LOG_WARN(...) logPrintf(LITIME_LOG_LEVEL_WARN, __VA_ARGS__)
#else
#define LITIME_LOG_WARN(...) ((void)0)
#endif

#if LITIME_LOG_LEVEL >= LITIME_LOG_LEVEL_INFO
#define LITIME_LOG_INFO(...) logPrintf(LITIME_LOG_LEVEL_INFO, __VA_ARGS__)
#else
#define LITIME_LOG_INFO(...) ((void)0)
#endif

#if LITIME_LOG_LEVEL >= LITIME_LOG_LEVEL_DEBUG
#define LITIME_LOG_DEBUG(...) logPrintf(LITIME_LOG_LEVEL_DEBUG, __VA_ARGS__)
#else
#define LITIME_LOG_DEBUG(...) ((void)0)
#endif

#endif // DEBUG_FUNCTIONS_H
