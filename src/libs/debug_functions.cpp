#include "debug_functions.h"

#include <cstdio>

// Global log sink - set in main.cpp, null means silent
LogPrintFunc logPrintFunc = nullptr;

void logPrintf(int level, const char* format, ...) {
  if (!logPrintFunc) return;
  va_list args;
  va_start(args, format);
  logPrintFunc(level, format, args);
  va_end(args);
}

std::string hexDump(const uint8_t* data, size_t length) {
  std::string out;
  if (!data) return out;
  out.reserve(length * 3);
  char byteText[4];
  for (size_t i = 0; i < length; i++) {
    snprintf(byteText, sizeof(byteText), i == 0 ? "%02X" : " %02X", data[i]);
    out += byteText;
  }
  return out;
}

void logPrintPlaceholder(int level, const char* format, va_list args) {
  // Do nothing
  (void)level;
  (void)format;
  (void)args;
}

const char* logLevelName(int level) {
  switch (level) {
    case LITIME_LOG_LEVEL_ERROR: return "E";
    case LITIME_LOG_LEVEL_WARN:  return "W";
    case LITIME_LOG_LEVEL_INFO:  return "I";
    case LITIME_LOG_LEVEL_DEBUG: return "D";
    default:                     return "?";
  }
}
