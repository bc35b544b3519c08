#include "LiTimeConfig.h"

#include <algorithm>
#include <cctype>

#include "debug_functions.h"

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return text;
}

}  // namespace

LiTimeConfig sanitizeConfig(const LiTimeConfig& config) {
  LiTimeConfig clean = config;

  if (clean.name.empty()) clean.name = clean.address;

  if (clean.responseTimeoutMs == 0) {
    LITIME_LOG_WARN("Response timeout 0 ms is invalid, using %u ms\n", LITIME_DEFAULT_RESPONSE_TIMEOUT_MS);
    clean.responseTimeoutMs = LITIME_DEFAULT_RESPONSE_TIMEOUT_MS;
  }
  if (clean.connectAttempts == 0) {
    LITIME_LOG_WARN("Connect attempts 0 is invalid, using %u\n", LITIME_DEFAULT_CONNECT_ATTEMPTS);
    clean.connectAttempts = LITIME_DEFAULT_CONNECT_ATTEMPTS;
  }
  if (clean.updateIntervalMs == 0) {
    LITIME_LOG_WARN("Update interval 0 ms is invalid, using %u ms\n", LITIME_DEFAULT_UPDATE_INTERVAL_MS);
    clean.updateIntervalMs = LITIME_DEFAULT_UPDATE_INTERVAL_MS;
  }

  clean.serviceUuid = lowercase(clean.serviceUuid);
  clean.notifyCharUuid = lowercase(clean.notifyCharUuid);
  clean.writeCharUuid = lowercase(clean.writeCharUuid);
  return clean;
}
