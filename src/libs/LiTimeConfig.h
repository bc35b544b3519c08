#ifndef LITIME_CONFIG_H
#define LITIME_CONFIG_H

#include <cstdint>
#include <string>

#include "LiTimeProtocol.h"

#define LITIME_DEFAULT_UPDATE_INTERVAL_MS    30000u
#define LITIME_DEFAULT_RESPONSE_TIMEOUT_MS   10000u
#define LITIME_DEFAULT_CONNECT_ATTEMPTS      3u
#define LITIME_DEFAULT_CONNECT_RETRY_DELAY_MS 1000u
#define LITIME_DEFAULT_MAX_MISSED_UPDATES    3u

/** Runtime configuration for one BMS session. */
struct LiTimeConfig {
  std::string address;                                          /**< BLE address, "xx:xx:xx:xx:xx:xx". */
  std::string name;                                             /**< Display name; defaults to the address. */
  uint32_t updateIntervalMs = LITIME_DEFAULT_UPDATE_INTERVAL_MS;    /**< Poll period used by the caller. */
  uint32_t responseTimeoutMs = LITIME_DEFAULT_RESPONSE_TIMEOUT_MS;  /**< Wait for a status response. */
  uint32_t connectAttempts = LITIME_DEFAULT_CONNECT_ATTEMPTS;       /**< Transport connects per ensureConnected(). */
  uint32_t connectRetryDelayMs = LITIME_DEFAULT_CONNECT_RETRY_DELAY_MS; /**< Base delay, grows per attempt. */
  uint32_t maxMissedUpdates = LITIME_DEFAULT_MAX_MISSED_UPDATES;    /**< Diagnostic threshold, never disables. */
  std::string serviceUuid = LITIME_SERVICE_UUID;
  std::string notifyCharUuid = LITIME_NOTIFY_CHAR_UUID;
  std::string writeCharUuid = LITIME_WRITE_CHAR_UUID;
};

// Copy of config with out-of-range values replaced by defaults
LiTimeConfig sanitizeConfig(const LiTimeConfig& config);

#endif // LITIME_CONFIG_H
