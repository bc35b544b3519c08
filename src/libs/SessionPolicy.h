#ifndef SESSION_POLICY_H
#define SESSION_POLICY_H

#include <atomic>
#include <cstdint>

#include "StatusReading.h"

enum CycleOutcome {
  CYCLE_NOT_RUN = 0,
  CYCLE_OK,
  CYCLE_DISABLED,
  CYCLE_DEVICE_UNREACHABLE,
  CYCLE_TRANSPORT_FAILURE,
  CYCLE_RESPONSE_TIMEOUT,
  CYCLE_DECODE_ERROR,
};

const char* cycleOutcomeName(CycleOutcome outcome);

/**
 * @brief Miss counter and connection-enable flag for one session
 *
 * The counter is diagnostic only: it never disables the connection by
 * itself. Disabling is always an explicit setConnectionEnabled(false).
 * Counters are atomic so diagnostics can be read while a cycle is running.
 */
class SessionPolicy {
public:
  explicit SessionPolicy(uint32_t maxMissedUpdates);

  bool connectionEnabled() const { return enabled; }
  void setConnectionEnabled(bool value);

  // Fold a cycle outcome into the counters and return what to report
  StatusReading resolve(CycleOutcome outcome, const StatusReading& decoded);

  void resetMisses() { misses = 0; }

  uint32_t missedUpdates() const { return misses; }
  uint32_t maxMissedUpdates() const { return threshold; }
  bool missThresholdReached() const { return misses >= threshold; }

private:
  const uint32_t threshold;
  std::atomic<uint32_t> misses;
  std::atomic<bool> enabled;
};

#endif // SESSION_POLICY_H
