#include "SessionPolicy.h"

const char* cycleOutcomeName(CycleOutcome outcome) {
  switch (outcome) {
    case CYCLE_NOT_RUN:            return "not run";
    case CYCLE_OK:                 return "ok";
    case CYCLE_DISABLED:           return "connection disabled";
    case CYCLE_DEVICE_UNREACHABLE: return "device unreachable";
    case CYCLE_TRANSPORT_FAILURE:  return "transport failure";
    case CYCLE_RESPONSE_TIMEOUT:   return "response timeout";
    case CYCLE_DECODE_ERROR:       return "decode error";
  }
  return "unknown";
}

SessionPolicy::SessionPolicy(uint32_t maxMissedUpdates)
    : threshold(maxMissedUpdates), misses(0), enabled(true) {}

void SessionPolicy::setConnectionEnabled(bool value) {
  enabled = value;
  if (value) misses = 0;
}

StatusReading SessionPolicy::resolve(CycleOutcome outcome, const StatusReading& decoded) {
  switch (outcome) {
    case CYCLE_OK:
      misses = 0;
      return decoded;
    case CYCLE_NOT_RUN:
    case CYCLE_DISABLED:
      // Not an attempt, so not a miss
      return StatusReading::offline();
    default:
      misses++;
      return StatusReading::offline();
  }
}
