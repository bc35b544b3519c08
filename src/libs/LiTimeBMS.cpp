/**
 * @file LiTimeBMS.cpp
 * @brief LiTime BMS BLE session engine
 *
 * Implements the LiTimeBMS class: one polling cycle per poll() call (ensure
 * link, send status query, wait for the reassembled response, decode),
 * relay commands followed by a refresh, and the connection enable switch.
 *
 * Cycle outcomes:
 * - connection disabled        -> offline reading, no miss counted
 * - link unavailable           -> offline reading, miss
 * - query write failed         -> link torn down, offline reading, miss
 * - no response within timeout -> link kept, offline reading, miss
 * - malformed response         -> offline reading, miss
 * - decoded                    -> live reading, misses reset
 */

#include "LiTimeBMS.h"

#include <vector>

#include "FrameCodec.h"
#include "debug_functions.h"

//********************************************
// LiTimeBMS Class Implementation
//********************************************

/**
 * @brief Constructor for LiTimeBMS class
 *
 * Copies and sanitises the configuration. No BLE activity happens until the
 * first poll() or command.
 *
 * @param transport BLE transport, must outlive this instance
 * @param config Device address, name and timing parameters
 */
LiTimeBMS::LiTimeBMS(BleTransport& transport, const LiTimeConfig& config)
    : config(sanitizeConfig(config)),
      reassembler(LITIME_MIN_RESPONSE_LENGTH),
      link(transport, this->config, reassembler),
      policy(this->config.maxMissedUpdates),
      published(StatusReading::offline()) {
  SessionPolicy* sessionPolicy = &policy;
  link.setOnLinkEstablished([sessionPolicy]() { sessionPolicy->resetMisses(); });
}

LiTimeBMS::~LiTimeBMS() {
  shutdown();
}

/**
 * @brief Run one polling cycle
 *
 * Blocks for at most the connect attempts plus config.responseTimeoutMs.
 * The result is also stored as lastReading() and passed to the listener.
 *
 * @return Live reading on success, offline reading otherwise
 */
StatusReading LiTimeBMS::poll() {
  std::lock_guard<std::mutex> guard(sessionLock);
  return runCycle();
}

// Caller holds sessionLock
StatusReading LiTimeBMS::runCycle() {
  StatusReading decoded;
  CycleOutcome result = transact(decoded);
  StatusReading reading = policy.resolve(result, decoded);

  if (result != CYCLE_OK && result != CYCLE_DISABLED) {
    LITIME_LOG_DEBUG("Cycle for %s: %s (missed %u/%u)\n", config.address.c_str(), cycleOutcomeName(result),
                     policy.missedUpdates(), policy.maxMissedUpdates());
    if (policy.missThresholdReached()) {
      LITIME_LOG_WARN("%s has missed %u consecutive updates\n", config.address.c_str(), policy.missedUpdates());
    }
  }

  // Disabled while this cycle was waiting: the offline reading already went out
  if (!policy.connectionEnabled()) {
    reading = StatusReading::offline();
    result = CYCLE_DISABLED;
  }

  publish(reading, result);
  return reading;
}

CycleOutcome LiTimeBMS::transact(StatusReading& decoded) {
  if (!policy.connectionEnabled()) return CYCLE_DISABLED;

  if (!link.ensureConnected()) {
    LITIME_LOG_DEBUG("Cannot connect to %s\n", config.address.c_str());
    return CYCLE_DEVICE_UNREACHABLE;
  }

  // Stale fragments from an earlier cycle must not leak into this one
  reassembler.reset();

  try {
    link.send(CMD_QUERY_STATUS);
  } catch (const BleTransportError& err) {
    LITIME_LOG_WARN("Failed to send query to %s: %s\n", config.address.c_str(), err.what());
    link.disconnect();
    return CYCLE_TRANSPORT_FAILURE;
  }

  std::vector<uint8_t> frame;
  if (!reassembler.waitForFrame(config.responseTimeoutMs, frame)) {
    LITIME_LOG_WARN("Timeout waiting for response from %s (buffer has %u bytes)\n", config.address.c_str(),
                    (unsigned)reassembler.bufferedBytes());
    reassembler.reset();
    return CYCLE_RESPONSE_TIMEOUT;
  }

  DecodeResult result = decodeStatus(frame.data(), frame.size(), decoded);
  if (result != DECODE_OK) {
    LITIME_LOG_WARN("Failed to parse response from %s: %s (%u bytes)\n", config.address.c_str(),
                    decodeResultName(result), (unsigned)frame.size());
    return CYCLE_DECODE_ERROR;
  }

  LITIME_LOG_DEBUG("Status from %s: %.3f V, %.3f A, SOC %d%%\n", config.address.c_str(), *decoded.totalVoltage,
                   *decoded.current, *decoded.stateOfCharge);
  return CYCLE_OK;
}

/**
 * @brief Switch the charge or discharge MOSFET
 *
 * Connects first if needed; when the BMS is unreachable the request is
 * logged and dropped. On success an immediate refresh cycle runs so the new
 * state is published without waiting for the next poll.
 *
 * @param which RELAY_CHARGE or RELAY_DISCHARGE
 * @param enabled true to switch on
 */
void LiTimeBMS::setRelayState(RelaySwitch which, bool enabled) {
  const char* what = which == RELAY_CHARGE ? "charging" : "discharging";
  LITIME_LOG_INFO("Setting %s %s\n", what, enabled ? "ON" : "OFF");

  std::lock_guard<std::mutex> guard(sessionLock);

  if (!policy.connectionEnabled()) {
    LITIME_LOG_WARN("Cannot set %s on %s, connection disabled\n", what, config.address.c_str());
    return;
  }
  if (!link.ensureConnected()) {
    LITIME_LOG_WARN("Cannot set %s on %s, not connected\n", what, config.address.c_str());
    return;
  }

  uint8_t opcode;
  if (which == RELAY_CHARGE) {
    opcode = enabled ? CMD_CHARGE_ON : CMD_CHARGE_OFF;
  } else {
    opcode = enabled ? CMD_DISCHARGE_ON : CMD_DISCHARGE_OFF;
  }

  try {
    link.send(opcode);
  } catch (const BleTransportError& err) {
    LITIME_LOG_WARN("Failed to set %s on %s: %s\n", what, config.address.c_str(), err.what());
    link.disconnect();
    return;
  }

  runCycle();
}

/**
 * @brief Enable or disable the BLE connection
 *
 * Disabling publishes the offline reading straight away, even if a cycle is
 * still waiting for its response, then closes the link. Enabling clears the
 * miss counter and refreshes immediately.
 */
void LiTimeBMS::setConnectionEnabled(bool enabled) {
  policy.setConnectionEnabled(enabled);

  if (enabled) {
    LITIME_LOG_INFO("Connection enabled for %s, reconnecting\n", config.address.c_str());
    std::lock_guard<std::mutex> guard(sessionLock);
    runCycle();
    return;
  }

  LITIME_LOG_INFO("Connection disabled for %s, disconnecting\n", config.address.c_str());
  publish(StatusReading::offline(), CYCLE_DISABLED);

  std::lock_guard<std::mutex> guard(sessionLock);
  link.disconnect();
}

void LiTimeBMS::shutdown() {
  std::lock_guard<std::mutex> guard(sessionLock);
  link.disconnect();
}

void LiTimeBMS::setReadingListener(ReadingListener readingListener) {
  std::lock_guard<std::mutex> guard(stateLock);
  listener = readingListener;
}

StatusReading LiTimeBMS::lastReading() const {
  std::lock_guard<std::mutex> guard(stateLock);
  return published;
}

CycleOutcome LiTimeBMS::lastOutcome() const {
  std::lock_guard<std::mutex> guard(stateLock);
  return outcome;
}

void LiTimeBMS::publish(const StatusReading& reading, CycleOutcome result) {
  ReadingListener notify;
  {
    std::lock_guard<std::mutex> guard(stateLock);
    published = reading;
    outcome = result;
    notify = listener;
  }
  if (notify) notify(reading);
}
