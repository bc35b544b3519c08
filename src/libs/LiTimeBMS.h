#ifndef LITIME_BMS_H
#define LITIME_BMS_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "BleTransport.h"
#include "LiTimeConfig.h"
#include "LinkManager.h"
#include "NotificationReassembler.h"
#include "SessionPolicy.h"
#include "StatusReading.h"

enum RelaySwitch {
  RELAY_CHARGE,
  RELAY_DISCHARGE,
};

// Callback invoked with every reading the session produces
typedef std::function<void(const StatusReading& reading)> ReadingListener;

/**
 * @brief Polling session with one LiTime BMS over BLE
 *
 * poll() runs one query/response transaction and always returns a reading:
 * live on success, the fixed offline reading otherwise. Commands may be
 * called from other tasks between cycles; all link work is serialised on one
 * session lock so there is never more than one transaction or link in flight.
 * None of the public operations throw.
 */
class LiTimeBMS {
public:
  LiTimeBMS(BleTransport& transport, const LiTimeConfig& config);
  ~LiTimeBMS();

  LiTimeBMS(const LiTimeBMS&) = delete;
  LiTimeBMS& operator=(const LiTimeBMS&) = delete;

  StatusReading poll();
  void setRelayState(RelaySwitch which, bool enabled);
  void setConnectionEnabled(bool enabled);
  void shutdown();

  void setReadingListener(ReadingListener listener);
  StatusReading lastReading() const;

  const std::string& address() const { return config.address; }
  const std::string& deviceName() const { return config.name; }
  const LiTimeConfig& settings() const { return config; }
  bool connectionEnabled() const { return policy.connectionEnabled(); }
  uint32_t missedUpdates() const { return policy.missedUpdates(); }
  CycleOutcome lastOutcome() const;

  // Diagnostics and tests
  LinkManager& linkManager() { return link; }

private:
  StatusReading runCycle();
  CycleOutcome transact(StatusReading& decoded);
  void publish(const StatusReading& reading, CycleOutcome outcome);

  const LiTimeConfig config;
  NotificationReassembler reassembler;
  LinkManager link;
  SessionPolicy policy;

  std::mutex sessionLock;

  mutable std::mutex stateLock;
  StatusReading published;
  CycleOutcome outcome = CYCLE_NOT_RUN;
  ReadingListener listener;
};

#endif // LITIME_BMS_H
