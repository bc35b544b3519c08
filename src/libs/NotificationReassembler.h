#ifndef NOTIFICATION_REASSEMBLER_H
#define NOTIFICATION_REASSEMBLER_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "LiTimeProtocol.h"

/**
 * @brief Rebuilds status responses from BLE notification packets
 *
 * Idle:         no partial frame. A packet carrying the response marker at
 *               offset 2 starts accumulation; anything else is discarded.
 * Accumulating: packets are appended. A marker packet restarts the frame.
 *
 * Once the buffer reaches the frame length it is handed to waitForFrame()
 * and the state returns to Idle. Notifications may arrive on the BLE host
 * task at any time, so every entry point takes the internal lock.
 */
class NotificationReassembler {
public:
  explicit NotificationReassembler(size_t frameLength = LITIME_MIN_RESPONSE_LENGTH);

  // Transport push entry point
  void handleNotification(const uint8_t* data, size_t length);

  // Drop any partial or completed frame; called right before a query goes out
  void reset();

  // Block until a complete frame is available or timeoutMs elapses
  bool waitForFrame(uint32_t timeoutMs, std::vector<uint8_t>& frame);

  bool accumulating() const;
  size_t bufferedBytes() const;
  uint32_t discardedPackets() const;

private:
  const size_t frameLength;

  mutable std::mutex lock;
  std::condition_variable frameReady;

  std::vector<uint8_t> buffer;
  bool receivedStart = false;

  std::vector<uint8_t> completed;
  bool frameAvailable = false;

  uint32_t discarded = 0;
};

#endif // NOTIFICATION_REASSEMBLER_H
