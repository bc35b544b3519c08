#include "NotificationReassembler.h"

#include <chrono>

#include "debug_functions.h"

NotificationReassembler::NotificationReassembler(size_t frameLength) : frameLength(frameLength) {
  buffer.reserve(frameLength * 2);
}

/**
 * Handle one notification packet from the BMS
 *
 * The marker check deliberately mirrors what the device does: every real
 * status response starts with 0x65 at offset 2. A continuation fragment that
 * happens to carry 0x65 there would restart the frame.
 *
 * @param data   Packet bytes, owned by the transport
 * @param length Packet length
 */
void NotificationReassembler::handleNotification(const uint8_t* data, size_t length) {
  if (data == nullptr || length == 0) return;

  std::lock_guard<std::mutex> guard(lock);

  bool isStart = length > LITIME_RESPONSE_MARKER_OFFSET &&
                 data[LITIME_RESPONSE_MARKER_OFFSET] == LITIME_RESPONSE_MARKER_VALUE;

  if (isStart) {
    if (receivedStart && !buffer.empty()) {
      LITIME_LOG_DEBUG("Response restarted, dropping %u buffered bytes\n", (unsigned)buffer.size());
    }
    buffer.assign(data, data + length);
    receivedStart = true;
  } else if (receivedStart) {
    buffer.insert(buffer.end(), data, data + length);
  } else {
    discarded++;
    LITIME_LOG_DEBUG("Ignoring non-status notification (%u bytes)\n", (unsigned)length);
    return;
  }

  if (buffer.size() >= frameLength) {
    LITIME_LOG_DEBUG("Complete response: %u bytes\n", (unsigned)buffer.size());
    completed.swap(buffer);
    buffer.clear();
    receivedStart = false;
    frameAvailable = true;
    frameReady.notify_all();
  } else {
    LITIME_LOG_DEBUG("Buffered %u/%u bytes\n", (unsigned)buffer.size(), (unsigned)frameLength);
  }
}

void NotificationReassembler::reset() {
  std::lock_guard<std::mutex> guard(lock);
  buffer.clear();
  receivedStart = false;
  completed.clear();
  frameAvailable = false;
}

bool NotificationReassembler::waitForFrame(uint32_t timeoutMs, std::vector<uint8_t>& frame) {
  std::unique_lock<std::mutex> guard(lock);
  if (!frameReady.wait_for(guard, std::chrono::milliseconds(timeoutMs), [this] { return frameAvailable; })) {
    return false;
  }
  frame.swap(completed);
  completed.clear();
  frameAvailable = false;
  return true;
}

bool NotificationReassembler::accumulating() const {
  std::lock_guard<std::mutex> guard(lock);
  return receivedStart;
}

size_t NotificationReassembler::bufferedBytes() const {
  std::lock_guard<std::mutex> guard(lock);
  return buffer.size();
}

uint32_t NotificationReassembler::discardedPackets() const {
  std::lock_guard<std::mutex> guard(lock);
  return discarded;
}
