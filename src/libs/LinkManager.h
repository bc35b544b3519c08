#ifndef LINK_MANAGER_H
#define LINK_MANAGER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "BleTransport.h"
#include "LiTimeConfig.h"
#include "NotificationReassembler.h"

/**
 * @brief Owns the single BLE link to one BMS
 *
 * A link is a transport connection plus the negotiated notify source and
 * write target. It exists only after a successful connect + negotiate and is
 * dropped on explicit disconnect or any failure while setting it up.
 * Not thread-safe by itself; the session engine serialises all calls.
 */
class LinkManager {
public:
  LinkManager(BleTransport& transport, const LiTimeConfig& config, NotificationReassembler& reassembler);
  ~LinkManager();

  LinkManager(const LinkManager&) = delete;
  LinkManager& operator=(const LinkManager&) = delete;

  // True if a usable link exists afterwards; never throws
  bool ensureConnected();

  // Throws BleTransportError if there is no link or the write fails
  void send(uint8_t opcode);

  // Idempotent, best-effort close
  void disconnect();

  bool isConnected() const;

  // Invoked after every fresh negotiation
  void setOnLinkEstablished(std::function<void()> callback) { onLinkEstablished = callback; }

  // Number of successful negotiations since construction
  uint32_t negotiationCount() const { return negotiations; }

  const GattCharacteristic* notifySource() const { return link ? &link->notifyChar : nullptr; }
  const GattCharacteristic* writeTarget() const { return link ? &link->writeChar : nullptr; }

private:
  struct Link {
    std::unique_ptr<BleConnection> connection;
    GattCharacteristic notifyChar;
    GattCharacteristic writeChar;
  };

  std::unique_ptr<BleConnection> connectWithRetry(const BleDevice& device);
  bool negotiate(BleConnection& connection, GattCharacteristic& notifyChar, GattCharacteristic& writeChar);
  void closeQuietly(BleConnection& connection);

  BleTransport& transport;
  const LiTimeConfig& config;
  NotificationReassembler& reassembler;

  std::unique_ptr<Link> link;
  std::function<void()> onLinkEstablished;
  uint32_t negotiations = 0;
};

#endif // LINK_MANAGER_H
