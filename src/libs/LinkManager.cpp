/**
 * @file LinkManager.cpp
 * @brief BLE connection lifecycle for a LiTime BMS
 *
 * Handles device resolution, connection with bounded retries,
 * characteristic negotiation (FFE1 notify, FFE2 write with FFE1 fallback),
 * notification subscription and teardown.
 */

#include "LinkManager.h"

#include <chrono>
#include <system_error>
#include <thread>

#include "FrameCodec.h"
#include "debug_functions.h"

LinkManager::LinkManager(BleTransport& transport, const LiTimeConfig& config, NotificationReassembler& reassembler)
    : transport(transport), config(config), reassembler(reassembler) {}

LinkManager::~LinkManager() {
  disconnect();
}

bool LinkManager::isConnected() const {
  return link && link->connection && link->connection->isConnected();
}

/**
 * @brief Make sure a negotiated link exists
 *
 * Reuses the current link when the transport still reports it connected.
 * Otherwise resolves the device, connects (up to config.connectAttempts
 * times), negotiates characteristics and subscribes to notifications.
 * Any transport failure is logged as a warning and reported as false, with
 * no connection left open.
 *
 * @return true if a usable link exists on return
 */
bool LinkManager::ensureConnected() {
  if (isConnected()) return true;

  if (link) {
    LITIME_LOG_INFO("Link to %s dropped, reconnecting\n", config.address.c_str());
    disconnect();
  }

  std::unique_ptr<BleConnection> connection;
  try {
    std::unique_ptr<BleDevice> device = transport.resolveDevice(config.address);
    if (!device) {
      LITIME_LOG_DEBUG("Device %s not available\n", config.address.c_str());
      return false;
    }

    connection = connectWithRetry(*device);
    if (!connection) return false;

    GattCharacteristic notifyChar, writeChar;
    if (!negotiate(*connection, notifyChar, writeChar)) {
      closeQuietly(*connection);
      return false;
    }

    NotificationReassembler* target = &reassembler;
    connection->subscribe(notifyChar, [target](const uint8_t* data, size_t length) {
      target->handleNotification(data, length);
    });
    LITIME_LOG_INFO("Subscribed to notifications on %s\n", notifyChar.uuid.c_str());
    LITIME_LOG_INFO("Using write characteristic %s\n", writeChar.uuid.c_str());

    link.reset(new Link());
    link->connection = std::move(connection);
    link->notifyChar = notifyChar;
    link->writeChar = writeChar;
  } catch (const BleTransportError& err) {
    LITIME_LOG_WARN("Failed to connect to %s: %s\n", config.address.c_str(), err.what());
    if (connection) closeQuietly(*connection);
    link.reset();
    return false;
  } catch (const std::system_error& err) {
    LITIME_LOG_WARN("I/O error connecting to %s: %s\n", config.address.c_str(), err.what());
    if (connection) closeQuietly(*connection);
    link.reset();
    return false;
  }

  negotiations++;
  LITIME_LOG_INFO("Connected to LiTime BMS %s\n", config.address.c_str());
  if (onLinkEstablished) onLinkEstablished();
  return true;
}

std::unique_ptr<BleConnection> LinkManager::connectWithRetry(const BleDevice& device) {
  const uint32_t maxAttempts = config.connectAttempts;

  for (uint32_t attempt = 1; attempt <= maxAttempts; attempt++) {
    LITIME_LOG_DEBUG("Connection attempt %u/%u to %s...\n", attempt, maxAttempts, config.address.c_str());
    try {
      std::unique_ptr<BleConnection> connection = transport.connect(device);
      if (connection) return connection;
      LITIME_LOG_DEBUG("Connection attempt %u returned no link\n", attempt);
    } catch (const BleTransportError& err) {
      if (attempt == maxAttempts) throw;
      LITIME_LOG_DEBUG("Connection attempt %u failed for %s: %s\n", attempt, config.address.c_str(), err.what());
    }

    if (attempt < maxAttempts && config.connectRetryDelayMs > 0) {
      // Progressive delay: base, 2x base, ...
      std::this_thread::sleep_for(std::chrono::milliseconds((uint64_t)config.connectRetryDelayMs * attempt));
    }
  }

  LITIME_LOG_WARN("Failed to connect to %s after %u attempts\n", config.address.c_str(), maxAttempts);
  return nullptr;
}

/**
 * Pick the notify source and write target from the discovered GATT table
 *
 * Only characteristics of the configured service are considered. The
 * configured write characteristic wins over a writable notify characteristic
 * regardless of discovery order.
 */
bool LinkManager::negotiate(BleConnection& connection, GattCharacteristic& notifyChar, GattCharacteristic& writeChar) {
  bool haveNotify = false;
  bool haveWrite = false;
  bool writeIsPreferred = false;

  for (const GattCharacteristic& chr : connection.discoverServices()) {
    LITIME_LOG_DEBUG("  Char: %s/%s properties=0x%02X\n", chr.serviceUuid.c_str(), chr.uuid.c_str(), chr.properties);
    if (chr.serviceUuid != config.serviceUuid) continue;

    if (chr.canNotify() && chr.uuid == config.notifyCharUuid) {
      notifyChar = chr;
      haveNotify = true;
    }
    if (chr.canWrite()) {
      if (chr.uuid == config.writeCharUuid) {
        writeChar = chr;
        haveWrite = true;
        writeIsPreferred = true;
      } else if (chr.uuid == config.notifyCharUuid && !writeIsPreferred) {
        writeChar = chr;
        haveWrite = true;
      }
    }
  }

  if (!haveNotify) {
    LITIME_LOG_ERROR("Notify characteristic %s not found on %s\n", config.notifyCharUuid.c_str(), config.address.c_str());
    return false;
  }
  if (!haveWrite) {
    LITIME_LOG_ERROR("No writable characteristic found on %s\n", config.address.c_str());
    return false;
  }
  return true;
}

/**
 * Write one command frame to the BMS
 * @param opcode Command byte, see LiTimeOpcode
 * @throws BleTransportError when there is no link or the write fails
 */
void LinkManager::send(uint8_t opcode) {
  if (!link || !link->connection) {
    throw BleTransportError("not connected to " + config.address);
  }

  CommandFrame frame = buildCommand(opcode);
  LITIME_LOG_DEBUG("Sending command 0x%02X to %s (%u bytes, hex=%s)\n", opcode, link->writeChar.uuid.c_str(),
                   (unsigned)frame.size(), hexDump(frame.data(), frame.size()).c_str());
  try {
    link->connection->writeCharacteristic(link->writeChar, frame.data(), frame.size(), false);
  } catch (const BleTransportError& err) {
    LITIME_LOG_WARN("Failed to send command 0x%02X to %s: %s\n", opcode, config.address.c_str(), err.what());
    throw;
  }
}

void LinkManager::disconnect() {
  if (!link) return;
  if (link->connection) closeQuietly(*link->connection);
  link.reset();
}

void LinkManager::closeQuietly(BleConnection& connection) {
  try {
    connection.disconnect();
  } catch (const BleTransportError& err) {
    LITIME_LOG_DEBUG("Ignoring error while disconnecting %s: %s\n", config.address.c_str(), err.what());
  }
}
