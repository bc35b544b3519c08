#ifndef NIMBLE_TRANSPORT_H
#define NIMBLE_TRANSPORT_H

#include <Arduino.h>
#include <NimBLEDevice.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "BleTransport.h"

/**
 * @brief BleTransport on top of NimBLE-Arduino
 *
 * Resolution works from scan results: register the transport as the scan
 * callbacks and any address advertised within the sighting window can be
 * connected to.
 */
class NimBLETransport : public BleTransport, public NimBLEScanCallbacks {
public:
  explicit NimBLETransport(uint32_t sightingWindowMs = 120000);

  // NimBLEScanCallbacks
  void onResult(const NimBLEAdvertisedDevice* advertisedDevice) override;

  // BleTransport
  std::unique_ptr<BleDevice> resolveDevice(const std::string& address) override;
  std::unique_ptr<BleConnection> connect(const BleDevice& device) override;

  size_t knownDeviceCount();

private:
  struct Sighting {
    NimBLEAddress address;
    uint32_t lastSeen;
  };

  uint32_t sightingWindowMs;
  std::mutex lock;
  std::map<std::string, Sighting> sightings;
};

/**
 * @brief One NimBLEClient connection
 *
 * Owns the client and deletes it on destruction. Disconnections reported by
 * the stack flip isConnected() to false.
 */
class NimBLELink : public BleConnection, public NimBLEClientCallbacks {
public:
  NimBLELink(NimBLEClient* client, const std::string& peerAddress);
  ~NimBLELink() override;

  // BleConnection
  bool isConnected() const override;
  std::vector<GattCharacteristic> discoverServices() override;
  void subscribe(const GattCharacteristic& characteristic, NotifyCallback callback) override;
  void writeCharacteristic(const GattCharacteristic& characteristic, const uint8_t* data, size_t length,
                           bool awaitResponse) override;
  void disconnect() override;

  // NimBLEClientCallbacks
  void onDisconnect(NimBLEClient* pClient, int reason) override;

private:
  NimBLERemoteCharacteristic* lookup(const GattCharacteristic& characteristic);

  NimBLEClient* client;
  std::string peer;
  std::atomic<bool> linkUp;
  std::map<std::string, NimBLERemoteCharacteristic*> characteristics;
};

#endif // NIMBLE_TRANSPORT_H
