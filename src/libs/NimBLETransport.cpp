/**
 * @file NimBLETransport.cpp
 * @brief NimBLE-Arduino implementation of the BLE transport
 *
 * Maps the transport interface onto NimBLEClient: scan sightings for device
 * resolution, client creation with conservative connection parameters,
 * full GATT discovery, notification subscription and writes.
 */

#include "NimBLETransport.h"

#include <algorithm>
#include <cctype>

#include "debug_functions.h"

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return text;
}

// Full 128-bit lowercase form, so 16-bit and 128-bit UUIDs compare equal
std::string uuid128(const NimBLEUUID& uuid) {
  NimBLEUUID full = uuid;
  full.to128();
  return lowercase(full.toString());
}

std::string characteristicKey(const std::string& serviceUuid, const std::string& uuid) {
  return serviceUuid + "/" + uuid;
}

class NimBLEPeer : public BleDevice {
public:
  explicit NimBLEPeer(const std::string& address) : peerAddress(address) {}
  std::string address() const override { return peerAddress; }

private:
  std::string peerAddress;
};

}  // namespace

//********************************************
// NimBLETransport
//********************************************

NimBLETransport::NimBLETransport(uint32_t sightingWindowMs) : sightingWindowMs(sightingWindowMs) {}

/**
 * BLE scan result callback
 * Remembers every advertiser so resolveDevice() can answer from the last scan
 * @param advertisedDevice Pointer to the discovered BLE device
 */
void NimBLETransport::onResult(const NimBLEAdvertisedDevice* advertisedDevice) {
  std::string address = lowercase(advertisedDevice->getAddress().toString());
  std::lock_guard<std::mutex> guard(lock);
  auto found = sightings.find(address);
  if (found == sightings.end()) {
    LITIME_LOG_DEBUG("BLE Device found: %s\n", advertisedDevice->toString().c_str());
    sightings.insert(std::make_pair(address, Sighting{ advertisedDevice->getAddress(), (uint32_t)millis() }));
  } else {
    found->second.lastSeen = millis();
  }
}

std::unique_ptr<BleDevice> NimBLETransport::resolveDevice(const std::string& address) {
  std::string key = lowercase(address);
  std::lock_guard<std::mutex> guard(lock);
  auto found = sightings.find(key);
  if (found == sightings.end()) return nullptr;
  if ((uint32_t)millis() - found->second.lastSeen > sightingWindowMs) return nullptr;
  return std::unique_ptr<BleDevice>(new NimBLEPeer(key));
}

size_t NimBLETransport::knownDeviceCount() {
  std::lock_guard<std::mutex> guard(lock);
  return sightings.size();
}

/**
 * @brief Open a GATT client connection
 *
 * Reuses a client NimBLE already holds for this peer, otherwise creates one.
 * Connection parameters follow the multi-link settings that proved stable:
 * 30 ms interval, no latency, 4 s supervision timeout, 10 s connect timeout.
 *
 * @throws BleTransportError on failure, BleTimeoutError if the connect timed out
 */
std::unique_ptr<BleConnection> NimBLETransport::connect(const BleDevice& device) {
  NimBLEAddress peerAddress;
  {
    std::lock_guard<std::mutex> guard(lock);
    auto found = sightings.find(lowercase(device.address()));
    if (found == sightings.end()) {
      throw BleTransportError("device " + device.address() + " is no longer advertised");
    }
    peerAddress = found->second.address;
  }

  // Stop scanning before connecting
  if (NimBLEDevice::getScan()->isScanning()) {
    NimBLEDevice::getScan()->stop();
  }

  NimBLEClient* pClient = NimBLEDevice::getClientByPeerAddress(peerAddress);
  if (!pClient) {
    pClient = NimBLEDevice::createClient();
    if (!pClient) {
      throw BleTransportError("unable to create BLE client for " + device.address());
    }
    pClient->setConnectionParams(24, 24, 0, 400);
    pClient->setConnectTimeout(10000);
  }

  std::unique_ptr<NimBLELink> link(new NimBLELink(pClient, lowercase(device.address())));
  if (!pClient->connect(peerAddress)) {
    int lastError = pClient->getLastError();
    std::string reason = NimBLEUtils::returnCodeToString(lastError);
    // ~NimBLELink deletes the client
    if (lastError == BLE_HS_ETIMEOUT) {
      throw BleTimeoutError("connect to " + device.address() + " timed out");
    }
    throw BleTransportError("connect to " + device.address() + " failed: " + reason);
  }

  LITIME_LOG_DEBUG("Connected to: %s RSSI: %d\n", pClient->getPeerAddress().toString().c_str(), pClient->getRssi());
  return std::unique_ptr<BleConnection>(link.release());
}

//********************************************
// NimBLELink
//********************************************

// The client is not connected yet, so the peer address comes from the caller
NimBLELink::NimBLELink(NimBLEClient* client, const std::string& peerAddress)
    : client(client), peer(peerAddress), linkUp(true) {
  client->setClientCallbacks(this, false);
}

NimBLELink::~NimBLELink() {
  if (client) {
    client->setClientCallbacks(nullptr, false);
    if (client->isConnected()) client->disconnect();
    NimBLEDevice::deleteClient(client);
    client = nullptr;
  }
}

bool NimBLELink::isConnected() const {
  return linkUp && client && client->isConnected();
}

std::vector<GattCharacteristic> NimBLELink::discoverServices() {
  if (!isConnected()) throw BleTransportError("not connected to " + peer);

  std::vector<GattCharacteristic> found;
  characteristics.clear();

  const std::vector<NimBLERemoteService*>& services = client->getServices(true);
  if (services.empty()) throw BleTransportError("service discovery failed on " + peer);

  for (NimBLERemoteService* service : services) {
    std::string serviceUuid = uuid128(service->getUUID());
    LITIME_LOG_DEBUG("Service: %s\n", serviceUuid.c_str());

    for (NimBLERemoteCharacteristic* chr : service->getCharacteristics(true)) {
      GattCharacteristic info;
      info.serviceUuid = serviceUuid;
      info.uuid = uuid128(chr->getUUID());
      if (chr->canRead()) info.properties |= GATT_PROP_READ;
      if (chr->canWriteNoResponse()) info.properties |= GATT_PROP_WRITE_NO_RESPONSE;
      if (chr->canWrite()) info.properties |= GATT_PROP_WRITE;
      if (chr->canNotify()) info.properties |= GATT_PROP_NOTIFY;
      if (chr->canIndicate()) info.properties |= GATT_PROP_INDICATE;

      characteristics[characteristicKey(info.serviceUuid, info.uuid)] = chr;
      found.push_back(info);
    }
  }
  return found;
}

NimBLERemoteCharacteristic* NimBLELink::lookup(const GattCharacteristic& characteristic) {
  auto found = characteristics.find(characteristicKey(characteristic.serviceUuid, characteristic.uuid));
  if (found == characteristics.end()) {
    throw BleTransportError("characteristic " + characteristic.uuid + " not discovered on " + peer);
  }
  return found->second;
}

void NimBLELink::subscribe(const GattCharacteristic& characteristic, NotifyCallback callback) {
  NimBLERemoteCharacteristic* chr = lookup(characteristic);
  bool ok = chr->subscribe(true, [callback](NimBLERemoteCharacteristic* pChr, uint8_t* pData, size_t length,
                                            bool isNotify) { callback(pData, length); });
  if (!ok) {
    throw BleTransportError("failed to subscribe to " + characteristic.uuid + " on " + peer);
  }
}

void NimBLELink::writeCharacteristic(const GattCharacteristic& characteristic, const uint8_t* data, size_t length,
                                     bool awaitResponse) {
  if (!isConnected()) throw BleTransportError("not connected to " + peer);
  NimBLERemoteCharacteristic* chr = lookup(characteristic);
  if (!chr->writeValue(data, length, awaitResponse)) {
    throw BleTransportError("write to " + characteristic.uuid + " failed: " +
                            NimBLEUtils::returnCodeToString(client->getLastError()));
  }
}

void NimBLELink::disconnect() {
  linkUp = false;
  characteristics.clear();
  if (client && client->isConnected() && !client->disconnect()) {
    throw BleTransportError("disconnect from " + peer + " failed");
  }
}

/**
 * BLE client disconnection callback
 * Called from the NimBLE host task when the peer drops the link
 * @param pClient Pointer to the disconnected BLE client
 * @param reason Reason code for the disconnection
 */
void NimBLELink::onDisconnect(NimBLEClient* pClient, int reason) {
  LITIME_LOG_INFO("%s disconnected, reason: %d\n", peer.c_str(), reason);
  linkUp = false;
}
