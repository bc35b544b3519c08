#ifndef BLE_TRANSPORT_H
#define BLE_TRANSPORT_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// GATT characteristic property bits (Bluetooth Core, Vol 3, Part G, 3.3.1.1)
enum GattProperty : uint8_t {
  GATT_PROP_READ              = 0x02,
  GATT_PROP_WRITE_NO_RESPONSE = 0x04,
  GATT_PROP_WRITE             = 0x08,
  GATT_PROP_NOTIFY            = 0x10,
  GATT_PROP_INDICATE          = 0x20,
};

struct GattCharacteristic {
  std::string serviceUuid;  // full 128-bit form, lowercase
  std::string uuid;         // full 128-bit form, lowercase
  uint8_t properties = 0;

  bool canNotify() const { return properties & GATT_PROP_NOTIFY; }
  bool canWrite() const { return properties & (GATT_PROP_WRITE | GATT_PROP_WRITE_NO_RESPONSE); }
};

// Raised by transport implementations for any link-level failure
class BleTransportError : public std::runtime_error {
public:
  explicit BleTransportError(const std::string& what) : std::runtime_error(what) {}
};

class BleTimeoutError : public BleTransportError {
public:
  explicit BleTimeoutError(const std::string& what) : BleTransportError(what) {}
};

typedef std::function<void(const uint8_t* data, size_t length)> NotifyCallback;

// A resolved, connectable peer (e.g. a recent advertisement)
class BleDevice {
public:
  virtual ~BleDevice() {}
  virtual std::string address() const = 0;
};

/**
 * @brief One open GATT client connection
 *
 * Every operation throws BleTransportError on failure. Error messages name
 * the peer address the connection was opened to.
 */
class BleConnection {
public:
  virtual ~BleConnection() {}

  virtual bool isConnected() const = 0;
  virtual std::vector<GattCharacteristic> discoverServices() = 0;
  virtual void subscribe(const GattCharacteristic& characteristic, NotifyCallback callback) = 0;
  virtual void writeCharacteristic(const GattCharacteristic& characteristic, const uint8_t* data,
                                   size_t length, bool awaitResponse) = 0;
  virtual void disconnect() = 0;
};

class BleTransport {
public:
  virtual ~BleTransport() {}

  // Returns null when the address is not currently reachable
  virtual std::unique_ptr<BleDevice> resolveDevice(const std::string& address) = 0;

  // Throws BleTransportError when the link cannot be established
  virtual std::unique_ptr<BleConnection> connect(const BleDevice& device) = 0;
};

#endif // BLE_TRANSPORT_H
