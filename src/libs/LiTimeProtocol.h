#ifndef LITIME_PROTOCOL_H
#define LITIME_PROTOCOL_H

#include <cstddef>
#include <cstdint>

// Frame geometry
#define LITIME_COMMAND_LENGTH       8
#define LITIME_MIN_RESPONSE_LENGTH  104
#define LITIME_MAX_CELLS            16

// A status response always starts with this byte at offset 2
#define LITIME_RESPONSE_MARKER_OFFSET 2
#define LITIME_RESPONSE_MARKER_VALUE  0x65

// GATT layout (full 128-bit form, lowercase)
#define LITIME_SERVICE_UUID      "0000ffe0-0000-1000-8000-00805f9b34fb"
#define LITIME_NOTIFY_CHAR_UUID  "0000ffe1-0000-1000-8000-00805f9b34fb"
#define LITIME_WRITE_CHAR_UUID   "0000ffe2-0000-1000-8000-00805f9b34fb"

// Command opcodes (byte 4 of a command frame)
enum LiTimeOpcode : uint8_t {
  CMD_CHARGE_OFF    = 0x0A,
  CMD_CHARGE_ON     = 0x0B,
  CMD_DISCHARGE_OFF = 0x0C,
  CMD_DISCHARGE_ON  = 0x0D,
  CMD_QUERY_STATUS  = 0x13,
};

// Battery state word (offset 88)
enum LiTimeBatteryState : uint16_t {
  BATTERY_STATE_IDLE            = 0x0000,
  BATTERY_STATE_CHARGING        = 0x0001,
  BATTERY_STATE_DISCHARGING     = 0x0002,
  BATTERY_STATE_CHARGE_DISABLED = 0x0004,
};

// Heat state bit meaning "discharge disabled" (offset 68)
#define LITIME_HEAT_DISCHARGE_DISABLED 0x00000080u

// Status frame field offsets, all little-endian
//   offset  size  field
//   12      4     total voltage, mV
//   16      2x16  cell voltages, mV (0 = no cell)
//   48      4     current, mA, signed (negative = discharging)
//   52      2     cell temperature, C, signed
//   54      2     MOSFET temperature, C, signed
//   62      2     remaining capacity, 10 mAh
//   64      2     full charge capacity, 10 mAh
//   68      4     heat state
//   76      4     protection flags
//   80      4     failure flags
//   84      4     balancing state
//   88      2     battery state
//   90      2     SOC, %
//   92      2     SOH, %
//   96      4     discharge cycles
//   100     4     total discharged, mAh
namespace LiTimeOffset {
  const size_t TOTAL_VOLTAGE      = 12;
  const size_t CELL_VOLTAGES      = 16;
  const size_t CURRENT            = 48;
  const size_t CELL_TEMPERATURE   = 52;
  const size_t MOSFET_TEMPERATURE = 54;
  const size_t REMAINING_CAPACITY = 62;
  const size_t FULL_CAPACITY      = 64;
  const size_t HEAT_STATE         = 68;
  const size_t PROTECTION_FLAGS   = 76;
  const size_t FAILURE_FLAGS      = 80;
  const size_t BALANCING_STATE    = 84;
  const size_t BATTERY_STATE      = 88;
  const size_t STATE_OF_CHARGE    = 90;
  const size_t STATE_OF_HEALTH    = 92;
  const size_t DISCHARGE_CYCLES   = 96;
  const size_t TOTAL_DISCHARGE_AH = 100;
}

struct ProtectionFlag {
  uint32_t mask;
  const char* label;
};

// Protection word bits, in reporting order
extern const ProtectionFlag kProtectionFlags[];
extern const size_t kProtectionFlagCount;

#endif // LITIME_PROTOCOL_H
