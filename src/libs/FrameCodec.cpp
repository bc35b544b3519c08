/**
 * @file FrameCodec.cpp
 * @brief LiTime BMS command framing and status response decoding
 *
 * Command frames are fixed 8-byte requests with an additive checksum.
 * Status responses are at least LITIME_MIN_RESPONSE_LENGTH bytes with
 * little-endian fields at fixed offsets (see LiTimeProtocol.h).
 *
 * No I/O and no state: everything here is safe to call from any task.
 */

#include "FrameCodec.h"

#include <cmath>
#include <cstdio>

#include "debug_functions.h"

const ProtectionFlag kProtectionFlags[] = {
  { 0x00000004u, "Cell overvoltage" },
  { 0x00000020u, "Cell undervoltage" },
  { 0x00000040u, "Charge overcurrent" },
  { 0x00000080u, "Discharge overcurrent" },
  { 0x00000100u, "Charge overtemperature" },
  { 0x00000200u, "Discharge overtemperature" },
  { 0x00000400u, "Charge undertemperature" },
  { 0x00000800u, "Discharge undertemperature" },
  { 0x00004000u, "Short circuit" },
};

const size_t kProtectionFlagCount = sizeof(kProtectionFlags) / sizeof(kProtectionFlags[0]);

namespace {

// Ties go to the even digit (default FE_TONEAREST), matching the BMS app's rounding
double roundTo(double value, int decimals) {
  double scale = std::pow(10.0, decimals);
  return std::nearbyint(value * scale) / scale;
}

}  // namespace

const char* decodeResultName(DecodeResult result) {
  switch (result) {
    case DECODE_OK:              return "ok";
    case DECODE_FRAME_TOO_SHORT: return "frame too short";
  }
  return "unknown";
}

//********************************************
// FrameReader
//********************************************

bool FrameReader::fits(size_t offset, size_t width) const {
  return data_ != nullptr && offset <= length_ && width <= length_ - offset;
}

bool FrameReader::u16(size_t offset, uint16_t& out) const {
  if (!fits(offset, 2)) return false;
  out = (uint16_t)(data_[offset + 1] << 8 | data_[offset]);
  return true;
}

bool FrameReader::s16(size_t offset, int16_t& out) const {
  uint16_t raw;
  if (!u16(offset, raw)) return false;
  out = (int16_t)raw;
  return true;
}

bool FrameReader::u32(size_t offset, uint32_t& out) const {
  if (!fits(offset, 4)) return false;
  out = (uint32_t)data_[offset + 3] << 24 | (uint32_t)data_[offset + 2] << 16 |
        (uint32_t)data_[offset + 1] << 8 | (uint32_t)data_[offset];
  return true;
}

bool FrameReader::s32(size_t offset, int32_t& out) const {
  uint32_t raw;
  if (!u32(offset, raw)) return false;
  out = (int32_t)raw;
  return true;
}

//********************************************
// Commands
//********************************************

CommandFrame buildCommand(uint8_t opcode) {
  CommandFrame frame = { 0x00, 0x00, 0x04, 0x01, opcode, 0x55, 0xAA, 0x00 };
  frame[7] = (uint8_t)(0x04 + 0x01 + opcode);
  return frame;
}

//********************************************
// Status decoding
//********************************************

std::string decodeProtectionFlags(uint32_t flags) {
  if (flags == 0) return "OK";

  std::string labels;
  for (size_t i = 0; i < kProtectionFlagCount; i++) {
    if (flags & kProtectionFlags[i].mask) {
      if (!labels.empty()) labels += ", ";
      labels += kProtectionFlags[i].label;
    }
  }
  return labels.empty() ? "OK" : labels;
}

std::string decodeFailureFlags(uint32_t flags) {
  if (flags == 0) return "OK";
  char text[24];
  snprintf(text, sizeof(text), "Error: 0x%08X", (unsigned)flags);
  return text;
}

/**
 * Decode a status response into a StatusReading
 *
 * The whole reading is built in a local and only copied to out once every
 * field has been read, so a failed decode never leaves a half-filled result.
 *
 * @param data   Reassembled response bytes
 * @param length Number of bytes in data
 * @param out    Receives the live reading on DECODE_OK
 * @return DECODE_OK, or DECODE_FRAME_TOO_SHORT if any field lies past the end
 */
DecodeResult decodeStatus(const uint8_t* data, size_t length, StatusReading& out) {
  if (data == nullptr || length < LITIME_MIN_RESPONSE_LENGTH) {
    LITIME_LOG_DEBUG("Response too short: %u bytes, expected >= %u\n",
                     (unsigned)length, (unsigned)LITIME_MIN_RESPONSE_LENGTH);
    return DECODE_FRAME_TOO_SHORT;
  }

  FrameReader reader(data, length);
  StatusReading reading;

  uint32_t totalMillivolts;
  int32_t currentMilliamps;
  int16_t cellTemp, mosTemp;
  uint16_t remaining, full, batteryState, soc, soh;
  uint32_t heatState, protection, failure, balancingState, cycles, dischargedMah;

  bool ok = reader.u32(LiTimeOffset::TOTAL_VOLTAGE, totalMillivolts) &&
            reader.s32(LiTimeOffset::CURRENT, currentMilliamps) &&
            reader.s16(LiTimeOffset::CELL_TEMPERATURE, cellTemp) &&
            reader.s16(LiTimeOffset::MOSFET_TEMPERATURE, mosTemp) &&
            reader.u16(LiTimeOffset::REMAINING_CAPACITY, remaining) &&
            reader.u16(LiTimeOffset::FULL_CAPACITY, full) &&
            reader.u32(LiTimeOffset::HEAT_STATE, heatState) &&
            reader.u32(LiTimeOffset::PROTECTION_FLAGS, protection) &&
            reader.u32(LiTimeOffset::FAILURE_FLAGS, failure) &&
            reader.u32(LiTimeOffset::BALANCING_STATE, balancingState) &&
            reader.u16(LiTimeOffset::BATTERY_STATE, batteryState) &&
            reader.u16(LiTimeOffset::STATE_OF_CHARGE, soc) &&
            reader.u16(LiTimeOffset::STATE_OF_HEALTH, soh) &&
            reader.u32(LiTimeOffset::DISCHARGE_CYCLES, cycles) &&
            reader.u32(LiTimeOffset::TOTAL_DISCHARGE_AH, dischargedMah);
  if (!ok) return DECODE_FRAME_TOO_SHORT;

  // Cell voltages; a raw 0 means the slot is not populated
  double minCell = 0.0, maxCell = 0.0;
  int present = 0;
  for (int i = 0; i < LITIME_MAX_CELLS; i++) {
    uint16_t raw;
    if (!reader.u16(LiTimeOffset::CELL_VOLTAGES + 2 * i, raw)) return DECODE_FRAME_TOO_SHORT;
    if (raw == 0) continue;
    double volts = raw / 1000.0;
    reading.cellVoltages[i] = volts;
    if (present == 0 || volts < minCell) minCell = volts;
    if (present == 0 || volts > maxCell) maxCell = volts;
    present++;
  }
  if (present > 0) {
    reading.minCellVoltage = minCell;
    reading.maxCellVoltage = maxCell;
    reading.deltaCellVoltage = roundTo(maxCell - minCell, 3);
  }

  double volts = totalMillivolts / 1000.0;
  double amps = currentMilliamps / 1000.0;
  reading.totalVoltage = volts;
  reading.current = amps;
  reading.power = roundTo(volts * amps, 1);

  reading.cellTemperature = cellTemp;
  reading.mosfetTemperature = mosTemp;
  reading.remainingCapacity = remaining / 100.0;
  reading.fullChargeCapacity = full / 100.0;

  reading.dischargeEnabled = (heatState & LITIME_HEAT_DISCHARGE_DISABLED) == 0;
  reading.protectionStatus = decodeProtectionFlags(protection);
  reading.failureStatus = decodeFailureFlags(failure);
  reading.balancing = balancingState != 0;

  reading.charging = batteryState == BATTERY_STATE_CHARGING;
  reading.discharging = batteryState == BATTERY_STATE_DISCHARGING && amps < 0;
  reading.chargeEnabled = batteryState != BATTERY_STATE_CHARGE_DISABLED;

  reading.stateOfCharge = soc;
  reading.stateOfHealth = soh;
  reading.dischargeCycles = cycles;
  reading.totalDischargeAh = dischargedMah / 1000.0;

  reading.online = true;
  out = reading;
  return DECODE_OK;
}
