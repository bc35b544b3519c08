#ifndef STATUS_READING_H
#define STATUS_READING_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "LiTimeProtocol.h"

/**
 * @brief One decoded snapshot of BMS telemetry
 *
 * Every field is optional so an offline reading has exactly the same shape
 * as a live one: online == false and everything else empty. A live reading
 * has every scalar field set; only the per-cell entries may be empty, for
 * cell slots the pack does not populate.
 */
struct StatusReading {
  bool online = false;

  std::optional<double> totalVoltage;       // V
  std::optional<double> current;            // A, negative = discharging
  std::optional<double> power;              // W
  std::optional<int> stateOfCharge;         // %
  std::optional<int> stateOfHealth;         // %
  std::optional<int> cellTemperature;       // C
  std::optional<int> mosfetTemperature;     // C
  std::optional<double> remainingCapacity;  // Ah
  std::optional<double> fullChargeCapacity; // Ah
  std::optional<uint32_t> dischargeCycles;
  std::optional<double> totalDischargeAh;   // Ah
  std::optional<double> minCellVoltage;     // V
  std::optional<double> maxCellVoltage;     // V
  std::optional<double> deltaCellVoltage;   // V
  std::array<std::optional<double>, LITIME_MAX_CELLS> cellVoltages;

  std::optional<bool> charging;
  std::optional<bool> discharging;
  std::optional<bool> balancing;
  std::optional<bool> chargeEnabled;
  std::optional<bool> dischargeEnabled;

  std::optional<std::string> protectionStatus;
  std::optional<std::string> failureStatus;

  // The fixed degraded value: online = false, every other field absent
  static StatusReading offline() { return StatusReading(); }

  int cellCount() const {
    int count = 0;
    for (const auto& cell : cellVoltages) {
      if (cell) count++;
    }
    return count;
  }
};

#endif // STATUS_READING_H
