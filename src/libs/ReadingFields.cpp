#include "ReadingFields.h"

#include <cstdio>

namespace {

template <typename T>
std::optional<double> asDouble(const std::optional<T>& value) {
  if (!value) return std::nullopt;
  return (double)*value;
}

}  // namespace

const NumericField kNumericFields[] = {
  { "total_voltage",        "V",  3, [](const StatusReading& r) { return r.totalVoltage; } },
  { "current",              "A",  2, [](const StatusReading& r) { return r.current; } },
  { "power",                "W",  1, [](const StatusReading& r) { return r.power; } },
  { "state_of_charge",      "%",  0, [](const StatusReading& r) { return asDouble(r.stateOfCharge); } },
  { "state_of_health",      "%",  0, [](const StatusReading& r) { return asDouble(r.stateOfHealth); } },
  { "cell_temperature",     "C",  0, [](const StatusReading& r) { return asDouble(r.cellTemperature); } },
  { "mosfet_temperature",   "C",  0, [](const StatusReading& r) { return asDouble(r.mosfetTemperature); } },
  { "remaining_capacity",   "Ah", 2, [](const StatusReading& r) { return r.remainingCapacity; } },
  { "full_charge_capacity", "Ah", 2, [](const StatusReading& r) { return r.fullChargeCapacity; } },
  { "discharge_cycles",     "",   0, [](const StatusReading& r) { return asDouble(r.dischargeCycles); } },
  { "total_discharge_ah",   "Ah", 1, [](const StatusReading& r) { return r.totalDischargeAh; } },
  { "min_cell_voltage",     "V",  3, [](const StatusReading& r) { return r.minCellVoltage; } },
  { "max_cell_voltage",     "V",  3, [](const StatusReading& r) { return r.maxCellVoltage; } },
  { "delta_cell_voltage",   "V",  3, [](const StatusReading& r) { return r.deltaCellVoltage; } },
};
const size_t kNumericFieldCount = sizeof(kNumericFields) / sizeof(kNumericFields[0]);

const BinaryField kBinaryFields[] = {
  { "charging",    [](const StatusReading& r) { return r.charging; } },
  { "discharging", [](const StatusReading& r) { return r.discharging; } },
  { "balancing",   [](const StatusReading& r) { return r.balancing; } },
  { "online",      [](const StatusReading& r) { return std::optional<bool>(r.online); } },
};
const size_t kBinaryFieldCount = sizeof(kBinaryFields) / sizeof(kBinaryFields[0]);

const TextField kTextFields[] = {
  { "protection_status", [](const StatusReading& r) { return r.protectionStatus; } },
  { "failure_status",    [](const StatusReading& r) { return r.failureStatus; } },
};
const size_t kTextFieldCount = sizeof(kTextFields) / sizeof(kTextFields[0]);

const BinaryField kSwitchFields[] = {
  { "charging_switch",    [](const StatusReading& r) { return r.chargeEnabled; } },
  { "discharging_switch", [](const StatusReading& r) { return r.dischargeEnabled; } },
};
const size_t kSwitchFieldCount = sizeof(kSwitchFields) / sizeof(kSwitchFields[0]);

std::string cellVoltageKey(size_t index) {
  return "cell_voltage_" + std::to_string(index + 1);
}

std::optional<double> cellVoltage(const StatusReading& reading, size_t index) {
  if (index >= reading.cellVoltages.size()) return std::nullopt;
  return reading.cellVoltages[index];
}

const NumericField* findNumericField(const std::string& key) {
  for (size_t i = 0; i < kNumericFieldCount; i++) {
    if (key == kNumericFields[i].key) return &kNumericFields[i];
  }
  return nullptr;
}

const BinaryField* findBinaryField(const std::string& key) {
  for (size_t i = 0; i < kBinaryFieldCount; i++) {
    if (key == kBinaryFields[i].key) return &kBinaryFields[i];
  }
  for (size_t i = 0; i < kSwitchFieldCount; i++) {
    if (key == kSwitchFields[i].key) return &kSwitchFields[i];
  }
  return nullptr;
}

const TextField* findTextField(const std::string& key) {
  for (size_t i = 0; i < kTextFieldCount; i++) {
    if (key == kTextFields[i].key) return &kTextFields[i];
  }
  return nullptr;
}

bool fieldAvailable(const StatusReading& reading, const std::string& key) {
  if (key == "online") return true;
  return reading.online;
}

std::string formatNumeric(const NumericField& field, const StatusReading& reading) {
  std::optional<double> value = field.value(reading);
  if (!value) return "unavailable";

  char text[32];
  snprintf(text, sizeof(text), "%.*f", field.precision, *value);
  std::string out = text;
  if (field.unit[0] != '\0') {
    out += " ";
    out += field.unit;
  }
  return out;
}
