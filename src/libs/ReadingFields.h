#ifndef READING_FIELDS_H
#define READING_FIELDS_H

#include <cstddef>
#include <optional>
#include <string>

#include "StatusReading.h"

typedef std::optional<double> (*NumericExtractor)(const StatusReading& reading);
typedef std::optional<bool> (*BinaryExtractor)(const StatusReading& reading);
typedef std::optional<std::string> (*TextExtractor)(const StatusReading& reading);

struct NumericField {
  const char* key;
  const char* unit;      // "" when unitless
  int precision;         // suggested display decimals
  NumericExtractor value;
};

struct BinaryField {
  const char* key;
  BinaryExtractor value;
};

struct TextField {
  const char* key;
  TextExtractor value;
};

// Exposed metrics, in display order
extern const NumericField kNumericFields[];
extern const size_t kNumericFieldCount;

extern const BinaryField kBinaryFields[];
extern const size_t kBinaryFieldCount;

extern const TextField kTextFields[];
extern const size_t kTextFieldCount;

// Switch positions reported back from the BMS (charging_switch, discharging_switch)
extern const BinaryField kSwitchFields[];
extern const size_t kSwitchFieldCount;

// "cell_voltage_1" .. "cell_voltage_16"
std::string cellVoltageKey(size_t index);
std::optional<double> cellVoltage(const StatusReading& reading, size_t index);

const NumericField* findNumericField(const std::string& key);
const BinaryField* findBinaryField(const std::string& key);
const TextField* findTextField(const std::string& key);

// Every field follows the online flag, except "online" itself
bool fieldAvailable(const StatusReading& reading, const std::string& key);

// "12.345" style rendering for logs, "unavailable" when absent
std::string formatNumeric(const NumericField& field, const StatusReading& reading);

#endif // READING_FIELDS_H
