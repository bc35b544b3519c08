#include <Arduino.h>
#include <NimBLEDevice.h>
#include "libs/LiTimeBMS.h"
#include "libs/NimBLETransport.h"
#include "libs/ReadingFields.h"
#include "libs/debug_functions.h"

/**
 * @brief The monitored BMS
 *
 * Set the MAC address of your battery here. The display name is only used in
 * log output.
 */
LiTimeConfig makeConfig() {
  LiTimeConfig config;
  config.address = "c8:47:80:31:9b:02"; // Example Mac address of a LiTime BMS
  config.name = "LiTime 12V 100Ah";
  config.updateIntervalMs = 30000;
  return config;
}

NimBLETransport transport;
LiTimeBMS* bms = nullptr;

// BLE Scanning
NimBLEScan* pScan;
unsigned long lastScanTime = 0;
unsigned long lastPollTime = 0;
String commandLine;

// Log sink for the LiTime library
void logPrintForLiTime(int level, const char* format, va_list args) {
  char buffer[256];
  vsnprintf(buffer, sizeof(buffer), format, args);
  Serial.printf("[%s] %s", logLevelName(level), buffer);
}

void printReading(const StatusReading& reading) {
  Serial.printf("\n--- %s (%s) %s ---\n", bms->deviceName().c_str(), bms->address().c_str(),
                reading.online ? "online" : "offline");
  if (!reading.online) {
    Serial.printf("Missed updates: %u, last outcome: %s\n", bms->missedUpdates(), cycleOutcomeName(bms->lastOutcome()));
    return;
  }

  for (size_t i = 0; i < kNumericFieldCount; i++) {
    Serial.printf("  %-22s %s\n", kNumericFields[i].key, formatNumeric(kNumericFields[i], reading).c_str());
  }
  for (size_t i = 0; i < kTextFieldCount; i++) {
    std::optional<std::string> text = kTextFields[i].value(reading);
    Serial.printf("  %-22s %s\n", kTextFields[i].key, text ? text->c_str() : "unavailable");
  }
  for (size_t i = 0; i < kBinaryFieldCount; i++) {
    std::optional<bool> state = kBinaryFields[i].value(reading);
    Serial.printf("  %-22s %s\n", kBinaryFields[i].key, state ? (*state ? "on" : "off") : "unavailable");
  }
  for (size_t i = 0; i < kSwitchFieldCount; i++) {
    std::optional<bool> state = kSwitchFields[i].value(reading);
    Serial.printf("  %-22s %s\n", kSwitchFields[i].key, state ? (*state ? "on" : "off") : "unavailable");
  }
  for (size_t i = 0; i < LITIME_MAX_CELLS; i++) {
    std::optional<double> volts = cellVoltage(reading, i);
    if (volts) Serial.printf("  %-22s %.3f V\n", cellVoltageKey(i).c_str(), *volts);
  }
}

/**
 * Serial console commands:
 *   charge on|off, discharge on|off, connection on|off, log on|off
 */
void handleCommand(const String& line) {
  String cmd = line;
  cmd.trim();
  cmd.toLowerCase();
  if (cmd.isEmpty()) return;

  int space = cmd.indexOf(' ');
  String verb = space < 0 ? cmd : cmd.substring(0, space);
  String arg = space < 0 ? String("") : cmd.substring(space + 1);
  bool on = arg == "on";
  if (!on && arg != "off") {
    Serial.printf("Unknown argument '%s', expected on|off\n", arg.c_str());
    return;
  }

  if (verb == "charge") {
    bms->setRelayState(RELAY_CHARGE, on);
  } else if (verb == "discharge") {
    bms->setRelayState(RELAY_DISCHARGE, on);
  } else if (verb == "connection") {
    bms->setConnectionEnabled(on);
  } else if (verb == "log") {
    logPrintFunc = on ? logPrintForLiTime : logPrintPlaceholder;
    Serial.printf("Library logging %s\n", on ? "on" : "off");
  } else {
    Serial.printf("Unknown command '%s'\n", verb.c_str());
  }
}

//********************************************
// Main Program
//********************************************
void setup() {
  Serial.begin(115200);

  // Set up log sink for the LiTime library
  logPrintFunc = logPrintForLiTime;

  // Initialize NimBLE first (used to communicate with the BMS)
  LITIME_LOG_INFO("Initializing NimBLE\n");
  NimBLEDevice::init("LiTime monitor");
  NimBLEDevice::setPower(ESP_PWR_LVL_P9); // Maximum power for better range
  NimBLEDevice::setMTU(517);

  pScan = NimBLEDevice::getScan();
  pScan->setScanCallbacks(&transport);
  pScan->setInterval(1600); // 1000ms scan interval
  pScan->setWindow(100);    // 62.5ms scan window
  pScan->setActiveScan(true);

  bms = new LiTimeBMS(transport, makeConfig());
  bms->setReadingListener(printReading);

  // First poll as soon as the first scan has had a chance to see the BMS
  pScan->start(3000, false, true);
  lastScanTime = millis();
  lastPollTime = millis() - bms->settings().updateIntervalMs;

  LITIME_LOG_INFO("Setup complete!\n");
}

void loop() {
  while (Serial.available()) {
    char c = (char)Serial.read();
    if (c == '\n' || c == '\r') {
      handleCommand(commandLine);
      commandLine = "";
    } else {
      commandLine += c;
    }
  }

  // Scan only while the link is down, and not during a scan already running
  bool linkUp = bms->linkManager().isConnected();
  bool shouldScan = !linkUp && bms->connectionEnabled() && !pScan->isScanning() &&
                    (millis() - lastScanTime >= 20000);
  if (shouldScan) {
    LITIME_LOG_DEBUG("Starting BMS scan... (known devices: %u)\n", (unsigned)transport.knownDeviceCount());
    pScan->start(3000, false, true);
    lastScanTime = millis();
  }

  if (!pScan->isScanning() && millis() - lastPollTime >= bms->settings().updateIntervalMs) {
    lastPollTime = millis();
    bms->poll(); // printed by the reading listener
  }

  // The BMS needs ~100ms between requests
  delay(100);
}
