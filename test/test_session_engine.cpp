#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "FakeBleTransport.h"
#include "FrameCodec.h"
#include "LiTimeBMS.h"
#include "TestFrames.h"
#include "debug_functions.h"

namespace {

std::vector<std::string> capturedLog;

void captureLog(int level, const char* format, va_list args) {
  char buffer[256];
  vsnprintf(buffer, sizeof(buffer), format, args);
  capturedLog.push_back(std::string(logLevelName(level)) + " " + buffer);
}

bool logContains(const std::string& needle) {
  for (const std::string& line : capturedLog) {
    if (line.find(needle) != std::string::npos) return true;
  }
  return false;
}

Bytes commandBytes(uint8_t opcode) {
  CommandFrame frame = buildCommand(opcode);
  return Bytes(frame.begin(), frame.end());
}

// Answers every status query with the given frame split into two notifications
std::function<std::vector<Bytes>(const Bytes&)> answerWith(const std::vector<uint8_t>& frame) {
  return [frame](const Bytes& written) {
    std::vector<Bytes> packets;
    if (written.size() == LITIME_COMMAND_LENGTH && written[4] == CMD_QUERY_STATUS) {
      packets.push_back(Bytes(frame.begin(), frame.begin() + 40));
      packets.push_back(Bytes(frame.begin() + 40, frame.end()));
    }
    return packets;
  };
}

// Polls counter until it reaches atLeast or about two seconds have passed
bool waitFor(const std::atomic<int>& counter, int atLeast) {
  for (int i = 0; i < 400; i++) {
    if (counter.load() >= atLeast) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return counter.load() >= atLeast;
}

class SessionEngineTest : public ::testing::Test {
protected:
  SessionEngineTest() {
    capturedLog.clear();
    logPrintFunc = captureLog;
    transport.bms.responder = answerWith(typicalStatusFrame());
  }

  ~SessionEngineTest() override {
    logPrintFunc = nullptr;
  }

  static LiTimeConfig makeConfig() {
    LiTimeConfig config;
    config.address = "c8:47:80:31:9b:02";
    config.name = "House battery";
    config.responseTimeoutMs = 50;
    config.connectRetryDelayMs = 0;
    config.maxMissedUpdates = 3;
    return config;
  }

  FakeBms& bms() { return transport.bms; }

  FakeBleTransport transport;
};

}  // namespace

TEST_F(SessionEngineTest, PollReturnsLiveReading) {
  LiTimeBMS engine(transport, makeConfig());
  StatusReading reading = engine.poll();

  ASSERT_TRUE(reading.online);
  EXPECT_DOUBLE_EQ(*reading.totalVoltage, 52.3);
  EXPECT_EQ(*reading.stateOfCharge, 84);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_OK);
  EXPECT_TRUE(engine.lastReading().online);
  EXPECT_EQ(engine.missedUpdates(), 0u);

  ASSERT_EQ(bms().writes.size(), 1u);
  EXPECT_EQ(bms().writes[0], commandBytes(CMD_QUERY_STATUS));
}

TEST_F(SessionEngineTest, NothingHappensBeforeFirstPoll) {
  LiTimeBMS engine(transport, makeConfig());
  EXPECT_EQ(bms().resolveCalls, 0);
  EXPECT_FALSE(engine.lastReading().online);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_NOT_RUN);
}

TEST_F(SessionEngineTest, LinkIsReusedAcrossPolls) {
  LiTimeBMS engine(transport, makeConfig());
  engine.poll();
  engine.poll();
  EXPECT_EQ(bms().connectCalls, 1);
  EXPECT_EQ(bms().writes.size(), 2u);
}

TEST_F(SessionEngineTest, UnreachableDeviceGivesOfflineReadingAndMiss) {
  bms().reachable = false;
  LiTimeBMS engine(transport, makeConfig());
  StatusReading reading = engine.poll();

  EXPECT_FALSE(reading.online);
  EXPECT_FALSE(reading.totalVoltage.has_value());
  EXPECT_FALSE(reading.cellVoltages[0].has_value());
  EXPECT_EQ(engine.lastOutcome(), CYCLE_DEVICE_UNREACHABLE);
  EXPECT_EQ(engine.missedUpdates(), 1u);
}

TEST_F(SessionEngineTest, ResponseTimeoutKeepsLink) {
  bms().responder = nullptr;
  LiTimeBMS engine(transport, makeConfig());

  StatusReading reading = engine.poll();
  EXPECT_FALSE(reading.online);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_RESPONSE_TIMEOUT);
  EXPECT_TRUE(engine.linkManager().isConnected());
  EXPECT_TRUE(logContains("Timeout waiting for response"));
  EXPECT_TRUE(engine.linkManager().ensureConnected());
  EXPECT_EQ(engine.linkManager().negotiationCount(), 1u);

  bms().responder = answerWith(typicalStatusFrame());
  reading = engine.poll();
  EXPECT_TRUE(reading.online);
  EXPECT_EQ(bms().connectCalls, 1);
  EXPECT_EQ(engine.linkManager().negotiationCount(), 1u);
}

TEST_F(SessionEngineTest, PartialResponseDoesNotLeakIntoNextCycle) {
  std::vector<uint8_t> stale = StatusFrameBuilder().totalMillivolts(11111).build();
  bms().responder = [stale](const Bytes&) {
    return std::vector<Bytes>{ Bytes(stale.begin(), stale.begin() + 40) };
  };
  LiTimeBMS engine(transport, makeConfig());
  EXPECT_FALSE(engine.poll().online);

  // Tail of the stale frame arrives late, before the next query
  bms().push(Bytes(stale.begin() + 40, stale.end()));

  bms().responder = answerWith(typicalStatusFrame());
  StatusReading reading = engine.poll();
  ASSERT_TRUE(reading.online);
  EXPECT_DOUBLE_EQ(*reading.totalVoltage, 52.3);
}

TEST_F(SessionEngineTest, WriteFailureTearsDownLinkAndForcesRenegotiation) {
  LiTimeBMS engine(transport, makeConfig());
  ASSERT_TRUE(engine.poll().online);

  bms().failWrites = true;
  EXPECT_FALSE(engine.poll().online);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_TRANSPORT_FAILURE);
  EXPECT_FALSE(engine.linkManager().isConnected());
  EXPECT_EQ(bms().disconnectCalls, 1);

  bms().failWrites = false;
  EXPECT_TRUE(engine.linkManager().ensureConnected());
  EXPECT_EQ(engine.linkManager().negotiationCount(), 2u);
  EXPECT_TRUE(engine.poll().online);
  EXPECT_EQ(bms().connectCalls, 2);
}

TEST_F(SessionEngineTest, LinkLostDuringWriteIsTransportFailure) {
  LiTimeBMS engine(transport, makeConfig());
  ASSERT_TRUE(engine.poll().online);

  bms().dropLinkOnNextWrite = true;
  EXPECT_FALSE(engine.poll().online);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_TRANSPORT_FAILURE);

  EXPECT_TRUE(engine.poll().online);
  EXPECT_EQ(bms().connectCalls, 2);
}

TEST_F(SessionEngineTest, PeerDropIsRecoveredOnNextPoll) {
  LiTimeBMS engine(transport, makeConfig());
  ASSERT_TRUE(engine.poll().online);

  bms().linkOpen = false;
  EXPECT_TRUE(engine.poll().online);
  EXPECT_EQ(engine.linkManager().negotiationCount(), 2u);
}

TEST_F(SessionEngineTest, MissesAccumulateWithoutDisablingConnection) {
  bms().reachable = false;
  LiTimeBMS engine(transport, makeConfig());
  for (int i = 0; i < 5; i++) engine.poll();

  EXPECT_EQ(engine.missedUpdates(), 5u);
  EXPECT_TRUE(engine.connectionEnabled());
  EXPECT_TRUE(logContains("missed"));

  bms().reachable = true;
  EXPECT_TRUE(engine.poll().online);
  EXPECT_EQ(engine.missedUpdates(), 0u);
}

TEST_F(SessionEngineTest, NewLinkResetsMissCounter) {
  bms().reachable = false;
  LiTimeBMS engine(transport, makeConfig());
  engine.poll();
  engine.poll();
  ASSERT_EQ(engine.missedUpdates(), 2u);

  // Link comes up but the BMS stays silent: only this cycle counts
  bms().reachable = true;
  bms().responder = nullptr;
  engine.poll();
  EXPECT_EQ(engine.missedUpdates(), 1u);
}

TEST_F(SessionEngineTest, DisablingPublishesOfflineAndClosesLink) {
  LiTimeBMS engine(transport, makeConfig());
  std::vector<StatusReading> seen;
  engine.setReadingListener([&seen](const StatusReading& reading) { seen.push_back(reading); });

  ASSERT_TRUE(engine.poll().online);
  engine.setConnectionEnabled(false);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_TRUE(seen[0].online);
  EXPECT_FALSE(seen[1].online);
  EXPECT_FALSE(engine.connectionEnabled());
  EXPECT_FALSE(engine.linkManager().isConnected());
  EXPECT_EQ(engine.lastOutcome(), CYCLE_DISABLED);
  EXPECT_EQ(bms().disconnectCalls, 1);
}

TEST_F(SessionEngineTest, PollWhileDisabledDoesNoBleWork) {
  LiTimeBMS engine(transport, makeConfig());
  engine.setConnectionEnabled(false);

  StatusReading reading = engine.poll();
  EXPECT_FALSE(reading.online);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_DISABLED);
  EXPECT_EQ(engine.missedUpdates(), 0u);
  EXPECT_EQ(bms().resolveCalls, 0);
  EXPECT_EQ(bms().connectCalls, 0);
}

TEST_F(SessionEngineTest, EnablingReconnectsAndRefreshesImmediately) {
  LiTimeBMS engine(transport, makeConfig());
  engine.setConnectionEnabled(false);

  std::vector<StatusReading> seen;
  engine.setReadingListener([&seen](const StatusReading& reading) { seen.push_back(reading); });
  engine.setConnectionEnabled(true);

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_TRUE(seen[0].online);
  EXPECT_TRUE(engine.connectionEnabled());
  EXPECT_EQ(bms().connectCalls, 1);
}

TEST_F(SessionEngineTest, RelayCommandsSendOpcodeThenRefresh) {
  LiTimeBMS engine(transport, makeConfig());
  std::vector<StatusReading> seen;
  engine.setReadingListener([&seen](const StatusReading& reading) { seen.push_back(reading); });

  engine.setRelayState(RELAY_CHARGE, false);
  engine.setRelayState(RELAY_CHARGE, true);
  engine.setRelayState(RELAY_DISCHARGE, false);
  engine.setRelayState(RELAY_DISCHARGE, true);

  std::vector<Bytes> expected = {
    commandBytes(CMD_CHARGE_OFF),    commandBytes(CMD_QUERY_STATUS),
    commandBytes(CMD_CHARGE_ON),     commandBytes(CMD_QUERY_STATUS),
    commandBytes(CMD_DISCHARGE_OFF), commandBytes(CMD_QUERY_STATUS),
    commandBytes(CMD_DISCHARGE_ON),  commandBytes(CMD_QUERY_STATUS),
  };
  EXPECT_EQ(bms().writes, expected);
  ASSERT_EQ(seen.size(), 4u);
  for (const StatusReading& reading : seen) EXPECT_TRUE(reading.online);
  EXPECT_EQ(bms().connectCalls, 1);
}

TEST_F(SessionEngineTest, RelayCommandDroppedWhenUnreachable) {
  bms().reachable = false;
  LiTimeBMS engine(transport, makeConfig());
  int published = 0;
  engine.setReadingListener([&published](const StatusReading&) { published++; });

  engine.setRelayState(RELAY_DISCHARGE, false);
  EXPECT_TRUE(bms().writes.empty());
  EXPECT_EQ(published, 0);
  EXPECT_TRUE(logContains("Cannot set discharging"));
}

TEST_F(SessionEngineTest, RelayCommandDroppedWhenDisabled) {
  LiTimeBMS engine(transport, makeConfig());
  engine.setConnectionEnabled(false);
  engine.setRelayState(RELAY_CHARGE, true);
  EXPECT_TRUE(bms().writes.empty());
  EXPECT_EQ(bms().connectCalls, 0);
}

TEST_F(SessionEngineTest, RelayWriteFailureSkipsRefresh) {
  LiTimeBMS engine(transport, makeConfig());
  ASSERT_TRUE(engine.poll().online);
  int published = 0;
  engine.setReadingListener([&published](const StatusReading&) { published++; });

  bms().failWrites = true;
  engine.setRelayState(RELAY_CHARGE, false);
  EXPECT_EQ(published, 0);
  EXPECT_FALSE(engine.linkManager().isConnected());
}

TEST_F(SessionEngineTest, EmptyNameFallsBackToAddress) {
  LiTimeConfig config = makeConfig();
  config.name = "";
  LiTimeBMS engine(transport, config);
  EXPECT_EQ(engine.deviceName(), "c8:47:80:31:9b:02");
  EXPECT_EQ(engine.address(), "c8:47:80:31:9b:02");
}

TEST_F(SessionEngineTest, DestructionClosesLink) {
  {
    LiTimeBMS engine(transport, makeConfig());
    ASSERT_TRUE(engine.poll().online);
  }
  EXPECT_EQ(bms().disconnectCalls, 1);
  EXPECT_FALSE(bms().linkOpen);
}

TEST_F(SessionEngineTest, ResponsePushedFromTransportThreadWakesPoll) {
  std::atomic<int> queries(0);
  bms().responder = [&queries](const Bytes& written) {
    if (written[4] == CMD_QUERY_STATUS) queries++;
    return std::vector<Bytes>();
  };
  LiTimeConfig config = makeConfig();
  config.responseTimeoutMs = 5000;
  LiTimeBMS engine(transport, config);

  StatusReading reading;
  std::thread poller([&engine, &reading]() { reading = engine.poll(); });

  ASSERT_TRUE(waitFor(queries, 1));
  std::vector<uint8_t> frame = typicalStatusFrame();
  bms().push(Bytes(frame.begin(), frame.begin() + 20));
  bms().push(Bytes(frame.begin() + 20, frame.end()));
  poller.join();

  ASSERT_TRUE(reading.online);
  EXPECT_DOUBLE_EQ(*reading.totalVoltage, 52.3);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_OK);
}

TEST_F(SessionEngineTest, DisableDuringCycleWinsOverLateResponse) {
  std::atomic<int> queries(0);
  bms().responder = [&queries](const Bytes& written) {
    if (written[4] == CMD_QUERY_STATUS) queries++;
    return std::vector<Bytes>();
  };
  LiTimeConfig config = makeConfig();
  config.responseTimeoutMs = 5000;
  LiTimeBMS engine(transport, config);

  std::mutex seenLock;
  std::vector<StatusReading> seen;
  std::atomic<int> offlinePublished(0);
  engine.setReadingListener([&](const StatusReading& reading) {
    std::lock_guard<std::mutex> guard(seenLock);
    seen.push_back(reading);
    if (!reading.online) offlinePublished++;
  });

  StatusReading polled;
  std::thread poller([&engine, &polled]() { polled = engine.poll(); });
  ASSERT_TRUE(waitFor(queries, 1));

  std::thread disabler([&engine]() { engine.setConnectionEnabled(false); });
  ASSERT_TRUE(waitFor(offlinePublished, 1));

  // The answer to the in-flight query arrives after the disable
  std::vector<uint8_t> frame = typicalStatusFrame();
  bms().push(frame);

  poller.join();
  disabler.join();

  EXPECT_FALSE(polled.online);
  EXPECT_FALSE(polled.totalVoltage.has_value());
  EXPECT_FALSE(engine.lastReading().online);
  EXPECT_EQ(engine.lastOutcome(), CYCLE_DISABLED);
  EXPECT_FALSE(engine.connectionEnabled());
  EXPECT_FALSE(engine.linkManager().isConnected());
  EXPECT_FALSE(bms().linkOpen);
  EXPECT_EQ(engine.missedUpdates(), 0u);

  std::lock_guard<std::mutex> guard(seenLock);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_FALSE(seen[0].online);
  EXPECT_FALSE(seen[1].online);
}
