#include "common/error.h"
#include "device/adb_device.h"
#include "device/device_handle.h"
#include "device/ios_device.h"
#include "fakes.h"
#include <gtest/gtest.h>

using namespace trackcast;
using namespace trackcast::fakes;

namespace {
const std::string kUdid = "00008030-001A2B3C4D5E";
const std::string kSerial = "emulator-5554";
} // namespace

// ---- command runner ----

TEST(CommandRunner, QuotesArgumentsForTheShell) {
  EXPECT_EQ(PopenCommandRunner::quote("abc"), "'abc'");
  EXPECT_EQ(PopenCommandRunner::quote("it's"), "'it'\\''s'");
  EXPECT_EQ(PopenCommandRunner::quote("a b;rm -rf"), "'a b;rm -rf'");
}

TEST(CommandRunner, CapturesOutputAndExitCode) {
  PopenCommandRunner runner;

  auto ok = runner.run({"echo", "hello world"});
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(first_line(ok.output), "hello world");

  auto failed = runner.run({"sh", "-c", "echo broken >&2; exit 3"});
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(failed.exit_code, 3);
  EXPECT_EQ(first_line(failed.output), "broken");
}

TEST(CommandRunner, SpawnedSessionReadsStdin) {
  PopenCommandRunner runner;

  auto session = runner.spawn({"sh", "-c", "read line; exit 4"});
  ASSERT_NE(session, nullptr);
  EXPECT_TRUE(session->write_line(""));
  EXPECT_EQ(session->close(), 4);
  EXPECT_EQ(session->close(), 4);
}

TEST(CommandRunner, FirstLineTrims) {
  EXPECT_EQ(first_line("  17.2.1  \nnext"), "17.2.1");
  EXPECT_EQ(first_line("\r\n"), "");
  EXPECT_EQ(first_line(""), "");
}

// ---- iOS ----

class IosTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    runner = std::make_shared<FakeCommandRunner>();
    transport = std::make_unique<IosTransport>(runner, IosTools{}, kUdid);
  }

  std::shared_ptr<FakeCommandRunner> runner;
  std::unique_ptr<IosTransport> transport;
};

TEST_F(IosTransportTest, LegacyServiceBeforeIos17) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "ProductVersion"}, 0,
                 "16.7.2\n");
  runner->script({"idevicesetlocation", "-u", kUdid, "--", "37.3349000",
                  "-122.0090000"},
                 0, "");

  std::string error;
  ASSERT_TRUE(transport->connect({kUdid, ConnectionKind::USB, ""}, error));
  EXPECT_EQ(transport->service(), IosTransport::LocationService::LEGACY);

  EXPECT_TRUE(transport->set_location(37.3349, -122.009, error)) << error;
}

TEST_F(IosTransportTest, DvtServiceFromIos17) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "ProductVersion"}, 0,
                 "17.4\n");
  runner->script({"pymobiledevice3", "developer", "dvt", "simulate-location",
                  "clear", "--udid", kUdid},
                 0, "");

  std::string error;
  ASSERT_TRUE(transport->connect({kUdid, ConnectionKind::USB, ""}, error));
  EXPECT_EQ(transport->service(), IosTransport::LocationService::DVT);
  EXPECT_TRUE(transport->set_location(1.0, 2.0, error)) << error;

  ASSERT_EQ(runner->sessions.size(), 1u);
  EXPECT_EQ(runner->sessions[0]->command,
            "pymobiledevice3 developer dvt simulate-location set --udid " +
                kUdid + " -- 1.0000000 2.0000000");
  EXPECT_FALSE(runner->sessions[0]->closed);

  transport->disconnect();
  EXPECT_TRUE(runner->sessions[0]->closed);
  EXPECT_TRUE(runner->called("pymobiledevice3 developer dvt simulate-location "
                             "clear --udid " +
                             kUdid));
  EXPECT_EQ(transport->service(), IosTransport::LocationService::NONE);
}

TEST_F(IosTransportTest, DvtLocationStaysHeldBetweenSteps) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "ProductVersion"}, 0,
                 "17.0");

  std::string error;
  ASSERT_TRUE(transport->connect({kUdid, ConnectionKind::USB, ""}, error));
  ASSERT_TRUE(transport->set_location(1.0, 1.0, error));
  ASSERT_TRUE(transport->set_location(2.0, 2.0, error));

  // no one-shot set command blocks the caller
  EXPECT_EQ(runner->calls.size(), 1u);
  ASSERT_EQ(runner->sessions.size(), 2u);
  EXPECT_FALSE(runner->sessions[0]->closed);
  EXPECT_FALSE(runner->sessions[1]->closed);

  ASSERT_TRUE(transport->set_location(3.0, 3.0, error));
  EXPECT_TRUE(runner->sessions[0]->closed);
  EXPECT_EQ(runner->sessions[0]->lines, std::vector<std::string>{""});
  EXPECT_FALSE(runner->sessions[1]->closed);
  EXPECT_FALSE(runner->sessions[2]->closed);
  EXPECT_EQ(transport->held_sessions(), IosTransport::kHeldDvtSessions);

  transport->disconnect();
  for (const auto &session : runner->sessions) {
    EXPECT_TRUE(session->closed);
  }
  EXPECT_EQ(transport->held_sessions(), 0u);

  // a second disconnect has nothing left to release
  auto calls = runner->calls.size();
  transport->disconnect();
  EXPECT_EQ(runner->calls.size(), calls);
}

TEST_F(IosTransportTest, DvtSessionFailureIsReported) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "ProductVersion"}, 0,
                 "18.1");
  runner->script_session({"pymobiledevice3", "developer", "dvt",
                          "simulate-location", "set", "--udid", kUdid, "--",
                          "1.0000000", "1.0000000"},
                         1);

  std::string error;
  ASSERT_TRUE(transport->connect({kUdid, ConnectionKind::USB, ""}, error));
  ASSERT_TRUE(transport->set_location(1.0, 1.0, error));
  ASSERT_TRUE(transport->set_location(2.0, 2.0, error));

  EXPECT_FALSE(transport->set_location(3.0, 3.0, error));
  EXPECT_EQ(error, "location session exited with code 1");
}

TEST_F(IosTransportTest, NetworkEndpointAddsFlag) {
  runner->script({"ideviceinfo", "-u", kUdid, "-n", "-k", "ProductVersion"},
                 0, "15.0");

  std::string error;
  EXPECT_TRUE(transport->connect({kUdid, ConnectionKind::WIFI, ""}, error));
}

TEST_F(IosTransportTest, ConnectFailureReportsToolOutput) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "ProductVersion"}, 255,
                 "ERROR: Could not connect to lockdownd\n");

  std::string error;
  EXPECT_FALSE(transport->connect({kUdid, ConnectionKind::USB, ""}, error));
  EXPECT_EQ(error, "ERROR: Could not connect to lockdownd");

  EXPECT_FALSE(transport->set_location(0, 0, error));
  EXPECT_EQ(error, "Service not available");
}

TEST_F(IosTransportTest, DisconnectResetsLegacyLocation) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "ProductVersion"}, 0,
                 "16.0");
  std::string error;
  ASSERT_TRUE(transport->connect({kUdid, ConnectionKind::USB, ""}, error));

  transport->disconnect();
  EXPECT_TRUE(runner->called("idevicesetlocation -u " + kUdid + " reset"));

  auto calls = runner->calls.size();
  transport->disconnect();
  EXPECT_EQ(runner->calls.size(), calls);
}

TEST_F(IosTransportTest, FactoryNameFromDeviceName) {
  runner->script({"ideviceinfo", "-u", kUdid, "-k", "DeviceName"}, 0,
                 "Alice's iPhone\n");
  EXPECT_EQ(transport->fetch_factory_name().value_or(""), "Alice's iPhone");
}

TEST(IosScanner, UsbWinsOverNetwork) {
  auto runner = std::make_shared<FakeCommandRunner>();
  runner->script({"idevice_id", "-l"}, 0, "AAA\nBBB\n");
  runner->script({"idevice_id", "-n"}, 0, "BBB\nCCC\n");

  IosScanner scanner(runner, IosTools{});
  auto found = scanner.scan();

  ASSERT_EQ(found.size(), 3u);
  EXPECT_EQ(found[0].udid, "AAA");
  EXPECT_EQ(found[1].udid, "BBB");
  EXPECT_EQ(found[1].endpoint.kind, ConnectionKind::USB);
  EXPECT_EQ(found[2].udid, "CCC");
  EXPECT_EQ(found[2].endpoint.kind, ConnectionKind::WIFI);
}

TEST(IosScanner, MissingToolYieldsNoDevices) {
  auto runner = std::make_shared<FakeCommandRunner>();
  IosScanner scanner(runner, IosTools{});
  EXPECT_TRUE(scanner.scan().empty());
}

TEST(IosScanner, FallbackLabelUsesUdidPrefix) {
  IosScanner scanner(std::make_shared<FakeCommandRunner>(), IosTools{});
  EXPECT_EQ(scanner.fallback_label(kUdid), "iPhone (00008030...)");
}

// ---- Android ----

TEST(AdbScanner, KeepsOnlyReadyDevices) {
  auto runner = std::make_shared<FakeCommandRunner>();
  runner->script({"adb", "devices"}, 0,
                 "List of devices attached\n"
                 "emulator-5554\tdevice\n"
                 "R58M1234ABC\tunauthorized\n"
                 "0123456789\tdevice\n\n");

  AdbScanner scanner(runner, AdbTools{});
  auto found = scanner.scan();

  ASSERT_EQ(found.size(), 2u);
  EXPECT_EQ(found[0].udid, "emulator-5554");
  EXPECT_EQ(found[0].family, DeviceFamily::ANDROID);
  EXPECT_EQ(found[0].endpoint.kind, ConnectionKind::BRIDGED);
  EXPECT_EQ(found[1].udid, "0123456789");
  EXPECT_EQ(scanner.fallback_label("0123456789"), "Android (01234567...)");
}

TEST(AdbTransport, SendsMockLocationIntent) {
  auto runner = std::make_shared<FakeCommandRunner>();
  runner->script({"adb", "-s", kSerial, "get-state"}, 0, "device\n");
  runner->script({"adb", "-s", kSerial, "shell",
                  "am startservice -a com.lexa.fakegps.START --ed lat "
                  "48.8584000 --ed long 2.2945000"},
                 0, "Starting service: Intent { ... }\n");
  runner->script({"adb", "-s", kSerial, "shell", "getprop ro.product.model"},
                 0, "Pixel 7\n");

  AdbTransport transport(runner, AdbTools{}, kSerial);
  std::string error;
  ASSERT_TRUE(
      transport.connect({kSerial, ConnectionKind::BRIDGED, ""}, error));
  EXPECT_TRUE(transport.set_location(48.8584, 2.2945, error)) << error;
  EXPECT_EQ(transport.fetch_factory_name().value_or(""),
            "Pixel 7 (emulator-5554)");

  transport.disconnect();
  EXPECT_FALSE(transport.set_location(48.8584, 2.2945, error));
}

TEST(AdbTransport, OfflineDeviceFailsToConnect) {
  auto runner = std::make_shared<FakeCommandRunner>();
  runner->script({"adb", "-s", kSerial, "get-state"}, 0, "offline\n");

  AdbTransport transport(runner, AdbTools{}, kSerial);
  std::string error;
  EXPECT_FALSE(
      transport.connect({kSerial, ConnectionKind::BRIDGED, ""}, error));
  EXPECT_EQ(error, "offline");
}

// ---- handle ----

class DeviceHandleTest : public ::testing::Test {
protected:
  void SetUp() override {
    state = std::make_shared<FakeDeviceState>();
    store = std::make_shared<MemoryNameStore>();
  }

  std::unique_ptr<DeviceHandle> make_handle() {
    DiscoveredDevice record{kUdid, DeviceFamily::IOS,
                            {"", ConnectionKind::USB, ""}};
    return std::make_unique<DeviceHandle>(
        record, std::make_unique<FakeTransport>(DeviceFamily::IOS, state),
        store, "iPhone (00008030...)");
  }

  std::shared_ptr<FakeDeviceState> state;
  std::shared_ptr<MemoryNameStore> store;
};

TEST_F(DeviceHandleTest, DisplayNamePrecedence) {
  auto handle = make_handle();
  EXPECT_EQ(handle->display_name(), "iPhone (00008030...)");
  EXPECT_EQ(handle->serial(), kUdid);

  state->factory_name = "Alice's iPhone";
  handle->connect();
  EXPECT_EQ(handle->display_name(), "Alice's iPhone");

  handle->set_user_name("Field unit 3");
  EXPECT_EQ(handle->display_name(), "Field unit 3");
}

TEST_F(DeviceHandleTest, LoadsPersistedNamesOnCreation) {
  store->upsert(kUdid, std::string("Stored iPhone"), std::string("Bench"));

  auto handle = make_handle();
  EXPECT_EQ(handle->factory_name().value_or(""), "Stored iPhone");
  EXPECT_EQ(handle->display_name(), "Bench");
}

TEST_F(DeviceHandleTest, ConnectPersistsFactoryName) {
  state->factory_name = "Bob's iPad";
  auto handle = make_handle();

  handle->connect();
  EXPECT_TRUE(handle->connected());

  auto record = store->get(kUdid);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->factory_name.value_or(""), "Bob's iPad");
}

TEST_F(DeviceHandleTest, NamingFailureDoesNotFailConnect) {
  state->throw_on_name = true;
  auto handle = make_handle();
  EXPECT_NO_THROW(handle->connect());
  EXPECT_TRUE(handle->connected());

  state->throw_on_name = false;
  state->factory_name = "Carol's iPhone";
  store->fail_writes = true;
  auto other = make_handle();
  EXPECT_NO_THROW(other->connect());
  EXPECT_TRUE(other->connected());
}

TEST_F(DeviceHandleTest, ConnectFailureRaisesDeviceConnection) {
  state->fail_connect = true;
  auto handle = make_handle();

  try {
    handle->connect();
    FAIL() << "expected device-connection error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::DEVICE_CONNECTION);
    EXPECT_EQ(e.device_udid(), kUdid);
    EXPECT_STREQ(e.code(), "DEVICE_CONNECTION_ERROR");
  }
  EXPECT_FALSE(handle->connected());
}

TEST_F(DeviceHandleTest, ControlFailureDropsConnection) {
  auto handle = make_handle();
  handle->connect();
  handle->set_location(1.0, 2.0);
  EXPECT_EQ(state->location_count(), 1u);

  state->fail_set_location = true;
  try {
    handle->set_location(1.0, 2.0);
    FAIL() << "expected device-control error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::DEVICE_CONTROL);
  }
  EXPECT_FALSE(handle->connected());

  EXPECT_THROW(handle->set_location(1.0, 2.0), Error);
}

TEST_F(DeviceHandleTest, DisconnectIsIdempotent) {
  auto handle = make_handle();
  handle->disconnect();
  EXPECT_EQ(state->disconnect_count(), 0);

  handle->connect();
  handle->disconnect();
  handle->disconnect();
  EXPECT_EQ(state->disconnect_count(), 1);
  EXPECT_FALSE(handle->connected());
}

TEST_F(DeviceHandleTest, DisconnectAfterLostDeviceStillClears) {
  auto handle = make_handle();
  handle->connect();
  state->fail_set_location = true;
  EXPECT_THROW(handle->set_location(0, 0), Error);

  handle->disconnect();
  EXPECT_EQ(state->disconnect_count(), 1);
}
