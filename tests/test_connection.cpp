/**
 * @file test_connection.cpp
 * @brief Unit tests for endpoint connection management
 */

#include <gtest/gtest.h>

#include <adbpush/connection.hpp>

#include "fake_runner.hpp"

namespace adbpush::test {

class ConnectionManagerTest : public ::testing::Test {
 protected:
  FakeRunner runner;
  ConnectionManager connection{runner};
  Endpoint endpoint{"192.168.1.50", 5555};
};

// Device list parsing

TEST_F(ConnectionManagerTest, ParseDeviceListSkipsHeaderAndDaemonNoise) {
  auto devices = parse_device_list(
      "* daemon not running; starting now at tcp:5037\n"
      "* daemon started successfully\n"
      "List of devices attached\n"
      "192.168.1.50:5555\tdevice\n"
      "emulator-5554\toffline\n"
      "\n");

  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].serial, "192.168.1.50:5555");
  EXPECT_EQ(devices[0].state, "device");
  EXPECT_EQ(devices[1].serial, "emulator-5554");
  EXPECT_EQ(devices[1].state, "offline");
}

TEST_F(ConnectionManagerTest, EndpointFormatsAsAddressPort) {
  EXPECT_EQ(endpoint.to_string(), "192.168.1.50:5555");
}

// Status matching

TEST_F(ConnectionManagerTest, MatchIsDelimiterBounded) {
  runner.connected = {"192.168.1.50:55550", "10.192.168.1.50:5555"};
  EXPECT_FALSE(connection.is_connected(endpoint));

  runner.connected.insert("192.168.1.50:5555");
  EXPECT_TRUE(connection.is_connected(endpoint));
}

TEST_F(ConnectionManagerTest, OfflineEndpointIsNotConnected) {
  runner.offline = {"192.168.1.50:5555"};
  EXPECT_FALSE(connection.is_connected(endpoint));
}

// ensure_connected

TEST_F(ConnectionManagerTest, MissingToolIsReportedBeforeAnyQuery) {
  runner.tool_installed = false;

  EXPECT_EQ(connection.ensure_connected(endpoint),
            ConnectResult::ToolUnavailable);
  EXPECT_EQ(runner.count("devices"), 0u);
  EXPECT_EQ(runner.count("connect"), 0u);
}

TEST_F(ConnectionManagerTest, AlreadyConnectedIsIdempotent) {
  runner.connected = {"192.168.1.50:5555"};

  EXPECT_EQ(connection.ensure_connected(endpoint), ConnectResult::Connected);
  EXPECT_EQ(connection.ensure_connected(endpoint), ConnectResult::Connected);
  EXPECT_EQ(runner.count("tcpip"), 0u);
  EXPECT_EQ(runner.count("connect"), 0u);
}

TEST_F(ConnectionManagerTest, SecondCallAfterConnectingIssuesNoConnect) {
  EXPECT_TRUE(connected(connection.ensure_connected(endpoint)));
  EXPECT_EQ(runner.count("connect"), 1u);

  EXPECT_TRUE(connected(connection.ensure_connected(endpoint)));
  EXPECT_EQ(runner.count("connect"), 1u);
  EXPECT_EQ(runner.count("tcpip"), 1u);
}

TEST_F(ConnectionManagerTest, ConnectSwitchesToTcpipThenConnects) {
  EXPECT_EQ(connection.ensure_connected(endpoint), ConnectResult::Connected);

  std::vector<std::string> order;
  for (const auto& call : runner.calls) order.push_back(call.at(0));
  std::vector<std::string> expected = {"version", "devices", "tcpip",
                                       "connect", "devices"};
  EXPECT_EQ(order, expected);

  EXPECT_EQ(runner.calls[2], (std::vector<std::string>{"tcpip", "5555"}));
  EXPECT_EQ(runner.calls[3],
            (std::vector<std::string>{"connect", "192.168.1.50:5555"}));
}

TEST_F(ConnectionManagerTest, FailedConnectIsAttemptedOnce) {
  runner.connect_succeeds = false;

  EXPECT_EQ(connection.ensure_connected(endpoint), ConnectResult::Failed);
  EXPECT_EQ(runner.count("connect"), 1u);
  EXPECT_FALSE(connected(ConnectResult::Failed));
}

TEST_F(ConnectionManagerTest, DisconnectRemovesEndpoint) {
  runner.connected = {"192.168.1.50:5555"};

  EXPECT_TRUE(connection.disconnect(endpoint));
  EXPECT_FALSE(connection.is_connected(endpoint));
}

TEST_F(ConnectionManagerTest, DescribeNamesEachResult) {
  EXPECT_STREQ(describe(ConnectResult::Connected), "connected");
  EXPECT_STRNE(describe(ConnectResult::ToolUnavailable),
               describe(ConnectResult::Failed));
}

}  // namespace adbpush::test
