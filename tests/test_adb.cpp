/**
 * @file test_adb.cpp
 * @brief Unit tests for the subprocess runner and environment guard
 */

#include <gtest/gtest.h>

#include <adbpush/adb.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_runner.hpp"

namespace adbpush::test {

// Quoting

TEST(ShellQuoteTest, PlainArgumentsAreUntouched) {
  EXPECT_EQ(shell_quote("push"), "push");
  EXPECT_EQ(shell_quote("/sdcard/Download/a.txt"), "/sdcard/Download/a.txt");
  EXPECT_EQ(shell_quote("192.168.1.5:5555"), "192.168.1.5:5555");
}

TEST(ShellQuoteTest, SpecialCharactersAreQuoted) {
  EXPECT_EQ(shell_quote("my file.txt"), "'my file.txt'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote("$(reboot)"), "'$(reboot)'");
  EXPECT_EQ(shell_quote(""), "''");
}

TEST(ProcessRunnerTest, CommandMergesStderr) {
  ProcessRunner runner("adb");
  EXPECT_EQ(runner.build_command({"push", "a b.txt", "/sdcard/x"}),
            "adb push 'a b.txt' /sdcard/x 2>&1");
}

// Real subprocesses through /bin/sh

TEST(ProcessRunnerTest, RunCapturesOutputAndExitCode) {
  ProcessRunner echo("echo");
  auto result = echo.run({"hello", "world"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->output, "hello world\n");

  ProcessRunner sh("sh");
  auto failed = sh.run({"-c", "echo oops >&2; exit 3"});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->exit_code, 3);
  EXPECT_EQ(failed->output, "oops\n");
}

TEST(ProcessRunnerTest, MissingBinaryIsNonZeroExit) {
  ProcessRunner runner("adbpush-no-such-binary");
  auto result = runner.run({"version"});
  ASSERT_TRUE(result.has_value());
  EXPECT_NE(result->exit_code, 0);
}

TEST(ProcessRunnerTest, StreamDeliversLinesWithoutEndings) {
  ProcessRunner sh("sh");
  std::vector<std::string> lines;
  auto status = sh.stream({"-c", "printf 'one\\r\\ntwo\\nthree'"},
                          [&](const std::string& line) {
                            lines.push_back(line);
                            return true;
                          });

  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, 0);
  EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(ProcessRunnerTest, StreamStopsWhenHandlerDeclines) {
  ProcessRunner sh("sh");
  std::vector<std::string> lines;
  sh.stream({"-c", "echo a; echo 'adb: error: closed'; echo c"},
            [&](const std::string& line) {
              lines.push_back(line);
              return line.rfind("adb: error:", 0) != 0;
            });

  EXPECT_EQ(lines, (std::vector<std::string>{"a", "adb: error: closed"}));
}

// Environment guard

TEST(ScopedEnvTest, SetsAndUnsets) {
  unsetenv("ADBPUSH_TEST_VAR");
  {
    ScopedEnv env("ADBPUSH_TEST_VAR", "all");
    ASSERT_NE(std::getenv("ADBPUSH_TEST_VAR"), nullptr);
    EXPECT_STREQ(std::getenv("ADBPUSH_TEST_VAR"), "all");
  }
  EXPECT_EQ(std::getenv("ADBPUSH_TEST_VAR"), nullptr);
}

TEST(ScopedEnvTest, RestoresPreviousValue) {
  setenv("ADBPUSH_TEST_VAR", "usb", 1);
  {
    ScopedEnv env("ADBPUSH_TEST_VAR", "all");
    EXPECT_STREQ(std::getenv("ADBPUSH_TEST_VAR"), "all");
  }
  EXPECT_STREQ(std::getenv("ADBPUSH_TEST_VAR"), "usb");
  unsetenv("ADBPUSH_TEST_VAR");
}

TEST(ScopedEnvTest, RestoresOnException) {
  unsetenv("ADBPUSH_TEST_VAR");
  try {
    ScopedEnv env("ADBPUSH_TEST_VAR", "all");
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(std::getenv("ADBPUSH_TEST_VAR"), nullptr);
}

// Remote read

TEST(ReadRemoteTest, ReturnsContentOrNothing) {
  FakeRunner runner;
  runner.device_files["/sdcard/a.txt"] = "contents";

  EXPECT_EQ(read_remote(runner, "", "/sdcard/a.txt").value_or(""), "contents");
  EXPECT_FALSE(read_remote(runner, "", "/sdcard/missing").has_value());

  runner.launch_fails = true;
  EXPECT_FALSE(read_remote(runner, "", "/sdcard/a.txt").has_value());
}

TEST(ReadRemoteTest, TargetsGivenDevice) {
  FakeRunner runner;
  runner.required_serial = "10.0.0.5:5555";
  runner.device_files["/sdcard/a.txt"] = "contents";

  EXPECT_EQ(read_remote(runner, "10.0.0.5:5555", "/sdcard/a.txt").value_or(""),
            "contents");
  EXPECT_EQ(runner.serials.back(), "10.0.0.5:5555");
  EXPECT_FALSE(read_remote(runner, "", "/sdcard/a.txt").has_value());
}

TEST(ForDeviceTest, PrefixesSerial) {
  std::vector<std::string> expected = {"-s", "10.0.0.5:5555", "push", "a",
                                       "/sdcard/a"};
  EXPECT_EQ(for_device("10.0.0.5:5555", {"push", "a", "/sdcard/a"}), expected);
}

TEST(ForDeviceTest, EmptySerialLeavesArgumentsAlone) {
  std::vector<std::string> expected = {"exec-out", "cat", "/sdcard/a"};
  EXPECT_EQ(for_device("", {"exec-out", "cat", "/sdcard/a"}), expected);
}

}  // namespace adbpush::test
