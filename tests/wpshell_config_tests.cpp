// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/config.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using wpshell::ConfigStatus;
using wpshell::LoadTestConfig;
using wpshell::ShellConfig;

class WpShellConfigTest : public ::testing::Test {
protected:
	void TearDown() override
	{
		if (!config_path.empty()) {
			std::filesystem::remove(config_path);
		}
	}

	std::string WriteConfig(const std::string& contents)
	{
		config_path = std::filesystem::path(::testing::TempDir()) /
		              (std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
		               ".ini");
		std::ofstream out(config_path);
		out << contents;
		return config_path.string();
	}

	std::filesystem::path config_path = {};
};

TEST_F(WpShellConfigTest, ShellDefaults)
{
	ShellConfig config{};

	const auto result = wpshell::ParseShellConfig({}, config);

	ASSERT_EQ(result.status, ConfigStatus::Ok);
	EXPECT_EQ(config.device, "virtual");
	EXPECT_EQ(config.port, 0);
	EXPECT_EQ(config.log_level, "info");
	EXPECT_EQ(config.logfile, "wasatch-shell.log");
}

TEST_F(WpShellConfigTest, ShellOverrides)
{
	ShellConfig config{};

	const auto result = wpshell::ParseShellConfig(
	        {"--device", "none", "--port", "6123", "--log-level", "DEBUG", "--logfile", ""},
	        config);

	ASSERT_EQ(result.status, ConfigStatus::Ok) << result.message;
	EXPECT_EQ(config.device, "none");
	EXPECT_EQ(config.port, 6123);
	EXPECT_EQ(config.log_level, "debug");
	EXPECT_EQ(config.logfile, "");
}

TEST_F(WpShellConfigTest, ShellRejectsBadValues)
{
	ShellConfig config{};

	EXPECT_EQ(wpshell::ParseShellConfig({"--port", "80"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseShellConfig({"--port", "http"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseShellConfig({"--device", "usb"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseShellConfig({"--log-level", "loud"}, config).status,
	          ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseShellConfig({"--bogus"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseShellConfig({"stray"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseShellConfig({"--device", "none", "stray", "words"}, config).status,
	          ConfigStatus::Error);
}

TEST_F(WpShellConfigTest, HelpIsReported)
{
	ShellConfig config{};

	const auto result = wpshell::ParseShellConfig({"--help"}, config);

	EXPECT_EQ(result.status, ConfigStatus::Help);
	EXPECT_NE(result.message.find("--device"), std::string::npos);
}

TEST_F(WpShellConfigTest, ShellReadsConfigFileThenCommandLine)
{
	const auto path = WriteConfig(
	        "[load_test]\n"
	        "timeout-ms = 5\n"
	        "[shell]\n"
	        "device = none\n"
	        "port = 7000\n"
	        "log-level = warning\n");

	ShellConfig config{};
	const auto result = wpshell::ParseShellConfig({"--config", path, "--port", "7001"}, config);

	ASSERT_EQ(result.status, ConfigStatus::Ok) << result.message;
	EXPECT_EQ(config.device, "none");
	EXPECT_EQ(config.port, 7001);
	EXPECT_EQ(config.log_level, "warning");
}

TEST_F(WpShellConfigTest, MissingConfigFileIsAnError)
{
	ShellConfig config{};

	const auto result = wpshell::ParseShellConfig({"--config", "/nonexistent/wpshell.ini"},
	                                              config);

	EXPECT_EQ(result.status, ConfigStatus::Error);
	EXPECT_NE(result.message.find("/nonexistent/wpshell.ini"), std::string::npos);
}

TEST_F(WpShellConfigTest, LoadTestDefaults)
{
	LoadTestConfig config{};

	ASSERT_EQ(wpshell::ParseLoadTestConfig({}, config).status, ConfigStatus::Ok);
	EXPECT_EQ(config.outer_loops, 5);
	EXPECT_EQ(config.inner_loops, 10);
	EXPECT_EQ(config.shell, "./wasatch-shell");
	EXPECT_TRUE(config.connect.empty());
	EXPECT_EQ(config.timeout_ms, 1000u);
	EXPECT_EQ(config.launch_timeout_ms, 5000u);
	EXPECT_EQ(config.settle_ms, 2000u);
	EXPECT_EQ(config.logfile, "load-test.log");
}

TEST_F(WpShellConfigTest, LoadTestPositionalLoopCounts)
{
	LoadTestConfig config{};

	const auto result = wpshell::ParseLoadTestConfig({"2", "-1", "--settle-ms", "0"}, config);

	ASSERT_EQ(result.status, ConfigStatus::Ok) << result.message;
	EXPECT_EQ(config.outer_loops, 2);
	EXPECT_EQ(config.inner_loops, -1);
	EXPECT_EQ(config.settle_ms, 0u);
}

TEST_F(WpShellConfigTest, LoadTestShellArguments)
{
	LoadTestConfig config{};

	const auto result = wpshell::ParseLoadTestConfig(
	        {"--shell", "/opt/wp/wasatch-shell", "--shell-arg=--device=none",
	         "--shell-arg=--logfile=shell.log"},
	        config);

	ASSERT_EQ(result.status, ConfigStatus::Ok) << result.message;
	EXPECT_EQ(config.shell, "/opt/wp/wasatch-shell");
	const std::vector<std::string> expected = {"--device=none", "--logfile=shell.log"};
	EXPECT_EQ(config.shell_args, expected);
}

TEST_F(WpShellConfigTest, EmptyLogfileSelectsStderr)
{
	LoadTestConfig config{};

	const auto result = wpshell::ParseLoadTestConfig({"--logfile", "", "3"}, config);

	ASSERT_EQ(result.status, ConfigStatus::Ok) << result.message;
	EXPECT_TRUE(config.logfile.empty());
	EXPECT_EQ(config.outer_loops, 3);
}

TEST_F(WpShellConfigTest, LoadTestRejectsBadValues)
{
	LoadTestConfig config{};

	EXPECT_EQ(wpshell::ParseLoadTestConfig({"five"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseLoadTestConfig({"1", "2", "3"}, config).status, ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseLoadTestConfig({"--timeout-ms", "0"}, config).status,
	          ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseLoadTestConfig({"--connect", "localhost"}, config).status,
	          ConfigStatus::Error);
	EXPECT_EQ(wpshell::ParseLoadTestConfig({"--connect", "localhost:99999"}, config).status,
	          ConfigStatus::Error);
}

TEST_F(WpShellConfigTest, LoadTestConfigFileSection)
{
	const auto path = WriteConfig(
	        "[shell]\n"
	        "port = 7000\n"
	        "[load_test]\n"
	        "outer = 3\n"
	        "inner = 4\n"
	        "connect = localhost:7000\n"
	        "timeout-ms = 2500\n");

	LoadTestConfig config{};
	const auto result = wpshell::ParseLoadTestConfig({"--config", path, "1"}, config);

	ASSERT_EQ(result.status, ConfigStatus::Ok) << result.message;
	EXPECT_EQ(config.outer_loops, 1);
	EXPECT_EQ(config.inner_loops, 4);
	EXPECT_EQ(config.connect, "localhost:7000");
	EXPECT_EQ(config.timeout_ms, 2500u);
}

TEST_F(WpShellConfigTest, ExpandsEnvironmentVariables)
{
	setenv("WPSHELL_TEST_DIR", "/tmp/wp", 1);
	unsetenv("WPSHELL_TEST_UNSET");

	EXPECT_EQ(wpshell::ExpandEnv("${WPSHELL_TEST_DIR}/shell.log"), "/tmp/wp/shell.log");
	EXPECT_EQ(wpshell::ExpandEnv("a${WPSHELL_TEST_UNSET}b"), "ab");
	EXPECT_EQ(wpshell::ExpandEnv("${unterminated"), "${unterminated");

	ShellConfig config{};
	ASSERT_EQ(wpshell::ParseShellConfig({"--logfile", "${WPSHELL_TEST_DIR}/x.log"}, config).status,
	          ConfigStatus::Ok);
	EXPECT_EQ(config.logfile, "/tmp/wp/x.log");
}

TEST_F(WpShellConfigTest, ParsesHostAndPort)
{
	const auto endpoint = wpshell::ParseHostPort("127.0.0.1:6000");
	ASSERT_TRUE(endpoint.has_value());
	EXPECT_EQ(endpoint->host, "127.0.0.1");
	EXPECT_EQ(endpoint->port, 6000);

	EXPECT_FALSE(wpshell::ParseHostPort(":6000").has_value());
	EXPECT_FALSE(wpshell::ParseHostPort("host:").has_value());
	EXPECT_FALSE(wpshell::ParseHostPort("host:0").has_value());
}

} // namespace
