// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_CONFIG_H
#define WPSHELL_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wpshell {

struct ShellConfig {
	std::string device    = "virtual";
	uint16_t port         = 0; // 0 serves stdio
	std::string log_level = "info";
	std::string logfile   = "wasatch-shell.log";
};

struct LoadTestConfig {
	int64_t outer_loops                 = 5;
	int64_t inner_loops                 = 10;
	std::string shell                   = "./wasatch-shell";
	std::vector<std::string> shell_args = {};
	std::string connect                 = {};
	uint32_t timeout_ms                 = 1000;
	uint32_t launch_timeout_ms          = 5000;
	uint32_t settle_ms                  = 2000;
	std::string log_level               = "info";
	std::string logfile                 = "load-test.log";
};

enum class ConfigStatus {
	Ok,
	Help,
	Error,
};

struct ConfigResult {
	ConfigStatus status = ConfigStatus::Ok;
	// Usage text for Help, the reason for Error.
	std::string message = {};
};

// Settings come from the defaults above, then the [shell] or [load_test]
// section of --config, then the command line. args excludes argv[0].
ConfigResult ParseShellConfig(const std::vector<std::string>& args, ShellConfig& config);
ConfigResult ParseLoadTestConfig(const std::vector<std::string>& args, LoadTestConfig& config);

// Replaces ${NAME} with the environment variable, or nothing when unset.
std::string ExpandEnv(const std::string& value);

struct HostPort {
	std::string host = {};
	uint16_t port    = 0;
};

std::optional<HostPort> ParseHostPort(const std::string& text);

} // namespace wpshell

#endif // WPSHELL_CONFIG_H
