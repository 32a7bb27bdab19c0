// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/config.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <utility>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include "misc/logging.h"
#include "wpshell/arguments.h"

namespace po = boost::program_options;

namespace wpshell {

namespace {

constexpr char ShellSection[]    = "shell.";
constexpr char LoadTestSection[] = "load_test.";

constexpr int64_t MaxTimeoutMs = 3600 * 1000;

// Short options are off so that a negative loop count stays positional.
constexpr int CommandLineStyle = po::command_line_style::unix_style ^
                                 po::command_line_style::allow_short;

ConfigResult ok()
{
	return {ConfigStatus::Ok, {}};
}

ConfigResult error(std::string message)
{
	return {ConfigStatus::Error, std::move(message)};
}

std::string key(const std::string& prefix, const char* name)
{
	return prefix + name;
}

template <typename T>
std::optional<T> lookup(const po::variables_map& vm, const std::string& name)
{
	const auto it = vm.find(name);
	if (it == vm.end() || it->second.empty()) {
		return std::nullopt;
	}
	return it->second.as<T>();
}

ConfigResult read_integer(const po::variables_map& vm, const std::string& name,
                          const int64_t min_value, const int64_t max_value,
                          int64_t& out)
{
	const auto text = lookup<std::string>(vm, name);
	if (!text) {
		return ok();
	}
	const auto value = ParseInteger(*text);
	if (!value || *value < min_value || *value > max_value) {
		return error(fmt::format("Invalid value '{}' for {}: expected an integer in [{}, {}]",
		                         *text, name, min_value, max_value));
	}
	out = *value;
	return ok();
}

ConfigResult read_log_level(const po::variables_map& vm, const std::string& name,
                            std::string& out)
{
	const auto level = lookup<std::string>(vm, name);
	if (!level) {
		return ok();
	}
	if (!LOG_ParseLevel(*level)) {
		return error(fmt::format("Invalid value '{}' for {}: expected trace, debug, info, warning or error",
		                         *level, name));
	}
	out = ToLower(*level);
	return ok();
}

ConfigResult load_config_file(const std::string& path, const po::options_description& desc,
                              po::variables_map& vm)
{
	std::ifstream in(path);
	if (!in) {
		return error(fmt::format("Unable to read config file '{}'", path));
	}

	try {
		// other sections of a shared file are not ours to reject
		po::store(po::parse_config_file(in, desc, true), vm);
	} catch (const po::error& ex) {
		return error(fmt::format("{}: {}", path, ex.what()));
	}
	return ok();
}

void add_shell_options(po::options_description& desc, const std::string& prefix)
{
	desc.add_options()
	        (key(prefix, "device").c_str(), po::value<std::string>(),
	         "Device backend: virtual (default) or none.")
	        (key(prefix, "port").c_str(), po::value<std::string>(),
	         "Serve the shell over TCP on this port (1024-65535) instead of stdio.")
	        (key(prefix, "log-level").c_str(), po::value<std::string>(),
	         "trace, debug, info (default), warning or error.")
	        (key(prefix, "logfile").c_str(), po::value<std::string>(),
	         "Log file (default wasatch-shell.log, \"\" for stderr). Supports ${ENV} expansion.");
}

ConfigResult apply_shell_options(const po::variables_map& vm, const std::string& prefix,
                                 ShellConfig& config)
{
	if (const auto device = lookup<std::string>(vm, key(prefix, "device"))) {
		const auto name = ToLower(*device);
		if (name != "virtual" && name != "none") {
			return error(fmt::format("Invalid value '{}' for {}device: expected virtual or none",
			                         *device, prefix));
		}
		config.device = name;
	}

	int64_t port = config.port;
	auto result  = read_integer(vm, key(prefix, "port"), 1024, 65535, port);
	if (result.status != ConfigStatus::Ok) {
		return result;
	}
	config.port = static_cast<uint16_t>(port);

	result = read_log_level(vm, key(prefix, "log-level"), config.log_level);
	if (result.status != ConfigStatus::Ok) {
		return result;
	}

	if (const auto logfile = lookup<std::string>(vm, key(prefix, "logfile"))) {
		config.logfile = ExpandEnv(*logfile);
	}
	return ok();
}

void add_load_test_options(po::options_description& desc, const std::string& prefix)
{
	desc.add_options()
	        (key(prefix, "shell").c_str(), po::value<std::string>(),
	         "Shell executable to launch (default ./wasatch-shell).")
	        (key(prefix, "shell-arg").c_str(), po::value<std::vector<std::string>>(),
	         "Extra argument for the shell; may be repeated.")
	        (key(prefix, "connect").c_str(), po::value<std::string>(),
	         "Drive a shell served over TCP at HOST:PORT instead of launching one.")
	        (key(prefix, "timeout-ms").c_str(), po::value<std::string>(),
	         "Per-response timeout in milliseconds (default 1000).")
	        (key(prefix, "launch-timeout-ms").c_str(), po::value<std::string>(),
	         "Timeout for the shell banner in milliseconds (default 5000).")
	        (key(prefix, "settle-ms").c_str(), po::value<std::string>(),
	         "Pause at the start of each pass in milliseconds (default 2000).")
	        (key(prefix, "log-level").c_str(), po::value<std::string>(),
	         "trace, debug, info (default), warning or error.")
	        (key(prefix, "logfile").c_str(), po::value<std::string>(),
	         "Transcript log (default load-test.log, \"\" for stderr).");
}

void add_loop_options(po::options_description& desc, const std::string& prefix)
{
	desc.add_options()
	        (key(prefix, "outer").c_str(), po::value<std::string>(),
	         "Number of passes, 0 or less runs forever (default 5).")
	        (key(prefix, "inner").c_str(), po::value<std::string>(),
	         "Query iterations per pass, 0 or less runs forever (default 10).");
}

ConfigResult apply_load_test_options(const po::variables_map& vm, const std::string& prefix,
                                     LoadTestConfig& config)
{
	constexpr int64_t loop_limit = std::numeric_limits<int32_t>::max();

	auto result = read_integer(vm, key(prefix, "outer"), -loop_limit, loop_limit,
	                           config.outer_loops);
	if (result.status != ConfigStatus::Ok) {
		return result;
	}
	result = read_integer(vm, key(prefix, "inner"), -loop_limit, loop_limit,
	                      config.inner_loops);
	if (result.status != ConfigStatus::Ok) {
		return result;
	}

	if (const auto shell = lookup<std::string>(vm, key(prefix, "shell"))) {
		config.shell = ExpandEnv(*shell);
	}
	if (const auto args = lookup<std::vector<std::string>>(vm, key(prefix, "shell-arg"))) {
		config.shell_args = *args;
	}
	if (const auto connect = lookup<std::string>(vm, key(prefix, "connect"))) {
		if (!connect->empty() && !ParseHostPort(*connect)) {
			return error(fmt::format("Invalid value '{}' for {}connect: expected HOST:PORT",
			                         *connect, prefix));
		}
		config.connect = *connect;
	}

	const struct {
		const char* name;
		int64_t min_value;
		uint32_t& target;
	} timings[] = {
	        {"timeout-ms", 1, config.timeout_ms},
	        {"launch-timeout-ms", 1, config.launch_timeout_ms},
	        {"settle-ms", 0, config.settle_ms},
	};
	for (const auto& timing : timings) {
		int64_t value = timing.target;
		result = read_integer(vm, key(prefix, timing.name), timing.min_value, MaxTimeoutMs, value);
		if (result.status != ConfigStatus::Ok) {
			return result;
		}
		timing.target = static_cast<uint32_t>(value);
	}

	result = read_log_level(vm, key(prefix, "log-level"), config.log_level);
	if (result.status != ConfigStatus::Ok) {
		return result;
	}

	if (const auto logfile = lookup<std::string>(vm, key(prefix, "logfile"))) {
		config.logfile = ExpandEnv(*logfile);
	}
	return ok();
}

std::string usage(const char* synopsis, const po::options_description& desc)
{
	std::ostringstream oss;
	oss << "Usage: " << synopsis << "\n\n" << desc;
	return oss.str();
}

} // namespace

std::string ExpandEnv(const std::string& value)
{
	std::string result;
	result.reserve(value.size());

	size_t pos = 0;
	while (pos < value.size()) {
		const auto start = value.find("${", pos);
		if (start == std::string::npos) {
			result.append(value.substr(pos));
			break;
		}
		result.append(value.substr(pos, start - pos));
		const auto end = value.find('}', start + 2);
		if (end == std::string::npos) {
			result.append(value.substr(start));
			break;
		}
		const auto name = value.substr(start + 2, end - (start + 2));
		if (const char* env_value = std::getenv(name.c_str())) {
			result.append(env_value);
		}
		pos = end + 1;
	}

	return result;
}

std::optional<HostPort> ParseHostPort(const std::string& text)
{
	const auto colon = text.rfind(':');
	if (colon == std::string::npos || colon == 0) {
		return std::nullopt;
	}

	const auto port = ParseInteger(std::string_view(text).substr(colon + 1));
	if (!port || *port < 1 || *port > 65535) {
		return std::nullopt;
	}
	return HostPort{text.substr(0, colon), static_cast<uint16_t>(*port)};
}

ConfigResult ParseShellConfig(const std::vector<std::string>& args, ShellConfig& config)
{
	po::options_description cli("wasatch-shell options");
	cli.add_options()
	        ("help", "Show this help and exit.")
	        ("config", po::value<std::string>(), "INI file with a [shell] section.");
	add_shell_options(cli, "");

	// wasatch-shell takes no positional arguments
	const po::positional_options_description none;

	po::variables_map cli_vm;
	try {
		po::store(po::command_line_parser(args)
		                  .options(cli)
		                  .positional(none)
		                  .style(CommandLineStyle)
		                  .run(),
		          cli_vm);
	} catch (const po::error& ex) {
		return error(ex.what());
	}

	if (cli_vm.count("help")) {
		return {ConfigStatus::Help, usage("wasatch-shell [options]", cli)};
	}

	if (const auto path = lookup<std::string>(cli_vm, "config")) {
		po::options_description file;
		add_shell_options(file, ShellSection);

		po::variables_map file_vm;
		const auto loaded = load_config_file(ExpandEnv(*path), file, file_vm);
		if (loaded.status != ConfigStatus::Ok) {
			return loaded;
		}
		const auto applied = apply_shell_options(file_vm, ShellSection, config);
		if (applied.status != ConfigStatus::Ok) {
			return applied;
		}
	}

	return apply_shell_options(cli_vm, "", config);
}

ConfigResult ParseLoadTestConfig(const std::vector<std::string>& args, LoadTestConfig& config)
{
	po::options_description cli("load-test options");
	cli.add_options()
	        ("help", "Show this help and exit.")
	        ("config", po::value<std::string>(), "INI file with a [load_test] section.");
	add_load_test_options(cli, "");

	po::options_description loops;
	add_loop_options(loops, "");

	po::options_description all;
	all.add(cli).add(loops);

	po::positional_options_description positional;
	positional.add("outer", 1).add("inner", 1);

	po::variables_map cli_vm;
	try {
		po::store(po::command_line_parser(args)
		                  .options(all)
		                  .positional(positional)
		                  .style(CommandLineStyle)
		                  .run(),
		          cli_vm);
	} catch (const po::error& ex) {
		return error(ex.what());
	}

	if (cli_vm.count("help")) {
		return {ConfigStatus::Help,
		        usage("load-test [outer_loop_count] [inner_loop_count] [options]", cli)};
	}

	if (const auto path = lookup<std::string>(cli_vm, "config")) {
		po::options_description file;
		add_load_test_options(file, LoadTestSection);
		add_loop_options(file, LoadTestSection);

		po::variables_map file_vm;
		const auto loaded = load_config_file(ExpandEnv(*path), file, file_vm);
		if (loaded.status != ConfigStatus::Ok) {
			return loaded;
		}
		const auto applied = apply_load_test_options(file_vm, LoadTestSection, config);
		if (applied.status != ConfigStatus::Ok) {
			return applied;
		}
	}

	return apply_load_test_options(cli_vm, "", config);
}

} // namespace wpshell
