// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>

#include "loadtest/load_test.h"
#include "loadtest/process_transport.h"
#include "loadtest/tcp_transport.h"
#include "misc/logging.h"
#include "wpshell/config.h"

namespace {

constexpr int UsageExitCode  = 2;
constexpr int LaunchExitCode = 1;

volatile std::sig_atomic_t g_cancel_requested = 0;

void handle_cancel_signal(int)
{
	g_cancel_requested = 1;
}

void install_signal_handlers()
{
	struct sigaction action = {};
	action.sa_handler       = handle_cancel_signal;
	sigemptyset(&action.sa_mask);
	sigaction(SIGINT, &action, nullptr);
	sigaction(SIGTERM, &action, nullptr);

	// a shell that dies mid-run must surface as a failed exchange
	std::signal(SIGPIPE, SIG_IGN);
}

wpshell::TransportResult open_transport(const wpshell::LoadTestConfig& config)
{
	const std::chrono::milliseconds launch_timeout(config.launch_timeout_ms);

	if (!config.connect.empty()) {
		const auto endpoint = wpshell::ParseHostPort(config.connect);
		if (!endpoint) {
			return {nullptr, "invalid --connect value '" + config.connect + "'"};
		}
		return wpshell::ConnectTcp(endpoint->host, endpoint->port, launch_timeout);
	}
	return wpshell::ProcessTransport::Spawn(config.shell, config.shell_args);
}

} // namespace

int main(int argc, char* argv[])
{
	const std::vector<std::string> args(argv + 1, argv + argc);

	wpshell::LoadTestConfig config = {};
	const auto parsed = wpshell::ParseLoadTestConfig(args, config);
	switch (parsed.status) {
	case wpshell::ConfigStatus::Ok: break;
	case wpshell::ConfigStatus::Help: std::cout << parsed.message; return 0;
	case wpshell::ConfigStatus::Error:
		std::cerr << "load-test: " << parsed.message << "\n";
		return UsageExitCode;
	}

	if (!LOG_Init("load-test", config.log_level, config.logfile)) {
		return UsageExitCode;
	}
	install_signal_handlers();

	auto opened = open_transport(config);
	if (!opened.transport) {
		std::cerr << "load-test: " << opened.error << "\n";
		LOG_ERR("LOADTEST: %s", opened.error.c_str());
		LOG_Shutdown();
		return LaunchExitCode;
	}

	wpshell::LoadTestPlan plan = {};
	plan.outer_loops      = config.outer_loops;
	plan.inner_loops      = config.inner_loops;
	plan.response_timeout = std::chrono::milliseconds(config.timeout_ms);
	plan.launch_timeout   = std::chrono::milliseconds(config.launch_timeout_ms);
	plan.settle_delay     = std::chrono::milliseconds(config.settle_ms);

	wpshell::LoadTestDriver driver(*opened.transport, plan, std::cout);
	driver.SetCancelPredicate([]() { return g_cancel_requested != 0; });

	const auto result = driver.Run();
	opened.transport->Close();

	std::cout << "round trips: " << result.stats.round_trips << "\n";
	if (result.outcome != wpshell::Outcome::Success) {
		std::cerr << "load-test: " << wpshell::DescribeFailure(result) << "\n";
	}

	const auto status = wpshell::ExitCode(result);
	LOG_INFO("LOADTEST: exiting with status %d", status);
	LOG_Shutdown();
	return status;
}
