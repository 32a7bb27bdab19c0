// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>
#include <unistd.h>

#include "misc/logging.h"
#include "wpshell/command_processor.h"
#include "wpshell/config.h"
#include "wpshell/protocol.h"
#include "wpshell/server.h"
#include "wpshell/shell.h"
#include "wpshell/spectrometer.h"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int)
{
	g_stop_requested = 1;
}

void install_signal_handlers()
{
	struct sigaction action = {};
	action.sa_handler       = handle_stop_signal;
	sigemptyset(&action.sa_mask);
	// no SA_RESTART: a blocked poll() must wake up and see the flag
	sigaction(SIGINT, &action, nullptr);
	sigaction(SIGTERM, &action, nullptr);

	std::signal(SIGPIPE, SIG_IGN);
}

} // namespace

int main(int argc, char* argv[])
{
	const std::vector<std::string> args(argv + 1, argv + argc);

	wpshell::ShellConfig config = {};
	const auto parsed = wpshell::ParseShellConfig(args, config);
	switch (parsed.status) {
	case wpshell::ConfigStatus::Ok: break;
	case wpshell::ConfigStatus::Help: std::cout << parsed.message; return 0;
	case wpshell::ConfigStatus::Error:
		std::cerr << "wasatch-shell: " << parsed.message << "\n";
		return 2;
	}

	if (!LOG_Init("wasatch-shell", config.log_level, config.logfile)) {
		return 2;
	}
	install_signal_handlers();

	LOG_INFO("SHELL: wasatch-shell %s starting with the %s device backend",
	         std::string(wpshell::ShellVersion).c_str(),
	         config.device.c_str());

	const auto stop_requested = []() { return g_stop_requested != 0; };

	wpshell::CommandProcessor processor(wpshell::MakeSpectrometerOpener(config.device));

	int status = 0;
	if (config.port != 0) {
		status = wpshell::RunServer(processor, wpshell::MakeSdlNetBackend(),
		                            config.port, stop_requested);
	} else {
		status = wpshell::RunStdio(processor, STDIN_FILENO, STDOUT_FILENO, stop_requested);
	}

	LOG_INFO("SHELL: exiting with status %d", status);
	LOG_Shutdown();
	return status;
}
