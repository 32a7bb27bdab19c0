// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_LOADTEST_PROCESS_TRANSPORT_H
#define WPSHELL_LOADTEST_PROCESS_TRANSPORT_H

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "loadtest/transport.h"

namespace wpshell {

// Child process with its stdin and stdout connected through pipes. Stderr is
// inherited.
class ProcessTransport final : public Transport {
public:
	~ProcessTransport() override;
	ProcessTransport(const ProcessTransport&)            = delete;
	ProcessTransport& operator=(const ProcessTransport&) = delete;

	static TransportResult Spawn(const std::string& program,
	                             const std::vector<std::string>& args);

	bool Write(const std::string& data) override;
	ReadResult Read(std::chrono::milliseconds timeout) override;
	// Closes the pipes and reaps the child, terminating it if it lingers.
	void Close() override;
	std::string Describe() const override;

	// Raw waitpid status once the child has been reaped.
	std::optional<int> ExitStatus() const { return m_exit_status; }

private:
	ProcessTransport(std::string program, pid_t pid, int to_child, int from_child);

	std::string m_program;
	pid_t m_pid      = -1;
	int m_to_child   = -1;
	int m_from_child = -1;
	std::optional<int> m_exit_status = std::nullopt;
};

} // namespace wpshell

#endif // WPSHELL_LOADTEST_PROCESS_TRANSPORT_H
