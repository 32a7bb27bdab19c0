// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "loadtest/process_transport.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include "misc/logging.h"

extern char** environ;

namespace wpshell {

namespace {

constexpr size_t ReadChunkSize = 4096;
constexpr auto ExitGracePeriod = std::chrono::milliseconds(1000);
constexpr auto ReapPollInterval = std::chrono::milliseconds(20);

void close_fd(int& fd)
{
	if (fd >= 0) {
		::close(fd);
		fd = -1;
	}
}

class FileActions {
public:
	FileActions() { m_ok = posix_spawn_file_actions_init(&m_actions) == 0; }
	~FileActions()
	{
		if (m_ok) {
			posix_spawn_file_actions_destroy(&m_actions);
		}
	}
	FileActions(const FileActions&)            = delete;
	FileActions& operator=(const FileActions&) = delete;

	bool Dup2(const int fd, const int target)
	{
		return m_ok && posix_spawn_file_actions_adddup2(&m_actions, fd, target) == 0;
	}

	posix_spawn_file_actions_t* Get() { return &m_actions; }

private:
	posix_spawn_file_actions_t m_actions = {};
	bool m_ok                            = false;
};

enum class Reap {
	Exited,
	Running,
	Failed,
};

Reap reap_within(const pid_t pid, const std::chrono::milliseconds timeout, int& status)
{
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	for (;;) {
		const pid_t result = ::waitpid(pid, &status, WNOHANG);
		if (result == pid) {
			return Reap::Exited;
		}
		if (result < 0 && errno != EINTR) {
			LOG_WARNING("LOADTEST: waitpid failed: %s", std::strerror(errno));
			return Reap::Failed;
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			return Reap::Running;
		}
		std::this_thread::sleep_for(ReapPollInterval);
	}
}

} // namespace

ProcessTransport::ProcessTransport(std::string program, const pid_t pid,
                                   const int to_child, const int from_child)
        : m_program(std::move(program)),
          m_pid(pid),
          m_to_child(to_child),
          m_from_child(from_child),
          m_exit_status(std::nullopt)
{}

ProcessTransport::~ProcessTransport()
{
	Close();
}

TransportResult ProcessTransport::Spawn(const std::string& program,
                                        const std::vector<std::string>& args)
{
	int to_child[2]   = {-1, -1};
	int from_child[2] = {-1, -1};

	if (::pipe2(to_child, O_CLOEXEC) != 0) {
		return {nullptr, fmt::format("pipe failed: {}", std::strerror(errno))};
	}
	if (::pipe2(from_child, O_CLOEXEC) != 0) {
		const auto reason = fmt::format("pipe failed: {}", std::strerror(errno));
		close_fd(to_child[0]);
		close_fd(to_child[1]);
		return {nullptr, reason};
	}

	auto close_all = [&]() {
		close_fd(to_child[0]);
		close_fd(to_child[1]);
		close_fd(from_child[0]);
		close_fd(from_child[1]);
	};

	// dup2 clears close-on-exec on the child's copies
	FileActions actions;
	if (!actions.Dup2(to_child[0], STDIN_FILENO) ||
	    !actions.Dup2(from_child[1], STDOUT_FILENO)) {
		close_all();
		return {nullptr, "unable to prepare spawn file actions"};
	}

	std::vector<char*> argv;
	argv.reserve(args.size() + 2);
	argv.push_back(const_cast<char*>(program.c_str()));
	for (const auto& arg : args) {
		argv.push_back(const_cast<char*>(arg.c_str()));
	}
	argv.push_back(nullptr);

	pid_t pid = -1;
	const int rc = posix_spawnp(&pid, program.c_str(), actions.Get(), nullptr,
	                            argv.data(), environ);
	if (rc != 0) {
		close_all();
		return {nullptr, fmt::format("unable to launch '{}': {}", program, std::strerror(rc))};
	}

	close_fd(to_child[0]);
	close_fd(from_child[1]);

	LOG_INFO("LOADTEST: launched '%s' as pid %d", program.c_str(), static_cast<int>(pid));
	std::unique_ptr<Transport> transport(
	        new ProcessTransport(program, pid, to_child[1], from_child[0]));
	return {std::move(transport), {}};
}

bool ProcessTransport::Write(const std::string& data)
{
	if (m_to_child < 0) {
		return false;
	}

	size_t written = 0;
	while (written < data.size()) {
		const auto result = ::write(m_to_child, data.data() + written, data.size() - written);
		if (result < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG_WARNING("LOADTEST: write to '%s' failed: %s",
			            m_program.c_str(), std::strerror(errno));
			return false;
		}
		written += static_cast<size_t>(result);
	}
	return true;
}

ReadResult ProcessTransport::Read(const std::chrono::milliseconds timeout)
{
	if (m_from_child < 0) {
		return {ReadResult::Status::Eof, {}, {}};
	}

	const auto deadline = std::chrono::steady_clock::now() + timeout;
	for (;;) {
		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
		        deadline - std::chrono::steady_clock::now());

		pollfd pfd = {};
		pfd.fd     = m_from_child;
		pfd.events = POLLIN;

		const auto ready = ::poll(&pfd, 1, static_cast<int>(std::max<int64_t>(0, remaining.count())));
		if (ready < 0) {
			if (errno == EINTR) {
				continue;
			}
			return {ReadResult::Status::Error, {}, fmt::format("poll failed: {}", std::strerror(errno))};
		}
		if (ready == 0) {
			return {ReadResult::Status::Timeout, {}, {}};
		}

		char buffer[ReadChunkSize];
		const auto received = ::read(m_from_child, buffer, sizeof(buffer));
		if (received < 0) {
			if (errno == EINTR) {
				continue;
			}
			return {ReadResult::Status::Error, {}, fmt::format("read failed: {}", std::strerror(errno))};
		}
		if (received == 0) {
			return {ReadResult::Status::Eof, {}, {}};
		}
		return {ReadResult::Status::Data, std::string(buffer, static_cast<size_t>(received)), {}};
	}
}

void ProcessTransport::Close()
{
	close_fd(m_to_child);
	close_fd(m_from_child);

	if (m_pid <= 0) {
		return;
	}

	int status  = 0;
	auto reaped = reap_within(m_pid, ExitGracePeriod, status);
	if (reaped == Reap::Running) {
		LOG_WARNING("LOADTEST: '%s' still running, sending SIGTERM", m_program.c_str());
		::kill(m_pid, SIGTERM);
		reaped = reap_within(m_pid, ExitGracePeriod, status);
	}
	if (reaped == Reap::Running) {
		LOG_WARNING("LOADTEST: '%s' ignored SIGTERM, sending SIGKILL", m_program.c_str());
		::kill(m_pid, SIGKILL);
		reaped = reap_within(m_pid, ExitGracePeriod, status);
	}

	if (reaped == Reap::Exited) {
		m_exit_status = status;
		LOG_DEBUG("LOADTEST: '%s' exited with status %d", m_program.c_str(), status);
	} else {
		LOG_WARNING("LOADTEST: unable to reap '%s' (pid %d)",
		            m_program.c_str(), static_cast<int>(m_pid));
	}
	m_pid = -1;
}

std::string ProcessTransport::Describe() const
{
	return m_program;
}

} // namespace wpshell
