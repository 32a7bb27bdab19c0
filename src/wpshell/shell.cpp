// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/shell.h"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include "misc/logging.h"
#include "wpshell/session.h"

namespace wpshell {

namespace {

constexpr int StopCheckIntervalMs = 200;
constexpr size_t ReadChunkSize    = 4096;

bool write_all(const int fd, const std::string& text)
{
	size_t written = 0;
	while (written < text.size()) {
		const auto result = ::write(fd, text.data() + written, text.size() - written);
		if (result < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG_WARNING("SHELL: write failed: %s", std::strerror(errno));
			return false;
		}
		written += static_cast<size_t>(result);
	}
	return true;
}

bool stopping(const StopRequested& stop_requested)
{
	return stop_requested && stop_requested();
}

} // namespace

int RunStdio(ICommandProcessor& processor, const int in_fd, const int out_fd,
             const StopRequested& stop_requested)
{
	ShellSession session(processor, [out_fd](const std::string& text) {
		return write_all(out_fd, text);
	});

	if (!session.Begin()) {
		processor.Shutdown();
		return 1;
	}

	char buffer[ReadChunkSize];
	while (!session.IsFinished()) {
		if (stopping(stop_requested)) {
			LOG_INFO("SHELL: stop requested");
			break;
		}

		pollfd pfd = {};
		pfd.fd     = in_fd;
		pfd.events = POLLIN;

		const auto ready = ::poll(&pfd, 1, StopCheckIntervalMs);
		if (ready < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG_ERR("SHELL: poll failed: %s", std::strerror(errno));
			session.EndOfInput();
			break;
		}
		if (ready == 0) {
			continue;
		}

		const auto received = ::read(in_fd, buffer, sizeof(buffer));
		if (received < 0) {
			if (errno == EINTR || errno == EAGAIN) {
				continue;
			}
			LOG_ERR("SHELL: read failed: %s", std::strerror(errno));
			session.EndOfInput();
			break;
		}
		if (received == 0) {
			session.EndOfInput();
			break;
		}

		session.Feed(std::string_view(buffer, static_cast<size_t>(received)));
	}

	// close and end of input have already released the device
	processor.Shutdown();
	return 0;
}

int RunServer(ICommandProcessor& processor, std::unique_ptr<NetworkBackend> backend,
              const uint16_t port, const StopRequested& stop_requested)
{
	ShellServer server(std::move(backend));
	if (!server.Start(port, processor)) {
		LOG_ERR("SHELL: unable to serve on port %u", static_cast<unsigned>(port));
		return 1;
	}

	while (!stopping(stop_requested)) {
		server.Poll(StopCheckIntervalMs);
	}

	LOG_INFO("SHELL: stop requested, %zu client(s) connected", server.SessionCount());
	server.Stop();
	return 0;
}

} // namespace wpshell
