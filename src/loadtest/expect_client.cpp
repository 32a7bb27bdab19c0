// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "loadtest/expect_client.h"

#include <utility>

#include "misc/logging.h"

namespace wpshell {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds remaining_until(const Clock::time_point deadline)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
}

// Transcript lines are logged without their trailing newline.
std::string chomp(std::string text)
{
	while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
		text.pop_back();
	}
	return text;
}

} // namespace

ExpectClient::ExpectClient(Transport& transport)
        : m_transport(transport),
          m_buffer(),
          m_eof(false)
{}

bool ExpectClient::SendLine(const std::string& line)
{
	LOG_DEBUG("LOADTEST: >> %s", line.c_str());
	return m_transport.Write(line + "\n");
}

ExpectResult ExpectClient::Expect(const std::string& pattern, const std::chrono::milliseconds timeout)
{
	const auto deadline = Clock::now() + timeout;

	for (;;) {
		const auto pos = m_buffer.find(pattern);
		if (pos != std::string::npos) {
			ExpectResult result = {};
			result.success      = true;
			result.text         = m_buffer.substr(0, pos);
			m_buffer.erase(0, pos + pattern.size());
			LOG_DEBUG("LOADTEST: << %s", chomp(result.text + pattern).c_str());
			return result;
		}

		if (m_eof) {
			return Fail("end of stream");
		}

		const auto remaining = remaining_until(deadline);
		if (remaining.count() <= 0) {
			return Fail("timeout");
		}

		auto read = m_transport.Read(remaining);
		switch (read.status) {
		case ReadResult::Status::Data:
			m_buffer.append(read.data);
			break;
		case ReadResult::Status::Timeout:
			return Fail("timeout");
		case ReadResult::Status::Eof:
			m_eof = true;
			break;
		case ReadResult::Status::Error:
			return Fail(std::move(read.error));
		}
	}
}

ExpectResult ExpectClient::ExpectEof(const std::chrono::milliseconds timeout)
{
	const auto deadline = Clock::now() + timeout;

	while (!m_eof) {
		const auto remaining = remaining_until(deadline);
		if (remaining.count() <= 0) {
			return Fail("timeout");
		}

		auto read = m_transport.Read(remaining);
		switch (read.status) {
		case ReadResult::Status::Data:
			m_buffer.append(read.data);
			break;
		case ReadResult::Status::Timeout:
			return Fail("timeout");
		case ReadResult::Status::Eof:
			m_eof = true;
			break;
		case ReadResult::Status::Error:
			return Fail(std::move(read.error));
		}
	}

	ExpectResult result = {};
	result.success      = true;
	result.text         = std::exchange(m_buffer, {});
	LOG_DEBUG("LOADTEST: << <eof>");
	return result;
}

ExpectResult ExpectClient::Fail(std::string error) const
{
	LOG_DEBUG("LOADTEST: expect failed (%s), buffered '%s'", error.c_str(), m_buffer.c_str());

	ExpectResult result = {};
	result.success      = false;
	result.text         = m_buffer;
	result.error        = std::move(error);
	return result;
}

} // namespace wpshell
