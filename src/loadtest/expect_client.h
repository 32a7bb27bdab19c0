// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_LOADTEST_EXPECT_CLIENT_H
#define WPSHELL_LOADTEST_EXPECT_CLIENT_H

#include <chrono>
#include <string>

#include "loadtest/transport.h"

namespace wpshell {

struct ExpectResult {
	bool success = false;
	// On success the text that preceded the match, on failure everything
	// received and not yet consumed.
	std::string text  = {};
	std::string error = {};
};

// Blocking send/expect conversation over a transport. Waits are bounded and
// never retried.
class ExpectClient {
public:
	explicit ExpectClient(Transport& transport);
	ExpectClient(const ExpectClient&)            = delete;
	ExpectClient& operator=(const ExpectClient&) = delete;

	bool SendLine(const std::string& line);
	// Consumes input up to and including the first occurrence of pattern.
	ExpectResult Expect(const std::string& pattern, std::chrono::milliseconds timeout);
	ExpectResult ExpectEof(std::chrono::milliseconds timeout);

	bool AtEof() const { return m_eof; }

private:
	ExpectResult Fail(std::string error) const;

	Transport& m_transport;
	std::string m_buffer;
	bool m_eof = false;
};

} // namespace wpshell

#endif // WPSHELL_LOADTEST_EXPECT_CLIENT_H
