// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_LOADTEST_TRANSPORT_H
#define WPSHELL_LOADTEST_TRANSPORT_H

#include <chrono>
#include <memory>
#include <string>

namespace wpshell {

struct ReadResult {
	enum class Status {
		Data,
		Timeout,
		Eof,
		Error,
	};

	Status status     = Status::Error;
	std::string data  = {};
	std::string error = {};
};

// Byte stream to a running shell.
class Transport {
public:
	virtual ~Transport() = default;

	virtual bool Write(const std::string& data)                = 0;
	virtual ReadResult Read(std::chrono::milliseconds timeout) = 0;
	virtual void Close()                                       = 0;
	virtual std::string Describe() const                       = 0;
};

struct TransportResult {
	std::unique_ptr<Transport> transport = {};
	std::string error                    = {};
};

} // namespace wpshell

#endif // WPSHELL_LOADTEST_TRANSPORT_H
