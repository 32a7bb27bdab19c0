// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_SESSION_H
#define WPSHELL_SESSION_H

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "wpshell/command_processor.h"

namespace wpshell {

// One shell conversation. Raw input goes in through Feed(), responses come
// out through the writer, each terminated by the prompt.
class ShellSession {
public:
	// Returns false when the peer can no longer be written to.
	using Writer = std::function<bool(const std::string&)>;

	ShellSession(ICommandProcessor& processor, Writer writer);
	ShellSession(const ShellSession&)            = delete;
	ShellSession& operator=(const ShellSession&) = delete;

	// Emits the banner and the first prompt.
	bool Begin();
	void Feed(std::string_view data);
	// Flushes an unterminated last line, then shuts the processor down.
	void EndOfInput();

	bool IsFinished() const { return m_finished; }
	bool HasPendingCommand() const { return m_pending.has_value(); }

private:
	struct PendingCommand {
		Command command = {};
		size_t arity    = 0;
	};

	void HandleLine(std::string_view line);
	void Dispatch(const Command& command);
	bool Write(const std::string& text);

	ICommandProcessor& m_processor;
	Writer m_writer;
	std::string m_buffer;
	std::optional<PendingCommand> m_pending;
	bool m_finished = false;
};

} // namespace wpshell

#endif // WPSHELL_SESSION_H
