// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/session.h"

#include <iterator>
#include <utility>

#include "misc/logging.h"
#include "wpshell/arguments.h"
#include "wpshell/protocol.h"

namespace wpshell {

namespace {

bool is_comment(const std::string_view trimmed)
{
	return !trimmed.empty() && trimmed.front() == '#';
}

} // namespace

ShellSession::ShellSession(ICommandProcessor& processor, Writer writer)
        : m_processor(processor),
          m_writer(std::move(writer)),
          m_buffer(),
          m_pending(std::nullopt),
          m_finished(false)
{}

bool ShellSession::Begin()
{
	std::string greeting(BannerPrefix);
	greeting.append(ShellVersion);
	greeting.push_back('\n');
	greeting.append(Prompt);
	return Write(greeting);
}

void ShellSession::Feed(const std::string_view data)
{
	if (m_finished) {
		return;
	}

	m_buffer.append(data);

	while (!m_finished) {
		const auto eol = m_buffer.find_first_of("\r\n");
		if (eol == std::string::npos) {
			break;
		}

		const std::string line = m_buffer.substr(0, eol);
		m_buffer.erase(0, eol + 1);
		HandleLine(line);
	}
}

void ShellSession::EndOfInput()
{
	if (m_finished) {
		return;
	}

	if (!m_buffer.empty()) {
		const std::string line = std::move(m_buffer);
		m_buffer.clear();
		HandleLine(line);
	}

	if (m_finished) {
		return;
	}

	if (m_pending) {
		LOG_WARNING("SHELL: input ended while '%s' was waiting for %zu more argument(s)",
		            m_pending->command.name.c_str(),
		            m_pending->arity - m_pending->command.args.size());
		m_pending.reset();
	}

	LOG_INFO("SHELL: end of input");
	m_processor.Shutdown();
	m_finished = true;
}

void ShellSession::HandleLine(const std::string_view line)
{
	const auto trimmed = Trim(line);
	if (trimmed.empty() || is_comment(trimmed)) {
		return;
	}

	auto tokens = Tokenize(trimmed);

	if (m_pending) {
		auto& args = m_pending->command.args;
		for (auto& token : tokens) {
			args.push_back(std::move(token));
		}
		if (args.size() < m_pending->arity) {
			return;
		}
		const auto command = std::move(m_pending->command);
		m_pending.reset();
		Dispatch(command);
		return;
	}

	Command command{};
	command.name = std::move(tokens.front());
	command.args.assign(std::make_move_iterator(tokens.begin() + 1),
	                    std::make_move_iterator(tokens.end()));

	const auto arity = m_processor.Arity(command.name);
	if (arity && command.args.size() < *arity) {
		m_pending = PendingCommand{std::move(command), *arity};
		return;
	}

	Dispatch(command);
}

void ShellSession::Dispatch(const Command& command)
{
	auto response = m_processor.HandleCommand(command);

	if (m_processor.ConsumeExitRequest()) {
		if (!response.payload.empty()) {
			Write(response.payload);
		}
		m_buffer.clear();
		m_finished = true;
		return;
	}

	response.payload.append(Prompt);
	Write(response.payload);
}

bool ShellSession::Write(const std::string& text)
{
	if (!m_writer || m_writer(text)) {
		return true;
	}

	LOG_WARNING("SHELL: peer stopped accepting output");
	m_finished = true;
	return false;
}

} // namespace wpshell
