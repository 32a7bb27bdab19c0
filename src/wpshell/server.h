// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_SERVER_H
#define WPSHELL_SERVER_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "wpshell/command_processor.h"
#include "wpshell/session.h"

namespace wpshell {

using ClientHandle = uintptr_t;

constexpr size_t MaxShellClients = 8;

// Something that happened on a client connection since the last poll.
struct BackendEvent {
	enum class Type {
		Connected,
		Data,
		Closed,
	};

	Type type           = Type::Closed;
	ClientHandle client = 0;
	// Bytes received, only set for Data.
	std::string data = {};

	static BackendEvent Connected(const ClientHandle handle)
	{
		return {Type::Connected, handle, {}};
	}
	static BackendEvent Data(const ClientHandle handle, std::string bytes)
	{
		return {Type::Data, handle, std::move(bytes)};
	}
	static BackendEvent Closed(const ClientHandle handle)
	{
		return {Type::Closed, handle, {}};
	}
};

// Listening socket plus its accepted clients. Implemented with SDL_net for
// real use and faked in tests.
class NetworkBackend {
public:
	virtual ~NetworkBackend() = default;

	virtual bool Start(uint16_t port) = 0;
	// Closes every client and the listener.
	virtual void Stop() = 0;
	// Waits at most timeout_ms for activity before returning.
	virtual std::vector<BackendEvent> Poll(uint32_t timeout_ms) = 0;
	virtual bool Send(ClientHandle client, const std::string& payload) = 0;
	virtual void Close(ClientHandle client) = 0;
};

// Serves the shell protocol to TCP clients. All clients share one command
// processor, so they also share the opened spectrometer.
class ShellServer {
public:
	explicit ShellServer(std::unique_ptr<NetworkBackend> backend);
	~ShellServer();
	ShellServer(const ShellServer&)            = delete;
	ShellServer& operator=(const ShellServer&) = delete;

	bool Start(uint16_t port, ICommandProcessor& processor);
	void Stop();
	void Poll(uint32_t timeout_ms = 0);

	bool IsRunning() const { return m_running; }
	uint16_t Port() const { return m_port; }
	size_t SessionCount() const { return m_sessions.size(); }

private:
	void Accept(ClientHandle client);
	void HandleData(ClientHandle client, const std::string& data);
	void Drop(ClientHandle client);

	std::unique_ptr<NetworkBackend> m_backend;
	ICommandProcessor* m_processor = nullptr;
	std::unordered_map<ClientHandle, std::unique_ptr<ShellSession>> m_sessions;
	bool m_running  = false;
	uint16_t m_port = 0;
};

bool InitializeSdlNet();
std::unique_ptr<NetworkBackend> MakeSdlNetBackend();

} // namespace wpshell

#endif // WPSHELL_SERVER_H
