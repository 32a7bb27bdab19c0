// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/server.h"

#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "misc/logging.h"

#include <SDL_net.h>

namespace wpshell {

namespace {

constexpr int ReceiveChunkSize = 2048;

// SDL_net hands out opaque socket pointers; they double as client handles.
ClientHandle handle_of(TCPsocket socket)
{
	return reinterpret_cast<ClientHandle>(socket);
}

TCPsocket socket_of(const ClientHandle handle)
{
	return reinterpret_cast<TCPsocket>(handle);
}

std::string describe_peer(TCPsocket socket)
{
	const IPaddress* peer = SDLNet_TCP_GetPeerAddress(socket);
	if (!peer) {
		return "unknown peer";
	}
	const uint32_t host = SDLNet_Read32(&peer->host);
	return fmt::format("{}.{}.{}.{}:{}",
	                   (host >> 24) & 0xff,
	                   (host >> 16) & 0xff,
	                   (host >> 8) & 0xff,
	                   host & 0xff,
	                   SDLNet_Read16(&peer->port));
}

class SdlNetBackend final : public NetworkBackend {
public:
	SdlNetBackend() = default;
	~SdlNetBackend() override { Stop(); }
	SdlNetBackend(const SdlNetBackend&)            = delete;
	SdlNetBackend& operator=(const SdlNetBackend&) = delete;

	bool Start(const uint16_t port) override
	{
		Stop();
		if (!InitializeSdlNet()) {
			return false;
		}

		IPaddress address = {};
		if (SDLNet_ResolveHost(&address, nullptr, port) != 0) {
			LOG_ERR("SHELL: unable to bind port %u: %s",
			        static_cast<unsigned>(port), SDLNet_GetError());
			return false;
		}

		// the listener takes one slot on top of the clients
		m_watched = SDLNet_AllocSocketSet(static_cast<int>(MaxShellClients) + 1);
		m_listener = SDLNet_TCP_Open(&address);
		if (!m_watched || !m_listener ||
		    SDLNet_TCP_AddSocket(m_watched, m_listener) < 0) {
			LOG_ERR("SHELL: unable to listen on port %u: %s",
			        static_cast<unsigned>(port), SDLNet_GetError());
			Stop();
			return false;
		}

		LOG_INFO("SHELL: serving spectrometer shell on TCP port %u",
		         static_cast<unsigned>(port));
		return true;
	}

	void Stop() override
	{
		while (!m_peers.empty()) {
			Close(m_peers.begin()->first);
		}
		if (m_listener) {
			if (m_watched) {
				SDLNet_TCP_DelSocket(m_watched, m_listener);
			}
			SDLNet_TCP_Close(m_listener);
			m_listener = nullptr;
		}
		if (m_watched) {
			SDLNet_FreeSocketSet(m_watched);
			m_watched = nullptr;
		}
	}

	std::vector<BackendEvent> Poll(const uint32_t timeout_ms) override
	{
		std::vector<BackendEvent> events = {};
		if (!m_watched || SDLNet_CheckSockets(m_watched, timeout_ms) <= 0) {
			return events;
		}

		if (SDLNet_SocketReady(m_listener)) {
			AcceptWaiting(events);
		}

		std::vector<ClientHandle> ready = {};
		for (const auto& [handle, peer] : m_peers) {
			if (SDLNet_SocketReady(socket_of(handle))) {
				ready.push_back(handle);
			}
		}
		for (const auto handle : ready) {
			Receive(handle, events);
		}
		return events;
	}

	bool Send(const ClientHandle client, const std::string& payload) override
	{
		if (m_peers.count(client) == 0) {
			return false;
		}

		const char* cursor = payload.data();
		size_t left        = payload.size();
		while (left > 0) {
			const int sent = SDLNet_TCP_Send(socket_of(client), cursor, static_cast<int>(left));
			if (sent <= 0) {
				LOG_WARNING("SHELL: send to %s failed: %s",
				            m_peers[client].c_str(), SDLNet_GetError());
				return false;
			}
			cursor += sent;
			left -= static_cast<size_t>(sent);
		}
		return true;
	}

	void Close(const ClientHandle client) override
	{
		const auto peer = m_peers.find(client);
		if (peer == m_peers.end()) {
			return;
		}
		LOG_DEBUG("SHELL: closing connection from %s", peer->second.c_str());
		SDLNet_TCP_DelSocket(m_watched, socket_of(client));
		SDLNet_TCP_Close(socket_of(client));
		m_peers.erase(peer);
	}

private:
	void AcceptWaiting(std::vector<BackendEvent>& events)
	{
		for (TCPsocket socket = SDLNet_TCP_Accept(m_listener); socket;
		     socket           = SDLNet_TCP_Accept(m_listener)) {
			const auto peer = describe_peer(socket);
			if (m_peers.size() >= MaxShellClients ||
			    SDLNet_TCP_AddSocket(m_watched, socket) < 0) {
				LOG_WARNING("SHELL: turning away %s, %zu clients already connected",
				            peer.c_str(), m_peers.size());
				SDLNet_TCP_Close(socket);
				continue;
			}

			LOG_DEBUG("SHELL: accepted connection from %s", peer.c_str());
			m_peers.emplace(handle_of(socket), peer);
			events.push_back(BackendEvent::Connected(handle_of(socket)));
		}
	}

	void Receive(const ClientHandle client, std::vector<BackendEvent>& events)
	{
		char chunk[ReceiveChunkSize];
		const int received = SDLNet_TCP_Recv(socket_of(client), chunk, ReceiveChunkSize);
		if (received > 0) {
			events.push_back(BackendEvent::Data(client, std::string(chunk, received)));
			return;
		}
		Close(client);
		events.push_back(BackendEvent::Closed(client));
	}

	TCPsocket m_listener        = nullptr;
	SDLNet_SocketSet m_watched  = nullptr;
	// client handle to printable peer address
	std::unordered_map<ClientHandle, std::string> m_peers = {};
};

} // namespace

bool InitializeSdlNet()
{
	static bool initialized = false;
	if (initialized) {
		return true;
	}

	if (SDLNet_Init() < 0) {
		LOG_ERR("SHELL: SDLNet_Init failed: %s", SDLNet_GetError());
		return false;
	}
	std::atexit(SDLNet_Quit);
	initialized = true;
	return true;
}

ShellServer::ShellServer(std::unique_ptr<NetworkBackend> backend)
        : m_backend(std::move(backend)),
          m_processor(nullptr),
          m_sessions(),
          m_running(false),
          m_port(0)
{}

ShellServer::~ShellServer()
{
	Stop();
}

bool ShellServer::Start(const uint16_t port, ICommandProcessor& processor)
{
	if (!m_backend) {
		LOG_ERR("SHELL: no network backend available");
		return false;
	}

	Stop();
	if (!m_backend->Start(port)) {
		return false;
	}

	m_processor = &processor;
	m_port      = port;
	m_running   = true;
	return true;
}

void ShellServer::Stop()
{
	if (!m_running) {
		return;
	}

	while (!m_sessions.empty()) {
		Drop(m_sessions.begin()->first);
	}

	// the device outlives individual clients, so release it here
	m_processor->Shutdown();
	m_backend->Stop();

	m_processor = nullptr;
	m_port      = 0;
	m_running   = false;
}

void ShellServer::Poll(const uint32_t timeout_ms)
{
	if (!m_running) {
		return;
	}

	for (const auto& event : m_backend->Poll(timeout_ms)) {
		switch (event.type) {
		case BackendEvent::Type::Connected: Accept(event.client); break;
		case BackendEvent::Type::Data: HandleData(event.client, event.data); break;
		case BackendEvent::Type::Closed:
			if (m_sessions.erase(event.client) > 0) {
				LOG_INFO("SHELL: client hung up, %zu remaining", m_sessions.size());
			}
			break;
		}
	}
}

void ShellServer::Accept(const ClientHandle client)
{
	if (m_sessions.size() >= MaxShellClients) {
		LOG_WARNING("SHELL: refusing client, %zu sessions already open", m_sessions.size());
		m_backend->Close(client);
		return;
	}

	NetworkBackend& backend = *m_backend;
	auto session = std::make_unique<ShellSession>(*m_processor, [&backend, client](const std::string& text) {
		return backend.Send(client, text);
	});
	if (!session->Begin()) {
		m_backend->Close(client);
		return;
	}

	m_sessions.emplace(client, std::move(session));
	LOG_INFO("SHELL: client connected, %zu session(s) open", m_sessions.size());
}

void ShellServer::HandleData(const ClientHandle client, const std::string& data)
{
	const auto session = m_sessions.find(client);
	if (session == m_sessions.end()) {
		return;
	}

	session->second->Feed(data);
	if (session->second->IsFinished()) {
		Drop(client);
	}
}

void ShellServer::Drop(const ClientHandle client)
{
	m_sessions.erase(client);
	m_backend->Close(client);
}

std::unique_ptr<NetworkBackend> MakeSdlNetBackend()
{
	return std::make_unique<SdlNetBackend>();
}

} // namespace wpshell
