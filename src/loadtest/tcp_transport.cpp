// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "loadtest/tcp_transport.h"

#include <algorithm>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "misc/logging.h"
#include "wpshell/server.h"

#include <SDL_net.h>

namespace wpshell {

namespace {

constexpr size_t ReceiveBufferSize = 4096;
constexpr auto ConnectRetryInterval = std::chrono::milliseconds(100);

class TcpTransport final : public Transport {
public:
	TcpTransport(std::string endpoint, TCPsocket socket, SDLNet_SocketSet socket_set)
	        : m_endpoint(std::move(endpoint)),
	          m_socket(socket),
	          m_socket_set(socket_set)
	{}

	~TcpTransport() override { Close(); }

	TcpTransport(const TcpTransport&)            = delete;
	TcpTransport& operator=(const TcpTransport&) = delete;

	bool Write(const std::string& data) override
	{
		if (!m_socket) {
			return false;
		}

		size_t total_sent = 0;
		while (total_sent < data.size()) {
			const auto remaining = static_cast<int>(data.size() - total_sent);
			const auto chunk = SDLNet_TCP_Send(m_socket, data.data() + total_sent, remaining);
			if (chunk <= 0) {
				LOG_WARNING("LOADTEST: send to %s failed: %s",
				            m_endpoint.c_str(), SDLNet_GetError());
				return false;
			}
			total_sent += static_cast<size_t>(chunk);
		}
		return true;
	}

	ReadResult Read(const std::chrono::milliseconds timeout) override
	{
		if (!m_socket) {
			return {ReadResult::Status::Eof, {}, {}};
		}

		const auto wait_ms = static_cast<uint32_t>(std::max<int64_t>(0, timeout.count()));
		const auto ready   = SDLNet_CheckSockets(m_socket_set, wait_ms);
		if (ready < 0) {
			return {ReadResult::Status::Error, {}, SDLNet_GetError()};
		}
		if (ready == 0 || !SDLNet_SocketReady(m_socket)) {
			return {ReadResult::Status::Timeout, {}, {}};
		}

		char buffer[ReceiveBufferSize] = {};
		const auto received = SDLNet_TCP_Recv(m_socket, buffer, sizeof(buffer));
		if (received <= 0) {
			return {ReadResult::Status::Eof, {}, {}};
		}
		return {ReadResult::Status::Data, std::string(buffer, buffer + received), {}};
	}

	void Close() override
	{
		if (m_socket) {
			SDLNet_TCP_DelSocket(m_socket_set, m_socket);
			SDLNet_TCP_Close(m_socket);
			m_socket = nullptr;
		}
		if (m_socket_set) {
			SDLNet_FreeSocketSet(m_socket_set);
			m_socket_set = nullptr;
		}
	}

	std::string Describe() const override { return m_endpoint; }

private:
	std::string m_endpoint;
	TCPsocket m_socket            = nullptr;
	SDLNet_SocketSet m_socket_set = nullptr;
};

} // namespace

TransportResult ConnectTcp(const std::string& host, const uint16_t port,
                           const std::chrono::milliseconds connect_timeout)
{
	const auto endpoint = fmt::format("{}:{}", host, port);

	if (!InitializeSdlNet()) {
		return {nullptr, fmt::format("SDLNet_Init failed: {}", SDLNet_GetError())};
	}

	IPaddress address = {};
	if (SDLNet_ResolveHost(&address, host.c_str(), port) < 0) {
		return {nullptr, fmt::format("unable to resolve {}: {}", endpoint, SDLNet_GetError())};
	}

	const auto deadline = std::chrono::steady_clock::now() + connect_timeout;
	TCPsocket socket    = nullptr;
	for (;;) {
		socket = SDLNet_TCP_Open(&address);
		if (socket) {
			break;
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			return {nullptr, fmt::format("unable to connect to {}: {}", endpoint, SDLNet_GetError())};
		}
		std::this_thread::sleep_for(ConnectRetryInterval);
	}

	auto* socket_set = SDLNet_AllocSocketSet(1);
	if (!socket_set) {
		SDLNet_TCP_Close(socket);
		return {nullptr, fmt::format("SDLNet_AllocSocketSet failed: {}", SDLNet_GetError())};
	}
	if (SDLNet_TCP_AddSocket(socket_set, socket) < 0) {
		const auto reason = fmt::format("SDLNet_TCP_AddSocket failed: {}", SDLNet_GetError());
		SDLNet_FreeSocketSet(socket_set);
		SDLNet_TCP_Close(socket);
		return {nullptr, reason};
	}

	LOG_INFO("LOADTEST: connected to %s", endpoint.c_str());
	return {std::make_unique<TcpTransport>(endpoint, socket, socket_set), {}};
}

} // namespace wpshell
