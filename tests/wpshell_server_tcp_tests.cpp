// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/server.h"

#include "wpshell/command_processor.h"
#include "wpshell/spectrometer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using wpshell::BackendEvent;
using wpshell::ClientHandle;
using wpshell::CommandProcessor;
using wpshell::NetworkBackend;
using wpshell::ShellServer;
using wpshell::Spectrometer;
using wpshell::VirtualSpectrometer;

const std::string Greeting = "wasatch-shell version 1.1.0\nwp> ";

class FakeBackend : public NetworkBackend {
public:
	bool Start(const uint16_t port) override
	{
		started_port = port;
		return start_result;
	}

	void Stop() override { stopped = true; }

	std::vector<BackendEvent> Poll(const uint32_t /*timeout_ms*/) override
	{
		if (pending_events.empty()) {
			return {};
		}

		auto events = std::move(pending_events.front());
		pending_events.pop_front();
		return events;
	}

	bool Send(const ClientHandle client, const std::string& payload) override
	{
		sent.emplace_back(client, payload);
		return send_result;
	}

	void Close(const ClientHandle client) override
	{
		closed_clients.push_back(client);
	}

	void QueueEvents(std::vector<BackendEvent> events)
	{
		pending_events.emplace_back(std::move(events));
	}

	std::string SentTo(const ClientHandle client) const
	{
		std::string text;
		for (const auto& [handle, payload] : sent) {
			if (handle == client) {
				text += payload;
			}
		}
		return text;
	}

	bool WasClosed(const ClientHandle client) const
	{
		return std::find(closed_clients.begin(), closed_clients.end(), client) !=
		       closed_clients.end();
	}

	uint16_t started_port = 0;
	bool start_result     = true;
	bool stopped          = false;
	bool send_result      = true;

	std::deque<std::vector<BackendEvent>> pending_events = {};
	std::vector<std::pair<ClientHandle, std::string>> sent = {};
	std::vector<ClientHandle> closed_clients               = {};
};

class WpShellServerTcpTest : public ::testing::Test {
protected:
	WpShellServerTcpTest()
	        : processor([]() -> std::unique_ptr<Spectrometer> {
		          return std::make_unique<VirtualSpectrometer>();
	          })
	{}

	void SetUp() override
	{
		auto owned = std::make_unique<FakeBackend>();
		backend    = owned.get();
		server     = std::make_unique<ShellServer>(std::move(owned));
		ASSERT_TRUE(server->Start(6123, processor));
	}

	void Deliver(std::vector<BackendEvent> events)
	{
		backend->QueueEvents(std::move(events));
		server->Poll();
	}

	CommandProcessor processor;
	FakeBackend* backend = nullptr;
	std::unique_ptr<ShellServer> server;
};

TEST_F(WpShellServerTcpTest, StartsAndStops)
{
	EXPECT_EQ(backend->started_port, 6123);
	EXPECT_TRUE(server->IsRunning());

	server->Stop();
	EXPECT_TRUE(backend->stopped);
	EXPECT_FALSE(server->IsRunning());
}

TEST_F(WpShellServerTcpTest, FailedStartIsReported)
{
	auto owned = std::make_unique<FakeBackend>();
	owned->start_result = false;
	ShellServer other(std::move(owned));

	EXPECT_FALSE(other.Start(6124, processor));
	EXPECT_FALSE(other.IsRunning());
}

TEST_F(WpShellServerTcpTest, GreetsNewClients)
{
	const ClientHandle client = 1;

	Deliver({BackendEvent::Connected(client)});

	EXPECT_EQ(server->SessionCount(), 1u);
	EXPECT_EQ(backend->SentTo(client), Greeting);
}

TEST_F(WpShellServerTcpTest, DispatchesCommands)
{
	const ClientHandle client = 1;

	Deliver({BackendEvent::Connected(client)});
	Deliver({BackendEvent::Data(client, "open\nget_integration_time_ms\n")});

	EXPECT_EQ(backend->SentTo(client), Greeting + "1\nwp> 10\nwp> ");
}

TEST_F(WpShellServerTcpTest, HandlesPartialLines)
{
	const ClientHandle client = 1;

	Deliver({BackendEvent::Connected(client)});
	Deliver({BackendEvent::Data(client, "op")});
	EXPECT_EQ(backend->SentTo(client), Greeting);

	Deliver({BackendEvent::Data(client, "en\r\n")});
	EXPECT_EQ(backend->SentTo(client), Greeting + "1\nwp> ");
}

TEST_F(WpShellServerTcpTest, SessionsKeepSeparateBuffers)
{
	const ClientHandle first  = 1;
	const ClientHandle second = 2;

	Deliver({BackendEvent::Connected(first), BackendEvent::Connected(second)});
	Deliver({BackendEvent::Data(first, "set_integration_time_ms\n"),
	         BackendEvent::Data(second, "open\n")});
	Deliver({BackendEvent::Data(first, "250\n")});

	// both clients share the device the second one opened
	EXPECT_EQ(backend->SentTo(first), Greeting + "1\nwp> ");
	EXPECT_EQ(backend->SentTo(second), Greeting + "1\nwp> ");
}

TEST_F(WpShellServerTcpTest, CloseDropsOnlyThatClient)
{
	const ClientHandle first  = 1;
	const ClientHandle second = 2;

	Deliver({BackendEvent::Connected(first), BackendEvent::Connected(second)});
	Deliver({BackendEvent::Data(first, "open\nclose\n")});

	EXPECT_TRUE(backend->WasClosed(first));
	EXPECT_FALSE(backend->WasClosed(second));
	EXPECT_EQ(server->SessionCount(), 1u);
	EXPECT_FALSE(processor.IsOpen());

	Deliver({BackendEvent::Data(second, "get_tec_enabled\n")});
	EXPECT_EQ(backend->SentTo(second), Greeting + "0\nwp> ");
}

TEST_F(WpShellServerTcpTest, DisconnectKeepsDeviceOpen)
{
	const ClientHandle client = 1;

	Deliver({BackendEvent::Connected(client)});
	Deliver({BackendEvent::Data(client, "open\n")});
	Deliver({BackendEvent::Closed(client)});

	EXPECT_EQ(server->SessionCount(), 0u);
	EXPECT_TRUE(processor.IsOpen());
}

TEST_F(WpShellServerTcpTest, RejectsClientsBeyondLimit)
{
	std::vector<BackendEvent> events;
	for (ClientHandle client = 1; client <= wpshell::MaxShellClients + 1; ++client) {
		events.push_back(BackendEvent::Connected(client));
	}

	Deliver(std::move(events));

	const ClientHandle rejected = wpshell::MaxShellClients + 1;
	EXPECT_EQ(server->SessionCount(), wpshell::MaxShellClients);
	EXPECT_TRUE(backend->WasClosed(rejected));
	EXPECT_TRUE(backend->SentTo(rejected).empty());
}

TEST_F(WpShellServerTcpTest, SendFailureDropsClient)
{
	const ClientHandle client = 1;

	Deliver({BackendEvent::Connected(client)});
	backend->send_result = false;
	Deliver({BackendEvent::Data(client, "open\n")});

	EXPECT_TRUE(backend->WasClosed(client));
	EXPECT_EQ(server->SessionCount(), 0u);
}

TEST_F(WpShellServerTcpTest, StopReleasesDevice)
{
	const ClientHandle client = 1;

	Deliver({BackendEvent::Connected(client)});
	Deliver({BackendEvent::Data(client, "open\n")});
	ASSERT_TRUE(processor.IsOpen());

	server->Stop();

	EXPECT_FALSE(processor.IsOpen());
	EXPECT_TRUE(backend->WasClosed(client));
}

} // namespace
