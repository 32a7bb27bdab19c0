// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_COMMAND_PROCESSOR_H
#define WPSHELL_COMMAND_PROCESSOR_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "wpshell/spectrometer.h"

namespace wpshell {

struct CommandResponse {
	bool ok             = false;
	std::string payload = {};
};

struct Command {
	std::string name              = {};
	std::vector<std::string> args = {};
};

class ICommandProcessor {
public:
	virtual ~ICommandProcessor() = default;

	// Number of positional arguments a command takes, nullopt if unknown.
	virtual std::optional<size_t> Arity(const std::string& name) const = 0;
	virtual CommandResponse HandleCommand(const Command& command)      = 0;
	virtual bool ConsumeExitRequest() { return false; }
	// Called when the input stream ends without an explicit close.
	virtual void Shutdown() {}
};

class CommandProcessor : public ICommandProcessor {
public:
	explicit CommandProcessor(SpectrometerOpener opener,
	                          std::function<void()> exit_handler = {});
	~CommandProcessor() override;
	CommandProcessor(const CommandProcessor&)            = delete;
	CommandProcessor& operator=(const CommandProcessor&) = delete;

	std::optional<size_t> Arity(const std::string& name) const override;
	CommandResponse HandleCommand(const Command& command) override;
	bool ConsumeExitRequest() override;
	void Shutdown() override;

	bool IsOpen() const { return static_cast<bool>(m_device); }
	std::vector<std::string> GetCommandNames() const;

private:
	using Arguments = std::vector<std::string>;
	using Handler   = std::function<CommandResponse(const Arguments&)>;

	struct CommandSpec {
		size_t arity         = 0;
		bool requires_device = true;
		std::string usage    = {};
		Handler handler      = {};
	};

	void RegisterCommands();
	void Register(const std::string& name, size_t arity, bool requires_device,
	              std::string usage, Handler handler);

	template <typename T>
	void RegisterGetter(const std::string& name,
	                    DeviceReading<T> (Spectrometer::*getter)());

	template <typename T>
	void RegisterSetter(const std::string& name, const std::string& usage,
	                    DeviceStatus (Spectrometer::*setter)(T));

	CommandResponse HandleOpen();
	CommandResponse HandleClose();
	CommandResponse HandleHelp() const;
	CommandResponse HandleStats() const;
	CommandResponse HandleConfigJson();
	CommandResponse HandleSetLaserPowerMw(const std::string& argument);
	CommandResponse HandleCalibrationQuery(bool (*present)(const SpectrometerInfo&));
	CommandResponse ReadLaserBoardAdc(uint8_t adc, bool calibrated);
	void ReleaseDevice();

	std::unordered_map<std::string, CommandSpec> m_commands;
	SpectrometerOpener m_opener;
	std::function<void()> m_exit_handler;
	std::unique_ptr<Spectrometer> m_device;
	uint64_t m_requests   = 0;
	uint64_t m_success    = 0;
	uint64_t m_failures   = 0;
	bool m_exit_requested = false;
};

} // namespace wpshell

#endif // WPSHELL_COMMAND_PROCESSOR_H
