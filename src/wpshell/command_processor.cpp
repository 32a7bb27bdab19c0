// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/command_processor.h"

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "misc/logging.h"
#include "wpshell/arguments.h"
#include "wpshell/protocol.h"

namespace wpshell {

namespace {

CommandResponse Ack()
{
	return {true, std::string(AckTrue)};
}

CommandResponse Nak()
{
	return {false, std::string(AckFalse)};
}

CommandResponse FromStatus(const std::string& command, const DeviceStatus& status)
{
	if (!status.success) {
		LOG_ERR("SHELL: %s failed: %s", command.c_str(), status.error.c_str());
		return Nak();
	}
	return Ack();
}

template <typename T>
std::string FormatValue(const T& value)
{
	if constexpr (std::is_same_v<T, bool>) {
		return value ? "1" : "0";
	} else if constexpr (std::is_floating_point_v<T>) {
		return fmt::format("{:.2f}", value);
	} else {
		return fmt::format("{}", value);
	}
}

template <typename T>
std::optional<T> ParseArgument(const std::string& token)
{
	if constexpr (std::is_same_v<T, bool>) {
		return ParseBool(token);
	} else if constexpr (std::is_floating_point_v<T>) {
		return ParseFloat(token);
	} else {
		const auto value = ParseInteger(token);
		if (!value || *value < 0 ||
		    static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
			return std::nullopt;
		}
		return static_cast<T>(*value);
	}
}

bool HasLinearityCoeffs(const SpectrometerInfo& info)
{
	return !info.linearity_coeffs.empty();
}

bool HasLaserPowerCalibration(const SpectrometerInfo& info)
{
	return !info.laser_power_coeffs.empty();
}

} // namespace

CommandProcessor::CommandProcessor(SpectrometerOpener opener, std::function<void()> exit_handler)
        : m_commands(),
          m_opener(std::move(opener)),
          m_exit_handler(std::move(exit_handler)),
          m_device(),
          m_requests(0),
          m_success(0),
          m_failures(0),
          m_exit_requested(false)
{
	RegisterCommands();
}

CommandProcessor::~CommandProcessor()
{
	ReleaseDevice();
}

void CommandProcessor::Register(const std::string& name, const size_t arity,
                                const bool requires_device, std::string usage,
                                Handler handler)
{
	CommandSpec spec{};
	spec.arity           = arity;
	spec.requires_device = requires_device;
	spec.usage           = std::move(usage);
	spec.handler         = std::move(handler);
	m_commands[name]     = std::move(spec);
}

template <typename T>
void CommandProcessor::RegisterGetter(const std::string& name,
                                      DeviceReading<T> (Spectrometer::*getter)())
{
	Register(name, 0, true, name, [this, name, getter](const Arguments&) {
		const auto reading = (m_device.get()->*getter)();
		if (!reading.success) {
			LOG_ERR("SHELL: %s failed: %s", name.c_str(), reading.error.c_str());
			return Nak();
		}
		return CommandResponse{true, FormatValue(reading.value) + "\n"};
	});
}

template <typename T>
void CommandProcessor::RegisterSetter(const std::string& name, const std::string& usage,
                                      DeviceStatus (Spectrometer::*setter)(T))
{
	Register(name, 1, true, name + " " + usage, [this, name, setter](const Arguments& args) {
		const auto value = ParseArgument<T>(args[0]);
		if (!value) {
			LOG_WARNING("SHELL: %s rejected argument '%s'", name.c_str(), args[0].c_str());
			return Nak();
		}
		return FromStatus(name, (m_device.get()->*setter)(*value));
	});
}

void CommandProcessor::RegisterCommands()
{
	Register("open", 0, false, "open", [this](const Arguments&) { return HandleOpen(); });
	for (const char* name : {"close", "quit", "exit"}) {
		Register(name, 0, false, name, [this](const Arguments&) { return HandleClose(); });
	}
	Register("help", 0, false, "help", [this](const Arguments&) { return HandleHelp(); });
	Register("script_version", 0, false, "script_version", [](const Arguments&) {
		return CommandResponse{true, std::string(ShellVersion) + "\n"};
	});
	Register("connection_check", 0, true, "connection_check", [this](const Arguments&) {
		return FromStatus("connection_check", m_device->ConnectionCheck());
	});
	Register("get_config_json", 0, true, "get_config_json", [this](const Arguments&) {
		return HandleConfigJson();
	});

	RegisterSetter("set_integration_time_ms", "<ms>", &Spectrometer::SetIntegrationTimeMs);
	RegisterGetter("get_integration_time_ms", &Spectrometer::GetIntegrationTimeMs);
	RegisterGetter("get_actual_integration_time_us", &Spectrometer::GetActualIntegrationTimeUs);

	RegisterSetter("set_detector_tec_setpoint_degc", "<degC>", &Spectrometer::SetTecSetpointDegC);
	RegisterGetter("get_detector_tec_setpoint_degc", &Spectrometer::GetTecSetpointDegC);
	RegisterGetter("get_detector_temperature_degc", &Spectrometer::GetDetectorTemperatureDegC);
	RegisterSetter("set_tec_enable", "<bool>", &Spectrometer::SetTecEnable);
	RegisterGetter("get_tec_enabled", &Spectrometer::GetTecEnabled);

	Register("set_laser_power_mw", 1, true, "set_laser_power_mw <mW>", [this](const Arguments& args) {
		return HandleSetLaserPowerMw(args[0]);
	});
	RegisterSetter("set_laser_power_perc", "<percent>", &Spectrometer::SetLaserPowerPerc);
	RegisterSetter("set_laser_enable", "<bool>", &Spectrometer::SetLaserEnable);
	RegisterGetter("get_laser_enabled", &Spectrometer::GetLaserEnabled);
	RegisterGetter("get_laser_mod_enabled", &Spectrometer::GetLaserModEnabled);
	RegisterGetter("get_laser_mod_period", &Spectrometer::GetLaserModPeriodUs);
	RegisterGetter("get_laser_mod_pulse_width", &Spectrometer::GetLaserModPulseWidthUs);
	RegisterGetter("get_laser_mod_duration", &Spectrometer::GetLaserModDurationUs);
	RegisterGetter("get_laser_mod_pulse_delay", &Spectrometer::GetLaserModPulseDelayUs);
	RegisterGetter("get_laser_power_ramping_enabled", &Spectrometer::GetLaserPowerRampingEnabled);

	Register("get_laser_temperature_raw", 0, true, "get_laser_temperature_raw", [this](const Arguments&) {
		return ReadLaserBoardAdc(0, false);
	});
	Register("get_laser_temperature_degc", 0, true, "get_laser_temperature_degc", [this](const Arguments&) {
		return ReadLaserBoardAdc(0, true);
	});
	Register("get_secondary_adc_raw", 0, true, "get_secondary_adc_raw", [this](const Arguments&) {
		return ReadLaserBoardAdc(1, false);
	});
	Register("get_secondary_adc_calibrated", 0, true, "get_secondary_adc_calibrated", [this](const Arguments&) {
		return ReadLaserBoardAdc(1, true);
	});
	RegisterSetter("select_adc", "<0|1>", &Spectrometer::SelectAdc);
	RegisterGetter("get_selected_adc", &Spectrometer::GetSelectedAdc);

	RegisterGetter("get_actual_frames", &Spectrometer::GetActualFrames);
	RegisterGetter("get_vr_num_frames", &Spectrometer::GetNumFrames);
	RegisterGetter("get_external_trigger_output", &Spectrometer::GetExternalTriggerOutput);
	RegisterSetter("set_scans_to_average", "<count>", &Spectrometer::SetScansToAverage);

	Register("get_spectrum", 0, true, "get_spectrum", [this](const Arguments&) {
		const auto reading = m_device->GetSpectrum();
		if (!reading.success) {
			LOG_ERR("SHELL: get_spectrum failed: %s", reading.error.c_str());
			return Nak();
		}
		return CommandResponse{true, fmt::format("{}\n", fmt::join(reading.value, ","))};
	});

	Register("has_linearity_coeffs", 0, true, "has_linearity_coeffs", [this](const Arguments&) {
		return HandleCalibrationQuery(&HasLinearityCoeffs);
	});
	Register("has_laser_power_calibration", 0, true, "has_laser_power_calibration", [this](const Arguments&) {
		return HandleCalibrationQuery(&HasLaserPowerCalibration);
	});
}

std::optional<size_t> CommandProcessor::Arity(const std::string& name) const
{
	const auto it = m_commands.find(ToLower(name));
	if (it == m_commands.end()) {
		return std::nullopt;
	}
	return it->second.arity;
}

std::vector<std::string> CommandProcessor::GetCommandNames() const
{
	std::vector<std::string> names;
	names.reserve(m_commands.size() + 1);
	for (const auto& [name, _] : m_commands) {
		names.push_back(name);
	}
	names.emplace_back("stats");
	std::sort(names.begin(), names.end());
	return names;
}

CommandResponse CommandProcessor::HandleCommand(const Command& command)
{
	const auto name = ToLower(command.name);
	if (name.empty()) {
		return Nak();
	}

	if (name == "stats") {
		return HandleStats();
	}

	++m_requests;
	LOG_DEBUG("SHELL: received command '%s' with %zu argument(s)", name.c_str(), command.args.size());

	const auto it = m_commands.find(name);
	if (it == m_commands.end()) {
		LOG_WARNING("SHELL: unknown command '%s'", name.c_str());
		++m_failures;
		return Nak();
	}

	const auto& spec = it->second;
	if (command.args.size() != spec.arity) {
		LOG_WARNING("SHELL: %s expects %zu argument(s), got %zu",
		            name.c_str(), spec.arity, command.args.size());
		++m_failures;
		return Nak();
	}

	if (spec.requires_device && !m_device) {
		LOG_ERR("SHELL: %s rejected: not connected", name.c_str());
		++m_failures;
		return Nak();
	}

	const auto response = spec.handler(command.args);
	if (response.ok) {
		++m_success;
	} else {
		++m_failures;
	}
	return response;
}

CommandResponse CommandProcessor::HandleOpen()
{
	if (m_device) {
		LOG_INFO("SHELL: open requested while already connected");
		return Ack();
	}

	if (!m_opener) {
		LOG_ERR("SHELL: no spectrometer backend configured");
		return Nak();
	}

	auto device = m_opener();
	if (!device) {
		LOG_ERR("SHELL: no spectrometers found");
		return Nak();
	}

	const auto info = device->GetInfo();
	if (!info.success) {
		LOG_ERR("SHELL: unable to read spectrometer identity: %s", info.error.c_str());
		device->Close();
		return Nak();
	}

	LOG_INFO("SHELL: connected to %s %s (%u pixels)",
	         info.value.model.c_str(),
	         info.value.serial_number.c_str(),
	         info.value.pixels);
	m_device = std::move(device);
	return Ack();
}

CommandResponse CommandProcessor::HandleClose()
{
	ReleaseDevice();
	if (m_exit_handler) {
		m_exit_handler();
	}
	m_exit_requested = true;
	return {true, ""};
}

CommandResponse CommandProcessor::HandleHelp() const
{
	std::vector<std::string> lines;
	lines.reserve(m_commands.size() + 1);
	for (const auto& [name, spec] : m_commands) {
		lines.push_back(spec.usage);
	}
	lines.emplace_back("stats");
	std::sort(lines.begin(), lines.end());

	std::ostringstream oss;
	oss << BannerPrefix << ShellVersion << "\n";
	oss << "Supported commands (arguments may follow on later lines):\n";
	for (const auto& line : lines) {
		oss << "  " << line << "\n";
	}
	return {true, oss.str()};
}

CommandResponse CommandProcessor::HandleStats() const
{
	std::ostringstream oss;
	oss << "requests=" << m_requests << ' '
	    << "success=" << m_success << ' '
	    << "failures=" << m_failures << "\n";
	return {true, oss.str()};
}

CommandResponse CommandProcessor::HandleConfigJson()
{
	const auto info = m_device->GetInfo();
	if (!info.success) {
		LOG_ERR("SHELL: get_config_json failed: %s", info.error.c_str());
		return Nak();
	}
	const auto state = m_device->GetState();
	if (!state.success) {
		LOG_ERR("SHELL: get_config_json failed: %s", state.error.c_str());
		return Nak();
	}
	return {true, BuildConfigJson(info.value, state.value)};
}

CommandResponse CommandProcessor::HandleSetLaserPowerMw(const std::string& argument)
{
	const auto mw = ParseFloat(argument);
	if (!mw) {
		LOG_WARNING("SHELL: set_laser_power_mw rejected argument '%s'", argument.c_str());
		return Nak();
	}

	const auto info = m_device->GetInfo();
	if (!info.success) {
		LOG_ERR("SHELL: set_laser_power_mw failed: %s", info.error.c_str());
		return Nak();
	}
	if (!HasLaserPowerCalibration(info.value)) {
		LOG_ERR("SHELL: set_laser_power_mw requires a laser power calibration");
		return Nak();
	}
	if (*mw < 0.0 || *mw > info.value.max_laser_power_mw) {
		LOG_ERR("SHELL: set_laser_power_mw %.2f outside [0, %.2f]",
		        *mw, info.value.max_laser_power_mw);
		return Nak();
	}

	const auto perc = std::clamp(EvaluatePolynomial(info.value.laser_power_coeffs, *mw), 0.0, 100.0);
	LOG_DEBUG("SHELL: %.2f mW maps to %.2f%%", *mw, perc);
	return FromStatus("set_laser_power_mw", m_device->SetLaserPowerPerc(perc));
}

CommandResponse CommandProcessor::HandleCalibrationQuery(bool (*present)(const SpectrometerInfo&))
{
	const auto info = m_device->GetInfo();
	if (!info.success) {
		LOG_ERR("SHELL: calibration query failed: %s", info.error.c_str());
		return Nak();
	}
	return {true, FormatValue(present(info.value)) + "\n"};
}

CommandResponse CommandProcessor::ReadLaserBoardAdc(const uint8_t adc, const bool calibrated)
{
	const auto selected = m_device->SelectAdc(adc);
	if (!selected.success) {
		LOG_ERR("SHELL: unable to select ADC %u: %s", adc, selected.error.c_str());
		return Nak();
	}

	// The first conversion after switching channels is unreliable.
	const auto throwaway = m_device->ReadAdc();
	if (!throwaway.success) {
		LOG_ERR("SHELL: ADC %u read failed: %s", adc, throwaway.error.c_str());
		return Nak();
	}
	const auto raw = m_device->ReadAdc();
	if (!raw.success) {
		LOG_ERR("SHELL: ADC %u read failed: %s", adc, raw.error.c_str());
		return Nak();
	}

	if (!calibrated) {
		return {true, FormatValue(raw.value) + "\n"};
	}

	const auto info = m_device->GetInfo();
	if (!info.success) {
		LOG_ERR("SHELL: ADC %u calibration unavailable: %s", adc, info.error.c_str());
		return Nak();
	}
	const auto& coeffs = (adc == 0) ? info.value.adc_to_degc_coeffs
	                                : info.value.linearity_coeffs;
	if (coeffs.empty()) {
		LOG_ERR("SHELL: ADC %u has no calibration", adc);
		return Nak();
	}
	return {true, FormatValue(EvaluatePolynomial(coeffs, raw.value)) + "\n"};
}

bool CommandProcessor::ConsumeExitRequest()
{
	if (!m_exit_requested) {
		return false;
	}
	m_exit_requested = false;
	return true;
}

void CommandProcessor::Shutdown()
{
	ReleaseDevice();
}

void CommandProcessor::ReleaseDevice()
{
	if (!m_device) {
		return;
	}

	// never leave the laser firing once the shell lets go of the unit
	const auto laser_off = m_device->SetLaserEnable(false);
	if (!laser_off.success) {
		LOG_WARNING("SHELL: unable to disable laser on close: %s", laser_off.error.c_str());
	}
	m_device->Close();
	m_device.reset();
	LOG_INFO("SHELL: spectrometer closed");
}

} // namespace wpshell
