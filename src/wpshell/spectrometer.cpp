// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/spectrometer.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <string_view>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "misc/logging.h"

namespace wpshell {

namespace {

constexpr double AmbientDegC       = 25.0;
constexpr double MinTecSetpointDegC = -20.0;
constexpr double MaxTecSetpointDegC = 35.0;
constexpr uint64_t ModPeriodUs      = 100;
constexpr uint32_t MaxScansToAverage = 10000;
constexpr double DarkLevel          = 600.0;
constexpr double MaxPixelValue      = 65535.0;

DeviceStatus Ok()
{
	return DeviceStatus{true, {}};
}

DeviceStatus Failure(std::string message)
{
	DeviceStatus status{};
	status.success = false;
	status.error   = std::move(message);
	return status;
}

template <typename T>
DeviceReading<T> Success(T value)
{
	DeviceReading<T> reading{};
	reading.success = true;
	reading.value   = std::move(value);
	return reading;
}

template <typename T>
DeviceReading<T> ReadFailure(std::string message)
{
	DeviceReading<T> reading{};
	reading.success = false;
	reading.error   = std::move(message);
	return reading;
}

// Pixel positions and relative heights of the simulated Raman lines.
struct RamanLine {
	double pixel;
	double height;
	double width;
};

constexpr RamanLine SimulatedLines[] = {
        {212.0, 1800.0, 3.0},
        {388.0, 5200.0, 2.5},
        {541.0, 2600.0, 4.0},
        {790.0, 900.0, 3.5},
};

double Gaussian(const double x, const double center, const double width)
{
	const double d = (x - center) / width;
	return std::exp(-0.5 * d * d);
}

std::string JsonEscape(std::string_view text)
{
	std::string escaped;
	escaped.reserve(text.size());
	for (const char ch : text) {
		switch (ch) {
		case '"': escaped += "\\\""; break;
		case '\\': escaped += "\\\\"; break;
		case '\n': escaped += "\\n"; break;
		case '\r': escaped += "\\r"; break;
		case '\t': escaped += "\\t"; break;
		default:
			if (static_cast<unsigned char>(ch) < 0x20) {
				escaped += fmt::format("\\u{:04x}", static_cast<unsigned>(ch));
			} else {
				escaped.push_back(ch);
			}
			break;
		}
	}
	return escaped;
}

std::string JsonArray(const std::vector<double>& values)
{
	return fmt::format("[{}]", fmt::join(values, ", "));
}

const char* JsonBool(const bool value)
{
	return value ? "true" : "false";
}

} // namespace

double EvaluatePolynomial(const std::vector<double>& coeffs, const double x)
{
	double result = 0.0;
	double power  = 1.0;
	for (const auto coeff : coeffs) {
		result += coeff * power;
		power *= x;
	}
	return result;
}

std::string BuildConfigJson(const SpectrometerInfo& info, const SpectrometerState& state)
{
	std::string json;
	json += "{\n";
	json += "    \"eeprom\": {\n";
	json += fmt::format("        \"model\": \"{}\",\n", JsonEscape(info.model));
	json += fmt::format("        \"serial_number\": \"{}\",\n", JsonEscape(info.serial_number));
	json += fmt::format("        \"detector\": \"{}\",\n", JsonEscape(info.detector));
	json += fmt::format("        \"active_pixels_horizontal\": {},\n", info.pixels);
	json += fmt::format("        \"excitation_nm\": {},\n", info.excitation_nm);
	json += fmt::format("        \"min_integration_time_ms\": {},\n", info.min_integration_time_ms);
	json += fmt::format("        \"max_integration_time_ms\": {},\n", info.max_integration_time_ms);
	json += fmt::format("        \"max_laser_power_mW\": {},\n", info.max_laser_power_mw);
	json += fmt::format("        \"has_cooling\": {},\n", JsonBool(info.has_cooling));
	json += fmt::format("        \"has_laser\": {},\n", JsonBool(info.has_laser));
	json += fmt::format("        \"wavelength_coeffs\": {},\n", JsonArray(info.wavelength_coeffs));
	json += fmt::format("        \"adc_to_degC_coeffs\": {},\n", JsonArray(info.adc_to_degc_coeffs));
	json += fmt::format("        \"linearity_coeffs\": {},\n", JsonArray(info.linearity_coeffs));
	json += fmt::format("        \"laser_power_coeffs\": {}\n", JsonArray(info.laser_power_coeffs));
	json += "    },\n";
	json += "    \"state\": {\n";
	json += fmt::format("        \"integration_time_ms\": {},\n", state.integration_time_ms);
	json += fmt::format("        \"tec_enabled\": {},\n", JsonBool(state.tec_enabled));
	json += fmt::format("        \"tec_setpoint_degC\": {},\n", state.tec_setpoint_degc);
	json += fmt::format("        \"laser_enabled\": {},\n", JsonBool(state.laser_enabled));
	json += fmt::format("        \"laser_power_perc\": {},\n", state.laser_power_perc);
	json += fmt::format("        \"mod_enabled\": {},\n", JsonBool(state.laser_mod_enabled));
	json += fmt::format("        \"selected_adc\": {},\n", static_cast<unsigned>(state.selected_adc));
	json += fmt::format("        \"scans_to_average\": {},\n", state.scans_to_average);
	json += fmt::format("        \"frames\": {}\n", state.frames);
	json += "    }\n";
	json += "}\n";
	return json;
}

VirtualSpectrometer::VirtualSpectrometer(SpectrometerInfo info)
        : m_info(std::move(info)),
          m_state(),
          m_detector_degc(AmbientDegC),
          m_simulate_timing(false),
          m_closed(false)
{
	m_state.integration_time_ms = std::max<uint32_t>(10, m_info.min_integration_time_ms);
	m_state.tec_setpoint_degc   = 10.0;
}

SpectrometerInfo VirtualSpectrometer::DefaultInfo()
{
	SpectrometerInfo info{};
	info.model                   = "WP-785X-VIRTUAL";
	info.serial_number           = "WP-VIRT-0001";
	info.detector                = "HAMAMATSU_S16010";
	info.pixels                  = 1024;
	info.excitation_nm           = 785.0;
	info.min_integration_time_ms = 1;
	info.max_integration_time_ms = 60000;
	info.max_laser_power_mw      = 100.0;
	info.has_cooling             = true;
	info.has_laser               = true;
	info.wavelength_coeffs       = {799.5, 0.2312, -1.2e-05, 2.5e-10};
	info.adc_to_degc_coeffs      = {1.5, 0.0124};
	info.linearity_coeffs        = {0.0, 0.05};
	info.laser_power_coeffs      = {0.0, 1.0};
	return info;
}

DeviceReading<SpectrometerInfo> VirtualSpectrometer::GetInfo()
{
	return Success(m_info);
}

DeviceReading<SpectrometerState> VirtualSpectrometer::GetState()
{
	return Success(m_state);
}

DeviceStatus VirtualSpectrometer::ConnectionCheck()
{
	if (m_closed) {
		return Failure("device closed");
	}
	return Ok();
}

DeviceStatus VirtualSpectrometer::SetIntegrationTimeMs(const uint32_t ms)
{
	if (ms < m_info.min_integration_time_ms || ms > m_info.max_integration_time_ms) {
		return Failure(fmt::format("integration time {} ms outside [{}, {}]",
		                           ms,
		                           m_info.min_integration_time_ms,
		                           m_info.max_integration_time_ms));
	}
	m_state.integration_time_ms = ms;
	return Ok();
}

DeviceReading<uint32_t> VirtualSpectrometer::GetIntegrationTimeMs()
{
	return Success(m_state.integration_time_ms);
}

DeviceReading<uint64_t> VirtualSpectrometer::GetActualIntegrationTimeUs()
{
	return Success(static_cast<uint64_t>(m_state.integration_time_ms) * 1000);
}

DeviceStatus VirtualSpectrometer::SetTecSetpointDegC(const double degc)
{
	if (!m_info.has_cooling) {
		return Failure("detector has no TEC");
	}
	if (degc < MinTecSetpointDegC || degc > MaxTecSetpointDegC) {
		return Failure(fmt::format("TEC setpoint {} outside [{}, {}]",
		                           degc,
		                           MinTecSetpointDegC,
		                           MaxTecSetpointDegC));
	}
	m_state.tec_setpoint_degc = degc;
	return Ok();
}

DeviceReading<double> VirtualSpectrometer::GetTecSetpointDegC()
{
	return Success(m_state.tec_setpoint_degc);
}

DeviceReading<double> VirtualSpectrometer::GetDetectorTemperatureDegC()
{
	// Each read moves the detector half way towards its equilibrium.
	const double target = m_state.tec_enabled ? m_state.tec_setpoint_degc : AmbientDegC;
	m_detector_degc += (target - m_detector_degc) * 0.5;
	return Success(m_detector_degc);
}

DeviceStatus VirtualSpectrometer::SetTecEnable(const bool enable)
{
	if (!m_info.has_cooling) {
		return Failure("detector has no TEC");
	}
	m_state.tec_enabled = enable;
	return Ok();
}

DeviceReading<bool> VirtualSpectrometer::GetTecEnabled()
{
	return Success(m_state.tec_enabled);
}

DeviceStatus VirtualSpectrometer::SetLaserPowerPerc(const double perc)
{
	if (!m_info.has_laser) {
		return Failure("unit has no laser");
	}
	if (perc < 0.0 || perc > 100.0) {
		return Failure(fmt::format("laser power {}% outside [0, 100]", perc));
	}
	m_state.laser_power_perc  = perc;
	m_state.laser_mod_enabled = perc < 100.0;
	return Ok();
}

DeviceStatus VirtualSpectrometer::SetLaserEnable(const bool enable)
{
	if (!m_info.has_laser) {
		return Failure("unit has no laser");
	}
	m_state.laser_enabled = enable;
	return Ok();
}

DeviceReading<bool> VirtualSpectrometer::GetLaserEnabled()
{
	return Success(m_state.laser_enabled);
}

DeviceReading<bool> VirtualSpectrometer::GetLaserModEnabled()
{
	return Success(m_state.laser_mod_enabled);
}

DeviceReading<uint64_t> VirtualSpectrometer::GetLaserModPeriodUs()
{
	return Success(ModPeriodUs);
}

DeviceReading<uint64_t> VirtualSpectrometer::GetLaserModPulseWidthUs()
{
	if (!m_state.laser_mod_enabled) {
		return Success(ModPeriodUs);
	}
	const auto width = std::lround(m_state.laser_power_perc * ModPeriodUs / 100.0);
	return Success(static_cast<uint64_t>(width));
}

DeviceReading<uint64_t> VirtualSpectrometer::GetLaserModDurationUs()
{
	return Success(uint64_t{0});
}

DeviceReading<uint64_t> VirtualSpectrometer::GetLaserModPulseDelayUs()
{
	return Success(uint64_t{0});
}

DeviceReading<bool> VirtualSpectrometer::GetLaserPowerRampingEnabled()
{
	return Success(false);
}

DeviceStatus VirtualSpectrometer::SelectAdc(const uint8_t adc)
{
	if (adc > 1) {
		return Failure(fmt::format("invalid ADC {}", static_cast<unsigned>(adc)));
	}
	m_state.selected_adc = adc;
	return Ok();
}

DeviceReading<uint8_t> VirtualSpectrometer::GetSelectedAdc()
{
	return Success(m_state.selected_adc);
}

DeviceReading<uint16_t> VirtualSpectrometer::ReadAdc()
{
	const double power = m_state.laser_enabled ? m_state.laser_power_perc : 0.0;
	if (m_state.selected_adc == 0) {
		// laser thermistor warms slightly with output power
		return Success(static_cast<uint16_t>(1900 + std::lround(power * 2.0)));
	}
	// photodiode sees only a small dark offset with the laser off
	return Success(static_cast<uint16_t>(3 + std::lround(power * 14.0)));
}

DeviceReading<uint32_t> VirtualSpectrometer::GetActualFrames()
{
	return Success(m_state.frames);
}

DeviceReading<uint32_t> VirtualSpectrometer::GetNumFrames()
{
	return Success(uint32_t{1});
}

DeviceReading<uint32_t> VirtualSpectrometer::GetExternalTriggerOutput()
{
	return Success(uint32_t{0});
}

DeviceStatus VirtualSpectrometer::SetScansToAverage(const uint32_t scans)
{
	if (scans == 0 || scans > MaxScansToAverage) {
		return Failure(fmt::format("scans to average {} outside [1, {}]", scans, MaxScansToAverage));
	}
	m_state.scans_to_average = scans;
	return Ok();
}

DeviceReading<std::vector<double>> VirtualSpectrometer::GetSpectrum()
{
	if (m_closed) {
		return ReadFailure<std::vector<double>>("device closed");
	}

	std::vector<double> sum(m_info.pixels, 0.0);
	for (uint32_t scan = 0; scan < m_state.scans_to_average; ++scan) {
		const auto spectrum = AcquireScan();
		for (size_t i = 0; i < sum.size(); ++i) {
			sum[i] += spectrum[i];
		}
	}
	for (auto& value : sum) {
		value = std::round(value / m_state.scans_to_average);
	}
	return Success(std::move(sum));
}

std::vector<double> VirtualSpectrometer::AcquireScan()
{
	if (m_simulate_timing) {
		std::this_thread::sleep_for(std::chrono::milliseconds(m_state.integration_time_ms));
	}

	std::mt19937 rng(m_state.frames);
	std::normal_distribution<double> noise(0.0, 4.0);

	const double exposure = m_state.integration_time_ms / 100.0;
	const double power    = m_state.laser_enabled ? m_state.laser_power_perc / 100.0 : 0.0;

	std::vector<double> spectrum(m_info.pixels);
	for (uint32_t pixel = 0; pixel < m_info.pixels; ++pixel) {
		const double x = pixel;
		double signal  = 200.0 * Gaussian(x, m_info.pixels / 2.0, m_info.pixels / 3.0);
		for (const auto& line : SimulatedLines) {
			signal += line.height * power * Gaussian(x, line.pixel, line.width);
		}
		const double value = DarkLevel + signal * exposure + noise(rng);
		spectrum[pixel]    = std::clamp(value, 0.0, MaxPixelValue);
	}

	++m_state.frames;
	return spectrum;
}

void VirtualSpectrometer::Close()
{
	if (m_closed) {
		return;
	}
	m_state.laser_enabled = false;
	m_closed              = true;
	LOG_DEBUG("SHELL: virtual spectrometer %s closed", m_info.serial_number.c_str());
}

SpectrometerOpener MakeSpectrometerOpener(const std::string& backend)
{
	if (backend == "virtual") {
		return []() -> std::unique_ptr<Spectrometer> {
			auto device = std::make_unique<VirtualSpectrometer>();
			device->SetSimulateTiming(true);
			return device;
		};
	}
	if (backend == "none") {
		return []() -> std::unique_ptr<Spectrometer> { return nullptr; };
	}
	return {};
}

} // namespace wpshell
