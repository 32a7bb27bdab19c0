// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_SPECTROMETER_H
#define WPSHELL_SPECTROMETER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wpshell {

struct DeviceStatus {
	bool success      = false;
	std::string error = {};
};

template <typename T>
struct DeviceReading {
	bool success      = false;
	T value           = {};
	std::string error = {};
};

// Calibration and identity fields normally stored in the unit's EEPROM.
struct SpectrometerInfo {
	std::string model         = {};
	std::string serial_number = {};
	std::string detector      = {};
	uint32_t pixels           = 1024;
	double excitation_nm      = 0.0;
	uint32_t min_integration_time_ms = 1;
	uint32_t max_integration_time_ms = 60000;
	double max_laser_power_mw = 0.0;
	bool has_cooling          = false;
	bool has_laser            = false;

	std::vector<double> wavelength_coeffs  = {};
	std::vector<double> adc_to_degc_coeffs = {};
	std::vector<double> linearity_coeffs   = {};
	std::vector<double> laser_power_coeffs = {};
};

struct SpectrometerState {
	uint32_t integration_time_ms = 0;
	bool tec_enabled             = false;
	double tec_setpoint_degc     = 0.0;
	bool laser_enabled           = false;
	double laser_power_perc      = 0.0;
	bool laser_mod_enabled       = false;
	uint8_t selected_adc         = 0;
	uint32_t scans_to_average    = 1;
	uint32_t frames              = 0;
};

// Hardware-facing operations the shell needs. Every call reports failure
// through its result rather than throwing.
class Spectrometer {
public:
	virtual ~Spectrometer() = default;

	virtual DeviceReading<SpectrometerInfo> GetInfo()   = 0;
	virtual DeviceReading<SpectrometerState> GetState() = 0;
	virtual DeviceStatus ConnectionCheck()              = 0;

	virtual DeviceStatus SetIntegrationTimeMs(uint32_t ms)           = 0;
	virtual DeviceReading<uint32_t> GetIntegrationTimeMs()           = 0;
	virtual DeviceReading<uint64_t> GetActualIntegrationTimeUs()     = 0;

	virtual DeviceStatus SetTecSetpointDegC(double degc)             = 0;
	virtual DeviceReading<double> GetTecSetpointDegC()               = 0;
	virtual DeviceReading<double> GetDetectorTemperatureDegC()       = 0;
	virtual DeviceStatus SetTecEnable(bool enable)                   = 0;
	virtual DeviceReading<bool> GetTecEnabled()                      = 0;

	virtual DeviceStatus SetLaserPowerPerc(double perc)              = 0;
	virtual DeviceStatus SetLaserEnable(bool enable)                 = 0;
	virtual DeviceReading<bool> GetLaserEnabled()                    = 0;
	virtual DeviceReading<bool> GetLaserModEnabled()                 = 0;
	virtual DeviceReading<uint64_t> GetLaserModPeriodUs()            = 0;
	virtual DeviceReading<uint64_t> GetLaserModPulseWidthUs()        = 0;
	virtual DeviceReading<uint64_t> GetLaserModDurationUs()          = 0;
	virtual DeviceReading<uint64_t> GetLaserModPulseDelayUs()        = 0;
	virtual DeviceReading<bool> GetLaserPowerRampingEnabled()        = 0;

	virtual DeviceStatus SelectAdc(uint8_t adc)                      = 0;
	virtual DeviceReading<uint8_t> GetSelectedAdc()                  = 0;
	virtual DeviceReading<uint16_t> ReadAdc()                        = 0;

	virtual DeviceReading<uint32_t> GetActualFrames()                = 0;
	virtual DeviceReading<uint32_t> GetNumFrames()                   = 0;
	virtual DeviceReading<uint32_t> GetExternalTriggerOutput()       = 0;
	virtual DeviceStatus SetScansToAverage(uint32_t scans)           = 0;
	virtual DeviceReading<std::vector<double>> GetSpectrum()         = 0;

	virtual void Close() = 0;
};

using SpectrometerOpener = std::function<std::unique_ptr<Spectrometer>()>;

// Software model of a Raman spectrometer with a detector TEC, a modulated
// laser and two laser-board ADCs (0 = laser thermistor, 1 = photodiode).
class VirtualSpectrometer : public Spectrometer {
public:
	explicit VirtualSpectrometer(SpectrometerInfo info = DefaultInfo());

	static SpectrometerInfo DefaultInfo();

	// When enabled GetSpectrum blocks for the integration time of each scan.
	void SetSimulateTiming(bool enable) { m_simulate_timing = enable; }

	DeviceReading<SpectrometerInfo> GetInfo() override;
	DeviceReading<SpectrometerState> GetState() override;
	DeviceStatus ConnectionCheck() override;

	DeviceStatus SetIntegrationTimeMs(uint32_t ms) override;
	DeviceReading<uint32_t> GetIntegrationTimeMs() override;
	DeviceReading<uint64_t> GetActualIntegrationTimeUs() override;

	DeviceStatus SetTecSetpointDegC(double degc) override;
	DeviceReading<double> GetTecSetpointDegC() override;
	DeviceReading<double> GetDetectorTemperatureDegC() override;
	DeviceStatus SetTecEnable(bool enable) override;
	DeviceReading<bool> GetTecEnabled() override;

	DeviceStatus SetLaserPowerPerc(double perc) override;
	DeviceStatus SetLaserEnable(bool enable) override;
	DeviceReading<bool> GetLaserEnabled() override;
	DeviceReading<bool> GetLaserModEnabled() override;
	DeviceReading<uint64_t> GetLaserModPeriodUs() override;
	DeviceReading<uint64_t> GetLaserModPulseWidthUs() override;
	DeviceReading<uint64_t> GetLaserModDurationUs() override;
	DeviceReading<uint64_t> GetLaserModPulseDelayUs() override;
	DeviceReading<bool> GetLaserPowerRampingEnabled() override;

	DeviceStatus SelectAdc(uint8_t adc) override;
	DeviceReading<uint8_t> GetSelectedAdc() override;
	DeviceReading<uint16_t> ReadAdc() override;

	DeviceReading<uint32_t> GetActualFrames() override;
	DeviceReading<uint32_t> GetNumFrames() override;
	DeviceReading<uint32_t> GetExternalTriggerOutput() override;
	DeviceStatus SetScansToAverage(uint32_t scans) override;
	DeviceReading<std::vector<double>> GetSpectrum() override;

	void Close() override;

private:
	std::vector<double> AcquireScan();

	SpectrometerInfo m_info;
	SpectrometerState m_state = {};
	double m_detector_degc    = 25.0;
	bool m_simulate_timing    = false;
	bool m_closed             = false;
};

double EvaluatePolynomial(const std::vector<double>& coeffs, double x);

std::string BuildConfigJson(const SpectrometerInfo& info, const SpectrometerState& state);

// "virtual" opens a VirtualSpectrometer, "none" never finds a device.
SpectrometerOpener MakeSpectrometerOpener(const std::string& backend);

} // namespace wpshell

#endif // WPSHELL_SPECTROMETER_H
