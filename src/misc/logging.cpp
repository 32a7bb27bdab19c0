// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "misc/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::optional<spdlog::level::level_enum> LOG_ParseLevel(const std::string& name)
{
	std::string lower(name);
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});

	if (lower == "trace") {
		return spdlog::level::trace;
	}
	if (lower == "debug") {
		return spdlog::level::debug;
	}
	if (lower == "info") {
		return spdlog::level::info;
	}
	if (lower == "warning" || lower == "warn") {
		return spdlog::level::warn;
	}
	if (lower == "error" || lower == "critical") {
		return spdlog::level::err;
	}
	if (lower == "off") {
		return spdlog::level::off;
	}
	return std::nullopt;
}

bool LOG_Init(const std::string& name, const std::string& level, const std::string& path)
{
	const auto parsed_level = LOG_ParseLevel(level);
	if (!parsed_level) {
		std::fprintf(stderr, "Invalid log level '%s'\n", level.c_str());
		return false;
	}

	spdlog::drop(name);

	std::shared_ptr<spdlog::logger> logger;
	try {
		if (path.empty()) {
			logger = spdlog::stderr_color_mt(name);
		} else {
			logger = spdlog::basic_logger_mt(name, path);
		}
	} catch (const spdlog::spdlog_ex& ex) {
		std::fprintf(stderr, "Unable to open log '%s': %s\n", path.c_str(), ex.what());
		return false;
	}

	logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ %v");
	logger->set_level(*parsed_level);
	logger->flush_on(*parsed_level);
	spdlog::set_default_logger(std::move(logger));
	return true;
}

void LOG_Shutdown()
{
	spdlog::shutdown();
}
