// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_MISC_LOGGING_H
#define WPSHELL_MISC_LOGGING_H

#include <optional>
#include <string>

#include <fmt/printf.h>
#include <spdlog/spdlog.h>

// printf-style logging macros. Formatting is skipped entirely when the
// level is disabled.
#define WPSHELL_LOG(level, ...) \
	do { \
		if (spdlog::should_log(level)) { \
			spdlog::log(level, fmt::sprintf(__VA_ARGS__)); \
		} \
	} while (0)

#define LOG_TRACE(...)   WPSHELL_LOG(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...)   WPSHELL_LOG(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)    WPSHELL_LOG(spdlog::level::info, __VA_ARGS__)
#define LOG_WARNING(...) WPSHELL_LOG(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERR(...)     WPSHELL_LOG(spdlog::level::err, __VA_ARGS__)

std::optional<spdlog::level::level_enum> LOG_ParseLevel(const std::string& name);

// Installs the default logger. An empty path logs to stderr; stdout is
// never used because it carries the shell protocol.
bool LOG_Init(const std::string& name, const std::string& level, const std::string& path);

void LOG_Shutdown();

#endif // WPSHELL_MISC_LOGGING_H
