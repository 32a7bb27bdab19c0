// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "wpshell/arguments.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <string>

namespace wpshell {

std::string Trim(std::string_view text)
{
	const auto begin = text.find_first_not_of(" \t\r\n");
	if (begin == std::string_view::npos) {
		return {};
	}
	const auto end = text.find_last_not_of(" \t\r\n");
	return std::string(text.substr(begin, end - begin + 1));
}

std::string ToLower(std::string_view text)
{
	std::string lower(text);
	std::transform(lower.begin(),
	               lower.end(),
	               lower.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lower;
}

std::vector<std::string> Tokenize(std::string_view line)
{
	std::vector<std::string> tokens;
	std::string current;

	for (const char ch : line) {
		if (std::isspace(static_cast<unsigned char>(ch))) {
			if (!current.empty()) {
				tokens.push_back(current);
				current.clear();
			}
		} else {
			current.push_back(ch);
		}
	}
	if (!current.empty()) {
		tokens.push_back(current);
	}
	return tokens;
}

std::optional<bool> ParseBool(std::string_view token)
{
	const auto lower = ToLower(token);
	if (lower == "on" || lower == "true" || lower == "yes" || lower == "1") {
		return true;
	}
	if (lower == "off" || lower == "false" || lower == "no" || lower == "0") {
		return false;
	}
	return std::nullopt;
}

std::optional<int64_t> ParseInteger(std::string_view token)
{
	if (token.empty()) {
		return std::nullopt;
	}
	const std::string text(token);
	try {
		size_t consumed = 0;
		const auto value = std::stoll(text, &consumed, 10);
		if (consumed != text.size()) {
			return std::nullopt;
		}
		return static_cast<int64_t>(value);
	} catch (const std::exception&) {
		return std::nullopt;
	}
}

std::optional<double> ParseFloat(std::string_view token)
{
	if (token.empty()) {
		return std::nullopt;
	}
	const std::string text(token);
	try {
		size_t consumed = 0;
		const auto value = std::stod(text, &consumed);
		if (consumed != text.size() || !std::isfinite(value)) {
			return std::nullopt;
		}
		return value;
	} catch (const std::exception&) {
		return std::nullopt;
	}
}

} // namespace wpshell
