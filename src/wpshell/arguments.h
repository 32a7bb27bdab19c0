// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_ARGUMENTS_H
#define WPSHELL_ARGUMENTS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wpshell {

std::string Trim(std::string_view text);
std::string ToLower(std::string_view text);

// Splits on any run of whitespace. Quoting is not supported.
std::vector<std::string> Tokenize(std::string_view line);

// Accepts on/true/yes/1 and off/false/no/0 in any letter case.
std::optional<bool> ParseBool(std::string_view token);

// The whole token must be consumed; "12abc" is rejected.
std::optional<int64_t> ParseInteger(std::string_view token);
std::optional<double> ParseFloat(std::string_view token);

} // namespace wpshell

#endif // WPSHELL_ARGUMENTS_H
