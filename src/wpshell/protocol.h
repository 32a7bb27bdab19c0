// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_PROTOCOL_H
#define WPSHELL_PROTOCOL_H

#include <string_view>

namespace wpshell {

constexpr std::string_view ShellVersion = "1.1.0";

// Written once when a session starts, followed by the version and a newline.
constexpr std::string_view BannerPrefix = "wasatch-shell version ";

// The only synchronisation signal a client gets: a command is complete once
// this has been written.
constexpr std::string_view Prompt = "wp> ";

constexpr std::string_view AckTrue  = "1\n";
constexpr std::string_view AckFalse = "0\n";

} // namespace wpshell

#endif // WPSHELL_PROTOCOL_H
