// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_SHELL_H
#define WPSHELL_SHELL_H

#include <cstdint>
#include <functional>

#include "wpshell/command_processor.h"
#include "wpshell/server.h"

namespace wpshell {

using StopRequested = std::function<bool()>;

// Serves one session on file descriptors in_fd/out_fd until close or end
// of input. Returns the process exit status.
int RunStdio(ICommandProcessor& processor, int in_fd, int out_fd,
             const StopRequested& stop_requested);

// Serves TCP clients until stop_requested returns true.
int RunServer(ICommandProcessor& processor, std::unique_ptr<NetworkBackend> backend,
              uint16_t port, const StopRequested& stop_requested);

} // namespace wpshell

#endif // WPSHELL_SHELL_H
