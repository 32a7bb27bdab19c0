// SPDX-FileCopyrightText:  2025 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef WPSHELL_LOADTEST_TCP_TRANSPORT_H
#define WPSHELL_LOADTEST_TCP_TRANSPORT_H

#include <chrono>
#include <cstdint>
#include <string>

#include "loadtest/transport.h"

namespace wpshell {

// Keeps retrying until the shell accepts or connect_timeout expires, so the
// server may still be starting up.
TransportResult ConnectTcp(const std::string& host, uint16_t port,
                           std::chrono::milliseconds connect_timeout);

} // namespace wpshell

#endif // WPSHELL_LOADTEST_TCP_TRANSPORT_H
