#pragma once

#include <string>

namespace pong {

// Bound, listening IPv4 socket on 0.0.0.0:port, or -1 with `error` filled in.
int openTcpListener(int port, std::string& error);

// Waits up to timeoutMs for a connection. Returns the accepted fd, or -1 on timeout
// or a transient accept failure. `peer` receives "ip:port".
int acceptWithTimeout(int listenFd, int timeoutMs, std::string& peer);

}  // namespace pong
