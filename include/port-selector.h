#pragma once

#include <httplib.h>

#include <string>
#include <vector>

// Binds svr to the first candidate that accepts a bind, in list order, and
// returns that port. An empty list asks the OS for an ephemeral port. An
// exhausted non-empty list throws BindError, it never falls back to an
// ephemeral port.
int bindFirstAvailable(httplib::Server& svr, const std::string& host, const std::vector<int>& candidates);

// Socket options for the listening socket: SO_REUSEADDR only, so a port that
// another socket is listening on really fails to bind.
void applyListenerSocketOptions(httplib::Server& svr);
