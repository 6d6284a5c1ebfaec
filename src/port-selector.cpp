#include "port-selector.h"
#include "errors.h"
#include "logger.h"

#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <sys/socket.h>
#include <netinet/in.h>
#endif

void applyListenerSocketOptions(httplib::Server& svr) {
    svr.set_socket_options([](socket_t sock) {
        int yes = 1;
        if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
            reinterpret_cast<const char*>(&yes), sizeof(yes)) != 0) {
            LOG_WARNING("PortSelector", "setsockopt(SO_REUSEADDR) failed: %s", std::strerror(errno));
        }
        });
}

int bindFirstAvailable(httplib::Server& svr, const std::string& host, const std::vector<int>& candidates) {
    if (candidates.empty()) {
        int port = svr.bind_to_any_port(host);
        if (port <= 0) {
            LOG_ERROR("PortSelector", "Ephemeral bind on %s failed", host);
            throw BindError({});
        }
        LOG_DEBUG("PortSelector", "Bound ephemeral port %d on %s", port, host);
        return port;
    }

    for (int port : candidates) {
        if (svr.bind_to_port(host, port)) {
            LOG_DEBUG("PortSelector", "Bound candidate port %d on %s", port, host);
            return port;
        }
        LOG_DEBUG("PortSelector", "Candidate port %d on %s is not bindable", port, host);
    }

    LOG_WARNING("PortSelector", "All %zu candidate ports are taken", candidates.size());
    throw BindError(candidates);
}
