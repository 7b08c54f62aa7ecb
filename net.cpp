#include "net.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace pong {

namespace {

std::string clientIp(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
    }
    return "unknown";
}

}  // namespace

int openTcpListener(int port, std::string& error) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("socket error: ") + strerror(errno);
        return -1;
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = std::string("bind error: ") + strerror(errno);
        close(fd);
        return -1;
    }
    if (listen(fd, 16) < 0) {
        error = std::string("listen error: ") + strerror(errno);
        close(fd);
        return -1;
    }
    return fd;
}

int acceptWithTimeout(int listenFd, int timeoutMs, std::string& peer) {
    pollfd pfd{};
    pfd.fd = listenFd;
    pfd.events = POLLIN;
    int r = poll(&pfd, 1, timeoutMs);
    if (r <= 0) return -1;

    sockaddr_in client{};
    socklen_t len = sizeof(client);
    int clientFd = accept(listenFd, reinterpret_cast<sockaddr*>(&client), &len);
    if (clientFd < 0) {
        if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
            std::cerr << "accept error: " << strerror(errno) << "\n";
        }
        return -1;
    }
    peer = clientIp(client);
    return clientFd;
}

}  // namespace pong
