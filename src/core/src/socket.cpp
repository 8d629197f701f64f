#include "kg_socket.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kg {
namespace net {

int open_tcp_listener(const std::string& bind_address, uint16_t port, int backlog,
                      std::string& error) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        error = "invalid bind address '" + bind_address + "'";
        return -1;
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        error = std::string("socket: ") + std::strerror(errno);
        return -1;
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind " + bind_address + ":" + std::to_string(port) + ": " +
                std::strerror(errno);
        close(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        error = std::string("listen: ") + std::strerror(errno);
        close(fd);
        return -1;
    }

    return fd;
}

uint16_t local_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string peer_address(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return "";
    }
    return buf;
}

void wake_listener(int fd) {
    if (fd < 0) return;
    shutdown(fd, SHUT_RDWR);
}

bool is_transient_accept_error(int err) {
    switch (err) {
        case EINTR:
        case ECONNABORTED:
        case EAGAIN:
        case EPROTO:
        case EPERM:
        case ENETDOWN:
        case ENOPROTOOPT:
        case EHOSTDOWN:
        case ENONET:
        case EHOSTUNREACH:
        case EOPNOTSUPP:
        case ENETUNREACH:
            return true;
        default:
            return false;
    }
}

bool is_resource_accept_error(int err) {
    return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
}

} // namespace net
} // namespace kg
