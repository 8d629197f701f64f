#ifndef KG_SOCKET_HPP
#define KG_SOCKET_HPP

#include <cstdint>
#include <string>

#include <netinet/in.h>

namespace kg {
namespace net {

/**
 * @brief Creates an IPv4 TCP socket bound to address:port and listening
 * @param bind_address dotted quad, "0.0.0.0" for any
 * @param port 0 selects an ephemeral port
 * @param error receives a diagnostic on failure
 * @return listening descriptor, or -1
 */
int open_tcp_listener(const std::string& bind_address, uint16_t port, int backlog,
                      std::string& error);

/// Port a bound socket actually listens on, 0 on error.
uint16_t local_port(int fd);

/// Dotted-quad text for an accepted peer.
std::string peer_address(const sockaddr_in& addr);

/// Makes a thread blocked in accept() on fd return; fd stays open.
void wake_listener(int fd);

/// True for accept() errors caused by the peer or by a signal.
bool is_transient_accept_error(int err);

/// True for accept() errors caused by descriptor or buffer exhaustion.
bool is_resource_accept_error(int err);

} // namespace net
} // namespace kg

#endif // KG_SOCKET_HPP
