#pragma once

#include <cstdint>
#include <string>

namespace todo {

/*
 * RAII wrapper for a POSIX TCP socket
 *
 * Owns the descriptor and closes it on destruction
 * Move-only
 */
class Socket {
public:
    // Constructs an invalid socket
    Socket() noexcept;

    // Takes ownership of an existing file descriptor
    explicit Socket(int fd) noexcept;

    // Closes the socket if valid
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // Creates a non-blocking IPv4 socket bound to host:port and listening.
    // Port 0 picks an ephemeral port, see local_port().
    // Throws std::runtime_error on failure.
    static Socket listen_tcp(const std::string& host, uint16_t port);

    // Port the socket is bound to, 0 if unknown
    uint16_t local_port() const noexcept;

    bool valid() const noexcept;
    int fd() const noexcept;

    // Releases ownership without closing
    int release() noexcept;

private:
    int fd_;
};

} // namespace todo
