#include "todo/socket.hpp"

#include <stdexcept>     // std::runtime_error
#include <sys/socket.h>  // socket(), bind(), listen()
#include <netinet/in.h>  // sockaddr_in
#include <arpa/inet.h>   // htons(), inet_pton()
#include <unistd.h>      // close()


namespace todo {


Socket::Socket() noexcept: fd_(-1) {}

Socket::Socket(int fd) noexcept: fd_(fd) {}

Socket::~Socket() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

Socket::Socket(Socket&& other) noexcept: fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        if (fd_ != -1) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::listen_tcp(const std::string& host, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port); // Converts port to network byte order
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
        throw std::runtime_error("Invalid bind address: " + host);

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1)
        throw std::runtime_error("Failed to create socket");

    // Owned from here on, closed if anything below throws
    Socket sock{fd};

    int opt = 1;
    if (::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1)
        throw std::runtime_error("Failed to set SO_REUSEADDR");

    if (::bind(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        throw std::runtime_error("Bind failed on " + host + ":" + std::to_string(port));

    if (::listen(sock.fd(), SOMAXCONN) == -1)
        throw std::runtime_error("Listen failed");

    return sock;
}

uint16_t Socket::local_port() const noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (fd_ == -1 || ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        return 0;
    return ntohs(addr.sin_port);
}

bool Socket::valid() const noexcept {
    return fd_ != -1;
}

int Socket::fd() const noexcept {
    return fd_;
}

int Socket::release() noexcept {
    int tmp = fd_;
    fd_ = -1;
    return tmp;
}

} // namespace todo
