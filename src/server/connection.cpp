#include "connection.hpp"
#include <cerrno>
#include <unistd.h>
#include <sys/socket.h>

namespace todo {


bool Connection::read_to_inbox() {
    char buffer[4096];
    ssize_t n = ::read(socket_.fd(), buffer, sizeof(buffer));

    if (n == 0) {
        peer_closed_ = true;
        return false;
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true; // No data left to read
        throw IOError{"read failed"};
    }
    if (closing_)
        return true; // nothing more will be answered, drop it

    if (server_inbox_.size() + n > MAX_INBOX_SIZE) {
        server_inbox_.clear();
        throw BufferOverflowError{"request too large"};
    }

    server_inbox_.append(buffer, n);
    return true;
}

std::optional<HttpRequest> Connection::try_get_request() {
    if (busy_ || closing_)
        return std::nullopt;

    auto request = HttpParser::try_parse(server_inbox_);
    if (request)
        busy_ = true;
    return request;
}

void Connection::complete_request(bool keep_alive) {
    std::lock_guard lock(outbox_mutex_);
    server_outbox_.append(last_response_);
    last_response_.clear();
    if (!keep_alive)
        closing_ = true;
    busy_ = false;
}

void Connection::fail(std::string data) {
    server_inbox_.clear();
    std::lock_guard lock(outbox_mutex_);
    closing_ = true;
    if (busy_)
        last_response_ = std::move(data);
    else
        server_outbox_.append(data);
}

bool Connection::finished() const {
    return (closing_ || peer_closed_) && !busy_ && !outbox_has_data();
}

void Connection::append_response(std::string data) {
    std::lock_guard lock(outbox_mutex_);
    server_outbox_.append(data);
}

bool Connection::write_from_outbox() {
    std::lock_guard lock(outbox_mutex_);
    if (server_outbox_.empty())
        return false;

    // MSG_NOSIGNAL: don't SIGPIPE us if the socket is dead
    ssize_t n = ::send(socket_.fd(), server_outbox_.data(), server_outbox_.size(), MSG_NOSIGNAL);
    if (n >= 0) {
        server_outbox_.erase(0, n); // Remove what was actually sent
        return !server_outbox_.empty();
    }
    // n < 0
    if (errno == EAGAIN || errno == EWOULDBLOCK)
        return true;
    throw IOError("write failed");
}


bool Connection::inbox_has_data() const {
    return !server_inbox_.empty();
}

bool Connection::outbox_has_data() const {
    std::lock_guard lock(outbox_mutex_);
    return !server_outbox_.empty();
}

} // namespace todo
