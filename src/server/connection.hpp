#pragma once

#include "todo/http.hpp"
#include "todo/socket.hpp"
#include <atomic>
#include <string>
#include <stdexcept>
#include <mutex>
#include <optional>

namespace todo {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

class BufferOverflowError : public IOError {
    using IOError::IOError;
};

/*
 * Represents a single client connection.
 *
 * The inbox belongs to the reactor thread. The outbox is shared with
 * the worker that answers the request in flight. At most one request
 * per connection is in flight so pipelined responses stay in order.
 */
class Connection {
public:
    explicit Connection(Socket socket) : socket_(std::move(socket)) {};

    int fd() const noexcept { return socket_.fd(); }

    // append response to outbox
    void append_response(std::string data);

    // Worker side: response for the request in flight has been queued
    void complete_request(bool keep_alive);

    // Queue a last response, then stop taking requests.
    // With a request in flight it goes out after that request's response.
    void fail(std::string data);

    // Write to client. Return true if there is still data left to send
    bool write_from_outbox();

    // returns false once the client has closed its sending side
    bool read_to_inbox();

    // Next complete request, if none is in flight.
    // Throws ProtocolError on malformed input.
    std::optional<HttpRequest> try_get_request();

    bool busy() const noexcept { return busy_; }
    bool closing() const noexcept { return closing_; }
    bool peer_closed() const noexcept { return peer_closed_; }

    // Closing or peer gone, nothing in flight and outbox drained
    bool finished() const;

    // only used in tests to confirm partial reads/writes
    bool inbox_has_data() const;
    bool outbox_has_data() const;

private:
    static constexpr size_t MAX_INBOX_SIZE = 1024 * 1024 * 2; // 2MB limit
    Socket socket_;
    std::string server_inbox_;
    std::string server_outbox_;
    std::string last_response_; // held back by fail() until the request in flight completes
    mutable std::mutex outbox_mutex_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> closing_{false};
    bool peer_closed_{false}; // reactor thread only
};

} // namespace todo
