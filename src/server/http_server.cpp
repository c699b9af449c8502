#include "http_server.hpp"

#include <stdexcept>     // std::runtime_error
#include <sys/socket.h>  // accept4()
#include <netinet/in.h>  // sockaddr_in
#include <cerrno>

#include <string>
#include <iostream>
#include <csignal>

namespace todo {


void Task::execute(const RequestDispatcher& dispatcher) {
    auto client = connection.lock();
    if (!client) {
        // The Reactor already deleted this connection
        std::cout << "[Worker] Skipping task: Client already disconnected." << std::endl;
        return;
    }

    HttpResponse response;
    try {
        response = dispatcher.execute(request);
    } catch (const std::exception& e) {
        std::cerr << "[Worker] " << request.method << " " << request.path << " failed: " << e.what() << std::endl;
        response = HttpResponse::text(500, "Internal Server Error");
    }

    bool keep_alive = request.keep_alive();
    client->append_response(response.serialize(keep_alive));
    client->complete_request(keep_alive);
    if (on_complete)
        on_complete();
}


HttpServer::HttpServer(ServerConfig config, std::shared_ptr<TodoStore> store)
    : config_(std::move(config)),
      store_(std::move(store)),
      dispatcher_(store_) {
    if (!store_)
        throw std::invalid_argument("HttpServer requires a store");
    if (config_.num_workers == 0)
        throw std::invalid_argument("HttpServer requires at least one worker");
}

void HttpServer::start() {
    if (running_)
        throw std::runtime_error("Server is already listening");

    listen_socket_ = Socket::listen_tcp(config_.host, config_.port);
    port_ = listen_socket_.local_port();

    std::signal(SIGPIPE, SIG_IGN); // ignore SIGPIPE
    s_this_server = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    poll_fds_.push_back({listen_socket_.fd(), POLLIN, 0}); // The server listening socket
    poll_fds_.push_back({waker_.read_fd(), POLLIN, 0}); // The read-end of the self-pipe

    setup_workers();
    running_ = true;
    std::cout << "Listening on " << config_.host << ":" << port_.load() << std::endl;

    try {
        run_reactor();
    } catch (...) {
        shutdown(); // join the workers before anything they touch goes away
        throw;
    }
    shutdown();
}

void HttpServer::run_reactor() {
    while (!stop_requested_) {
        apply_dirty_updates();
        int activity = poll(poll_fds_.data(), poll_fds_.size(), -1); // Block until a FD is ready
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGWINCH or SIGCONT
                continue;
            break;
        }

        for (size_t i = 0; i < poll_fds_.size();) {
            short revents = poll_fds_[i].revents;
            int fd = poll_fds_[i].fd;

            // Nothing on current fd
            if (revents == 0) {
                ++i;
                continue;
            }
            poll_fds_[i].revents = 0;

            // Waker poke
            if (fd == waker_.read_fd()) {
                if (revents & POLLIN)
                    waker_.clear();
                ++i;
                continue;
            }

            // New client
            if (fd == listen_socket_.fd()) {
                if (revents & POLLIN)
                    handle_new_connection();
                ++i;
                continue;
            }

            bool alive = true;
            if (revents & POLLIN)
                alive = handle_client_read(fd);
            if (alive && (revents & POLLOUT))
                alive = handle_client_write(i);
            // Errors and hangups without pending data
            if (alive && (revents & (POLLERR | POLLHUP | POLLNVAL)) && !(revents & POLLIN))
                alive = false;

            if (!alive) {
                // swap & pop moves the last entry into slot i, look at it next
                handle_client_dc(i);
                continue;
            }
            ++i;
        }
    }
}

void HttpServer::shutdown() {
    workers_.clear(); // jthread requests stop and joins
    size_t dropped = work_queue_.clear();
    if (dropped > 0)
        std::cout << "Dropped " << dropped << " pending requests\n";

    clients_.clear();
    fd_idx_map_.clear();
    poll_fds_.clear();
    {
        std::lock_guard lock(dirty_mutex_);
        dirty_fds_.clear();
    }
    listen_socket_ = Socket{}; // closes the listening FD

    if (s_this_server == this)
        s_this_server = nullptr;
    stop_requested_ = false;
    running_ = false;
    std::cout << "Server stopped" << std::endl;
}

void HttpServer::apply_dirty_updates() {
    std::vector<int> local_dirty;
    {
        // Swap to a local vector to keep the lock time minimal
        std::lock_guard lock(dirty_mutex_);
        local_dirty.swap(dirty_fds_);
    }

    for (auto fd : local_dirty) {
        if (fd_idx_map_.find(fd) == fd_idx_map_.end())
            continue; // disconnected meanwhile
        enable_write(fd);
        // The previous request is answered, the next pipelined one may go
        dispatch_pending(fd);
    }
}

void HttpServer::mark_as_dirty(int fd) {
    {
        std::lock_guard lock(dirty_mutex_);
        dirty_fds_.push_back(fd);
    }
    waker_.notify();
}

void HttpServer::enable_write(int fd) {
    auto it = fd_idx_map_.find(fd);
    if (it != fd_idx_map_.end())
        poll_fds_[it->second].events |= POLLOUT;
}

bool HttpServer::handle_client_write(size_t poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto& client_connection = clients_.at(fd);

    try {
        if (!client_connection->write_from_outbox()) {  // if "everything has been written"
            poll_fds_[poll_fds_idx].events &= ~POLLOUT; // Outbox empty, turn off POLLOUT
            if (client_connection->finished())
                return false;
        }
    } catch (const IOError&) {
        return false;
    }
    return true;
}

void HttpServer::handle_client_dc(size_t poll_fds_idx) {
    int moving_fd = poll_fds_.back().fd;
    int dead_fd = poll_fds_[poll_fds_idx].fd;

    // swap & pop to remove dead connection in O(1)
    if (poll_fds_idx < poll_fds_.size() - 1) {
        std::swap(poll_fds_[poll_fds_idx], poll_fds_.back());
        fd_idx_map_[moving_fd] = poll_fds_idx;
    }
    fd_idx_map_.erase(dead_fd);
    clients_.erase(dead_fd);
    poll_fds_.pop_back();

    std::cout << "Client [" << dead_fd << "] disconnected\n";
}

void HttpServer::handle_new_connection() {
    auto client = accept();
    if (!client)
        return;
    std::cout << "Client [" << client->fd() << "] connected on port " << port_.load() << "\n";
    int current_fd = client->fd();
    poll_fds_.push_back({current_fd, POLLIN, 0});
    fd_idx_map_[current_fd] = poll_fds_.size() - 1;
    clients_[current_fd] = std::make_shared<Connection>(std::move(*client));
}

bool HttpServer::handle_client_read(int fd) {
    auto& client_connection = clients_.at(fd);
    try {
        // Pull data from the OS into our buffer
        if (!client_connection->read_to_inbox()) {
            // Half-closed: stop reading, answer what is already buffered
            poll_fds_[fd_idx_map_.at(fd)].events &= ~POLLIN;
        }
    } catch (const BufferOverflowError& e) {
        client_connection->fail(HttpResponse::text(413, e.what()).serialize(false));
        enable_write(fd);
        return true;
    } catch (const IOError&) {
        return false;
    }

    dispatch_pending(fd);
    return !client_connection->finished();
}

void HttpServer::dispatch_pending(int fd) {
    auto client_connection = clients_.at(fd);
    try {
        auto request = client_connection->try_get_request();
        if (!request)
            return;
        // Push to worker pool
        work_queue_.push(Task{
            .connection = client_connection,
            .request = std::move(*request),
            .on_complete = [this, fd]() { mark_as_dirty(fd); }
        });
    } catch (const ProtocolError& e) {
        client_connection->fail(HttpResponse::text(e.status(), e.what()).serialize(false));
        enable_write(fd);
    }
}

void HttpServer::stop() {
    // Only the first request pokes the reactor
    if (stop_requested_.exchange(true))
        return;
    waker_.notify(); // reactor wakes up, sees stop_requested_ and tears down
}

std::optional<Socket> HttpServer::accept() {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);

    // Create non-blocking client socket
    int client_fd = ::accept4(
        listen_socket_.fd(),
        reinterpret_cast<sockaddr*>(&client_addr),
        &client_len,
        SOCK_NONBLOCK | SOCK_CLOEXEC
    );

    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            std::cerr << "Accept failed: errno " << errno << "\n";
        return std::nullopt;
    }

    return Socket{client_fd};
}

bool HttpServer::is_running() const noexcept {
    return running_;
}

uint16_t HttpServer::port() const noexcept {
    return port_;
}

void HttpServer::worker_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        auto task = work_queue_.wait_and_pop(stop_token);
        if (task)
            task->execute(dispatcher_);
    }
}

void HttpServer::setup_workers() {
    for (size_t i = 0; i < config_.num_workers; i++) {
        workers_.emplace_back([this](std::stop_token stop_token) {
            worker_loop(stop_token);
        });
    }
}


} // namespace todo
