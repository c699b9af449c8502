#pragma once

#include "todo/socket.hpp"
#include "todo/todo_store.hpp"
#include "todo/work_queue.hpp"
#include "todo/http.hpp"
#include "todo/request_dispatcher.hpp"
#include "waker.hpp"
#include "connection.hpp"
#include "server_config.hpp"
#include <cstdint>
#include <thread>
#include <mutex>
#include <vector>
#include <functional>
#include <optional>
#include <atomic>
#include <memory>
#include <poll.h>
#include <map>
#include <unordered_map>

namespace todo {

struct Task {
    std::weak_ptr<Connection> connection;
    HttpRequest request;
    std::function<void()> on_complete; // Reactor poke callback

    void execute(const RequestDispatcher& dispatcher);
};


class HttpServer {
public:
    HttpServer(ServerConfig config, std::shared_ptr<TodoStore> store);

    ~HttpServer() = default;

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    // Bind, start the workers and run the reactor until stop().
    // Throws std::runtime_error if the address cannot be bound.
    void start();

    // Ask the reactor to shut down. Safe from any thread and from a signal handler.
    // A stop requested before start() makes the next start() return right after binding.
    void stop();

    // Returns true if the server is running.
    bool is_running() const noexcept;

    // Bound port, valid once running
    uint16_t port() const noexcept;

private:
    ServerConfig config_;
    std::shared_ptr<TodoStore> store_;
    RequestDispatcher dispatcher_;
    Socket listen_socket_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint16_t> port_{0};

    // Reactor event loop
    void run_reactor();
    void shutdown();
    std::optional<Socket> accept();
    void handle_new_connection();
    bool handle_client_read(int fd);
    bool handle_client_write(size_t poll_fds_idx);
    void handle_client_dc(size_t poll_fds_idx);
    void dispatch_pending(int fd);
    void enable_write(int fd);

    // Thread pool
    WorkQueue<Task> work_queue_;
    std::vector<pollfd> poll_fds_;
    std::map<int, std::shared_ptr<Connection>> clients_; // fd -> connection map
    void setup_workers();
    void worker_loop(std::stop_token stop_token);

    // Waker
    Waker waker_;
    inline static HttpServer* s_this_server = nullptr; // used by the signal handler
    static void signal_handler(int) {
        if (s_this_server)
            s_this_server->stop();
    }

    // dirty list
    std::mutex dirty_mutex_;
    std::vector<int> dirty_fds_;
    std::unordered_map<int, size_t> fd_idx_map_;

    void mark_as_dirty(int fd);
    void apply_dirty_updates();

    // Declared last: joined before the waker, queue and dirty list are destroyed
    std::vector<std::jthread> workers_;

};

} // namespace todo
