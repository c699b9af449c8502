#pragma once

#include <unistd.h>
#include <fcntl.h>
#include <stdexcept>


namespace todo {

/*
 * Self-pipe used to interrupt the reactor's poll().
 * notify() is async-signal-safe, the SIGINT handler calls it.
 */
class Waker {
public:
    Waker();
    ~Waker();

    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;

    int read_fd() const noexcept;

    void notify() noexcept;

    // Drains pending notifications
    void clear() noexcept;

private:
    int pipe_fds_[2];
};

} // namespace todo
