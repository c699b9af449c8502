#include "waker.hpp"


namespace todo {

Waker::Waker() {
    if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) == -1)
        throw std::runtime_error("Failed to create self-pipe");
}

Waker::~Waker() {
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
}

int Waker::read_fd() const noexcept {
    return pipe_fds_[0];
}

void Waker::notify() noexcept {
    char c = 'x';
    // A full pipe already guarantees a wakeup
    [[maybe_unused]] ssize_t n = ::write(pipe_fds_[1], &c, 1);
}

void Waker::clear() noexcept {
    char buf[64];
    while (::read(pipe_fds_[0], buf, sizeof(buf)) > 0);
}

} // namespace todo
