#include "shutdown_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

namespace {

// Write end of the installed coordinator's pipe, -1 when none
std::atomic<int> g_signal_pipe{-1};

} // namespace

extern "C" void devserve_signal_handler(int sig) {
    int saved_errno = errno;
    int fd = g_signal_pipe.load();
    if (fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(sig);
        ssize_t ignored = write(fd, &byte, 1);
        (void)ignored;  // pipe full means a signal is already pending
    }
    errno = saved_errno;
}

namespace ds {

const char* to_string(ShutdownCoordinator::State state) {
    switch (state) {
        case ShutdownCoordinator::State::Running: return "running";
        case ShutdownCoordinator::State::ShuttingDown: return "shutting-down";
        case ShutdownCoordinator::State::Stopped: return "stopped";
    }
    return "unknown";
}

ShutdownCoordinator::ShutdownCoordinator(StopFunction stop)
    : stop_(std::move(stop))
{
}

ShutdownCoordinator::~ShutdownCoordinator() {
    uninstall();
    if (stop_thread_.joinable()) {
        stop_thread_.join();
    }
}

void ShutdownCoordinator::install() {
    if (installed_) return;

    if (pipe2(pipe_fds_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw std::runtime_error(std::string("Failed to create signal pipe: ") + std::strerror(errno));
    }

    int expected = -1;
    if (!g_signal_pipe.compare_exchange_strong(expected, pipe_fds_[1])) {
        close(pipe_fds_[0]);
        close(pipe_fds_[1]);
        pipe_fds_[0] = pipe_fds_[1] = -1;
        throw std::runtime_error("Another shutdown coordinator is already installed");
    }

    installed_ = true;
    watcher_thread_ = std::thread(&ShutdownCoordinator::watch_signals, this);

    std::signal(SIGINT, devserve_signal_handler);
    std::signal(SIGTERM, devserve_signal_handler);
}

void ShutdownCoordinator::uninstall() {
    if (!installed_) return;

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_pipe.store(-1);

    // Zero byte tells the watcher to exit
    unsigned char quit = 0;
    while (write(pipe_fds_[1], &quit, 1) < 0 && errno == EINTR) {
    }
    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }

    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    installed_ = false;
}

void ShutdownCoordinator::watch_signals() {
    for (;;) {
        pollfd pfd{};
        pfd.fd = pipe_fds_[0];
        pfd.events = POLLIN;
        if (poll(&pfd, 1, -1) < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Signal watcher: poll failed: {}", std::strerror(errno));
            return;
        }

        unsigned char buf[16];
        ssize_t n = read(pipe_fds_[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            spdlog::error("Signal watcher: read failed: {}", std::strerror(errno));
            return;
        }

        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == 0) return;
            int sig = buf[i];
            request_shutdown(std::string("signal ") + std::to_string(sig) + " (" + strsignal(sig) + ")");
        }
    }
}

bool ShutdownCoordinator::request_shutdown(const std::string& reason) {
    State expected = State::Running;
    if (!state_.compare_exchange_strong(expected, State::ShuttingDown)) {
        spdlog::debug("Shutdown already {} ({} ignored)", to_string(expected), reason);
        return false;
    }

    spdlog::info("Received {}, gracefully shutting down. Please wait...", reason);

    std::lock_guard<std::mutex> lock(mutex_);
    stop_thread_ = std::thread(&ShutdownCoordinator::run_stop, this, reason);
    return true;
}

void ShutdownCoordinator::run_stop(const std::string& reason) {
    try {
        if (stop_) stop_();
    } catch (const std::exception& e) {
        spdlog::error("Error while stopping after {}: {}", reason, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(State::Stopped);
    }
    stopped_cv_.notify_all();
    spdlog::debug("Shutdown complete");
}

void ShutdownCoordinator::wait_until_stopped() {
    std::unique_lock<std::mutex> lock(mutex_);
    stopped_cv_.wait(lock, [this] { return state_.load() == State::Stopped; });
}

bool ShutdownCoordinator::wait_until_stopped(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return stopped_cv_.wait_for(lock, timeout, [this] { return state_.load() == State::Stopped; });
}

} // namespace ds
