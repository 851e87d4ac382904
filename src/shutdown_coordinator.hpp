#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ds {

// Turns SIGINT/SIGTERM into exactly one call of the stop function.
//
// The signal handler only writes the signal number to a pipe. A watcher
// thread reads it and calls request_shutdown(), which moves
// Running -> ShuttingDown and runs the stop function on its own thread.
// When that returns the state becomes Stopped. Further requests are no-ops.
class ShutdownCoordinator {
public:
    enum class State { Running, ShuttingDown, Stopped };

    // Must block until the server has stopped (HttpServer::stop does)
    using StopFunction = std::function<void()>;

    explicit ShutdownCoordinator(StopFunction stop);
    ~ShutdownCoordinator();

    // Non-copyable
    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    // Route SIGINT and SIGTERM here. Only one coordinator may be installed
    // per process; throws std::runtime_error otherwise.
    void install();

    // Restore default signal dispositions and stop the watcher
    void uninstall();

    // Start the shutdown sequence unless one is already under way.
    // Returns immediately; true if this call started it.
    bool request_shutdown(const std::string& reason);

    State state() const { return state_.load(); }

    void wait_until_stopped();
    bool wait_until_stopped(std::chrono::milliseconds timeout);

private:
    void watch_signals();
    void run_stop(const std::string& reason);

    StopFunction stop_;
    std::atomic<State> state_{State::Running};

    std::mutex mutex_;
    std::condition_variable stopped_cv_;
    std::thread stop_thread_;

    std::thread watcher_thread_;
    int pipe_fds_[2] = {-1, -1};
    bool installed_ = false;
};

const char* to_string(ShutdownCoordinator::State state);

} // namespace ds
