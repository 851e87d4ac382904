#include "browser.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstring>
#include <thread>
#include <vector>

extern char** environ;

namespace ds {

bool open_browser(const std::string& url) {
#ifdef __APPLE__
    const char* launcher = "open";
#else
    const char* launcher = "xdg-open";
#endif

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<char*> args = {const_cast<char*>(launcher), const_cast<char*>(url.c_str()), nullptr};

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, launcher, &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        spdlog::debug("Could not open browser with {}: {}", launcher, std::strerror(rc));
        return false;
    }

    // Reap the launcher without holding up startup
    std::thread([pid, launcher]() {
        int status = 0;
        waitpid(pid, &status, 0);
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            spdlog::debug("{} exited with status {}", launcher, status);
        }
    }).detach();

    return true;
}

} // namespace ds
