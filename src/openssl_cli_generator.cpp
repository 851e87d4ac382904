#include "openssl_cli_generator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

extern char** environ;

namespace fs = std::filesystem;

namespace ds {

namespace {

// Temporary file created with mkstemps and unlinked on scope exit
class ScopedTempFile {
public:
    ScopedTempFile(const std::string& dir, const std::string& contents) {
        std::string pattern = (fs::path(dir) / "devserve-XXXXXX.cnf").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');

        int fd = mkstemps(buf.data(), 4);
        if (fd < 0) {
            throw ProvisioningError("Failed to create temporary openssl config in " + dir +
                                    ": " + std::strerror(errno));
        }
        path_ = buf.data();

        const char* cursor = contents.data();
        size_t remaining = contents.size();
        while (remaining > 0) {
            ssize_t n = write(fd, cursor, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                close(fd);
                unlink(path_.c_str());
                throw ProvisioningError("Failed to write " + path_ + ": " + std::strerror(err));
            }
            cursor += n;
            remaining -= static_cast<size_t>(n);
        }
        close(fd);
    }

    ~ScopedTempFile() {
        if (unlink(path_.c_str()) < 0 && errno != ENOENT) {
            spdlog::warn("Failed to remove temporary file {}: {}", path_, std::strerror(errno));
        }
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Keeps only the last lines of openssl's chatter for error messages
std::string tail(const std::string& text, size_t max_chars = 512) {
    if (text.size() <= max_chars) return text;
    return "..." + text.substr(text.size() - max_chars);
}

} // namespace

OpensslCliGenerator::OpensslCliGenerator(std::string executable, std::string temp_dir)
    : executable_(std::move(executable))
    , temp_dir_(std::move(temp_dir))
{
    if (executable_.empty()) {
        const char* path = std::getenv("PATH");
        executable_ = find_in_path("openssl", path ? path : "");
    } else if (access(executable_.c_str(), X_OK) != 0) {
        spdlog::debug("openssl: {} is not executable", executable_);
        executable_.clear();
    }

    if (temp_dir_.empty()) {
        std::error_code ec;
        temp_dir_ = fs::temp_directory_path(ec).string();
        if (ec) temp_dir_ = "/tmp";
    }
}

std::string OpensslCliGenerator::find_in_path(const std::string& program, const std::string& search_path) {
    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / program;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

std::string OpensslCliGenerator::render_config(const CertificateRequest& request) {
    std::ostringstream oss;
    oss << "[req]\n"
        << "distinguished_name = req_distinguished_name\n"
        << "x509_extensions = v3_req\n"
        << "prompt = no\n"
        << "[req_distinguished_name]\n"
        << "CN = " << request.common_name << "\n"
        << "[v3_req]\n"
        << "basicConstraints = CA:FALSE\n"
        << "subjectAltName = " << join_subject_alt_names(request.subject_alt_names) << "\n";
    return oss.str();
}

void OpensslCliGenerator::generate(const CertificateRequest& request) {
    if (!available()) {
        throw ProvisioningError("openssl executable not found");
    }

    ScopedTempFile config(temp_dir_, render_config(request));

    std::vector<std::string> argv = {
        executable_, "req", "-x509",
        "-newkey", "rsa:" + std::to_string(request.key_bits),
        "-keyout", request.key_path,
        "-out", request.cert_path,
        "-days", std::to_string(request.validity_days),
        "-nodes",
        "-config", config.path(),
    };

    spdlog::debug("Running {} req -x509 -config {}", executable_, config.path());
    auto result = run(argv);

    if (result.exit_code != 0) {
        throw ProvisioningError("openssl exited with status " + std::to_string(result.exit_code) +
                                (result.output.empty() ? "" : ": " + tail(result.output)));
    }
}

OpensslCliGenerator::ProcessResult OpensslCliGenerator::run(const std::vector<std::string>& argv) {
    int pipe_fds[2];
    if (pipe(pipe_fds) < 0) {
        throw ProvisioningError(std::string("pipe() failed: ") + std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
    posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);

    std::vector<char*> args;
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawn(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(pipe_fds[1]);

    if (rc != 0) {
        close(pipe_fds[0]);
        throw ProvisioningError("Failed to start " + argv[0] + ": " + std::strerror(rc));
    }

    ProcessResult result;
    char buf[1024];
    for (;;) {
        ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProvisioningError(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace ds
