#pragma once

#include "config.hpp"
#include "tls_raii.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ds {

// Static file server over TLS. One worker thread per connection, one request
// per connection. serve() blocks until stop() is called from another thread.
class HttpServer {
public:
    // hidden_files are never served nor listed (the certificate and key)
    HttpServer(const ServerConfig& config, SslCtxPtr tls_ctx,
               std::vector<std::string> hidden_files = {});
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen on host:port; throws ServerError. Called by serve() if needed.
    void listen();

    // Accept loop. Returns after stop(), once in-flight connections are
    // drained; throws ServerError on listener failure.
    void serve();

    // Ask serve() to finish and wait until it has. Safe from any thread other
    // than the one running serve(); no-op when not serving.
    void stop();

    bool is_running() const { return serving_.load(); }

    // Bound port (useful when configured with port 0)
    uint16_t port() const { return bound_port_; }

    static std::string get_mime_type(const std::string& path);

private:
    struct Response {
        int status = 200;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::string file_path;   // streamed instead of body when set
        uint64_t content_length = 0;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_connection();
    void handle_client(int client_fd, const std::string& client_ip);
    Response handle_request(const std::string& method, const std::string& target);
    Response serve_directory(const std::filesystem::path& dir, const std::string& url_path,
                             const std::string& query);
    Response serve_file(const std::filesystem::path& file);
    Response listing(const std::filesystem::path& dir, const std::string& url_path);
    static Response error_response(int status, const std::string& detail = "");
    bool send_response(SSL* ssl, const Response& res, bool head_only);
    bool is_hidden(const std::filesystem::path& path) const;

    void reap_workers();
    void drain_workers();
    void finish_serving();

    ServerConfig config_;
    SslCtxPtr tls_ctx_;
    std::filesystem::path root_;
    std::vector<std::filesystem::path> hidden_files_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> serving_{false};
    std::atomic<bool> stop_requested_{false};

    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;

    std::mutex workers_mutex_;
    std::condition_variable idle_cv_;
    std::list<Worker> workers_;
    std::set<int> active_fds_;

    static const std::unordered_map<std::string, std::string> mime_types_;
};

// Percent-decoding; returns false on malformed escapes or embedded NUL
bool url_decode(const std::string& in, std::string& out);

// Percent-encoding of everything outside the unreserved set and '/'
std::string url_encode_path(const std::string& in);

std::string html_escape(const std::string& in);

const char* status_text(int status);

} // namespace ds
