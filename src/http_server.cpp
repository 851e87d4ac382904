#include "http_server.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <new>
#include <system_error>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ds {

namespace {

constexpr size_t kMaxHeaderBytes = 16 * 1024;
constexpr size_t kFileChunkBytes = 64 * 1024;

std::string peer_address(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET6) {
        const auto* a = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
        std::string s(buf);
        // IPv4-mapped clients of a dual-stack listener
        if (s.rfind("::ffff:", 0) == 0 && s.find('.') != std::string::npos) {
            return s.substr(7);
        }
        return s;
    }
    const auto* a = reinterpret_cast<const sockaddr_in*>(&addr);
    inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    return buf;
}

void set_socket_timeout(int fd, int timeout_ms) {
    if (timeout_ms <= 0) return;
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool ssl_write_all(SSL* ssl, const char* data, size_t size) {
    while (size > 0) {
        int n = SSL_write(ssl, data, static_cast<int>(std::min<size_t>(size, INT32_MAX)));
        if (n <= 0) {
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

// Whether `path` equals or lies below `base` (both lexically normal)
bool is_within(const fs::path& base, const fs::path& path) {
    auto mismatch = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
    if (mismatch.first == base.end()) return true;
    // base ends with an empty component when it carries a trailing slash
    return std::next(mismatch.first) == base.end() && mismatch.first->empty();
}

} // namespace

const std::unordered_map<std::string, std::string> HttpServer::mime_types_ = {
    {".html", "text/html"},
    {".htm",  "text/html"},
    {".css",  "text/css"},
    {".js",   "application/javascript"},
    {".mjs",  "application/javascript"},
    {".json", "application/json"},
    {".map",  "application/json"},
    {".webmanifest", "application/manifest+json"},
    {".txt",  "text/plain"},
    {".xml",  "application/xml"},
    {".pdf",  "application/pdf"},
    {".wasm", "application/wasm"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".webp", "image/webp"},
    {".avif", "image/avif"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
    {".otf",  "font/otf"},
    {".mp3",  "audio/mpeg"},
    {".wav",  "audio/wav"},
    {".ogg",  "audio/ogg"},
    {".mp4",  "video/mp4"},
    {".webm", "video/webm"},
};

HttpServer::HttpServer(const ServerConfig& config, SslCtxPtr tls_ctx,
                       std::vector<std::string> hidden_files)
    : config_(config)
    , tls_ctx_(std::move(tls_ctx))
{
    std::error_code ec;
    root_ = fs::weakly_canonical(fs::absolute(config_.root), ec);
    if (ec) {
        root_ = fs::absolute(config_.root).lexically_normal();
    }
    for (const auto& f : hidden_files) {
        hidden_files_.push_back(fs::weakly_canonical(fs::absolute(f), ec));
    }
}

HttpServer::~HttpServer() {
    stop();
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::listen() {
    if (server_fd_ >= 0) return;
    if (!tls_ctx_) {
        throw ServerError("HTTPS: no TLS context");
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* result = nullptr;
    std::string port_str = std::to_string(config_.port);
    const char* host = config_.host.empty() ? nullptr : config_.host.c_str();
    int gai = getaddrinfo(host, port_str.c_str(), &hints, &result);
    if (gai != 0) {
        throw ServerError("HTTPS: cannot resolve " + config_.host + ": " + gai_strerror(gai));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs(result, &freeaddrinfo);

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (ai->ai_family == AF_INET6) {
            int v6only = 0;
            setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
        }

        if (bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::string("bind: ") + std::strerror(errno);
            close(fd);
            continue;
        }
        if (::listen(fd, SOMAXCONN) < 0) {
            last_error = std::string("listen: ") + std::strerror(errno);
            close(fd);
            continue;
        }

        sockaddr_storage local{};
        socklen_t len = sizeof(local);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            bound_port_ = ntohs(local.ss_family == AF_INET6
                ? reinterpret_cast<sockaddr_in6*>(&local)->sin6_port
                : reinterpret_cast<sockaddr_in*>(&local)->sin_port);
        }
        server_fd_ = fd;
        break;
    }

    if (server_fd_ < 0) {
        throw ServerError("HTTPS: failed to listen on " + config_.host + ":" + port_str +
                          " (" + last_error + ")");
    }

    spdlog::info("HTTPS server listening on https://{}:{} (root: {})",
                 config_.host, bound_port_, root_.string());
}

void HttpServer::serve() {
    if (serving_.exchange(true)) {
        throw ServerError("HTTPS: serve() is already running");
    }

    try {
        listen();
    } catch (const ServerError&) {
        finish_serving();
        throw;
    }

    // A client hanging up mid-write must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    std::string failure;
    while (!stop_requested_.load()) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, config_.poll_interval_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            failure = std::string("poll: ") + std::strerror(errno);
            break;
        }
        if (rc > 0) {
            if (pfd.revents & (POLLERR | POLLNVAL)) {
                failure = "listening socket failed";
                break;
            }
            if (pfd.revents & POLLIN) {
                accept_connection();
            }
        }
        reap_workers();
    }

    close(server_fd_);
    server_fd_ = -1;
    spdlog::info("HTTPS server stopped accepting connections");

    drain_workers();
    finish_serving();

    if (!failure.empty()) {
        throw ServerError("HTTPS: " + failure);
    }
}

void HttpServer::stop() {
    stop_requested_.store(true);
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait(lock, [this] { return !serving_.load(); });
}

void HttpServer::finish_serving() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        serving_.store(false);
    }
    stopped_cv_.notify_all();
}

void HttpServer::accept_connection() {
    sockaddr_storage client_addr{};
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len,
                            SOCK_CLOEXEC);
    if (client_fd < 0) {
        // Transient: aborted handshakes, fd exhaustion, signals
        spdlog::debug("HTTPS: accept failed: {}", std::strerror(errno));
        return;
    }

    set_socket_timeout(client_fd, config_.socket_timeout_ms);
    std::string client_ip = peer_address(client_addr);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    try {
        workers_.push_back(Worker{std::thread(), std::make_shared<std::atomic<bool>>(false)});
    } catch (const std::bad_alloc&) {
        spdlog::error("HTTPS: out of memory, dropping connection from {}", client_ip);
        close(client_fd);
        return;
    }

    // The list node exists before the thread does, so a started worker is always tracked
    Worker& worker = workers_.back();
    auto done = worker.done;
    try {
        active_fds_.insert(client_fd);
        worker.thread = std::thread([this, client_fd, client_ip, done]() {
            handle_client(client_fd, client_ip);
            {
                std::lock_guard<std::mutex> worker_lock(workers_mutex_);
                active_fds_.erase(client_fd);
                close(client_fd);
            }
            done->store(true);
            idle_cv_.notify_all();
        });
    } catch (const std::exception& e) {
        spdlog::error("HTTPS: cannot start worker for {}: {}", client_ip, e.what());
        active_fds_.erase(client_fd);
        workers_.pop_back();
        close(client_fd);
    }
}

void HttpServer::reap_workers() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.splice(finished.end(), workers_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void HttpServer::drain_workers() {
    std::list<Worker> remaining;
    {
        std::unique_lock<std::mutex> lock(workers_mutex_);
        auto timeout = std::chrono::milliseconds(config_.drain_timeout_ms);
        if (!idle_cv_.wait_for(lock, timeout, [this] { return active_fds_.empty(); })) {
            spdlog::warn("HTTPS: {} connection(s) still open after {} ms, closing them",
                         active_fds_.size(), config_.drain_timeout_ms);
            for (int fd : active_fds_) {
                shutdown(fd, SHUT_RDWR);
            }
        }
        remaining.swap(workers_);
    }
    for (auto& w : remaining) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    SslPtr ssl(SSL_new(tls_ctx_.get()), &SSL_free);
    if (!ssl) {
        spdlog::error("HTTPS: SSL_new failed: {}", openssl_error_string());
        return;
    }
    SSL_set_fd(ssl.get(), client_fd);

    if (SSL_accept(ssl.get()) != 1) {
        // Typically a browser rejecting the self-signed certificate
        spdlog::debug("HTTPS: TLS handshake with {} failed: {}", client_ip, openssl_error_string());
        return;
    }

    // Read the request head
    std::string request;
    char buf[4096];
    size_t head_end = std::string::npos;
    while (head_end == std::string::npos) {
        int n = SSL_read(ssl.get(), buf, sizeof(buf));
        if (n <= 0) {
            ERR_clear_error();
            return;
        }
        request.append(buf, static_cast<size_t>(n));
        head_end = request.find("\r\n\r\n");
        if (head_end == std::string::npos && request.size() > kMaxHeaderBytes) {
            send_response(ssl.get(), error_response(431), false);
            access_logger()->info("{} \"- -\" 431", client_ip);
            return;
        }
    }

    // Parse first line: "GET /path HTTP/1.1"
    std::string first_line = request.substr(0, request.find("\r\n"));
    std::istringstream line(first_line);
    std::string method, target, version, extra;
    line >> method >> target >> version;

    Response res;
    if (method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0 || (line >> extra)) {
        res = error_response(400, "Bad request syntax");
    } else {
        res = handle_request(method, target);
    }

    bool sent = send_response(ssl.get(), res, method == "HEAD");
    if (sent) {
        SSL_shutdown(ssl.get());
    } else {
        spdlog::debug("HTTPS: client {} went away mid-response", client_ip);
    }
    ERR_clear_error();

    access_logger()->info("{} \"{} {}\" {}", client_ip,
                          method.empty() ? "-" : method,
                          target.empty() ? "-" : target, res.status);
}

HttpServer::Response HttpServer::handle_request(const std::string& method, const std::string& target) {
    if (method != "GET" && method != "HEAD") {
        auto res = error_response(501, "Unsupported method (" + method + ")");
        res.headers.emplace_back("Allow", "GET, HEAD");
        return res;
    }

    std::string uri = target;

    // Absolute-form: drop scheme and authority
    auto scheme = uri.find("://");
    if (scheme != std::string::npos && uri[0] != '/') {
        auto path_start = uri.find('/', scheme + 3);
        uri = path_start == std::string::npos ? "/" : uri.substr(path_start);
    }

    // Strip fragment and query string
    auto fragment = uri.find('#');
    if (fragment != std::string::npos) {
        uri = uri.substr(0, fragment);
    }
    std::string query;
    auto query_pos = uri.find('?');
    if (query_pos != std::string::npos) {
        query = uri.substr(query_pos);
        uri = uri.substr(0, query_pos);
    }

    if (uri.empty() || uri[0] != '/') {
        return error_response(400, "Bad request path");
    }

    std::string decoded;
    if (!url_decode(uri, decoded)) {
        return error_response(400, "Bad request path");
    }

    // Security: resolve lexically and check it's inside root
    fs::path full = (root_ / fs::path(decoded).relative_path()).lexically_normal();
    if (!is_within(root_, full)) {
        spdlog::warn("HTTPS: Path traversal attempt: {}", target);
        return error_response(404, "File not found");
    }

    std::error_code ec;
    auto status = fs::status(full, ec);
    if (ec || !fs::exists(status)) {
        return error_response(404, "File not found");
    }

    if (fs::is_directory(status)) {
        return serve_directory(full, decoded, query);
    }

    // "file.html/" names a directory that doesn't exist
    if (decoded.back() == '/' || !fs::is_regular_file(status) || is_hidden(full)) {
        return error_response(404, "File not found");
    }

    return serve_file(full);
}

HttpServer::Response HttpServer::serve_directory(const fs::path& dir, const std::string& url_path,
                                                 const std::string& query) {
    if (url_path.back() != '/') {
        Response res;
        res.status = 301;
        res.headers.emplace_back("Location", url_encode_path(url_path + "/") + query);
        return res;
    }

    for (const char* index : {"index.html", "index.htm"}) {
        fs::path candidate = dir / index;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && !is_hidden(candidate)) {
            return serve_file(candidate);
        }
    }

    return listing(dir, url_path);
}

HttpServer::Response HttpServer::serve_file(const fs::path& file) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    std::ifstream readable(file, std::ios::binary);
    if (ec || !readable.is_open()) {
        return error_response(500, "Cannot read file");
    }

    Response res;
    res.status = 200;
    res.file_path = file.string();
    res.content_length = size;
    res.headers.emplace_back("Content-Type", get_mime_type(file.string()));
    return res;
}

HttpServer::Response HttpServer::listing(const fs::path& dir, const std::string& url_path) {
    std::vector<std::pair<std::string, bool>> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (is_hidden(it->path())) continue;
        std::error_code type_ec;
        entries.emplace_back(it->path().filename().string(), it->is_directory(type_ec));
    }
    if (ec) {
        return error_response(404, "No permission to list directory");
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        std::string la = a.first, lb = b.first;
        std::transform(la.begin(), la.end(), la.begin(), ::tolower);
        std::transform(lb.begin(), lb.end(), lb.begin(), ::tolower);
        return la < lb;
    });

    std::string title = "Directory listing for " + html_escape(url_path);
    std::ostringstream html;
    html << "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n</head>\n<body>\n"
         << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto& [name, is_dir] : entries) {
        std::string display = is_dir ? name + "/" : name;
        html << "<li><a href=\"" << url_encode_path(display) << "\">"
             << html_escape(display) << "</a></li>\n";
    }
    html << "</ul>\n<hr>\n</body>\n</html>\n";

    Response res;
    res.status = 200;
    res.body = html.str();
    res.headers.emplace_back("Content-Type", "text/html; charset=utf-8");
    return res;
}

HttpServer::Response HttpServer::error_response(int status, const std::string& detail) {
    Response res;
    res.status = status;
    std::string message = html_escape(detail.empty() ? status_text(status) : detail);
    res.body = "<html><body><h1>" + std::to_string(status) + " " + status_text(status) +
               "</h1><p>" + message + "</p></body></html>";
    res.headers.emplace_back("Content-Type", "text/html; charset=utf-8");
    return res;
}

bool HttpServer::send_response(SSL* ssl, const Response& res, bool head_only) {
    uint64_t length = res.file_path.empty() ? res.body.size() : res.content_length;

    std::ostringstream oss;
    oss << "HTTP/1.1 " << res.status << " " << status_text(res.status) << "\r\n"
        << "Server: devserve\r\n";
    for (const auto& [name, value] : res.headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << length << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Cache-Control: no-cache\r\n"
        << "Connection: close\r\n"
        << "\r\n";

    std::string header = oss.str();
    if (!ssl_write_all(ssl, header.data(), header.size())) return false;
    if (head_only) return true;

    if (res.file_path.empty()) {
        return ssl_write_all(ssl, res.body.data(), res.body.size());
    }

    std::ifstream file(res.file_path, std::ios::binary);
    std::vector<char> chunk(kFileChunkBytes);
    uint64_t remaining = length;
    while (remaining > 0 && file) {
        file.read(chunk.data(), static_cast<std::streamsize>(std::min<uint64_t>(chunk.size(), remaining)));
        auto got = static_cast<size_t>(file.gcount());
        if (got == 0) break;
        if (!ssl_write_all(ssl, chunk.data(), got)) return false;
        remaining -= got;
    }
    // A file that shrank while being sent leaves the response short
    return remaining == 0;
}

bool HttpServer::is_hidden(const fs::path& path) const {
    if (hidden_files_.empty()) return false;
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) canonical = path.lexically_normal();
    return std::find(hidden_files_.begin(), hidden_files_.end(), canonical) != hidden_files_.end();
}

std::string HttpServer::get_mime_type(const std::string& path) {
    fs::path p(path);
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    auto it = mime_types_.find(ext);
    if (it != mime_types_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

bool url_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size() || !std::isxdigit(static_cast<unsigned char>(in[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
                return false;
            }
            char decoded = static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            if (decoded == '\0') return false;
            out.push_back(decoded);
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return true;
}

std::string url_encode_path(const std::string& in) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0f]);
        }
    }
    return out;
}

std::string html_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 301: return "Moved Permanently";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default: return "Unknown";
    }
}

} // namespace ds
