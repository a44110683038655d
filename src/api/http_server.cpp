#include "api/http_server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <list>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

std::string HttpRequest::header(const std::string& name) const
{
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::param(const std::string& name) const
{
    auto it = params.find(name);
    return it == params.end() ? std::string() : it->second;
}

const char* status_text(int status)
{
    switch (status) {
    case 100: return "Continue";
    case 200: return "OK";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
    }
}

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

int create_and_bind_tcp(const std::string& host, int port)
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(static_cast<uint16_t>(port));

    if (host.empty() || host == "*" || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (host == "localhost") {
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        addrinfo hints{};
        hints.ai_family   = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
        if (rc != 0 || res == nullptr) {
            throw std::runtime_error(fmt::format("HttpServer: cannot resolve host '{}': {}",
                                                 host, gai_strerror(rc)));
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
        freeaddrinfo(res);
    }

    int sock = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        throw std::runtime_error(fmt::format("HttpServer: socket: {}", std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(sock);
        throw std::runtime_error(fmt::format("HttpServer: bind {}:{}: {}",
                                             host, port, std::strerror(err)));
    }
    if (listen(sock, 128) < 0) {
        int err = errno;
        ::close(sock);
        throw std::runtime_error(fmt::format("HttpServer: listen: {}", std::strerror(err)));
    }
    return sock;
}

void set_socket_timeout(int fd, int option, std::chrono::milliseconds timeout)
{
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

bool send_all(int fd, const char* data, std::size_t len)
{
    while (len > 0) {
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len  -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string_view trim(std::string_view s)
{
    auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view s, bool plusAsSpace)
{
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(plusAsSpace && c == '+' ? ' ' : c);
    }
    return out;
}

std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        if (end > start) out.emplace_back(path.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

bool match_route(const std::vector<std::string>& pattern,
                 const std::vector<std::string>& segments,
                 std::unordered_map<std::string, std::string>& params)
{
    if (pattern.size() != segments.size()) return false;
    std::unordered_map<std::string, std::string> captured;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (!pattern[i].empty() && pattern[i].front() == ':') {
            captured[pattern[i].substr(1)] = segments[i];
        } else if (pattern[i] != segments[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

class ConnectionResponder : public HttpResponder {
public:
    ConnectionResponder(int fd, const std::atomic<bool>& stopping)
        : fd_(fd), stopping_(stopping) {}

    void send(int status, const std::string& contentType, const std::string& body) override
    {
        if (status_ != 0) {
            spdlog::warn("HttpServer: response already sent, status {} dropped", status);
            return;
        }
        status_ = status;
        std::string head = fmt::format(
            "HTTP/1.1 {} {}\r\nContent-Type: {}\r\nContent-Length: {}\r\nConnection: close\r\n\r\n",
            status, status_text(status), contentType, body.size());
        if (!send_all(fd_, head.data(), head.size()) || !send_all(fd_, body.data(), body.size())) {
            spdlog::debug("HttpServer: failed to send response: {}", std::strerror(errno));
        }
    }

    bool beginEventStream() override
    {
        if (status_ != 0) return false;
        status_    = 200;
        streaming_ = true;
        static const std::string head =
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: text/event-stream\r\n"
            "Cache-Control: no-cache\r\n"
            "Connection: close\r\n"
            "X-Accel-Buffering: no\r\n\r\n";
        return send_all(fd_, head.data(), head.size());
    }

    bool write(const std::string& chunk) override
    {
        if (!streaming_) return false;
        return send_all(fd_, chunk.data(), chunk.size());
    }

    bool peerClosed() override
    {
        pollfd p{fd_, static_cast<short>(POLLIN | POLLRDHUP), 0};
        if (::poll(&p, 1, 0) <= 0) return false;
        if (p.revents & (POLLRDHUP | POLLHUP | POLLERR)) return true;
        if (p.revents & POLLIN) {
            char c;
            return ::recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT) == 0;
        }
        return false;
    }

    bool serverStopping() const override { return stopping_.load(std::memory_order_acquire); }

    int status() const override { return status_; }

private:
    int                      fd_;
    const std::atomic<bool>& stopping_;
    int                      status_    = 0;
    bool                     streaming_ = false;
};

} // namespace

class HttpServer::Impl {
public:
    explicit Impl(Options opt) : opt_(std::move(opt)) {}

    ~Impl() { stop(); }

    void route(const std::string& method, const std::string& pattern, HttpHandler handler)
    {
        std::lock_guard lg(routesMtx_);
        routes_.push_back(Route{method, split_path(pattern), std::move(handler)});
    }

    void start()
    {
        if (thread_.joinable()) return;

        fd_ = create_and_bind_tcp(opt_.host, opt_.port);

        sockaddr_in bound{};
        socklen_t   len = sizeof(bound);
        if (getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            boundPort_ = ntohs(bound.sin_port);
        }

        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error("HttpServer: epoll_create1 failed");
        }
        epoll_event ev{};
        ev.events  = EPOLLIN;
        ev.data.fd = fd_;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd_, &ev) < 0) {
            closeListener();
            throw std::runtime_error("HttpServer: epoll_ctl add failed");
        }

        stop_flag_ = false;
        stopping_  = false;
        thread_    = std::thread([this]() { acceptLoop(); });
        spdlog::info("HttpServer: listening on {}:{}", opt_.host, boundPort_);
    }

    void stop()
    {
        if (!thread_.joinable()) return;

        stop_flag_ = true;
        stopping_.store(true, std::memory_order_release);
        thread_.join();
        closeListener();

        // 唤醒仍阻塞在读请求上的连接线程；事件流通过 serverStopping() 自行退出
        std::list<Connection> conns;
        {
            std::lock_guard lg(connMtx_);
            for (auto& c : conns_) {
                if (c.fd >= 0) ::shutdown(c.fd, SHUT_RD);
            }
            conns.swap(conns_);
        }
        for (auto& c : conns) {
            if (c.thread.joinable()) c.thread.join();
        }
        spdlog::info("HttpServer: stopped");
    }

    int port() const { return boundPort_; }

private:
    struct Route {
        std::string              method;
        std::vector<std::string> segments;
        HttpHandler              handler;
    };

    struct Connection {
        int                      fd = -1;      // connMtx_ 保护
        std::string              peer;
        std::atomic<bool>        finished{false};
        std::thread              thread;
    };

    void closeListener()
    {
        if (fd_ >= 0)       ::close(fd_);
        if (epoll_fd_ >= 0) ::close(epoll_fd_);
        fd_       = -1;
        epoll_fd_ = -1;
    }

    void acceptLoop()
    {
        constexpr int max_events = 16;
        epoll_event events[max_events];
        while (!stop_flag_) {
            int nf = epoll_wait(epoll_fd_, events, max_events, 200);
            if (nf < 0) {
                if (errno == EINTR) continue;
                spdlog::error("HttpServer: epoll_wait error {}", std::strerror(errno));
                break;
            }
            for (int i = 0; i < nf; ++i) {
                if (events[i].data.fd == fd_) acceptAll();
            }
            reapFinished();
        }
    }

    void acceptAll()
    {
        while (true) {
            sockaddr_in peer{};
            socklen_t   len  = sizeof(peer);
            int         conn = accept4(fd_, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
            if (conn < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    spdlog::warn("HttpServer: accept failed: {}", std::strerror(errno));
                }
                return;
            }

            char ip[INET_ADDRSTRLEN] = "unknown";
            inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));

            std::lock_guard lg(connMtx_);
            auto& c = conns_.emplace_back();
            c.fd    = conn;
            c.peer  = fmt::format("{}:{}", ip, ntohs(peer.sin_port));
            try {
                c.thread = std::thread([this, &c]() { handleConnection(c); });
            } catch (const std::system_error& e) {
                spdlog::error("HttpServer: cannot start connection thread: {}", e.what());
                ::close(conn);
                conns_.pop_back();
            }
        }
    }

    void reapFinished()
    {
        std::lock_guard lg(connMtx_);
        for (auto it = conns_.begin(); it != conns_.end();) {
            if (it->finished.load(std::memory_order_acquire)) {
                if (it->thread.joinable()) it->thread.join();
                it = conns_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void handleConnection(Connection& c)
    {
        int fd;
        {
            std::lock_guard lg(connMtx_);
            fd = c.fd;
        }
        set_socket_timeout(fd, SO_RCVTIMEO, opt_.readTimeout);
        set_socket_timeout(fd, SO_SNDTIMEO, opt_.writeTimeout);

        ConnectionResponder resp(fd, stopping_);
        bool                fullyRead = false;
        try {
            HttpRequest req;
            req.remoteAddr = c.peer;
            int status = readRequest(fd, req);
            if (status == 0) {
                fullyRead = true;
                dispatch(req, resp);
            } else if (status > 0) {
                spdlog::debug("HttpServer: {} rejected with {}", c.peer, status);
                resp.json(status, {{"error", status_text(status)}});
            }
        } catch (const std::exception& e) {
            spdlog::error("HttpServer: connection {} failed: {}", c.peer, e.what());
            if (resp.status() == 0) resp.json(500, {{"error", "Internal server error"}});
        }

        ::shutdown(fd, SHUT_WR);
        if (!fullyRead) drain(fd);
        {
            std::lock_guard lg(connMtx_);
            ::close(fd);
            c.fd = -1;
        }
        c.finished.store(true, std::memory_order_release);
    }

    // 请求未读完就关闭会触发 RST，客户端可能收不到错误响应
    static void drain(int fd)
    {
        set_socket_timeout(fd, SO_RCVTIMEO, std::chrono::milliseconds(100));
        char        buf[4096];
        std::size_t total = 0;
        while (total < 1024 * 1024) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            total += static_cast<std::size_t>(n);
        }
    }

    // 0 = 成功，>0 = 需要回给客户端的错误码，-1 = 对端已关闭
    int readRequest(int fd, HttpRequest& req)
    {
        std::string buf;
        char        tmp[4096];
        std::size_t headerEnd;
        while ((headerEnd = buf.find("\r\n\r\n")) == std::string::npos) {
            if (buf.size() > kMaxHeaderBytes) return 431;
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n == 0) return buf.empty() ? -1 : 400;
            if (n < 0) {
                if (errno == EINTR) continue;
                if ((errno == EAGAIN || errno == EWOULDBLOCK) && !buf.empty()) return 408;
                return -1;
            }
            buf.append(tmp, static_cast<std::size_t>(n));
        }

        std::string_view head(buf.data(), headerEnd);
        auto lineEnd = head.find("\r\n");
        std::string_view requestLine = head.substr(0, lineEnd);

        auto sp1 = requestLine.find(' ');
        auto sp2 = sp1 == std::string_view::npos ? sp1 : requestLine.find(' ', sp1 + 1);
        if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) return 400;

        req.method = std::string(requestLine.substr(0, sp1));
        std::string_view target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
        req.version = std::string(requestLine.substr(sp2 + 1));
        if (req.method.empty() || target.empty() || target.front() != '/' ||
            req.version.rfind("HTTP/1.", 0) != 0) {
            return 400;
        }
        for (char ch : req.method) {
            if (!std::isupper(static_cast<unsigned char>(ch))) return 400;
        }

        auto qpos = target.find('?');
        req.path = url_decode(target.substr(0, qpos), false);
        if (qpos != std::string_view::npos) {
            for (const auto& pair : split_query(target.substr(qpos + 1))) {
                auto eq = pair.find('=');
                if (eq == std::string_view::npos) req.query[url_decode(pair, true)] = "";
                else req.query[url_decode(pair.substr(0, eq), true)] = url_decode(pair.substr(eq + 1), true);
            }
        }

        std::size_t pos = lineEnd == std::string_view::npos ? head.size() : lineEnd + 2;
        while (pos < head.size()) {
            auto end = head.find("\r\n", pos);
            if (end == std::string_view::npos) end = head.size();
            std::string_view line = head.substr(pos, end - pos);
            pos = end + 2;
            if (line.empty()) continue;
            auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) return 400;
            req.headers[to_lower(std::string(line.substr(0, colon)))] =
                std::string(trim(line.substr(colon + 1)));
        }

        if (!req.header("transfer-encoding").empty()) return 501;

        std::size_t contentLength = 0;
        if (auto cl = req.header("content-length"); !cl.empty()) {
            try {
                std::size_t used = 0;
                contentLength = std::stoull(cl, &used);
                if (used != cl.size()) return 400;
            } catch (const std::logic_error&) {
                return 400;
            }
        }
        if (contentLength > opt_.maxBodyBytes) return 413;

        if (contentLength > 0 && to_lower(req.header("expect")) == "100-continue") {
            static const std::string cont = "HTTP/1.1 100 Continue\r\n\r\n";
            send_all(fd, cont.data(), cont.size());
        }

        req.body = buf.substr(headerEnd + 4);
        while (req.body.size() < contentLength) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n == 0) return 400;
            if (n < 0) {
                if (errno == EINTR) continue;
                return (errno == EAGAIN || errno == EWOULDBLOCK) ? 408 : -1;
            }
            req.body.append(tmp, static_cast<std::size_t>(n));
        }
        req.body.resize(contentLength);
        return 0;
    }

    static std::vector<std::string_view> split_query(std::string_view q)
    {
        std::vector<std::string_view> out;
        std::size_t start = 0;
        while (start <= q.size()) {
            auto end = q.find('&', start);
            if (end == std::string_view::npos) end = q.size();
            if (end > start) out.push_back(q.substr(start, end - start));
            start = end + 1;
        }
        return out;
    }

    void dispatch(HttpRequest& req, HttpResponder& resp)
    {
        auto segments = split_path(req.path);

        HttpHandler handler;
        bool        pathMatched = false;
        {
            std::lock_guard lg(routesMtx_);
            for (const auto& r : routes_) {
                std::unordered_map<std::string, std::string> params;
                if (!match_route(r.segments, segments, params)) continue;
                pathMatched = true;
                if (r.method == req.method) {
                    req.params = std::move(params);
                    handler    = r.handler;
                    break;
                }
            }
        }

        if (!handler) {
            int status = pathMatched ? 405 : 404;
            spdlog::debug("HttpServer: {} {} -> {}", req.method, req.path, status);
            resp.json(status, {{"error", pathMatched ? "Method not allowed" : "Not found"}});
            return;
        }

        handler(req, resp);
        if (resp.status() == 0) {
            spdlog::error("HttpServer: handler for {} {} sent no response", req.method, req.path);
            resp.json(500, {{"error", "Internal server error"}});
        }
    }

    const Options     opt_;
    int               fd_        = -1;
    int               epoll_fd_  = -1;
    int               boundPort_ = 0;
    std::thread       thread_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> stopping_{false};

    std::mutex         routesMtx_;
    std::vector<Route> routes_;

    std::mutex            connMtx_;
    std::list<Connection> conns_;
};

// public 接口转发
HttpServer::HttpServer(Options opt)
    : pImpl_(std::make_unique<Impl>(std::move(opt))) {}
HttpServer::~HttpServer() = default;
void HttpServer::route(const std::string& method, const std::string& pattern, HttpHandler handler)
{
    pImpl_->route(method, pattern, std::move(handler));
}
void HttpServer::start() { pImpl_->start(); }
void HttpServer::stop() { pImpl_->stop(); }
int HttpServer::port() const { return pImpl_->port(); }
