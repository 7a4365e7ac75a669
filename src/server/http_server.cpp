/**
 * @file http_server.cpp
 * @brief HttpServer implementation: POSIX sockets with poll() timeouts.
 */

#include "server/http_server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace archetype {

namespace {

constexpr size_t kReadChunk = 8192;
constexpr int kAcceptPollMs = 100;

void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}

void close_connection(int fd) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

/// One recv() after waiting up to @p timeout_ms. 0 bytes means the peer closed.
Result<size_t> recv_some(int fd, char* buf, size_t len, uint32_t timeout_ms) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (ready < 0) return Error{ErrorCode::Io, "poll failed: " + std::string(strerror(errno))};
    if (ready == 0) return Error{ErrorCode::Unavailable, "Timed out waiting for data"};

    auto received = ::recv(fd, buf, len, 0);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return size_t{0};
        return Error{ErrorCode::Io, "recv failed: " + std::string(strerror(errno))};
    }
    if (received == 0) return Error{ErrorCode::Io, "Connection closed by peer"};
    return static_cast<size_t>(received);
}

}  // anonymous namespace

bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

// ─────────────────────────────────────────────
// ChunkedStream
// ─────────────────────────────────────────────

ChunkedStream::ChunkedStream(int fd, std::string pending_input, uint32_t send_timeout_ms,
                             size_t max_line_bytes, std::stop_token stop)
    : fd_(fd)
    , input_(std::move(pending_input))
    , send_timeout_ms_(send_timeout_ms)
    , max_line_bytes_(max_line_bytes)
    , stop_(std::move(stop)) {}

Result<void> ChunkedStream::write(std::string_view payload) {
    if (!open_) return Error{ErrorCode::Io, "Stream closed"};
    if (payload.empty()) return {};
    auto chunk = encode_chunk(payload);
    if (!send_all(fd_, chunk.data(), chunk.size(), send_timeout_ms_)) {
        open_ = false;
        return Error{ErrorCode::Io, "Stream send failed"};
    }
    return {};
}

Result<std::optional<std::string>> ChunkedStream::read_line(uint32_t timeout_ms) {
    auto take_line = [this]() -> std::optional<std::string> {
        auto nl = input_.find('\n');
        if (nl == std::string::npos) return std::nullopt;
        std::string line = input_.substr(0, nl);
        input_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    };

    if (auto line = take_line()) return line;
    if (!open_) return Error{ErrorCode::Io, "Stream closed"};

    char buf[kReadChunk];
    auto got = recv_some(fd_, buf, sizeof(buf), timeout_ms);
    if (!got) {
        if (got.error().code == ErrorCode::Unavailable) return std::optional<std::string>{};
        open_ = false;
        return got.error();
    }
    input_.append(buf, *got);
    if (auto line = take_line()) return line;
    if (input_.size() > max_line_bytes_) {
        input_.clear();
        open_ = false;
        return Error{ErrorCode::InvalidArgument, "Stream input exceeds "
                     + std::to_string(max_line_bytes_) + " bytes without a newline"};
    }
    return std::optional<std::string>{};
}

void ChunkedStream::finish() {
    if (!open_) return;
    auto last = encode_chunk({});
    send_all(fd_, last.data(), last.size(), send_timeout_ms_);
    open_ = false;
}

// ─────────────────────────────────────────────
// HttpServer
// ─────────────────────────────────────────────

HttpServer::HttpServer(Router& router, Logger& logger, Options options)
    : router_(router)
    , logger_(logger)
    , options_(std::move(options))
    , pool_(std::max<size_t>(1, options_.worker_threads) + options_.stream_threads,
            static_cast<size_t>(std::max<uint32_t>(1, options_.worker_threads)) * 16) {}

HttpServer::~HttpServer() {
    stop();
}

Result<uint16_t> HttpServer::listen() {
    if (server_fd_ >= 0) {
        return Error{ErrorCode::InvalidState, "Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    std::string host = options_.host == "localhost" ? "127.0.0.1" : options_.host;
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return Error{ErrorCode::InvalidArgument, "Invalid listen address: " + options_.host};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (server_fd_ < 0) {
        return Error{ErrorCode::Io, "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto reason = std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorCode::Io, "Bind failed on " + options_.host + ":"
                                    + std::to_string(options_.port) + ": " + reason};
    }

    if (::listen(server_fd_, DEFAULT_BACKLOG) < 0) {
        auto reason = std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorCode::Io, "Listen failed: " + reason};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    ::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len);
    bound_port_ = ntohs(bound.sin_port);
    return bound_port_;
}

void HttpServer::serve() {
    if (server_fd_ < 0 || accept_thread_.joinable()) return;
    accept_thread_ = std::jthread([this](std::stop_token stop) { accept_loop(stop); });
    logger_.info("HTTP server listening on " + options_.host + ":" + std::to_string(bound_port_));
}

void HttpServer::stop() {
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    pool_.shutdown();
}

void HttpServer::accept_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0) continue;

        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) continue;

        configure_socket(client_fd);

        auto queued = pool_.try_submit([this, client_fd](std::stop_token worker_stop) {
            handle_connection(client_fd, worker_stop);
        });
        if (!queued) {
            logger_.warn("Connection refused: worker pool saturated");
            reply(client_fd, HttpResponse::error(503, "Unavailable", "Server is busy"));
            close_connection(client_fd);
        }
    }
}

void HttpServer::handle_connection(int fd, std::stop_token stop) {
    std::string leftover;
    auto request = read_request(fd, leftover);
    if (!request) {
        const auto& err = request.error();
        // Io means the client went away; there is nobody to answer
        if (err.code != ErrorCode::Io) {
            int status = err.code == ErrorCode::Unavailable ? 413 : 400;
            reply(fd, HttpResponse::error(status, to_string(err.code), err.message));
        }
        close_connection(fd);
        return;
    }

    HttpResponse response;
    try {
        response = router_.dispatch(*request);
    } catch (const std::exception& e) {
        logger_.error("Handler for " + request->method + " " + request->path + " threw: " + e.what());
        response = HttpResponse::error(500, "Internal", e.what());
    }
    ++served_;
    logger_.log(LogLevel::Debug, "Request served",
                {{"method", request->method}, {"target", request->target}, {"status", response.status}});

    if (!response.is_stream()) {
        reply(fd, response);
        close_connection(fd);
        return;
    }

    auto head = serialize_stream_head(response);
    if (send_all(fd, head.data(), head.size(), options_.send_timeout_ms)) {
        ChunkedStream stream(fd, std::move(leftover), options_.send_timeout_ms,
                             static_cast<size_t>(options_.max_request_bytes), stop);
        try {
            response.streamer(stream);
        } catch (const std::exception& e) {
            logger_.error("Stream " + request->path + " aborted: " + e.what());
        }
        stream.finish();
    }
    close_connection(fd);
}

Result<HttpRequest> HttpServer::read_request(int fd, std::string& leftover) {
    std::string buffer;
    char chunk[kReadChunk];

    std::optional<size_t> head_end;
    while (!(head_end = find_head_end(buffer))) {
        if (buffer.size() > options_.max_request_bytes) {
            return Error{ErrorCode::Unavailable, "Request head too large"};
        }
        auto got = recv_some(fd, chunk, sizeof(chunk), options_.read_timeout_ms);
        if (!got) return Error{ErrorCode::Io, got.error().message};
        buffer.append(chunk, *got);
    }

    auto request = parse_request_head(std::string_view{buffer}.substr(0, *head_end));
    if (!request) return request.error();

    auto length = content_length(*request);
    if (!length) return length.error();
    if (*length > options_.max_request_bytes) {
        return Error{ErrorCode::Unavailable,
                     "Request body of " + std::to_string(*length) + " bytes exceeds limit"};
    }

    while (buffer.size() - *head_end < *length) {
        auto got = recv_some(fd, chunk, sizeof(chunk), options_.read_timeout_ms);
        if (!got) return Error{ErrorCode::Io, got.error().message};
        buffer.append(chunk, *got);
    }

    request->body = buffer.substr(*head_end, *length);
    leftover = buffer.substr(*head_end + *length);
    return request;
}

void HttpServer::reply(int fd, const HttpResponse& response) {
    auto wire = serialize_response(response);
    if (!send_all(fd, wire.data(), wire.size(), options_.send_timeout_ms)) {
        logger_.debug("Failed to send response (" + std::to_string(response.status) + ")");
    }
}

}  // namespace archetype
