/**
 * @file http_server.hpp
 * @brief HTTP/1.1 server over POSIX sockets.
 *
 * One request per connection (Connection: close). An accept thread polls
 * the listening socket and hands each connection to a worker pool; a full
 * pool answers 503 straight from the accept thread. Streaming responses
 * keep their worker until the streamer returns.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "server/http_message.hpp"
#include "server/router.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace archetype {

/**
 * @brief Write side of a chunked response, plus the client's inbound bytes.
 */
class ChunkedStream {
public:
    /// A client line longer than @p max_line_bytes closes the stream.
    ChunkedStream(int fd, std::string pending_input, uint32_t send_timeout_ms,
                  size_t max_line_bytes, std::stop_token stop);

    ChunkedStream(const ChunkedStream&) = delete;
    ChunkedStream& operator=(const ChunkedStream&) = delete;

    /// Send one chunk. Error once the peer is gone or a send times out.
    Result<void> write(std::string_view payload);

    /**
     * @brief Next newline-terminated line the client sent, waiting up to @p timeout_ms.
     *
     * nullopt on timeout; error when the client has closed the connection or
     * has sent more than max_line_bytes without a newline.
     */
    Result<std::optional<std::string>> read_line(uint32_t timeout_ms);

    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }
    [[nodiscard]] bool is_open() const noexcept { return open_; }

    /// Terminating zero-length chunk.
    void finish();

private:
    int fd_;
    std::string input_;
    uint32_t send_timeout_ms_;
    size_t max_line_bytes_;
    std::stop_token stop_;
    bool open_{true};
};

class HttpServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8000;                 ///< 0 picks an ephemeral port
        uint32_t worker_threads = 8;
        uint32_t stream_threads = 32;         ///< extra workers reserved for long-lived streams
        uint64_t max_request_bytes = 1048576;
        uint32_t read_timeout_ms = 10000;
        uint32_t send_timeout_ms = 2000;
    };

    static constexpr int DEFAULT_BACKLOG = 64;

    HttpServer(Router& router, Logger& logger, Options options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and listen; returns the bound port.
    Result<uint16_t> listen();

    /// Start the accept thread.
    void serve();

    /// Stop accepting, close the socket and stop the workers.
    void stop();

    [[nodiscard]] bool is_listening() const noexcept { return server_fd_ >= 0; }
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }
    [[nodiscard]] uint64_t requests_served() const noexcept { return served_.load(); }

private:
    void accept_loop(std::stop_token stop);
    void handle_connection(int fd, std::stop_token stop);

    /// Reads head and body; @p leftover receives any bytes past the body.
    Result<HttpRequest> read_request(int fd, std::string& leftover);

    void reply(int fd, const HttpResponse& response);

    Router& router_;
    Logger& logger_;
    Options options_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<uint64_t> served_{0};
    ThreadPool pool_;
    std::jthread accept_thread_;
};

/// Write every byte or fail; polls for writability up to @p timeout_ms per step.
bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms);

}  // namespace archetype
