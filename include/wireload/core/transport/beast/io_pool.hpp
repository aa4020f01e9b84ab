#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "wireload/core/transport/error.hpp"
#include "wireload/core/transport/telemetry/websocket.hpp"


namespace wireload::core::transport::beast {

/*
===============================================================================
 IoPool
===============================================================================

Shared asynchronous I/O runtime for every WebSocket of a run.

  • One io_context driven by a fixed set of threads
  • One TLS client context (OpenSSL) shared by all secure sockets
  • One telemetry block fed by all sockets

Each WebSocket serializes its own operations on a strand created from this
context, so no socket is ever touched by two I/O threads at once.

Lifetime: the pool must outlive every WebSocket created on it. Destroying
the pool stops the context and discards handlers still queued.
===============================================================================
*/
class IoPool {
public:
    struct Options {
        std::size_t threads = 2;
        bool verify_peer = true;
        std::chrono::milliseconds connect_timeout{10000};
    };

    explicit IoPool(const Options& options);
    ~IoPool();

    IoPool(const IoPool&) = delete;
    IoPool& operator=(const IoPool&) = delete;

    // Stop the context and join the I/O threads (idempotent)
    void stop() noexcept;

    [[nodiscard]] boost::asio::io_context& context() noexcept { return ioc_; }
    [[nodiscard]] boost::asio::ssl::context& tls() noexcept { return tls_; }
    [[nodiscard]] telemetry::WebSocket& telemetry() noexcept { return telemetry_; }
    [[nodiscard]] const telemetry::WebSocket& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] bool verify_peer() const noexcept { return options_.verify_peer; }
    [[nodiscard]] std::chrono::milliseconds connect_timeout() const noexcept { return options_.connect_timeout; }

private:
    void run_() noexcept;

private:
    Options options_;
    telemetry::WebSocket telemetry_;
    boost::asio::ssl::context tls_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::vector<std::thread> threads_;
};

// Blocking name resolution check, used once per run before any session exists.
[[nodiscard]]
Error resolve(const std::string& host, const std::string& port) noexcept;

} // namespace wireload::core::transport::beast
