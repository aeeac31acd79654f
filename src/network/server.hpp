#pragma once

#include "storage/store.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <string>

namespace polykv::network {

// Owns the io_context and TCP acceptor.
//
// Usage:
//   Server srv{"0.0.0.0", 6379, store};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if the
    // address is invalid or the port cannot be bound.  Port 0 picks an
    // ephemeral port (see port()).  `threads` == 0 means hardware concurrency.
    Server(std::string host, std::uint16_t port, Store& store, std::uint32_t threads = 0);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Closes the acceptor and stops the io_context, causing run() to return.
    // Safe to call from any thread.
    void stop();

    // The port actually bound.
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] boost::asio::io_context& io_context() noexcept { return ioc_; }

private:
    // Accept loop coroutine – runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    std::string host_;
    std::uint16_t port_;
    Store& store_;
    std::uint32_t threads_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace polykv::network
