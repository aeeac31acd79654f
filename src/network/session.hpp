#pragma once

#include "command/response.hpp"
#include "network/wire_value.hpp"
#include "storage/store.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <optional>
#include <string>

namespace polykv::network {

// Translate one request and execute it against the store.
// Returns nullopt for an empty request (no reply is sent); translation
// failures come back as ErrorResp carrying the error message.
[[nodiscard]] std::optional<Response> process_request(const WireValue& request,
                                                      Store& store);

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects, a protocol error occurs, or a write fails.  Requests are
// RESP values or inline commands; replies are written in request order.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, Store& store);

    // Main coroutine.  Loops reading a request, executing it, and sending the
    // response.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

private:
    // Write `wire` to the socket.  Returns false on failure.
    boost::asio::awaitable<bool> send(const std::string& remote, const std::string& wire);

    boost::asio::ip::tcp::socket socket_;
    Store& store_;
};

} // namespace polykv::network
