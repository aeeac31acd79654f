#include "network/session.hpp"
#include "command/translator.hpp"
#include "network/resp_protocol.hpp"
#include "storage/engine.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <variant>

namespace polykv::network {

std::optional<Response> process_request(const WireValue& request, Store& store) {
    auto translated = command::translate(request);

    if (const auto* err = std::get_if<TranslationError>(&translated)) {
        if (err->kind == TranslationErrorKind::Noop) {
            return std::nullopt;
        }
        return ErrorResp{err->message()};
    }
    return execute(std::get<Command>(translated), store);
}

Session::Session(boost::asio::ip::tcp::socket socket, Store& store)
    : socket_(std::move(socket)), store_(store) {}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::debug("Session::run() - client connected from {}", remote);

    std::string buf;
    buf.reserve(256);

    for (;;) {
        auto result = co_await read_wire_value(socket_, buf);

        if (std::holds_alternative<ConnectionClosed>(result)) {
            break;
        }

        if (const auto* perr = std::get_if<ProtocolError>(&result)) {
            spdlog::warn("Session {}: protocol error: {}", remote, perr->message);
            // The stream position is lost; report and drop the connection.
            co_await send(remote, "-ERR Protocol error: " + perr->message + "\r\n");
            break;
        }

        const auto& request = std::get<WireValue>(result);
        if (spdlog::should_log(spdlog::level::trace)) {
            spdlog::trace("Session {}: recv {}", remote, serialize_wire_value(request));
        }

        auto response = process_request(request, store_);
        if (!response) {
            continue; // empty request, nothing to answer
        }

        if (!co_await send(remote, serialize_resp_response(*response))) {
            break;
        }
    }

    spdlog::debug("Session::run() - client disconnected: {}", remote);
}

boost::asio::awaitable<bool> Session::send(const std::string& remote,
                                           const std::string& wire) {
    boost::system::error_code ec;
    co_await boost::asio::async_write(
        socket_, boost::asio::buffer(wire),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (ec) {
        if (ec != boost::asio::error::eof &&
            ec != boost::asio::error::connection_reset &&
            ec != boost::asio::error::broken_pipe) {
            spdlog::warn("Session {}: write error: {}", remote, ec.message());
        }
        co_return false;
    }
    spdlog::trace("Session {}: sent {} bytes", remote, wire.size());
    co_return true;
}

} // namespace polykv::network
