#include "common/logger.hpp"
#include "network/resp_protocol.hpp"
#include "network/wire_value.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

using namespace polykv;

// Format a reply the way redis-cli does.  Nested array items are indented
// under their parent's number.
std::string format_reply(const WireValue& value, const std::string& indent = "") {
    return std::visit(
        [&](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                return v.data;
            } else if constexpr (std::is_same_v<T, ErrorString>) {
                return "(error) " + v.message;
            } else if constexpr (std::is_same_v<T, BulkString>) {
                return "\"" + v.data + "\"";
            } else if constexpr (std::is_same_v<T, Integer>) {
                return "(integer) " + std::to_string(v.value);
            } else if constexpr (std::is_same_v<T, NullBulkString> ||
                                 std::is_same_v<T, NullArray>) {
                return "(nil)";
            } else if constexpr (std::is_same_v<T, WireArray>) {
                if (v.elements.empty()) {
                    return "(empty array)";
                }
                std::string out;
                for (std::size_t i = 0; i < v.elements.size(); ++i) {
                    const std::string number = std::to_string(i + 1) + ") ";
                    if (i > 0) {
                        out += '\n';
                        out += indent;
                    }
                    out += number;
                    out += format_reply(v.elements[i],
                                        indent + std::string(number.size(), ' '));
                }
                return out;
            }
        },
        value);
}

} // anonymous namespace

// ── REPL coroutine ────────────────────────────────────────────────────────────

asio::awaitable<void> repl(tcp::socket socket) {
    using namespace polykv;

    std::string recv_buf;
    recv_buf.reserve(512);

    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        const auto words = network::split_command_line(line);
        if (words.empty()) {
            continue;
        }

        const std::string request = network::serialize_resp_request(words);

        boost::system::error_code wec;
        co_await asio::async_write(socket, asio::buffer(request),
                                   asio::redirect_error(asio::use_awaitable, wec));

        if (wec) {
            spdlog::error("polykv-cli: send error: {}", wec.message());
            break;
        }

        auto reply = co_await network::read_wire_value(socket, recv_buf, false);

        if (std::holds_alternative<network::ConnectionClosed>(reply)) {
            fprintf(stdout, "Server disconnected.\n");
            break;
        }
        if (const auto* perr = std::get_if<network::ProtocolError>(&reply)) {
            spdlog::error("polykv-cli: malformed reply: {}", perr->message);
            break;
        }

        fprintf(stdout, "%s\n", format_reply(std::get<WireValue>(reply)).c_str());
    }
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("polykv-cli options");
    desc.add_options()
        ("help,h",                                            "Show this help")
        ("host",   po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p", po::value<std::uint16_t>()->default_value(6379),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();

    polykv::init_default_logger(polykv::parse_log_level(log_level));

    spdlog::debug("polykv-cli connecting to {}:{}", host, port);

    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            spdlog::error("polykv-cli: failed to connect to {}:{} – {}", host, port, ec.message());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        fprintf(stdout, "Connected to %s:%u. "
                "Type commands (PING, SET k v, HSET h f v, SADD s m, LPUSH l v, ...). "
                "Ctrl+D to quit.\n",
                host.c_str(), port);

        asio::co_spawn(ioc, repl(std::move(socket)), asio::detached);
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("polykv-cli: exception: {}", ex.what());
        return 1;
    }

    return 0;
}
