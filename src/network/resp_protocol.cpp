#include "network/resp_protocol.hpp"
#include "common/overloaded.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace polykv::network {

namespace {

using boost::asio::ip::tcp;

// Read a CRLF-terminated line from the socket.  Returns the line content
// (without the trailing \r\n), or nullopt if the socket failed first.
boost::asio::awaitable<std::optional<std::string>>
read_line(tcp::socket& socket, std::string& buf) {
    boost::system::error_code ec;
    const std::size_t n = co_await boost::asio::async_read_until(
        socket, boost::asio::dynamic_buffer(buf), "\r\n",
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (ec) {
        co_return std::nullopt;
    }

    // n includes the \r\n
    std::string line = buf.substr(0, n - 2);
    buf.erase(0, n);
    co_return line;
}

// Read exactly `count` bytes + trailing \r\n from the socket.
// Returns nullopt on socket failure; a missing terminator is reported by the
// caller through `terminated`.
boost::asio::awaitable<std::optional<std::string>>
read_bulk(tcp::socket& socket, std::string& buf, std::size_t count, bool& terminated) {
    const std::size_t need = count + 2; // data + \r\n

    if (buf.size() < need) {
        boost::system::error_code ec;
        co_await boost::asio::async_read(
            socket, boost::asio::dynamic_buffer(buf),
            boost::asio::transfer_exactly(need - buf.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return std::nullopt;
        }
    }

    terminated = buf[count] == '\r' && buf[count + 1] == '\n';
    std::string data = buf.substr(0, count);
    buf.erase(0, need);
    co_return data;
}

// Parse a signed integer from a string_view (lengths and integer replies).
bool parse_int(std::string_view sv, std::int64_t& out) {
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return !sv.empty() && ec == std::errc{} && ptr == sv.data() + sv.size();
}

ReadResult protocol_error(std::string message) {
    return ProtocolError{std::move(message)};
}

boost::asio::awaitable<ReadResult>
read_value(tcp::socket& socket, std::string& buf, bool allow_inline, std::size_t depth) {
    if (depth > kMaxNestingDepth) {
        co_return protocol_error("nesting too deep");
    }

    auto line = co_await read_line(socket, buf);
    if (!line) {
        co_return ConnectionClosed{};
    }

    if (line->empty() || !is_resp_protocol(static_cast<uint8_t>(line->front()))) {
        if (!allow_inline) {
            co_return protocol_error(
                "unexpected type byte '" + line->substr(0, 1) + "'");
        }
        // Inline command: PING, SET k v, ...
        co_return make_bulk_array(split_command_line(*line));
    }

    const char type = line->front();
    const std::string_view payload = std::string_view{*line}.substr(1);

    switch (type) {
        case '+':
            co_return SimpleString{std::string{payload}};

        case '-':
            co_return ErrorString{std::string{payload}};

        case ':': {
            std::int64_t value = 0;
            if (!parse_int(payload, value)) {
                co_return protocol_error("invalid integer");
            }
            co_return Integer{value};
        }

        case '$': {
            std::int64_t len = 0;
            if (!parse_int(payload, len) || len < -1 || len > kMaxBulkLength) {
                co_return protocol_error("invalid bulk length");
            }
            if (len == -1) {
                co_return NullBulkString{};
            }
            bool terminated = false;
            auto data = co_await read_bulk(socket, buf, static_cast<std::size_t>(len),
                                           terminated);
            if (!data) {
                co_return ConnectionClosed{};
            }
            if (!terminated) {
                co_return protocol_error("bulk string not terminated by CRLF");
            }
            co_return BulkString{std::move(*data)};
        }

        case '*': {
            std::int64_t count = 0;
            if (!parse_int(payload, count) || count < -1 || count > kMaxArrayLength) {
                co_return protocol_error("invalid multibulk length");
            }
            if (count == -1) {
                co_return NullArray{};
            }
            WireArray array;
            array.elements.reserve(static_cast<std::size_t>(count));
            for (std::int64_t i = 0; i < count; ++i) {
                // Elements are never inline.
                auto element = co_await read_value(socket, buf, false, depth + 1);
                if (!std::holds_alternative<WireValue>(element)) {
                    co_return element;
                }
                array.elements.push_back(std::move(std::get<WireValue>(element)));
            }
            co_return WireValue{std::move(array)};
        }

        default:
            co_return protocol_error("unknown type byte");
    }
}

void append_bulk(std::string& out, const std::string& s) {
    out += '$';
    out += std::to_string(s.size());
    out += "\r\n";
    out += s;
    out += "\r\n";
}

void append_array_header(std::string& out, std::size_t n) {
    out += '*';
    out += std::to_string(n);
    out += "\r\n";
}

void append_response(std::string& out, const Response& response) {
    std::visit(
        Overloaded{
            [&](const OkResp&) { out += "+OK\r\n"; },
            [&](const PongResp&) { out += "+PONG\r\n"; },
            [&](const NilResp&) { out += "$-1\r\n"; }, // null bulk string
            [&](const ValueResp& r) { append_bulk(out, r.value); },
            [&](const MultiValueResp& r) {
                append_array_header(out, r.values.size());
                for (const auto& v : r.values) {
                    append_bulk(out, v);
                }
            },
            [&](const ArrayResp& r) {
                append_array_header(out, r.items.size());
                for (const auto& item : r.items) {
                    append_response(out, item);
                }
            },
            [&](const IntResp& r) {
                out += ':';
                out += std::to_string(r.value);
                out += "\r\n";
            },
            [&](const ErrorResp& r) {
                out += "-ERR ";
                out += r.message;
                out += "\r\n";
            },
        },
        response);
}

void append_wire_value(std::string& out, const WireValue& value) {
    std::visit(
        Overloaded{
            [&](const SimpleString& v) {
                out += '+';
                out += v.data;
                out += "\r\n";
            },
            [&](const ErrorString& v) {
                out += '-';
                out += v.message;
                out += "\r\n";
            },
            [&](const BulkString& v) { append_bulk(out, v.data); },
            [&](const Integer& v) {
                out += ':';
                out += std::to_string(v.value);
                out += "\r\n";
            },
            [&](const WireArray& v) {
                append_array_header(out, v.elements.size());
                for (const auto& e : v.elements) {
                    append_wire_value(out, e);
                }
            },
            [&](const NullArray&) { out += "*-1\r\n"; },
            [&](const NullBulkString&) { out += "$-1\r\n"; },
        },
        value);
}

} // anonymous namespace

bool is_resp_protocol(uint8_t first_byte) noexcept {
    return first_byte == '+' || first_byte == '-' || first_byte == ':' ||
           first_byte == '$' || first_byte == '*';
}

// ── RESP reader ──────────────────────────────────────────────────────────────

boost::asio::awaitable<ReadResult>
read_wire_value(boost::asio::ip::tcp::socket& socket, std::string& buf, bool allow_inline) {
    auto result = co_await read_value(socket, buf, allow_inline, 0);
    if (const auto* err = std::get_if<ProtocolError>(&result)) {
        spdlog::debug("RESP protocol error: {}", err->message);
    }
    co_return result;
}

// ── RESP serializer ──────────────────────────────────────────────────────────

std::string serialize_resp_response(const Response& response) {
    std::string out;
    append_response(out, response);
    return out;
}

std::string serialize_wire_value(const WireValue& value) {
    std::string out;
    append_wire_value(out, value);
    return out;
}

// ── RESP client-side helpers ─────────────────────────────────────────────────

std::string serialize_resp_request(const std::vector<std::string>& args) {
    return serialize_wire_value(make_bulk_array(args));
}

std::vector<std::string> split_command_line(const std::string& line) {
    std::vector<std::string> parts;
    std::string token;
    bool in_token = false;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '\\' && i + 1 < line.size()) {
                token.push_back(line[++i]);
            } else if (c == '"') {
                in_quotes = false;
            } else {
                token.push_back(c);
            }
        } else if (c == ' ' || c == '\t') {
            if (in_token) {
                parts.push_back(std::move(token));
                token.clear();
                in_token = false;
            }
        } else if (c == '"') {
            in_quotes = true;
            in_token = true;
        } else {
            token.push_back(c);
            in_token = true;
        }
    }
    if (in_token) {
        parts.push_back(std::move(token));
    }
    return parts;
}

} // namespace polykv::network
