#pragma once

#include "command/response.hpp"
#include "network/wire_value.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace polykv::network {

// ── Limits ────────────────────────────────────────────────────────────────────

inline constexpr std::int64_t kMaxBulkLength  = 512LL * 1024 * 1024;
inline constexpr std::int64_t kMaxArrayLength = 1024 * 1024;
inline constexpr std::size_t  kMaxNestingDepth = 32;

// ── RESP reader (streaming, reads from socket) ───────────────────────────────

// The peer closed the connection (or the socket failed) before a complete
// value was read.
struct ConnectionClosed {};

// The byte stream is not valid RESP.  The stream position is unknown
// afterwards, so the connection should be closed after reporting it.
struct ProtocolError {
    std::string message;
};

using ReadResult = std::variant<WireValue, ConnectionClosed, ProtocolError>;

// Returns true if `first_byte` starts a RESP value (+ - : $ *).
[[nodiscard]] bool is_resp_protocol(uint8_t first_byte) noexcept;

// Read one complete wire value from the socket.
// `buf` is a persistent read buffer shared across calls on the same
// connection; bytes past the value stay in it for the next call.
//
// With `allow_inline`, a top-level line that does not start with a RESP type
// byte is an inline command: it is split on spaces and tabs into an array of
// bulk strings (an empty line yields an empty array).
[[nodiscard]] boost::asio::awaitable<ReadResult>
read_wire_value(boost::asio::ip::tcp::socket& socket, std::string& buf,
                bool allow_inline = true);

// ── RESP serializer ──────────────────────────────────────────────────────────

// Serialize a Response into RESP wire format.
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string serialize_resp_response(const Response& response);

// Serialize any wire value into RESP wire format.
[[nodiscard]] std::string serialize_wire_value(const WireValue& value);

// ── RESP client-side helpers (for polykv-cli) ────────────────────────────────

// Serialize command words into a RESP array of bulk strings.
[[nodiscard]] std::string serialize_resp_request(const std::vector<std::string>& args);

// Split an interactive input line into words.  Double quotes group words
// containing spaces ("hello world"); a backslash escapes the next character
// inside quotes.
[[nodiscard]] std::vector<std::string> split_command_line(const std::string& line);

} // namespace polykv::network
