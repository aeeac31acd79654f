#pragma once

#include "command/command.hpp"

#include <string>
#include <variant>
#include <vector>

namespace polykv {

// ── Responses ─────────────────────────────────────────────────────────────────
//
// Outcome of executing one Command, independent of wire formatting.

struct OkResp {};
struct PongResp {};
struct NilResp {};

struct ValueResp {
    Value value;
};

// Flat list of values (HGETALL field/value pairs, SMEMBERS, LRANGE, ...).
struct MultiValueResp {
    std::vector<Value> values;
};

struct IntResp {
    Count value;
};

struct ErrorResp {
    std::string message;
};

struct ArrayResp;

using Response = std::variant<OkResp, PongResp, NilResp, ValueResp, MultiValueResp,
                              ArrayResp, IntResp, ErrorResp>;

// Nested array of sub-responses (HMGET: one value or nil per field).
struct ArrayResp {
    std::vector<Response> items;
};

// ── Execution error payloads ──────────────────────────────────────────────────

// Existing value is not a base-10 integer (INCRBY, HINCRBY, ...).
inline constexpr const char* kErrBadType  = "Bad Type!";
// Increment result does not fit in a signed 64-bit integer.
inline constexpr const char* kErrOverflow = "increment or decrement would overflow";
// RENAME source key is absent.
inline constexpr const char* kErrNoSuchKey = "no such key";
// SRANDMEMBER negative count beyond kMaxRandomPicks.
inline constexpr const char* kErrOutOfRange = "value is out of range";

} // namespace polykv
