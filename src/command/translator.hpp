#pragma once

#include "command/command.hpp"
#include "command/translation_error.hpp"
#include "network/wire_value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace polykv::command {

// Translate one parsed wire value into a typed Command.
//
//   - A bare simple/bulk string only names zero-argument commands (PING, KEYS).
//   - An array names the command in its first element (case-insensitive) and
//     carries the arguments in the remaining elements, which are checked for
//     arity and coerced to strings or counts.
//   - An empty array yields TranslationErrorKind::Noop.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, TranslationError> translate(const WireValue& value);

// ── Coercions ─────────────────────────────────────────────────────────────────
//
// Total conversions from a loosely-typed wire value.  Each returns nullopt when
// the value has the wrong shape; the translator maps that to InvalidType.

// Simple or bulk string → its bytes.
[[nodiscard]] std::optional<std::string> as_string(const WireValue& value);

// Wire integer, or simple/bulk string holding a base-10 64-bit integer.
[[nodiscard]] std::optional<Count> as_count(const WireValue& value);

// Parse a whole byte sequence as a base-10 signed 64-bit integer.  An optional
// leading '+' or '-' is accepted; anything else (whitespace, trailing bytes,
// overflow) fails.  Shared with the engines for counter semantics.
[[nodiscard]] std::optional<Count> parse_count(std::string_view text);

} // namespace polykv::command
