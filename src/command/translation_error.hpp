#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace polykv {

// ── TranslationError ──────────────────────────────────────────────────────────
//
// Reported by the translator before any container is touched.

enum class TranslationErrorKind : uint8_t {
    UnknownOp,          // no valid command name
    Noop,               // empty request array; callers may ignore it silently
    NotEnoughArgs,      // fewer arguments than the command's minimum
    WrongNumberOfArgs,  // argument count differs from the command's exact arity
    InvalidType,        // wire value of the wrong shape for a string/count slot
    SyntaxError,        // well-typed arguments that do not form a valid request
};

struct TranslationError {
    TranslationErrorKind kind;
    std::size_t arity = 0; // required count for NotEnoughArgs / WrongNumberOfArgs

    [[nodiscard]] static TranslationError unknown_op() {
        return {TranslationErrorKind::UnknownOp};
    }
    [[nodiscard]] static TranslationError noop() {
        return {TranslationErrorKind::Noop};
    }
    [[nodiscard]] static TranslationError not_enough_args(std::size_t min) {
        return {TranslationErrorKind::NotEnoughArgs, min};
    }
    [[nodiscard]] static TranslationError wrong_number_of_args(std::size_t exact) {
        return {TranslationErrorKind::WrongNumberOfArgs, exact};
    }
    [[nodiscard]] static TranslationError invalid_type() {
        return {TranslationErrorKind::InvalidType};
    }
    [[nodiscard]] static TranslationError syntax_error() {
        return {TranslationErrorKind::SyntaxError};
    }

    // Human-readable message, e.g. "wrong number of arguments(3)".
    [[nodiscard]] std::string message() const;

    bool operator==(const TranslationError&) const = default;
};

} // namespace polykv
