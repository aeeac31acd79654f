#include "command/translation_error.hpp"

#include <string>

namespace polykv {

std::string TranslationError::message() const {
    switch (kind) {
        case TranslationErrorKind::UnknownOp:
            return "unknown operation";
        case TranslationErrorKind::Noop:
            return "no-op";
        case TranslationErrorKind::NotEnoughArgs:
            return "not enough arguments(" + std::to_string(arity) + ")";
        case TranslationErrorKind::WrongNumberOfArgs:
            return "wrong number of arguments(" + std::to_string(arity) + ")";
        case TranslationErrorKind::InvalidType:
            return "invalid argument type";
        case TranslationErrorKind::SyntaxError:
            return "syntax error";
    }
    return "unknown error";
}

} // namespace polykv
