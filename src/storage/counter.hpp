#pragma once

#include "command/command.hpp"
#include "command/response.hpp"

#include <optional>
#include <variant>

namespace polykv {

// Counter arithmetic shared by INCRBY/DECRBY and HINCRBY.
//
// `current` is the stored value, or nullptr when the key/field is absent
// (treated as 0).  Returns the new value, or the ErrorResp to send back when
// the stored value is not a base-10 integer or the result overflows a signed
// 64-bit integer.  Nothing is written here; callers store the decimal text
// of the returned value only on success, so error paths leave data untouched.
[[nodiscard]] std::variant<Count, ErrorResp> apply_delta(const Value* current, Count delta);

// Same, subtracting `delta`.
[[nodiscard]] std::variant<Count, ErrorResp> apply_negated_delta(const Value* current,
                                                                 Count delta);

// a + b, or nullopt on signed overflow.
[[nodiscard]] std::optional<Count> checked_add(Count a, Count b) noexcept;

} // namespace polykv
