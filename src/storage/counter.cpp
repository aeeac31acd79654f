#include "storage/counter.hpp"
#include "command/translator.hpp"

#include <limits>
#include <utility>

namespace polykv {

std::optional<Count> checked_add(Count a, Count b) noexcept {
    constexpr Count kMax = std::numeric_limits<Count>::max();
    constexpr Count kMin = std::numeric_limits<Count>::min();
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
        return std::nullopt;
    }
    return a + b;
}

namespace {

// Stored value (absent = 0) as an integer, or the bad-type error.
std::variant<Count, ErrorResp> current_value(const Value* current) {
    if (current == nullptr) {
        return Count{0};
    }
    auto parsed = command::parse_count(*current);
    if (!parsed) {
        return ErrorResp{kErrBadType};
    }
    return *parsed;
}

} // anonymous namespace

std::variant<Count, ErrorResp> apply_delta(const Value* current, Count delta) {
    auto base = current_value(current);
    if (auto* err = std::get_if<ErrorResp>(&base)) {
        return std::move(*err);
    }

    auto sum = checked_add(std::get<Count>(base), delta);
    if (!sum) {
        return ErrorResp{kErrOverflow};
    }
    return *sum;
}

std::variant<Count, ErrorResp> apply_negated_delta(const Value* current, Count delta) {
    if (delta != std::numeric_limits<Count>::min()) {
        return apply_delta(current, -delta);
    }

    // -delta is not representable: base - min == (base + max) + 1, which only
    // fits when base is negative.
    auto base = current_value(current);
    if (auto* err = std::get_if<ErrorResp>(&base)) {
        return std::move(*err);
    }
    const Count b = std::get<Count>(base);
    if (b >= 0) {
        return ErrorResp{kErrOverflow};
    }
    return (b + std::numeric_limits<Count>::max()) + 1;
}

} // namespace polykv
