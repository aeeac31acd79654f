#include "command/translator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace polykv::command {

namespace {

using Args            = std::span<const WireValue>;
using TranslateResult = std::variant<Command, TranslationError>;

// ── Helpers ───────────────────────────────────────────────────────────────────

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<TranslationError> expect_exact(Args tail, std::size_t n) {
    if (tail.size() != n) {
        return TranslationError::wrong_number_of_args(n);
    }
    return std::nullopt;
}

std::optional<TranslationError> expect_at_least(Args tail, std::size_t n) {
    if (tail.size() < n) {
        return TranslationError::not_enough_args(n);
    }
    return std::nullopt;
}

// Pulls typed arguments out of the tail.  The first coercion failure is
// remembered and reported by finish(); later reads return placeholders.
class ArgReader {
public:
    explicit ArgReader(Args tail) : tail_(tail) {}

    std::string string(std::size_t i) {
        auto s = as_string(tail_[i]);
        if (!s) {
            fail(TranslationError::invalid_type());
            return {};
        }
        return std::move(*s);
    }

    Count count(std::size_t i) {
        auto c = as_count(tail_[i]);
        if (!c) {
            fail(TranslationError::invalid_type());
            return 0;
        }
        return *c;
    }

    // Every element from `first` to the end must be a simple or bulk string.
    std::vector<std::string> strings_from(std::size_t first) {
        std::vector<std::string> out;
        out.reserve(tail_.size() > first ? tail_.size() - first : 0);
        for (std::size_t i = first; i < tail_.size(); ++i) {
            out.push_back(string(i));
        }
        return out;
    }

    void fail(TranslationError err) {
        if (!error_) {
            error_ = err;
        }
    }

    template <typename Family>
    [[nodiscard]] TranslateResult finish(Family cmd) const {
        if (error_) {
            return *error_;
        }
        return Command{std::move(cmd)};
    }

private:
    Args tail_;
    std::optional<TranslationError> error_;
};

// Optional trailing count shared by SPOP and SRANDMEMBER.
std::optional<Count> optional_count(ArgReader& args, Args tail) {
    if (tail.size() < 2) {
        return std::nullopt;
    }
    return args.count(1);
}

// ── Per-family translation ────────────────────────────────────────────────────
//
// Each returns nullopt when `name` does not belong to the family.

std::optional<TranslateResult> translate_server(const std::string& name) {
    if (name == "ping") {
        return Command{ServerCommand{PingCmd{}}};
    }
    if (name == "keys") {
        return Command{ServerCommand{KeysCmd{}}};
    }
    return std::nullopt;
}

std::optional<TranslateResult> translate_strings(const std::string& name, Args tail) {
    ArgReader args{tail};

    if (name == "set") {
        if (auto err = expect_exact(tail, 2)) return *err;
        SetCmd cmd{args.string(0), args.string(1)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "get") {
        if (auto err = expect_exact(tail, 1)) return *err;
        GetCmd cmd{args.string(0)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "del") {
        if (auto err = expect_at_least(tail, 1)) return *err;
        DelCmd cmd{args.strings_from(0)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "rename") {
        if (auto err = expect_exact(tail, 2)) return *err;
        RenameCmd cmd{args.string(0), args.string(1)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "exists") {
        if (auto err = expect_at_least(tail, 1)) return *err;
        ExistsCmd cmd{args.strings_from(0)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "incr") {
        if (auto err = expect_exact(tail, 1)) return *err;
        IncrByCmd cmd{args.string(0), 1};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "decr") {
        if (auto err = expect_exact(tail, 1)) return *err;
        DecrByCmd cmd{args.string(0), 1};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "incrby") {
        if (auto err = expect_exact(tail, 2)) return *err;
        IncrByCmd cmd{args.string(0), args.count(1)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "decrby") {
        if (auto err = expect_exact(tail, 2)) return *err;
        DecrByCmd cmd{args.string(0), args.count(1)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    if (name == "strlen") {
        if (auto err = expect_exact(tail, 1)) return *err;
        StrLenCmd cmd{args.string(0)};
        return args.finish(StringCommand{std::move(cmd)});
    }
    return std::nullopt;
}

std::optional<TranslateResult> translate_hashes(const std::string& name, Args tail) {
    ArgReader args{tail};

    if (name == "hget") {
        if (auto err = expect_exact(tail, 2)) return *err;
        HGetCmd cmd{args.string(0), args.string(1)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hset") {
        if (auto err = expect_exact(tail, 3)) return *err;
        HSetCmd cmd{args.string(0), args.string(1), args.string(2)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hexists") {
        if (auto err = expect_exact(tail, 2)) return *err;
        HExistsCmd cmd{args.string(0), args.string(1)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hgetall") {
        if (auto err = expect_exact(tail, 1)) return *err;
        HGetAllCmd cmd{args.string(0)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hmget") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        HMGetCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hkeys") {
        if (auto err = expect_exact(tail, 1)) return *err;
        HKeysCmd cmd{args.string(0)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hmset") {
        if (auto err = expect_at_least(tail, 3)) return *err;
        HMSetCmd cmd{args.string(0), {}};
        auto rest = args.strings_from(1);
        if (rest.size() % 2 != 0) {
            // A field without its value.
            args.fail(TranslationError::syntax_error());
        }
        cmd.pairs.reserve(rest.size() / 2);
        for (std::size_t i = 0; i + 1 < rest.size(); i += 2) {
            cmd.pairs.emplace_back(std::move(rest[i]), std::move(rest[i + 1]));
        }
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hincrby") {
        if (auto err = expect_exact(tail, 3)) return *err;
        HIncrByCmd cmd{args.string(0), args.string(1), args.count(2)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hlen") {
        if (auto err = expect_exact(tail, 1)) return *err;
        HLenCmd cmd{args.string(0)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hdel") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        HDelCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hvals") {
        if (auto err = expect_exact(tail, 1)) return *err;
        HValsCmd cmd{args.string(0)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hstrlen") {
        if (auto err = expect_exact(tail, 2)) return *err;
        HStrLenCmd cmd{args.string(0), args.string(1)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    if (name == "hsetnx") {
        if (auto err = expect_exact(tail, 3)) return *err;
        HSetNxCmd cmd{args.string(0), args.string(1), args.string(2)};
        return args.finish(HashCommand{std::move(cmd)});
    }
    return std::nullopt;
}

std::optional<TranslateResult> translate_sets(const std::string& name, Args tail) {
    ArgReader args{tail};

    if (name == "sadd") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SAddCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "srem") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SRemCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "smembers") {
        if (auto err = expect_exact(tail, 1)) return *err;
        SMembersCmd cmd{args.string(0)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sismember") {
        if (auto err = expect_exact(tail, 2)) return *err;
        SIsMemberCmd cmd{args.string(0), args.string(1)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "scard") {
        if (auto err = expect_exact(tail, 1)) return *err;
        SCardCmd cmd{args.string(0)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sdiff") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SDiffCmd cmd{args.strings_from(0)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sunion") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SUnionCmd cmd{args.strings_from(0)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sinter") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SInterCmd cmd{args.strings_from(0)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sdiffstore") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SDiffStoreCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sunionstore") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SUnionStoreCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "sinterstore") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        SInterStoreCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "spop") {
        if (auto err = expect_at_least(tail, 1)) return *err;
        if (tail.size() > 2) return TranslationError::wrong_number_of_args(2);
        SPopCmd cmd{args.string(0), optional_count(args, tail)};
        if (cmd.count && *cmd.count < 0) {
            args.fail(TranslationError::invalid_type());
        }
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "smove") {
        if (auto err = expect_exact(tail, 3)) return *err;
        SMoveCmd cmd{args.string(0), args.string(1), args.string(2)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    if (name == "srandmember") {
        if (auto err = expect_at_least(tail, 1)) return *err;
        if (tail.size() > 2) return TranslationError::wrong_number_of_args(2);
        SRandMemberCmd cmd{args.string(0), optional_count(args, tail)};
        return args.finish(SetCommand{std::move(cmd)});
    }
    return std::nullopt;
}

std::optional<TranslateResult> translate_lists(const std::string& name, Args tail) {
    ArgReader args{tail};

    if (name == "lpush") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        LPushCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "rpush") {
        if (auto err = expect_at_least(tail, 2)) return *err;
        RPushCmd cmd{args.string(0), args.strings_from(1)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "lpushx") {
        if (auto err = expect_exact(tail, 2)) return *err;
        LPushXCmd cmd{args.string(0), args.string(1)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "rpushx") {
        if (auto err = expect_exact(tail, 2)) return *err;
        RPushXCmd cmd{args.string(0), args.string(1)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "llen") {
        if (auto err = expect_exact(tail, 1)) return *err;
        LLenCmd cmd{args.string(0)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "lpop") {
        if (auto err = expect_exact(tail, 1)) return *err;
        LPopCmd cmd{args.string(0)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "rpop") {
        if (auto err = expect_exact(tail, 1)) return *err;
        RPopCmd cmd{args.string(0)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "lrange") {
        if (auto err = expect_exact(tail, 3)) return *err;
        LRangeCmd cmd{args.string(0), args.count(1), args.count(2)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "lindex") {
        if (auto err = expect_exact(tail, 2)) return *err;
        LIndexCmd cmd{args.string(0), args.count(1)};
        return args.finish(ListCommand{std::move(cmd)});
    }
    if (name == "linsert") {
        // LINSERT key BEFORE|AFTER pivot value
        if (auto err = expect_exact(tail, 4)) return *err;
        LInsertCmd cmd{args.string(0), InsertPosition::Before, args.string(2), args.string(3)};
        const std::string where = to_lower(args.string(1));
        if (where == "after") {
            cmd.position = InsertPosition::After;
        } else if (where != "before") {
            args.fail(TranslationError::syntax_error());
        }
        return args.finish(ListCommand{std::move(cmd)});
    }
    return std::nullopt;
}

TranslateResult translate_array(const WireArray& array) {
    if (array.elements.empty()) {
        return TranslationError::noop();
    }

    auto head = as_string(array.elements.front());
    if (!head) {
        return TranslationError::invalid_type();
    }
    const std::string name = to_lower(std::move(*head));

    // PING / KEYS ignore whatever follows them.
    if (auto server = translate_server(name)) {
        return std::move(*server);
    }

    const Args tail = Args{array.elements}.subspan(1);

    if (auto r = translate_strings(name, tail)) return std::move(*r);
    if (auto r = translate_hashes(name, tail))  return std::move(*r);
    if (auto r = translate_sets(name, tail))    return std::move(*r);
    if (auto r = translate_lists(name, tail))   return std::move(*r);

    return TranslationError::unknown_op();
}

} // anonymous namespace

// ── Coercions ─────────────────────────────────────────────────────────────────

std::optional<std::string> as_string(const WireValue& value) {
    if (const auto* s = std::get_if<SimpleString>(&value)) {
        return s->data;
    }
    if (const auto* b = std::get_if<BulkString>(&value)) {
        return b->data;
    }
    return std::nullopt;
}

std::optional<Count> parse_count(std::string_view text) {
    // from_chars rejects a leading '+', base-10 text may carry one.
    if (text.size() > 1 && text.front() == '+' && text[1] != '-') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    Count out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<Count> as_count(const WireValue& value) {
    if (const auto* i = std::get_if<Integer>(&value)) {
        return i->value;
    }
    if (auto s = as_string(value)) {
        return parse_count(*s);
    }
    return std::nullopt;
}

// ── translate ─────────────────────────────────────────────────────────────────

std::variant<Command, TranslationError> translate(const WireValue& value) {
    return std::visit(
        [](const auto& v) -> TranslateResult {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString> || std::is_same_v<T, BulkString>) {
                if (auto server = translate_server(to_lower(v.data))) {
                    return std::move(*server);
                }
                return TranslationError::unknown_op();
            } else if constexpr (std::is_same_v<T, WireArray>) {
                return translate_array(v);
            } else {
                return TranslationError::unknown_op();
            }
        },
        value);
}

} // namespace polykv::command
