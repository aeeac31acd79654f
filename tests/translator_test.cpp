#include "command/translator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace polykv::command {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

WireValue request(const std::vector<std::string>& parts) {
    return make_bulk_array(parts);
}

} // anonymous namespace

// ── Fixture ───────────────────────────────────────────────────────────────────

class TranslatorTest : public ::testing::Test {
protected:
    // Translate and unwrap a Command of family F holding alternative T.
    template <typename F, typename T>
    T expect_command(const WireValue& value) {
        auto result = translate(value);
        EXPECT_TRUE(std::holds_alternative<Command>(result))
            << "translation failed: "
            << (std::holds_alternative<TranslationError>(result)
                    ? std::get<TranslationError>(result).message()
                    : std::string{});
        if (!std::holds_alternative<Command>(result)) {
            return T{};
        }
        const auto& cmd = std::get<Command>(result);
        EXPECT_TRUE(std::holds_alternative<F>(cmd));
        if (!std::holds_alternative<F>(cmd)) {
            return T{};
        }
        const auto& family = std::get<F>(cmd);
        EXPECT_TRUE(std::holds_alternative<T>(family));
        if (!std::holds_alternative<T>(family)) {
            return T{};
        }
        return std::get<T>(family);
    }

    TranslationError expect_error(const WireValue& value) {
        auto result = translate(value);
        EXPECT_TRUE(std::holds_alternative<TranslationError>(result));
        if (!std::holds_alternative<TranslationError>(result)) {
            return TranslationError::unknown_op();
        }
        return std::get<TranslationError>(result);
    }
};

// ── Top-level shapes ──────────────────────────────────────────────────────────

TEST_F(TranslatorTest, EmptyArrayIsNoop) {
    EXPECT_EQ(expect_error(WireArray{}), TranslationError::noop());
}

TEST_F(TranslatorTest, BareStringPing) {
    expect_command<ServerCommand, PingCmd>(SimpleString{"PING"});
    expect_command<ServerCommand, PingCmd>(BulkString{"ping"});
}

TEST_F(TranslatorTest, BareStringKeys) {
    expect_command<ServerCommand, KeysCmd>(BulkString{"keys"});
}

TEST_F(TranslatorTest, BareStringOtherCommandIsUnknown) {
    EXPECT_EQ(expect_error(BulkString{"get"}), TranslationError::unknown_op());
}

TEST_F(TranslatorTest, NonArrayNonStringIsUnknown) {
    EXPECT_EQ(expect_error(Integer{42}), TranslationError::unknown_op());
    EXPECT_EQ(expect_error(NullArray{}), TranslationError::unknown_op());
    EXPECT_EQ(expect_error(NullBulkString{}), TranslationError::unknown_op());
    EXPECT_EQ(expect_error(ErrorString{"ERR"}), TranslationError::unknown_op());
}

TEST_F(TranslatorTest, NonStringHeadIsInvalidType) {
    WireArray array;
    array.elements.emplace_back(Integer{1});
    array.elements.emplace_back(BulkString{"k"});
    EXPECT_EQ(expect_error(array), TranslationError::invalid_type());
}

TEST_F(TranslatorTest, UnknownCommandName) {
    EXPECT_EQ(expect_error(request({"FLUSHALL"})), TranslationError::unknown_op());
}

TEST_F(TranslatorTest, CommandNameIsCaseInsensitive) {
    auto cmd = expect_command<HashCommand, HGetCmd>(request({"hGeT", "h", "f"}));
    EXPECT_EQ(cmd.key, "h");
    EXPECT_EQ(cmd.field, "f");
}

TEST_F(TranslatorTest, PingIgnoresTrailingArguments) {
    expect_command<ServerCommand, PingCmd>(request({"PING", "hello"}));
    expect_command<ServerCommand, KeysCmd>(request({"KEYS", "*"}));
}

// ── Arity ─────────────────────────────────────────────────────────────────────

TEST_F(TranslatorTest, ExactArityMismatch) {
    EXPECT_EQ(expect_error(request({"HGET", "h"})),
              TranslationError::wrong_number_of_args(2));
    EXPECT_EQ(expect_error(request({"HGET", "h", "f", "extra"})),
              TranslationError::wrong_number_of_args(2));
    EXPECT_EQ(expect_error(request({"SET", "k"})),
              TranslationError::wrong_number_of_args(2));
}

TEST_F(TranslatorTest, HSetWithOnlyKeyCitesRequiredCount) {
    auto err = expect_error(request({"HSET", "k"}));
    EXPECT_EQ(err, TranslationError::wrong_number_of_args(3));
    EXPECT_EQ(err.message(), "wrong number of arguments(3)");
}

TEST_F(TranslatorTest, MinimumArityMissing) {
    EXPECT_EQ(expect_error(request({"HDEL", "h"})),
              TranslationError::not_enough_args(2));
    EXPECT_EQ(expect_error(request({"SADD", "s"})),
              TranslationError::not_enough_args(2));
    EXPECT_EQ(expect_error(request({"DEL"})),
              TranslationError::not_enough_args(1));
}

TEST_F(TranslatorTest, ErrorMessagesCarryArity) {
    EXPECT_EQ(TranslationError::wrong_number_of_args(3).message(),
              "wrong number of arguments(3)");
    EXPECT_EQ(TranslationError::not_enough_args(2).message(),
              "not enough arguments(2)");
    EXPECT_EQ(TranslationError::unknown_op().message(), "unknown operation");
    EXPECT_EQ(TranslationError::invalid_type().message(), "invalid argument type");
    EXPECT_EQ(TranslationError::syntax_error().message(), "syntax error");
}

// ── Argument coercion ─────────────────────────────────────────────────────────

TEST_F(TranslatorTest, SimpleStringArgumentsAccepted) {
    WireArray array;
    array.elements.emplace_back(SimpleString{"HSET"});
    array.elements.emplace_back(SimpleString{"h"});
    array.elements.emplace_back(BulkString{"f"});
    array.elements.emplace_back(SimpleString{"v"});
    auto cmd = expect_command<HashCommand, HSetCmd>(array);
    EXPECT_EQ(cmd.value, "v");
}

TEST_F(TranslatorTest, IntegerWhereStringExpectedIsInvalidType) {
    WireArray array;
    array.elements.emplace_back(BulkString{"HGET"});
    array.elements.emplace_back(BulkString{"h"});
    array.elements.emplace_back(Integer{5});
    EXPECT_EQ(expect_error(array), TranslationError::invalid_type());
}

TEST_F(TranslatorTest, CountFromWireInteger) {
    WireArray array;
    array.elements.emplace_back(BulkString{"HINCRBY"});
    array.elements.emplace_back(BulkString{"h"});
    array.elements.emplace_back(BulkString{"f"});
    array.elements.emplace_back(Integer{-7});
    auto cmd = expect_command<HashCommand, HIncrByCmd>(array);
    EXPECT_EQ(cmd.delta, -7);
}

TEST_F(TranslatorTest, CountFromDecimalString) {
    auto cmd = expect_command<HashCommand, HIncrByCmd>(request({"HINCRBY", "h", "f", "+12"}));
    EXPECT_EQ(cmd.delta, 12);
}

TEST_F(TranslatorTest, NonNumericCountIsInvalidType) {
    EXPECT_EQ(expect_error(request({"HINCRBY", "h", "f", "ten"})),
              TranslationError::invalid_type());
    EXPECT_EQ(expect_error(request({"LRANGE", "l", "0", "1x"})),
              TranslationError::invalid_type());
}

TEST_F(TranslatorTest, ParseCountBoundaries) {
    EXPECT_EQ(parse_count("9223372036854775807"), std::numeric_limits<Count>::max());
    EXPECT_EQ(parse_count("-9223372036854775808"), std::numeric_limits<Count>::min());
    EXPECT_FALSE(parse_count("9223372036854775808").has_value());
    EXPECT_FALSE(parse_count("").has_value());
    EXPECT_FALSE(parse_count(" 1").has_value());
    EXPECT_FALSE(parse_count("+-1").has_value());
    EXPECT_FALSE(parse_count("+").has_value());
}

// ── Strings ───────────────────────────────────────────────────────────────────

TEST_F(TranslatorTest, SetAndGet) {
    auto set = expect_command<StringCommand, SetCmd>(request({"SET", "k", "v"}));
    EXPECT_EQ(set.key, "k");
    EXPECT_EQ(set.value, "v");
    auto get = expect_command<StringCommand, GetCmd>(request({"GET", "k"}));
    EXPECT_EQ(get.key, "k");
}

TEST_F(TranslatorTest, IncrAndDecrUseUnitDelta) {
    EXPECT_EQ((expect_command<StringCommand, IncrByCmd>(request({"INCR", "n"})).delta), 1);
    EXPECT_EQ((expect_command<StringCommand, DecrByCmd>(request({"DECR", "n"})).delta), 1);
    EXPECT_EQ((expect_command<StringCommand, DecrByCmd>(request({"DECRBY", "n", "5"})).delta), 5);
}

TEST_F(TranslatorTest, DelCollectsKeys) {
    auto cmd = expect_command<StringCommand, DelCmd>(request({"DEL", "a", "b", "c"}));
    EXPECT_EQ(cmd.keys, (std::vector<Key>{"a", "b", "c"}));
}

// ── Hashes ────────────────────────────────────────────────────────────────────

TEST_F(TranslatorTest, HMSetPairsInOrder) {
    auto cmd = expect_command<HashCommand, HMSetCmd>(
        request({"HMSET", "h", "f1", "v1", "f2", "v2"}));
    ASSERT_EQ(cmd.pairs.size(), 2u);
    EXPECT_EQ(cmd.pairs[0], (std::pair<Key, Value>{"f1", "v1"}));
    EXPECT_EQ(cmd.pairs[1], (std::pair<Key, Value>{"f2", "v2"}));
}

TEST_F(TranslatorTest, HMSetDanglingFieldIsSyntaxError) {
    EXPECT_EQ(expect_error(request({"HMSET", "h", "f1", "v1", "f2"})),
              TranslationError::syntax_error());
}

TEST_F(TranslatorTest, HMGetFields) {
    auto cmd = expect_command<HashCommand, HMGetCmd>(request({"HMGET", "h", "a", "b"}));
    EXPECT_EQ(cmd.fields, (std::vector<Key>{"a", "b"}));
}

// ── Sets ──────────────────────────────────────────────────────────────────────

TEST_F(TranslatorTest, SetAlgebraNeedsTwoKeys) {
    EXPECT_EQ(expect_error(request({"SINTER", "a"})), TranslationError::not_enough_args(2));
    auto cmd = expect_command<SetCommand, SUnionCmd>(request({"SUNION", "a", "b"}));
    EXPECT_EQ(cmd.keys.size(), 2u);
}

TEST_F(TranslatorTest, StoreVariantsSplitDestination) {
    auto cmd = expect_command<SetCommand, SDiffStoreCmd>(
        request({"SDIFFSTORE", "dst", "a", "b"}));
    EXPECT_EQ(cmd.destination, "dst");
    EXPECT_EQ(cmd.keys, (std::vector<Key>{"a", "b"}));
}

TEST_F(TranslatorTest, SPopOptionalCount) {
    EXPECT_FALSE((expect_command<SetCommand, SPopCmd>(request({"SPOP", "s"})).count));
    auto cmd = expect_command<SetCommand, SPopCmd>(request({"SPOP", "s", "3"}));
    ASSERT_TRUE(cmd.count.has_value());
    EXPECT_EQ(*cmd.count, 3);
}

TEST_F(TranslatorTest, SPopNegativeCountRejected) {
    EXPECT_EQ(expect_error(request({"SPOP", "s", "-1"})), TranslationError::invalid_type());
}

TEST_F(TranslatorTest, SPopTooManyArguments) {
    EXPECT_EQ(expect_error(request({"SPOP", "s", "1", "2"})),
              TranslationError::wrong_number_of_args(2));
}

TEST_F(TranslatorTest, SRandMemberAcceptsNegativeCount) {
    auto cmd = expect_command<SetCommand, SRandMemberCmd>(request({"SRANDMEMBER", "s", "-5"}));
    ASSERT_TRUE(cmd.count.has_value());
    EXPECT_EQ(*cmd.count, -5);
}

TEST_F(TranslatorTest, SetCountsAtInt64Extremes) {
    auto rand = expect_command<SetCommand, SRandMemberCmd>(
        request({"SRANDMEMBER", "s", "-9223372036854775808"}));
    ASSERT_TRUE(rand.count.has_value());
    EXPECT_EQ(*rand.count, std::numeric_limits<Count>::min());

    auto pop = expect_command<SetCommand, SPopCmd>(request({"SPOP", "s", "9223372036854775807"}));
    ASSERT_TRUE(pop.count.has_value());
    EXPECT_EQ(*pop.count, std::numeric_limits<Count>::max());
}

TEST_F(TranslatorTest, SetCountBeyondInt64Rejected) {
    EXPECT_EQ(expect_error(request({"SRANDMEMBER", "s", "-9223372036854775809"})),
              TranslationError::invalid_type());
    EXPECT_EQ(expect_error(request({"SPOP", "s", "9223372036854775808"})),
              TranslationError::invalid_type());
}

// ── Lists ─────────────────────────────────────────────────────────────────────

TEST_F(TranslatorTest, LRangeIndices) {
    auto cmd = expect_command<ListCommand, LRangeCmd>(request({"LRANGE", "l", "0", "-1"}));
    EXPECT_EQ(cmd.start, 0);
    EXPECT_EQ(cmd.stop, -1);
}

TEST_F(TranslatorTest, LInsertPosition) {
    auto before = expect_command<ListCommand, LInsertCmd>(
        request({"LINSERT", "l", "before", "p", "v"}));
    EXPECT_EQ(before.position, InsertPosition::Before);
    EXPECT_EQ(before.pivot, "p");
    EXPECT_EQ(before.value, "v");

    auto after = expect_command<ListCommand, LInsertCmd>(
        request({"LINSERT", "l", "AFTER", "p", "v"}));
    EXPECT_EQ(after.position, InsertPosition::After);
}

TEST_F(TranslatorTest, LInsertBadPositionIsSyntaxError) {
    EXPECT_EQ(expect_error(request({"LINSERT", "l", "middle", "p", "v"})),
              TranslationError::syntax_error());
}

} // namespace polykv::command
