#include "network/session.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace polykv::network {

// ── Fixture ───────────────────────────────────────────────────────────────────

class ProcessRequestTest : public ::testing::Test {
protected:
    std::optional<Response> send(const std::vector<std::string>& parts) {
        return process_request(make_bulk_array(parts), store_);
    }

    std::string error_of(const std::vector<std::string>& parts) {
        auto r = send(parts);
        EXPECT_TRUE(r.has_value());
        if (!r || !std::holds_alternative<ErrorResp>(*r)) {
            ADD_FAILURE() << "expected an error reply";
            return {};
        }
        return std::get<ErrorResp>(*r).message;
    }

    Store store_;
};

// ── Translation outcomes ──────────────────────────────────────────────────────

TEST_F(ProcessRequestTest, EmptyRequestHasNoReply) {
    EXPECT_FALSE(send({}).has_value());
}

TEST_F(ProcessRequestTest, TranslationErrorBecomesErrorReply) {
    EXPECT_EQ(error_of({"HSET", "k"}), "wrong number of arguments(3)");
    EXPECT_EQ(error_of({"NOSUCHCMD"}), "unknown operation");
    EXPECT_EQ(error_of({"SADD", "s"}), "not enough arguments(2)");
    EXPECT_EQ(error_of({"LINSERT", "l", "AROUND", "p", "v"}), "syntax error");
}

TEST_F(ProcessRequestTest, TranslationErrorTouchesNothing) {
    (void)error_of({"HMSET", "h", "f1", "v1", "f2"});
    EXPECT_TRUE(store_.keys().empty());
}

// ── Execution ─────────────────────────────────────────────────────────────────

TEST_F(ProcessRequestTest, ExecutesAgainstStore) {
    auto set = send({"HSET", "h", "f", "v"});
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(std::holds_alternative<OkResp>(*set));

    auto get = send({"hget", "h", "f"});
    ASSERT_TRUE(get.has_value());
    ASSERT_TRUE(std::holds_alternative<ValueResp>(*get));
    EXPECT_EQ(std::get<ValueResp>(*get).value, "v");
}

TEST_F(ProcessRequestTest, BareStringPing) {
    auto r = process_request(SimpleString{"PING"}, store_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(std::holds_alternative<PongResp>(*r));
}

TEST_F(ProcessRequestTest, ExecutionErrorPassesThrough) {
    (void)send({"SET", "n", "abc"});
    EXPECT_EQ(error_of({"INCR", "n"}), "Bad Type!");
}

TEST_F(ProcessRequestTest, HugeNegativeRandMemberCountIsErrorReply) {
    (void)send({"SADD", "s", "a", "b"});
    EXPECT_EQ(error_of({"SRANDMEMBER", "s", "-9223372036854775808"}), "value is out of range");
    EXPECT_EQ(error_of({"SRANDMEMBER", "s", "-1000000000"}), "value is out of range");
}

} // namespace polykv::network
