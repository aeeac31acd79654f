#include "storage/engine.hpp"

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

namespace polykv {

// ── Fixture ───────────────────────────────────────────────────────────────────

class EngineTest : public ::testing::Test {
protected:
    Response run(const Command& cmd) { return execute(cmd, store_); }

    Store store_;
};

// ── Server commands ───────────────────────────────────────────────────────────

TEST_F(EngineTest, PingReturnsPong) {
    EXPECT_TRUE(std::holds_alternative<PongResp>(run(ServerCommand{PingCmd{}})));
}

TEST_F(EngineTest, KeysAcrossFamilies) {
    run(StringCommand{SetCmd{"str", "v"}});
    run(HashCommand{HSetCmd{"hash", "f", "v"}});
    run(SetCommand{SAddCmd{"set", {"m"}}});
    run(ListCommand{RPushCmd{"list", {"x"}}});

    auto r = run(ServerCommand{KeysCmd{}});
    ASSERT_TRUE(std::holds_alternative<MultiValueResp>(r));
    auto keys = std::get<MultiValueResp>(r).values;
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<Key>{"hash", "list", "set", "str"}));
}

TEST_F(EngineTest, KeysEmptyStoreIsEmptyList) {
    auto r = run(ServerCommand{KeysCmd{}});
    ASSERT_TRUE(std::holds_alternative<MultiValueResp>(r));
    EXPECT_TRUE(std::get<MultiValueResp>(r).values.empty());
}

// ── Routing ───────────────────────────────────────────────────────────────────

TEST_F(EngineTest, FamiliesUseSeparateContainers) {
    run(StringCommand{SetCmd{"k", "string"}});
    run(HashCommand{HSetCmd{"k", "f", "hash"}});

    auto s = run(StringCommand{GetCmd{"k"}});
    ASSERT_TRUE(std::holds_alternative<ValueResp>(s));
    EXPECT_EQ(std::get<ValueResp>(s).value, "string");

    auto h = run(HashCommand{HGetCmd{"k", "f"}});
    ASSERT_TRUE(std::holds_alternative<ValueResp>(h));
    EXPECT_EQ(std::get<ValueResp>(h).value, "hash");
}

TEST_F(EngineTest, DelOnlyTouchesStrings) {
    run(HashCommand{HSetCmd{"k", "f", "v"}});
    auto r = run(StringCommand{DelCmd{{"k"}}});
    ASSERT_TRUE(std::holds_alternative<IntResp>(r));
    EXPECT_EQ(std::get<IntResp>(r).value, 0);
    EXPECT_TRUE(std::holds_alternative<ValueResp>(run(HashCommand{HGetCmd{"k", "f"}})));
}

} // namespace polykv
